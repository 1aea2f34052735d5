#include <funcorch/orchestrator/executor.hpp>

#include <funcorch/common/exceptions.hpp>
#include <funcorch/common/util.hpp>
#include <funcorch/orchestrator/config.hpp>
#include <funcorch/orchestrator/heartbeat.hpp>
#include <funcorch/orchestrator/invoker.hpp>

#include <condition_variable>
#include <mutex>

#include <fmt/format.h>

namespace funcorch::orchestrator::executor {

  namespace {

    // Deactivates a logical invocation on every exit path.
    // Counters of server-generated ids cannot be resumed and are dropped.
    struct ActiveInvocation {

      ActiveInvocation(
          attempts::AttemptTable& attempts, const std::string& invocation_id, bool transient
      )
          : _attempts(attempts), _invocation_id(invocation_id), _transient(transient)
      {
      }

      ~ActiveInvocation()
      {
        if (_transient) {
          _attempts.clear(_invocation_id);
        } else {
          _attempts.finish(_invocation_id);
        }
      }

      ActiveInvocation(const ActiveInvocation&) = delete;
      ActiveInvocation& operator=(const ActiveInvocation&) = delete;

    private:
      attempts::AttemptTable& _attempts;
      const std::string& _invocation_id;
      bool _transient;
    };

  } // namespace

  Executor::Executor(
      const config::Retry& cfg, attempts::AttemptTable& attempts, invoker::Invoker& invoker,
      heartbeat::HeartbeatTracker& heartbeats
  )
      : Executor(cfg, attempts, invoker, heartbeats, backoff::Backoff::construct(cfg))
  {
  }

  Executor::Executor(
      const config::Retry& cfg, attempts::AttemptTable& attempts, invoker::Invoker& invoker,
      heartbeat::HeartbeatTracker& heartbeats, std::unique_ptr<backoff::Backoff> backoff
  )
      : _max_retry_count(cfg.max_retry_count), _attempts(attempts), _invoker(invoker),
        _heartbeats(heartbeats), _backoff(std::move(backoff))
  {
    if (_max_retry_count < 0) {
      throw common::InvalidConfigurationError(
          fmt::format("Incorrect retry count {}", _max_retry_count)
      );
    }
    if (!_backoff) {
      _backoff = std::make_unique<backoff::NoBackoff>();
    }
    _logger = common::util::create_logger("Executor");
  }

  void Executor::_verify(
      const std::string& invocation_id, const attempts::RetryContext& presented, int tracked
  ) const
  {
    if (presented.retry_count != tracked) {
      _logger->error(
          "Invocation {}: retry count {} diverged from tracked count {}", invocation_id,
          presented.retry_count, tracked
      );
      throw common::InternalConsistencyError(fmt::format(
          "retryCount={} is not equal to invocationCount={}", presented.retry_count, tracked
      ));
    }

    if (presented.max_retry_count != _max_retry_count) {
      _logger->error(
          "Invocation {}: max retry count {} diverged from configured {}", invocation_id,
          presented.max_retry_count, _max_retry_count
      );
      throw common::InternalConsistencyError(fmt::format(
          "maxRetryCount={} is not equal to {}", presented.max_retry_count, _max_retry_count
      ));
    }
  }

  bool Executor::_wait(std::chrono::milliseconds delay, std::stop_token& stop)
  {
    if (delay.count() <= 0) {
      return !stop.stop_requested();
    }

    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_lock<std::mutex> lock{mutex};
    cv.wait_for(lock, stop, delay, []() { return false; });
    return !stop.stop_requested();
  }

  InvocationResult Executor::invoke(
      const FunctionDefinition& definition, const InvocationRequest& request,
      std::stop_token stop
  )
  {
    const std::string& invocation_id = request.invocation_id;

    auto tracked = _attempts.begin(invocation_id, request.reset);
    if (!tracked.has_value()) {
      throw common::InternalConsistencyError(
          fmt::format("Invocation {} is already in progress", invocation_id)
      );
    }
    ActiveInvocation active{_attempts, invocation_id, request.generated_id};

    // The bound seen by the body comes from the function's own declaration.
    int presented_max = definition.max_retry_count.value_or(_max_retry_count);

    for (int attempt = 0;; ++attempt) {

      attempts::RetryContext context{attempt, presented_max};
      _verify(invocation_id, context, tracked.value());

      _logger->debug(
          "Invocation {} of {}: attempt {}, max retries {}", invocation_id, definition.id(),
          attempt, _max_retry_count
      );

      std::exception_ptr error;
      std::string reason;
      try {

        std::string output = _invoker.invoke(definition, invocation_id, context, request.input);

        _logger->info(
            "Invocation {} of {} succeeded at attempt {}", invocation_id, definition.id(), attempt
        );
        return InvocationResult{
            invocation_id, std::move(output), attempt + 1,
            _heartbeats.is_live(definition.assembly_full_name)};

      } catch (std::exception& exc) {
        error = std::current_exception();
        reason = exc.what();
      } catch (...) {
        error = std::current_exception();
        reason = "unknown exception";
      }

      _logger->warn(
          "Invocation {} of {} failed at attempt {}, reason: {}", invocation_id, definition.id(),
          attempt, reason
      );

      if (attempt >= _max_retry_count) {
        _attempts.clear(invocation_id);
        throw common::RetriesExhausted(
            fmt::format(
                "Function {} failed after {} attempts, reason: {}", definition.id(), attempt + 1,
                reason
            ),
            attempt + 1, error
        );
      }

      if (!_wait(_backoff->delay(attempt + 1), stop)) {
        _logger->info("Invocation {} cancelled after attempt {}", invocation_id, attempt);
        throw common::InvocationCancelled(
            fmt::format("Invocation {} cancelled after {} attempts", invocation_id, attempt + 1)
        );
      }

      tracked = _attempts.advance(invocation_id);
    }
  }

} // namespace funcorch::orchestrator::executor
