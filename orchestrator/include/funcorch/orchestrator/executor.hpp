#ifndef FUNCORCH_ORCHESTRATOR_EXECUTOR_HPP
#define FUNCORCH_ORCHESTRATOR_EXECUTOR_HPP

#include <funcorch/orchestrator/attempts.hpp>
#include <funcorch/orchestrator/backoff.hpp>
#include <funcorch/orchestrator/function.hpp>

#include <memory>
#include <stop_token>
#include <string>

#include <spdlog/spdlog.h>

namespace funcorch::orchestrator::config {

  struct Retry;

} // namespace funcorch::orchestrator::config

namespace funcorch::orchestrator::heartbeat {

  class HeartbeatTracker;

} // namespace funcorch::orchestrator::heartbeat

namespace funcorch::orchestrator::invoker {

  struct Invoker;

} // namespace funcorch::orchestrator::invoker

namespace funcorch::orchestrator::executor {

  struct InvocationRequest {
    // Identity of the logical invocation; owns one attempt counter.
    std::string invocation_id;

    std::string input;

    // Start a fresh logical invocation: the attempt counter goes back to zero.
    bool reset{};

    // The id was assigned by the server; nobody can resume it, so the
    // counter is dropped once the invocation ends.
    bool generated_id{};
  };

  struct InvocationResult {
    std::string invocation_id;
    std::string output;
    // Number of attempts made, the successful one included.
    int attempts;
    // Reporting only; never used to gate execution.
    bool host_is_running;
  };

  class Executor {
  public:
    Executor(
        const config::Retry& cfg, attempts::AttemptTable& attempts, invoker::Invoker& invoker,
        heartbeat::HeartbeatTracker& heartbeats
    );

    Executor(
        const config::Retry& cfg, attempts::AttemptTable& attempts, invoker::Invoker& invoker,
        heartbeat::HeartbeatTracker& heartbeats, std::unique_ptr<backoff::Backoff> backoff
    );

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Runs a logical invocation of a function, retrying failed attempts.
    ///
    /// Attempts are strictly sequential. Before each attempt the retry state
    /// presented to the body is checked against the tracked counter and the
    /// configured bound; a mismatch throws InternalConsistencyError and is never
    /// retried. A failed attempt is retried until the bound is reached; then the
    /// counter is cleared and RetriesExhausted is thrown, carrying the last error.
    /// After a success the counter keeps its final value until the next reset,
    /// unless the id was generated by the server.
    ///
    /// @param[in] definition function to invoke
    /// @param[in] request invocation id, payload and reset flag
    /// @param[in] stop cancellation observed between attempts; throws InvocationCancelled
    /// without advancing the counter
    /// @return output of the successful attempt
    ////////////////////////////////////////////////////////////////////////////////
    InvocationResult invoke(
        const FunctionDefinition& definition, const InvocationRequest& request,
        std::stop_token stop = {}
    );

    int max_retry_count() const
    {
      return _max_retry_count;
    }

  private:
    void _verify(
        const std::string& invocation_id, const attempts::RetryContext& presented, int tracked
    ) const;

    // False if cancelled while waiting.
    static bool _wait(std::chrono::milliseconds delay, std::stop_token& stop);

    int _max_retry_count;

    attempts::AttemptTable& _attempts;

    invoker::Invoker& _invoker;

    heartbeat::HeartbeatTracker& _heartbeats;

    std::unique_ptr<backoff::Backoff> _backoff;

    std::shared_ptr<spdlog::logger> _logger;
  };

} // namespace funcorch::orchestrator::executor

#endif
