#ifndef FUNCORCH_ORCHESTRATOR_WORKER_HPP
#define FUNCORCH_ORCHESTRATOR_WORKER_HPP

#include <funcorch/common/util.hpp>
#include <funcorch/orchestrator/config.hpp>
#include <funcorch/orchestrator/executor.hpp>
#include <funcorch/orchestrator/http.hpp>
#include <funcorch/orchestrator/indexer.hpp>
#include <funcorch/orchestrator/listing.hpp>

#include <BS_thread_pool.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>

namespace funcorch::orchestrator {

  class Registry;

  namespace heartbeat {
    class HeartbeatTracker;
  } // namespace heartbeat

} // namespace funcorch::orchestrator

namespace funcorch::orchestrator::worker {

  class Workers {
  public:
    Workers(
        const config::Workers& config, Registry& registry, indexer::Indexer& indexer,
        executor::Executor& executor, heartbeat::HeartbeatTracker& heartbeats
    )
        : _pool(config.threads), _registry(registry), _indexer(indexer), _executor(executor),
          _heartbeats(heartbeats)
    {
      _logger = common::util::create_logger("Workers");
    }

    template <typename F, typename... Args>
    void add_task(F&& func, Args&&... args)
    {
      _pool.detach_task([this, func, ... args = std::forward<Args>(args)]() mutable {
        std::invoke(func, *this, std::forward<Args>(args)...);
      });
    }

    template <typename F>
    void add_task(F&& func)
    {
      _pool.detach_task(std::forward<F>(func));
    }

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Runs a logical invocation of a registered function and replies with
    /// its output, or with the reason of the failure.
    ///
    /// @param[in] function_id location identifier of the function
    /// @param[in] request invocation id, payload and reset flag
    /// @param[in] callback receives the HTTP response
    ////////////////////////////////////////////////////////////////////////////////
    void handle_invocation(
        const std::string& function_id, executor::InvocationRequest request,
        HttpServer::callback_t&& callback
    );

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Registers or deletes functions.
    ///
    /// @param[in] operation index command
    /// @return result of the command
    ////////////////////////////////////////////////////////////////////////////////
    indexer::IndexResult process_index_operation(const indexer::IndexOperation& operation);

    listing::FunctionList list_functions() const;

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Records a heartbeat of a host.
    ///
    /// @return error message if operation failed; empty optional otherwise
    ////////////////////////////////////////////////////////////////////////////////
    std::optional<std::string> heartbeat(const std::string& assembly_full_name);

    const heartbeat::HeartbeatTracker& heartbeats() const
    {
      return _heartbeats;
    }

    // Cancels invocations waiting for a retry and waits for running tasks.
    void shutdown();

  private:
    BS::thread_pool _pool;

    Registry& _registry;

    indexer::Indexer& _indexer;

    executor::Executor& _executor;

    heartbeat::HeartbeatTracker& _heartbeats;

    std::stop_source _stop;

    std::shared_ptr<spdlog::logger> _logger;
  };

} // namespace funcorch::orchestrator::worker

#endif
