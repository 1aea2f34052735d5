#ifndef FUNCORCH_ORCHESTRATOR_SERVER_HPP
#define FUNCORCH_ORCHESTRATOR_SERVER_HPP

#include <funcorch/orchestrator/attempts.hpp>
#include <funcorch/orchestrator/config.hpp>
#include <funcorch/orchestrator/executor.hpp>
#include <funcorch/orchestrator/heartbeat.hpp>
#include <funcorch/orchestrator/http.hpp>
#include <funcorch/orchestrator/indexer.hpp>
#include <funcorch/orchestrator/invoker.hpp>
#include <funcorch/orchestrator/registry.hpp>
#include <funcorch/orchestrator/scanner.hpp>
#include <funcorch/orchestrator/storage.hpp>
#include <funcorch/orchestrator/worker.hpp>

#include <memory>

#include <spdlog/spdlog.h>

namespace funcorch::orchestrator {

  struct Server {

    void run();

    // Called from the signal handler; only requests the HTTP loop to quit.
    void shutdown();

    // Blocks until the HTTP server stops, then drains the workers.
    void wait();

    int http_port() const
    {
      return _http_server->port();
    }

    static void configure(config::Config& cfg)
    {
      _instance.reset(new Server{cfg});
    }

    static Server* instance()
    {
      return _instance.get();
    }

  private:
    static std::shared_ptr<Server> _instance;

    Server(config::Config& cfg);

    std::shared_ptr<spdlog::logger> _logger;

    std::unique_ptr<storage::BlobStorage> _storage;

    Registry _registry;

    heartbeat::HeartbeatTracker _heartbeats;

    attempts::AttemptTable _attempts;

    invoker::FunctionInvoker _invoker;

    executor::Executor _executor;

    scanner::Scanner _scanner;

    indexer::Indexer _indexer;

    worker::Workers _workers;

    // Shared pointer is required by drogon
    std::shared_ptr<HttpServer> _http_server;
  };

} // namespace funcorch::orchestrator

#endif
