#include <funcorch/orchestrator/server.hpp>

#include <funcorch/common/util.hpp>

#include <chrono>

#include <spdlog/spdlog.h>

namespace funcorch::orchestrator {

  std::shared_ptr<Server> Server::_instance = nullptr;

  Server::Server(config::Config& cfg)
      : _storage(storage::BlobStorage::construct(cfg.storage)),
        _heartbeats(std::chrono::milliseconds{cfg.heartbeat.poll_interval_ms}),
        _invoker(*_storage), _executor(cfg.retry, _attempts, _invoker, _heartbeats),
        _scanner(*_storage, _registry, std::chrono::milliseconds{cfg.storage.scan_timeout_ms}),
        _indexer(_registry, _scanner),
        _workers(cfg.workers, _registry, _indexer, _executor, _heartbeats),
        _http_server(std::make_shared<HttpServer>(cfg.http, _workers))
  {
    _logger = common::util::create_logger("Server");
    _logger->info(
        "Configured with max retry count {}, heartbeat interval {} ms, storage root {}",
        cfg.retry.max_retry_count, cfg.heartbeat.poll_interval_ms, cfg.storage.root
    );
  }

  void Server::run()
  {
    _http_server->run();
  }

  void Server::wait()
  {
    _http_server->wait();
    // Pending retries are cancelled only once the HTTP server is down.
    _workers.shutdown();
  }

  void Server::shutdown()
  {
    _http_server->shutdown();
  }

} // namespace funcorch::orchestrator
