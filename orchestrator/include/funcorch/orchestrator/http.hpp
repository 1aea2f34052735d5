#ifndef FUNCORCH_ORCHESTRATOR_HTTP_HPP
#define FUNCORCH_ORCHESTRATOR_HTTP_HPP

#include <funcorch/orchestrator/indexer.hpp>

#include <memory>
#include <string>
#include <thread>

#include <drogon/HttpTypes.h>
#include <drogon/drogon.h>
#include <spdlog/spdlog.h>

namespace funcorch::orchestrator {

  namespace worker {
    class Workers;
  } // namespace worker

  namespace config {
    struct HTTPServer;
  } // namespace config

  struct HttpServer : public drogon::HttpController<HttpServer, false>,
                      std::enable_shared_from_this<HttpServer> {
    using request_t = drogon::HttpRequestPtr;
    using callback_t = std::function<void(const drogon::HttpResponsePtr&)>;

    METHOD_LIST_BEGIN
    ADD_METHOD_TO(HttpServer::invoke, "/functions/invoke", drogon::Post);
    ADD_METHOD_TO(HttpServer::scan, "/functions/scan", drogon::Put);
    ADD_METHOD_TO(HttpServer::register_url, "/functions/url", drogon::Put);
    ADD_METHOD_TO(HttpServer::register_library, "/functions/library", drogon::Put);
    ADD_METHOD_TO(HttpServer::delete_function, "/functions/delete", drogon::Post);
    ADD_METHOD_TO(HttpServer::list_functions, "/functions", drogon::Get);
    ADD_METHOD_TO(HttpServer::heartbeat, "/hosts/heartbeat", drogon::Put);
    ADD_METHOD_TO(HttpServer::host_status, "/hosts/status", drogon::Get);
    METHOD_LIST_END

    HttpServer(config::HTTPServer& cfg, worker::Workers& workers);

    void run();
    void shutdown();
    void wait();

    // Parameters: function, optional reset and invocation_id; body is the input.
    void invoke(const drogon::HttpRequestPtr& request, callback_t&& callback);

    // Parameters: account (connection string or name), path (container[/prefix]).
    void scan(const drogon::HttpRequestPtr& request, callback_t&& callback);

    // Parameters: url, optional account and max_retry_count.
    void register_url(const drogon::HttpRequestPtr& request, callback_t&& callback);

    // Parameters: path, optional entry_point and max_retry_count.
    void register_library(const drogon::HttpRequestPtr& request, callback_t&& callback);

    // Parameters: function.
    void delete_function(const drogon::HttpRequestPtr& request, callback_t&& callback);

    void list_functions(const drogon::HttpRequestPtr& request, callback_t&& callback);

    // Parameters: assembly.
    void heartbeat(const drogon::HttpRequestPtr& request, callback_t&& callback);

    // Parameters: assembly.
    void host_status(const drogon::HttpRequestPtr& request, callback_t&& callback);

    static drogon::HttpResponsePtr failed_response(
        const std::string& reason, drogon::HttpStatusCode code = drogon::k500InternalServerError
    );
    static drogon::HttpResponsePtr correct_response(const std::string& reason);
    static drogon::HttpResponsePtr correct_response(const Json::Value& body);

    int port() const
    {
      return _port;
    }

  private:
    void _index(indexer::IndexOperation&& operation, callback_t&& callback);

    int _port;

    int _threads;

    worker::Workers& _workers;

    std::shared_ptr<spdlog::logger> _logger;
    std::thread _server_thread;
  };
} // namespace funcorch::orchestrator

#endif
