#ifndef FUNCORCH_COMMON_HTTP_HPP
#define FUNCORCH_COMMON_HTTP_HPP

#include <functional>
#include <memory>
#include <string>
#include <utility>

#include <drogon/HttpTypes.h>

namespace drogon {
  class HttpRequest;
  class HttpResponse;
  class HttpClient;
} // namespace drogon

namespace trantor {
  class EventLoop;
  class EventLoopThreadPool;
} // namespace trantor

namespace funcorch::common::http {

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Asynchronous client of a single HTTP server.
  ///
  /// Requests complete on the event loop the client was created with; callbacks
  /// must not block it.
  ////////////////////////////////////////////////////////////////////////////////
  struct HTTPClient {

    using request_ptr_t = std::shared_ptr<drogon::HttpRequest>;
    using response_ptr_t = std::shared_ptr<drogon::HttpResponse>;
    using parameters_t = std::initializer_list<std::pair<std::string, std::string>>;
    using headers_t = std::initializer_list<std::pair<std::string, std::string>>;
    using callback_t = std::function<void(drogon::ReqResult, const response_ptr_t&)>;

    HTTPClient() = default;

    HTTPClient(const std::string& address, trantor::EventLoop* loop);

    request_ptr_t put(const std::string& path, parameters_t&& params, callback_t&& callback);

    request_ptr_t get(const std::string& path, parameters_t&& params, callback_t&& callback);

    request_ptr_t post(const std::string& path, parameters_t&& params, callback_t&& callback);

    // Text body with custom headers, e.g. the retry state of a function attempt.
    request_ptr_t post(
        const std::string& path, parameters_t&& params, headers_t&& headers, std::string body,
        callback_t&& callback
    );

  private:
    static request_ptr_t
    _build(drogon::HttpMethod method, const std::string& path, parameters_t params);

    request_ptr_t _send(request_ptr_t req, callback_t&& callback);

    std::shared_ptr<drogon::HttpClient> _http_client;
  };

  // Event loops shared by all clients of the process.
  struct HTTPClientFactory {

    static void initialize(int thread_num);
    static void shutdown();

    // Client on the next loop of the pool.
    static HTTPClient create_client(std::string address, int port = -1);

    // Client on the default loop; requests of all shared clients are serialized.
    static HTTPClient create_client_shared(std::string address, int port = -1);

  private:
    static std::string _address(std::string address, int port);

    static std::unique_ptr<trantor::EventLoopThreadPool> _pool;
    static trantor::EventLoop* _default_loop;
  };

} // namespace funcorch::common::http

#endif
