#include <funcorch/common/http.hpp>

#include <funcorch/common/exceptions.hpp>

#include <drogon/HttpClient.h>
#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>
#include <fmt/format.h>
#include <trantor/net/EventLoop.h>
#include <trantor/net/EventLoopThreadPool.h>

namespace funcorch::common::http {

  std::unique_ptr<trantor::EventLoopThreadPool> HTTPClientFactory::_pool = nullptr;
  trantor::EventLoop* HTTPClientFactory::_default_loop = nullptr;

  HTTPClient::HTTPClient(const std::string& address, trantor::EventLoop* loop)
      : _http_client(drogon::HttpClient::newHttpClient(address, loop, false, false))
  {
  }

  HTTPClient::request_ptr_t
  HTTPClient::_build(drogon::HttpMethod method, const std::string& path, parameters_t params)
  {
    auto req = drogon::HttpRequest::newHttpRequest();
    req->setMethod(method);
    req->setPath(path);
    for (const auto& [key, value] : params) {
      req->setParameter(key, value);
    }
    return req;
  }

  HTTPClient::request_ptr_t HTTPClient::_send(request_ptr_t req, callback_t&& callback)
  {
    if (!_http_client) {
      throw common::FuncOrchException("HTTP client is not connected to any server");
    }
    _http_client->sendRequest(req, std::move(callback));
    return req;
  }

  HTTPClient::request_ptr_t
  HTTPClient::put(const std::string& path, parameters_t&& params, callback_t&& callback)
  {
    return _send(_build(drogon::Put, path, params), std::move(callback));
  }

  HTTPClient::request_ptr_t
  HTTPClient::get(const std::string& path, parameters_t&& params, callback_t&& callback)
  {
    return _send(_build(drogon::Get, path, params), std::move(callback));
  }

  HTTPClient::request_ptr_t
  HTTPClient::post(const std::string& path, parameters_t&& params, callback_t&& callback)
  {
    return _send(_build(drogon::Post, path, params), std::move(callback));
  }

  HTTPClient::request_ptr_t HTTPClient::post(
      const std::string& path, parameters_t&& params, headers_t&& headers, std::string body,
      callback_t&& callback
  )
  {
    auto req = _build(drogon::Post, path, params);
    // The path may carry a query string that is already encoded.
    req->setPathEncode(false);
    req->setContentTypeCode(drogon::CT_TEXT_PLAIN);
    req->setBody(std::move(body));
    for (const auto& [name, value] : headers) {
      req->addHeader(name, value);
    }
    return _send(std::move(req), std::move(callback));
  }

  void HTTPClientFactory::initialize(int thread_num)
  {
    _pool = std::make_unique<trantor::EventLoopThreadPool>(thread_num);
    _pool->start();
    _default_loop = _pool->getNextLoop();
  }

  void HTTPClientFactory::shutdown()
  {
    _default_loop = nullptr;
    _pool.reset();
  }

  std::string HTTPClientFactory::_address(std::string address, int port)
  {
    return port == -1 ? address : fmt::format("{}:{}", address, port);
  }

  HTTPClient HTTPClientFactory::create_client(std::string address, int port)
  {
    if (!_pool) {
      throw common::FuncOrchException("Uninitialized HTTPClientFactory!");
    }
    return HTTPClient{_address(std::move(address), port), _pool->getNextLoop()};
  }

  HTTPClient HTTPClientFactory::create_client_shared(std::string address, int port)
  {
    if (!_default_loop) {
      throw common::FuncOrchException("Uninitialized HTTPClientFactory!");
    }
    return HTTPClient{_address(std::move(address), port), _default_loop};
  }

} // namespace funcorch::common::http
