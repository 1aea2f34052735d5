#include <funcorch/orchestrator/http.hpp>

#include <funcorch/common/uuid.hpp>
#include <funcorch/common/util.hpp>
#include <funcorch/orchestrator/config.hpp>
#include <funcorch/orchestrator/heartbeat.hpp>
#include <funcorch/orchestrator/worker.hpp>

#include <charconv>
#include <chrono>
#include <optional>

#include <drogon/HttpAppFramework.h>
#include <drogon/HttpTypes.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace funcorch::orchestrator {

  namespace {

    // Absent or empty parameters are nullopt; malformed ones throw.
    std::optional<int> int_parameter(const drogon::HttpRequestPtr& request, const std::string& name)
    {
      const std::string& value = request->getParameter(name);
      if (value.empty()) {
        return std::nullopt;
      }

      int result{};
      auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
      if (ec != std::errc{} || ptr != value.data() + value.size() || result < 0) {
        throw common::InvalidConfigurationError(
            fmt::format("Incorrect value {} of parameter {}", value, name)
        );
      }
      return result;
    }

    // Any value other than an empty one, 0 or false enables the flag.
    bool flag_parameter(const drogon::HttpRequestPtr& request, const std::string& name)
    {
      const auto& params = request->getParameters();
      auto iter = params.find(name);
      if (iter == params.end()) {
        return false;
      }
      return iter->second != "0" && !common::util::iequals(iter->second, "false");
    }

    std::string format_timestamp(timestamp_t timestamp)
    {
      return fmt::format(
          "{}", std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch())
                    .count()
      );
    }

  } // namespace

  HttpServer::HttpServer(config::HTTPServer& cfg, worker::Workers& workers)
      : _port(cfg.port), _threads(cfg.threads), _workers(workers)
  {
    _logger = common::util::create_logger("HttpServer");
    drogon::app().setClientMaxBodySize(cfg.max_payload_size);
    drogon::app().setIdleConnectionTimeout(cfg.idle_connection_timeout);
  }

  void HttpServer::run()
  {
    drogon::app().disableSigtermHandling();
    drogon::app().registerController(shared_from_this());
    drogon::app().setThreadNum(_threads);
    _server_thread = std::thread{[this]() { drogon::app().addListener("0.0.0.0", _port).run(); }};
  }

  void HttpServer::shutdown()
  {
    if (drogon::app().isRunning()) {
      drogon::app().getLoop()->queueInLoop([]() { drogon::app().quit(); });
    }
  }

  void HttpServer::wait()
  {
    if (_server_thread.joinable()) {
      _server_thread.join();
    }
    _logger->info("Stopped HTTP server");
  }

  drogon::HttpResponsePtr HttpServer::correct_response(const std::string& reason)
  {
    Json::Value json;
    json["message"] = reason;
    return correct_response(json);
  }

  drogon::HttpResponsePtr HttpServer::correct_response(const Json::Value& body)
  {
    auto resp = drogon::HttpResponse::newHttpJsonResponse(body);
    resp->setStatusCode(drogon::k200OK);
    return resp;
  }

  drogon::HttpResponsePtr
  HttpServer::failed_response(const std::string& reason, drogon::HttpStatusCode status_code)
  {
    Json::Value json;
    json["reason"] = reason;
    auto resp = drogon::HttpResponse::newHttpJsonResponse(json);
    resp->setStatusCode(status_code);
    return resp;
  }

  void HttpServer::invoke(const drogon::HttpRequestPtr& request, callback_t&& callback)
  {
    std::string function_id = request->getParameter("function");
    if (function_id.empty()) {
      callback(failed_response("Missing arguments!", drogon::k400BadRequest));
      return;
    }

    executor::InvocationRequest invocation;
    invocation.invocation_id = request->getParameter("invocation_id");
    if (invocation.invocation_id.empty()) {
      static common::UUID uuid_generator;
      invocation.invocation_id = uuid_generator.str();
      invocation.generated_id = true;
    }
    invocation.input = std::string{request->getBody()};
    invocation.reset = flag_parameter(request, "reset");

    _logger->info(
        "Push new invocation {} of {}, reset {}", invocation.invocation_id, function_id,
        invocation.reset
    );
    _workers.add_task(
        &worker::Workers::handle_invocation, function_id, std::move(invocation),
        std::move(callback)
    );
  }

  void HttpServer::_index(indexer::IndexOperation&& operation, callback_t&& callback)
  {
    _workers.add_task([=, this, callback = std::move(callback)]() {
      auto result = _workers.process_index_operation(operation);
      if (result.error) {
        callback(failed_response(result.error.value(), drogon::k400BadRequest));
        return;
      }

      Json::Value json;
      if (result.count_scanned) {
        json["count_scanned"] = result.count_scanned.value();
      }
      if (result.deleted) {
        json["deleted"] = result.deleted.value();
      }
      callback(correct_response(json));
    });
  }

  void HttpServer::scan(const drogon::HttpRequestPtr& request, callback_t&& callback)
  {
    std::string account = request->getParameter("account");
    std::string path = request->getParameter("path");
    if (account.empty() || path.empty()) {
      callback(failed_response("Missing arguments!", drogon::k400BadRequest));
      return;
    }

    _logger->info("Scan path {}", path);
    _index(indexer::RegisterCommand{account, path}, std::move(callback));
  }

  void HttpServer::register_url(const drogon::HttpRequestPtr& request, callback_t&& callback)
  {
    std::string url = request->getParameter("url");
    if (url.empty()) {
      callback(failed_response("Missing arguments!", drogon::k400BadRequest));
      return;
    }

    try {
      auto max_retry_count = int_parameter(request, "max_retry_count");
      _logger->info("Register URL function {}", url);
      _index(
          indexer::RegisterUrlCommand{url, request->getParameter("account"), max_retry_count},
          std::move(callback)
      );
    } catch (common::InvalidConfigurationError& exc) {
      callback(failed_response(exc.what(), drogon::k400BadRequest));
    }
  }

  void HttpServer::register_library(const drogon::HttpRequestPtr& request, callback_t&& callback)
  {
    std::string path = request->getParameter("path");
    if (path.empty()) {
      callback(failed_response("Missing arguments!", drogon::k400BadRequest));
      return;
    }

    try {
      auto max_retry_count = int_parameter(request, "max_retry_count");
      _logger->info("Register library function {}", path);
      _index(
          indexer::RegisterLibraryCommand{
              path, request->getParameter("entry_point"), max_retry_count},
          std::move(callback)
      );
    } catch (common::InvalidConfigurationError& exc) {
      callback(failed_response(exc.what(), drogon::k400BadRequest));
    }
  }

  void HttpServer::delete_function(const drogon::HttpRequestPtr& request, callback_t&& callback)
  {
    std::string function_id = request->getParameter("function");
    if (function_id.empty()) {
      callback(failed_response("Missing arguments!", drogon::k400BadRequest));
      return;
    }

    _logger->info("Delete function {}", function_id);
    _index(indexer::DeleteCommand{function_id}, std::move(callback));
  }

  void HttpServer::list_functions(
      const drogon::HttpRequestPtr&, // NOLINT
      callback_t&& callback
  )
  {
    _workers.add_task([this, callback = std::move(callback)]() {
      auto list = _workers.list_functions();

      Json::Value groups{Json::arrayValue};
      for (const auto& group : list.groups) {

        Json::Value functions{Json::arrayValue};
        for (const auto& func : group.functions) {
          Json::Value model;
          model["id"] = func.id;
          model["timestamp"] = format_timestamp(func.timestamp);
          model["description"] = func.description;
          model["location_id"] = func.location_id;
          model["location_name"] = func.location_name;
          model["hostIsRunning"] = func.host_is_running;
          functions.append(model);
        }

        Json::Value json_group;
        json_group["key"] = group.key;
        json_group["functions"] = functions;
        groups.append(json_group);
      }

      Json::Value json;
      json["functions"] = groups;
      json["has_warning"] = list.has_warning;
      callback(correct_response(json));
    });
  }

  void HttpServer::heartbeat(const drogon::HttpRequestPtr& request, callback_t&& callback)
  {
    std::string assembly = request->getParameter("assembly");
    if (assembly.empty()) {
      callback(failed_response("Missing arguments!", drogon::k400BadRequest));
      return;
    }

    _logger->debug("Heartbeat of {}", assembly);
    auto error = _workers.heartbeat(assembly);
    if (error) {
      callback(failed_response(error.value(), drogon::k400BadRequest));
    } else {
      callback(correct_response("Recorded"));
    }
  }

  void HttpServer::host_status(const drogon::HttpRequestPtr& request, callback_t&& callback)
  {
    std::string assembly = request->getParameter("assembly");
    if (assembly.empty()) {
      callback(failed_response("Missing arguments!", drogon::k400BadRequest));
      return;
    }

    auto now = std::chrono::system_clock::now();
    auto host = _workers.heartbeats().get(assembly);

    Json::Value json;
    json["assembly"] = assembly;
    json["live"] = _workers.heartbeats().is_live(assembly, now);
    if (host) {
      json["last_heartbeat"] = format_timestamp(host->last_heartbeat);
    }
    callback(correct_response(json));
  }

} // namespace funcorch::orchestrator
