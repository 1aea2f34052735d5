#include <funcorch/orchestrator/worker.hpp>

#include <funcorch/common/exceptions.hpp>
#include <funcorch/common/util.hpp>
#include <funcorch/orchestrator/heartbeat.hpp>
#include <funcorch/orchestrator/registry.hpp>

#include <drogon/HttpResponse.h>
#include <drogon/HttpTypes.h>
#include <json/value.h>

namespace funcorch::orchestrator::worker {

  void Workers::handle_invocation(
      const std::string& function_id, executor::InvocationRequest request,
      HttpServer::callback_t&& callback
  )
  {
    auto definition = _registry.get(function_id);
    if (!definition.has_value()) {
      callback(HttpServer::failed_response("Function unknown", drogon::k404NotFound));
      return;
    }

    try {

      auto result = _executor.invoke(definition.value(), request, _stop.get_token());

      Json::Value json;
      json["invocation_id"] = result.invocation_id;
      json["output"] = result.output;
      json["attempts"] = result.attempts;
      json["host_is_running"] = result.host_is_running;
      callback(HttpServer::correct_response(json));

    } catch (common::RetriesExhausted& exc) {

      Json::Value json;
      json["reason"] = exc.what();
      json["attempts"] = exc.attempts();
      auto resp = drogon::HttpResponse::newHttpJsonResponse(json);
      resp->setStatusCode(drogon::k500InternalServerError);
      callback(resp);

    } catch (common::InternalConsistencyError& exc) {
      callback(HttpServer::failed_response(exc.what()));
    } catch (common::InvocationCancelled& exc) {
      callback(HttpServer::failed_response(exc.what(), drogon::k503ServiceUnavailable));
    } catch (common::InvalidConfigurationError& exc) {
      callback(HttpServer::failed_response(exc.what(), drogon::k400BadRequest));
    } catch (std::exception& exc) {
      _logger->error(
          "Invocation {} of {} failed: {}", request.invocation_id, function_id, exc.what()
      );
      callback(HttpServer::failed_response(exc.what()));
    }
  }

  indexer::IndexResult Workers::process_index_operation(const indexer::IndexOperation& operation)
  {
    return _indexer.process(operation);
  }

  listing::FunctionList Workers::list_functions() const
  {
    return listing::list_functions(_registry, _heartbeats);
  }

  std::optional<std::string> Workers::heartbeat(const std::string& assembly_full_name)
  {
    try {
      _heartbeats.touch(assembly_full_name);
      return std::nullopt;
    } catch (common::InvalidConfigurationError& exc) {
      return exc.what();
    }
  }

  void Workers::shutdown()
  {
    _logger->info("Stopping workers");
    _stop.request_stop();
    _pool.wait();
  }

} // namespace funcorch::orchestrator::worker
