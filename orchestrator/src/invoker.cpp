#include <funcorch/orchestrator/invoker.hpp>

#include <funcorch/common/exceptions.hpp>
#include <funcorch/common/http.hpp>
#include <funcorch/common/util.hpp>
#include <funcorch/orchestrator/storage.hpp>

#include <future>

#include <drogon/HttpResponse.h>
#include <drogon/HttpTypes.h>
#include <fmt/format.h>

#include <dlfcn.h>

namespace funcorch::orchestrator::invoker {

  LibraryInvoker::LibraryInvoker()
  {
    _logger = common::util::create_logger("LibraryInvoker");
  }

  LibraryInvoker::~LibraryInvoker()
  {
    for (auto [name, handle] : _libraries) {
      dlclose(handle);
    }
  }

  LibraryInvoker::entry_point_t
  LibraryInvoker::_load_function(const std::string& library_name, const std::string& entry_point)
  {
    std::lock_guard<std::mutex> lock{_mutex};

    std::string key = fmt::format("{}!{}", library_name, entry_point);
    auto func = _functions.find(key);
    if (func != _functions.end()) {
      return func->second;
    }

    auto library = _libraries.find(library_name);
    void* library_handle = nullptr;
    if (library == _libraries.end()) {
      library_handle = dlopen(library_name.c_str(), RTLD_NOW);
      if (library_handle == nullptr) {
        throw common::FunctionFailure(
            fmt::format("Couldn't open the library {}, reason: {}", library_name, dlerror())
        );
      }
      _libraries[library_name] = library_handle;
    } else {
      library_handle = library->second;
    }

    void* func_handle = dlsym(library_handle, entry_point.c_str());
    if (func_handle == nullptr) {
      throw common::FunctionFailure(
          fmt::format("Couldn't get the function {}, reason: {}", entry_point, dlerror())
      );
    }

    _logger->debug("Loaded {} from {}", entry_point, library_name);
    auto ptr = reinterpret_cast<entry_point_t>(func_handle);
    _functions[key] = ptr;
    return ptr;
  }

  std::string LibraryInvoker::invoke(
      const std::filesystem::path& library, const std::string& entry_point,
      const std::string& invocation_id, const attempts::RetryContext& context,
      std::string_view input
  )
  {
    auto func = _load_function(library.string(), entry_point);

    function::Context ctx{invocation_id, input, context.retry_count, context.max_retry_count};
    int ret = func(ctx);
    if (ret != 0) {
      throw common::FunctionFailure(
          ctx.error().empty() ? fmt::format("Function returned {}", ret) : ctx.error()
      );
    }
    return ctx.output();
  }

  HttpTarget split_url(const std::string& url)
  {
    auto scheme = url.find("://");
    auto authority_end = url.find_first_of("/?#", scheme == std::string::npos ? 0 : scheme + 3);

    HttpTarget target;
    target.address = url.substr(0, authority_end);
    if (authority_end == std::string::npos) {
      target.path = "/";
      return target;
    }

    auto fragment = url.find('#', authority_end);
    target.path = url.substr(authority_end, fragment - authority_end);
    if (target.path.empty() || target.path.front() != '/') {
      target.path.insert(0, "/");
    }
    return target;
  }

  std::string HttpInvoker::invoke(
      const std::string& url, const std::string& invocation_id,
      const attempts::RetryContext& context, std::string_view input
  )
  {
    auto [address, path] = split_url(url);

    auto client = common::http::HTTPClientFactory::create_client(address);

    // The callback can outlive this call when the request times out.
    auto result = std::make_shared<std::promise<std::string>>();
    auto future = result->get_future();
    client.post(
        path, {},
        {{"X-Invocation-Id", invocation_id},
         {"X-Retry-Count", std::to_string(context.retry_count)},
         {"X-Max-Retry-Count", std::to_string(context.max_retry_count)}},
        std::string{input},
        [result, url](drogon::ReqResult req_result, const drogon::HttpResponsePtr& response) {
          if (req_result != drogon::ReqResult::Ok) {
            result->set_exception(std::make_exception_ptr(
                common::FunctionFailure(fmt::format("Request to {} failed", url))
            ));
            return;
          }

          auto status = static_cast<int>(response->getStatusCode());
          if (status < 200 || status >= 300) {
            result->set_exception(std::make_exception_ptr(common::FunctionFailure(
                fmt::format("Function at {} returned {}: {}", url, status, response->getBody())
            )));
            return;
          }

          result->set_value(std::string{response->getBody()});
        }
    );

    if (future.wait_for(_timeout) != std::future_status::ready) {
      throw common::FunctionFailure(fmt::format("Request to {} timed out", url));
    }
    return future.get();
  }

  std::string FunctionInvoker::invoke(
      const FunctionDefinition& definition, const std::string& invocation_id,
      const attempts::RetryContext& context, std::string_view input
  )
  {
    return std::visit(
        common::util::overloaded{
            [&](const RemoteFunctionLocation& loc) {
              auto account = storage::Account::parse(loc.account_connection_string);
              auto path = _storage.fetch(account, loc.container, loc.blob);
              return _libraries.invoke(
                  path, definition.entry_point, invocation_id, context, input
              );
            },
            [&](const LocalFunctionLocation& loc) {
              return _libraries.invoke(
                  loc.path, definition.entry_point, invocation_id, context, input
              );
            },
            [&](const UrlFunctionLocation& loc) {
              return _http.invoke(loc.invoke_url, invocation_id, context, input);
            }
        },
        definition.location
    );
  }

} // namespace funcorch::orchestrator::invoker
