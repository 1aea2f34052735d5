#ifndef FUNCORCH_ORCHESTRATOR_INVOKER_HPP
#define FUNCORCH_ORCHESTRATOR_INVOKER_HPP

#include <funcorch/function/context.hpp>
#include <funcorch/orchestrator/attempts.hpp>
#include <funcorch/orchestrator/function.hpp>

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include <spdlog/spdlog.h>

namespace funcorch::orchestrator::storage {

  struct BlobStorage;

} // namespace funcorch::orchestrator::storage

namespace funcorch::orchestrator::invoker {

  struct Invoker {

    Invoker() = default;
    Invoker(const Invoker&) = delete;
    Invoker(Invoker&&) = delete;
    Invoker& operator=(const Invoker&) = delete;
    Invoker& operator=(Invoker&&) = delete;
    virtual ~Invoker() = default;

    /**
     * @brief Runs one attempt of a function body.
     * Throws FunctionFailure, or any exception raised by the body, on failure.
     *
     * @param definition function to run
     * @param invocation_id logical invocation this attempt belongs to
     * @param context retry state presented to the body
     * @param input invocation payload
     * @return output produced by the body
     */
    virtual std::string invoke(
        const FunctionDefinition& definition, const std::string& invocation_id,
        const attempts::RetryContext& context, std::string_view input
    ) = 0;
  };

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Loads function libraries with dlopen and calls their entry points.
  /// Libraries stay loaded until the invoker is destroyed.
  ////////////////////////////////////////////////////////////////////////////////
  struct LibraryInvoker {

    using entry_point_t = function::Context::entry_point_t;

    LibraryInvoker();
    LibraryInvoker(const LibraryInvoker&) = delete;
    LibraryInvoker& operator=(const LibraryInvoker&) = delete;
    ~LibraryInvoker();

    std::string invoke(
        const std::filesystem::path& library, const std::string& entry_point,
        const std::string& invocation_id, const attempts::RetryContext& context,
        std::string_view input
    );

  private:
    entry_point_t _load_function(const std::string& library_name, const std::string& entry_point);

    std::mutex _mutex;
    std::unordered_map<std::string, void*> _libraries;
    std::unordered_map<std::string, entry_point_t> _functions;

    std::shared_ptr<spdlog::logger> _logger;
  };

  struct HttpTarget {
    // Scheme, host and port.
    std::string address;
    // Request path with the query string; never empty.
    std::string path;
  };

  // Splits a function URL; the fragment is dropped.
  HttpTarget split_url(const std::string& url);

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Invokes a function by POSTing the input to its URL.
  /// The retry state is passed in the X-Retry-Count and X-Max-Retry-Count headers.
  ////////////////////////////////////////////////////////////////////////////////
  struct HttpInvoker {

    static constexpr std::chrono::seconds DEFAULT_TIMEOUT{60};

    HttpInvoker(std::chrono::milliseconds timeout = DEFAULT_TIMEOUT) : _timeout(timeout) {}

    std::string invoke(
        const std::string& url, const std::string& invocation_id,
        const attempts::RetryContext& context, std::string_view input
    );

  private:
    std::chrono::milliseconds _timeout;
  };

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Invoker selecting the execution substrate from the function location:
  /// remote blobs are fetched from storage and loaded as libraries, local libraries
  /// are loaded directly, URL functions are called over HTTP.
  ////////////////////////////////////////////////////////////////////////////////
  class FunctionInvoker : public Invoker {
  public:
    FunctionInvoker(storage::BlobStorage& storage) : _storage(storage) {}

    std::string invoke(
        const FunctionDefinition& definition, const std::string& invocation_id,
        const attempts::RetryContext& context, std::string_view input
    ) override;

  private:
    storage::BlobStorage& _storage;

    LibraryInvoker _libraries;

    HttpInvoker _http;
  };

} // namespace funcorch::orchestrator::invoker

#endif
