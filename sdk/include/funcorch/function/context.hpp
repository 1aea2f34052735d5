#ifndef FUNCORCH_FUNCTION_CONTEXT_HPP
#define FUNCORCH_FUNCTION_CONTEXT_HPP

#include <string>
#include <string_view>

namespace funcorch::orchestrator::invoker {
  struct LibraryInvoker;
} // namespace funcorch::orchestrator::invoker

namespace funcorch::function {

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Execution context handed to a function body.
  ///
  /// A function library exports
  ///   extern "C" int handler(funcorch::function::Context& context);
  /// Returning a non-zero value, or throwing, marks the attempt as failed.
  ////////////////////////////////////////////////////////////////////////////////
  struct Context {

    static constexpr std::string_view ENTRY_POINT = "handler";

    using entry_point_t = int (*)(Context&);

    // Zero-based index of the current attempt.
    int retry_count() const
    {
      return _retry_count;
    }

    int max_retry_count() const
    {
      return _max_retry_count;
    }

    std::string_view invocation_id() const
    {
      return _invocation_id;
    }

    std::string_view input() const
    {
      return _input;
    }

    void write_output(std::string_view data)
    {
      _output.append(data);
    }

    void fail(std::string_view reason)
    {
      _error = reason;
    }

    const std::string& output() const
    {
      return _output;
    }

    const std::string& error() const
    {
      return _error;
    }

  private:
    Context(
        std::string_view invocation_id, std::string_view input, int retry_count,
        int max_retry_count
    )
        : _retry_count(retry_count), _max_retry_count(max_retry_count),
          _invocation_id(invocation_id), _input(input)
    {
    }

    int _retry_count;
    int _max_retry_count;

    std::string_view _invocation_id;
    std::string_view _input;

    std::string _output;
    std::string _error;

    friend struct orchestrator::invoker::LibraryInvoker;
  };

} // namespace funcorch::function

#endif
