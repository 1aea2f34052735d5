#ifndef FUNCORCH_COMMON_EXCEPTIONS_HPP
#define FUNCORCH_COMMON_EXCEPTIONS_HPP

#include <exception>
#include <stdexcept>
#include <string>

namespace funcorch::common {

  struct FuncOrchException : std::runtime_error {

    FuncOrchException(const std::string& msg) : std::runtime_error(msg) {}
  };

  struct InvalidConfigurationError : FuncOrchException {

    InvalidConfigurationError(const std::string& msg) : FuncOrchException(msg) {}
  };

  struct ObjectDoesNotExist : FuncOrchException {

    ObjectDoesNotExist(const std::string& name) : FuncOrchException(name) {}
  };

  struct StorageError : FuncOrchException {

    StorageError(const std::string& msg) : FuncOrchException(msg) {}
  };

  // Raised by a function body, or by the invoker on its behalf.
  struct FunctionFailure : FuncOrchException {

    FunctionFailure(const std::string& msg) : FuncOrchException(msg) {}
  };

  // The retry harness and the function disagree on the attempt state.
  // Never retried.
  struct InternalConsistencyError : FuncOrchException {

    InternalConsistencyError(const std::string& msg) : FuncOrchException(msg) {}
  };

  struct RetriesExhausted : FuncOrchException {

    RetriesExhausted(const std::string& msg, int attempts, std::exception_ptr cause)
        : FuncOrchException(msg), _attempts(attempts), _cause(std::move(cause))
    {
    }

    int attempts() const
    {
      return _attempts;
    }

    const std::exception_ptr& cause() const
    {
      return _cause;
    }

  private:
    int _attempts;
    std::exception_ptr _cause;
  };

  struct InvocationCancelled : FuncOrchException {

    InvocationCancelled(const std::string& msg) : FuncOrchException(msg) {}
  };

} // namespace funcorch::common

#endif
