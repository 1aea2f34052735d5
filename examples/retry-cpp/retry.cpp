#include <funcorch/function/context.hpp>

#include <mutex>
#include <string>
#include <unordered_map>

#include <fmt/format.h>

namespace {

  std::mutex counters_mutex;
  // Attempts observed by this library, per logical invocation.
  std::unordered_map<std::string, int> counters;

} // namespace

// Fails the first attempt of every logical invocation and succeeds on the retry.
// Cross-checks the retry state reported by the orchestrator with its own count.
extern "C" int handler(funcorch::function::Context& context)
{
  std::lock_guard<std::mutex> lock{counters_mutex};

  std::string id{context.invocation_id()};
  if (context.retry_count() == 0) {
    counters[id] = 0;
  }
  int& invocation_count = counters[id];

  if (context.retry_count() != invocation_count) {
    context.fail(fmt::format(
        "retryCount={} is not equal to invocationCount={}", context.retry_count(),
        invocation_count
    ));
    return 1;
  }

  if (context.max_retry_count() != 2) {
    context.fail(fmt::format("maxRetryCount={} is not equal to 2", context.max_retry_count()));
    return 1;
  }

  invocation_count += 1;
  if (invocation_count < 2) {
    context.fail("An error occurred");
    return 1;
  }

  context.write_output(fmt::format("invocationCount: {}", invocation_count));
  counters.erase(id);
  return 0;
}
