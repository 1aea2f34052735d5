#include <funcorch/orchestrator/backoff.hpp>

#include <funcorch/common/exceptions.hpp>
#include <funcorch/orchestrator/config.hpp>

#include <algorithm>

#include <fmt/format.h>

namespace funcorch::orchestrator::backoff {

  Strategy deserialize(std::string strategy)
  {
    if (strategy == "none") {
      return Strategy::NONE;
    }
    if (strategy == "fixedDelay") {
      return Strategy::FIXED_DELAY;
    }
    if (strategy == "exponentialBackoff") {
      return Strategy::EXPONENTIAL_BACKOFF;
    }
    throw common::InvalidConfigurationError(fmt::format("Unknown retry strategy {}", strategy));
  }

  std::unique_ptr<Backoff> Backoff::construct(const config::Retry& cfg)
  {
    switch (cfg.strategy) {
    case Strategy::NONE:
      return std::make_unique<NoBackoff>();
    case Strategy::FIXED_DELAY:
      return std::make_unique<FixedDelay>(std::chrono::milliseconds{cfg.delay_ms});
    case Strategy::EXPONENTIAL_BACKOFF:
      return std::make_unique<ExponentialBackoff>(
          std::chrono::milliseconds{cfg.delay_ms}, std::chrono::milliseconds{cfg.max_delay_ms}
      );
    }
    return nullptr;
  }

  std::chrono::milliseconds NoBackoff::delay(int /*unused*/) const
  {
    return std::chrono::milliseconds{0};
  }

  std::chrono::milliseconds FixedDelay::delay(int /*unused*/) const
  {
    return _delay;
  }

  std::chrono::milliseconds ExponentialBackoff::delay(int attempt) const
  {
    // Attempt 1 waits min_delay; shifting stops once the cap is reached.
    auto delay = _min_delay;
    for (int i = 1; i < attempt && delay < _max_delay; ++i) {
      delay *= 2;
    }
    return std::min(delay, _max_delay);
  }

} // namespace funcorch::orchestrator::backoff
