#ifndef FUNCORCH_ORCHESTRATOR_BACKOFF_HPP
#define FUNCORCH_ORCHESTRATOR_BACKOFF_HPP

#include <chrono>
#include <memory>
#include <string>

namespace funcorch::orchestrator::config {

  struct Retry;

} // namespace funcorch::orchestrator::config

namespace funcorch::orchestrator::backoff {

  enum class Strategy { NONE = 0, FIXED_DELAY, EXPONENTIAL_BACKOFF };

  Strategy deserialize(std::string strategy);

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Delay inserted before a re-attempt. The retry state machine does not
  /// depend on the policy.
  ////////////////////////////////////////////////////////////////////////////////
  struct Backoff {

    Backoff() = default;
    Backoff(const Backoff&) = default;
    Backoff(Backoff&&) = default;
    Backoff& operator=(const Backoff&) = default;
    Backoff& operator=(Backoff&&) = default;
    virtual ~Backoff() = default;

    /**
     * @param attempt index of the attempt about to start, at least 1
     * @return time to wait before starting it
     */
    virtual std::chrono::milliseconds delay(int attempt) const = 0;

    static std::unique_ptr<Backoff> construct(const config::Retry& cfg);
  };

  // Retries start immediately.
  struct NoBackoff : Backoff {
    std::chrono::milliseconds delay(int attempt) const override;
  };

  struct FixedDelay : Backoff {

    FixedDelay(std::chrono::milliseconds delay) : _delay(delay) {}

    std::chrono::milliseconds delay(int attempt) const override;

  private:
    std::chrono::milliseconds _delay;
  };

  // Doubles the delay with every attempt, capped at max_delay.
  struct ExponentialBackoff : Backoff {

    ExponentialBackoff(std::chrono::milliseconds min_delay, std::chrono::milliseconds max_delay)
        : _min_delay(min_delay), _max_delay(max_delay)
    {
    }

    std::chrono::milliseconds delay(int attempt) const override;

  private:
    std::chrono::milliseconds _min_delay;
    std::chrono::milliseconds _max_delay;
  };

} // namespace funcorch::orchestrator::backoff

#endif
