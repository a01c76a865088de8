#ifndef CORE_RATE_GOVERNOR_HPP
#define CORE_RATE_GOVERNOR_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>

namespace core {

struct RateGovernorConfig {
  double initial_rate = 10.0;  // tokens per second
  double min_rate = 0.5;
  double max_rate = 20.0;
  double burst_capacity = 10.0;
  // Consecutive successes needed before the rate is raised again.
  uint32_t success_window = 20;
  double recovery_factor = 1.1;
};

// Adaptive token bucket shared by all transfers. Backpressure halves the
// refill rate, sustained success slowly brings it back. Thread safe.
class RateGovernor {
 public:
  using Clock = std::chrono::steady_clock;
  using Now = std::function<Clock::time_point()>;

  explicit RateGovernor(RateGovernorConfig config, Now now = &Clock::now);

  // Takes cost tokens and returns how long the caller has to wait before
  // using them. The reservation is made even when the wait is positive, so
  // concurrent callers queue up behind each other.
  std::chrono::microseconds Acquire(double cost = 1.0);

  // The remote side pushed back. retry_after, if not zero, blocks every
  // acquisition for at least that long.
  void OnBackpressure(
      std::chrono::milliseconds retry_after = std::chrono::milliseconds(0));

  void OnSuccess();

  double RefillRate() const;
  double Tokens() const;

 private:
  void Refill(Clock::time_point now);

  const RateGovernorConfig config_;
  Now now_;
  double rate_;
  double tokens_;
  uint32_t successes_ = 0;
  Clock::time_point last_refill_;
  Clock::time_point blocked_until_;
  mutable std::mutex mutex_;
};

}  // namespace core

#endif
