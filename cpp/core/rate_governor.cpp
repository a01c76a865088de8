#include "core/rate_governor.hpp"

#include <kj/debug.h>
#include <algorithm>

namespace core {

RateGovernor::RateGovernor(RateGovernorConfig config, Now now)
    : config_(config), now_(std::move(now)) {
  KJ_REQUIRE(config_.min_rate > 0 && config_.min_rate <= config_.max_rate,
             config_.min_rate, config_.max_rate, "Invalid rate bounds");
  KJ_REQUIRE(config_.burst_capacity > 0, config_.burst_capacity,
             "Invalid burst capacity");
  KJ_REQUIRE(config_.recovery_factor >= 1.0, config_.recovery_factor,
             "Invalid recovery factor");
  rate_ = std::min(config_.max_rate,
                   std::max(config_.min_rate, config_.initial_rate));
  tokens_ = config_.burst_capacity;
  last_refill_ = now_();
  blocked_until_ = last_refill_;
}

void RateGovernor::Refill(Clock::time_point now) {
  if (now <= last_refill_) return;
  std::chrono::duration<double> elapsed = now - last_refill_;
  tokens_ = std::min(config_.burst_capacity, tokens_ + elapsed.count() * rate_);
  last_refill_ = now;
}

std::chrono::microseconds RateGovernor::Acquire(double cost) {
  std::lock_guard<std::mutex> lck(mutex_);
  Clock::time_point now = now_();
  Refill(now);
  tokens_ -= cost;
  std::chrono::microseconds wait(0);
  if (tokens_ < 0) {
    wait = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::duration<double>(-tokens_ / rate_));
  }
  if (blocked_until_ > now) {
    wait = std::max(wait, std::chrono::duration_cast<std::chrono::microseconds>(
                              blocked_until_ - now));
  }
  return wait;
}

void RateGovernor::OnBackpressure(std::chrono::milliseconds retry_after) {
  std::lock_guard<std::mutex> lck(mutex_);
  Clock::time_point now = now_();
  Refill(now);
  rate_ = std::max(config_.min_rate, rate_ / 2);
  // Debt stays, so whoever is already queued keeps waiting.
  tokens_ = std::min(tokens_, 0.0);
  successes_ = 0;
  if (retry_after.count() > 0) {
    blocked_until_ = std::max(blocked_until_, now + retry_after);
  }
  KJ_LOG(WARNING, "Backpressure, lowering rate", rate_, retry_after.count());
}

void RateGovernor::OnSuccess() {
  std::lock_guard<std::mutex> lck(mutex_);
  if (++successes_ < config_.success_window) return;
  successes_ = 0;
  Refill(now_());
  double rate = std::min(config_.max_rate, rate_ * config_.recovery_factor);
  if (rate != rate_) KJ_LOG(INFO, "Raising rate", rate);
  rate_ = rate;
}

double RateGovernor::RefillRate() const {
  std::lock_guard<std::mutex> lck(mutex_);
  return rate_;
}

double RateGovernor::Tokens() const {
  std::lock_guard<std::mutex> lck(mutex_);
  return tokens_;
}

}  // namespace core
