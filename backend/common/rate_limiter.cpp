#include "rate_limiter.hpp"
#include <stdexcept>

namespace common {

RateLimiter::RateLimiter(size_t max_rate, Clock::duration period)
  : max_rate_(max_rate), period_(period) {
  if (max_rate_ < 1) {
    throw std::invalid_argument("RateLimiter max_rate must be at least 1");
  }
  if (period_ <= Clock::duration::zero()) {
    throw std::invalid_argument("RateLimiter period must be positive");
  }
}

bool RateLimiter::acquire(std::stop_token stop) {
  std::unique_lock<std::mutex> lock(mutex_);
  while (true) {
    if (stop.stop_requested()) {
      return false;
    }

    auto now = Clock::now();
    while (!taken_.empty() && taken_.front() + period_ <= now) {
      taken_.pop_front();
    }

    if (taken_.size() < max_rate_) {
      taken_.push_back(now);
      return true;
    }

    // sleep until the oldest token is refilled; the predicate never holds so
    // this only returns on timeout or stop request
    condition_.wait_until(lock, stop, taken_.front() + period_, []() { return false; });
  }
}

} // namespace common
