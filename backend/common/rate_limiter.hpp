#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>
#include <condition_variable>
#include <stop_token>

namespace common {

// Token bucket holding max_rate tokens. A token taken at time t goes back into
// the bucket at t + period, so any window of length period sees at most
// max_rate successful acquire() calls.
class RateLimiter {
public:
  using Clock = std::chrono::steady_clock;

  RateLimiter(size_t max_rate, Clock::duration period);

  RateLimiter(const RateLimiter&) = delete;
  RateLimiter& operator=(const RateLimiter&) = delete;

  // Blocks until a token is free and takes it. Returns false only when stop
  // is requested while waiting.
  bool acquire(std::stop_token stop = {});

private:
  const size_t max_rate_;
  const Clock::duration period_;
  std::mutex mutex_;
  std::condition_variable_any condition_;
  std::deque<Clock::time_point> taken_;  // oldest first
};

} // namespace common
