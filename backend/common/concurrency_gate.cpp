#include "concurrency_gate.hpp"
#include <stdexcept>

namespace common {

ConcurrencyGate::ConcurrencyGate(size_t capacity) : capacity_(capacity) {
  if (capacity_ < 1) {
    throw std::invalid_argument("ConcurrencyGate capacity must be at least 1");
  }
}

bool ConcurrencyGate::acquire(std::stop_token stop) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (!condition_.wait(lock, stop, [this]() { return in_use_ < capacity_; })) {
    return false;
  }
  ++in_use_;
  return true;
}

void ConcurrencyGate::release() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    // unmatched release is a caller bug; never let in_use_ wrap around
    if (in_use_ == 0) {
      return;
    }
    --in_use_;
  }
  condition_.notify_one();
}

size_t ConcurrencyGate::inUse() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return in_use_;
}

size_t ConcurrencyGate::available() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return capacity_ - in_use_;
}

} // namespace common
