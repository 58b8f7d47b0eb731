#pragma once

#include <cstddef>
#include <mutex>
#include <condition_variable>
#include <stop_token>
#include <utility>

namespace common {

/*
  空闲许可数 = capacity - in_use
  一个许可覆盖一个条目的整个生命周期(包括所有重试)
*/
class ConcurrencyGate {
public:
  explicit ConcurrencyGate(size_t capacity);

  ConcurrencyGate(const ConcurrencyGate&) = delete;
  ConcurrencyGate& operator=(const ConcurrencyGate&) = delete;

  // Blocks until a permit is free. Returns false only if stop was requested
  // while waiting, in which case no permit is held.
  bool acquire(std::stop_token stop = {});
  void release();

  size_t inUse() const;
  size_t available() const;

private:
  const size_t capacity_;
  size_t in_use_{0};
  mutable std::mutex mutex_;
  std::condition_variable_any condition_;
};

// RAII: 接管一个已获取的许可, 析构时自动归还给 gate
class PermitGuard {
public:
  PermitGuard(ConcurrencyGate& gate, std::adopt_lock_t) : gate_(&gate) {}
  ~PermitGuard() { if (gate_) gate_->release(); }

  PermitGuard(PermitGuard&& other) noexcept : gate_(std::exchange(other.gate_, nullptr)) {}
  PermitGuard& operator=(PermitGuard&&) = delete;

  PermitGuard(const PermitGuard&) = delete;
  PermitGuard& operator=(const PermitGuard&) = delete;

private:
  ConcurrencyGate* gate_;
};

} // namespace common
