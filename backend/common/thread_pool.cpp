#include "thread_pool.hpp"

namespace common {

ThreadPool::ThreadPool(unsigned int size) {
  if (size < 1) {
    _poolSize = 2;
  } else {
    _poolSize = size;
  }
  _threads.reserve(_poolSize);

  for (unsigned int i = 0; i < _poolSize; i++) {
    _threads.emplace_back([this]() -> void {
      while (true) {
        Task task;
        {
          std::unique_lock<std::mutex> lock{_mtx};
          _cv.wait(lock, [this]() -> bool {
            return _stop.load(std::memory_order_acquire) || !_tasks.empty();
          });

          // drain the queue before honouring stop
          if (_stop.load(std::memory_order_acquire) && _tasks.empty()) {
            break;
          }

          task = std::move(_tasks.front());
          _tasks.pop();
        }
        task();
      }
    });
  }
}

ThreadPool::~ThreadPool() {
  {
    std::lock_guard<std::mutex> lock{_mtx};
    _stop.store(true, std::memory_order_release);
  }
  _cv.notify_all();
  // join here, workers still read _stop and _tasks
  _threads.clear();
}

} // namespace common
