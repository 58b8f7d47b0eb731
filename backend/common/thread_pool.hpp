#pragma once

#include <vector>
#include <thread>
#include <future>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <functional>
#include <stdexcept>

namespace common {

// Fixed-size worker pool. Tasks still queued when the pool is destroyed are run
// before the workers exit.
class ThreadPool {
public:
    explicit ThreadPool(unsigned int size = std::thread::hardware_concurrency());
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    template <typename Func, typename... Args>
    auto commit(Func&& func, Args&&... args) -> std::future<std::invoke_result_t<Func, Args...>> {
        using ReturnType = std::invoke_result_t<Func, Args...>;

        if (_stop.load(std::memory_order_relaxed)) {
            throw std::runtime_error("ThreadPool is stopped");
        }

        auto task = std::packaged_task<ReturnType()>(
            [func = std::forward<Func>(func), ...args = std::forward<Args>(args)]() mutable -> ReturnType {
                return std::invoke(std::move(func), std::move(args)...);
            });

        auto ret = task.get_future();
        {
            std::lock_guard<std::mutex> lock{_mtx};
            _tasks.emplace([task = std::move(task)]() mutable -> void {
                task();
            });
        }
        _cv.notify_one();
        return ret;
    }

    size_t size() const { return _poolSize; }

private:
    using Task = std::packaged_task<void()>;

    std::mutex _mtx;
    std::condition_variable _cv;

    std::queue<Task> _tasks;
    std::vector<std::jthread> _threads;

    std::atomic_bool _stop{false};
    size_t _poolSize{0};
};

} // namespace common
