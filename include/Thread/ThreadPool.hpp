#pragma once
#include "core/Common.hpp"

#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>

namespace gridmaze
{

// Fixed set of workers draining a FIFO of jobs. Used by batch generation;
// every job owns its maze and its random engine, so jobs share nothing.
class ThreadPool final {
public:
    // 0 picks hardware_concurrency (4 when unknown).
    explicit ThreadPool(size_t threadCount = 0);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    size_t size() const noexcept;

    // Joins the workers. Jobs still queued are dropped; their futures
    // report broken_promise.
    void shutdown();

    // Throws std::runtime_error after shutdown().
    template <class F>
    auto enqueue(F&& f) -> std::future<std::invoke_result_t<std::decay_t<F>>>
    {
        using R = std::invoke_result_t<std::decay_t<F>>;

        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(f));
        std::future<R> fut = task->get_future();
        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (stop_) {
                throw std::runtime_error("ThreadPool is stopped");
            }
            jobs_.emplace([task]() { (*task)(); });
        }
        cv_.notify_one();
        return fut;
    }

private:
    void workerLoop_();

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    bool stop_{false};

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> jobs_;
};

} // namespace gridmaze
