#include "Thread/ThreadPool.hpp"

namespace gridmaze
{

ThreadPool::ThreadPool(size_t threadCount)
{
    if (threadCount == 0) {
        threadCount = std::thread::hardware_concurrency();
        if (threadCount == 0) threadCount = 4;
    }

    workers_.reserve(threadCount);
    try {
        for (size_t i = 0; i < threadCount; ++i) {
            workers_.emplace_back([this] { workerLoop_(); });
        }
    } catch (...) {
        // joins whatever started before the failure
        shutdown();
        throw;
    }
}

ThreadPool::~ThreadPool()
{
    shutdown();
}

size_t ThreadPool::size() const noexcept
{
    std::lock_guard<std::mutex> lock(mtx_);
    return workers_.size();
}

void ThreadPool::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (stop_) return;
        stop_ = true;
    }
    cv_.notify_all();

    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }

    std::lock_guard<std::mutex> lock(mtx_);
    workers_.clear();
    std::queue<std::function<void()>> empty;
    jobs_.swap(empty);
}

void ThreadPool::workerLoop_()
{
    for (;;) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(mtx_);
            cv_.wait(lock, [&] { return stop_ || !jobs_.empty(); });

            if (stop_) return;

            job = std::move(jobs_.front());
            jobs_.pop();
        }
        job();
    }
}

} // namespace gridmaze
