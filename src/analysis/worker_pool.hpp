// Fixed-size worker pool for scenario execution

#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace mcpdoctor::analysis::detail
{

/// At most `size` tasks run at once; the rest wait in FIFO order.
/// The destructor drains the queue and joins every worker.
class WorkerPool
{
  public:
    explicit WorkerPool(std::size_t size)
    {
        if (size == 0)
            size = 1;
        workers_.reserve(size);
        for (std::size_t i = 0; i < size; ++i)
            workers_.emplace_back([this] { worker_loop(); });
    }

    ~WorkerPool()
    {
        stop();
    }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// Exceptions thrown by f surface through the returned future
    template <typename F>
    auto submit(F&& f) -> std::future<std::invoke_result_t<F>>
    {
        using R = std::invoke_result_t<F>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(f));
        auto fut = task->get_future();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_)
                throw std::runtime_error("Cannot submit task: worker pool is stopping");
            tasks_.emplace([task]() { (*task)(); });
        }
        cv_.notify_one();
        return fut;
    }

    /// Finish queued tasks, then join
    void stop()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_)
                return;
            stopping_ = true;
        }
        cv_.notify_all();
        for (auto& w : workers_)
            if (w.joinable())
                w.join();
        workers_.clear();
    }

    std::size_t size() const
    {
        return workers_.size();
    }

  private:
    void worker_loop()
    {
        for (;;)
        {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
                if (tasks_.empty())
                    return;
                task = std::move(tasks_.front());
                tasks_.pop();
            }
            // packaged_task stores any exception in its future
            task();
        }
    }

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;
};

} // namespace mcpdoctor::analysis::detail
