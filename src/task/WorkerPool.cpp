#include "WorkerPool.hpp"

#include <plog/Log.h>

#include <algorithm>

namespace task
{

int WorkerPool::defaultCapacity()
{
    const int cpus = static_cast<int>(std::thread::hardware_concurrency());
    return std::clamp(cpus, kMinThreads, kMaxThreads);
}

WorkerPool::WorkerPool(int capacity)
{
    const int count = capacity > 0 ? capacity : defaultCapacity();
    threads_.reserve(static_cast<std::size_t>(count));
    for (int i = 0; i < count; ++i)
        threads_.emplace_back([this] { threadLoop(); });
    PLOG_INFO << "Worker pool started with " << count << " threads";
}

WorkerPool::~WorkerPool()
{
    std::size_t discarded = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        discarded = queue_.size();
        queue_.clear();
    }
    work_cv_.notify_all();
    for (auto& t : threads_)
    {
        if (t.joinable())
            t.join();
    }
    if (discarded > 0)
        PLOG_WARNING << "Worker pool destroyed with " << discarded << " queued workers discarded";
}

void WorkerPool::start(std::unique_ptr<Worker> worker)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(std::move(worker));
    }
    work_cv_.notify_one();
}

bool WorkerPool::waitForDone(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(mutex_);
    return done_cv_.wait_for(lock, timeout, [this] { return queue_.empty() && active_ == 0; });
}

int WorkerPool::activeCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

std::size_t WorkerPool::queuedCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void WorkerPool::threadLoop()
{
    for (;;)
    {
        std::unique_ptr<Worker> worker;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            work_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (stopping_)
                return;
            worker = std::move(queue_.front());
            queue_.pop_front();
            ++active_;
        }

        worker->run();
        worker.reset();

        {
            std::lock_guard<std::mutex> lock(mutex_);
            --active_;
        }
        done_cv_.notify_all();
    }
}

} // namespace task
