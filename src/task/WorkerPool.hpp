#pragma once

#include "Worker.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace task
{

/**
 * @brief Fixed-size thread pool running Workers in FIFO order.
 *
 * A Worker is destroyed as soon as it has run. Destruction discards queued
 * Workers and joins every thread, so any running job is awaited.
 */
class WorkerPool
{
public:
    static constexpr int kMinThreads = 2;
    static constexpr int kMaxThreads = 4;

    // clamp(hardware_concurrency, 2, 4)
    static int defaultCapacity();

    // capacity <= 0 selects defaultCapacity()
    explicit WorkerPool(int capacity = 0);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void start(std::unique_ptr<Worker> worker);

    // Blocks until no Worker is queued or running. Returns false on timeout.
    bool waitForDone(std::chrono::milliseconds timeout);

    int capacity() const { return static_cast<int>(threads_.size()); }
    int activeCount() const;
    std::size_t queuedCount() const;

private:
    void threadLoop();

    mutable std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable done_cv_;
    std::deque<std::unique_ptr<Worker>> queue_;
    int active_ = 0;
    bool stopping_ = false;
    std::vector<std::thread> threads_;
};

} // namespace task
