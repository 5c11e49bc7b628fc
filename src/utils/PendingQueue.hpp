#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <iterator>
#include <mutex>
#include <utility>
#include <vector>

namespace utils
{

// Multi-producer queue drained in batches by a single consumer thread.
template <typename T>
class PendingQueue {
public:
    void push(T&& item) {
        {
            std::lock_guard<std::mutex> lock(m_);
            q_.push_back(std::move(item));
        }
        cv_.notify_one();
    }

    void drain(std::vector<T>& out) {
        std::lock_guard<std::mutex> lock(m_);
        out.insert(out.end(), std::make_move_iterator(q_.begin()), std::make_move_iterator(q_.end()));
        q_.clear();
    }

    // Blocks until an item is queued, wake() is called or the deadline passes.
    // Returns true when items are waiting.
    template <typename Clock, typename Duration>
    bool waitUntil(const std::chrono::time_point<Clock, Duration>& deadline) {
        std::unique_lock<std::mutex> lock(m_);
        cv_.wait_until(lock, deadline, [this] { return !q_.empty() || woken_; });
        woken_ = false;
        return !q_.empty();
    }

    void wake() {
        {
            std::lock_guard<std::mutex> lock(m_);
            woken_ = true;
        }
        cv_.notify_all();
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(m_);
        return q_.empty();
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(m_);
        return q_.size();
    }

private:
    mutable std::mutex m_;
    std::condition_variable cv_;
    std::vector<T> q_;
    bool woken_ = false;
};

} // namespace utils
