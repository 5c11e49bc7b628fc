#pragma once

#include <atomic>

namespace task
{

// Shared between the coordinating thread (writer) and one pool thread (reader).
class CancellationToken
{
public:
    void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }
    bool isCancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> cancelled_{false};
};

} // namespace task
