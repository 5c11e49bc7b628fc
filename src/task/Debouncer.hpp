#pragma once

#include "TimerQueue.hpp"
#include "translate/TranslationRequest.hpp"

#include <chrono>
#include <functional>
#include <optional>

namespace task
{

// Holds at most one pending request; each submit replaces it and restarts the delay.
class Debouncer
{
public:
    using DispatchFn = std::function<void(translate::TaskId, translate::TranslationRequest)>;

    Debouncer(TimerQueue& timers, DispatchFn dispatch);
    ~Debouncer();

    Debouncer(const Debouncer&) = delete;
    Debouncer& operator=(const Debouncer&) = delete;

    void submit(translate::TaskId id, translate::TranslationRequest request, std::chrono::milliseconds delay);

    // Drops the pending request without dispatching it. Returns false if none was pending.
    bool cancelPending();

    bool hasPending() const { return pending_.has_value(); }
    translate::TaskId pendingTaskId() const { return pending_id_; }

private:
    void onTimer();

    TimerQueue& timers_;
    DispatchFn dispatch_;
    TimerId timer_ = kInvalidTimerId;
    translate::TaskId pending_id_ = translate::kInvalidTaskId;
    std::optional<translate::TranslationRequest> pending_;
};

} // namespace task
