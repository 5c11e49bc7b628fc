#include "Debouncer.hpp"

#include <plog/Log.h>

#include <utility>

namespace task
{

Debouncer::Debouncer(TimerQueue& timers, DispatchFn dispatch)
    : timers_(timers)
    , dispatch_(std::move(dispatch))
{
}

Debouncer::~Debouncer()
{
    cancelPending();
}

void Debouncer::submit(translate::TaskId id, translate::TranslationRequest request, std::chrono::milliseconds delay)
{
    if (pending_)
        PLOG_DEBUG << "Debounce: task " << pending_id_ << " replaced by task " << id;

    if (timer_ != kInvalidTimerId)
        timers_.cancel(timer_);

    pending_id_ = id;
    pending_ = std::move(request);
    timer_ = timers_.schedule(delay, [this] { onTimer(); });
}

bool Debouncer::cancelPending()
{
    if (!pending_)
        return false;

    timers_.cancel(timer_);
    timer_ = kInvalidTimerId;
    pending_.reset();
    pending_id_ = translate::kInvalidTaskId;
    return true;
}

void Debouncer::onTimer()
{
    timer_ = kInvalidTimerId;
    if (!pending_)
        return;

    translate::TaskId id = pending_id_;
    translate::TranslationRequest request = std::move(*pending_);
    pending_.reset();
    pending_id_ = translate::kInvalidTaskId;

    PLOG_DEBUG << "Debounce: dispatching task " << id;
    dispatch_(id, std::move(request));
}

} // namespace task
