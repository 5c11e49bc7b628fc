#include "TimerQueue.hpp"

namespace task
{

TimerQueue::TimerQueue(ClockFn clock)
    : clock_(clock ? std::move(clock) : ClockFn([] { return Clock::now(); }))
{
}

TimePoint TimerQueue::now() const
{
    return clock_();
}

TimerId TimerQueue::schedule(std::chrono::milliseconds delay, std::function<void()> callback)
{
    if (delay.count() < 0)
        delay = std::chrono::milliseconds(0);

    const TimerId id = next_id_++;
    const TimePoint deadline = now() + delay;
    entries_.emplace(Key{deadline, id}, std::move(callback));
    index_.emplace(id, deadline);
    return id;
}

bool TimerQueue::cancel(TimerId id)
{
    auto it = index_.find(id);
    if (it == index_.end())
        return false;
    entries_.erase(Key{it->second, id});
    index_.erase(it);
    return true;
}

std::size_t TimerQueue::fireDue()
{
    const TimePoint limit = now();
    const TimerId id_limit = next_id_;
    std::size_t fired = 0;

    auto it = entries_.begin();
    while (it != entries_.end() && it->first.first <= limit)
    {
        if (it->first.second >= id_limit)
        {
            ++it;
            continue;
        }

        const TimerId id = it->first.second;
        std::function<void()> callback = std::move(it->second);
        entries_.erase(it);
        index_.erase(id);

        callback();
        ++fired;

        // The callback may have changed the map.
        it = entries_.begin();
    }
    return fired;
}

std::optional<TimePoint> TimerQueue::nextDeadline() const
{
    if (entries_.empty())
        return std::nullopt;
    return entries_.begin()->first.first;
}

} // namespace task
