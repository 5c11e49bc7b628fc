#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <unordered_map>
#include <utility>

namespace task
{

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using ClockFn = std::function<TimePoint()>;
using TimerId = std::uint64_t;

inline constexpr TimerId kInvalidTimerId = 0;

/**
 * @brief Deadline-ordered one-shot timers, owned by a single thread.
 *
 * Nothing fires on its own: the owner calls fireDue() from its loop. Timers
 * due at the same instant fire in scheduling order. The clock is injectable
 * so tests can advance time by hand.
 */
class TimerQueue
{
public:
    explicit TimerQueue(ClockFn clock = {});

    TimerId schedule(std::chrono::milliseconds delay, std::function<void()> callback);

    // Returns false if the timer already fired or was never scheduled.
    bool cancel(TimerId id);

    // Runs every timer that was due when the call began and returns how many
    // fired. Callbacks may schedule or cancel timers; new ones wait for the next call.
    std::size_t fireDue();

    std::optional<TimePoint> nextDeadline() const;
    TimePoint now() const;

    std::size_t size() const { return entries_.size(); }
    bool isScheduled(TimerId id) const { return index_.count(id) != 0; }

private:
    using Key = std::pair<TimePoint, TimerId>;

    ClockFn clock_;
    TimerId next_id_ = 1;
    std::map<Key, std::function<void()>> entries_;
    std::unordered_map<TimerId, TimePoint> index_;
};

} // namespace task
