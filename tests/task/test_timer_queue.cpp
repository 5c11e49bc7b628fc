#include <catch2/catch_test_macros.hpp>

#include "task/TimerQueue.hpp"
#include "../utils/manual_clock.hpp"

#include <chrono>
#include <vector>

using namespace task;
using namespace std::chrono_literals;

TEST_CASE("TimerQueue fires due timers in deadline order", "[task][timer]") {
    test_utils::ManualClock clock;
    TimerQueue timers(clock.fn());
    std::vector<int> fired;

    timers.schedule(300ms, [&] { fired.push_back(3); });
    timers.schedule(100ms, [&] { fired.push_back(1); });
    timers.schedule(200ms, [&] { fired.push_back(2); });
    REQUIRE(timers.size() == 3);
    REQUIRE(*timers.nextDeadline() == clock.now() + 100ms);

    REQUIRE(timers.fireDue() == 0);

    clock.advance(250ms);
    REQUIRE(timers.fireDue() == 2);
    REQUIRE(fired == std::vector<int>{1, 2});

    clock.advance(50ms);
    REQUIRE(timers.fireDue() == 1);
    REQUIRE(fired == std::vector<int>{1, 2, 3});
    REQUIRE_FALSE(timers.nextDeadline().has_value());
}

TEST_CASE("TimerQueue keeps scheduling order for equal deadlines", "[task][timer]") {
    test_utils::ManualClock clock;
    TimerQueue timers(clock.fn());
    std::vector<int> fired;

    for (int i = 0; i < 4; ++i)
        timers.schedule(0ms, [&, i] { fired.push_back(i); });

    timers.fireDue();
    REQUIRE(fired == std::vector<int>{0, 1, 2, 3});
}

TEST_CASE("TimerQueue cancellation", "[task][timer]") {
    test_utils::ManualClock clock;
    TimerQueue timers(clock.fn());
    bool fired = false;

    TimerId id = timers.schedule(10ms, [&] { fired = true; });
    REQUIRE(timers.isScheduled(id));
    REQUIRE(timers.cancel(id));
    REQUIRE_FALSE(timers.isScheduled(id));
    REQUIRE_FALSE(timers.cancel(id));

    clock.advance(20ms);
    REQUIRE(timers.fireDue() == 0);
    REQUIRE_FALSE(fired);

    SECTION("Unknown ids are rejected") {
        REQUIRE_FALSE(timers.cancel(kInvalidTimerId));
        REQUIRE_FALSE(timers.cancel(9999));
    }
}

TEST_CASE("TimerQueue callbacks may reschedule and cancel", "[task][timer]") {
    test_utils::ManualClock clock;
    TimerQueue timers(clock.fn());
    int chained = 0;
    bool victim_fired = false;

    TimerId victim = timers.schedule(5ms, [&] { victim_fired = true; });
    timers.schedule(1ms, [&] {
        timers.cancel(victim);
        timers.schedule(0ms, [&] { ++chained; });
    });

    clock.advance(10ms);
    REQUIRE(timers.fireDue() == 1);
    REQUIRE_FALSE(victim_fired);
    REQUIRE(chained == 0);

    // Timers added by a callback wait for the next pass.
    REQUIRE(timers.fireDue() == 1);
    REQUIRE(chained == 1);
    REQUIRE(timers.size() == 0);
}

TEST_CASE("TimerQueue treats negative delays as immediate", "[task][timer]") {
    test_utils::ManualClock clock;
    TimerQueue timers(clock.fn());
    bool fired = false;
    timers.schedule(-50ms, [&] { fired = true; });
    REQUIRE(timers.fireDue() == 1);
    REQUIRE(fired);
}
