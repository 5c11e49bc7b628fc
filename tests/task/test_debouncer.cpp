#include <catch2/catch_test_macros.hpp>

#include "task/Debouncer.hpp"
#include "../utils/manual_clock.hpp"

#include <chrono>
#include <utility>
#include <vector>

using namespace task;
using namespace std::chrono_literals;

namespace {

struct Dispatched {
    translate::TaskId id;
    std::string text;
};

translate::TranslationRequest request(const std::string& text) {
    translate::TranslationRequest r;
    r.text = text;
    r.source_lang = "en";
    r.target_lang = "ko";
    return r;
}

} // namespace

TEST_CASE("Debouncer dispatches only the last request", "[task][debounce]") {
    test_utils::ManualClock clock;
    TimerQueue timers(clock.fn());
    std::vector<Dispatched> dispatched;
    Debouncer debouncer(timers, [&](translate::TaskId id, translate::TranslationRequest r) {
        dispatched.push_back({id, r.text});
    });

    debouncer.submit(1, request("a"), 500ms);
    clock.advance(400ms);
    timers.fireDue();
    debouncer.submit(2, request("ab"), 500ms);
    clock.advance(400ms);
    timers.fireDue();
    debouncer.submit(3, request("abc"), 500ms);

    REQUIRE(debouncer.hasPending());
    REQUIRE(debouncer.pendingTaskId() == 3);
    REQUIRE(timers.size() == 1);

    clock.advance(499ms);
    timers.fireDue();
    REQUIRE(dispatched.empty());

    clock.advance(1ms);
    timers.fireDue();
    REQUIRE(dispatched.size() == 1);
    REQUIRE(dispatched[0].id == 3);
    REQUIRE(dispatched[0].text == "abc");
    REQUIRE_FALSE(debouncer.hasPending());
    REQUIRE(debouncer.pendingTaskId() == translate::kInvalidTaskId);
}

TEST_CASE("Debouncer cancelPending drops the request", "[task][debounce]") {
    test_utils::ManualClock clock;
    TimerQueue timers(clock.fn());
    int dispatched = 0;
    Debouncer debouncer(timers, [&](translate::TaskId, translate::TranslationRequest) { ++dispatched; });

    REQUIRE_FALSE(debouncer.cancelPending());

    debouncer.submit(1, request("hello"), 100ms);
    REQUIRE(debouncer.cancelPending());
    REQUIRE_FALSE(debouncer.hasPending());
    REQUIRE(timers.size() == 0);

    clock.advance(1s);
    timers.fireDue();
    REQUIRE(dispatched == 0);
}

TEST_CASE("Debouncer accepts new work from its dispatch callback", "[task][debounce]") {
    test_utils::ManualClock clock;
    TimerQueue timers(clock.fn());
    std::vector<translate::TaskId> dispatched;
    Debouncer* self = nullptr;
    Debouncer debouncer(timers, [&](translate::TaskId id, translate::TranslationRequest) {
        dispatched.push_back(id);
        if (id == 1)
            self->submit(2, request("follow-up"), 10ms);
    });
    self = &debouncer;

    debouncer.submit(1, request("first"), 10ms);
    clock.advance(10ms);
    timers.fireDue();
    REQUIRE(debouncer.hasPending());

    clock.advance(10ms);
    timers.fireDue();
    REQUIRE(dispatched == std::vector<translate::TaskId>{1, 2});
}
