#include <catch2/catch_test_macros.hpp>

#include "task/Worker.hpp"
#include "task/WorkerPool.hpp"
#include "translate/TranslationError.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <new>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace task;
using namespace std::chrono_literals;

namespace {

struct Collector {
    std::mutex mutex;
    std::vector<WorkerEvent> events;

    WorkerEventSink sink() {
        return [this](WorkerEvent&& ev) {
            std::lock_guard<std::mutex> lock(mutex);
            events.push_back(std::move(ev));
        };
    }

    std::vector<WorkerEventType> types() {
        std::lock_guard<std::mutex> lock(mutex);
        std::vector<WorkerEventType> out;
        for (const auto& e : events)
            out.push_back(e.type);
        return out;
    }
};

translate::TranslationResult okResult(const std::string& text) {
    translate::TranslationResult r;
    r.source_lang = "en";
    r.text = text;
    return r;
}

} // namespace

TEST_CASE("Worker event order", "[task][worker]") {
    Collector c;
    auto token = std::make_shared<CancellationToken>();

    SECTION("Success reports started, progress, result, finished") {
        Worker w(7, [](const translate::ProgressCallback& progress) {
            progress(50, "half");
            return okResult("done");
        }, token, c.sink());
        w.run();

        REQUIRE(c.types() == std::vector<WorkerEventType>{WorkerEventType::Started, WorkerEventType::Progress,
                                                          WorkerEventType::Result, WorkerEventType::Finished});
        for (const auto& e : c.events)
            REQUIRE(e.serial == 7);
        REQUIRE(c.events[1].percentage == 50);
        REQUIRE(c.events[1].message == "half");
        REQUIRE(c.events[2].result.text == "done");
    }

    SECTION("Progress outside 0..100 is clamped") {
        Worker w(3, [](const translate::ProgressCallback& progress) {
            progress(-5, "before");
            progress(250, "after");
            return okResult("done");
        }, token, c.sink());
        w.run();

        REQUIRE(c.events.size() == 5);
        REQUIRE(c.events[1].percentage == 0);
        REQUIRE(c.events[2].percentage == 100);
    }

    SECTION("Failure carries the exception for classification") {
        Worker w(1, [](const translate::ProgressCallback&) -> translate::TranslationResult {
            throw translate::ConnectionError("connection refused");
        }, token, c.sink());
        w.run();

        REQUIRE(c.types() == std::vector<WorkerEventType>{WorkerEventType::Started, WorkerEventType::Error,
                                                          WorkerEventType::Finished});
        const auto& err = c.events[1];
        REQUIRE(err.message == "connection refused");
        REQUIRE(err.error != nullptr);
        REQUIRE_THROWS_AS(std::rethrow_exception(err.error), translate::ConnectionError);
    }

    SECTION("Non-standard exceptions are still reported") {
        Worker w(1, [](const translate::ProgressCallback&) -> translate::TranslationResult { throw 42; }, token,
                 c.sink());
        w.run();
        REQUIRE(c.types() == std::vector<WorkerEventType>{WorkerEventType::Started, WorkerEventType::Error,
                                                          WorkerEventType::Finished});
    }

    SECTION("Cancelled before start emits only finished") {
        bool ran = false;
        token->cancel();
        Worker w(1, [&](const translate::ProgressCallback&) {
            ran = true;
            return okResult("x");
        }, token, c.sink());
        w.run();

        REQUIRE_FALSE(ran);
        REQUIRE(c.types() == std::vector<WorkerEventType>{WorkerEventType::Finished});
    }

    SECTION("Cancelled during the call drops progress and outcome") {
        Worker w(1, [&](const translate::ProgressCallback& progress) {
            progress(10, "before");
            token->cancel();
            progress(90, "after");
            return okResult("late");
        }, token, c.sink());
        w.run();

        REQUIRE(c.types() == std::vector<WorkerEventType>{WorkerEventType::Started, WorkerEventType::Progress,
                                                          WorkerEventType::Finished});
        REQUIRE(c.events[1].percentage == 10);
    }
}

TEST_CASE("Worker pool capacity", "[task][pool]") {
    SECTION("Default capacity is clamped to 2..4") {
        const int cap = WorkerPool::defaultCapacity();
        REQUIRE(cap >= 2);
        REQUIRE(cap <= 4);
        WorkerPool pool;
        REQUIRE(pool.capacity() == cap);
    }

    SECTION("Explicit capacity is honoured") {
        WorkerPool pool(3);
        REQUIRE(pool.capacity() == 3);
    }
}

TEST_CASE("Worker pool runs every worker", "[task][pool]") {
    WorkerPool pool(2);
    Collector c;
    std::atomic<int> running{0};
    std::atomic<int> peak{0};

    constexpr int kWorkers = 12;
    for (int i = 0; i < kWorkers; ++i) {
        pool.start(std::make_unique<Worker>(static_cast<AttemptSerial>(i + 1),
            [&](const translate::ProgressCallback&) {
                int now = ++running;
                int prev = peak.load();
                while (now > prev && !peak.compare_exchange_weak(prev, now)) {
                }
                std::this_thread::sleep_for(2ms);
                --running;
                return okResult("ok");
            },
            std::make_shared<CancellationToken>(), c.sink()));
    }

    REQUIRE(pool.waitForDone(5000ms));
    REQUIRE(pool.activeCount() == 0);
    REQUIRE(pool.queuedCount() == 0);
    REQUIRE(peak.load() <= 2);

    int finished = 0;
    for (const auto& e : c.events) {
        if (e.type == WorkerEventType::Finished)
            ++finished;
    }
    REQUIRE(finished == kWorkers);
}

TEST_CASE("Worker pool starts queued workers in FIFO order", "[task][pool]") {
    WorkerPool pool(1);
    std::mutex mutex;
    std::vector<int> order;

    for (int i = 0; i < 5; ++i) {
        pool.start(std::make_unique<Worker>(static_cast<AttemptSerial>(i + 1),
            [&, i](const translate::ProgressCallback&) {
                std::lock_guard<std::mutex> lock(mutex);
                order.push_back(i);
                return okResult("ok");
            },
            std::make_shared<CancellationToken>(), [](WorkerEvent&&) {}));
    }

    REQUIRE(pool.waitForDone(5000ms));
    REQUIRE(order == std::vector<int>{0, 1, 2, 3, 4});
}

TEST_CASE("waitForDone times out while a worker is blocked", "[task][pool]") {
    WorkerPool pool(1);
    std::atomic<bool> release{false};

    pool.start(std::make_unique<Worker>(1,
        [&](const translate::ProgressCallback&) {
            while (!release.load())
                std::this_thread::sleep_for(1ms);
            return okResult("ok");
        },
        std::make_shared<CancellationToken>(), [](WorkerEvent&&) {}));

    REQUIRE_FALSE(pool.waitForDone(20ms));
    release.store(true);
    REQUIRE(pool.waitForDone(5000ms));
}
