#pragma once

#include "translate/TranslationOrchestrator.hpp"

#include <algorithm>
#include <chrono>
#include <string>
#include <vector>

namespace test_utils {

struct RecordedEvent {
    std::string type; // started, progress, complete, error, retrying, finished
    translate::TaskId task_id = translate::kInvalidTaskId;
    int percentage = 0;
    std::string text;   // progress message or translated text
    std::string lang;   // detected language on complete
    translate::TranslationError error;
    int attempt = 0;
    int max_attempts = 0;
    int delay_ms = 0;
};

// Collects orchestrator callbacks in delivery order.
class EventRecorder {
public:
    void attach(translate::TranslationOrchestrator& orchestrator) {
        translate::OrchestratorCallbacks cb;
        cb.onStarted = [this](translate::TaskId id) { push({"started", id}); };
        cb.onProgress = [this](translate::TaskId id, int pct, const std::string& msg) {
            RecordedEvent ev{"progress", id};
            ev.percentage = pct;
            ev.text = msg;
            push(ev);
        };
        cb.onComplete = [this](translate::TaskId id, const std::string& lang, const std::string& text) {
            RecordedEvent ev{"complete", id};
            ev.lang = lang;
            ev.text = text;
            push(ev);
        };
        cb.onError = [this](translate::TaskId id, const translate::TranslationError& error) {
            RecordedEvent ev{"error", id};
            ev.error = error;
            push(ev);
        };
        cb.onRetrying = [this](translate::TaskId id, int attempt, int max_attempts, int delay_ms) {
            RecordedEvent ev{"retrying", id};
            ev.attempt = attempt;
            ev.max_attempts = max_attempts;
            ev.delay_ms = delay_ms;
            push(ev);
        };
        cb.onFinished = [this](translate::TaskId id) { push({"finished", id}); };
        orchestrator.setCallbacks(std::move(cb));
    }

    const std::vector<RecordedEvent>& events() const { return events_; }

    void clear() { events_.clear(); }

    std::size_t count(const std::string& type) const {
        return static_cast<std::size_t>(
            std::count_if(events_.begin(), events_.end(), [&](const RecordedEvent& e) { return e.type == type; }));
    }

    std::size_t count(const std::string& type, translate::TaskId id) const {
        return static_cast<std::size_t>(std::count_if(events_.begin(), events_.end(), [&](const RecordedEvent& e) {
            return e.type == type && e.task_id == id;
        }));
    }

    // Event types without progress, in order.
    std::vector<std::string> lifecycle() const {
        std::vector<std::string> out;
        for (const auto& e : events_) {
            if (e.type != "progress")
                out.push_back(e.type);
        }
        return out;
    }

    const RecordedEvent* last(const std::string& type) const {
        for (auto it = events_.rbegin(); it != events_.rend(); ++it) {
            if (it->type == type)
                return &*it;
        }
        return nullptr;
    }

private:
    void push(RecordedEvent ev) { events_.push_back(std::move(ev)); }

    std::vector<RecordedEvent> events_;
};

// Drives the orchestrator's loop until done() holds or the real-time limit passes.
template <typename Pred>
bool pumpUntil(translate::TranslationOrchestrator& orchestrator, Pred done,
               std::chrono::milliseconds limit = std::chrono::milliseconds(5000)) {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    orchestrator.processEvents();
    while (!done()) {
        if (std::chrono::steady_clock::now() > deadline)
            return false;
        orchestrator.waitForEvents(std::chrono::milliseconds(5));
        orchestrator.processEvents();
    }
    return true;
}

} // namespace test_utils
