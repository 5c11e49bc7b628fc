#pragma once

#include "ITranslator.hpp"
#include "TranslationError.hpp"
#include "TranslationRequest.hpp"
#include "state/TranslationConfig.hpp"
#include "task/Debouncer.hpp"
#include "task/RetryPolicy.hpp"
#include "task/TimerQueue.hpp"
#include "task/Worker.hpp"
#include "task/WorkerPool.hpp"
#include "utils/PendingQueue.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace translate
{

// Lifecycle events. All callbacks run on the coordinating thread inside processEvents().
struct OrchestratorCallbacks
{
    std::function<void(TaskId)> onStarted;
    std::function<void(TaskId, int percentage, const std::string& message)> onProgress;
    std::function<void(TaskId, const std::string& detected_lang, const std::string& text)> onComplete;
    std::function<void(TaskId, const TranslationError&)> onError;
    std::function<void(TaskId, int attempt, int max_attempts, int delay_ms)> onRetrying;
    std::function<void(TaskId)> onFinished;
};

/**
 * @brief Drives translation tasks from submission to a delivered result.
 *
 * Owns the worker pool, the debouncer, the active-task table and per-task
 * retry and timeout state. Every member function must be called from the one
 * thread that owns the orchestrator; pool threads only push WorkerEvents onto
 * the event queue, which processEvents() drains.
 *
 * A new dispatch cancels every other task. Events from attempts that are no
 * longer current are ignored, except that a cancelled attempt still reports
 * onFinished once its worker returns.
 */
class TranslationOrchestrator
{
public:
    TranslationOrchestrator(std::shared_ptr<ITranslator> translator, std::shared_ptr<ILanguageDetector> detector,
                            TranslationConfig config = {}, task::ClockFn clock = {});
    ~TranslationOrchestrator();

    TranslationOrchestrator(const TranslationOrchestrator&) = delete;
    TranslationOrchestrator& operator=(const TranslationOrchestrator&) = delete;

    void setCallbacks(OrchestratorCallbacks callbacks);

    // Validates and either debounces or dispatches at once. Invalid input is
    // reported as a Validation error on the next processEvents().
    TaskId submit(const std::string& text, const std::string& source_lang, const std::string& target_lang,
                  bool debounce = true);

    // Dispatches immediately without validation or debouncing.
    TaskId execute(TranslationRequest request);

    bool cancel(TaskId task_id);
    void cancelAll();

    // Cancels everything and waits up to wait for running workers to return.
    // Returns false if workers were still running when the wait ended.
    bool shutdown(std::chrono::milliseconds wait);

    // Handles queued worker events, deferred notices and due timers.
    // Returns the number of items handled.
    std::size_t processEvents();

    // Blocks until a worker event arrives, the next timer is due, or max_wait passes.
    void waitForEvents(std::chrono::milliseconds max_wait);

    bool isIdle() const;

    std::size_t activeTaskCount() const { return active_.size(); }
    std::size_t retryStateCount() const { return retry_states_.size(); }
    std::size_t timeoutCount() const { return timeouts_.size(); }
    bool hasPendingDebounce() const { return debouncer_.hasPending(); }
    bool isActive(TaskId task_id) const { return active_.count(task_id) != 0 || retry_states_.count(task_id) != 0; }

    int workerCapacity() const { return pool_->capacity(); }
    const TranslationConfig& config() const { return config_; }

private:
    enum class AttemptState
    {
        Running,    // no outcome yet
        Delivered,  // outcome ended the task; finished is forwarded
        Superseded, // outcome led to a retry, or the attempt timed out; finished is dropped
        Cancelled   // finished is forwarded
    };

    struct AttemptRecord
    {
        TaskId task_id = kInvalidTaskId;
        int attempt = 0;
        AttemptState state = AttemptState::Running;
    };

    struct ActiveAttempt
    {
        task::AttemptSerial serial = 0;
        std::shared_ptr<task::CancellationToken> token;
    };

    std::optional<TranslationError> validate(const TranslationRequest& request) const;

    void dispatch(TaskId task_id, TranslationRequest request);
    void startAttempt(TaskId task_id);
    task::WorkerJob makeJob(const TranslationRequest& request) const;

    void handleWorkerEvent(task::WorkerEvent& ev);
    void onAttemptTimeout(TaskId task_id, task::AttemptSerial serial);
    // Returns true when a retry was scheduled. serial is the failed attempt, or 0
    // when its record has already been settled.
    bool handleFailure(TaskId task_id, const TranslationError& error, task::AttemptSerial serial);
    void reportTerminalError(TaskId task_id, const TranslationError& error);
    void clearTimeout(TaskId task_id);

    void emitStarted(TaskId task_id);
    void emitProgress(TaskId task_id, int percentage, const std::string& message);
    void emitComplete(TaskId task_id, const TranslationResult& result);
    void emitError(TaskId task_id, const TranslationError& error);
    void emitRetrying(TaskId task_id, int attempt, int max_attempts, int delay_ms);
    void emitFinished(TaskId task_id);

    std::shared_ptr<ITranslator> translator_;
    std::shared_ptr<ILanguageDetector> detector_;
    TranslationConfig config_;
    task::RetryPolicy policy_;
    OrchestratorCallbacks callbacks_;

    TaskId next_task_id_ = 1;
    task::AttemptSerial next_serial_ = 1;
    bool shutting_down_ = false;

    std::unordered_map<TaskId, ActiveAttempt> active_;
    std::unordered_map<TaskId, task::RetryState> retry_states_;
    std::unordered_map<TaskId, task::TimerId> timeouts_;
    std::unordered_map<task::AttemptSerial, AttemptRecord> attempts_;
    std::vector<std::function<void()>> deferred_;

    task::TimerQueue timers_;
    task::Debouncer debouncer_;
    std::shared_ptr<utils::PendingQueue<task::WorkerEvent>> events_;

    // Declared last: destroyed first, joining pool threads before the state above goes away.
    std::unique_ptr<task::WorkerPool> pool_;
};

} // namespace translate
