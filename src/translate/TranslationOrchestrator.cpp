#include "TranslationOrchestrator.hpp"

#include "ErrorClassifier.hpp"
#include "Languages.hpp"
#include "TextUtils.hpp"
#include "utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace translate
{

TranslationOrchestrator::TranslationOrchestrator(std::shared_ptr<ITranslator> translator,
                                                 std::shared_ptr<ILanguageDetector> detector,
                                                 TranslationConfig config, task::ClockFn clock)
    : translator_(std::move(translator))
    , detector_(std::move(detector))
    , config_(std::move(config))
    , policy_(config_)
    , timers_(std::move(clock))
    , debouncer_(timers_, [this](TaskId id, TranslationRequest request) { dispatch(id, std::move(request)); })
    , events_(std::make_shared<utils::PendingQueue<task::WorkerEvent>>())
    , pool_(std::make_unique<task::WorkerPool>(config_.worker_threads))
{
    if (!translator_)
        throw std::invalid_argument("TranslationOrchestrator requires a translator");

    PLOG_INFO << "Orchestrator ready: " << pool_->capacity() << " workers, debounce " << config_.debounce_ms
              << " ms, timeout " << config_.translation_timeout_ms << " ms, max retries " << config_.max_retries;
}

TranslationOrchestrator::~TranslationOrchestrator()
{
    if (!shutting_down_)
        cancelAll();
}

void TranslationOrchestrator::setCallbacks(OrchestratorCallbacks callbacks)
{
    callbacks_ = std::move(callbacks);
}

std::optional<TranslationError> TranslationOrchestrator::validate(const TranslationRequest& request) const
{
    if (isBlank(request.text))
        return ErrorClassifier::makeValidationError("Text is empty");

    const std::size_t length = utf8Length(request.text);
    if (length > static_cast<std::size_t>(config_.max_text_length))
    {
        return ErrorClassifier::makeValidationError("Text is too long: " + std::to_string(length) +
                                                    " characters (limit " +
                                                    std::to_string(config_.max_text_length) + ")");
    }

    if (!isSupportedSource(request.source_lang))
        return ErrorClassifier::makeValidationError("Unsupported source language: " + request.source_lang);
    if (!isSupportedTarget(request.target_lang))
        return ErrorClassifier::makeValidationError("Unsupported target language: " + request.target_lang);

    return std::nullopt;
}

TaskId TranslationOrchestrator::submit(const std::string& text, const std::string& source_lang,
                                       const std::string& target_lang, bool debounce)
{
    if (shutting_down_)
    {
        PLOG_WARNING << "Submission rejected: orchestrator is shut down";
        return kInvalidTaskId;
    }

    const TaskId id = next_task_id_++;
    TranslationRequest request{text, source_lang, target_lang};

    if (auto error = validate(request))
    {
        PLOG_WARNING << "Task " << id << " rejected: " << error->message;
        deferred_.push_back([this, id, err = std::move(*error)] { reportTerminalError(id, err); });
        return id;
    }

    if (debounce && config_.debounce_ms > 0)
    {
        PLOG_DEBUG << "Task " << id << " debounced for " << config_.debounce_ms << " ms: '" << excerpt(text) << "'";
        debouncer_.submit(id, std::move(request), std::chrono::milliseconds(config_.debounce_ms));
    }
    else
    {
        dispatch(id, std::move(request));
    }
    return id;
}

TaskId TranslationOrchestrator::execute(TranslationRequest request)
{
    if (shutting_down_)
    {
        PLOG_WARNING << "Execution rejected: orchestrator is shut down";
        return kInvalidTaskId;
    }

    const TaskId id = next_task_id_++;
    dispatch(id, std::move(request));
    return id;
}

void TranslationOrchestrator::dispatch(TaskId task_id, TranslationRequest request)
{
    cancelAll();

    PLOG_INFO << "Task " << task_id << " dispatched (" << request.source_lang << " -> " << request.target_lang
              << "): '" << excerpt(request.text) << "'";

    retry_states_.emplace(task_id, policy_.begin(task_id, std::move(request)));
    startAttempt(task_id);
}

task::WorkerJob TranslationOrchestrator::makeJob(const TranslationRequest& request) const
{
    return [translator = translator_, detector = detector_, request](const ProgressCallback& progress) {
        TranslationResult result;
        result.source_lang = request.source_lang;

        if (request.source_lang == kAutoDetect)
        {
            progress(10, "Detecting language...");
            std::optional<std::string> detected;
            if (detector)
                detected = detector->detect(request.text);
            result.source_lang = detected.value_or("en");
        }

        if (!translator->isReady())
            throw std::runtime_error("Model not loaded");

        progress(20, "Translating...");
        result.text = translator->translate(request.text, result.source_lang, request.target_lang, progress);
        return result;
    };
}

void TranslationOrchestrator::startAttempt(TaskId task_id)
{
    auto it = retry_states_.find(task_id);
    if (it == retry_states_.end())
        return;

    task::RetryState& state = it->second;
    state.retry_timer = task::kInvalidTimerId;
    ++state.attempt;

    const task::AttemptSerial serial = next_serial_++;
    auto token = std::make_shared<task::CancellationToken>();

    attempts_[serial] = AttemptRecord{task_id, state.attempt, AttemptState::Running};
    active_[task_id] = ActiveAttempt{serial, token};
    timeouts_[task_id] = timers_.schedule(std::chrono::milliseconds(config_.translation_timeout_ms),
                                          [this, task_id, serial] { onAttemptTimeout(task_id, serial); });

    PLOG_DEBUG << "Task " << task_id << " attempt " << state.attempt << "/" << state.max_attempts << " queued";

    auto sink = [events = events_](task::WorkerEvent&& ev) { events->push(std::move(ev)); };
    pool_->start(std::make_unique<task::Worker>(serial, makeJob(state.request), std::move(token), std::move(sink)));
}

bool TranslationOrchestrator::cancel(TaskId task_id)
{
    if (debouncer_.hasPending() && debouncer_.pendingTaskId() == task_id)
    {
        debouncer_.cancelPending();
        PLOG_INFO << "Task " << task_id << " cancelled before dispatch";
        return true;
    }

    bool found = false;
    bool worker_outstanding = false;

    if (auto it = active_.find(task_id); it != active_.end())
    {
        it->second.token->cancel();
        if (auto rec = attempts_.find(it->second.serial); rec != attempts_.end())
            rec->second.state = AttemptState::Cancelled;
        active_.erase(it);
        found = true;
        worker_outstanding = true;
    }

    clearTimeout(task_id);

    if (auto it = retry_states_.find(task_id); it != retry_states_.end())
    {
        if (it->second.retry_timer != task::kInvalidTimerId)
            timers_.cancel(it->second.retry_timer);
        retry_states_.erase(it);
        found = true;
    }

    if (!found)
        return false;

    PLOG_INFO << "Task " << task_id << " cancelled";

    // Waiting for a retry: no worker will report finished for this task.
    if (!worker_outstanding)
        deferred_.push_back([this, task_id] { emitFinished(task_id); });
    return true;
}

void TranslationOrchestrator::cancelAll()
{
    debouncer_.cancelPending();

    std::vector<TaskId> ids;
    ids.reserve(active_.size() + retry_states_.size());
    for (const auto& [id, attempt] : active_)
        ids.push_back(id);
    for (const auto& [id, state] : retry_states_)
    {
        if (!active_.count(id))
            ids.push_back(id);
    }

    for (TaskId id : ids)
        cancel(id);

    for (const auto& [id, timer] : timeouts_)
        timers_.cancel(timer);
    timeouts_.clear();
}

bool TranslationOrchestrator::shutdown(std::chrono::milliseconds wait)
{
    PLOG_INFO << "Orchestrator shutting down";
    shutting_down_ = true;
    cancelAll();

    const bool drained = pool_->waitForDone(wait);
    if (!drained)
        PLOG_WARNING << "Shutdown: " << pool_->activeCount() << " workers still running after " << wait.count() << " ms";

    processEvents();
    return drained;
}

std::size_t TranslationOrchestrator::processEvents()
{
    std::size_t handled = 0;

    std::vector<task::WorkerEvent> batch;
    events_->drain(batch);
    for (auto& ev : batch)
        handleWorkerEvent(ev);
    handled += batch.size();

    std::vector<std::function<void()>> deferred;
    deferred.swap(deferred_);
    for (auto& fn : deferred)
        fn();
    handled += deferred.size();

    handled += timers_.fireDue();
    return handled;
}

void TranslationOrchestrator::waitForEvents(std::chrono::milliseconds max_wait)
{
    if (!deferred_.empty())
        return;

    auto deadline = std::chrono::steady_clock::now() + max_wait;
    if (auto next = timers_.nextDeadline())
    {
        const auto until_timer = *next - timers_.now();
        if (until_timer <= std::chrono::steady_clock::duration::zero())
            return;
        deadline = std::min(deadline, std::chrono::steady_clock::now() + until_timer);
    }
    events_->waitUntil(deadline);
}

bool TranslationOrchestrator::isIdle() const
{
    return active_.empty() && retry_states_.empty() && timeouts_.empty() && attempts_.empty() &&
           deferred_.empty() && !debouncer_.hasPending() && events_->empty();
}

void TranslationOrchestrator::handleWorkerEvent(task::WorkerEvent& ev)
{
    auto rec_it = attempts_.find(ev.serial);
    if (rec_it == attempts_.end())
    {
        PLOG_DEBUG << "Dropping event for unknown attempt " << ev.serial;
        return;
    }

    AttemptRecord& rec = rec_it->second;
    const TaskId task_id = rec.task_id;

    if (ev.type == task::WorkerEventType::Finished)
    {
        if (auto it = active_.find(task_id); it != active_.end() && it->second.serial == ev.serial)
            active_.erase(it);

        const AttemptState state = rec.state;
        attempts_.erase(rec_it);

        switch (state)
        {
        case AttemptState::Running:
            // Finished without an outcome; nothing left to deliver for this task.
            PLOG_WARNING << "Task " << task_id << " attempt " << ev.serial << " finished without a result";
            clearTimeout(task_id);
            retry_states_.erase(task_id);
            emitFinished(task_id);
            break;
        case AttemptState::Delivered:
        case AttemptState::Cancelled:
            emitFinished(task_id);
            break;
        case AttemptState::Superseded:
            break;
        }
        return;
    }

    if (rec.state != AttemptState::Running)
    {
        PLOG_DEBUG << "Ignoring stale event from task " << task_id << " attempt " << rec.attempt;
        return;
    }

    switch (ev.type)
    {
    case task::WorkerEventType::Started:
        PLOG_DEBUG << "Task " << task_id << " attempt " << rec.attempt << " started";
        emitStarted(task_id);
        break;

    case task::WorkerEventType::Progress:
        emitProgress(task_id, ev.percentage, ev.message);
        break;

    case task::WorkerEventType::Result:
        rec.state = AttemptState::Delivered;
        clearTimeout(task_id);
        retry_states_.erase(task_id);
        PLOG_INFO << "Task " << task_id << " completed on attempt " << rec.attempt;
        emitComplete(task_id, ev.result);
        break;

    case task::WorkerEventType::Error:
    {
        clearTimeout(task_id);
        TranslationError error = ErrorClassifier::classify(ev.error, ev.message, ev.diagnostic);
        PLOG_WARNING << "Task " << task_id << " attempt " << rec.attempt << " failed [" << toString(error.kind)
                     << "]: " << error.message;
        handleFailure(task_id, error, ev.serial);
        break;
    }

    case task::WorkerEventType::Finished:
        break;
    }
}

void TranslationOrchestrator::onAttemptTimeout(TaskId task_id, task::AttemptSerial serial)
{
    timeouts_.erase(task_id);

    auto it = active_.find(task_id);
    if (it == active_.end() || it->second.serial != serial)
        return;

    it->second.token->cancel();
    active_.erase(it);
    if (auto rec = attempts_.find(serial); rec != attempts_.end())
        rec->second.state = AttemptState::Superseded;

    PLOG_WARNING << "Task " << task_id << " timed out after " << config_.translation_timeout_ms << " ms";

    if (!handleFailure(task_id, ErrorClassifier::makeTimeoutError(), 0))
        emitFinished(task_id);
}

bool TranslationOrchestrator::handleFailure(TaskId task_id, const TranslationError& error,
                                            task::AttemptSerial serial)
{
    auto it = retry_states_.find(task_id);
    if (it == retry_states_.end())
        return false;

    task::RetryState& state = it->second;
    const task::RetryDecision decision = policy_.decide(state, error);

    if (auto rec = attempts_.find(serial); rec != attempts_.end())
        rec->second.state = decision.retry ? AttemptState::Superseded : AttemptState::Delivered;

    if (!decision.retry)
    {
        PLOG_ERROR << "Task " << task_id << " failed after " << state.attempt << " attempt(s): "
                   << toString(error.kind) << ": " << error.message;
        retry_states_.erase(it);
        reportTerminalError(task_id, error);
        return false;
    }

    const int delay_ms = static_cast<int>(decision.delay.count());
    PLOG_INFO << "Task " << task_id << " retrying in " << delay_ms << " ms (attempt " << decision.attempt << "/"
              << decision.max_attempts << ")";

    state.retry_timer = timers_.schedule(decision.delay, [this, task_id] { startAttempt(task_id); });
    emitRetrying(task_id, decision.attempt, decision.max_attempts, delay_ms);
    return true;
}

void TranslationOrchestrator::reportTerminalError(TaskId task_id, const TranslationError& error)
{
    const auto category = error.kind == ErrorKind::Validation ? utils::ErrorCategory::Validation
                                                              : utils::ErrorCategory::Translation;
    utils::ErrorReporter::ReportError(category, error.cause + " " + error.solution,
                                      "task " + std::to_string(task_id) + ": " + toString(error.kind) + ": " +
                                          error.message);
    emitError(task_id, error);
}

void TranslationOrchestrator::clearTimeout(TaskId task_id)
{
    auto it = timeouts_.find(task_id);
    if (it == timeouts_.end())
        return;
    timers_.cancel(it->second);
    timeouts_.erase(it);
}

void TranslationOrchestrator::emitStarted(TaskId task_id)
{
    if (callbacks_.onStarted)
        callbacks_.onStarted(task_id);
}

void TranslationOrchestrator::emitProgress(TaskId task_id, int percentage, const std::string& message)
{
    if (callbacks_.onProgress)
        callbacks_.onProgress(task_id, percentage, message);
}

void TranslationOrchestrator::emitComplete(TaskId task_id, const TranslationResult& result)
{
    if (callbacks_.onComplete)
        callbacks_.onComplete(task_id, result.source_lang, result.text);
}

void TranslationOrchestrator::emitError(TaskId task_id, const TranslationError& error)
{
    if (callbacks_.onError)
        callbacks_.onError(task_id, error);
}

void TranslationOrchestrator::emitRetrying(TaskId task_id, int attempt, int max_attempts, int delay_ms)
{
    if (callbacks_.onRetrying)
        callbacks_.onRetrying(task_id, attempt, max_attempts, delay_ms);
}

void TranslationOrchestrator::emitFinished(TaskId task_id)
{
    if (callbacks_.onFinished)
        callbacks_.onFinished(task_id);
}

} // namespace translate
