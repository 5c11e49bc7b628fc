#pragma once

#include "CancellationToken.hpp"
#include "translate/ITranslator.hpp"
#include "translate/TranslationRequest.hpp"

#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <string>

namespace task
{

// Identifies one attempt; never reused within a process.
using AttemptSerial = std::uint64_t;

enum class WorkerEventType
{
    Started,
    Progress,
    Result,
    Error,
    Finished
};

struct WorkerEvent
{
    WorkerEventType type = WorkerEventType::Finished;
    AttemptSerial serial = 0;

    int percentage = 0;          // Progress
    std::string message;         // Progress text or raw error text
    std::string diagnostic;      // Error: exception type
    std::exception_ptr error;    // Error: the original exception, for classification
    translate::TranslationResult result;
};

using WorkerEventSink = std::function<void(WorkerEvent&&)>;

// The blocking call run by a worker. May throw; must not outlive its arguments.
using WorkerJob = std::function<translate::TranslationResult(const translate::ProgressCallback& progress)>;

/**
 * @brief Runs one attempt on a pool thread and reports its lifecycle.
 *
 * Event order: Started, Progress*, Result or Error, Finished. If the token is
 * cancelled before the job starts or after it returns, only Finished is
 * emitted. Progress is clamped to 0..100 and dropped once the token is
 * cancelled.
 */
class Worker
{
public:
    Worker(AttemptSerial serial, WorkerJob job, std::shared_ptr<CancellationToken> token, WorkerEventSink sink);

    void run();

private:
    void emit(WorkerEventType type);

    AttemptSerial serial_;
    WorkerJob job_;
    std::shared_ptr<CancellationToken> token_;
    WorkerEventSink sink_;
};

} // namespace task
