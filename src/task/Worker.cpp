#include "Worker.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <typeinfo>
#include <utility>

namespace task
{

Worker::Worker(AttemptSerial serial, WorkerJob job, std::shared_ptr<CancellationToken> token, WorkerEventSink sink)
    : serial_(serial)
    , job_(std::move(job))
    , token_(std::move(token))
    , sink_(std::move(sink))
{
}

void Worker::emit(WorkerEventType type)
{
    WorkerEvent ev;
    ev.type = type;
    ev.serial = serial_;
    sink_(std::move(ev));
}

void Worker::run()
{
    if (token_->isCancelled())
    {
        PLOG_DEBUG << "Attempt " << serial_ << " cancelled before start";
        emit(WorkerEventType::Finished);
        return;
    }

    emit(WorkerEventType::Started);

    auto progress = [this](int percentage, const std::string& message) {
        if (token_->isCancelled())
            return;
        WorkerEvent ev;
        ev.type = WorkerEventType::Progress;
        ev.serial = serial_;
        ev.percentage = std::clamp(percentage, 0, 100);
        ev.message = message;
        sink_(std::move(ev));
    };

    WorkerEvent outcome;
    outcome.serial = serial_;
    try
    {
        outcome.result = job_(progress);
        outcome.type = WorkerEventType::Result;
    }
    catch (const std::exception& e)
    {
        outcome.type = WorkerEventType::Error;
        outcome.message = e.what();
        outcome.diagnostic = typeid(e).name();
        outcome.error = std::current_exception();
    }
    catch (...)
    {
        outcome.type = WorkerEventType::Error;
        outcome.message = "Unknown exception";
        outcome.diagnostic = "non-std exception";
        outcome.error = std::current_exception();
    }

    if (token_->isCancelled())
    {
        PLOG_DEBUG << "Attempt " << serial_ << " cancelled during execution, discarding outcome";
        emit(WorkerEventType::Finished);
        return;
    }

    sink_(std::move(outcome));
    emit(WorkerEventType::Finished);
}

} // namespace task
