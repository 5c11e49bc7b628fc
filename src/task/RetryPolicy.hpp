#pragma once

#include "TimerQueue.hpp"
#include "translate/TranslationError.hpp"
#include "translate/TranslationRequest.hpp"

#include <chrono>

struct TranslationConfig;

namespace task
{

struct RetryState
{
    translate::TaskId task_id = translate::kInvalidTaskId;
    translate::TranslationRequest request;
    int attempt = 0;        // attempts started so far
    int max_attempts = 1;   // max_retries + 1
    TimerId retry_timer = kInvalidTimerId;
};

struct RetryDecision
{
    bool retry = false;
    int attempt = 0;        // the attempt that failed
    int max_attempts = 0;   // effective_max_retries + 1
    std::chrono::milliseconds delay{0};
};

class RetryPolicy
{
public:
    RetryPolicy() = default;
    explicit RetryPolicy(const TranslationConfig& config);

    RetryState begin(translate::TaskId id, translate::TranslationRequest request) const;

    int effectiveMaxRetries(translate::ErrorKind kind) const;

    // min(initial * multiplier^(attempt-1), max); attempt is 1-based.
    std::chrono::milliseconds backoffDelay(int attempt) const;

    RetryDecision decide(const RetryState& state, const translate::TranslationError& error) const;

private:
    int max_retries_ = 3;
    int memory_error_max_retries_ = 1;
    int initial_delay_ms_ = 1000;
    int max_delay_ms_ = 10000;
    double multiplier_ = 2.0;
};

} // namespace task
