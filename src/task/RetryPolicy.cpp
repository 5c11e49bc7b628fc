#include "RetryPolicy.hpp"

#include "state/TranslationConfig.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace task
{

// Delays never shrink between attempts: multiplier >= 1 and max >= initial.
RetryPolicy::RetryPolicy(const TranslationConfig& config)
    : max_retries_(std::max(config.max_retries, 0))
    , memory_error_max_retries_(std::max(config.memory_error_max_retries, 0))
    , initial_delay_ms_(std::max(config.initial_retry_delay_ms, 0))
    , max_delay_ms_(std::max(config.max_retry_delay_ms, initial_delay_ms_))
    , multiplier_(std::isfinite(config.backoff_multiplier) ? std::max(config.backoff_multiplier, 1.0) : 1.0)
{
}

RetryState RetryPolicy::begin(translate::TaskId id, translate::TranslationRequest request) const
{
    RetryState state;
    state.task_id = id;
    state.request = std::move(request);
    state.attempt = 0;
    state.max_attempts = max_retries_ + 1;
    return state;
}

int RetryPolicy::effectiveMaxRetries(translate::ErrorKind kind) const
{
    return kind == translate::ErrorKind::Memory ? memory_error_max_retries_ : max_retries_;
}

std::chrono::milliseconds RetryPolicy::backoffDelay(int attempt) const
{
    const int exponent = std::max(attempt - 1, 0);
    const double raw = static_cast<double>(initial_delay_ms_) * std::pow(multiplier_, exponent);
    const double capped = std::min(raw, static_cast<double>(max_delay_ms_));
    return std::chrono::milliseconds(static_cast<long long>(std::max(capped, 0.0)));
}

RetryDecision RetryPolicy::decide(const RetryState& state, const translate::TranslationError& error) const
{
    const int effective = effectiveMaxRetries(error.kind);

    RetryDecision decision;
    decision.attempt = state.attempt;
    decision.max_attempts = effective + 1;
    decision.retry = error.is_retryable && state.attempt <= effective;
    if (decision.retry)
        decision.delay = backoffDelay(state.attempt);
    return decision;
}

} // namespace task
