#include "workq/retry_policy.hpp"
#include "workq/config.hpp"
#include "workq/errors.hpp"

namespace workq {

RetryPolicy::RetryPolicy(std::chrono::seconds base, std::chrono::seconds max_backoff)
    : base_(base), max_backoff_(max_backoff) {
    if (base_.count() < 0) {
        throw ValidationError("Backoff base must be >= 0 seconds");
    }
    if (max_backoff_.count() < 0) {
        throw ValidationError("Backoff cap must be >= 0 seconds");
    }
}

RetryPolicy RetryPolicy::from_config(const QueueConfig& config) {
    return RetryPolicy(std::chrono::seconds(config.backoff_base_seconds),
                       std::chrono::seconds(config.backoff_max_seconds));
}

std::chrono::seconds RetryPolicy::backoff(int retry_number) const {
    if (retry_number < 1) {
        return std::chrono::seconds{0};
    }

    // Saturate at ten years so now + backoff stays representable
    using rep = std::chrono::seconds::rep;
    constexpr rep ceiling = 10LL * 365 * 24 * 3600;
    rep delay = base_.count();
    for (int i = 1; i < retry_number && delay < ceiling; ++i) {
        delay *= 2;
    }
    if (delay > ceiling) {
        delay = ceiling;
    }

    if (max_backoff_.count() > 0 && delay > max_backoff_.count()) {
        delay = max_backoff_.count();
    }
    return std::chrono::seconds{delay};
}

CompletionDecision decide_completion(const Message& message,
                                     bool success,
                                     const RetryPolicy& policy,
                                     util::TimePoint now) {
    CompletionDecision decision;
    decision.retry_count = message.retry_count;

    if (success) {
        decision.outcome = CompletionOutcome::Completed;
        return decision;
    }

    if (message.retry_count < message.max_retries) {
        decision.outcome = CompletionOutcome::Retried;
        decision.retry_count = message.retry_count + 1;
        decision.next_scheduled_at = now + policy.backoff(decision.retry_count);
        return decision;
    }

    decision.outcome = CompletionOutcome::DeadLettered;
    return decision;
}

} // namespace workq
