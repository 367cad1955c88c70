#pragma once

#include "workq/queue_types.hpp"
#include <chrono>
#include <optional>
#include <string>

namespace workq {

struct QueueConfig;

/**
 * Exponential retry backoff: backoff(n) = base * 2^(n-1) for the n-th retry,
 * clamped to max_backoff when a cap is configured (zero means uncapped).
 * Non-decreasing in n for a fixed base.
 */
class RetryPolicy {
public:
    RetryPolicy() = default;
    explicit RetryPolicy(std::chrono::seconds base,
                         std::chrono::seconds max_backoff = std::chrono::seconds{0});

    static RetryPolicy from_config(const QueueConfig& config);

    std::chrono::seconds backoff(int retry_number) const;

    std::chrono::seconds base() const { return base_; }
    std::chrono::seconds max_backoff() const { return max_backoff_; }

private:
    std::chrono::seconds base_{60};
    std::chrono::seconds max_backoff_{0};
};

inline constexpr const char* DEAD_LETTER_REASON = "max retries exceeded";

// What the Completion Handler does with a Processing message
struct CompletionDecision {
    CompletionOutcome outcome = CompletionOutcome::Completed;
    int retry_count = 0;                              // value after the transition
    std::optional<util::TimePoint> next_scheduled_at; // Retried only
};

/**
 * Pure transition function shared by every store backend. The caller must have
 * verified the message is Processing and must hold its row lock.
 */
CompletionDecision decide_completion(const Message& message,
                                     bool success,
                                     const RetryPolicy& policy,
                                     util::TimePoint now);

} // namespace workq
