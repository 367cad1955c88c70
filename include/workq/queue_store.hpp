#pragma once

#include "workq/queue_name.hpp"
#include "workq/queue_types.hpp"
#include "workq/retry_policy.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace workq {

/**
 * QueueStore - durable record sets behind QueueManager
 *
 * Owns the active message rows and the append-only dead-letter archive for
 * every queue. Each operation is one atomic unit at the storage level; no
 * caller-side locking is needed or expected.
 *
 * Implementations raise StorageError for persistence failures and
 * InvalidStateError for state-machine violations. They never retry.
 */
class QueueStore {
public:
    virtual ~QueueStore() = default;

    // Insert one Pending row, return its id
    virtual int64_t insert(const QueueName& queue, const NewMessage& message) = 0;

    /**
     * Atomically move the best eligible row to Processing.
     *
     * Eligible: status Pending, scheduled_at <= now, type == type_filter when set.
     * Order: priority DESC, created_at ASC, id ASC. Rows held by a concurrent
     * claim are skipped, never waited on.
     */
    virtual std::optional<Message> claim_next(const QueueName& queue,
                                              const std::optional<std::string>& type_filter,
                                              const std::string& claimant_id,
                                              util::TimePoint now) = 0;

    /**
     * Apply a completion to a Processing row using decide_completion().
     * Throws InvalidStateError when the row is missing or not Processing.
     */
    virtual CompletionResult complete(const QueueName& queue,
                                      int64_t message_id,
                                      bool success,
                                      const std::optional<std::string>& error_message,
                                      const RetryPolicy& policy,
                                      util::TimePoint now) = 0;

    // Fail every Processing row claimed at or before cutoff through the retry policy
    virtual size_t reclaim_stale(const QueueName& queue,
                                 util::TimePoint cutoff,
                                 const std::string& error_message,
                                 const RetryPolicy& policy,
                                 util::TimePoint now) = 0;

    virtual std::optional<Message> find(const QueueName& queue, int64_t message_id) = 0;

    virtual QueueStats stats(const QueueName& queue,
                             util::TimePoint now,
                             std::chrono::minutes window) = 0;

    // Newest first
    virtual std::vector<DeadLetterRecord> dead_letters(const QueueName& queue, size_t limit) = 0;

    virtual std::optional<DeadLetterRecord> find_dead_letter(const QueueName& queue,
                                                             int64_t dead_letter_id) = 0;

    // Create backing structures if needed; idempotent
    virtual void initialize_schema() = 0;

    virtual bool health_check() = 0;
};

} // namespace workq
