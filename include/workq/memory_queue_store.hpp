#pragma once

#include "workq/queue_store.hpp"
#include <map>
#include <set>
#include <shared_mutex>
#include <unordered_map>

namespace workq {

/**
 * MemoryQueueStore - single-process QueueStore
 *
 * All state sits behind one shared_mutex: claim, complete and insert take it
 * exclusively, which is what makes a claim atomic; stats and reads take it
 * shared. Per-status indexes and counters are maintained on every transition,
 * so stats costs O(log n + completions in the window) instead of a full scan.
 * Nothing survives the process, so use it for embedded queues and tests.
 */
class MemoryQueueStore : public QueueStore {
public:
    MemoryQueueStore() = default;

    int64_t insert(const QueueName& queue, const NewMessage& message) override;

    std::optional<Message> claim_next(const QueueName& queue,
                                      const std::optional<std::string>& type_filter,
                                      const std::string& claimant_id,
                                      util::TimePoint now) override;

    CompletionResult complete(const QueueName& queue,
                              int64_t message_id,
                              bool success,
                              const std::optional<std::string>& error_message,
                              const RetryPolicy& policy,
                              util::TimePoint now) override;

    size_t reclaim_stale(const QueueName& queue,
                         util::TimePoint cutoff,
                         const std::string& error_message,
                         const RetryPolicy& policy,
                         util::TimePoint now) override;

    std::optional<Message> find(const QueueName& queue, int64_t message_id) override;

    QueueStats stats(const QueueName& queue,
                     util::TimePoint now,
                     std::chrono::minutes window) override;

    std::vector<DeadLetterRecord> dead_letters(const QueueName& queue, size_t limit) override;

    std::optional<DeadLetterRecord> find_dead_letter(const QueueName& queue,
                                                     int64_t dead_letter_id) override;

    void initialize_schema() override {}

    bool health_check() override { return true; }

private:
    // Claim order: priority DESC, created_at ASC, id ASC
    struct PendingKey {
        int priority;
        util::TimePoint created_at;
        int64_t id;

        bool operator<(const PendingKey& other) const {
            if (priority != other.priority) return priority > other.priority;
            if (created_at != other.created_at) return created_at < other.created_at;
            return id < other.id;
        }
    };

    struct CompletionSample {
        double processing_seconds;
        double latency_seconds;
    };

    struct QueueState {
        std::map<int64_t, Message> rows;
        std::set<PendingKey> pending;
        std::multiset<util::TimePoint> pending_created_at;
        std::set<int64_t> processing;
        int64_t completed_count = 0;
        // Keyed by claim_ended_at
        std::multimap<util::TimePoint, CompletionSample> completions;
        std::vector<DeadLetterRecord> dead_letters;
    };

    static void add_pending(QueueState& state, const Message& message);

    // Caller holds mutex_ exclusively
    CompletionResult apply_completion(QueueState& state,
                                      Message& message,
                                      bool success,
                                      const std::optional<std::string>& error_message,
                                      const RetryPolicy& policy,
                                      util::TimePoint now);

    static PendingKey key_of(const Message& message) {
        return PendingKey{message.priority, message.created_at, message.id};
    }

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, QueueState> queues_;
    int64_t next_id_ = 1;
    int64_t next_dead_letter_id_ = 1;
};

} // namespace workq
