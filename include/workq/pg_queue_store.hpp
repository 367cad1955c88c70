#pragma once

#include "workq/config.hpp"
#include "workq/database.hpp"
#include "workq/queue_store.hpp"
#include <memory>

namespace workq {

/**
 * PgQueueStore - PostgreSQL QueueStore
 *
 * Every queue shares workq.messages and workq.dead_letters, partitioned by a
 * queue_name column that is always bound as a parameter. Claims use a single
 * UPDATE over a FOR UPDATE SKIP LOCKED subselect, so concurrent consumers in
 * any number of processes never receive the same row and never wait on each
 * other's locks. Completions lock the row, decide, and write in one transaction.
 */
class PgQueueStore : public QueueStore {
public:
    explicit PgQueueStore(std::shared_ptr<DatabasePool> db_pool);

    static std::shared_ptr<DatabasePool> make_pool(const DatabaseConfig& config);

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

    void initialize_schema() override;

    bool health_check() override;

private:
    // Runs inside an open transaction on conn; the row is locked by the caller
    CompletionResult apply_completion(DatabaseConnection& conn,
                                      const Message& message,
                                      bool success,
                                      const std::optional<std::string>& error_message,
                                      const RetryPolicy& policy,
                                      util::TimePoint now);

    std::shared_ptr<DatabasePool> db_pool_;
};

} // namespace workq
