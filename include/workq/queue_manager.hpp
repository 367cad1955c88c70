#pragma once

#include "workq/config.hpp"
#include "workq/queue_store.hpp"
#include "workq/queue_types.hpp"
#include "workq/retry_policy.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace workq {

/**
 * QueueManager - the queue's public API
 *
 * Enqueue validates and inserts, claim hands one eligible message to exactly
 * one caller, complete applies the retry/dead-letter policy. Holds no message
 * state of its own; the QueueStore is the single source of truth, so any number
 * of managers (threads or processes) may share one store.
 *
 * Errors: ValidationError for bad arguments (nothing persisted),
 * InvalidStateError for completions of messages that are not processing,
 * StorageError for persistence failures. None are retried here.
 */
class QueueManager {
public:
    static constexpr size_t MAX_TYPE_LENGTH = 255;
    static constexpr size_t MAX_CORRELATION_ID_LENGTH = 255;
    static constexpr size_t MAX_CLAIMANT_LENGTH = 255;
    static constexpr const char* STALE_CLAIM_ERROR = "claim lease expired";

    explicit QueueManager(std::shared_ptr<QueueStore> store,
                          const QueueConfig& config = QueueConfig{},
                          util::Clock clock = util::system_clock());

    // Create backing tables if needed
    void initialize_schema();
    bool health_check();

    // Core message operations
    int64_t enqueue(const std::string& queue,
                    const std::string& type,
                    const std::string& body,
                    const EnqueueOptions& options = EnqueueOptions{});

    // Empty claimant_id means QueueConfig::worker_id
    std::optional<Message> claim(const std::string& queue,
                                 const std::optional<std::string>& type_filter = std::nullopt,
                                 const std::string& claimant_id = "");

    CompletionResult complete(const std::string& queue,
                              int64_t message_id,
                              bool success,
                              const std::optional<std::string>& error_message = std::nullopt);

    std::optional<Message> find(const std::string& queue, int64_t message_id);

    // Statistics and monitoring; window defaults to QueueConfig::stats_window_minutes
    QueueStats stats(const std::string& queue,
                     std::optional<std::chrono::minutes> window = std::nullopt);

    // Dead letters (operator surface)
    std::vector<DeadLetterRecord> dead_letters(const std::string& queue, size_t limit = 100);

    // Enqueue a fresh copy of an archived message; the archive is left untouched
    int64_t requeue_dead_letter(const std::string& queue, int64_t dead_letter_id);

    // Fail claims older than older_than through the retry policy. Never called implicitly.
    size_t reclaim_stale(const std::string& queue, std::chrono::seconds older_than);

    const RetryPolicy& retry_policy() const { return retry_policy_; }
    const QueueConfig& config() const { return config_; }

private:
    std::shared_ptr<QueueStore> store_;
    QueueConfig config_;
    RetryPolicy retry_policy_;
    util::Clock clock_;
};

} // namespace workq
