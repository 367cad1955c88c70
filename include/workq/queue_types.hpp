#pragma once

#include "workq/util/time.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace workq {

// ============================================================================
// Shared Queue Types
// Used by QueueManager and every QueueStore backend
// ============================================================================

enum class MessageStatus {
    Pending,
    Processing,
    Completed,
    DeadLettered
};

// "pending", "processing", "completed", "dead_lettered"
std::string to_string(MessageStatus status);
MessageStatus status_from_string(const std::string& value);

struct Message {
    int64_t id = 0;
    std::string queue_name;
    std::string type;
    std::string body;
    int priority = 0;
    MessageStatus status = MessageStatus::Pending;
    std::optional<std::string> correlation_id;
    int retry_count = 0;
    int max_retries = 0;
    util::TimePoint created_at;
    util::TimePoint scheduled_at;
    std::optional<util::TimePoint> claim_started_at;
    std::optional<util::TimePoint> claim_ended_at;
    std::optional<std::string> claimant_id;
    std::optional<std::string> last_error;

    nlohmann::json to_json() const;
};

// Everything enqueue persists; id and timestamps are assigned by the store
struct NewMessage {
    std::string type;
    std::string body;
    int priority = 0;
    std::optional<std::string> correlation_id;
    util::TimePoint created_at;
    util::TimePoint scheduled_at;
    int max_retries = 0;
};

struct EnqueueOptions {
    std::optional<int> priority;
    std::optional<std::string> correlation_id;
    std::optional<util::TimePoint> scheduled_at;
    std::optional<int> max_retries;
};

struct DeadLetterRecord {
    int64_t dead_letter_id = 0;
    Message message;                     // snapshot at migration time
    std::string reason;
    util::TimePoint dead_lettered_at;

    nlohmann::json to_json() const;
};

enum class CompletionOutcome {
    Completed,
    Retried,
    DeadLettered
};

std::string to_string(CompletionOutcome outcome);

struct CompletionResult {
    int64_t message_id = 0;
    CompletionOutcome outcome = CompletionOutcome::Completed;
    int retry_count = 0;
    std::optional<util::TimePoint> next_scheduled_at;   // set when Retried
    std::optional<int64_t> dead_letter_id;              // set when DeadLettered

    nlohmann::json to_json() const;
};

struct QueueStats {
    std::string queue_name;
    int64_t pending_count = 0;
    int64_t processing_count = 0;
    int64_t completed_count = 0;
    int64_t dead_lettered_count = 0;

    double oldest_pending_age_seconds = 0.0;

    // Trailing window over Completed rows (by claim_ended_at)
    int window_minutes = 60;
    int64_t completed_in_window = 0;
    double throughput_per_minute = 0.0;
    double avg_processing_seconds = 0.0;     // claim_ended_at - claim_started_at
    double p50_processing_seconds = 0.0;
    double p95_processing_seconds = 0.0;
    double avg_latency_seconds = 0.0;        // claim_ended_at - created_at

    nlohmann::json to_json() const;
};

// Linear-interpolated percentile over an unsorted sample, q in [0, 1]
double percentile(std::vector<double> samples, double q);

} // namespace workq
