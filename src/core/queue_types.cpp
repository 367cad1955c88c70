#include "workq/queue_types.hpp"
#include "workq/errors.hpp"
#include <algorithm>
#include <cmath>

namespace workq {

namespace {

nlohmann::json optional_time(const std::optional<util::TimePoint>& tp) {
    if (!tp) return nullptr;
    return util::to_iso8601(*tp);
}

nlohmann::json optional_string(const std::optional<std::string>& value) {
    if (!value) return nullptr;
    return *value;
}

} // namespace

std::string to_string(MessageStatus status) {
    switch (status) {
        case MessageStatus::Pending: return "pending";
        case MessageStatus::Processing: return "processing";
        case MessageStatus::Completed: return "completed";
        case MessageStatus::DeadLettered: return "dead_lettered";
    }
    return "unknown";
}

MessageStatus status_from_string(const std::string& value) {
    if (value == "pending") return MessageStatus::Pending;
    if (value == "processing") return MessageStatus::Processing;
    if (value == "completed") return MessageStatus::Completed;
    if (value == "dead_lettered") return MessageStatus::DeadLettered;
    throw StorageError("Unknown message status in storage: '" + value + "'");
}

std::string to_string(CompletionOutcome outcome) {
    switch (outcome) {
        case CompletionOutcome::Completed: return "completed";
        case CompletionOutcome::Retried: return "retried";
        case CompletionOutcome::DeadLettered: return "dead_lettered";
    }
    return "unknown";
}

nlohmann::json Message::to_json() const {
    return {
        {"id", id},
        {"queue", queue_name},
        {"type", type},
        {"body", body},
        {"priority", priority},
        {"status", to_string(status)},
        {"correlationId", optional_string(correlation_id)},
        {"retryCount", retry_count},
        {"maxRetries", max_retries},
        {"createdAt", util::to_iso8601(created_at)},
        {"scheduledAt", util::to_iso8601(scheduled_at)},
        {"claimStartedAt", optional_time(claim_started_at)},
        {"claimEndedAt", optional_time(claim_ended_at)},
        {"claimantId", optional_string(claimant_id)},
        {"lastError", optional_string(last_error)}
    };
}

nlohmann::json DeadLetterRecord::to_json() const {
    nlohmann::json json = message.to_json();
    json["originalMessageId"] = message.id;
    json.erase("id");
    json["deadLetterId"] = dead_letter_id;
    json["reason"] = reason;
    json["deadLetteredAt"] = util::to_iso8601(dead_lettered_at);
    return json;
}

nlohmann::json CompletionResult::to_json() const {
    nlohmann::json json = {
        {"messageId", message_id},
        {"outcome", to_string(outcome)},
        {"retryCount", retry_count},
        {"nextScheduledAt", optional_time(next_scheduled_at)}
    };
    json["deadLetterId"] = dead_letter_id ? nlohmann::json(*dead_letter_id) : nlohmann::json(nullptr);
    return json;
}

nlohmann::json QueueStats::to_json() const {
    return {
        {"queue", queue_name},
        {"statusCounts", {
            {"pending", pending_count},
            {"processing", processing_count},
            {"completed", completed_count},
            {"deadLettered", dead_lettered_count}
        }},
        {"oldestPendingAgeSeconds", oldest_pending_age_seconds},
        {"windowMinutes", window_minutes},
        {"completedInWindow", completed_in_window},
        {"throughputPerMinute", throughput_per_minute},
        {"processingSeconds", {
            {"avg", avg_processing_seconds},
            {"p50", p50_processing_seconds},
            {"p95", p95_processing_seconds}
        }},
        {"avgLatencySeconds", avg_latency_seconds}
    };
}

double percentile(std::vector<double> samples, double q) {
    if (samples.empty()) return 0.0;
    std::sort(samples.begin(), samples.end());
    q = std::clamp(q, 0.0, 1.0);

    double rank = q * static_cast<double>(samples.size() - 1);
    size_t lower = static_cast<size_t>(std::floor(rank));
    size_t upper = static_cast<size_t>(std::ceil(rank));
    double fraction = rank - static_cast<double>(lower);
    return samples[lower] + (samples[upper] - samples[lower]) * fraction;
}

} // namespace workq
