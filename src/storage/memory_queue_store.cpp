#include "workq/memory_queue_store.hpp"
#include "workq/errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <mutex>

namespace workq {

void MemoryQueueStore::add_pending(QueueState& state, const Message& message) {
    state.pending.insert(key_of(message));
    state.pending_created_at.insert(message.created_at);
}

int64_t MemoryQueueStore::insert(const QueueName& queue, const NewMessage& message) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto& state = queues_[queue.str()];

    Message row;
    row.id = next_id_++;
    row.queue_name = queue.str();
    row.type = message.type;
    row.body = message.body;
    row.priority = message.priority;
    row.status = MessageStatus::Pending;
    row.correlation_id = message.correlation_id;
    row.retry_count = 0;
    row.max_retries = message.max_retries;
    row.created_at = message.created_at;
    row.scheduled_at = message.scheduled_at;

    add_pending(state, row);
    int64_t id = row.id;
    state.rows.emplace(id, std::move(row));
    return id;
}

std::optional<Message> MemoryQueueStore::claim_next(const QueueName& queue,
                                                    const std::optional<std::string>& type_filter,
                                                    const std::string& claimant_id,
                                                    util::TimePoint now) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = queues_.find(queue.str());
    if (it == queues_.end()) {
        return std::nullopt;
    }
    auto& state = it->second;

    for (auto key_it = state.pending.begin(); key_it != state.pending.end(); ++key_it) {
        auto& row = state.rows.at(key_it->id);
        if (row.scheduled_at > now) continue;
        if (type_filter && row.type != *type_filter) continue;

        state.pending.erase(key_it);
        state.pending_created_at.erase(state.pending_created_at.find(row.created_at));
        state.processing.insert(row.id);
        row.status = MessageStatus::Processing;
        row.claimant_id = claimant_id;
        row.claim_started_at = now;
        row.claim_ended_at.reset();
        return row;
    }

    return std::nullopt;
}

CompletionResult MemoryQueueStore::apply_completion(QueueState& state,
                                                    Message& message,
                                                    bool success,
                                                    const std::optional<std::string>& error_message,
                                                    const RetryPolicy& policy,
                                                    util::TimePoint now) {
    auto decision = decide_completion(message, success, policy, now);

    CompletionResult result;
    result.message_id = message.id;
    result.outcome = decision.outcome;
    result.retry_count = decision.retry_count;

    state.processing.erase(message.id);

    switch (decision.outcome) {
        case CompletionOutcome::Completed:
            message.status = MessageStatus::Completed;
            message.claim_ended_at = now;
            ++state.completed_count;
            state.completions.emplace(now, CompletionSample{
                message.claim_started_at ? util::seconds_between(*message.claim_started_at, now) : 0.0,
                util::seconds_between(message.created_at, now)});
            break;

        case CompletionOutcome::Retried:
            message.status = MessageStatus::Pending;
            message.retry_count = decision.retry_count;
            message.claimant_id.reset();
            message.claim_started_at.reset();
            message.last_error = (error_message && !error_message->empty())
                ? error_message : std::nullopt;
            message.scheduled_at = *decision.next_scheduled_at;
            result.next_scheduled_at = decision.next_scheduled_at;
            add_pending(state, message);
            break;

        case CompletionOutcome::DeadLettered: {
            DeadLetterRecord record;
            record.dead_letter_id = next_dead_letter_id_++;
            record.message = message;
            record.message.status = MessageStatus::DeadLettered;
            if (error_message && !error_message->empty()) {
                record.message.last_error = error_message;
            }
            record.message.claim_ended_at = now;
            record.reason = DEAD_LETTER_REASON;
            record.dead_lettered_at = now;

            const int64_t id = message.id;
            result.dead_letter_id = record.dead_letter_id;
            state.dead_letters.push_back(std::move(record));
            state.rows.erase(id);   // invalidates message
            break;
        }
    }

    return result;
}

CompletionResult MemoryQueueStore::complete(const QueueName& queue,
                                            int64_t message_id,
                                            bool success,
                                            const std::optional<std::string>& error_message,
                                            const RetryPolicy& policy,
                                            util::TimePoint now) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto queue_it = queues_.find(queue.str());
    if (queue_it == queues_.end()) {
        throw InvalidStateError("Message " + std::to_string(message_id) +
                                " not found in queue '" + queue.str() + "'");
    }
    auto& state = queue_it->second;

    auto row_it = state.rows.find(message_id);
    if (row_it == state.rows.end()) {
        throw InvalidStateError("Message " + std::to_string(message_id) +
                                " not found in queue '" + queue.str() + "'");
    }
    if (row_it->second.status != MessageStatus::Processing) {
        throw InvalidStateError("Message " + std::to_string(message_id) + " is " +
                                to_string(row_it->second.status) + ", not processing");
    }

    return apply_completion(state, row_it->second, success, error_message, policy, now);
}

size_t MemoryQueueStore::reclaim_stale(const QueueName& queue,
                                       util::TimePoint cutoff,
                                       const std::string& error_message,
                                       const RetryPolicy& policy,
                                       util::TimePoint now) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto queue_it = queues_.find(queue.str());
    if (queue_it == queues_.end()) {
        return 0;
    }
    auto& state = queue_it->second;

    std::vector<int64_t> stale;
    for (int64_t id : state.processing) {
        const auto& row = state.rows.at(id);
        if (row.claim_started_at && *row.claim_started_at <= cutoff) {
            stale.push_back(id);
        }
    }

    for (int64_t id : stale) {
        auto result = apply_completion(state, state.rows.at(id), false, error_message, policy, now);
        spdlog::warn("Reclaimed stale claim: queue={}, id={}, outcome={}",
                     queue.str(), id, to_string(result.outcome));
    }

    return stale.size();
}

std::optional<Message> MemoryQueueStore::find(const QueueName& queue, int64_t message_id) {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto queue_it = queues_.find(queue.str());
    if (queue_it == queues_.end()) return std::nullopt;

    auto row_it = queue_it->second.rows.find(message_id);
    if (row_it == queue_it->second.rows.end()) return std::nullopt;
    return row_it->second;
}

QueueStats MemoryQueueStore::stats(const QueueName& queue,
                                   util::TimePoint now,
                                   std::chrono::minutes window) {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    QueueStats stats;
    stats.queue_name = queue.str();
    stats.window_minutes = static_cast<int>(window.count());

    auto queue_it = queues_.find(queue.str());
    if (queue_it == queues_.end()) {
        return stats;
    }
    const auto& state = queue_it->second;

    stats.pending_count = static_cast<int64_t>(state.pending.size());
    stats.processing_count = static_cast<int64_t>(state.processing.size());
    stats.completed_count = state.completed_count;
    stats.dead_lettered_count = static_cast<int64_t>(state.dead_letters.size());

    if (!state.pending_created_at.empty()) {
        stats.oldest_pending_age_seconds =
            std::max(0.0, util::seconds_between(*state.pending_created_at.begin(), now));
    }

    std::vector<double> processing_seconds;
    double latency_total = 0.0;
    for (auto it = state.completions.lower_bound(now - window); it != state.completions.end(); ++it) {
        processing_seconds.push_back(it->second.processing_seconds);
        latency_total += it->second.latency_seconds;
        ++stats.completed_in_window;
    }

    if (stats.completed_in_window > 0) {
        stats.avg_latency_seconds = latency_total / static_cast<double>(stats.completed_in_window);
    }
    if (!processing_seconds.empty()) {
        double total = 0.0;
        for (double s : processing_seconds) total += s;
        stats.avg_processing_seconds = total / static_cast<double>(processing_seconds.size());
        stats.p50_processing_seconds = percentile(processing_seconds, 0.50);
        stats.p95_processing_seconds = percentile(processing_seconds, 0.95);
    }
    if (window.count() > 0) {
        stats.throughput_per_minute =
            static_cast<double>(stats.completed_in_window) / static_cast<double>(window.count());
    }

    return stats;
}

std::vector<DeadLetterRecord> MemoryQueueStore::dead_letters(const QueueName& queue, size_t limit) {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<DeadLetterRecord> records;
    auto queue_it = queues_.find(queue.str());
    if (queue_it == queues_.end()) return records;

    const auto& archive = queue_it->second.dead_letters;
    for (auto it = archive.rbegin(); it != archive.rend() && records.size() < limit; ++it) {
        records.push_back(*it);
    }
    return records;
}

std::optional<DeadLetterRecord> MemoryQueueStore::find_dead_letter(const QueueName& queue,
                                                                   int64_t dead_letter_id) {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto queue_it = queues_.find(queue.str());
    if (queue_it == queues_.end()) return std::nullopt;

    for (const auto& record : queue_it->second.dead_letters) {
        if (record.dead_letter_id == dead_letter_id) return record;
    }
    return std::nullopt;
}

} // namespace workq
