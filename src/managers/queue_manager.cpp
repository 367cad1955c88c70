#include "workq/queue_manager.hpp"
#include "workq/errors.hpp"
#include "workq/queue_name.hpp"
#include "workq/util/text.hpp"
#include <spdlog/spdlog.h>

namespace workq {

namespace {

void require_storable(const std::string& text, const char* field) {
    if (!util::is_storable_text(text)) {
        throw ValidationError(std::string(field) + " must be valid UTF-8 without NUL bytes");
    }
}

} // namespace

QueueManager::QueueManager(std::shared_ptr<QueueStore> store,
                           const QueueConfig& config,
                           util::Clock clock)
    : store_(std::move(store)),
      config_(config),
      retry_policy_(RetryPolicy::from_config(config)),
      clock_(std::move(clock)) {
    if (!store_) {
        throw std::invalid_argument("Queue store cannot be null");
    }
    if (!clock_) {
        throw std::invalid_argument("Clock cannot be empty");
    }
    if (config_.default_max_retries < 0) {
        throw ValidationError("default_max_retries must be >= 0");
    }
    if (config_.stats_window_minutes <= 0) {
        throw ValidationError("stats_window_minutes must be > 0");
    }
}

void QueueManager::initialize_schema() {
    store_->initialize_schema();
}

bool QueueManager::health_check() {
    return store_->health_check();
}

int64_t QueueManager::enqueue(const std::string& queue,
                              const std::string& type,
                              const std::string& body,
                              const EnqueueOptions& options) {
    QueueName queue_name(queue);

    if (type.empty()) {
        throw ValidationError("Message type must not be empty");
    }
    if (type.size() > MAX_TYPE_LENGTH) {
        throw ValidationError("Message type exceeds " + std::to_string(MAX_TYPE_LENGTH) + " characters");
    }
    if (body.empty()) {
        throw ValidationError("Message body must not be empty");
    }
    if (options.correlation_id && options.correlation_id->size() > MAX_CORRELATION_ID_LENGTH) {
        throw ValidationError("Correlation id exceeds " + std::to_string(MAX_CORRELATION_ID_LENGTH) + " characters");
    }
    require_storable(type, "Message type");
    require_storable(body, "Message body");
    if (options.correlation_id) {
        require_storable(*options.correlation_id, "Correlation id");
    }

    int max_retries = options.max_retries.value_or(config_.default_max_retries);
    if (max_retries < 0) {
        throw ValidationError("max_retries must be >= 0, got " + std::to_string(max_retries));
    }

    auto now = clock_();

    NewMessage message;
    message.type = type;
    message.body = body;
    message.priority = options.priority.value_or(config_.default_priority);
    if (options.correlation_id && !options.correlation_id->empty()) {
        message.correlation_id = options.correlation_id;
    }
    message.created_at = now;
    message.scheduled_at = options.scheduled_at.value_or(now);
    message.max_retries = max_retries;

    int64_t id = store_->insert(queue_name, message);

    spdlog::debug("Enqueued message: queue={}, id={}, type={}, priority={}, max_retries={}",
                  queue_name.str(), id, type, message.priority, max_retries);
    return id;
}

std::optional<Message> QueueManager::claim(const std::string& queue,
                                           const std::optional<std::string>& type_filter,
                                           const std::string& claimant_id) {
    QueueName queue_name(queue);

    const std::string& claimant = claimant_id.empty() ? config_.worker_id : claimant_id;
    if (claimant.size() > MAX_CLAIMANT_LENGTH) {
        throw ValidationError("Claimant id exceeds " + std::to_string(MAX_CLAIMANT_LENGTH) + " characters");
    }
    require_storable(claimant, "Claimant id");

    // An empty filter is the same as no filter
    std::optional<std::string> filter;
    if (type_filter && !type_filter->empty()) {
        require_storable(*type_filter, "Type filter");
        filter = type_filter;
    }

    auto message = store_->claim_next(queue_name, filter, claimant, clock_());

    if (message) {
        spdlog::debug("Claimed message: queue={}, id={}, claimant={}, retry_count={}",
                      queue_name.str(), message->id, claimant, message->retry_count);
    }
    return message;
}

CompletionResult QueueManager::complete(const std::string& queue,
                                        int64_t message_id,
                                        bool success,
                                        const std::optional<std::string>& error_message) {
    QueueName queue_name(queue);

    // Error text is diagnostic: a malformed one must not keep the message stuck in processing
    std::optional<std::string> error;
    if (error_message) {
        error = util::to_storable_text(*error_message);
    }

    auto result = store_->complete(queue_name, message_id, success, error, retry_policy_, clock_());

    switch (result.outcome) {
        case CompletionOutcome::Completed:
            spdlog::debug("Completed message: queue={}, id={}", queue_name.str(), message_id);
            break;
        case CompletionOutcome::Retried:
            spdlog::info("Message failed, retry {} scheduled: queue={}, id={}, error={}",
                         result.retry_count, queue_name.str(), message_id, error.value_or(""));
            break;
        case CompletionOutcome::DeadLettered:
            spdlog::warn("Message moved to dead letters after {} retries: queue={}, id={}, dead_letter_id={}, error={}",
                         result.retry_count, queue_name.str(), message_id,
                         result.dead_letter_id.value_or(0), error.value_or(""));
            break;
    }

    return result;
}

std::optional<Message> QueueManager::find(const std::string& queue, int64_t message_id) {
    return store_->find(QueueName(queue), message_id);
}

QueueStats QueueManager::stats(const std::string& queue, std::optional<std::chrono::minutes> window) {
    QueueName queue_name(queue);

    auto effective_window = window.value_or(std::chrono::minutes(config_.stats_window_minutes));
    if (effective_window.count() <= 0) {
        throw ValidationError("Stats window must be at least one minute");
    }

    return store_->stats(queue_name, clock_(), effective_window);
}

std::vector<DeadLetterRecord> QueueManager::dead_letters(const std::string& queue, size_t limit) {
    return store_->dead_letters(QueueName(queue), limit);
}

int64_t QueueManager::requeue_dead_letter(const std::string& queue, int64_t dead_letter_id) {
    QueueName queue_name(queue);

    auto record = store_->find_dead_letter(queue_name, dead_letter_id);
    if (!record) {
        throw InvalidStateError("Dead letter " + std::to_string(dead_letter_id) +
                                " not found in queue '" + queue_name.str() + "'");
    }

    auto now = clock_();

    NewMessage message;
    message.type = record->message.type;
    message.body = record->message.body;
    message.priority = record->message.priority;
    message.correlation_id = record->message.correlation_id;
    message.max_retries = record->message.max_retries;
    message.created_at = now;
    message.scheduled_at = now;

    int64_t id = store_->insert(queue_name, message);

    spdlog::info("Requeued dead letter {} (original message {}) as message {} in queue {}",
                 dead_letter_id, record->message.id, id, queue_name.str());
    return id;
}

size_t QueueManager::reclaim_stale(const std::string& queue, std::chrono::seconds older_than) {
    QueueName queue_name(queue);

    if (older_than.count() < 0) {
        throw ValidationError("Reclaim threshold must be >= 0 seconds");
    }

    auto now = clock_();
    size_t reclaimed = store_->reclaim_stale(queue_name, now - older_than, STALE_CLAIM_ERROR, retry_policy_, now);

    if (reclaimed > 0) {
        spdlog::warn("Reclaimed {} stale claims older than {}s in queue {}",
                     reclaimed, older_than.count(), queue_name.str());
    }
    return reclaimed;
}

} // namespace workq
