#include "workq/worker.hpp"
#include "workq/errors.hpp"
#include "workq/queue_name.hpp"
#include <algorithm>
#include <chrono>
#include <spdlog/spdlog.h>

namespace workq {

Worker::Worker(std::shared_ptr<QueueManager> manager,
               const std::string& queue,
               MessageHandler handler,
               const WorkerConfig& config,
               std::optional<std::string> type_filter)
    : manager_(std::move(manager)),
      queue_(QueueName(queue).str()),
      handler_(std::move(handler)),
      config_(config),
      type_filter_(std::move(type_filter)) {
    if (!manager_) {
        throw std::invalid_argument("Queue manager cannot be null");
    }
    if (!handler_) {
        throw std::invalid_argument("Message handler cannot be empty");
    }
    if (config_.concurrency < 1) {
        throw ValidationError("Worker concurrency must be >= 1");
    }
    if (config_.poll_interval_ms < 1 || config_.max_poll_interval_ms < config_.poll_interval_ms) {
        throw ValidationError("Poll intervals must satisfy 1 <= poll_interval_ms <= max_poll_interval_ms");
    }
    if (config_.backoff_multiplier < 1.0) {
        throw ValidationError("backoff_multiplier must be >= 1.0");
    }
}

Worker::~Worker() {
    stop();
}

void Worker::start() {
    if (running_.exchange(true)) {
        return;
    }

    spdlog::info("Starting worker on queue {} - concurrency={}, poll_interval={}ms, backoff={}x@{}, max={}ms",
                 queue_, config_.concurrency, config_.poll_interval_ms,
                 config_.backoff_multiplier, config_.backoff_threshold, config_.max_poll_interval_ms);

    for (int i = 0; i < config_.concurrency; i++) {
        threads_.emplace_back(&Worker::run, this, i);
    }
}

void Worker::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
    }
    wait_cv_.notify_all();

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();

    spdlog::info("Worker on queue {} stopped - processed={}, failed={}",
                 queue_, processed_.load(), failed_.load());
}

int Worker::next_poll_interval(int current_interval_ms,
                               int consecutive_empty,
                               const WorkerConfig& config) {
    if (consecutive_empty == 0) {
        return config.poll_interval_ms;
    }
    if (consecutive_empty < config.backoff_threshold) {
        return current_interval_ms;
    }
    double next = current_interval_ms * config.backoff_multiplier;
    if (next >= config.max_poll_interval_ms) {
        return config.max_poll_interval_ms;
    }
    return std::max(current_interval_ms, static_cast<int>(next));
}

void Worker::run(int thread_index) {
    std::string claimant = manager_->config().worker_id + "-" + std::to_string(thread_index);
    int interval_ms = config_.poll_interval_ms;
    int consecutive_empty = 0;

    spdlog::debug("Worker thread {} started on queue {}", claimant, queue_);

    while (running_.load()) {
        bool had_message = false;
        try {
            had_message = poll_once(claimant);
        } catch (const StorageError& e) {
            spdlog::error("Worker thread {} storage error: {}", claimant, e.what());
        } catch (const InvalidStateError& e) {
            // Message was completed elsewhere (e.g. reclaimed) while the handler ran
            spdlog::warn("Worker thread {} completion rejected: {}", claimant, e.what());
            had_message = true;
        } catch (const Error& e) {
            spdlog::error("Worker thread {} error: {}", claimant, e.what());
        } catch (const std::exception& e) {
            spdlog::error("Worker thread {} unexpected exception: {}", claimant, e.what());
        }

        if (had_message) {
            if (consecutive_empty > 0) {
                spdlog::debug("Resetting backoff for {} (was: {}ms, {} empty)",
                              claimant, interval_ms, consecutive_empty);
            }
            consecutive_empty = 0;
            interval_ms = config_.poll_interval_ms;
            continue;
        }

        consecutive_empty++;
        int old_interval = interval_ms;
        interval_ms = next_poll_interval(interval_ms, consecutive_empty, config_);
        if (interval_ms > old_interval) {
            spdlog::debug("Backoff increased for {}: {}ms -> {}ms (empty count: {})",
                          claimant, old_interval, interval_ms, consecutive_empty);
        }
        wait_for(interval_ms);
    }

    spdlog::debug("Worker thread {} stopped", claimant);
}

bool Worker::poll_once(const std::string& claimant) {
    auto message = manager_->claim(queue_, type_filter_, claimant);
    if (!message) {
        return false;
    }

    bool success = true;
    std::string error;
    try {
        handler_(*message);
    } catch (const std::exception& e) {
        success = false;
        error = e.what();
    } catch (...) {
        // Non-std::exception throws still fail the message instead of leaving it processing
        success = false;
        error = UNKNOWN_HANDLER_ERROR;
    }

    auto result = success
        ? manager_->complete(queue_, message->id, true)
        : manager_->complete(queue_, message->id, false, error);

    if (result.outcome == CompletionOutcome::Completed) {
        processed_++;
    } else {
        failed_++;
    }
    return true;
}

void Worker::wait_for(int interval_ms) {
    std::unique_lock<std::mutex> lock(wait_mutex_);
    wait_cv_.wait_for(lock, std::chrono::milliseconds(interval_ms),
                      [this] { return !running_.load(); });
}

} // namespace workq
