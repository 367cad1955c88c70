#pragma once

#include "workq/config.hpp"
#include "workq/queue_manager.hpp"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace workq {

using MessageHandler = std::function<void(const Message&)>;

/**
 * Worker - consumer loop over one queue
 *
 * Each of the `concurrency` threads repeatedly:
 * 1. Claims the next eligible message (optionally filtered by type)
 * 2. Runs the handler
 * 3. Completes with success, or with failure and e.what() if the handler threw
 * 4. On an empty claim, sleeps for the current poll interval
 *
 * The poll interval starts at poll_interval_ms and is multiplied by
 * backoff_multiplier once backoff_threshold consecutive claims came back empty,
 * capped at max_poll_interval_ms. Any claimed message resets it.
 *
 * Handlers signal failure by throwing. A std::exception's what() becomes the
 * recorded error; any other thrown type is recorded as UNKNOWN_HANDLER_ERROR.
 *
 * @param manager Shared QueueManager (store access and retry policy)
 * @param queue Queue name, validated on construction
 * @param handler Called once per claimed message
 * @param config Concurrency and backoff settings
 * @param type_filter Only claim messages of this type
 */
class Worker {
public:
    static constexpr const char* UNKNOWN_HANDLER_ERROR = "unknown exception";

    Worker(std::shared_ptr<QueueManager> manager,
           const std::string& queue,
           MessageHandler handler,
           const WorkerConfig& config = WorkerConfig{},
           std::optional<std::string> type_filter = std::nullopt);
    ~Worker();

    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    void start();
    // Signals all threads and joins them. Messages in flight are completed first.
    void stop();

    bool is_running() const { return running_.load(); }
    uint64_t processed() const { return processed_.load(); }
    uint64_t failed() const { return failed_.load(); }

    // Next interval after a poll; exposed for tests
    static int next_poll_interval(int current_interval_ms,
                                  int consecutive_empty,
                                  const WorkerConfig& config);

private:
    void run(int thread_index);
    // Returns true if a message was claimed
    bool poll_once(const std::string& claimant);
    void wait_for(int interval_ms);

    std::shared_ptr<QueueManager> manager_;
    std::string queue_;
    MessageHandler handler_;
    WorkerConfig config_;
    std::optional<std::string> type_filter_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> processed_{0};
    std::atomic<uint64_t> failed_{0};

    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
    std::vector<std::thread> threads_;
};

} // namespace workq
