/**
 * QueueManager tests over the in-memory store
 *
 * Time is driven by a ManualClock so scheduling, backoff and stats are exact.
 */

#include "workq/errors.hpp"
#include "workq/memory_queue_store.hpp"
#include "workq/queue_manager.hpp"
#include "test_support.hpp"
#include <spdlog/spdlog.h>

using namespace workq;
using std::chrono::minutes;
using std::chrono::seconds;

namespace {

struct Fixture {
    test::ManualClock clock;
    std::shared_ptr<MemoryQueueStore> store = std::make_shared<MemoryQueueStore>();
    std::shared_ptr<QueueManager> manager;

    explicit Fixture(QueueConfig config = QueueConfig{}) {
        manager = std::make_shared<QueueManager>(store, config, clock.as_clock());
    }
};

EnqueueOptions with_priority(int priority) {
    EnqueueOptions options;
    options.priority = priority;
    return options;
}

EnqueueOptions with_max_retries(int max_retries) {
    EnqueueOptions options;
    options.max_retries = max_retries;
    return options;
}

} // namespace

bool test_enqueue_defaults() {
    TEST_HEADER("Enqueue defaults");

    Fixture f;
    int64_t id = f.manager->enqueue("email", "Welcome", "{\"to\":\"a@b.c\"}");
    auto message = f.manager->find("email", id);

    TEST_ASSERT(message.has_value(), "Enqueued message can be found");
    TEST_ASSERT(message->status == MessageStatus::Pending, "New message is pending");
    TEST_ASSERT(message->priority == 5, "Default priority is 5");
    TEST_ASSERT(message->max_retries == 3, "Default max retries is 3");
    TEST_ASSERT(message->retry_count == 0, "Retry count starts at 0");
    TEST_ASSERT(message->scheduled_at == f.clock.now(), "Default scheduled_at is now");
    TEST_ASSERT(message->created_at == f.clock.now(), "created_at is now");
    TEST_ASSERT(!message->correlation_id, "No correlation id unless given");

    EnqueueOptions options;
    options.correlation_id = "order-991";
    int64_t second = f.manager->enqueue("email", "Receipt", "{}", options);
    TEST_ASSERT(second > id, "Ids increase");
    TEST_ASSERT(f.manager->find("email", second)->correlation_id == std::optional<std::string>("order-991"),
                "Correlation id is stored");

    return true;
}

bool test_enqueue_validation() {
    TEST_HEADER("Enqueue validation");

    Fixture f;
    TEST_THROWS(f.manager->enqueue("email", "Welcome", ""), ValidationError, "Empty body is rejected");
    TEST_THROWS(f.manager->enqueue("email", "", "{}"), ValidationError, "Empty type is rejected");
    TEST_THROWS(f.manager->enqueue("email", "Welcome", "{}", with_max_retries(-1)), ValidationError,
                "Negative max_retries is rejected");
    TEST_THROWS(f.manager->enqueue("bad queue", "Welcome", "{}"), ValidationError, "Invalid queue name is rejected");
    TEST_THROWS(f.manager->enqueue("email", std::string(300, 't'), "{}"), ValidationError, "Oversized type is rejected");

    auto stats = f.manager->stats("email");
    TEST_ASSERT(stats.pending_count == 0, "Rejected enqueues persist nothing");

    QueueConfig bad;
    bad.stats_window_minutes = 0;
    TEST_THROWS(QueueManager(f.store, bad), ValidationError, "Zero stats window in config is rejected");

    return true;
}

bool test_text_fields_must_be_storable() {
    TEST_HEADER("Text fields must be storable");

    Fixture f;
    const std::string with_nul("ab\0cd", 5);
    const std::string latin1("caf\xE9");

    TEST_THROWS(f.manager->enqueue("email", "Welcome", with_nul), ValidationError,
                "Body with an embedded NUL is rejected");
    TEST_THROWS(f.manager->enqueue("email", "Welcome", latin1), ValidationError,
                "Body that is not UTF-8 is rejected");
    TEST_THROWS(f.manager->enqueue("email", latin1, "{}"), ValidationError, "Type that is not UTF-8 is rejected");

    EnqueueOptions options;
    options.correlation_id = with_nul;
    TEST_THROWS(f.manager->enqueue("email", "Welcome", "{}", options), ValidationError,
                "Correlation id with a NUL is rejected");
    TEST_ASSERT(f.manager->stats("email").pending_count == 0, "Nothing was persisted");

    const std::string unicode = "{\"greeting\":\"\xE3\x81\x93\xE3\x82\x93\xE3\x81\xAB\xE3\x81\xA1\xE3\x81\xAF\"}";
    int64_t id = f.manager->enqueue("email", "Welcome", unicode);
    TEST_ASSERT(f.manager->find("email", id)->body == unicode, "Multi-byte UTF-8 body is kept byte for byte");

    TEST_THROWS(f.manager->claim("email", latin1), ValidationError, "Type filter that is not UTF-8 is rejected");
    TEST_THROWS(f.manager->claim("email", std::nullopt, with_nul), ValidationError,
                "Claimant with a NUL is rejected");

    f.manager->claim("email");
    auto result = f.manager->complete("email", id, false, std::string("smtp\0 \xC0\xAF down", 13));
    TEST_ASSERT(result.outcome == CompletionOutcome::Retried, "Malformed error text still completes the claim");
    TEST_ASSERT(f.manager->find("email", id)->last_error == std::optional<std::string>("smtp? ?? down"),
                "NUL and malformed bytes in the error are replaced");

    return true;
}

bool test_claim_priority_order() {
    TEST_HEADER("Claim priority order");

    Fixture f;
    int64_t low = f.manager->enqueue("jobs", "T", "low", with_priority(5));
    int64_t high = f.manager->enqueue("jobs", "T", "high", with_priority(10));
    int64_t lowest = f.manager->enqueue("jobs", "T", "lowest", with_priority(1));

    auto first = f.manager->claim("jobs");
    auto second = f.manager->claim("jobs");
    auto third = f.manager->claim("jobs");
    auto fourth = f.manager->claim("jobs");

    TEST_ASSERT(first && first->id == high, "Priority 10 is claimed before priority 5");
    TEST_ASSERT(second && second->id == low, "Priority 5 is claimed next");
    TEST_ASSERT(third && third->id == lowest, "Priority 1 is claimed last");
    TEST_ASSERT(!fourth, "Claim on a drained queue returns nothing");

    return true;
}

bool test_claim_fifo_within_priority() {
    TEST_HEADER("FIFO within a priority");

    Fixture f;
    int64_t a = f.manager->enqueue("jobs", "T", "a");
    f.clock.advance(seconds(1));
    int64_t b = f.manager->enqueue("jobs", "T", "b");
    int64_t c = f.manager->enqueue("jobs", "T", "c");

    TEST_ASSERT(f.manager->claim("jobs")->id == a, "Oldest created_at first");
    TEST_ASSERT(f.manager->claim("jobs")->id == b, "Same created_at breaks ties by id");
    TEST_ASSERT(f.manager->claim("jobs")->id == c, "Then the later id");

    return true;
}

bool test_claim_state_and_claimant() {
    TEST_HEADER("Claim state");

    QueueConfig config;
    config.worker_id = "host-a";
    Fixture f(config);

    int64_t id = f.manager->enqueue("jobs", "T", "x");
    auto claimed = f.manager->claim("jobs");

    TEST_ASSERT(claimed && claimed->id == id, "Claim returns the message");
    TEST_ASSERT(claimed->status == MessageStatus::Processing, "Returned message is processing");
    TEST_ASSERT(claimed->claimant_id == std::optional<std::string>("host-a"),
                "Empty claimant falls back to worker id");
    TEST_ASSERT(claimed->claim_started_at == std::optional<util::TimePoint>(f.clock.now()),
                "claim_started_at is now");

    auto stored = f.manager->find("jobs", id);
    TEST_ASSERT(stored->status == MessageStatus::Processing, "Stored message is processing");

    int64_t other = f.manager->enqueue("jobs", "T", "y");
    auto named = f.manager->claim("jobs", std::nullopt, "consumer-9");
    TEST_ASSERT(named && named->id == other, "Second message claimed");
    TEST_ASSERT(named->claimant_id == std::optional<std::string>("consumer-9"), "Explicit claimant is recorded");

    return true;
}

bool test_claim_respects_schedule() {
    TEST_HEADER("Scheduled messages");

    Fixture f;
    EnqueueOptions later;
    later.scheduled_at = f.clock.now() + seconds(30);
    later.priority = 10;
    int64_t delayed = f.manager->enqueue("jobs", "T", "later", later);

    TEST_ASSERT(!f.manager->claim("jobs"), "Future message is not claimable");

    int64_t now_id = f.manager->enqueue("jobs", "T", "now", with_priority(1));
    auto claimed = f.manager->claim("jobs");
    TEST_ASSERT(claimed && claimed->id == now_id, "Lower priority eligible message wins over future one");

    f.clock.advance(seconds(29));
    TEST_ASSERT(!f.manager->claim("jobs"), "Still not claimable one second early");

    f.clock.advance(seconds(1));
    auto due = f.manager->claim("jobs");
    TEST_ASSERT(due && due->id == delayed, "Claimable once scheduled_at == now");

    return true;
}

bool test_claim_type_filter_and_queue_isolation() {
    TEST_HEADER("Type filter and queue isolation");

    Fixture f;
    int64_t email = f.manager->enqueue("work", "Email", "e", with_priority(1));
    int64_t sms = f.manager->enqueue("work", "Sms", "s", with_priority(9));
    int64_t other_queue = f.manager->enqueue("other", "Email", "o", with_priority(9));

    auto claimed = f.manager->claim("work", std::string("Email"));
    TEST_ASSERT(claimed && claimed->id == email, "Filter skips higher priority messages of other types");
    TEST_ASSERT(!f.manager->claim("work", std::string("Email")), "No more Email messages in this queue");

    auto unfiltered = f.manager->claim("work", std::string(""));
    TEST_ASSERT(unfiltered && unfiltered->id == sms, "Empty filter means no filter");

    TEST_ASSERT(f.manager->find("other", other_queue)->status == MessageStatus::Pending,
                "Messages in other queues are untouched");
    TEST_ASSERT(!f.manager->find("work", other_queue), "find is scoped to the queue");

    return true;
}

bool test_complete_success_and_double_completion() {
    TEST_HEADER("Complete success");

    Fixture f;
    int64_t id = f.manager->enqueue("jobs", "T", "x");
    f.manager->claim("jobs");
    f.clock.advance(seconds(3));

    auto result = f.manager->complete("jobs", id, true);
    TEST_ASSERT(result.outcome == CompletionOutcome::Completed, "Outcome is completed");

    auto stored = f.manager->find("jobs", id);
    TEST_ASSERT(stored->status == MessageStatus::Completed, "Message is completed");
    TEST_ASSERT(stored->claim_ended_at == std::optional<util::TimePoint>(f.clock.now()), "claim_ended_at is set");

    TEST_THROWS(f.manager->complete("jobs", id, true), InvalidStateError, "Second completion is rejected");
    TEST_ASSERT(f.manager->find("jobs", id)->claim_ended_at == stored->claim_ended_at,
                "Rejected completion changes nothing");

    TEST_THROWS(f.manager->complete("jobs", 9999, true), InvalidStateError, "Unknown id is rejected");

    int64_t pending = f.manager->enqueue("jobs", "T", "y");
    TEST_THROWS(f.manager->complete("jobs", pending, false, std::string("nope")), InvalidStateError,
                "Completing a pending message is rejected");
    TEST_ASSERT(f.manager->find("jobs", pending)->retry_count == 0, "Pending message keeps its retry count");

    return true;
}

bool test_retry_backoff_schedule() {
    TEST_HEADER("Retry backoff");

    QueueConfig config;
    config.backoff_base_seconds = 60;
    Fixture f(config);

    int64_t id = f.manager->enqueue("jobs", "T", "x", with_max_retries(3));

    f.manager->claim("jobs");
    auto first = f.manager->complete("jobs", id, false, std::string("timeout"));
    TEST_ASSERT(first.outcome == CompletionOutcome::Retried, "First failure retries");
    TEST_ASSERT(first.retry_count == 1, "Retry count is 1");
    TEST_ASSERT(first.next_scheduled_at == std::optional<util::TimePoint>(f.clock.now() + seconds(60)),
                "First retry after 60s");

    auto stored = f.manager->find("jobs", id);
    TEST_ASSERT(stored->status == MessageStatus::Pending, "Retried message is pending again");
    TEST_ASSERT(stored->last_error == std::optional<std::string>("timeout"), "Error message is recorded");
    TEST_ASSERT(!stored->claimant_id, "Claimant is cleared on retry");

    f.clock.advance(seconds(59));
    TEST_ASSERT(!f.manager->claim("jobs"), "Not claimable during backoff");
    f.clock.advance(seconds(1));
    TEST_ASSERT(f.manager->claim("jobs")->id == id, "Claimable after backoff");

    auto second = f.manager->complete("jobs", id, false, std::string("timeout"));
    TEST_ASSERT(second.next_scheduled_at == std::optional<util::TimePoint>(f.clock.now() + seconds(120)),
                "Second retry after 120s");

    return true;
}

bool test_dead_letter_after_max_retries() {
    TEST_HEADER("Dead letter after max retries");

    Fixture f;
    int64_t id = f.manager->enqueue("jobs", "Charge", "{\"amount\":10}", with_max_retries(2));

    CompletionResult result;
    for (int attempt = 0; attempt < 3; ++attempt) {
        auto claimed = f.manager->claim("jobs");
        TEST_ASSERT(claimed && claimed->id == id, "Attempt " + std::to_string(attempt + 1) + " claims the message");
        result = f.manager->complete("jobs", id, false, std::string("card declined"));
        f.clock.advance(minutes(10));
    }

    TEST_ASSERT(result.outcome == CompletionOutcome::DeadLettered, "Third failure dead-letters");
    TEST_ASSERT(result.retry_count == 2, "Dead-lettered with retry count 2");
    TEST_ASSERT(result.dead_letter_id.has_value(), "Dead letter id is returned");
    TEST_ASSERT(!f.manager->find("jobs", id), "No row remains in the active store");
    TEST_ASSERT(!f.manager->claim("jobs"), "Dead-lettered message is never claimed again");

    auto dead = f.manager->dead_letters("jobs");
    TEST_ASSERT(dead.size() == 1, "One dead letter record");
    TEST_ASSERT(dead[0].message.id == id, "Record keeps the original id");
    TEST_ASSERT(dead[0].message.retry_count == 2, "Record keeps retry count");
    TEST_ASSERT(dead[0].message.body == "{\"amount\":10}", "Record keeps body");
    TEST_ASSERT(dead[0].message.last_error == std::optional<std::string>("card declined"), "Record keeps last error");
    TEST_ASSERT(dead[0].reason == DEAD_LETTER_REASON, "Record has dead letter reason");
    TEST_ASSERT(dead[0].message.status == MessageStatus::DeadLettered, "Record status is dead_lettered");

    TEST_THROWS(f.manager->complete("jobs", id, true), InvalidStateError, "Completing a dead-lettered id is rejected");

    return true;
}

bool test_end_to_end_email_scenario() {
    TEST_HEADER("End-to-end email scenario");

    Fixture f;
    int64_t id = f.manager->enqueue("q", "Email", "{\"to\":\"ops@example.com\"}", with_max_retries(1));
    TEST_ASSERT(id == 1, "First message gets id 1");

    auto claimed = f.manager->claim("q");
    TEST_ASSERT(claimed && claimed->id == 1 && claimed->status == MessageStatus::Processing,
                "Claim returns id 1 in processing");

    auto retry = f.manager->complete("q", 1, false, std::string("smtp down"));
    auto pending = f.manager->find("q", 1);
    TEST_ASSERT(retry.outcome == CompletionOutcome::Retried, "First failure retries");
    TEST_ASSERT(pending->status == MessageStatus::Pending && pending->retry_count == 1,
                "Pending again with retry count 1");
    TEST_ASSERT(pending->scheduled_at == f.clock.now() + f.manager->retry_policy().backoff(1),
                "scheduled_at is now + backoff(1)");

    f.clock.advance(f.manager->retry_policy().backoff(1));
    auto again = f.manager->claim("q");
    TEST_ASSERT(again && again->id == 1, "Claimed again after the delay");

    auto dead = f.manager->complete("q", 1, false, std::string("smtp down"));
    TEST_ASSERT(dead.outcome == CompletionOutcome::DeadLettered, "Second failure dead-letters");
    TEST_ASSERT(!f.manager->find("q", 1), "Absent from the active store");
    TEST_ASSERT(f.manager->dead_letters("q").size() == 1, "Present in dead letters");

    return true;
}

bool test_stats() {
    TEST_HEADER("Stats");

    Fixture f;
    auto start = f.clock.now();

    int64_t a = f.manager->enqueue("s", "T", "a");
    int64_t b = f.manager->enqueue("s", "T", "b");
    f.clock.advance(seconds(10));
    f.manager->enqueue("s", "T", "c");
    f.manager->enqueue("s", "T", "d", with_max_retries(0));

    // a: processed in 2s, b: processed in 4s
    f.manager->claim("s");
    f.clock.advance(seconds(2));
    f.manager->complete("s", a, true);
    f.manager->claim("s");
    f.clock.advance(seconds(4));
    f.manager->complete("s", b, true);

    // c stays processing, d is dead-lettered
    auto c = f.manager->claim("s");
    auto d = f.manager->claim("s");
    f.manager->complete("s", d->id, false, std::string("bad input"));

    f.manager->enqueue("s", "T", "e");
    f.clock.advance(seconds(5));

    auto stats = f.manager->stats("s");
    TEST_ASSERT(stats.queue_name == "s", "Stats name the queue");
    TEST_ASSERT(stats.pending_count == 1, "One pending");
    TEST_ASSERT(stats.processing_count == 1 && c.has_value(), "One processing");
    TEST_ASSERT(stats.completed_count == 2, "Two completed");
    TEST_ASSERT(stats.dead_lettered_count == 1, "One dead-lettered");
    TEST_ASSERT(stats.oldest_pending_age_seconds == 5.0, "Oldest pending age is 5s");
    TEST_ASSERT(stats.window_minutes == 60, "Default window is the configured 60 minutes");
    TEST_ASSERT(stats.completed_in_window == 2, "Two completions in window");
    TEST_ASSERT(stats.throughput_per_minute == 2.0 / 60.0, "Throughput is completions per minute");
    TEST_ASSERT(stats.avg_processing_seconds == 3.0, "Average processing time is 3s");
    TEST_ASSERT(stats.p50_processing_seconds == 3.0, "Median processing time is 3s");
    TEST_ASSERT(stats.avg_latency_seconds == (12.0 + 16.0) / 2.0, "Average latency from creation to completion");

    f.clock.set(start + minutes(90));
    auto later = f.manager->stats("s", minutes(15));
    TEST_ASSERT(later.completed_in_window == 0, "Completions age out of the window");
    TEST_ASSERT(later.throughput_per_minute == 0.0, "Throughput drops to 0");
    TEST_ASSERT(later.completed_count == 2, "Status counts are not windowed");

    auto empty = f.manager->stats("nothing-here");
    TEST_ASSERT(empty.pending_count == 0 && empty.oldest_pending_age_seconds == 0.0, "Unknown queue has empty stats");

    TEST_THROWS(f.manager->stats("s", minutes(0)), ValidationError, "Zero-minute window is rejected");

    return true;
}

bool test_stats_follow_every_transition() {
    TEST_HEADER("Stats follow every transition");

    Fixture f;
    auto start = f.clock.now();

    int64_t first = f.manager->enqueue("t", "T", "first");
    f.clock.advance(seconds(10));
    f.manager->enqueue("t", "T", "second");

    f.manager->claim("t");
    auto stats = f.manager->stats("t");
    TEST_ASSERT(stats.pending_count == 1 && stats.processing_count == 1, "Claim moves one message to processing");
    TEST_ASSERT(stats.oldest_pending_age_seconds == 0.0, "Oldest pending is now the second message");

    f.clock.advance(seconds(5));
    f.manager->complete("t", first, false, std::string("transient"));
    stats = f.manager->stats("t");
    TEST_ASSERT(stats.pending_count == 2 && stats.processing_count == 0, "Retry returns the message to pending");
    TEST_ASSERT(stats.oldest_pending_age_seconds == 15.0, "Retried message is the oldest pending again");

    f.clock.advance(minutes(5));
    f.manager->claim("t");
    f.manager->claim("t");
    f.clock.advance(minutes(10));
    TEST_ASSERT(f.manager->reclaim_stale("t", minutes(5)) == 2, "Both claims reclaimed");
    stats = f.manager->stats("t");
    TEST_ASSERT(stats.pending_count == 2 && stats.processing_count == 0, "Reclaim returns claims to pending");

    // Old completions stay counted but leave the window
    for (int i = 0; i < 50; ++i) {
        int64_t id = f.manager->enqueue("t", "T", "bulk", with_priority(9));
        f.manager->claim("t");
        f.manager->complete("t", id, true);
    }
    f.clock.set(start + minutes(180));
    int64_t recent = f.manager->enqueue("t", "T", "recent", with_priority(9));
    f.manager->claim("t");
    f.clock.advance(seconds(3));
    f.manager->complete("t", recent, true);

    stats = f.manager->stats("t");
    TEST_ASSERT(stats.completed_count == 51, "All completions counted");
    TEST_ASSERT(stats.completed_in_window == 1, "Only the recent completion is in the window");
    TEST_ASSERT(stats.avg_processing_seconds == 3.0, "Window aggregates use only recent completions");
    TEST_ASSERT(stats.pending_count == 2, "Earlier pending messages untouched");

    return true;
}

bool test_requeue_dead_letter() {
    TEST_HEADER("Requeue dead letter");

    Fixture f;
    EnqueueOptions options;
    options.max_retries = 0;
    options.priority = 8;
    options.correlation_id = "invoice-12";
    int64_t id = f.manager->enqueue("billing", "Invoice", "{\"n\":12}", options);
    f.manager->claim("billing");
    auto result = f.manager->complete("billing", id, false, std::string("pdf renderer crashed"));
    TEST_ASSERT(result.outcome == CompletionOutcome::DeadLettered, "max_retries=0 dead-letters immediately");

    int64_t new_id = f.manager->requeue_dead_letter("billing", *result.dead_letter_id);
    TEST_ASSERT(new_id != id, "Requeue creates a new message");

    auto requeued = f.manager->find("billing", new_id);
    TEST_ASSERT(requeued->status == MessageStatus::Pending, "Requeued message is pending");
    TEST_ASSERT(requeued->retry_count == 0, "Requeued message has a fresh retry budget");
    TEST_ASSERT(requeued->priority == 8, "Priority is carried over");
    TEST_ASSERT(requeued->correlation_id == std::optional<std::string>("invoice-12"), "Correlation id is carried over");
    TEST_ASSERT(requeued->body == "{\"n\":12}", "Body is carried over");
    TEST_ASSERT(!requeued->last_error, "Last error is not carried over");

    TEST_ASSERT(f.manager->dead_letters("billing").size() == 1, "Archive record is untouched");

    TEST_THROWS(f.manager->requeue_dead_letter("billing", 424242), InvalidStateError, "Unknown dead letter id is rejected");
    TEST_THROWS(f.manager->requeue_dead_letter("other", *result.dead_letter_id), InvalidStateError,
                "Dead letter ids are scoped to their queue");

    return true;
}

bool test_dead_letters_newest_first_and_limit() {
    TEST_HEADER("Dead letter listing");

    Fixture f;
    std::vector<int64_t> ids;
    for (int i = 0; i < 3; ++i) {
        int64_t id = f.manager->enqueue("dl", "T", "m" + std::to_string(i), with_max_retries(0));
        f.manager->claim("dl");
        f.manager->complete("dl", id, false, std::string("boom"));
        f.clock.advance(seconds(1));
        ids.push_back(id);
    }

    auto all = f.manager->dead_letters("dl");
    TEST_ASSERT(all.size() == 3, "All records listed");
    TEST_ASSERT(all[0].message.id == ids[2] && all[2].message.id == ids[0], "Newest first");

    auto limited = f.manager->dead_letters("dl", 2);
    TEST_ASSERT(limited.size() == 2 && limited[0].message.id == ids[2], "Limit keeps the newest");

    return true;
}

bool test_reclaim_stale() {
    TEST_HEADER("Reclaim stale claims");

    Fixture f;
    int64_t stale = f.manager->enqueue("r", "T", "stale");
    int64_t last_chance = f.manager->enqueue("r", "T", "last", with_max_retries(0));
    f.manager->claim("r");
    f.manager->claim("r");

    f.clock.advance(minutes(10));
    int64_t fresh = f.manager->enqueue("r", "T", "fresh");
    f.manager->claim("r");

    TEST_ASSERT(f.manager->reclaim_stale("r", minutes(20)) == 0, "Nothing older than 20 minutes");

    size_t reclaimed = f.manager->reclaim_stale("r", minutes(5));
    TEST_ASSERT(reclaimed == 2, "Two claims older than 5 minutes are reclaimed");

    auto retried = f.manager->find("r", stale);
    TEST_ASSERT(retried->status == MessageStatus::Pending, "Reclaimed message is pending");
    TEST_ASSERT(retried->retry_count == 1, "Reclaim counts as a failed attempt");
    TEST_ASSERT(retried->last_error == std::optional<std::string>(QueueManager::STALE_CLAIM_ERROR),
                "Reclaim records the lease error");

    TEST_ASSERT(!f.manager->find("r", last_chance), "Reclaim with no retries left dead-letters");
    TEST_ASSERT(f.manager->find("r", fresh)->status == MessageStatus::Processing, "Recent claim is untouched");

    TEST_THROWS(f.manager->complete("r", stale, true), InvalidStateError,
                "The original claimant can no longer complete a reclaimed message");

    return true;
}

int main() {
    spdlog::set_level(spdlog::level::off);

    bool all_passed = true;
    all_passed &= test_enqueue_defaults();
    all_passed &= test_enqueue_validation();
    all_passed &= test_text_fields_must_be_storable();
    all_passed &= test_claim_priority_order();
    all_passed &= test_claim_fifo_within_priority();
    all_passed &= test_claim_state_and_claimant();
    all_passed &= test_claim_respects_schedule();
    all_passed &= test_claim_type_filter_and_queue_isolation();
    all_passed &= test_complete_success_and_double_completion();
    all_passed &= test_retry_backoff_schedule();
    all_passed &= test_dead_letter_after_max_retries();
    all_passed &= test_end_to_end_email_scenario();
    all_passed &= test_stats();
    all_passed &= test_stats_follow_every_transition();
    all_passed &= test_requeue_dead_letter();
    all_passed &= test_dead_letters_newest_first_and_limit();
    all_passed &= test_reclaim_stale();

    return workq::test::finish("QUEUE MANAGER", all_passed);
}
