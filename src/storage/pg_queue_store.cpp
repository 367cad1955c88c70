#include "workq/pg_queue_store.hpp"
#include "workq/errors.hpp"
#include <spdlog/spdlog.h>

namespace workq {

namespace {

// Timestamps cross the wire as integer microseconds since the Unix epoch,
// which round-trips exactly through TIMESTAMPTZ
std::string ts_param(int index) {
    return "(TIMESTAMPTZ 'epoch' + $" + std::to_string(index) + "::bigint * INTERVAL '1 microsecond')";
}

std::string micros(util::TimePoint tp) {
    return std::to_string(util::to_unix_micros(tp));
}

// Column list understood by parse_message(); alias qualifies every column
std::string message_columns(const std::string& alias) {
    const std::string a = alias.empty() ? "" : alias + ".";
    return a + "id, " + a + "queue_name, " + a + "message_type, " + a + "body, " + a + "priority, " +
           a + "status, " + a + "correlation_id, " + a + "retry_count, " + a + "max_retries, " +
           "(EXTRACT(EPOCH FROM " + a + "created_at) * 1000000)::bigint AS created_at_us, " +
           "(EXTRACT(EPOCH FROM " + a + "scheduled_at) * 1000000)::bigint AS scheduled_at_us, " +
           "(EXTRACT(EPOCH FROM " + a + "claim_started_at) * 1000000)::bigint AS claim_started_at_us, " +
           "(EXTRACT(EPOCH FROM " + a + "claim_ended_at) * 1000000)::bigint AS claim_ended_at_us, " +
           a + "claimant_id, " + a + "last_error";
}

const char* DEAD_LETTER_COLUMNS = R"(
    dead_letter_id, original_message_id AS id, queue_name, message_type, body, priority,
    'dead_lettered' AS status, correlation_id, retry_count, max_retries,
    (EXTRACT(EPOCH FROM original_created_at) * 1000000)::bigint AS created_at_us,
    (EXTRACT(EPOCH FROM scheduled_at) * 1000000)::bigint AS scheduled_at_us,
    (EXTRACT(EPOCH FROM claim_started_at) * 1000000)::bigint AS claim_started_at_us,
    (EXTRACT(EPOCH FROM claim_ended_at) * 1000000)::bigint AS claim_ended_at_us,
    claimant_id, last_error, reason,
    (EXTRACT(EPOCH FROM dead_lettered_at) * 1000000)::bigint AS dead_lettered_at_us
)";

std::optional<std::string> optional_text(const QueryResult& result, int row, const std::string& field) {
    if (result.is_null(row, field)) return std::nullopt;
    return result.get_value(row, field);
}

std::optional<util::TimePoint> optional_time(const QueryResult& result, int row, const std::string& field) {
    if (result.is_null(row, field)) return std::nullopt;
    return util::from_unix_micros(std::stoll(result.get_value(row, field)));
}

double optional_double(const QueryResult& result, int row, const std::string& field) {
    if (result.is_null(row, field)) return 0.0;
    return std::stod(result.get_value(row, field));
}

Message parse_message(const QueryResult& result, int row) {
    try {
        Message message;
        message.id = std::stoll(result.get_value(row, "id"));
        message.queue_name = result.get_value(row, "queue_name");
        message.type = result.get_value(row, "message_type");
        message.body = result.get_value(row, "body");
        message.priority = std::stoi(result.get_value(row, "priority"));
        message.status = status_from_string(result.get_value(row, "status"));
        message.correlation_id = optional_text(result, row, "correlation_id");
        message.retry_count = std::stoi(result.get_value(row, "retry_count"));
        message.max_retries = std::stoi(result.get_value(row, "max_retries"));
        message.created_at = util::from_unix_micros(std::stoll(result.get_value(row, "created_at_us")));
        message.scheduled_at = util::from_unix_micros(std::stoll(result.get_value(row, "scheduled_at_us")));
        message.claim_started_at = optional_time(result, row, "claim_started_at_us");
        message.claim_ended_at = optional_time(result, row, "claim_ended_at_us");
        message.claimant_id = optional_text(result, row, "claimant_id");
        message.last_error = optional_text(result, row, "last_error");
        return message;
    } catch (const std::logic_error& e) {
        // std::stoll / std::stoi on a malformed column
        throw StorageError(std::string("Malformed message row: ") + e.what());
    }
}

DeadLetterRecord parse_dead_letter(const QueryResult& result, int row) {
    DeadLetterRecord record;
    record.message = parse_message(result, row);
    try {
        record.dead_letter_id = std::stoll(result.get_value(row, "dead_letter_id"));
        record.dead_lettered_at = util::from_unix_micros(std::stoll(result.get_value(row, "dead_lettered_at_us")));
    } catch (const std::logic_error& e) {
        throw StorageError(std::string("Malformed dead letter row: ") + e.what());
    }
    record.reason = result.get_value(row, "reason");
    return record;
}

} // namespace

PgQueueStore::PgQueueStore(std::shared_ptr<DatabasePool> db_pool)
    : db_pool_(std::move(db_pool)) {
    if (!db_pool_) {
        throw std::invalid_argument("Database pool cannot be null");
    }
}

std::shared_ptr<DatabasePool> PgQueueStore::make_pool(const DatabaseConfig& config) {
    return std::make_shared<DatabasePool>(config.connection_string(),
                                          static_cast<size_t>(config.pool_size),
                                          config.pool_acquisition_timeout,
                                          config.statement_timeout,
                                          config.lock_timeout,
                                          config.idle_timeout);
}

void PgQueueStore::initialize_schema() {
    ScopedConnection conn(db_pool_.get());

    if (!conn->begin_transaction()) {
        throw StorageError("Failed to begin transaction for schema initialization: " + conn->last_error());
    }

    try {
        // Serialize concurrent initializers across processes
        QueryResult(conn->exec("SELECT pg_advisory_xact_lock(hashtext('workq.schema'))"))
            .expect_success("Failed to take schema lock");

        QueryResult(conn->exec("CREATE SCHEMA IF NOT EXISTS workq"))
            .expect_success("Failed to create schema");

        std::string create_tables_sql = R"(
            CREATE TABLE IF NOT EXISTS workq.messages (
                id BIGSERIAL PRIMARY KEY,
                queue_name VARCHAR(128) NOT NULL,
                message_type VARCHAR(255) NOT NULL,
                body TEXT NOT NULL,
                priority INTEGER NOT NULL DEFAULT 5,
                status VARCHAR(20) NOT NULL DEFAULT 'pending'
                    CHECK (status IN ('pending', 'processing', 'completed')),
                correlation_id VARCHAR(255),
                retry_count INTEGER NOT NULL DEFAULT 0,
                max_retries INTEGER NOT NULL DEFAULT 3 CHECK (max_retries >= 0),
                created_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),
                scheduled_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),
                claim_started_at TIMESTAMPTZ,
                claim_ended_at TIMESTAMPTZ,
                claimant_id VARCHAR(255),
                last_error TEXT,
                CHECK (retry_count BETWEEN 0 AND max_retries)
            );

            CREATE INDEX IF NOT EXISTS idx_messages_claim
                ON workq.messages (queue_name, status, priority DESC, scheduled_at);
            CREATE INDEX IF NOT EXISTS idx_messages_correlation
                ON workq.messages (correlation_id) WHERE correlation_id IS NOT NULL;
            CREATE INDEX IF NOT EXISTS idx_messages_completed
                ON workq.messages (queue_name, claim_ended_at) WHERE status = 'completed';

            CREATE TABLE IF NOT EXISTS workq.dead_letters (
                dead_letter_id BIGSERIAL PRIMARY KEY,
                queue_name VARCHAR(128) NOT NULL,
                original_message_id BIGINT NOT NULL,
                message_type VARCHAR(255) NOT NULL,
                body TEXT NOT NULL,
                priority INTEGER NOT NULL,
                correlation_id VARCHAR(255),
                retry_count INTEGER NOT NULL,
                max_retries INTEGER NOT NULL,
                original_created_at TIMESTAMPTZ NOT NULL,
                scheduled_at TIMESTAMPTZ NOT NULL,
                claim_started_at TIMESTAMPTZ,
                claim_ended_at TIMESTAMPTZ,
                claimant_id VARCHAR(255),
                last_error TEXT,
                reason VARCHAR(100) NOT NULL,
                dead_lettered_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
            );

            CREATE INDEX IF NOT EXISTS idx_dead_letters_queue
                ON workq.dead_letters (queue_name, dead_letter_id DESC);

            CREATE OR REPLACE FUNCTION workq.reject_dead_letter_update() RETURNS trigger AS $$
            BEGIN
                RAISE EXCEPTION 'workq.dead_letters is append-only';
            END;
            $$ LANGUAGE plpgsql;

            DROP TRIGGER IF EXISTS trg_dead_letters_append_only ON workq.dead_letters;
            CREATE TRIGGER trg_dead_letters_append_only
                BEFORE UPDATE ON workq.dead_letters
                FOR EACH ROW EXECUTE FUNCTION workq.reject_dead_letter_update();
        )";

        QueryResult(conn->exec(create_tables_sql)).expect_success("Failed to create tables");

        if (!conn->commit_transaction()) {
            throw StorageError("Failed to commit schema initialization: " + conn->last_error());
        }
    } catch (...) {
        if (!conn->rollback_transaction()) {
            spdlog::warn("Rollback failed: {}", conn->last_error());
        }
        throw;
    }

    spdlog::info("Database schema initialized (workq.messages, workq.dead_letters)");
}

bool PgQueueStore::health_check() {
    try {
        ScopedConnection conn(db_pool_.get());
        auto result = QueryResult(conn->exec("SELECT 1"));
        return result.is_success();
    } catch (const StorageError& e) {
        spdlog::error("Health check failed: {}", e.what());
        return false;
    }
}

int64_t PgQueueStore::insert(const QueueName& queue, const NewMessage& message) {
    ScopedConnection conn(db_pool_.get());

    std::string sql = R"(
        INSERT INTO workq.messages (
            queue_name, message_type, body, priority, correlation_id,
            max_retries, created_at, scheduled_at
        ) VALUES ($1, $2, $3, $4::integer, NULLIF($5::text, ''), $6::integer, )" +
        ts_param(7) + ", " + ts_param(8) + R"()
        RETURNING id
    )";

    std::vector<std::string> params = {
        queue.str(),
        message.type,
        message.body,
        std::to_string(message.priority),
        message.correlation_id.value_or(""),
        std::to_string(message.max_retries),
        micros(message.created_at),
        micros(message.scheduled_at)
    };

    auto result = QueryResult(conn->exec_params(sql, params));
    if (!result.is_success() || result.num_rows() != 1) {
        spdlog::error("Failed to insert message into queue {}: {}", queue.str(), result.error_message());
        throw StorageError("Failed to insert message: " + result.error_message());
    }
    return std::stoll(result.get_value(0, "id"));
}

std::optional<Message> PgQueueStore::claim_next(const QueueName& queue,
                                                const std::optional<std::string>& type_filter,
                                                const std::string& claimant_id,
                                                util::TimePoint now) {
    ScopedConnection conn(db_pool_.get());

    // One statement: the subselect locks the best eligible row, skipping rows
    // another claim holds, and the UPDATE moves it to processing. A row that a
    // concurrent claim committed first fails the status recheck and is skipped.
    std::string sql = R"(
        WITH next AS (
            SELECT id
            FROM workq.messages
            WHERE queue_name = $1
              AND status = 'pending'
              AND scheduled_at <= )" + ts_param(2) + R"(
              AND ($3::text = '' OR message_type = $3::text)
            ORDER BY priority DESC, created_at ASC, id ASC
            LIMIT 1
            FOR UPDATE SKIP LOCKED
        )
        UPDATE workq.messages m
        SET status = 'processing',
            claimant_id = $4::varchar,
            claim_started_at = )" + ts_param(2) + R"(,
            claim_ended_at = NULL
        FROM next
        WHERE m.id = next.id
        RETURNING )" + message_columns("m");

    std::vector<std::string> params = {
        queue.str(),
        micros(now),
        type_filter.value_or(""),
        claimant_id
    };

    auto result = QueryResult(conn->exec_params(sql, params));
    if (!result.is_success()) {
        spdlog::error("Claim query failed for queue {}: {}", queue.str(), result.error_message());
        throw StorageError("Claim failed: " + result.error_message());
    }

    if (result.num_rows() == 0) {
        return std::nullopt;
    }
    return parse_message(result, 0);
}

CompletionResult PgQueueStore::apply_completion(DatabaseConnection& conn,
                                                const Message& message,
                                                bool success,
                                                const std::optional<std::string>& error_message,
                                                const RetryPolicy& policy,
                                                util::TimePoint now) {
    auto decision = decide_completion(message, success, policy, now);

    CompletionResult result;
    result.message_id = message.id;
    result.outcome = decision.outcome;
    result.retry_count = decision.retry_count;

    const std::string id = std::to_string(message.id);

    switch (decision.outcome) {
        case CompletionOutcome::Completed: {
            std::string sql = R"(
                UPDATE workq.messages
                SET status = 'completed',
                    claim_ended_at = )" + ts_param(2) + R"(
                WHERE id = $1::bigint
            )";
            QueryResult(conn.exec_params(sql, {id, micros(now)}))
                .expect_success("Failed to mark message completed");
            break;
        }

        case CompletionOutcome::Retried: {
            std::string sql = R"(
                UPDATE workq.messages
                SET status = 'pending',
                    retry_count = $2::integer,
                    claimant_id = NULL,
                    claim_started_at = NULL,
                    last_error = NULLIF($3::text, ''),
                    scheduled_at = )" + ts_param(4) + R"(
                WHERE id = $1::bigint
            )";
            QueryResult(conn.exec_params(sql, {
                id,
                std::to_string(decision.retry_count),
                error_message.value_or(""),
                micros(*decision.next_scheduled_at)
            })).expect_success("Failed to reschedule message");
            result.next_scheduled_at = decision.next_scheduled_at;
            break;
        }

        case CompletionOutcome::DeadLettered: {
            std::string insert_sql = R"(
                INSERT INTO workq.dead_letters (
                    queue_name, original_message_id, message_type, body, priority,
                    correlation_id, retry_count, max_retries, original_created_at,
                    scheduled_at, claim_started_at, claim_ended_at, claimant_id,
                    last_error, reason, dead_lettered_at
                )
                SELECT queue_name, id, message_type, body, priority,
                       correlation_id, retry_count, max_retries, created_at,
                       scheduled_at, claim_started_at, )" + ts_param(2) + R"(, claimant_id,
                       COALESCE(NULLIF($3::text, ''), last_error), $4::varchar, )" + ts_param(2) + R"(
                FROM workq.messages
                WHERE id = $1::bigint
                RETURNING dead_letter_id
            )";
            auto inserted = QueryResult(conn.exec_params(insert_sql, {
                id,
                micros(now),
                error_message.value_or(""),
                DEAD_LETTER_REASON
            }));
            inserted.expect_success("Failed to archive dead letter");
            if (inserted.num_rows() != 1) {
                throw StorageError("Dead letter archive inserted " + std::to_string(inserted.num_rows()) + " rows");
            }
            result.dead_letter_id = std::stoll(inserted.get_value(0, "dead_letter_id"));

            QueryResult(conn.exec_params("DELETE FROM workq.messages WHERE id = $1::bigint", {id}))
                .expect_success("Failed to remove dead-lettered message");
            break;
        }
    }

    return result;
}

CompletionResult PgQueueStore::complete(const QueueName& queue,
                                        int64_t message_id,
                                        bool success,
                                        const std::optional<std::string>& error_message,
                                        const RetryPolicy& policy,
                                        util::TimePoint now) {
    ScopedConnection conn(db_pool_.get());

    if (!conn->begin_transaction()) {
        throw StorageError("Failed to begin transaction: " + conn->last_error());
    }

    try {
        std::string lock_sql = "SELECT " + message_columns("") + R"(
            FROM workq.messages
            WHERE queue_name = $1 AND id = $2::bigint
            FOR UPDATE
        )";

        auto locked = QueryResult(conn->exec_params(lock_sql, {queue.str(), std::to_string(message_id)}));
        locked.expect_success("Failed to lock message");

        if (locked.num_rows() == 0) {
            throw InvalidStateError("Message " + std::to_string(message_id) +
                                    " not found in queue '" + queue.str() + "'");
        }

        auto message = parse_message(locked, 0);
        if (message.status != MessageStatus::Processing) {
            throw InvalidStateError("Message " + std::to_string(message_id) + " is " +
                                    to_string(message.status) + ", not processing");
        }

        auto result = apply_completion(*conn, message, success, error_message, policy, now);

        if (!conn->commit_transaction()) {
            throw StorageError("Failed to commit completion: " + conn->last_error());
        }
        return result;

    } catch (...) {
        if (!conn->rollback_transaction()) {
            spdlog::warn("Rollback failed: {}", conn->last_error());
        }
        throw;
    }
}

size_t PgQueueStore::reclaim_stale(const QueueName& queue,
                                   util::TimePoint cutoff,
                                   const std::string& error_message,
                                   const RetryPolicy& policy,
                                   util::TimePoint now) {
    ScopedConnection conn(db_pool_.get());

    if (!conn->begin_transaction()) {
        throw StorageError("Failed to begin transaction: " + conn->last_error());
    }

    try {
        // Rows a concurrent complete() is holding are left alone
        std::string sql = "SELECT " + message_columns("") + R"(
            FROM workq.messages
            WHERE queue_name = $1
              AND status = 'processing'
              AND claim_started_at <= )" + ts_param(2) + R"(
            ORDER BY id
            FOR UPDATE SKIP LOCKED
        )";

        auto stale = QueryResult(conn->exec_params(sql, {queue.str(), micros(cutoff)}));
        stale.expect_success("Failed to select stale claims");

        for (int row = 0; row < stale.num_rows(); ++row) {
            auto message = parse_message(stale, row);
            auto result = apply_completion(*conn, message, false, error_message, policy, now);
            spdlog::warn("Reclaimed stale claim: queue={}, id={}, claimant={}, outcome={}",
                         queue.str(), message.id, message.claimant_id.value_or(""),
                         to_string(result.outcome));
        }

        if (!conn->commit_transaction()) {
            throw StorageError("Failed to commit reclaim: " + conn->last_error());
        }
        return static_cast<size_t>(stale.num_rows());

    } catch (...) {
        if (!conn->rollback_transaction()) {
            spdlog::warn("Rollback failed: {}", conn->last_error());
        }
        throw;
    }
}

std::optional<Message> PgQueueStore::find(const QueueName& queue, int64_t message_id) {
    ScopedConnection conn(db_pool_.get());

    std::string sql = "SELECT " + message_columns("") +
                      " FROM workq.messages WHERE queue_name = $1 AND id = $2::bigint";

    auto result = QueryResult(conn->exec_params(sql, {queue.str(), std::to_string(message_id)}));
    result.expect_success("Failed to read message");

    if (result.num_rows() == 0) return std::nullopt;
    return parse_message(result, 0);
}

QueueStats PgQueueStore::stats(const QueueName& queue,
                               util::TimePoint now,
                               std::chrono::minutes window) {
    ScopedConnection conn(db_pool_.get());

    // Plain MVCC reads: never blocks claims or completions and is never blocked by them
    std::string sql = R"(
        WITH bounds AS (
            SELECT )" + ts_param(2) + R"( AS now_ts,
                   )" + ts_param(2) + R"( - $3::integer * INTERVAL '1 minute' AS window_start
        ),
        scoped AS (
            SELECT m.*,
                   (m.status = 'completed' AND m.claim_ended_at >= b.window_start) AS in_window,
                   EXTRACT(EPOCH FROM (m.claim_ended_at - m.claim_started_at)) AS processing_s,
                   EXTRACT(EPOCH FROM (m.claim_ended_at - m.created_at)) AS latency_s
            FROM workq.messages m CROSS JOIN bounds b
            WHERE m.queue_name = $1
        )
        SELECT
            COUNT(*) FILTER (WHERE status = 'pending') AS pending_count,
            COUNT(*) FILTER (WHERE status = 'processing') AS processing_count,
            COUNT(*) FILTER (WHERE status = 'completed') AS completed_count,
            (SELECT COUNT(*) FROM workq.dead_letters d WHERE d.queue_name = $1) AS dead_lettered_count,
            GREATEST(0, EXTRACT(EPOCH FROM ((SELECT now_ts FROM bounds)
                - MIN(created_at) FILTER (WHERE status = 'pending')))) AS oldest_pending_age_seconds,
            COUNT(*) FILTER (WHERE in_window) AS completed_in_window,
            AVG(processing_s) FILTER (WHERE in_window) AS avg_processing_seconds,
            percentile_cont(0.5) WITHIN GROUP (ORDER BY processing_s)
                FILTER (WHERE in_window AND processing_s IS NOT NULL) AS p50_processing_seconds,
            percentile_cont(0.95) WITHIN GROUP (ORDER BY processing_s)
                FILTER (WHERE in_window AND processing_s IS NOT NULL) AS p95_processing_seconds,
            AVG(latency_s) FILTER (WHERE in_window) AS avg_latency_seconds
        FROM scoped
    )";

    auto result = QueryResult(conn->exec_params(sql, {
        queue.str(),
        micros(now),
        std::to_string(window.count())
    }));
    result.expect_success("Failed to compute queue stats");

    QueueStats stats;
    stats.queue_name = queue.str();
    stats.window_minutes = static_cast<int>(window.count());

    if (result.num_rows() == 0) {
        return stats;
    }

    try {
        stats.pending_count = std::stoll(result.get_value(0, "pending_count"));
        stats.processing_count = std::stoll(result.get_value(0, "processing_count"));
        stats.completed_count = std::stoll(result.get_value(0, "completed_count"));
        stats.dead_lettered_count = std::stoll(result.get_value(0, "dead_lettered_count"));
        stats.completed_in_window = std::stoll(result.get_value(0, "completed_in_window"));
        stats.oldest_pending_age_seconds = optional_double(result, 0, "oldest_pending_age_seconds");
        stats.avg_processing_seconds = optional_double(result, 0, "avg_processing_seconds");
        stats.p50_processing_seconds = optional_double(result, 0, "p50_processing_seconds");
        stats.p95_processing_seconds = optional_double(result, 0, "p95_processing_seconds");
        stats.avg_latency_seconds = optional_double(result, 0, "avg_latency_seconds");
    } catch (const std::logic_error& e) {
        throw StorageError(std::string("Malformed stats row: ") + e.what());
    }

    if (window.count() > 0) {
        stats.throughput_per_minute =
            static_cast<double>(stats.completed_in_window) / static_cast<double>(window.count());
    }

    return stats;
}

std::vector<DeadLetterRecord> PgQueueStore::dead_letters(const QueueName& queue, size_t limit) {
    ScopedConnection conn(db_pool_.get());

    std::string sql = std::string("SELECT ") + DEAD_LETTER_COLUMNS + R"(
        FROM workq.dead_letters
        WHERE queue_name = $1
        ORDER BY dead_letter_id DESC
        LIMIT $2::bigint
    )";

    auto result = QueryResult(conn->exec_params(sql, {queue.str(), std::to_string(limit)}));
    result.expect_success("Failed to list dead letters");

    std::vector<DeadLetterRecord> records;
    records.reserve(static_cast<size_t>(result.num_rows()));
    for (int row = 0; row < result.num_rows(); ++row) {
        records.push_back(parse_dead_letter(result, row));
    }
    return records;
}

std::optional<DeadLetterRecord> PgQueueStore::find_dead_letter(const QueueName& queue,
                                                               int64_t dead_letter_id) {
    ScopedConnection conn(db_pool_.get());

    std::string sql = std::string("SELECT ") + DEAD_LETTER_COLUMNS + R"(
        FROM workq.dead_letters
        WHERE queue_name = $1 AND dead_letter_id = $2::bigint
    )";

    auto result = QueryResult(conn->exec_params(sql, {queue.str(), std::to_string(dead_letter_id)}));
    result.expect_success("Failed to read dead letter");

    if (result.num_rows() == 0) return std::nullopt;
    return parse_dead_letter(result, 0);
}

} // namespace workq
