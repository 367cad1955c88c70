#pragma once

#include <string>
#include <vector>
#include <cstdlib>
#include <cstring>

namespace workq {

// Helper function to get boolean from environment
inline bool get_env_bool(const char* name, bool default_value) {
    const char* value = std::getenv(name);
    if (!value) return default_value;
    return std::strcmp(value, "true") == 0 || std::strcmp(value, "1") == 0;
}

// Helper function to get int from environment
inline int get_env_int(const char* name, int default_value) {
    const char* value = std::getenv(name);
    return value ? std::atoi(value) : default_value;
}

// Helper function to get double from environment
inline double get_env_double(const char* name, double default_value) {
    const char* value = std::getenv(name);
    return value ? std::atof(value) : default_value;
}

// Helper function to get string from environment
inline std::string get_env_string(const char* name, const std::string& default_value) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : default_value;
}

struct DatabaseConfig {
    // Connection settings
    std::string user = "postgres";
    std::string host = "localhost";
    std::string database = "postgres";
    std::string password = "postgres";
    std::string port = "5432";

    // SSL configuration
    bool use_ssl = false;

    // Pool configuration
    int pool_size = 10;
    int idle_timeout = 30000;             // 30 seconds
    int connection_timeout = 2000;        // 2 seconds
    int statement_timeout = 30000;        // 30 seconds
    int lock_timeout = 10000;             // 10 seconds
    int pool_acquisition_timeout = 10000; // 10 seconds - timeout for acquiring connection from pool

    static DatabaseConfig from_env() {
        DatabaseConfig config;
        config.user = get_env_string("PG_USER", "postgres");
        config.host = get_env_string("PG_HOST", "localhost");
        config.database = get_env_string("PG_DB", "postgres");
        config.password = get_env_string("PG_PASSWORD", "postgres");
        config.port = get_env_string("PG_PORT", "5432");

        config.use_ssl = get_env_bool("PG_USE_SSL", false);

        config.pool_size = get_env_int("DB_POOL_SIZE", 10);
        config.idle_timeout = get_env_int("DB_IDLE_TIMEOUT", 30000);
        config.connection_timeout = get_env_int("DB_CONNECTION_TIMEOUT", 2000);
        config.statement_timeout = get_env_int("DB_STATEMENT_TIMEOUT", 30000);
        config.lock_timeout = get_env_int("DB_LOCK_TIMEOUT", 10000);
        config.pool_acquisition_timeout = get_env_int("DB_POOL_ACQUISITION_TIMEOUT", 10000);

        return config;
    }

    std::string connection_string() const {
        std::string conn_str = "host=" + host + " port=" + port + " dbname=" + database +
                               " user=" + user + " password=" + password;

        conn_str += use_ssl ? " sslmode=require" : " sslmode=disable";

        // connect_timeout is in seconds and is the only timeout that belongs in the
        // connection string; the session timeouts are applied with SET on connect
        int connect_timeout_s = connection_timeout / 1000;
        if (connect_timeout_s < 1) connect_timeout_s = 1;
        conn_str += " connect_timeout=" + std::to_string(connect_timeout_s);

        return conn_str;
    }
};

struct QueueConfig {
    // Enqueue defaults
    int default_priority = 5;            // mid-range, higher claims first
    int default_max_retries = 3;

    // Retry backoff: base * 2^(n-1) seconds, optionally capped (0 = no cap)
    int backoff_base_seconds = 60;
    int backoff_max_seconds = 0;

    // Stats trailing window
    int stats_window_minutes = 60;

    // Claimant identity used when the caller does not supply one
    std::string worker_id = "workq-worker-1";

    static QueueConfig from_env() {
        QueueConfig config;
        config.default_priority = get_env_int("WORKQ_DEFAULT_PRIORITY", 5);
        config.default_max_retries = get_env_int("WORKQ_DEFAULT_MAX_RETRIES", 3);
        config.backoff_base_seconds = get_env_int("WORKQ_BACKOFF_BASE_SECONDS", 60);
        config.backoff_max_seconds = get_env_int("WORKQ_BACKOFF_MAX_SECONDS", 0);
        config.stats_window_minutes = get_env_int("WORKQ_STATS_WINDOW_MINUTES", 60);
        config.worker_id = get_env_string("WORKER_ID", "workq-worker-1");
        return config;
    }
};

struct WorkerConfig {
    int concurrency = 1;                 // Consumer threads per Worker
    int poll_interval_ms = 100;          // Base interval between claims when the queue is empty
    int backoff_threshold = 1;           // Consecutive empty claims before backoff starts
    double backoff_multiplier = 2.0;     // Exponential backoff multiplier
    int max_poll_interval_ms = 2000;     // Maximum poll interval after backoff

    static WorkerConfig from_env() {
        WorkerConfig config;
        config.concurrency = get_env_int("WORKQ_WORKER_CONCURRENCY", 1);
        config.poll_interval_ms = get_env_int("WORKQ_POLL_INTERVAL_MS", 100);
        config.backoff_threshold = get_env_int("WORKQ_BACKOFF_THRESHOLD", 1);
        config.backoff_multiplier = get_env_double("WORKQ_BACKOFF_MULTIPLIER", 2.0);
        config.max_poll_interval_ms = get_env_int("WORKQ_MAX_POLL_INTERVAL_MS", 2000);
        return config;
    }
};

struct LoggingConfig {
    std::string log_level = "info";
    std::string log_pattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] %v";

    static LoggingConfig from_env() {
        LoggingConfig config;
        config.log_level = get_env_string("LOG_LEVEL", "info");
        config.log_pattern = get_env_string("LOG_PATTERN", "[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        return config;
    }
};

struct Config {
    DatabaseConfig database;
    QueueConfig queue;
    WorkerConfig worker;
    LoggingConfig logging;

    static Config from_env() {
        Config config;
        config.database = DatabaseConfig::from_env();
        config.queue = QueueConfig::from_env();
        config.worker = WorkerConfig::from_env();
        config.logging = LoggingConfig::from_env();
        return config;
    }

    static Config load() {
        return from_env();
    }
};

} // namespace workq
