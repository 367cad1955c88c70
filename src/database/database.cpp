#include "workq/database.hpp"
#include "workq/errors.hpp"
#include <spdlog/spdlog.h>
#include <chrono>

namespace workq {

// DatabaseConnection Implementation
DatabaseConnection::DatabaseConnection(const std::string& connection_string,
                                       int statement_timeout_ms,
                                       int lock_timeout_ms,
                                       int idle_in_transaction_timeout_ms)
    : conn_(nullptr), in_transaction_(false) {
    conn_ = PQconnectdb(connection_string.c_str());

    if (PQstatus(conn_) != CONNECTION_OK) {
        std::string error = PQerrorMessage(conn_);
        PQfinish(conn_);
        conn_ = nullptr;
        throw StorageError("Failed to connect to database: " + error);
    }

    PQsetClientEncoding(conn_, "UTF8");

    // Session timeouts go through SET so they also work behind PgBouncer
    std::string set_timeouts =
        "SET statement_timeout = " + std::to_string(statement_timeout_ms) + "; " +
        "SET lock_timeout = " + std::to_string(lock_timeout_ms) + "; " +
        "SET idle_in_transaction_session_timeout = " + std::to_string(idle_in_transaction_timeout_ms) + ";";

    PGresult* result = PQexec(conn_, set_timeouts.c_str());
    if (PQresultStatus(result) != PGRES_COMMAND_OK) {
        std::string error = PQerrorMessage(conn_);
        PQclear(result);
        PQfinish(conn_);
        conn_ = nullptr;
        throw StorageError("Failed to set timeout parameters: " + error);
    }
    PQclear(result);
}

DatabaseConnection::~DatabaseConnection() {
    if (conn_) {
        PQfinish(conn_);
    }
}

DatabaseConnection::DatabaseConnection(DatabaseConnection&& other) noexcept
    : conn_(other.conn_), in_transaction_(other.in_transaction_) {
    other.conn_ = nullptr;
    other.in_transaction_ = false;
}

DatabaseConnection& DatabaseConnection::operator=(DatabaseConnection&& other) noexcept {
    if (this != &other) {
        if (conn_) PQfinish(conn_);
        conn_ = other.conn_;
        in_transaction_ = other.in_transaction_;
        other.conn_ = nullptr;
            other.in_transaction_ = false;
    }
    return *this;
}

bool DatabaseConnection::is_valid() const {
    return conn_ && PQstatus(conn_) == CONNECTION_OK;
}

PGresult* DatabaseConnection::exec(const std::string& query) {
    if (!is_valid()) return nullptr;
    return PQexec(conn_, query.c_str());
}

PGresult* DatabaseConnection::exec_params(const std::string& query, const std::vector<std::string>& params) {
    if (!is_valid()) return nullptr;

    std::vector<const char*> param_values;
    param_values.reserve(params.size());

    for (const auto& param : params) {
        param_values.push_back(param.c_str());
    }

    return PQexecParams(conn_, query.c_str(), static_cast<int>(params.size()),
                        nullptr, param_values.data(), nullptr, nullptr, 0);
}

std::string DatabaseConnection::last_error() const {
    return conn_ ? PQerrorMessage(conn_) : "No connection";
}

bool DatabaseConnection::begin_transaction() {
    auto result = QueryResult(exec("BEGIN"));
    in_transaction_ = result.is_success();
    return in_transaction_;
}

bool DatabaseConnection::commit_transaction() {
    auto result = QueryResult(exec("COMMIT"));
    in_transaction_ = false;
    return result.is_success();
}

bool DatabaseConnection::rollback_transaction() {
    auto result = QueryResult(exec("ROLLBACK"));
    in_transaction_ = false;
    return result.is_success();
}

// DatabasePool Implementation
DatabasePool::DatabasePool(const std::string& connection_string,
                           size_t pool_size,
                           int acquisition_timeout_ms,
                           int statement_timeout_ms,
                           int lock_timeout_ms,
                           int idle_in_transaction_timeout_ms)
    : available_connections_(), mutex_(), condition_(),
      connection_string_(connection_string),
      pool_size_(pool_size),
      current_size_(0),
      acquisition_timeout_ms_(acquisition_timeout_ms),
      statement_timeout_ms_(statement_timeout_ms),
      lock_timeout_ms_(lock_timeout_ms),
      idle_in_transaction_timeout_ms_(idle_in_transaction_timeout_ms) {

    // Pre-populate the pool
    for (size_t i = 0; i < pool_size_; ++i) {
        try {
            auto conn = create_connection();
            if (conn && conn->is_valid()) {
                available_connections_.push(std::move(conn));
                ++current_size_;
            }
        } catch (const StorageError& e) {
            spdlog::error("Failed to create initial database connection: {}", e.what());
        }
    }

    if (current_size_ == 0) {
        throw StorageError("Failed to create any database connections");
    }

    spdlog::info("Database pool initialized with {}/{} connections (acquisition timeout: {}ms, statement timeout: {}ms)",
                 current_size_, pool_size_, acquisition_timeout_ms_, statement_timeout_ms_);
}

DatabasePool::~DatabasePool() {
    std::lock_guard<std::mutex> lock(mutex_);
    while (!available_connections_.empty()) {
        available_connections_.pop();
    }
}

std::unique_ptr<DatabaseConnection> DatabasePool::create_connection() {
    return std::make_unique<DatabaseConnection>(connection_string_,
                                                statement_timeout_ms_,
                                                lock_timeout_ms_,
                                                idle_in_transaction_timeout_ms_);
}

std::unique_ptr<DatabaseConnection> DatabasePool::get_connection() {
    std::unique_lock<std::mutex> lock(mutex_);

    // Wait for available connection or timeout
    if (!condition_.wait_for(lock, std::chrono::milliseconds(acquisition_timeout_ms_),
                             [this] { return !available_connections_.empty(); })) {

        if (current_size_ >= pool_size_) {
            spdlog::warn("Pool exhausted after {}ms (pool: {}/{})",
                         acquisition_timeout_ms_, current_size_, pool_size_);
            throw StorageError("Database connection pool timeout (waited " +
                               std::to_string(acquisition_timeout_ms_) + "ms, all " +
                               std::to_string(pool_size_) + " connections in use)");
        }

        // Connections were lost earlier: refill one slot so the pool recovers
        // once PostgreSQL is reachable again. The slot is reserved before unlocking.
        ++current_size_;
        spdlog::warn("Pool timeout - refilling a lost connection (pool: {}/{})", current_size_, pool_size_);

        lock.unlock();
        std::unique_ptr<DatabaseConnection> new_conn;
        try {
            new_conn = create_connection();
        } catch (const StorageError& e) {
            spdlog::error("Failed to create connection on timeout: {}", e.what());
            lock.lock();
            --current_size_;
            throw StorageError("Database connection pool timeout (waited " +
                               std::to_string(acquisition_timeout_ms_) + "ms): " + e.what());
        }

        return new_conn;
    }

    auto conn = std::move(available_connections_.front());
    available_connections_.pop();

    if (!conn->is_valid()) {
        spdlog::warn("Invalid connection found in pool, replacing it");

        lock.unlock();
        std::unique_ptr<DatabaseConnection> new_conn;
        try {
            new_conn = create_connection();
        } catch (const StorageError& e) {
            spdlog::error("Failed to create replacement connection: {}", e.what());
            lock.lock();
            --current_size_;
            throw;
        }

        return new_conn;
    }

    return conn;
}

void DatabasePool::return_connection(std::unique_ptr<DatabaseConnection> conn) {
    if (!conn) return;

    // A transaction left open by an exception must not leak into the next borrower
    if (conn->in_transaction() && conn->is_valid()) {
        spdlog::warn("Connection returned with an open transaction, rolling back");
        if (!conn->rollback_transaction()) {
            spdlog::error("Rollback on return failed: {}", conn->last_error());
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (conn->is_valid()) {
        available_connections_.push(std::move(conn));
        condition_.notify_one();
        return;
    }

    spdlog::warn("Returned invalid connection to pool, attempting to create replacement");
    --current_size_;

    try {
        auto new_conn = create_connection();
        available_connections_.push(std::move(new_conn));
        ++current_size_;
        spdlog::info("Successfully replaced invalid connection, pool at {}/{}", current_size_, pool_size_);
    } catch (const StorageError& e) {
        spdlog::error("Exception creating replacement connection: {} - pool size now {}/{}",
                      e.what(), current_size_, pool_size_);
    }
    condition_.notify_one();
}

size_t DatabasePool::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_size_;
}

size_t DatabasePool::available() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return available_connections_.size();
}

// ScopedConnection Implementation
ScopedConnection::ScopedConnection(DatabasePool* pool) : pool_(pool) {
    if (!pool_) {
        throw std::invalid_argument("Database pool cannot be null");
    }
    conn_ = pool_->get_connection();
}

ScopedConnection::~ScopedConnection() {
    if (pool_ && conn_) {
        pool_->return_connection(std::move(conn_));
    }
}

// QueryResult Implementation
void QueryResult::expect_success(const std::string& context) const {
    if (!is_success()) {
        throw StorageError(context + ": " + error_message());
    }
}

} // namespace workq
