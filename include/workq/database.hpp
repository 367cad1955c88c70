#pragma once

#include <libpq-fe.h>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <vector>

namespace workq {

class DatabaseConnection {
private:
    PGconn* conn_;
    bool in_transaction_;

public:
    // Connects and applies the session timeouts; throws StorageError on failure
    DatabaseConnection(const std::string& connection_string,
                       int statement_timeout_ms,
                       int lock_timeout_ms,
                       int idle_in_transaction_timeout_ms);
    ~DatabaseConnection();

    // Non-copyable, movable
    DatabaseConnection(const DatabaseConnection&) = delete;
    DatabaseConnection& operator=(const DatabaseConnection&) = delete;
    DatabaseConnection(DatabaseConnection&& other) noexcept;
    DatabaseConnection& operator=(DatabaseConnection&& other) noexcept;

    bool is_valid() const;
    bool in_transaction() const { return in_transaction_; }

    PGresult* exec(const std::string& query);
    PGresult* exec_params(const std::string& query, const std::vector<std::string>& params);

    std::string last_error() const;

    // Transaction support
    bool begin_transaction();
    bool commit_transaction();
    bool rollback_transaction();
};

class DatabasePool {
private:
    std::queue<std::unique_ptr<DatabaseConnection>> available_connections_;
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::string connection_string_;
    size_t pool_size_;
    size_t current_size_;
    int acquisition_timeout_ms_;
    int statement_timeout_ms_;
    int lock_timeout_ms_;
    int idle_in_transaction_timeout_ms_;

    std::unique_ptr<DatabaseConnection> create_connection();

public:
    DatabasePool(const std::string& connection_string,
                 size_t pool_size = 10,
                 int acquisition_timeout_ms = 10000,
                 int statement_timeout_ms = 30000,
                 int lock_timeout_ms = 10000,
                 int idle_in_transaction_timeout_ms = 30000);
    ~DatabasePool();

    DatabasePool(const DatabasePool&) = delete;
    DatabasePool& operator=(const DatabasePool&) = delete;

    // Waits up to acquisition_timeout_ms; throws StorageError if all pool_size
    // connections stay in use
    std::unique_ptr<DatabaseConnection> get_connection();
    void return_connection(std::unique_ptr<DatabaseConnection> conn);

    // Open connections, never more than pool_size
    size_t size() const;
    size_t available() const;
};

// RAII connection wrapper
class ScopedConnection {
private:
    DatabasePool* pool_;
    std::unique_ptr<DatabaseConnection> conn_;

public:
    explicit ScopedConnection(DatabasePool* pool);
    ~ScopedConnection();

    ScopedConnection(const ScopedConnection&) = delete;
    ScopedConnection& operator=(const ScopedConnection&) = delete;

    DatabaseConnection* operator->() { return conn_.get(); }
    DatabaseConnection& operator*() { return *conn_; }
};

// Result wrapper for easier handling
class QueryResult {
private:
    PGresult* result_;

public:
    explicit QueryResult(PGresult* result) : result_(result) {}
    ~QueryResult() { if (result_) PQclear(result_); }

    // Non-copyable, movable
    QueryResult(const QueryResult&) = delete;
    QueryResult& operator=(const QueryResult&) = delete;
    QueryResult(QueryResult&& other) noexcept : result_(other.result_) { other.result_ = nullptr; }
    QueryResult& operator=(QueryResult&& other) noexcept {
        if (this != &other) {
            if (result_) PQclear(result_);
            result_ = other.result_;
            other.result_ = nullptr;
        }
        return *this;
    }

    bool is_success() const {
        return result_ && (PQresultStatus(result_) == PGRES_COMMAND_OK ||
                           PQresultStatus(result_) == PGRES_TUPLES_OK);
    }

    int num_rows() const { return result_ ? PQntuples(result_) : 0; }
    int num_fields() const { return result_ ? PQnfields(result_) : 0; }

    std::string get_value(int row, int col) const {
        if (!result_ || row >= num_rows() || col >= num_fields()) return "";
        const char* val = PQgetvalue(result_, row, col);
        return val ? std::string(val) : "";
    }

    std::string get_value(int row, const std::string& field_name) const {
        if (!result_) return "";
        int col = PQfnumber(result_, field_name.c_str());
        if (col == -1) return "";
        return get_value(row, col);
    }

    bool is_null(int row, int col) const {
        return result_ && PQgetisnull(result_, row, col);
    }

    bool is_null(int row, const std::string& field_name) const {
        if (!result_) return true;
        int col = PQfnumber(result_, field_name.c_str());
        return col == -1 || PQgetisnull(result_, row, col);
    }

    std::string error_message() const {
        return result_ ? PQresultErrorMessage(result_) : "No result";
    }

    // Throws StorageError unless the statement succeeded
    void expect_success(const std::string& context) const;
};

} // namespace workq
