#pragma once

#include <libpq-fe.h>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace hive {

struct DatabaseConfig;

// Per-session limits applied with SET after every (re)connect
struct SessionTimeouts {
    int statement_ms = 30000;
    int lock_ms = 10000;
    int idle_in_transaction_ms = 30000;
};

class DatabaseConnection {
public:
    DatabaseConnection(const std::string& connection_string, const SessionTimeouts& timeouts);
    ~DatabaseConnection();

    DatabaseConnection(const DatabaseConnection&) = delete;
    DatabaseConnection& operator=(const DatabaseConnection&) = delete;

    bool is_valid() const;

    // PQreset plus session setup; false if the server is still unreachable
    bool reset();

    PGresult* exec(const std::string& query);
    PGresult* exec_params(const std::string& query, const std::vector<std::string>& params);

    std::string last_error() const;

private:
    bool apply_session_settings(std::string& error);

    PGconn* conn_ = nullptr;
    SessionTimeouts timeouts_;
};

struct PoolStats {
    size_t open = 0;
    size_t idle = 0;
    size_t max_size = 0;
};

/**
 * Bounded libpq connection pool.
 *
 * One connection is opened up front so a bad configuration fails at
 * startup; the rest are opened on demand up to max_size. A caller that
 * finds every connection busy waits up to the acquisition timeout and
 * then gets std::runtime_error. Broken connections are reset once on
 * checkout and dropped when they come back unusable.
 */
class DatabasePool {
public:
    explicit DatabasePool(const DatabaseConfig& config);
    ~DatabasePool() = default;

    DatabasePool(const DatabasePool&) = delete;
    DatabasePool& operator=(const DatabasePool&) = delete;

    std::unique_ptr<DatabaseConnection> acquire();
    void release(std::unique_ptr<DatabaseConnection> conn);

    PoolStats stats() const;

private:
    std::unique_ptr<DatabaseConnection> open_connection();

    std::string connection_string_;
    SessionTimeouts timeouts_;
    size_t max_size_;
    int acquisition_timeout_ms_;

    mutable std::mutex mutex_;
    std::condition_variable released_;
    std::vector<std::unique_ptr<DatabaseConnection>> idle_;
    size_t open_ = 0;
};

// Checks a connection out for the lifetime of the scope
class ScopedConnection {
public:
    explicit ScopedConnection(DatabasePool* pool);
    ~ScopedConnection();

    ScopedConnection(const ScopedConnection&) = delete;
    ScopedConnection& operator=(const ScopedConnection&) = delete;

    DatabaseConnection* operator->() { return conn_.get(); }
    DatabaseConnection& operator*() { return *conn_; }

private:
    DatabasePool* pool_;
    std::unique_ptr<DatabaseConnection> conn_;
};

// Owns a PGresult
class QueryResult {
public:
    explicit QueryResult(PGresult* result) : result_(result) {}
    ~QueryResult() { if (result_) PQclear(result_); }

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

    bool is_success() const;
    std::string error_message() const;

    int num_rows() const { return result_ ? PQntuples(result_) : 0; }

    // Rows touched by INSERT/UPDATE/DELETE
    int affected_rows() const;

    // Empty string for NULL, unknown columns and out-of-range rows
    std::string get_value(int row, int col) const;
    std::string get_value(int row, const std::string& column) const;

    bool is_null(int row, const std::string& column) const;

private:
    int column_index(const std::string& column) const {
        return result_ ? PQfnumber(result_, column.c_str()) : -1;
    }

    PGresult* result_;
};

} // namespace hive
