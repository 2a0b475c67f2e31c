#include "hive/database.hpp"
#include "hive/config.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <cstdlib>
#include <stdexcept>

namespace hive {

// ---------------------------------------------------------------------------
// DatabaseConnection
// ---------------------------------------------------------------------------

DatabaseConnection::DatabaseConnection(const std::string& connection_string, const SessionTimeouts& timeouts)
    : timeouts_(timeouts) {
    conn_ = PQconnectdb(connection_string.c_str());

    std::string error;
    if (PQstatus(conn_) != CONNECTION_OK) {
        error = "Failed to connect to database: " + last_error();
    } else if (!apply_session_settings(error)) {
        error = "Failed to configure database session: " + error;
    }

    if (!error.empty()) {
        PQfinish(conn_);
        conn_ = nullptr;
        throw std::runtime_error(error);
    }
}

DatabaseConnection::~DatabaseConnection() {
    if (conn_) PQfinish(conn_);
}

bool DatabaseConnection::apply_session_settings(std::string& error) {
    PQsetClientEncoding(conn_, "UTF8");

    // Applied with SET rather than connection options so they survive poolers
    std::string settings =
        "SET statement_timeout = " + std::to_string(timeouts_.statement_ms) + "; "
        "SET lock_timeout = " + std::to_string(timeouts_.lock_ms) + "; "
        "SET idle_in_transaction_session_timeout = " + std::to_string(timeouts_.idle_in_transaction_ms) + ";";

    QueryResult result(PQexec(conn_, settings.c_str()));
    if (!result.is_success()) {
        error = result.error_message();
        return false;
    }
    return true;
}

bool DatabaseConnection::is_valid() const {
    return conn_ && PQstatus(conn_) == CONNECTION_OK;
}

bool DatabaseConnection::reset() {
    if (!conn_) return false;

    PQreset(conn_);
    if (PQstatus(conn_) != CONNECTION_OK) {
        return false;
    }

    std::string error;
    if (!apply_session_settings(error)) {
        spdlog::warn("Database session setup failed after reset: {}", error);
        return false;
    }
    return true;
}

PGresult* DatabaseConnection::exec(const std::string& query) {
    if (!is_valid()) return nullptr;
    return PQexec(conn_, query.c_str());
}

PGresult* DatabaseConnection::exec_params(const std::string& query, const std::vector<std::string>& params) {
    if (!is_valid()) return nullptr;

    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& param : params) {
        values.push_back(param.c_str());
    }

    return PQexecParams(conn_, query.c_str(), static_cast<int>(values.size()),
                        nullptr, values.data(), nullptr, nullptr, 0);
}

std::string DatabaseConnection::last_error() const {
    return conn_ ? PQerrorMessage(conn_) : "no connection";
}

// ---------------------------------------------------------------------------
// DatabasePool
// ---------------------------------------------------------------------------

DatabasePool::DatabasePool(const DatabaseConfig& config)
    : connection_string_(config.connection_string()),
      max_size_(config.pool_size > 0 ? static_cast<size_t>(config.pool_size) : 1),
      acquisition_timeout_ms_(config.pool_acquisition_timeout) {
    timeouts_.statement_ms = config.statement_timeout;
    timeouts_.lock_ms = config.lock_timeout;
    timeouts_.idle_in_transaction_ms = config.idle_in_transaction_timeout;

    // Throws on a bad configuration or an unreachable server
    idle_.push_back(open_connection());
    open_ = 1;

    spdlog::info("Database pool ready: {}:{}/{} (max {} connections, acquisition timeout {}ms, "
                 "statement timeout {}ms)",
                 config.host, config.port, config.database, max_size_,
                 acquisition_timeout_ms_, timeouts_.statement_ms);
}

std::unique_ptr<DatabaseConnection> DatabasePool::open_connection() {
    return std::make_unique<DatabaseConnection>(connection_string_, timeouts_);
}

std::unique_ptr<DatabaseConnection> DatabasePool::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);

    bool available = released_.wait_for(lock, std::chrono::milliseconds(acquisition_timeout_ms_),
        [this] { return !idle_.empty() || open_ < max_size_; });
    if (!available) {
        throw std::runtime_error("Timed out after " + std::to_string(acquisition_timeout_ms_) +
                                 "ms waiting for a database connection (" + std::to_string(open_) +
                                 " open, all busy)");
    }

    if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        lock.unlock();

        if (conn->is_valid() || conn->reset()) {
            return conn;
        }

        spdlog::warn("Dropping broken database connection: {}", conn->last_error());
        conn.reset();
        lock.lock();
        --open_;
    }

    // Reserve the slot before connecting outside the lock
    ++open_;
    lock.unlock();

    try {
        return open_connection();
    } catch (const std::exception&) {
        {
            std::lock_guard<std::mutex> relock(mutex_);
            --open_;
        }
        released_.notify_one();
        throw;
    }
}

void DatabasePool::release(std::unique_ptr<DatabaseConnection> conn) {
    if (!conn) return;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (conn->is_valid()) {
            idle_.push_back(std::move(conn));
        } else {
            spdlog::warn("Discarding database connection returned in a broken state");
            --open_;
        }
    }
    released_.notify_one();
}

PoolStats DatabasePool::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return PoolStats{open_, idle_.size(), max_size_};
}

// ---------------------------------------------------------------------------
// ScopedConnection
// ---------------------------------------------------------------------------

ScopedConnection::ScopedConnection(DatabasePool* pool) : pool_(pool) {
    if (!pool_) {
        throw std::invalid_argument("Database pool cannot be null");
    }
    conn_ = pool_->acquire();
}

ScopedConnection::~ScopedConnection() {
    if (conn_) pool_->release(std::move(conn_));
}

// ---------------------------------------------------------------------------
// QueryResult
// ---------------------------------------------------------------------------

bool QueryResult::is_success() const {
    if (!result_) return false;
    auto status = PQresultStatus(result_);
    return status == PGRES_COMMAND_OK || status == PGRES_TUPLES_OK;
}

std::string QueryResult::error_message() const {
    return result_ ? PQresultErrorMessage(result_) : "connection unavailable";
}

int QueryResult::affected_rows() const {
    if (!result_) return 0;
    const char* affected = PQcmdTuples(result_);
    return (affected && *affected) ? std::atoi(affected) : 0;
}

std::string QueryResult::get_value(int row, int col) const {
    if (!result_ || row < 0 || row >= PQntuples(result_) || col < 0 || col >= PQnfields(result_)) {
        return "";
    }
    return PQgetvalue(result_, row, col);
}

std::string QueryResult::get_value(int row, const std::string& column) const {
    return get_value(row, column_index(column));
}

bool QueryResult::is_null(int row, const std::string& column) const {
    int col = column_index(column);
    return col < 0 || PQgetisnull(result_, row, col);
}

} // namespace hive
