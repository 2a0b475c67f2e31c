#pragma once

#include "hive/job_types.hpp"
#include <string>
#include <unordered_map>
#include <cstdlib>
#include <cstring>

namespace hive {

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
    std::string schema = "hive";

    bool use_ssl = false;

    // Pool configuration
    int pool_size = 10;
    int connection_timeout = 2000;        // 2 seconds
    int statement_timeout = 30000;        // 30 seconds
    int lock_timeout = 10000;             // 10 seconds
    int idle_in_transaction_timeout = 30000;
    int pool_acquisition_timeout = 10000; // timeout for acquiring a connection from the pool

    static DatabaseConfig from_env() {
        DatabaseConfig config;
        config.user = get_env_string("PG_USER", "postgres");
        config.host = get_env_string("PG_HOST", "localhost");
        config.database = get_env_string("PG_DB", "postgres");
        config.password = get_env_string("PG_PASSWORD", "postgres");
        config.port = get_env_string("PG_PORT", "5432");
        config.schema = get_env_string("PG_SCHEMA", "hive");

        config.use_ssl = get_env_bool("PG_USE_SSL", false);

        config.pool_size = get_env_int("DB_POOL_SIZE", 10);
        config.connection_timeout = get_env_int("DB_CONNECTION_TIMEOUT", 2000);
        config.statement_timeout = get_env_int("DB_STATEMENT_TIMEOUT", 30000);
        config.lock_timeout = get_env_int("DB_LOCK_TIMEOUT", 10000);
        config.idle_in_transaction_timeout = get_env_int("DB_IDLE_IN_TRANSACTION_TIMEOUT", 30000);
        config.pool_acquisition_timeout = get_env_int("DB_POOL_ACQUISITION_TIMEOUT", 10000);

        return config;
    }

    std::string connection_string() const {
        std::string conn_str = "host=" + host + " port=" + port + " dbname=" + database +
                               " user=" + user + " password=" + password;

        conn_str += use_ssl ? " sslmode=require" : " sslmode=disable";

        // connect_timeout is in seconds; the remaining timeouts are applied
        // with SET after connecting (see DatabaseConnection)
        int connect_seconds = connection_timeout / 1000;
        if (connect_seconds < 1) connect_seconds = 1;
        conn_str += " connect_timeout=" + std::to_string(connect_seconds);

        return conn_str;
    }
};

struct SchedulerConfig {
    int concurrency_limit = 5;               // max simultaneous in-flight jobs
    int polling_interval_ms = 200;           // local tick
    int db_poll_interval_ms = 5000;          // durable store claim cadence
    int job_timeout_ms = 30 * 60 * 1000;     // logged as anomaly when exceeded
    int stale_job_timeout_seconds = 600;     // acknowledged_by_worker lease
    int stale_check_interval_ms = 60000;     // periodic stale lease sweep
    bool debug_mode = false;

    static SchedulerConfig from_env() {
        SchedulerConfig config;
        config.concurrency_limit = get_env_int("HIVE_CONCURRENCY_LIMIT", 5);
        config.polling_interval_ms = get_env_int("HIVE_POLLING_INTERVAL_MS", 200);
        config.db_poll_interval_ms = get_env_int("HIVE_DB_POLL_INTERVAL_MS", 5000);
        config.job_timeout_ms = get_env_int("HIVE_JOB_TIMEOUT_MS", 30 * 60 * 1000);
        config.stale_job_timeout_seconds = get_env_int("HIVE_STALE_JOB_TIMEOUT_SECONDS", 600);
        config.stale_check_interval_ms = get_env_int("HIVE_STALE_CHECK_INTERVAL_MS", 60000);
        config.debug_mode = get_env_bool("HIVE_DEBUG", false);
        return config;
    }
};

struct RetryConfig {
    int default_max_retries = 3;
    int retry_delay_ms = 0;                  // 0 = requeued jobs are claimable immediately
    int max_retry_delay_ms = 60000;
    std::unordered_map<JobType, int> max_retries_by_type;

    int max_retries_for(JobType type) const {
        auto it = max_retries_by_type.find(type);
        return it != max_retries_by_type.end() ? it->second : default_max_retries;
    }

    static RetryConfig from_env() {
        RetryConfig config;
        config.default_max_retries = get_env_int("HIVE_MAX_RETRIES", 3);
        config.retry_delay_ms = get_env_int("HIVE_RETRY_DELAY_MS", 0);
        config.max_retry_delay_ms = get_env_int("HIVE_MAX_RETRY_DELAY_MS", 60000);
        return config;
    }
};

struct LoggingConfig {
    std::string level = "info";
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] %v";

    static LoggingConfig from_env() {
        LoggingConfig config;
        config.level = get_env_string("LOG_LEVEL", "info");
        return config;
    }
};

struct Config {
    DatabaseConfig database;
    SchedulerConfig scheduler;
    RetryConfig retry;
    LoggingConfig logging;

    static Config load() {
        Config config;
        config.database = DatabaseConfig::from_env();
        config.scheduler = SchedulerConfig::from_env();
        config.retry = RetryConfig::from_env();
        config.logging = LoggingConfig::from_env();
        return config;
    }
};

} // namespace hive
