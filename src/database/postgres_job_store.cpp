#include "hive/postgres_job_store.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

namespace hive {

namespace {

const std::string JOB_COLUMNS = R"(
    id, session_id, job_type, payload::text AS payload, priority, status,
    status_message, sub_status_message, progress_percentage,
    response, error_message, tokens_sent, tokens_received,
    metadata::text AS metadata, retry_count,
    (EXTRACT(EPOCH FROM created_at) * 1000)::BIGINT AS created_at_ms,
    (EXTRACT(EPOCH FROM updated_at) * 1000)::BIGINT AS updated_at_ms,
    (EXTRACT(EPOCH FROM started_at) * 1000)::BIGINT AS started_at_ms,
    (EXTRACT(EPOCH FROM ended_at) * 1000)::BIGINT AS ended_at_ms,
    (EXTRACT(EPOCH FROM process_after) * 1000)::BIGINT AS process_after_ms
)";

// ('completed','completed_by_tag','failed','canceled')
std::string terminal_status_list() {
    std::string list = "(";
    bool first = true;
    for (auto status : {JobStatus::COMPLETED, JobStatus::COMPLETED_BY_TAG,
                        JobStatus::FAILED, JobStatus::CANCELED}) {
        if (!first) list += ",";
        list += "'" + to_string(status) + "'";
        first = false;
    }
    return list + ")";
}

// Postgres array literal of every status allowed to move to `to`
std::string allowed_source_statuses(JobStatus to) {
    std::string array = "{";
    bool first = true;
    for (int i = 0; i <= static_cast<int>(JobStatus::CANCELED); ++i) {
        auto from = static_cast<JobStatus>(i);
        if (!can_transition(from, to)) continue;
        if (!first) array += ",";
        array += to_string(from);
        first = false;
    }
    return array + "}";
}

std::string optional_epoch_ms(const std::optional<std::chrono::system_clock::time_point>& tp) {
    return tp ? std::to_string(to_epoch_ms(*tp)) : "";
}

std::optional<std::chrono::system_clock::time_point> read_epoch_ms(const QueryResult& result,
                                                                   int row,
                                                                   const std::string& column) {
    if (result.is_null(row, column)) return std::nullopt;
    return from_epoch_ms(std::stoll(result.get_value(row, column)));
}

nlohmann::json parse_json_column(const std::string& text) {
    auto value = nlohmann::json::parse(text, nullptr, false);
    return value.is_discarded() ? nlohmann::json() : value;
}

} // anonymous namespace

PostgresJobStore::PostgresJobStore(std::shared_ptr<DatabasePool> db_pool, const std::string& schema)
    : db_pool_(std::move(db_pool)), schema_(schema), table_(schema + ".background_jobs") {
    if (!db_pool_) {
        throw std::invalid_argument("PostgresJobStore requires a database pool");
    }
}

bool PostgresJobStore::initialize_schema() {
    try {
        ScopedConnection conn(db_pool_.get());

        auto schema_result = QueryResult(conn->exec("CREATE SCHEMA IF NOT EXISTS " + schema_));
        if (!schema_result.is_success()) {
            spdlog::error("Failed to create schema: {}", schema_result.error_message());
            return false;
        }

        std::string create_table_sql = "CREATE TABLE IF NOT EXISTS " + table_ + R"( (
                id TEXT PRIMARY KEY,
                session_id TEXT NOT NULL DEFAULT '',
                job_type VARCHAR(64) NOT NULL,
                payload JSONB NOT NULL DEFAULT '{}'::jsonb,
                priority INTEGER NOT NULL DEFAULT 0,
                status VARCHAR(32) NOT NULL DEFAULT 'queued',
                status_message TEXT NOT NULL DEFAULT '',
                sub_status_message TEXT NOT NULL DEFAULT '',
                progress_percentage INTEGER,
                response TEXT NOT NULL DEFAULT '',
                error_message TEXT NOT NULL DEFAULT '',
                tokens_sent BIGINT NOT NULL DEFAULT 0,
                tokens_received BIGINT NOT NULL DEFAULT 0,
                metadata JSONB NOT NULL DEFAULT '{}'::jsonb,
                retry_count INTEGER NOT NULL DEFAULT 0,
                process_after TIMESTAMPTZ,
                created_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),
                updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),
                started_at TIMESTAMPTZ,
                ended_at TIMESTAMPTZ
            );
        )";

        auto table_result = QueryResult(conn->exec(create_table_sql));
        if (!table_result.is_success()) {
            spdlog::error("Failed to create tables: {}", table_result.error_message());
            return false;
        }

        std::string create_indexes_sql =
            "CREATE INDEX IF NOT EXISTS idx_background_jobs_claim ON " + table_ +
            " (priority DESC, created_at ASC) WHERE status = 'queued';"
            "CREATE INDEX IF NOT EXISTS idx_background_jobs_status_updated ON " + table_ +
            " (status, updated_at);"
            "CREATE INDEX IF NOT EXISTS idx_background_jobs_session ON " + table_ +
            " (session_id, created_at);";

        auto index_result = QueryResult(conn->exec(create_indexes_sql));
        if (!index_result.is_success()) {
            spdlog::warn("Could not create background_jobs indexes: {}", index_result.error_message());
        }

        spdlog::info("Database schema initialized successfully ({})", table_);
        return true;

    } catch (const std::exception& e) {
        spdlog::error("Failed to initialize schema: {}", e.what());
        return false;
    }
}

bool PostgresJobStore::health_check() {
    try {
        ScopedConnection conn(db_pool_.get());
        auto result = QueryResult(conn->exec("SELECT 1"));
        return result.is_success();
    } catch (const std::exception& e) {
        spdlog::error("Health check failed: {}", e.what());
        return false;
    }
}

void PostgresJobStore::create_job(const Job& job) {
    if (job.id.empty()) {
        throw std::invalid_argument("Job id cannot be empty");
    }

    ScopedConnection conn(db_pool_.get());

    std::string sql = "INSERT INTO " + table_ + R"(
        (id, session_id, job_type, payload, priority, status, status_message,
         sub_status_message, progress_percentage, metadata, retry_count, process_after)
        VALUES ($1, $2, $3, $4::jsonb, $5::int, $6, $7, $8, NULLIF($9, '')::int,
                $10::jsonb, $11::int,
                to_timestamp(NULLIF($12, '')::bigint / 1000.0))
    )";

    nlohmann::json metadata = job.metadata.is_object() ? job.metadata : nlohmann::json::object();

    std::vector<std::string> params = {
        job.id,
        job.session_id,
        to_string(job.type),
        job.payload.dump(),
        std::to_string(job.priority),
        to_string(job.status),
        job.status_message,
        job.sub_status_message,
        job.progress_percentage ? std::to_string(*job.progress_percentage) : "",
        metadata.dump(),
        std::to_string(job.retry_count),
        optional_epoch_ms(job.process_after)
    };

    auto result = QueryResult(conn->exec_params(sql, params));
    if (!result.is_success()) {
        throw std::runtime_error("Failed to insert job " + job.id + ": " + result.error_message());
    }
}

std::vector<Job> PostgresJobStore::claim_queued_jobs(int limit) {
    if (limit <= 0) return {};

    ScopedConnection conn(db_pool_.get());

    std::string sql = "UPDATE " + table_ + R"(
        SET status = 'acknowledged_by_worker',
            status_message = 'Acknowledged by worker',
            process_after = NULL,
            updated_at = NOW()
        WHERE id IN (
            SELECT id FROM )" + table_ + R"(
            WHERE status = 'queued'
              AND (process_after IS NULL OR process_after <= NOW())
            ORDER BY priority DESC, created_at ASC
            LIMIT $1
            FOR UPDATE SKIP LOCKED
        )
        RETURNING )" + JOB_COLUMNS;

    auto result = QueryResult(conn->exec_params(sql, {std::to_string(limit)}));
    if (!result.is_success()) {
        throw std::runtime_error("Failed to claim queued jobs: " + result.error_message());
    }

    // Leased rows that cannot become a Job are failed on the connection
    // already held, so a single-connection pool cannot block on itself
    std::vector<MalformedRow> malformed;
    auto jobs = rows_to_jobs(result, &malformed);
    for (const auto& row : malformed) {
        fail_malformed_row(*conn, row.id, row.reason);
    }

    // RETURNING order is unspecified; restore claim order
    std::sort(jobs.begin(), jobs.end(), [](const Job& a, const Job& b) {
        if (a.priority != b.priority) return a.priority > b.priority;
        return a.created_at < b.created_at;
    });
    return jobs;
}

bool PostgresJobStore::update_job_status(const JobStatusUpdate& update) {
    if (update.status == JobStatus::QUEUED) {
        spdlog::debug("Refused status update for job {}: queued is not a valid target", update.id);
        return false;
    }

    std::vector<std::string> params = {
        update.id,
        to_string(update.status),
        allowed_source_statuses(update.status)
    };
    std::string set_clause = "status = $2, updated_at = NOW()";

    auto bind = [&params, &set_clause](const std::string& assignment, const std::string& value) {
        params.push_back(value);
        std::string placeholder = "$" + std::to_string(params.size());
        std::string expr = assignment;
        expr.replace(expr.find('?'), 1, placeholder);
        set_clause += ", " + expr;
    };

    if (update.status_message) bind("status_message = ?", *update.status_message);
    if (update.sub_status_message) bind("sub_status_message = ?", *update.sub_status_message);
    if (update.error_message) bind("error_message = ?", *update.error_message);
    if (update.response) bind("response = ?", *update.response);
    if (update.progress_percentage) {
        bind("progress_percentage = ?::int", std::to_string(std::clamp(*update.progress_percentage, 0, 100)));
    }
    if (update.tokens_sent) bind("tokens_sent = ?::bigint", std::to_string(*update.tokens_sent));
    if (update.tokens_received) bind("tokens_received = ?::bigint", std::to_string(*update.tokens_received));
    if (update.metadata && update.metadata->is_object()) {
        bind("metadata = metadata || ?::jsonb", update.metadata->dump());
    }

    if (update.status == JobStatus::RUNNING || is_streaming(update.status)) {
        set_clause += ", started_at = COALESCE(started_at, NOW())";
    }
    if (is_terminal(update.status)) {
        set_clause += ", ended_at = NOW()";
    }

    std::string sql = "UPDATE " + table_ + " SET " + set_clause +
                      " WHERE id = $1 AND status = ANY($3::text[])";

    ScopedConnection conn(db_pool_.get());
    auto result = QueryResult(conn->exec_params(sql, params));
    if (!result.is_success()) {
        throw std::runtime_error("Failed to update job " + update.id + ": " + result.error_message());
    }

    if (result.affected_rows() == 0) {
        spdlog::debug("Status update for job {} to {} not applied", update.id, to_string(update.status));
        return false;
    }
    return true;
}

bool PostgresJobStore::start_processing(const std::string& id, const std::string& status_message) {
    ScopedConnection conn(db_pool_.get());

    std::string sql = "UPDATE " + table_ + R"(
        SET status = 'running',
            status_message = $2,
            started_at = COALESCE(started_at, NOW()),
            updated_at = NOW()
        WHERE id = $1 AND status = 'acknowledged_by_worker')";

    auto result = QueryResult(conn->exec_params(sql, {id, status_message}));
    if (!result.is_success()) {
        throw std::runtime_error("Failed to start job " + id + ": " + result.error_message());
    }
    return result.affected_rows() > 0;
}

bool PostgresJobStore::append_to_response(const std::string& id,
                                          const std::string& chunk,
                                          int64_t tokens_received) {
    ScopedConnection conn(db_pool_.get());

    std::string sql = "UPDATE " + table_ + R"(
        SET response = response || $2,
            tokens_received = tokens_received + $3::bigint,
            updated_at = NOW()
        WHERE id = $1 AND status NOT IN )" + terminal_status_list();

    auto result = QueryResult(conn->exec_params(sql, {id, chunk, std::to_string(tokens_received)}));
    if (!result.is_success()) {
        throw std::runtime_error("Failed to append response for job " + id + ": " + result.error_message());
    }
    return result.affected_rows() > 0;
}

bool PostgresJobStore::requeue_for_retry(const std::string& id,
                                         const std::string& error_message,
                                         std::chrono::milliseconds delay) {
    ScopedConnection conn(db_pool_.get());

    std::string sql = "UPDATE " + table_ + R"(
        SET status = 'queued',
            retry_count = retry_count + 1,
            error_message = $2,
            status_message = 'Retry #' || (retry_count + 1) || ' scheduled',
            progress_percentage = NULL,
            process_after = CASE WHEN $3::bigint > 0
                                 THEN NOW() + ($3::bigint * INTERVAL '1 millisecond')
                                 ELSE NULL END,
            updated_at = NOW()
        WHERE id = $1 AND status NOT IN )" + terminal_status_list();

    auto result = QueryResult(conn->exec_params(sql, {id, error_message, std::to_string(delay.count())}));
    if (!result.is_success()) {
        throw std::runtime_error("Failed to requeue job " + id + ": " + result.error_message());
    }
    return result.affected_rows() > 0;
}

int PostgresJobStore::reset_stale_acknowledged(int threshold_seconds) {
    ScopedConnection conn(db_pool_.get());

    std::string sql = "UPDATE " + table_ + R"(
        SET status = 'queued',
            status_message = 'Re-queued after worker timeout',
            updated_at = NOW()
        WHERE status = 'acknowledged_by_worker'
          AND updated_at < NOW() - ($1::int * INTERVAL '1 second')
    )";

    auto result = QueryResult(conn->exec_params(sql, {std::to_string(threshold_seconds)}));
    if (!result.is_success()) {
        throw std::runtime_error("Failed to reset stale jobs: " + result.error_message());
    }
    return result.affected_rows();
}

bool PostgresJobStore::cancel_job(const std::string& id, const std::string& reason) {
    ScopedConnection conn(db_pool_.get());

    std::string sql = "UPDATE " + table_ + R"(
        SET status = 'canceled', status_message = $2, ended_at = NOW(), updated_at = NOW()
        WHERE id = $1 AND status NOT IN )" + terminal_status_list();

    auto result = QueryResult(conn->exec_params(sql, {id, reason}));
    if (!result.is_success()) {
        throw std::runtime_error("Failed to cancel job " + id + ": " + result.error_message());
    }
    return result.affected_rows() > 0;
}

int PostgresJobStore::cancel_session_jobs(const std::string& session_id, const std::string& reason) {
    ScopedConnection conn(db_pool_.get());

    std::string sql = "UPDATE " + table_ + R"(
        SET status = 'canceled', status_message = $2, ended_at = NOW(), updated_at = NOW()
        WHERE session_id = $1 AND status NOT IN )" + terminal_status_list();

    auto result = QueryResult(conn->exec_params(sql, {session_id, reason}));
    if (!result.is_success()) {
        throw std::runtime_error("Failed to cancel jobs for session " + session_id + ": " +
                                 result.error_message());
    }
    return result.affected_rows();
}

std::optional<Job> PostgresJobStore::get_job(const std::string& id) {
    auto jobs = query_jobs("id = $1", {id});
    if (jobs.empty()) return std::nullopt;
    return jobs.front();
}

std::vector<Job> PostgresJobStore::list_active_jobs() {
    return query_jobs("status NOT IN " + terminal_status_list() + " ORDER BY created_at ASC", {});
}

std::vector<Job> PostgresJobStore::list_session_jobs(const std::string& session_id) {
    return query_jobs("session_id = $1 ORDER BY created_at ASC", {session_id});
}

std::vector<Job> PostgresJobStore::query_jobs(const std::string& where_clause,
                                              const std::vector<std::string>& params) {
    ScopedConnection conn(db_pool_.get());

    std::string sql = "SELECT " + JOB_COLUMNS + " FROM " + table_ + " WHERE " + where_clause;
    auto result = QueryResult(conn->exec_params(sql, params));
    if (!result.is_success()) {
        throw std::runtime_error("Failed to query jobs: " + result.error_message());
    }
    return rows_to_jobs(result, nullptr);
}

std::vector<Job> PostgresJobStore::rows_to_jobs(const QueryResult& result,
                                                std::vector<MalformedRow>* malformed) {
    std::vector<Job> jobs;
    jobs.reserve(static_cast<size_t>(result.num_rows()));

    for (int i = 0; i < result.num_rows(); ++i) {
        Job job;
        job.id = result.get_value(i, "id");

        std::string type_name = result.get_value(i, "job_type");
        std::string status_name = result.get_value(i, "status");
        auto type = parse_job_type(type_name);
        auto status = parse_job_status(status_name);
        if (!type || !status) {
            // Unknown types cannot be represented past this point
            std::string reason = !type ? "Malformed job: unknown job type '" + type_name + "'"
                                       : "Malformed job: unknown status '" + status_name + "'";
            if (malformed) {
                malformed->push_back({job.id, reason});
            } else {
                spdlog::warn("Skipping job {}: {}", job.id, reason);
            }
            continue;
        }

        job.type = *type;
        job.status = *status;
        job.session_id = result.get_value(i, "session_id");
        job.payload = parse_json_column(result.get_value(i, "payload"));
        job.priority = std::stoi(result.get_value(i, "priority"));
        job.status_message = result.get_value(i, "status_message");
        job.sub_status_message = result.get_value(i, "sub_status_message");
        if (!result.is_null(i, "progress_percentage")) {
            job.progress_percentage = std::stoi(result.get_value(i, "progress_percentage"));
        }
        job.response = result.get_value(i, "response");
        job.error_message = result.get_value(i, "error_message");
        job.tokens_sent = std::stoll(result.get_value(i, "tokens_sent"));
        job.tokens_received = std::stoll(result.get_value(i, "tokens_received"));
        job.metadata = parse_json_column(result.get_value(i, "metadata"));
        if (!job.metadata.is_object()) job.metadata = nlohmann::json::object();
        job.retry_count = std::stoi(result.get_value(i, "retry_count"));

        job.created_at = from_epoch_ms(std::stoll(result.get_value(i, "created_at_ms")));
        job.updated_at = from_epoch_ms(std::stoll(result.get_value(i, "updated_at_ms")));
        job.started_at = read_epoch_ms(result, i, "started_at_ms");
        job.ended_at = read_epoch_ms(result, i, "ended_at_ms");
        job.process_after = read_epoch_ms(result, i, "process_after_ms");

        jobs.push_back(std::move(job));
    }

    return jobs;
}

void PostgresJobStore::fail_malformed_row(DatabaseConnection& conn,
                                          const std::string& id,
                                          const std::string& reason) {
    spdlog::error("Job {}: {}", id, reason);

    std::string sql = "UPDATE " + table_ + R"(
        SET status = 'failed', error_message = $2, status_message = 'Failed',
            ended_at = NOW(), updated_at = NOW()
        WHERE id = $1 AND status NOT IN )" + terminal_status_list();

    auto result = QueryResult(conn.exec_params(sql, {id, reason}));
    if (!result.is_success()) {
        // Still leased, so the stale sweep hands it back to a later claim
        spdlog::error("Failed to mark malformed job {} as failed: {}", id, result.error_message());
    }
}

} // namespace hive
