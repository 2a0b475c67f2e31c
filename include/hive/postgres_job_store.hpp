#pragma once

#include "hive/job_store.hpp"
#include "hive/database.hpp"
#include <memory>

namespace hive {

/**
 * JobStore over the `<schema>.background_jobs` table.
 *
 * Claims use a single UPDATE ... WHERE id IN (SELECT ... FOR UPDATE SKIP
 * LOCKED) so concurrent schedulers never receive the same row. Timestamps
 * are kept in TIMESTAMPTZ columns and read back as epoch milliseconds.
 */
class PostgresJobStore : public JobStore {
public:
    PostgresJobStore(std::shared_ptr<DatabasePool> db_pool, const std::string& schema = "hive");

    // Creates the schema, table and indexes when missing
    bool initialize_schema();
    bool health_check();

    void create_job(const Job& job) override;
    std::vector<Job> claim_queued_jobs(int limit) override;
    bool update_job_status(const JobStatusUpdate& update) override;
    bool start_processing(const std::string& id, const std::string& status_message) override;
    bool append_to_response(const std::string& id,
                            const std::string& chunk,
                            int64_t tokens_received) override;
    bool requeue_for_retry(const std::string& id,
                           const std::string& error_message,
                           std::chrono::milliseconds delay) override;
    int reset_stale_acknowledged(int threshold_seconds) override;
    bool cancel_job(const std::string& id, const std::string& reason) override;
    int cancel_session_jobs(const std::string& session_id, const std::string& reason) override;
    std::optional<Job> get_job(const std::string& id) override;
    std::vector<Job> list_active_jobs() override;
    std::vector<Job> list_session_jobs(const std::string& session_id) override;

private:
    std::shared_ptr<DatabasePool> db_pool_;
    std::string schema_;
    std::string table_;

    struct MalformedRow {
        std::string id;
        std::string reason;
    };

    // Rows with an unknown type or status are left out. With `malformed`
    // null they are only logged, otherwise collected for the caller
    std::vector<Job> rows_to_jobs(const QueryResult& result, std::vector<MalformedRow>* malformed);
    std::vector<Job> query_jobs(const std::string& where_clause, const std::vector<std::string>& params);
    void fail_malformed_row(DatabaseConnection& conn, const std::string& id, const std::string& reason);
};

} // namespace hive
