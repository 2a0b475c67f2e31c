#pragma once

#include "hive/job_store.hpp"
#include <functional>
#include <mutex>
#include <unordered_map>

namespace hive {

/**
 * Process-local JobStore backed by a mutex-guarded map.
 *
 * Every operation runs under one lock, which makes claims atomic the same
 * way the conditional UPDATE is in PostgreSQL. The clock is injectable so
 * lease expiry can be exercised without sleeping.
 */
class MemoryJobStore : public JobStore {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    MemoryJobStore();
    explicit MemoryJobStore(Clock clock);

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

    size_t size() const;

private:
    struct Row {
        Job job;
        uint64_t insert_order;
    };

    std::vector<Job> sorted_by_creation(const std::function<bool(const Job&)>& filter) const;
    void finalize_locked(Job& job, JobStatus status, const std::string& message);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Row> rows_;
    uint64_t next_insert_order_ = 0;
    Clock clock_;
};

} // namespace hive
