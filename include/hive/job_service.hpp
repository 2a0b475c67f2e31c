#pragma once

#include "hive/job_store.hpp"
#include "hive/scheduler.hpp"
#include <memory>

namespace hive {

struct EnqueueOptions {
    int priority = 0;
    std::string session_id;
    nlohmann::json metadata = nlohmann::json::object();
};

/**
 * Entry point for callers that create, inspect and cancel jobs.
 *
 * Jobs are persisted as queued rows; the scheduler picks them up on its
 * next claim, or sooner when one is attached and running.
 */
class JobService {
public:
    explicit JobService(std::shared_ptr<JobStore> store,
                        std::shared_ptr<Scheduler> scheduler = nullptr);

    /**
     * Persist a new queued job.
     * @param payload JSON object (null is treated as {}); jobId is injected
     * @return the generated job id (UUIDv7)
     * @throws JobValidationError if payload is not an object
     * @throws std::runtime_error if the store rejects the insert
     */
    std::string enqueue_job(JobType type, nlohmann::json payload, const EnqueueOptions& options = {});

    std::optional<Job> get_job(const std::string& id);
    std::vector<Job> list_active_jobs();
    std::vector<Job> list_session_jobs(const std::string& session_id);

    // Durable cancel plus removal from the scheduler's local queue
    bool cancel_job(const std::string& id, const std::string& reason = "Canceled by user");
    int cancel_session_jobs(const std::string& session_id, const std::string& reason = "Session canceled");

    // Time-ordered UUIDv7
    static std::string generate_job_id();

private:
    std::shared_ptr<JobStore> store_;
    std::shared_ptr<Scheduler> scheduler_;
};

} // namespace hive
