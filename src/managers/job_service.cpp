#include "hive/job_service.hpp"
#include <spdlog/spdlog.h>
#include <iomanip>
#include <random>
#include <sstream>

namespace hive {

JobService::JobService(std::shared_ptr<JobStore> store, std::shared_ptr<Scheduler> scheduler)
    : store_(std::move(store)), scheduler_(std::move(scheduler)) {
    if (!store_) {
        throw std::invalid_argument("JobService requires a job store");
    }
}

std::string JobService::generate_job_id() {
    // UUIDv7 layout: TTTTTTTT-TTTT-7RRR-VRRR-RRRRRRRRRRRR
    // T = 48-bit unix ms timestamp, 7 = version, V = variant (10xx)
    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();

    static thread_local std::mt19937_64 gen(std::random_device{}());
    std::uniform_int_distribution<uint64_t> dis;

    uint64_t rand1 = dis(gen);
    uint64_t rand2 = dis(gen);

    std::stringstream ss;
    ss << std::hex << std::setfill('0');

    ss << std::setw(8) << ((ms >> 16) & 0xFFFFFFFF);
    ss << "-";
    ss << std::setw(4) << (ms & 0xFFFF);

    ss << "-7" << std::setw(3) << (rand1 & 0xFFF);

    ss << "-" << std::setw(1) << (8 | ((rand1 >> 12) & 0x3));
    ss << std::setw(3) << ((rand1 >> 16) & 0xFFF);

    ss << "-" << std::setw(12) << (rand2 & 0xFFFFFFFFFFFF);

    return ss.str();
}

std::string JobService::enqueue_job(JobType type, nlohmann::json payload, const EnqueueOptions& options) {
    if (payload.is_null()) {
        payload = nlohmann::json::object();
    }
    if (!payload.is_object()) {
        throw JobValidationError("Payload for " + to_string(type) + " job must be a JSON object");
    }

    Job job;
    job.id = generate_job_id();
    job.session_id = options.session_id;
    job.type = type;
    job.priority = options.priority;
    job.status = JobStatus::QUEUED;
    job.status_message = "Queued";
    job.metadata = options.metadata.is_object() ? options.metadata : nlohmann::json::object();

    payload["jobId"] = job.id;
    job.payload = std::move(payload);

    store_->create_job(job);
    spdlog::info("Enqueued job {} ({}, priority {}{})", job.id, to_string(type), job.priority,
                 job.session_id.empty() ? "" : ", session " + job.session_id);

    if (scheduler_ && scheduler_->is_running()) {
        scheduler_->trigger_fetch();
    }
    return job.id;
}

std::optional<Job> JobService::get_job(const std::string& id) {
    return store_->get_job(id);
}

std::vector<Job> JobService::list_active_jobs() {
    return store_->list_active_jobs();
}

std::vector<Job> JobService::list_session_jobs(const std::string& session_id) {
    return store_->list_session_jobs(session_id);
}

bool JobService::cancel_job(const std::string& id, const std::string& reason) {
    bool canceled = store_->cancel_job(id, reason);
    if (scheduler_) {
        scheduler_->cancel_job(id);
    }

    if (canceled) {
        spdlog::info("Canceled job {}: {}", id, reason);
    } else {
        spdlog::debug("Cancel of job {} had no effect (missing or already terminal)", id);
    }
    return canceled;
}

int JobService::cancel_session_jobs(const std::string& session_id, const std::string& reason) {
    int canceled = store_->cancel_session_jobs(session_id, reason);
    if (scheduler_) {
        scheduler_->cancel_session_jobs(session_id);
    }

    spdlog::info("Canceled {} jobs of session {}: {}", canceled, session_id, reason);
    return canceled;
}

} // namespace hive
