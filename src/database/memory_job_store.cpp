#include "hive/memory_job_store.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

namespace hive {

MemoryJobStore::MemoryJobStore()
    : MemoryJobStore([] { return std::chrono::system_clock::now(); }) {
}

MemoryJobStore::MemoryJobStore(Clock clock) : clock_(std::move(clock)) {
    if (!clock_) {
        throw std::invalid_argument("MemoryJobStore clock cannot be empty");
    }
}

void MemoryJobStore::create_job(const Job& job) {
    if (job.id.empty()) {
        throw std::invalid_argument("Job id cannot be empty");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (rows_.count(job.id)) {
        throw std::runtime_error("Job " + job.id + " already exists");
    }

    Row row{job, next_insert_order_++};
    auto now = clock_();
    row.job.created_at = now;
    row.job.updated_at = now;
    if (!row.job.metadata.is_object()) {
        row.job.metadata = nlohmann::json::object();
    }
    rows_.emplace(job.id, std::move(row));
}

std::vector<Job> MemoryJobStore::claim_queued_jobs(int limit) {
    std::vector<Job> claimed;
    if (limit <= 0) return claimed;

    std::lock_guard<std::mutex> lock(mutex_);
    auto now = clock_();

    std::vector<Row*> candidates;
    for (auto& [id, row] : rows_) {
        if (row.job.status != JobStatus::QUEUED) continue;
        if (row.job.process_after && *row.job.process_after > now) continue;
        candidates.push_back(&row);
    }

    std::sort(candidates.begin(), candidates.end(), [](const Row* a, const Row* b) {
        if (a->job.priority != b->job.priority) return a->job.priority > b->job.priority;
        if (a->job.created_at != b->job.created_at) return a->job.created_at < b->job.created_at;
        return a->insert_order < b->insert_order;
    });

    if (candidates.size() > static_cast<size_t>(limit)) {
        candidates.resize(static_cast<size_t>(limit));
    }

    claimed.reserve(candidates.size());
    for (Row* row : candidates) {
        row->job.status = JobStatus::ACKNOWLEDGED_BY_WORKER;
        row->job.status_message = "Acknowledged by worker";
        row->job.process_after.reset();
        row->job.updated_at = now;
        claimed.push_back(row->job);
    }

    return claimed;
}

bool MemoryJobStore::update_job_status(const JobStatusUpdate& update) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rows_.find(update.id);
    if (it == rows_.end()) {
        spdlog::warn("Status update for unknown job {}", update.id);
        return false;
    }

    Job& job = it->second.job;
    if (!can_transition(job.status, update.status)) {
        spdlog::debug("Refused status update for job {}: {} -> {}",
                      job.id, to_string(job.status), to_string(update.status));
        return false;
    }

    auto now = clock_();
    job.status = update.status;
    if (update.status_message) job.status_message = *update.status_message;
    if (update.sub_status_message) job.sub_status_message = *update.sub_status_message;
    if (update.error_message) job.error_message = *update.error_message;
    if (update.response) job.response = *update.response;
    if (update.progress_percentage) {
        job.progress_percentage = std::clamp(*update.progress_percentage, 0, 100);
    }
    if (update.tokens_sent) job.tokens_sent = *update.tokens_sent;
    if (update.tokens_received) job.tokens_received = *update.tokens_received;
    if (update.metadata && update.metadata->is_object()) {
        job.metadata.update(*update.metadata);
    }

    if (!job.started_at && (update.status == JobStatus::RUNNING || is_streaming(update.status))) {
        job.started_at = now;
    }
    if (is_terminal(update.status)) {
        job.ended_at = now;
    }
    job.updated_at = now;
    return true;
}

bool MemoryJobStore::start_processing(const std::string& id, const std::string& status_message) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rows_.find(id);
    if (it == rows_.end() || it->second.job.status != JobStatus::ACKNOWLEDGED_BY_WORKER) {
        return false;
    }

    Job& job = it->second.job;
    auto now = clock_();
    job.status = JobStatus::RUNNING;
    job.status_message = status_message;
    if (!job.started_at) job.started_at = now;
    job.updated_at = now;
    return true;
}

bool MemoryJobStore::append_to_response(const std::string& id,
                                        const std::string& chunk,
                                        int64_t tokens_received) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rows_.find(id);
    if (it == rows_.end() || is_terminal(it->second.job.status)) {
        return false;
    }

    Job& job = it->second.job;
    job.response += chunk;
    job.tokens_received += tokens_received;
    job.updated_at = clock_();
    return true;
}

bool MemoryJobStore::requeue_for_retry(const std::string& id,
                                       const std::string& error_message,
                                       std::chrono::milliseconds delay) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rows_.find(id);
    if (it == rows_.end() || is_terminal(it->second.job.status)) {
        return false;
    }

    Job& job = it->second.job;
    auto now = clock_();
    job.status = JobStatus::QUEUED;
    job.retry_count += 1;
    job.error_message = error_message;
    job.status_message = "Retry #" + std::to_string(job.retry_count) + " scheduled";
    job.progress_percentage.reset();
    if (delay.count() > 0) {
        job.process_after = now + delay;
    } else {
        job.process_after.reset();
    }
    job.updated_at = now;
    return true;
}

int MemoryJobStore::reset_stale_acknowledged(int threshold_seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = clock_();
    auto cutoff = now - std::chrono::seconds(threshold_seconds);

    int reset = 0;
    for (auto& [id, row] : rows_) {
        Job& job = row.job;
        if (job.status == JobStatus::ACKNOWLEDGED_BY_WORKER && job.updated_at < cutoff) {
            job.status = JobStatus::QUEUED;
            job.status_message = "Re-queued after worker timeout";
            job.updated_at = now;
            ++reset;
        }
    }
    return reset;
}

void MemoryJobStore::finalize_locked(Job& job, JobStatus status, const std::string& message) {
    auto now = clock_();
    job.status = status;
    job.status_message = message;
    job.ended_at = now;
    job.updated_at = now;
}

bool MemoryJobStore::cancel_job(const std::string& id, const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rows_.find(id);
    if (it == rows_.end() || is_terminal(it->second.job.status)) {
        return false;
    }
    finalize_locked(it->second.job, JobStatus::CANCELED, reason);
    return true;
}

int MemoryJobStore::cancel_session_jobs(const std::string& session_id, const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    int canceled = 0;
    for (auto& [id, row] : rows_) {
        if (row.job.session_id == session_id && !is_terminal(row.job.status)) {
            finalize_locked(row.job, JobStatus::CANCELED, reason);
            ++canceled;
        }
    }
    return canceled;
}

std::optional<Job> MemoryJobStore::get_job(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rows_.find(id);
    if (it == rows_.end()) return std::nullopt;
    return it->second.job;
}

std::vector<Job> MemoryJobStore::sorted_by_creation(const std::function<bool(const Job&)>& filter) const {
    std::vector<const Row*> selected;
    for (const auto& [id, row] : rows_) {
        if (filter(row.job)) selected.push_back(&row);
    }
    std::sort(selected.begin(), selected.end(), [](const Row* a, const Row* b) {
        return a->insert_order < b->insert_order;
    });

    std::vector<Job> jobs;
    jobs.reserve(selected.size());
    for (const Row* row : selected) jobs.push_back(row->job);
    return jobs;
}

std::vector<Job> MemoryJobStore::list_active_jobs() {
    std::lock_guard<std::mutex> lock(mutex_);
    return sorted_by_creation([](const Job& job) { return is_active(job.status); });
}

std::vector<Job> MemoryJobStore::list_session_jobs(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return sorted_by_creation([&session_id](const Job& job) { return job.session_id == session_id; });
}

size_t MemoryJobStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rows_.size();
}

} // namespace hive
