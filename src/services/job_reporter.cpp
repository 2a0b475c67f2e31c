#include "hive/job_reporter.hpp"
#include <spdlog/spdlog.h>

namespace hive {

JobReporter::JobReporter(std::shared_ptr<JobStore> store, std::string job_id)
    : store_(std::move(store)), job_id_(std::move(job_id)) {
    if (!store_) {
        throw std::invalid_argument("JobReporter requires a job store");
    }
}

JobReporter JobReporter::from_payload(std::shared_ptr<JobStore> store, const nlohmann::json& payload) {
    if (!payload.is_object() || !payload.contains("jobId") || !payload["jobId"].is_string()) {
        throw JobValidationError("Payload does not reference its job (missing jobId)");
    }
    return JobReporter(std::move(store), payload["jobId"].get<std::string>());
}

bool JobReporter::mark_running(const std::string& message, int64_t tokens_sent) {
    JobStatusUpdate update;
    update.id = job_id_;
    update.status = JobStatus::RUNNING;
    update.status_message = message;
    if (tokens_sent > 0) update.tokens_sent = tokens_sent;
    return store_->update_job_status(update);
}

bool JobReporter::set_stream_state(JobStatus state,
                                   const std::string& sub_status_message,
                                   std::optional<int> progress_percentage) {
    if (!is_streaming(state)) {
        throw std::invalid_argument(to_string(state) + " is not a streaming state");
    }

    JobStatusUpdate update;
    update.id = job_id_;
    update.status = state;
    update.sub_status_message = sub_status_message;
    update.progress_percentage = progress_percentage;
    return store_->update_job_status(update);
}

bool JobReporter::append_response(const std::string& chunk, int64_t tokens) {
    return store_->append_to_response(job_id_, chunk, tokens);
}

bool JobReporter::complete(const std::string& response, const nlohmann::json& metadata) {
    JobStatusUpdate update;
    update.id = job_id_;
    update.status = JobStatus::COMPLETED;
    update.status_message = std::string("Completed");
    update.response = response;
    update.progress_percentage = 100;
    if (metadata.is_object()) update.metadata = metadata;

    bool applied = store_->update_job_status(update);
    if (!applied) {
        spdlog::info("Job {} completion ignored, job is no longer active", job_id_);
    }
    return applied;
}

bool JobReporter::complete_by_tag(const std::string& response, const std::string& tag) {
    JobStatusUpdate update;
    update.id = job_id_;
    update.status = JobStatus::COMPLETED_BY_TAG;
    update.status_message = "Completed by tag " + tag;
    update.response = response;
    update.progress_percentage = 100;
    update.metadata = nlohmann::json{{"completionTag", tag}};
    return store_->update_job_status(update);
}

bool JobReporter::fail(const std::string& error_message) {
    JobStatusUpdate update;
    update.id = job_id_;
    update.status = JobStatus::FAILED;
    update.status_message = std::string("Failed");
    update.error_message = error_message;
    return store_->update_job_status(update);
}

bool JobReporter::is_canceled() {
    auto job = store_->get_job(job_id_);
    return !job || job->status == JobStatus::CANCELED;
}

} // namespace hive
