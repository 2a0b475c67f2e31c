#include "hive/job_types.hpp"

namespace hive {

namespace {

struct TypeName {
    JobType type;
    const char* name;
};

struct StatusName {
    JobStatus status;
    const char* name;
};

constexpr TypeName TYPE_NAMES[] = {
    {JobType::GENERIC_STREAM,      "generic_stream"},
    {JobType::TRANSCRIPTION,       "transcription"},
    {JobType::REGEX_GENERATION,    "regex_generation"},
    {JobType::PATH_CORRECTION,     "path_correction"},
    {JobType::IMPLEMENTATION_PLAN, "implementation_plan"},
    {JobType::TEXT_IMPROVEMENT,    "text_improvement"},
    {JobType::GUIDANCE_GENERATION, "guidance_generation"},
};

constexpr StatusName STATUS_NAMES[] = {
    {JobStatus::QUEUED,                 "queued"},
    {JobStatus::ACKNOWLEDGED_BY_WORKER, "acknowledged_by_worker"},
    {JobStatus::PREPARING_INPUT,        "preparing_input"},
    {JobStatus::GENERATING_STREAM,      "generating_stream"},
    {JobStatus::PROCESSING_STREAM,      "processing_stream"},
    {JobStatus::RUNNING,                "running"},
    {JobStatus::COMPLETED,              "completed"},
    {JobStatus::COMPLETED_BY_TAG,       "completed_by_tag"},
    {JobStatus::FAILED,                 "failed"},
    {JobStatus::CANCELED,               "canceled"},
};

nlohmann::json optional_time(const std::optional<std::chrono::system_clock::time_point>& tp) {
    if (!tp) return nullptr;
    return to_epoch_ms(*tp);
}

} // namespace

const std::vector<JobType>& all_job_types() {
    static const std::vector<JobType> types = [] {
        std::vector<JobType> out;
        for (const auto& entry : TYPE_NAMES) out.push_back(entry.type);
        return out;
    }();
    return types;
}

std::string to_string(JobType type) {
    for (const auto& entry : TYPE_NAMES) {
        if (entry.type == type) return entry.name;
    }
    return "unknown";
}

std::string to_string(JobStatus status) {
    for (const auto& entry : STATUS_NAMES) {
        if (entry.status == status) return entry.name;
    }
    return "unknown";
}

std::optional<JobType> parse_job_type(const std::string& value) {
    for (const auto& entry : TYPE_NAMES) {
        if (value == entry.name) return entry.type;
    }
    return std::nullopt;
}

std::optional<JobStatus> parse_job_status(const std::string& value) {
    for (const auto& entry : STATUS_NAMES) {
        if (value == entry.name) return entry.status;
    }
    return std::nullopt;
}

bool is_terminal(JobStatus status) {
    switch (status) {
        case JobStatus::COMPLETED:
        case JobStatus::COMPLETED_BY_TAG:
        case JobStatus::FAILED:
        case JobStatus::CANCELED:
            return true;
        default:
            return false;
    }
}

bool is_streaming(JobStatus status) {
    return status == JobStatus::PREPARING_INPUT ||
           status == JobStatus::GENERATING_STREAM ||
           status == JobStatus::PROCESSING_STREAM;
}

bool can_transition(JobStatus from, JobStatus to) {
    if (is_terminal(from)) return false;
    if (to == JobStatus::QUEUED) return false;
    // A claimed job cannot be pushed back to a lease by a status update
    if (to == JobStatus::ACKNOWLEDGED_BY_WORKER) {
        return from == JobStatus::QUEUED || from == JobStatus::ACKNOWLEDGED_BY_WORKER;
    }
    // Failure and cancel apply to any live row; progress needs a claim first
    if (is_terminal(to)) return true;
    return from != JobStatus::QUEUED;
}

int64_t to_epoch_ms(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point from_epoch_ms(int64_t ms) {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

nlohmann::json Job::to_json() const {
    nlohmann::json j = {
        {"id", id},
        {"sessionId", session_id},
        {"type", to_string(type)},
        {"payload", payload},
        {"priority", priority},
        {"status", to_string(status)},
        {"statusMessage", status_message},
        {"subStatusMessage", sub_status_message},
        {"createdAt", to_epoch_ms(created_at)},
        {"updatedAt", to_epoch_ms(updated_at)},
        {"startedAt", optional_time(started_at)},
        {"endedAt", optional_time(ended_at)},
        {"processAfter", optional_time(process_after)},
        {"response", response},
        {"errorMessage", error_message},
        {"tokensSent", tokens_sent},
        {"tokensReceived", tokens_received},
        {"metadata", metadata},
        {"retryCount", retry_count},
    };
    if (progress_percentage) {
        j["progressPercentage"] = *progress_percentage;
    } else {
        j["progressPercentage"] = nullptr;
    }
    return j;
}

QueuedJob QueuedJob::from_job(const Job& job) {
    QueuedJob queued;
    queued.id = job.id;
    queued.session_id = job.session_id;
    queued.type = job.type;
    queued.payload = job.payload;
    queued.priority = job.priority;
    queued.retry_count = job.retry_count;
    return queued;
}

} // namespace hive
