#pragma once

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace hive {

// ============================================================================
// Job Types & State Model
// Shared by the stores, the dispatcher, the scheduler and processors
// ============================================================================

enum class JobType : uint8_t {
    GENERIC_STREAM,
    TRANSCRIPTION,
    REGEX_GENERATION,
    PATH_CORRECTION,
    IMPLEMENTATION_PLAN,
    TEXT_IMPROVEMENT,
    GUIDANCE_GENERATION
};

/**
 * Job lifecycle:
 *
 *   queued -> acknowledged_by_worker
 *          -> {preparing_input -> generating_stream -> processing_stream}*
 *          -> running -> completed | completed_by_tag | failed | canceled
 *
 * Simple jobs may go straight from running to completed. canceled can be
 * entered from any non-terminal state. queued is only re-entered through
 * a stale lease reset or a retry requeue.
 */
enum class JobStatus : uint8_t {
    QUEUED,
    ACKNOWLEDGED_BY_WORKER,
    PREPARING_INPUT,
    GENERATING_STREAM,
    PROCESSING_STREAM,
    RUNNING,
    COMPLETED,
    COMPLETED_BY_TAG,
    FAILED,
    CANCELED
};

const std::vector<JobType>& all_job_types();

std::string to_string(JobType type);
std::string to_string(JobStatus status);

std::optional<JobType> parse_job_type(const std::string& value);
std::optional<JobStatus> parse_job_status(const std::string& value);

bool is_terminal(JobStatus status);
bool is_streaming(JobStatus status);

// Not terminal: still owned by a caller, the store or a worker
inline bool is_active(JobStatus status) { return !is_terminal(status); }

/**
 * Whether a generic status update may move a job from `from` to `to`.
 * Terminal states never change and queued is reserved for the dedicated
 * store operations (stale reset, retry requeue). A queued job must be
 * claimed before it can report progress.
 */
bool can_transition(JobStatus from, JobStatus to);

struct Job {
    std::string id;
    std::string session_id;
    JobType type = JobType::GENERIC_STREAM;
    nlohmann::json payload = nlohmann::json::object();
    int priority = 0;
    JobStatus status = JobStatus::QUEUED;
    std::string status_message;
    std::string sub_status_message;
    std::optional<int> progress_percentage;
    std::chrono::system_clock::time_point created_at;
    std::chrono::system_clock::time_point updated_at;
    std::optional<std::chrono::system_clock::time_point> started_at;
    std::optional<std::chrono::system_clock::time_point> ended_at;
    std::optional<std::chrono::system_clock::time_point> process_after;
    std::string response;
    std::string error_message;
    int64_t tokens_sent = 0;
    int64_t tokens_received = 0;
    nlohmann::json metadata = nlohmann::json::object();
    int retry_count = 0;

    nlohmann::json to_json() const;
};

// In-memory projection of a claimed job, alive until dispatched
struct QueuedJob {
    std::string id;
    std::string session_id;
    JobType type = JobType::GENERIC_STREAM;
    nlohmann::json payload;
    int priority = 0;
    int retry_count = 0;
    uint64_t sequence = 0;   // assigned by JobQueue::enqueue

    static QueuedJob from_job(const Job& job);
};

// Partial update. Unset fields are left untouched.
struct JobStatusUpdate {
    std::string id;
    JobStatus status;
    std::optional<std::string> status_message;
    std::optional<std::string> sub_status_message;
    std::optional<std::string> error_message;
    std::optional<std::string> response;
    std::optional<int> progress_percentage;
    std::optional<int64_t> tokens_sent;
    std::optional<int64_t> tokens_received;
    std::optional<nlohmann::json> metadata;   // merged into existing metadata
};

// Uniform processor result
struct ProcessResult {
    bool success = false;
    std::string message;
    nlohmann::json data;                 // null when the processor returns nothing
    std::optional<std::string> error;

    static ProcessResult ok(const std::string& message, nlohmann::json data = nullptr) {
        return ProcessResult{true, message, std::move(data), std::nullopt};
    }
    static ProcessResult failure(const std::string& error) {
        return ProcessResult{false, error, nullptr, error};
    }
};

// ============================================================================
// Error types
// ============================================================================

// Input can never succeed; the job is failed without retries
class JobValidationError : public std::runtime_error {
public:
    explicit JobValidationError(const std::string& what) : std::runtime_error(what) {}
};

// Referenced job or resource does not exist; not retried either
class JobNotFoundError : public std::runtime_error {
public:
    explicit JobNotFoundError(const std::string& what) : std::runtime_error(what) {}
};

// Milliseconds since epoch helpers used by the stores and to_json
int64_t to_epoch_ms(std::chrono::system_clock::time_point tp);
std::chrono::system_clock::time_point from_epoch_ms(int64_t ms);

} // namespace hive
