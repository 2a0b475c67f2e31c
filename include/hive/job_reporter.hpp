#pragma once

#include "hive/job_store.hpp"
#include <memory>

namespace hive {

/**
 * Progress writer handed to processors for the job they are running.
 *
 * Every call is a single store write. Once the row is terminal the store
 * refuses the write and the call returns false, which is how a processor
 * notices that its job was canceled.
 */
class JobReporter {
public:
    JobReporter(std::shared_ptr<JobStore> store, std::string job_id);

    // Reads payload["jobId"]; throws JobValidationError when it is missing
    static JobReporter from_payload(std::shared_ptr<JobStore> store, const nlohmann::json& payload);

    const std::string& job_id() const { return job_id_; }

    bool mark_running(const std::string& message = "Processing", int64_t tokens_sent = 0);

    // state must be preparing_input, generating_stream or processing_stream
    bool set_stream_state(JobStatus state,
                          const std::string& sub_status_message,
                          std::optional<int> progress_percentage = std::nullopt);

    bool append_response(const std::string& chunk, int64_t tokens = 0);

    bool complete(const std::string& response, const nlohmann::json& metadata = nullptr);
    bool complete_by_tag(const std::string& response, const std::string& tag);
    bool fail(const std::string& error_message);

    bool is_canceled();

private:
    std::shared_ptr<JobStore> store_;
    std::string job_id_;
};

} // namespace hive
