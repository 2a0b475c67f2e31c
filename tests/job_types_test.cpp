/**
 * Job type and state model tests
 *
 * - wire names for job types and statuses
 * - terminal / streaming classification
 * - allowed status transitions
 * - JSON projection of a job
 */

#include "test_harness.hpp"

using namespace hive;

TEST(test_job_type_wire_names) {
    ASSERT_EQ(to_string(JobType::IMPLEMENTATION_PLAN), "implementation_plan", "implementation_plan wire name");
    ASSERT_EQ(to_string(JobType::GENERIC_STREAM), "generic_stream", "generic_stream wire name");
    ASSERT_EQ(all_job_types().size(), 7u, "Seven job types");

    for (JobType type : all_job_types()) {
        auto parsed = parse_job_type(to_string(type));
        ASSERT(parsed.has_value(), "Every wire name parses back: " + to_string(type));
        ASSERT(*parsed == type, "Parsed type matches: " + to_string(type));
    }
}

TEST(test_unknown_names_rejected) {
    ASSERT(!parse_job_type("image_generation").has_value(), "Unknown type is rejected");
    ASSERT(!parse_job_type("").has_value(), "Empty type is rejected");
    ASSERT(!parse_job_type("Transcription").has_value(), "Type names are case sensitive");
    ASSERT(!parse_job_status("done").has_value(), "Unknown status is rejected");
    ASSERT(parse_job_status("acknowledged_by_worker") == JobStatus::ACKNOWLEDGED_BY_WORKER,
           "acknowledged_by_worker parses");
}

TEST(test_terminal_states) {
    ASSERT(is_terminal(JobStatus::COMPLETED), "completed is terminal");
    ASSERT(is_terminal(JobStatus::COMPLETED_BY_TAG), "completed_by_tag is terminal");
    ASSERT(is_terminal(JobStatus::FAILED), "failed is terminal");
    ASSERT(is_terminal(JobStatus::CANCELED), "canceled is terminal");

    ASSERT(!is_terminal(JobStatus::QUEUED), "queued is not terminal");
    ASSERT(!is_terminal(JobStatus::ACKNOWLEDGED_BY_WORKER), "acknowledged_by_worker is not terminal");
    ASSERT(!is_terminal(JobStatus::RUNNING), "running is not terminal");
    ASSERT(is_active(JobStatus::GENERATING_STREAM), "generating_stream is active");

    ASSERT(is_streaming(JobStatus::PREPARING_INPUT), "preparing_input is a streaming state");
    ASSERT(is_streaming(JobStatus::PROCESSING_STREAM), "processing_stream is a streaming state");
    ASSERT(!is_streaming(JobStatus::RUNNING), "running is not a streaming state");
}

TEST(test_transitions_from_terminal_refused) {
    for (JobStatus from : {JobStatus::COMPLETED, JobStatus::COMPLETED_BY_TAG,
                           JobStatus::FAILED, JobStatus::CANCELED}) {
        ASSERT(!can_transition(from, JobStatus::RUNNING), "Terminal job cannot run again: " + to_string(from));
        ASSERT(!can_transition(from, JobStatus::COMPLETED), "Terminal job cannot complete: " + to_string(from));
        ASSERT(!can_transition(from, JobStatus::CANCELED), "Terminal job cannot be canceled: " + to_string(from));
    }
}

TEST(test_lifecycle_transitions) {
    ASSERT(can_transition(JobStatus::QUEUED, JobStatus::ACKNOWLEDGED_BY_WORKER), "queued -> acknowledged");
    ASSERT(can_transition(JobStatus::ACKNOWLEDGED_BY_WORKER, JobStatus::PREPARING_INPUT), "acknowledged -> preparing_input");
    ASSERT(can_transition(JobStatus::GENERATING_STREAM, JobStatus::PROCESSING_STREAM), "generating -> processing");
    ASSERT(can_transition(JobStatus::PROCESSING_STREAM, JobStatus::GENERATING_STREAM), "streaming states may repeat");
    ASSERT(can_transition(JobStatus::RUNNING, JobStatus::COMPLETED), "running -> completed");
    ASSERT(can_transition(JobStatus::RUNNING, JobStatus::COMPLETED_BY_TAG), "running -> completed_by_tag");
    ASSERT(can_transition(JobStatus::QUEUED, JobStatus::CANCELED), "queued -> canceled");
    ASSERT(can_transition(JobStatus::ACKNOWLEDGED_BY_WORKER, JobStatus::FAILED), "acknowledged -> failed");

    ASSERT(!can_transition(JobStatus::RUNNING, JobStatus::QUEUED), "queued is not reachable by update");
    ASSERT(!can_transition(JobStatus::ACKNOWLEDGED_BY_WORKER, JobStatus::QUEUED), "lease reset is not an update");
    ASSERT(!can_transition(JobStatus::RUNNING, JobStatus::ACKNOWLEDGED_BY_WORKER), "running cannot go back to a lease");
}

TEST(test_progress_needs_claim) {
    ASSERT(can_transition(JobStatus::ACKNOWLEDGED_BY_WORKER, JobStatus::RUNNING), "acknowledged -> running");
    ASSERT(!can_transition(JobStatus::QUEUED, JobStatus::RUNNING), "queued cannot skip the claim to running");
    ASSERT(!can_transition(JobStatus::QUEUED, JobStatus::GENERATING_STREAM), "queued cannot start streaming");
    ASSERT(!can_transition(JobStatus::QUEUED, JobStatus::PREPARING_INPUT), "queued cannot prepare input");
    ASSERT(can_transition(JobStatus::QUEUED, JobStatus::FAILED), "queued -> failed");
    ASSERT(can_transition(JobStatus::QUEUED, JobStatus::CANCELED), "queued -> canceled");
}

TEST(test_job_to_json) {
    Job job = make_job("job-1", JobType::REGEX_GENERATION, 4, "session-9");
    job.created_at = from_epoch_ms(1700000000000);
    job.updated_at = from_epoch_ms(1700000000500);
    job.progress_percentage = 40;
    job.metadata = {{"model", "test-model"}};

    auto j = job.to_json();
    ASSERT_EQ(j["id"], "job-1", "id serialized");
    ASSERT_EQ(j["type"], "regex_generation", "type uses wire name");
    ASSERT_EQ(j["status"], "queued", "status uses wire name");
    ASSERT_EQ(j["sessionId"], "session-9", "session id serialized");
    ASSERT_EQ(j["priority"], 4, "priority serialized");
    ASSERT_EQ(j["createdAt"], 1700000000000, "createdAt in epoch ms");
    ASSERT_EQ(j["progressPercentage"], 40, "progress serialized");
    ASSERT(j["startedAt"].is_null(), "startedAt null until the job runs");
    ASSERT_EQ(j["payload"]["jobId"], "job-1", "payload carries jobId");
    ASSERT_EQ(j["metadata"]["model"], "test-model", "metadata serialized");
}

TEST(test_queued_job_projection) {
    Job job = make_job("job-2", JobType::TRANSCRIPTION, 7, "session-1");
    job.retry_count = 2;

    auto queued = QueuedJob::from_job(job);
    ASSERT_EQ(queued.id, "job-2", "id copied");
    ASSERT(queued.type == JobType::TRANSCRIPTION, "type copied");
    ASSERT_EQ(queued.priority, 7, "priority copied");
    ASSERT_EQ(queued.session_id, "session-1", "session copied");
    ASSERT_EQ(queued.retry_count, 2, "retry count copied");
    ASSERT_EQ(queued.payload["jobId"], "job-2", "payload copied");
}

TEST(test_process_result_helpers) {
    auto ok = ProcessResult::ok("done", "output text");
    ASSERT(ok.success, "ok() is a success");
    ASSERT(!ok.error.has_value(), "ok() carries no error");
    ASSERT_EQ(ok.data, "output text", "ok() keeps data");

    auto failed = ProcessResult::failure("model unavailable");
    ASSERT(!failed.success, "failure() is not a success");
    ASSERT(failed.error.has_value(), "failure() carries the error");
    ASSERT_EQ(*failed.error, "model unavailable", "failure() error text");
}

int main() {
    std::cout << "=== Job Model Tests ===" << std::endl;
    RUN_TEST(test_job_type_wire_names);
    RUN_TEST(test_unknown_names_rejected);
    RUN_TEST(test_terminal_states);
    RUN_TEST(test_transitions_from_terminal_refused);
    RUN_TEST(test_lifecycle_transitions);
    RUN_TEST(test_progress_needs_claim);
    RUN_TEST(test_job_to_json);
    RUN_TEST(test_queued_job_projection);
    RUN_TEST(test_process_result_helpers);

    return report_results("Job model");
}
