#pragma once

#include "hive/job_types.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace hive {

/**
 * JobStore - contract for the durable job table
 *
 * The store is the single source of truth for job state. Every mutating
 * operation refreshes updated_at and refuses to touch a terminal row, so a
 * canceled job is never overwritten by a late completion.
 *
 * Implementations throw std::runtime_error on storage failures (connection
 * lost, query error). Callers in the scheduling core catch and log them.
 */
class JobStore {
public:
    virtual ~JobStore() = default;

    /**
     * Insert a new job row. created_at/updated_at are assigned by the store.
     * @throws std::runtime_error if the id already exists or the insert fails
     */
    virtual void create_job(const Job& job) = 0;

    /**
     * Atomically select up to `limit` queued jobs (priority desc, created_at
     * asc, process_after reached) and flip them to acknowledged_by_worker in
     * the same operation. Concurrent callers never receive the same id.
     */
    virtual std::vector<Job> claim_queued_jobs(int limit) = 0;

    /**
     * Partial update. Returns false when the job does not exist, is already
     * terminal, or the transition is not allowed (see can_transition).
     */
    virtual bool update_job_status(const JobStatusUpdate& update) = 0;

    /**
     * Conditional acknowledged_by_worker -> running, done by the dispatcher
     * right before a processor is invoked. Only one caller can win for a
     * given lease; a running row is no longer touched by the stale sweep.
     */
    virtual bool start_processing(const std::string& id, const std::string& status_message) = 0;

    /**
     * Append a streamed chunk to the response and add to tokens_received.
     * Returns false when the job does not exist or is terminal.
     */
    virtual bool append_to_response(const std::string& id,
                                    const std::string& chunk,
                                    int64_t tokens_received) = 0;

    /**
     * Put a non-terminal job back to queued for another attempt:
     * retry_count + 1, error_message kept, claimable after `delay`.
     */
    virtual bool requeue_for_retry(const std::string& id,
                                   const std::string& error_message,
                                   std::chrono::milliseconds delay) = 0;

    /**
     * Reset acknowledged_by_worker rows whose updated_at is older than
     * `threshold_seconds` back to queued. Returns the number of rows reset.
     */
    virtual int reset_stale_acknowledged(int threshold_seconds) = 0;

    // Cancellation by an external actor; only non-terminal rows are affected
    virtual bool cancel_job(const std::string& id, const std::string& reason) = 0;
    virtual int cancel_session_jobs(const std::string& session_id, const std::string& reason) = 0;

    virtual std::optional<Job> get_job(const std::string& id) = 0;
    virtual std::vector<Job> list_active_jobs() = 0;
    virtual std::vector<Job> list_session_jobs(const std::string& session_id) = 0;
};

} // namespace hive
