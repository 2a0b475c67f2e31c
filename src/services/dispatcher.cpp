#include "hive/dispatcher.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace hive {

std::string to_string(DispatchOutcome outcome) {
    switch (outcome) {
        case DispatchOutcome::COMPLETED: return "completed";
        case DispatchOutcome::FAILED: return "failed";
        case DispatchOutcome::RETRY_SCHEDULED: return "retry_scheduled";
        case DispatchOutcome::SKIPPED: return "skipped";
    }
    return "unknown";
}

Dispatcher::Dispatcher(std::shared_ptr<JobStore> store,
                       std::shared_ptr<ProcessorRegistry> registry,
                       RetryConfig retry_config)
    : store_(std::move(store)), registry_(std::move(registry)), retry_config_(std::move(retry_config)) {
    if (!store_ || !registry_) {
        throw std::invalid_argument("Dispatcher requires a job store and a processor registry");
    }
}

std::chrono::milliseconds Dispatcher::retry_delay(int retry_count) const {
    if (retry_config_.retry_delay_ms <= 0) {
        return std::chrono::milliseconds(0);
    }

    int64_t cap = std::max(retry_config_.max_retry_delay_ms, retry_config_.retry_delay_ms);
    int64_t delay = retry_config_.retry_delay_ms;
    for (int i = 0; i < retry_count && delay < cap; ++i) {
        delay *= 2;
    }
    return std::chrono::milliseconds(std::min(delay, cap));
}

DispatchResult Dispatcher::dispatch(const QueuedJob& queued) {
    auto current = store_->get_job(queued.id);
    if (!current) {
        spdlog::warn("Job {} no longer exists, skipping dispatch", queued.id);
        return {DispatchOutcome::SKIPPED, "Job not found"};
    }
    if (is_terminal(current->status)) {
        spdlog::info("Job {} is already {}, skipping dispatch", queued.id, to_string(current->status));
        return {DispatchOutcome::SKIPPED, "Job already " + to_string(current->status)};
    }
    if (current->status != JobStatus::ACKNOWLEDGED_BY_WORKER) {
        // Lease was reset and possibly re-claimed elsewhere
        spdlog::warn("Job {} is {} instead of acknowledged_by_worker, skipping dispatch",
                     queued.id, to_string(current->status));
        return {DispatchOutcome::SKIPPED, "Job no longer leased to this worker"};
    }

    auto processor = registry_->get_processor(queued.type);
    if (!processor) {
        return mark_failed(queued.id, "No processor registered for job type " + to_string(queued.type));
    }

    // Leaving acknowledged_by_worker takes the row out of the stale sweep;
    // losing this race means another dispatch already owns the lease
    if (!store_->start_processing(queued.id, "Processing")) {
        spdlog::warn("Job {} could not be moved to running, skipping dispatch", queued.id);
        return {DispatchOutcome::SKIPPED, "Job no longer leased to this worker"};
    }

    spdlog::debug("Dispatching job {} ({}, attempt {})", queued.id, to_string(queued.type),
                  current->retry_count + 1);

    ProcessResult result;
    try {
        result = processor->process(queued.payload);
    } catch (const JobValidationError& e) {
        return mark_failed(queued.id, std::string("Validation error: ") + e.what());
    } catch (const JobNotFoundError& e) {
        return mark_failed(queued.id, std::string("Not found: ") + e.what());
    } catch (const std::exception& e) {
        return handle_failure(*current, e.what());
    }

    if (result.success) {
        return finalize_success(queued, result);
    }

    std::string error = result.error.value_or(result.message);
    if (error.empty()) error = "Processor reported failure";
    return handle_failure(*current, error);
}

DispatchResult Dispatcher::finalize_success(const QueuedJob& queued, const ProcessResult& result) {
    auto row = store_->get_job(queued.id);
    if (!row) {
        return {DispatchOutcome::SKIPPED, "Job disappeared during processing"};
    }

    if (is_terminal(row->status)) {
        // The processor already recorded its own outcome, or the job was canceled
        if (row->status == JobStatus::COMPLETED || row->status == JobStatus::COMPLETED_BY_TAG) {
            spdlog::info("Job {} completed", queued.id);
            return {DispatchOutcome::COMPLETED, result.message};
        }
        spdlog::info("Job {} finished processing but is {}, keeping it", queued.id, to_string(row->status));
        return {DispatchOutcome::SKIPPED, "Job already " + to_string(row->status)};
    }

    JobStatusUpdate update;
    update.id = queued.id;
    update.status = JobStatus::COMPLETED;
    update.status_message = result.message.empty() ? std::string("Completed") : result.message;
    update.progress_percentage = 100;
    if (result.data.is_string()) {
        update.response = result.data.get<std::string>();
    } else if (!result.data.is_null()) {
        update.response = result.data.dump();
    } else {
        update.response = result.message;
    }

    if (!store_->update_job_status(update)) {
        spdlog::info("Job {} changed state before completion was recorded", queued.id);
        return {DispatchOutcome::SKIPPED, "Completion not applied"};
    }

    spdlog::info("Job {} completed", queued.id);
    return {DispatchOutcome::COMPLETED, result.message};
}

DispatchResult Dispatcher::handle_failure(const Job& job, const std::string& error) {
    int max_retries = retry_config_.max_retries_for(job.type);

    if (job.retry_count < max_retries) {
        auto delay = retry_delay(job.retry_count);
        if (store_->requeue_for_retry(job.id, error, delay)) {
            spdlog::warn("Job {} failed (attempt {}/{}), retry scheduled: {}",
                         job.id, job.retry_count + 1, max_retries + 1, error);
            return {DispatchOutcome::RETRY_SCHEDULED, error};
        }
        spdlog::info("Job {} failed but could not be requeued (already terminal)", job.id);
        return {DispatchOutcome::SKIPPED, error};
    }

    spdlog::warn("Job {} exhausted its {} retries", job.id, max_retries);
    return mark_failed(job.id, error);
}

DispatchResult Dispatcher::mark_failed(const std::string& id, const std::string& error) {
    JobStatusUpdate update;
    update.id = id;
    update.status = JobStatus::FAILED;
    update.status_message = std::string("Failed");
    update.error_message = error;

    if (!store_->update_job_status(update)) {
        spdlog::info("Job {} failure not recorded, row already terminal", id);
        return {DispatchOutcome::SKIPPED, error};
    }

    spdlog::error("Job {} failed: {}", id, error);
    return {DispatchOutcome::FAILED, error};
}

} // namespace hive
