#pragma once

#include "hive/config.hpp"
#include "hive/job_store.hpp"
#include "hive/processor_registry.hpp"
#include <memory>

namespace hive {

enum class DispatchOutcome {
    COMPLETED,
    FAILED,
    RETRY_SCHEDULED,
    SKIPPED
};

std::string to_string(DispatchOutcome outcome);

struct DispatchResult {
    DispatchOutcome outcome;
    std::string message;
};

/**
 * Runs one claimed job through its processor and records the outcome.
 *
 * The durable row is re-read before anything runs, so a job canceled or
 * re-claimed while it waited in the queue is skipped without calling the
 * processor. The row is moved to running before the processor is invoked,
 * which takes it out of the stale lease reset. Processor failures never
 * escape dispatch(); store errors do.
 */
class Dispatcher {
public:
    Dispatcher(std::shared_ptr<JobStore> store,
               std::shared_ptr<ProcessorRegistry> registry,
               RetryConfig retry_config = RetryConfig{});

    DispatchResult dispatch(const QueuedJob& job);

    // Delay applied to the next attempt after `retry_count` failed ones
    std::chrono::milliseconds retry_delay(int retry_count) const;

private:
    std::shared_ptr<JobStore> store_;
    std::shared_ptr<ProcessorRegistry> registry_;
    RetryConfig retry_config_;

    DispatchResult finalize_success(const QueuedJob& job, const ProcessResult& result);
    DispatchResult handle_failure(const Job& job, const std::string& error);
    DispatchResult mark_failed(const std::string& id, const std::string& error);
};

} // namespace hive
