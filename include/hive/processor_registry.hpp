#pragma once

#include "hive/job_types.hpp"
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace hive {

/**
 * Executor bound to one job type.
 *
 * process() may report failure either by returning ProcessResult::failure()
 * or by throwing. JobValidationError and JobNotFoundError are treated as
 * permanent; anything else is retried up to the type's retry ceiling.
 */
class JobProcessor {
public:
    virtual ~JobProcessor() = default;
    virtual ProcessResult process(const nlohmann::json& payload) = 0;
};

/**
 * Maps each JobType to exactly one JobProcessor.
 *
 * Bindings are normally made once at startup, before the scheduler runs.
 */
class ProcessorRegistry {
public:
    // Replaces an existing binding for the same type (logged as a warning)
    void register_processor(JobType type, std::shared_ptr<JobProcessor> processor);

    // nullptr when no processor is bound
    std::shared_ptr<JobProcessor> get_processor(JobType type) const;

    bool has_processor(JobType type) const;
    std::vector<JobType> list_registered_types() const;

private:
    std::unordered_map<JobType, std::shared_ptr<JobProcessor>> processors_;
    mutable std::mutex mutex_;
};

} // namespace hive
