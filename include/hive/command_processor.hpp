#pragma once

#include "hive/job_store.hpp"
#include "hive/processor_registry.hpp"
#include <memory>

namespace hive {

/**
 * Processor that delegates a job to an external command.
 *
 * The payload is written to a temporary JSON file whose path is appended
 * as the last argument. Combined stdout/stderr becomes the job response;
 * a non-zero exit status is reported as a recoverable failure.
 */
class CommandProcessor : public JobProcessor {
public:
    CommandProcessor(std::string command, std::shared_ptr<JobStore> store);

    ProcessResult process(const nlohmann::json& payload) override;

    const std::string& command() const { return command_; }

private:
    std::string command_;
    std::shared_ptr<JobStore> store_;
};

// HIVE_CMD_<TYPE> environment variable for a job type, e.g. HIVE_CMD_TEXT_IMPROVEMENT
std::string command_env_var(JobType type);

/**
 * Register a CommandProcessor for every job type whose HIVE_CMD_<TYPE>
 * variable is set. Returns the number of processors registered.
 */
int register_command_processors(ProcessorRegistry& registry, std::shared_ptr<JobStore> store);

} // namespace hive
