#include "hive/processor_registry.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

namespace hive {

void ProcessorRegistry::register_processor(JobType type, std::shared_ptr<JobProcessor> processor) {
    if (!processor) {
        throw std::invalid_argument("Cannot register a null processor for " + to_string(type));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = processors_.find(type);
    if (it != processors_.end()) {
        spdlog::warn("Replacing processor already registered for job type {}", to_string(type));
        it->second = std::move(processor);
        return;
    }

    processors_.emplace(type, std::move(processor));
    spdlog::debug("Registered processor for job type {}", to_string(type));
}

std::shared_ptr<JobProcessor> ProcessorRegistry::get_processor(JobType type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = processors_.find(type);
    return it != processors_.end() ? it->second : nullptr;
}

bool ProcessorRegistry::has_processor(JobType type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return processors_.count(type) > 0;
}

std::vector<JobType> ProcessorRegistry::list_registered_types() const {
    std::vector<JobType> types;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        types.reserve(processors_.size());
        for (const auto& [type, processor] : processors_) {
            types.push_back(type);
        }
    }
    std::sort(types.begin(), types.end());
    return types;
}

} // namespace hive
