#include "hive/job_queue.hpp"
#include <spdlog/spdlog.h>

namespace hive {

nlohmann::json JobQueueStats::to_json() const {
    return {
        {"size", size},
        {"totalEnqueued", total_enqueued},
        {"totalDequeued", total_dequeued},
        {"totalRemoved", total_removed},
        {"highestPriority", highest_priority ? nlohmann::json(*highest_priority) : nlohmann::json()}
    };
}

void JobQueue::enqueue(QueuedJob job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        job.sequence = next_sequence_++;
        spdlog::debug("Queued job {} ({}, priority {})", job.id, to_string(job.type), job.priority);
        jobs_.insert(std::move(job));
        ++total_enqueued_;
    }
    cv_.notify_one();
}

std::optional<QueuedJob> JobQueue::pop_locked() {
    if (jobs_.empty()) return std::nullopt;

    auto node = jobs_.extract(jobs_.begin());
    ++total_dequeued_;
    return std::move(node.value());
}

std::optional<QueuedJob> JobQueue::dequeue() {
    std::lock_guard<std::mutex> lock(mutex_);
    return pop_locked();
}

std::optional<QueuedJob> JobQueue::wait_dequeue(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return closed_ || !jobs_.empty(); });
    if (closed_) return std::nullopt;
    return pop_locked();
}

bool JobQueue::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = jobs_.begin(); it != jobs_.end(); ++it) {
        if (it->id == id) {
            jobs_.erase(it);
            ++total_removed_;
            return true;
        }
    }
    return false;
}

size_t JobQueue::remove_session(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = 0;
    for (auto it = jobs_.begin(); it != jobs_.end();) {
        if (it->session_id == session_id) {
            it = jobs_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    total_removed_ += removed;
    return removed;
}

void JobQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool JobQueue::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t JobQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

bool JobQueue::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.empty();
}

JobQueueStats JobQueue::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    JobQueueStats stats;
    stats.size = jobs_.size();
    stats.total_enqueued = total_enqueued_;
    stats.total_dequeued = total_dequeued_;
    stats.total_removed = total_removed_;
    if (!jobs_.empty()) {
        stats.highest_priority = jobs_.begin()->priority;
    }
    return stats;
}

} // namespace hive
