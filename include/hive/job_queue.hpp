#pragma once

#include "hive/job_types.hpp"
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <set>
#include <string>

namespace hive {

struct JobQueueStats {
    size_t size = 0;
    uint64_t total_enqueued = 0;
    uint64_t total_dequeued = 0;
    uint64_t total_removed = 0;
    std::optional<int> highest_priority;

    nlohmann::json to_json() const;
};

/**
 * Thread-safe priority queue of claimed jobs waiting for a worker.
 *
 * Higher priority first; equal priorities leave in enqueue order. Jobs are
 * kept in an ordered set so cancellation can drop them before dispatch.
 */
class JobQueue {
public:
    // Never blocks; assigns the FIFO sequence number
    void enqueue(QueuedJob job);

    std::optional<QueuedJob> dequeue();

    // Blocks until a job is available, the timeout elapses or close() is called
    std::optional<QueuedJob> wait_dequeue(std::chrono::milliseconds timeout);

    // Drop a job that has not been handed to a worker yet
    bool remove(const std::string& id);
    size_t remove_session(const std::string& session_id);

    void close();
    bool is_closed() const;

    size_t size() const;
    bool empty() const;
    JobQueueStats stats() const;

private:
    // Dequeue order: priority desc, then sequence asc
    struct DispatchOrder {
        bool operator()(const QueuedJob& a, const QueuedJob& b) const {
            if (a.priority != b.priority) return a.priority > b.priority;
            return a.sequence < b.sequence;
        }
    };

    std::optional<QueuedJob> pop_locked();

    std::set<QueuedJob, DispatchOrder> jobs_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    uint64_t next_sequence_ = 0;
    uint64_t total_enqueued_ = 0;
    uint64_t total_dequeued_ = 0;
    uint64_t total_removed_ = 0;
    bool closed_ = false;
};

} // namespace hive
