#pragma once

#include "hive/config.hpp"
#include "hive/dispatcher.hpp"
#include "hive/job_queue.hpp"
#include "hive/job_store.hpp"
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

namespace hive {

struct SchedulerStats {
    int active_workers = 0;
    int peak_active_workers = 0;
    int concurrency_limit = 0;
    uint64_t claimed = 0;
    uint64_t malformed = 0;
    uint64_t completed = 0;
    uint64_t failed = 0;
    uint64_t retried = 0;
    uint64_t skipped = 0;
    uint64_t stale_reset = 0;
    uint64_t timeouts_logged = 0;
    JobQueueStats queue;

    nlohmann::json to_json() const;
};

/**
 * Scheduler - bounded-concurrency execution of durable jobs
 *
 * One control thread claims queued rows from the store, sweeps stale
 * acknowledged_by_worker leases and watches for overdue jobs. A fixed pool
 * of concurrency_limit worker threads pulls from the local JobQueue and
 * runs each job through the Dispatcher, so at most concurrency_limit jobs
 * are ever in flight.
 *
 * Jobs claimed but not yet dispatched when stop() is called stay
 * acknowledged_by_worker and are recovered by the stale reset at the next
 * start().
 */
class Scheduler {
public:
    Scheduler(std::shared_ptr<JobStore> store,
              std::shared_ptr<Dispatcher> dispatcher,
              SchedulerConfig config);
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /**
     * Reset stale leases, run one immediate fetch, then start the control
     * thread and the worker pool.
     * @return false if the scheduler is already running
     */
    bool start();
    void stop();
    bool is_running() const { return running_; }

    /**
     * Claim up to (concurrency_limit - queue size) rows and queue the valid
     * ones. Malformed rows are marked failed. Returns the number queued.
     */
    int fetch_from_store();

    // Returns the number of leases put back to queued
    int reset_stale_jobs();

    // Wake the control thread for an immediate store poll
    void trigger_fetch();

    // Drop jobs still waiting in the local queue; the durable row is not touched
    bool cancel_job(const std::string& id);
    size_t cancel_session_jobs(const std::string& session_id);

    int active_workers() const { return active_workers_; }
    int peak_active_workers() const { return peak_active_workers_; }
    size_t queue_size() const { return queue_->size(); }
    SchedulerStats stats() const;

    const SchedulerConfig& config() const { return config_; }

private:
    struct InFlightJob {
        JobType type;
        std::chrono::steady_clock::time_point started;
        bool timeout_logged = false;
    };

    void control_loop();
    void worker_loop(int worker_id);
    void process_job(const QueuedJob& job);
    void check_timeouts();
    bool validate_claimed(const Job& job, std::string& reason) const;
    void fail_malformed(const Job& job, const std::string& reason);

    std::shared_ptr<JobStore> store_;
    std::shared_ptr<Dispatcher> dispatcher_;
    std::shared_ptr<JobQueue> queue_;
    SchedulerConfig config_;

    std::atomic<bool> running_{false};
    std::thread control_thread_;
    std::vector<std::thread> worker_threads_;

    std::mutex control_mutex_;
    std::condition_variable control_cv_;
    bool fetch_requested_ = false;

    mutable std::mutex in_flight_mutex_;
    std::unordered_map<std::string, InFlightJob> in_flight_;

    std::atomic<int> active_workers_{0};
    std::atomic<int> peak_active_workers_{0};

    std::atomic<uint64_t> claimed_{0};
    std::atomic<uint64_t> malformed_{0};
    std::atomic<uint64_t> completed_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<uint64_t> retried_{0};
    std::atomic<uint64_t> skipped_{0};
    std::atomic<uint64_t> stale_reset_{0};
    std::atomic<uint64_t> timeouts_logged_{0};
};

} // namespace hive
