#include "hive/scheduler.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <functional>

namespace hive {

namespace {

// Keeps active_workers_ balanced and the in-flight table clean however dispatch exits
class ActiveJobGuard {
public:
    ActiveJobGuard(std::atomic<int>& active, std::function<void()> on_exit)
        : active_(active), on_exit_(std::move(on_exit)) {}
    ~ActiveJobGuard() {
        --active_;
        on_exit_();
    }

    ActiveJobGuard(const ActiveJobGuard&) = delete;
    ActiveJobGuard& operator=(const ActiveJobGuard&) = delete;

private:
    std::atomic<int>& active_;
    std::function<void()> on_exit_;
};

} // anonymous namespace

nlohmann::json SchedulerStats::to_json() const {
    return {
        {"activeWorkers", active_workers},
        {"peakActiveWorkers", peak_active_workers},
        {"concurrencyLimit", concurrency_limit},
        {"claimed", claimed},
        {"malformed", malformed},
        {"completed", completed},
        {"failed", failed},
        {"retried", retried},
        {"skipped", skipped},
        {"staleReset", stale_reset},
        {"timeoutsLogged", timeouts_logged},
        {"queue", queue.to_json()}
    };
}

Scheduler::Scheduler(std::shared_ptr<JobStore> store,
                     std::shared_ptr<Dispatcher> dispatcher,
                     SchedulerConfig config)
    : store_(std::move(store)),
      dispatcher_(std::move(dispatcher)),
      queue_(std::make_shared<JobQueue>()),
      config_(config) {
    if (!store_ || !dispatcher_) {
        throw std::invalid_argument("Scheduler requires a job store and a dispatcher");
    }
    if (config_.concurrency_limit < 1) {
        spdlog::warn("Invalid concurrency limit {}, using 1", config_.concurrency_limit);
        config_.concurrency_limit = 1;
    }
    if (config_.polling_interval_ms < 1) config_.polling_interval_ms = 1;
}

Scheduler::~Scheduler() {
    stop();
}

bool Scheduler::start() {
    if (running_) {
        spdlog::warn("Scheduler already running");
        return false;
    }

    if (queue_->is_closed()) {
        queue_ = std::make_shared<JobQueue>();
    }

    // Leases left behind by a previous process must be back in queued
    // before the first claim
    try {
        reset_stale_jobs();
    } catch (const std::exception& e) {
        spdlog::error("Initial stale job reset failed: {}", e.what());
    }

    try {
        fetch_from_store();
    } catch (const std::exception& e) {
        spdlog::error("Initial fetch from store failed: {}", e.what());
    }

    running_ = true;

    worker_threads_.reserve(static_cast<size_t>(config_.concurrency_limit));
    for (int i = 0; i < config_.concurrency_limit; ++i) {
        worker_threads_.emplace_back(&Scheduler::worker_loop, this, i);
    }
    control_thread_ = std::thread(&Scheduler::control_loop, this);

    spdlog::info("Scheduler started: concurrency_limit={}, polling_interval={}ms, db_poll_interval={}ms, "
                 "job_timeout={}ms, stale_job_timeout={}s, stale_check_interval={}ms",
                 config_.concurrency_limit, config_.polling_interval_ms, config_.db_poll_interval_ms,
                 config_.job_timeout_ms, config_.stale_job_timeout_seconds, config_.stale_check_interval_ms);
    return true;
}

void Scheduler::stop() {
    if (!running_) return;

    spdlog::info("Scheduler: Stopping...");

    {
        std::lock_guard<std::mutex> lock(control_mutex_);
        running_ = false;
    }
    control_cv_.notify_all();
    queue_->close();

    if (control_thread_.joinable()) {
        control_thread_.join();
    }
    for (auto& worker : worker_threads_) {
        if (worker.joinable()) worker.join();
    }
    worker_threads_.clear();

    size_t abandoned = queue_->size();
    if (abandoned > 0) {
        spdlog::info("Scheduler: {} claimed jobs left undispatched, stale reset will recover them", abandoned);
    }
    spdlog::info("Scheduler: Stopped");
}

void Scheduler::trigger_fetch() {
    {
        std::lock_guard<std::mutex> lock(control_mutex_);
        fetch_requested_ = true;
    }
    control_cv_.notify_one();
}

int Scheduler::reset_stale_jobs() {
    int reset = store_->reset_stale_acknowledged(config_.stale_job_timeout_seconds);
    if (reset > 0) {
        stale_reset_ += static_cast<uint64_t>(reset);
        spdlog::warn("Reset {} stale acknowledged_by_worker jobs back to queued", reset);
    }
    return reset;
}

int Scheduler::fetch_from_store() {
    int capacity = config_.concurrency_limit - static_cast<int>(queue_->size());
    if (capacity <= 0) {
        spdlog::debug("Local queue full ({} waiting), skipping claim", queue_->size());
        return 0;
    }

    auto jobs = store_->claim_queued_jobs(capacity);
    if (jobs.empty()) return 0;

    claimed_ += jobs.size();

    int queued = 0;
    for (const auto& job : jobs) {
        std::string reason;
        if (!validate_claimed(job, reason)) {
            fail_malformed(job, reason);
            continue;
        }
        queue_->enqueue(QueuedJob::from_job(job));
        ++queued;
    }

    if (config_.debug_mode) {
        spdlog::info("Claimed {} jobs, queued {} (queue size {})", jobs.size(), queued, queue_->size());
    } else {
        spdlog::debug("Claimed {} jobs, queued {}", jobs.size(), queued);
    }
    return queued;
}

bool Scheduler::validate_claimed(const Job& job, std::string& reason) const {
    if (!job.payload.is_object()) {
        reason = "Malformed job: payload is not a JSON object";
        return false;
    }
    auto it = job.payload.find("jobId");
    if (it == job.payload.end() || !it->is_string()) {
        reason = "Malformed job: payload is missing jobId";
        return false;
    }
    if (it->get<std::string>() != job.id) {
        reason = "Malformed job: payload jobId does not match job id";
        return false;
    }
    return true;
}

void Scheduler::fail_malformed(const Job& job, const std::string& reason) {
    ++malformed_;
    spdlog::error("Job {}: {}", job.id, reason);

    JobStatusUpdate update;
    update.id = job.id;
    update.status = JobStatus::FAILED;
    update.status_message = std::string("Failed");
    update.error_message = reason;

    try {
        if (!store_->update_job_status(update)) {
            spdlog::warn("Could not mark malformed job {} as failed", job.id);
        }
    } catch (const std::exception& e) {
        spdlog::error("Failed to mark malformed job {} as failed: {}", job.id, e.what());
    }
}

void Scheduler::control_loop() {
    spdlog::info("Scheduler: control thread started (tick={}ms)", config_.polling_interval_ms);

    auto last_db_poll = std::chrono::steady_clock::now();
    auto last_stale_check = last_db_poll;

    while (running_) {
        bool forced = false;
        {
            std::unique_lock<std::mutex> lock(control_mutex_);
            control_cv_.wait_for(lock, std::chrono::milliseconds(config_.polling_interval_ms),
                [this] { return !running_ || fetch_requested_; });
            if (!running_) break;
            forced = fetch_requested_;
            fetch_requested_ = false;
        }

        auto now = std::chrono::steady_clock::now();

        if (forced || now - last_db_poll >= std::chrono::milliseconds(config_.db_poll_interval_ms)) {
            last_db_poll = now;
            try {
                fetch_from_store();
            } catch (const std::exception& e) {
                spdlog::error("Scheduler fetch error: {}", e.what());
            }
        }

        if (now - last_stale_check >= std::chrono::milliseconds(config_.stale_check_interval_ms)) {
            last_stale_check = now;
            try {
                reset_stale_jobs();
            } catch (const std::exception& e) {
                spdlog::error("Scheduler stale reset error: {}", e.what());
            }
        }

        check_timeouts();
    }

    spdlog::info("Scheduler: control thread stopped");
}

void Scheduler::check_timeouts() {
    auto now = std::chrono::steady_clock::now();
    auto limit = std::chrono::milliseconds(config_.job_timeout_ms);

    std::lock_guard<std::mutex> lock(in_flight_mutex_);
    for (auto& [id, entry] : in_flight_) {
        if (entry.timeout_logged || now - entry.started < limit) continue;

        entry.timeout_logged = true;
        ++timeouts_logged_;
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - entry.started);
        spdlog::warn("Job {} ({}) exceeded timeout: running for {}ms (limit {}ms)",
                     id, to_string(entry.type), elapsed.count(), config_.job_timeout_ms);
    }
}

void Scheduler::worker_loop(int worker_id) {
    spdlog::debug("Scheduler: worker {} started", worker_id);

    while (running_) {
        auto job = queue_->wait_dequeue(std::chrono::milliseconds(config_.polling_interval_ms));
        if (!job) continue;
        process_job(*job);
    }

    spdlog::debug("Scheduler: worker {} stopped", worker_id);
}

void Scheduler::process_job(const QueuedJob& job) {
    int active = ++active_workers_;
    int peak = peak_active_workers_.load();
    while (active > peak && !peak_active_workers_.compare_exchange_weak(peak, active)) {
    }

    {
        std::lock_guard<std::mutex> lock(in_flight_mutex_);
        in_flight_[job.id] = InFlightJob{job.type, std::chrono::steady_clock::now(), false};
    }

    ActiveJobGuard guard(active_workers_, [this, &job] {
        std::lock_guard<std::mutex> lock(in_flight_mutex_);
        in_flight_.erase(job.id);
    });

    try {
        auto result = dispatcher_->dispatch(job);
        switch (result.outcome) {
            case DispatchOutcome::COMPLETED: ++completed_; break;
            case DispatchOutcome::FAILED: ++failed_; break;
            case DispatchOutcome::RETRY_SCHEDULED: ++retried_; break;
            case DispatchOutcome::SKIPPED: ++skipped_; break;
        }

        // A freed slot with nothing waiting locally pulls the next claim forward
        if (result.outcome == DispatchOutcome::RETRY_SCHEDULED || queue_->empty()) {
            trigger_fetch();
        }
    } catch (const std::exception& e) {
        spdlog::error("Unexpected error dispatching job {}: {}", job.id, e.what());
    }
}

bool Scheduler::cancel_job(const std::string& id) {
    bool removed = queue_->remove(id);
    if (removed) {
        spdlog::info("Removed canceled job {} from local queue", id);
    }
    return removed;
}

size_t Scheduler::cancel_session_jobs(const std::string& session_id) {
    size_t removed = queue_->remove_session(session_id);
    if (removed > 0) {
        spdlog::info("Removed {} canceled jobs of session {} from local queue", removed, session_id);
    }
    return removed;
}

SchedulerStats Scheduler::stats() const {
    SchedulerStats stats;
    stats.active_workers = active_workers_;
    stats.peak_active_workers = peak_active_workers_;
    stats.concurrency_limit = config_.concurrency_limit;
    stats.claimed = claimed_;
    stats.malformed = malformed_;
    stats.completed = completed_;
    stats.failed = failed_;
    stats.retried = retried_;
    stats.skipped = skipped_;
    stats.stale_reset = stale_reset_;
    stats.timeouts_logged = timeouts_logged_;
    stats.queue = queue_->stats();
    return stats;
}

} // namespace hive
