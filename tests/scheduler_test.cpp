/**
 * Scheduler tests
 *
 * End-to-end runs against the in-memory store with short intervals:
 * - bounded concurrency (10 jobs, limit 3)
 * - restart recovery of stale leases before the first dispatch
 * - malformed rows failed at claim time
 * - fast path through JobService, local-queue cancellation
 * - overdue job watchdog
 */

#include "hive/job_service.hpp"
#include "hive/memory_job_store.hpp"
#include "hive/scheduler.hpp"
#include "test_harness.hpp"
#include <algorithm>
#include <atomic>
#include <mutex>

using namespace hive;

namespace {

SchedulerConfig fast_config(int concurrency_limit) {
    SchedulerConfig config;
    config.concurrency_limit = concurrency_limit;
    config.polling_interval_ms = 10;
    config.db_poll_interval_ms = 20;
    config.job_timeout_ms = 60000;
    config.stale_job_timeout_seconds = 600;
    config.stale_check_interval_ms = 60000;
    return config;
}

struct ManualClock {
    std::shared_ptr<std::chrono::system_clock::time_point> now =
        std::make_shared<std::chrono::system_clock::time_point>(std::chrono::system_clock::now());

    MemoryJobStore::Clock fn() const {
        auto ref = now;
        return [ref] { return *ref; };
    }
    void advance(std::chrono::seconds delta) { *now += delta; }
};

bool all_terminal(JobStore& store, const std::vector<std::string>& ids) {
    for (const auto& id : ids) {
        auto job = store.get_job(id);
        if (!job || !is_terminal(job->status)) return false;
    }
    return true;
}

// Records every payload seen, in call order
struct CallLog {
    std::mutex mutex;
    std::vector<std::string> ids;

    void add(const nlohmann::json& payload) {
        std::lock_guard<std::mutex> lock(mutex);
        ids.push_back(payload["jobId"].get<std::string>());
    }
    size_t size() {
        std::lock_guard<std::mutex> lock(mutex);
        return ids.size();
    }
    std::vector<std::string> snapshot() {
        std::lock_guard<std::mutex> lock(mutex);
        return ids;
    }
};

} // namespace

TEST(test_bounded_concurrency) {
    auto store = std::make_shared<MemoryJobStore>();
    auto registry = std::make_shared<ProcessorRegistry>();

    std::atomic<int> running{0};
    std::atomic<int> max_running{0};
    registry->register_processor(JobType::GENERIC_STREAM, std::make_shared<FunctionProcessor>(
        [&running, &max_running](const nlohmann::json&) {
            int now = ++running;
            int seen = max_running.load();
            while (now > seen && !max_running.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(30));
            --running;
            return ProcessResult::ok("done");
        }));

    std::vector<std::string> ids;
    for (int i = 0; i < 10; ++i) {
        ids.push_back("bounded-" + std::to_string(i));
        store->create_job(make_job(ids.back()));
    }

    auto dispatcher = std::make_shared<Dispatcher>(store, registry);
    Scheduler scheduler(store, dispatcher, fast_config(3));
    ASSERT(scheduler.start(), "Scheduler started");

    bool finished = wait_until([&] { return all_terminal(*store, ids); }, 10000);
    scheduler.stop();

    ASSERT(finished, "All ten jobs reached a terminal state");
    ASSERT(max_running.load() <= 3, "Never more than three processors at once");
    ASSERT(max_running.load() >= 2, "Work actually ran in parallel");
    ASSERT(scheduler.peak_active_workers() <= 3, "Peak active workers within the limit");
    ASSERT_EQ(scheduler.active_workers(), 0, "No active workers after stop");
    for (const auto& id : ids) {
        ASSERT(store->get_job(id)->status == JobStatus::COMPLETED, "Job completed: " + id);
    }
    ASSERT_EQ(scheduler.stats().completed, 10u, "Stats count ten completions");
}

TEST(test_start_twice_refused) {
    auto store = std::make_shared<MemoryJobStore>();
    auto dispatcher = std::make_shared<Dispatcher>(store, std::make_shared<ProcessorRegistry>());
    Scheduler scheduler(store, dispatcher, fast_config(1));

    ASSERT(scheduler.start(), "First start succeeds");
    ASSERT(!scheduler.start(), "Second start refused");
    ASSERT(scheduler.is_running(), "Still running");
    scheduler.stop();
    ASSERT(!scheduler.is_running(), "Stopped");
}

TEST(test_restart_recovers_stale_leases) {
    ManualClock clock;
    auto store = std::make_shared<MemoryJobStore>(clock.fn());
    store->create_job(make_job("orphan-1", JobType::GENERIC_STREAM, 1));
    store->create_job(make_job("orphan-2", JobType::GENERIC_STREAM, 2));

    // A previous process claimed both and died
    ASSERT_EQ(store->claim_queued_jobs(5).size(), 2u, "Both jobs leased by the dead process");
    clock.advance(std::chrono::seconds(700));

    auto registry = std::make_shared<ProcessorRegistry>();
    CallLog calls;
    registry->register_processor(JobType::GENERIC_STREAM, std::make_shared<FunctionProcessor>(
        [&calls](const nlohmann::json& payload) {
            calls.add(payload);
            return ProcessResult::ok("recovered");
        }));

    auto dispatcher = std::make_shared<Dispatcher>(store, registry);
    Scheduler scheduler(store, dispatcher, fast_config(2));
    ASSERT(scheduler.start(), "Scheduler started");
    ASSERT_EQ(scheduler.stats().stale_reset, 2u, "Both leases reset during start");

    bool finished = wait_until([&] { return all_terminal(*store, {"orphan-1", "orphan-2"}); });
    scheduler.stop();

    ASSERT(finished, "Recovered jobs finished");
    ASSERT_EQ(calls.size(), 2u, "Each recovered job processed once");
    ASSERT(store->get_job("orphan-1")->status == JobStatus::COMPLETED, "orphan-1 completed");
    ASSERT(store->get_job("orphan-2")->status == JobStatus::COMPLETED, "orphan-2 completed");
    ASSERT_EQ(store->get_job("orphan-1")->retry_count, 0, "A lease reset is not a retry");
}

TEST(test_malformed_rows_failed) {
    auto store = std::make_shared<MemoryJobStore>();

    Job missing = make_job("no-back-reference");
    missing.payload = {{"prompt", "hello"}};
    store->create_job(missing);

    Job mismatched = make_job("mismatched");
    mismatched.payload = {{"jobId", "someone-else"}};
    store->create_job(mismatched);

    Job not_object = make_job("not-object");
    not_object.payload = nlohmann::json::array({1, 2, 3});
    store->create_job(not_object);

    store->create_job(make_job("valid"));

    auto registry = std::make_shared<ProcessorRegistry>();
    CallLog calls;
    registry->register_processor(JobType::GENERIC_STREAM, std::make_shared<FunctionProcessor>(
        [&calls](const nlohmann::json& payload) {
            calls.add(payload);
            return ProcessResult::ok("done");
        }));

    auto dispatcher = std::make_shared<Dispatcher>(store, registry);
    Scheduler scheduler(store, dispatcher, fast_config(4));
    ASSERT(scheduler.start(), "Scheduler started");

    std::vector<std::string> ids = {"no-back-reference", "mismatched", "not-object", "valid"};
    bool finished = wait_until([&] { return all_terminal(*store, ids); });
    scheduler.stop();

    ASSERT(finished, "All rows terminal");
    ASSERT_EQ(calls.size(), 1u, "Only the valid job reached a processor");
    ASSERT(store->get_job("valid")->status == JobStatus::COMPLETED, "Valid job completed");

    for (const auto& id : {"no-back-reference", "mismatched", "not-object"}) {
        auto job = store->get_job(id);
        ASSERT(job->status == JobStatus::FAILED, std::string("Malformed row failed: ") + id);
        ASSERT(job->error_message.find("Malformed job") == 0, std::string("Malformed reason recorded: ") + id);
        ASSERT_EQ(job->retry_count, 0, std::string("Malformed row not retried: ") + id);
    }
    ASSERT_EQ(scheduler.stats().malformed, 3u, "Three malformed rows counted");
}

TEST(test_retries_until_exhausted) {
    auto store = std::make_shared<MemoryJobStore>();
    auto registry = std::make_shared<ProcessorRegistry>();
    std::atomic<int> attempts{0};
    registry->register_processor(JobType::GENERIC_STREAM, std::make_shared<FunctionProcessor>(
        [&attempts](const nlohmann::json&) -> ProcessResult {
            ++attempts;
            throw std::runtime_error("model API unavailable");
        }));

    store->create_job(make_job("always-fails"));

    RetryConfig retry;
    retry.default_max_retries = 3;
    auto dispatcher = std::make_shared<Dispatcher>(store, registry, retry);
    Scheduler scheduler(store, dispatcher, fast_config(2));
    ASSERT(scheduler.start(), "Scheduler started");

    bool finished = wait_until([&] { return all_terminal(*store, {"always-fails"}); });
    scheduler.stop();

    ASSERT(finished, "Job reached a terminal state");
    ASSERT_EQ(attempts.load(), 4, "Processor invoked max_retries + 1 times");
    auto job = store->get_job("always-fails");
    ASSERT(job->status == JobStatus::FAILED, "Job failed");
    ASSERT_EQ(job->error_message, "model API unavailable", "Error message recorded");
    ASSERT_EQ(scheduler.stats().retried, 3u, "Three retries scheduled");
}

TEST(test_enqueue_wakes_scheduler) {
    auto store = std::make_shared<MemoryJobStore>();
    auto registry = std::make_shared<ProcessorRegistry>();
    registry->register_processor(JobType::TEXT_IMPROVEMENT, std::make_shared<FunctionProcessor>(
        [](const nlohmann::json& payload) {
            return ProcessResult::ok("improved", payload["text"].get<std::string>() + "!");
        }));

    auto config = fast_config(2);
    config.db_poll_interval_ms = 600000;   // only the enqueue nudge can trigger a claim

    auto dispatcher = std::make_shared<Dispatcher>(store, registry);
    auto scheduler = std::make_shared<Scheduler>(store, dispatcher, config);
    JobService service(store, scheduler);
    ASSERT(scheduler->start(), "Scheduler started");

    std::string id = service.enqueue_job(JobType::TEXT_IMPROVEMENT, {{"text", "hello"}});
    bool finished = wait_until([&] { return all_terminal(*store, {id}); }, 3000);
    scheduler->stop();

    ASSERT(finished, "Job processed without waiting for the store poll");
    ASSERT_EQ(store->get_job(id)->response, "hello!", "Processor output stored");
}

TEST(test_cancel_removes_from_local_queue) {
    auto store = std::make_shared<MemoryJobStore>();
    auto registry = std::make_shared<ProcessorRegistry>();
    std::atomic<bool> release{false};
    CallLog calls;
    registry->register_processor(JobType::GENERIC_STREAM, std::make_shared<FunctionProcessor>(
        [&release, &calls](const nlohmann::json& payload) {
            calls.add(payload);
            wait_until([&release] { return release.load(); }, 10000);
            return ProcessResult::ok("done");
        }));

    store->create_job(make_job("blocking", JobType::GENERIC_STREAM, 9));
    store->create_job(make_job("waiting", JobType::GENERIC_STREAM, 1));

    auto dispatcher = std::make_shared<Dispatcher>(store, registry);
    auto scheduler = std::make_shared<Scheduler>(store, dispatcher, fast_config(1));
    JobService service(store, scheduler);
    ASSERT(scheduler->start(), "Scheduler started");

    bool waiting_queued = wait_until([&] {
        return calls.size() == 1 && scheduler->queue_size() == 1;
    });
    if (!waiting_queued) {
        release = true;
        scheduler->stop();
    }
    ASSERT(waiting_queued, "Second job claimed into the local queue");

    ASSERT(service.cancel_job("waiting"), "Cancel applied");
    ASSERT_EQ(scheduler->queue_size(), 0u, "Canceled job removed from the local queue");

    release = true;
    bool finished = wait_until([&] { return all_terminal(*store, {"blocking", "waiting"}); });
    scheduler->stop();

    ASSERT(finished, "Both jobs terminal");
    auto seen = calls.snapshot();
    ASSERT_EQ(seen.size(), 1u, "Canceled job never processed");
    ASSERT_EQ(seen[0], "blocking", "Only the running job was processed");
    ASSERT(store->get_job("waiting")->status == JobStatus::CANCELED, "Waiting job canceled");
    ASSERT(store->get_job("blocking")->status == JobStatus::COMPLETED, "Running job completed");
}

TEST(test_overdue_job_logged_not_killed) {
    auto store = std::make_shared<MemoryJobStore>();
    auto registry = std::make_shared<ProcessorRegistry>();
    registry->register_processor(JobType::GENERIC_STREAM, std::make_shared<FunctionProcessor>(
        [](const nlohmann::json&) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            return ProcessResult::ok("slow but fine");
        }));

    store->create_job(make_job("slow"));

    auto config = fast_config(1);
    config.job_timeout_ms = 30;
    auto dispatcher = std::make_shared<Dispatcher>(store, registry);
    Scheduler scheduler(store, dispatcher, config);
    ASSERT(scheduler.start(), "Scheduler started");

    bool finished = wait_until([&] { return all_terminal(*store, {"slow"}); });
    scheduler.stop();

    ASSERT(finished, "Slow job finished");
    ASSERT(store->get_job("slow")->status == JobStatus::COMPLETED, "Timeout does not change the outcome");
    ASSERT_EQ(scheduler.stats().timeouts_logged, 1u, "Overdue job reported exactly once");
}

TEST(test_stop_leaves_claims_for_recovery) {
    ManualClock clock;
    auto store = std::make_shared<MemoryJobStore>(clock.fn());
    auto registry = std::make_shared<ProcessorRegistry>();

    store->create_job(make_job("claimed-a"));
    store->create_job(make_job("claimed-b"));

    auto dispatcher = std::make_shared<Dispatcher>(store, registry);
    Scheduler scheduler(store, dispatcher, fast_config(2));

    // Claim without running workers, as if the process stopped right after a fetch
    ASSERT_EQ(scheduler.fetch_from_store(), 2, "Two jobs claimed into the local queue");
    ASSERT_EQ(scheduler.queue_size(), 2u, "Both waiting locally");
    ASSERT(store->get_job("claimed-a")->status == JobStatus::ACKNOWLEDGED_BY_WORKER, "Row leased");

    clock.advance(std::chrono::seconds(601));
    ASSERT_EQ(scheduler.reset_stale_jobs(), 2, "Expired leases reset");
    ASSERT(store->get_job("claimed-b")->status == JobStatus::QUEUED, "Row claimable again");
}

TEST(test_stale_sweep_spares_job_in_progress) {
    ManualClock clock;
    auto store = std::make_shared<MemoryJobStore>(clock.fn());
    auto registry = std::make_shared<ProcessorRegistry>();

    std::atomic<bool> release{false};
    std::atomic<int> concurrent{0};
    std::atomic<int> max_concurrent{0};
    CallLog calls;
    // Never reports progress, so only the dispatcher touches the row
    registry->register_processor(JobType::GENERIC_STREAM, std::make_shared<FunctionProcessor>(
        [&](const nlohmann::json& payload) {
            calls.add(payload);
            int now = ++concurrent;
            int seen = max_concurrent.load();
            while (now > seen && !max_concurrent.compare_exchange_weak(seen, now)) {
            }
            wait_until([&release] { return release.load(); }, 10000);
            --concurrent;
            return ProcessResult::ok("done");
        }));

    store->create_job(make_job("long-running"));

    auto config = fast_config(2);
    config.stale_check_interval_ms = 50;
    auto dispatcher = std::make_shared<Dispatcher>(store, registry);
    Scheduler scheduler(store, dispatcher, config);
    ASSERT(scheduler.start(), "Scheduler started");

    bool started = wait_until([&] { return calls.size() == 1; });
    if (started) {
        clock.advance(std::chrono::seconds(601));
        // Several sweep and claim cycles while the job is still in flight
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
    }
    bool row_running = store->get_job("long-running")->status == JobStatus::RUNNING;
    size_t calls_in_flight = calls.size();

    release = true;
    bool finished = wait_until([&] { return all_terminal(*store, {"long-running"}); });
    scheduler.stop();

    ASSERT(started, "Job dispatched");
    ASSERT(row_running, "Row stays running past the lease timeout");
    ASSERT_EQ(calls_in_flight, 1u, "Not dispatched again while in flight");
    ASSERT_EQ(max_concurrent.load(), 1, "Never two runs of the same job");
    ASSERT(finished, "Job finished");
    ASSERT_EQ(calls.size(), 1u, "Processed exactly once");
    ASSERT(store->get_job("long-running")->status == JobStatus::COMPLETED, "Completed");
    ASSERT_EQ(scheduler.stats().stale_reset, 0u, "No lease reset");
}

int main() {
    std::cout << "=== Scheduler Tests ===" << std::endl;
    RUN_TEST(test_bounded_concurrency);
    RUN_TEST(test_start_twice_refused);
    RUN_TEST(test_restart_recovers_stale_leases);
    RUN_TEST(test_malformed_rows_failed);
    RUN_TEST(test_retries_until_exhausted);
    RUN_TEST(test_enqueue_wakes_scheduler);
    RUN_TEST(test_cancel_removes_from_local_queue);
    RUN_TEST(test_overdue_job_logged_not_killed);
    RUN_TEST(test_stop_leaves_claims_for_recovery);
    RUN_TEST(test_stale_sweep_spares_job_in_progress);

    return report_results("Scheduler");
}
