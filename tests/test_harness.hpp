#pragma once

#include "hive/job_types.hpp"
#include "hive/processor_registry.hpp"
#include <chrono>
#include <functional>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

// ============================================================================
// Simple Test Framework
// ============================================================================

struct TestResult {
    std::string name;
    bool passed;
    std::string message;
    std::chrono::milliseconds duration;
};

inline std::vector<TestResult> g_test_results;
inline int g_tests_passed = 0;
inline int g_tests_failed = 0;

#define TEST(name) void name(TestResult& hive_test_result_)
#define ASSERT(cond, msg) do { if (!(cond)) { hive_test_result_.passed = false; hive_test_result_.message = msg; return; } } while(0)
#define ASSERT_EQ(a, b, msg) ASSERT((a) == (b), msg)
#define ASSERT_NE(a, b, msg) ASSERT((a) != (b), msg)
#define ASSERT_GT(a, b, msg) ASSERT((a) > (b), msg)

#define RUN_TEST(fn) run_test(#fn, fn)

inline void run_test(const std::string& name, void (*fn)(TestResult&)) {
    std::cout << "Running test: " << name << " :";
    TestResult result;
    result.name = name;
    result.passed = true;
    result.message = "";

    auto start = std::chrono::steady_clock::now();

    try {
        fn(result);
    } catch (const std::exception& e) {
        result.passed = false;
        result.message = std::string("Exception: ") + e.what();
    }

    auto end = std::chrono::steady_clock::now();
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

    if (result.passed) {
        g_tests_passed++;
        std::cout << " ✅ " << " (" << result.duration.count() << "ms)" << std::endl;
    } else {
        g_tests_failed++;
        std::cout << " ❌ " << " - " << result.message << " (" << result.duration.count() << "ms)" << std::endl;
    }

    g_test_results.push_back(result);
}

inline int report_results(const std::string& suite) {
    std::cout << std::endl;
    std::cout << "============================================" << std::endl;
    std::cout << suite << ": " << g_tests_passed << " passed, " << g_tests_failed << " failed" << std::endl;
    std::cout << "============================================" << std::endl;
    return g_tests_failed > 0 ? 1 : 0;
}

// ============================================================================
// Test Utilities
// ============================================================================

// Poll until the predicate holds or the timeout expires
inline bool wait_until(const std::function<bool()>& predicate, int timeout_ms = 5000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
}

// A queued row with a well-formed payload
inline hive::Job make_job(const std::string& id,
                          hive::JobType type = hive::JobType::GENERIC_STREAM,
                          int priority = 0,
                          const std::string& session_id = "") {
    hive::Job job;
    job.id = id;
    job.type = type;
    job.priority = priority;
    job.session_id = session_id;
    job.status = hive::JobStatus::QUEUED;
    job.payload = {{"jobId", id}, {"prompt", "test prompt for " + id}};
    return job;
}

// Processor whose behaviour is supplied by the test
class FunctionProcessor : public hive::JobProcessor {
public:
    using Handler = std::function<hive::ProcessResult(const nlohmann::json&)>;

    explicit FunctionProcessor(Handler handler) : handler_(std::move(handler)) {}

    hive::ProcessResult process(const nlohmann::json& payload) override {
        return handler_(payload);
    }

private:
    Handler handler_;
};
