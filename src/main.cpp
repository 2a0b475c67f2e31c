#include "hive/command_processor.hpp"
#include "hive/config.hpp"
#include "hive/dispatcher.hpp"
#include "hive/memory_job_store.hpp"
#include "hive/postgres_job_store.hpp"
#include "hive/processor_registry.hpp"
#include "hive/scheduler.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int signal) {
    g_shutdown_requested = signal;
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options]\n"
              << "Options:\n"
              << "  --memory           Use the in-process job store instead of PostgreSQL\n"
              << "  --dev              Enable development mode (debug logging)\n"
              << "  --concurrency N    Maximum jobs in flight (default: 5)\n"
              << "  --help             Show this help message\n"
              << "\n"
              << "Environment variables:\n"
              << "  PG_HOST                         PostgreSQL host (default: localhost)\n"
              << "  PG_PORT                         PostgreSQL port (default: 5432)\n"
              << "  PG_DB                           PostgreSQL database (default: postgres)\n"
              << "  PG_USER                         PostgreSQL user (default: postgres)\n"
              << "  PG_PASSWORD                     PostgreSQL password (default: postgres)\n"
              << "  PG_SCHEMA                       Schema holding background_jobs (default: hive)\n"
              << "  DB_POOL_SIZE                    Database pool size (default: 10)\n"
              << "  HIVE_CONCURRENCY_LIMIT          Maximum jobs in flight (default: 5)\n"
              << "  HIVE_POLLING_INTERVAL_MS        Scheduler tick (default: 200)\n"
              << "  HIVE_DB_POLL_INTERVAL_MS        Store claim interval (default: 5000)\n"
              << "  HIVE_JOB_TIMEOUT_MS             Overdue job warning threshold (default: 1800000)\n"
              << "  HIVE_STALE_JOB_TIMEOUT_SECONDS  Lease before a claimed job is re-queued (default: 600)\n"
              << "  HIVE_STALE_CHECK_INTERVAL_MS    Stale lease sweep interval (default: 60000)\n"
              << "  HIVE_MAX_RETRIES                Retries after a recoverable failure (default: 3)\n"
              << "  HIVE_RETRY_DELAY_MS             Base retry backoff, 0 = immediate (default: 0)\n"
              << "  HIVE_CMD_<TYPE>                 Command that processes jobs of TYPE\n"
              << "  LOG_LEVEL                       trace, debug, info, warn, error (default: info)\n"
              << std::endl;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    hive::Config config = hive::Config::load();

    spdlog::set_level(spdlog::level::from_str(config.logging.level));
    spdlog::set_pattern(config.logging.pattern);

    bool use_memory_store = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--memory") {
            use_memory_store = true;
        } else if (arg == "--dev") {
            config.scheduler.debug_mode = true;
        } else if (arg == "--concurrency" && i + 1 < argc) {
            config.scheduler.concurrency_limit = std::atoi(argv[++i]);
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    if (config.scheduler.debug_mode) {
        spdlog::set_level(spdlog::level::debug);
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        std::shared_ptr<hive::JobStore> store;

        if (use_memory_store) {
            spdlog::info("Using in-memory job store (jobs are lost on exit)");
            store = std::make_shared<hive::MemoryJobStore>();
        } else {
            auto db_pool = std::make_shared<hive::DatabasePool>(config.database);
            auto pg_store = std::make_shared<hive::PostgresJobStore>(db_pool, config.database.schema);
            if (!pg_store->initialize_schema()) {
                spdlog::error("Failed to initialize database schema");
                return 1;
            }
            store = pg_store;
        }

        auto registry = std::make_shared<hive::ProcessorRegistry>();
        int registered = hive::register_command_processors(*registry, store);
        if (registered == 0) {
            spdlog::warn("No processors registered (set HIVE_CMD_<TYPE>); claimed jobs will fail");
        }

        auto dispatcher = std::make_shared<hive::Dispatcher>(store, registry, config.retry);
        hive::Scheduler scheduler(store, dispatcher, config.scheduler);

        spdlog::info("Starting Hive job scheduler...");
        spdlog::info("Configuration:");
        spdlog::info("   - Store: {}", use_memory_store ? "memory" :
                     config.database.host + ":" + config.database.port + "/" + config.database.database);
        spdlog::info("   - Concurrency: {}", config.scheduler.concurrency_limit);
        spdlog::info("   - Max retries: {}", config.retry.default_max_retries);
        spdlog::info("   - Processors: {}", registered);
        spdlog::info("   - Dev Mode: {}", config.scheduler.debug_mode ? "enabled" : "disabled");

        if (!scheduler.start()) {
            spdlog::error("Failed to start scheduler");
            return 1;
        }

        auto last_stats = std::chrono::steady_clock::now();
        while (!g_shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));

            if (config.scheduler.debug_mode &&
                std::chrono::steady_clock::now() - last_stats >= std::chrono::seconds(30)) {
                last_stats = std::chrono::steady_clock::now();
                spdlog::info("Scheduler stats: {}", scheduler.stats().to_json().dump());
            }
        }

        spdlog::info("Received signal {}, shutting down gracefully...", static_cast<int>(g_shutdown_requested));
        scheduler.stop();

    } catch (const std::exception& e) {
        spdlog::error("Scheduler error: {}", e.what());
        return 1;
    }

    return 0;
}
