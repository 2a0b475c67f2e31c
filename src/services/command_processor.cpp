#include "hive/command_processor.hpp"
#include "hive/config.hpp"
#include "hive/job_reporter.hpp"
#include <spdlog/spdlog.h>
#include <sys/wait.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <vector>

namespace hive {

namespace {

// Run a shell command, capture stderr+stdout, return exit code
int run_command(const std::string& cmd, std::string& output) {
    std::string full_cmd = cmd + " 2>&1";
    FILE* pipe = popen(full_cmd.c_str(), "r");
    if (!pipe) return -1;

    char buffer[4096];
    while (fgets(buffer, sizeof(buffer), pipe)) {
        output += buffer;
    }

    int status = pclose(pipe);
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    return -1;
}

std::string shell_quote(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    return quoted + "'";
}

// Temporary payload file, removed when the job finishes
class PayloadFile {
public:
    explicit PayloadFile(const nlohmann::json& payload) {
        const char* tmpdir = std::getenv("TMPDIR");
        std::string pattern = std::string(tmpdir && *tmpdir ? tmpdir : "/tmp") + "/hive-job-XXXXXX";
        std::vector<char> buffer(pattern.begin(), pattern.end());
        buffer.push_back('\0');

        int fd = mkstemp(buffer.data());
        if (fd == -1) {
            throw std::runtime_error("Failed to create payload file in " + pattern);
        }
        ::close(fd);
        path_ = buffer.data();

        std::ofstream out(path_, std::ios::trunc);
        out << payload.dump();
        if (!out) {
            std::remove(path_.c_str());
            throw std::runtime_error("Failed to write payload file " + path_);
        }
    }

    ~PayloadFile() {
        if (!path_.empty()) std::remove(path_.c_str());
    }

    PayloadFile(const PayloadFile&) = delete;
    PayloadFile& operator=(const PayloadFile&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // anonymous namespace

CommandProcessor::CommandProcessor(std::string command, std::shared_ptr<JobStore> store)
    : command_(std::move(command)), store_(std::move(store)) {
    if (command_.empty()) {
        throw std::invalid_argument("CommandProcessor requires a command");
    }
}

ProcessResult CommandProcessor::process(const nlohmann::json& payload) {
    auto reporter = JobReporter::from_payload(store_, payload);

    if (!reporter.mark_running("Running external command")) {
        throw JobNotFoundError("Job " + reporter.job_id() + " is no longer active");
    }

    PayloadFile payload_file(payload);
    if (!reporter.set_stream_state(JobStatus::GENERATING_STREAM, "Waiting for command output")) {
        throw JobNotFoundError("Job " + reporter.job_id() + " is no longer active");
    }

    std::string output;
    int exit_code = run_command(command_ + " " + shell_quote(payload_file.path()), output);

    if (exit_code != 0) {
        // Keep the tail, commands tend to print the failure last
        constexpr size_t MAX_ERROR_OUTPUT = 2000;
        std::string tail = output.size() > MAX_ERROR_OUTPUT
            ? output.substr(output.size() - MAX_ERROR_OUTPUT) : output;
        spdlog::warn("Command for job {} exited with status {}", reporter.job_id(), exit_code);
        return ProcessResult::failure("Command exited with status " + std::to_string(exit_code) +
                                      (tail.empty() ? "" : ": " + tail));
    }

    if (!reporter.set_stream_state(JobStatus::PROCESSING_STREAM, "Collecting command output", 100)) {
        spdlog::info("Job {} was closed while its command ran, output discarded", reporter.job_id());
    }
    return ProcessResult::ok("Command completed", output);
}

std::string command_env_var(JobType type) {
    std::string name = to_string(type);
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return "HIVE_CMD_" + name;
}

int register_command_processors(ProcessorRegistry& registry, std::shared_ptr<JobStore> store) {
    int registered = 0;
    for (JobType type : all_job_types()) {
        std::string var = command_env_var(type);
        std::string command = get_env_string(var.c_str(), "");
        if (command.empty()) continue;

        registry.register_processor(type, std::make_shared<CommandProcessor>(command, store));
        spdlog::info("Job type {} handled by command: {}", to_string(type), command);
        ++registered;
    }
    return registered;
}

} // namespace hive
