#include "prandtl_regression/run_executor.hpp"

#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>

#include <sys/wait.h>

namespace fs = std::filesystem;

namespace {

// POSIX shell single-quoting: 'it'\''s'
std::string quote(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('\'');
    for (char ch : s) {
        if (ch == '\'') {
            out += "'\\''";
        } else {
            out.push_back(ch);
        }
    }
    out.push_back('\'');
    return out;
}

std::string quote(const fs::path& p) { return quote(p.string()); }

}  // namespace

namespace prandtl::regression {

RunExecutor::RunExecutor(Config config) : config_{std::move(config)} {}

void RunExecutor::prepare_workdir(const fs::path& work_dir, const fs::path& output_dir) const {
    fs::remove_all(work_dir);
    fs::create_directories(work_dir);
    fs::create_directories(output_dir);
}

std::string RunExecutor::build_command(const fs::path& work_dir, const fs::path& patched_config) const {
    std::ostringstream cmd;
    cmd << "cd " << quote(work_dir) << " && ";
    if (config_.timeout_sec > 0) {
        cmd << "timeout --kill-after=10 " << config_.timeout_sec << " ";
    }
    // The launcher is a command prefix and may carry its own options.
    if (!config_.launcher.empty()) {
        cmd << config_.launcher << " -n " << config_.ranks << " ";
    }
    cmd << quote(config_.executable) << " -c " << quote(patched_config);
    if (config_.capture_output) {
        cmd << " > " << quote(work_dir / "run.log") << " 2>&1";
    }
    return cmd.str();
}

int RunExecutor::decode_status(int status) noexcept {
    if (status == -1) {
        return -1;
    }
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return status;
}

bool RunExecutor::is_interrupt_status(int status) noexcept {
    if (status == -1) {
        return false;
    }
    if (WIFSIGNALED(status)) {
        return WTERMSIG(status) == SIGINT || WTERMSIG(status) == SIGQUIT;
    }
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status) == 128 + SIGINT || WEXITSTATUS(status) == 128 + SIGQUIT;
    }
    return false;
}

RunExecutor::Outcome RunExecutor::run(const fs::path& work_dir, const fs::path& patched_config) const {
    Outcome outcome;
    outcome.command = build_command(work_dir, patched_config);

    // Keep harness progress lines ahead of the solver's own output.
    std::cout.flush();
    std::fflush(stdout);

    const int status = std::system(outcome.command.c_str());
    outcome.exit_code = decode_status(status);
    outcome.interrupted = is_interrupt_status(status);
    if (config_.timeout_sec > 0) {
        // 137 = 128 + SIGKILL, sent after the --kill-after grace period.
        outcome.timed_out = outcome.exit_code == kTimeoutExitCode || outcome.exit_code == 137;
    }
    return outcome;
}

}  // namespace prandtl::regression
