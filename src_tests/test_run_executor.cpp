/**
 * @file test_run_executor.cpp
 * @brief Tests for the solver launch command and exit status handling
 *
 * The launcher is left empty in the process tests so that a shell script can
 * stand in for the solver without an MPI installation.
 */

#include <catch2/catch_test_macros.hpp>

#include "common/temp_dir.hpp"
#include "prandtl_regression/run_executor.hpp"

#include <csignal>
#include <filesystem>
#include <string>

using prandtl::regression::RunExecutor;
using prandtl::regression::tests::TempDir;
using prandtl::regression::tests::read_text;
using prandtl::regression::tests::write_script;
using prandtl::regression::tests::write_text;

namespace fs = std::filesystem;

TEST_CASE("command runs the launcher with two ranks from the work directory", "[executor][command]") {
    RunExecutor executor(RunExecutor::Config{.executable = "/runs/Prandtl"});
    const auto cmd = executor.build_command("/runs/LidDrivenCavity", "/runs/LidDrivenCavity/config.patched.json");

    REQUIRE(cmd == "cd '/runs/LidDrivenCavity' && mpiexec -n 2 '/runs/Prandtl' -c "
                   "'/runs/LidDrivenCavity/config.patched.json'");
}

TEST_CASE("command options: timeout, capture, no launcher, quoting", "[executor][command]") {
    RunExecutor executor(RunExecutor::Config{
        .executable = "/runs/Prandtl",
        .launcher = "",
        .ranks = 4,
        .timeout_sec = 30,
        .capture_output = true,
    });
    const auto cmd = executor.build_command("/runs/it's here", "/runs/it's here/config.patched.json");

    REQUIRE(cmd == "cd '/runs/it'\\''s here' && timeout --kill-after=10 30 '/runs/Prandtl' -c "
                   "'/runs/it'\\''s here/config.patched.json' > '/runs/it'\\''s here/run.log' 2>&1");
}

TEST_CASE("wait status decoding", "[executor][status]") {
    REQUIRE(RunExecutor::decode_status(-1) == -1);
    REQUIRE(RunExecutor::decode_status(0) == 0);
    // Exit code lives in the second byte, the terminating signal in the low bits.
    REQUIRE(RunExecutor::decode_status(3 << 8) == 3);
    REQUIRE(RunExecutor::decode_status(9) == 128 + 9);
}

TEST_CASE("SIGINT and SIGQUIT are recognised as interrupts", "[executor][status][interrupt]") {
    REQUIRE(RunExecutor::is_interrupt_status(SIGINT));
    REQUIRE(RunExecutor::is_interrupt_status(SIGQUIT));
    REQUIRE(RunExecutor::is_interrupt_status((128 + SIGINT) << 8));
    REQUIRE(RunExecutor::is_interrupt_status((128 + SIGQUIT) << 8));

    REQUIRE_FALSE(RunExecutor::is_interrupt_status(-1));
    REQUIRE_FALSE(RunExecutor::is_interrupt_status(0));
    REQUIRE_FALSE(RunExecutor::is_interrupt_status(SIGKILL));
    REQUIRE_FALSE(RunExecutor::is_interrupt_status(3 << 8));
    REQUIRE_FALSE(RunExecutor::is_interrupt_status(RunExecutor::kTimeoutExitCode << 8));
}

TEST_CASE("prepare_workdir purges earlier contents", "[executor][workdir]") {
    TempDir tmp("prandtl-executor");
    const auto work = tmp.path() / "LidDrivenCavity";
    write_text(work / "out" / "ParaView" / "ParaView.pvd", "stale");
    write_text(work / "checkpoint.h5", "stale");

    RunExecutor executor(RunExecutor::Config{});
    executor.prepare_workdir(work, work / "out");

    REQUIRE(fs::is_directory(work / "out"));
    REQUIRE(fs::is_empty(work / "out"));
    REQUIRE_FALSE(fs::exists(work / "checkpoint.h5"));
}

TEST_CASE("run reports the solver exit code and runs in the work directory", "[executor][process]") {
    TempDir tmp("prandtl-executor");
    const auto exe = tmp.path() / "Prandtl";
    const auto work = tmp.path() / "Cavity";
    write_script(exe,
                 "[ \"$1\" = \"-c\" ] || exit 90\n"
                 "[ -f \"$2\" ] || exit 91\n"
                 "pwd > where.txt\n"
                 "exit 7\n");
    write_text(work / "config.patched.json", "{}");

    RunExecutor executor(RunExecutor::Config{.executable = exe, .launcher = ""});
    const auto outcome = executor.run(work, work / "config.patched.json");

    REQUIRE(outcome.exit_code == 7);
    REQUIRE_FALSE(outcome.timed_out);
    auto where = read_text(work / "where.txt");
    REQUIRE_FALSE(where.empty());
    where.pop_back();  // trailing newline from pwd
    REQUIRE(fs::equivalent(where, work));
}

TEST_CASE("captured output lands in run.log", "[executor][process]") {
    TempDir tmp("prandtl-executor");
    const auto exe = tmp.path() / "Prandtl";
    const auto work = tmp.path() / "Cavity";
    write_script(exe, "echo solver says hi\necho oops >&2\nexit 0\n");
    fs::create_directories(work);

    RunExecutor executor(RunExecutor::Config{.executable = exe, .launcher = "", .capture_output = true});
    const auto outcome = executor.run(work, work / "config.patched.json");

    REQUIRE(outcome.exit_code == 0);
    REQUIRE(read_text(work / "run.log") == "solver says hi\noops\n");
}

TEST_CASE("a hung solver is stopped by the timeout", "[executor][process][timeout]") {
    TempDir tmp("prandtl-executor");
    const auto exe = tmp.path() / "Prandtl";
    const auto work = tmp.path() / "Cavity";
    write_script(exe, "sleep 30\n");
    fs::create_directories(work);

    RunExecutor executor(RunExecutor::Config{.executable = exe, .launcher = "", .timeout_sec = 1});
    const auto outcome = executor.run(work, work / "config.patched.json");

    REQUIRE(outcome.exit_code == RunExecutor::kTimeoutExitCode);
    REQUIRE(outcome.timed_out);
}

TEST_CASE("a solver killed by SIGINT is reported as interrupted", "[executor][process][interrupt]") {
    TempDir tmp("prandtl-executor");
    const auto exe = tmp.path() / "Prandtl";
    const auto work = tmp.path() / "Cavity";
    // Falls back to the shell convention when SIGINT is ignored in this environment.
    write_script(exe, "kill -INT $$\nexit 130\n");
    fs::create_directories(work);

    RunExecutor executor(RunExecutor::Config{.executable = exe, .launcher = ""});
    const auto outcome = executor.run(work, work / "config.patched.json");

    REQUIRE(outcome.interrupted);
    REQUIRE(outcome.exit_code == 128 + SIGINT);
    REQUIRE_FALSE(outcome.timed_out);
}

TEST_CASE("an ordinary failure is not an interrupt", "[executor][process][interrupt]") {
    TempDir tmp("prandtl-executor");
    const auto exe = tmp.path() / "Prandtl";
    const auto work = tmp.path() / "Cavity";
    write_script(exe, "exit 1\n");
    fs::create_directories(work);

    RunExecutor executor(RunExecutor::Config{.executable = exe, .launcher = ""});
    const auto outcome = executor.run(work, work / "config.patched.json");

    REQUIRE(outcome.exit_code == 1);
    REQUIRE_FALSE(outcome.interrupted);
}
