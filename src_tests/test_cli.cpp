/**
 * @file test_cli.cpp
 * @brief Exit code contract of the prandtl_regression executable
 *
 * 0 = all examples passed, 1 = at least one failed, 2 = usage/dependency error.
 */

#include <catch2/catch_test_macros.hpp>

#include "common/temp_dir.hpp"

#include <cstdlib>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>
#include <sys/wait.h>

using prandtl::regression::tests::TempDir;
using prandtl::regression::tests::read_text;
using prandtl::regression::tests::write_script;
using prandtl::regression::tests::write_text;

namespace fs = std::filesystem;

namespace {

std::string q(const fs::path& p) { return "'" + p.string() + "'"; }

int run_cli(const std::string& arguments, const fs::path& log) {
    const std::string cmd = std::string("'") + PRANDTL_REGRESSION_CLI_PATH + "' " + arguments + " > " + q(log) + " 2>&1";
    const int status = std::system(cmd.c_str());
    REQUIRE(status != -1);
    REQUIRE(WIFEXITED(status));
    return WEXITSTATUS(status);
}

struct CliFixture {
    TempDir tmp{"prandtl-cli"};
    fs::path exe = tmp.path() / "build" / "Prandtl";
    fs::path run_dir = tmp.path() / "RunTests";
    fs::path log = tmp.path() / "cli.log";

    CliFixture() {
        write_script(exe,
                     "mkdir -p out/ParaView/Cycle000000 out/ParaView/Cycle000010\n"
                     "case \"$(basename \"$PWD\")\" in\n"
                     "  NoManifest*) ;;\n"
                     "  *) touch out/ParaView/ParaView.pvd ;;\n"
                     "esac\n");
    }

    fs::path config(const std::string& name) {
        const auto path = tmp.path() / "TestCases" / name / "config.json";
        write_text(path, R"({"runTime": {"final_time": 2.0}})");
        return path;
    }

    std::string common() const {
        return "-n 10 -e " + q(exe) + " -o " + q(run_dir) + " --launcher ''";
    }
};

}  // namespace

TEST_CASE("both -c and -l is a usage error and runs nothing", "[cli][usage]") {
    CliFixture fx;
    const auto cfg = fx.config("Cavity");
    write_text(fx.tmp.path() / "list.txt", cfg.string() + "\n");

    REQUIRE(run_cli(fx.common() + " -c " + q(cfg) + " -l " + q(fx.tmp.path() / "list.txt"), fx.log) == 2);
    REQUIRE_FALSE(fs::exists(fx.run_dir));
    REQUIRE(read_text(fx.log).find("choose either -c or -l, not both.") != std::string::npos);
}

TEST_CASE("usage and dependency errors exit with 2", "[cli][usage]") {
    CliFixture fx;
    const auto cfg = fx.config("Cavity");

    SECTION("no input") {
        REQUIRE(run_cli(fx.common(), fx.log) == 2);
    }
    SECTION("unknown option") {
        REQUIRE(run_cli(fx.common() + " -c " + q(cfg) + " --frobnicate", fx.log) == 2);
    }
    SECTION("missing executable") {
        REQUIRE(run_cli("-e " + q(fx.tmp.path() / "nope") + " -o " + q(fx.run_dir) + " -c " + q(cfg), fx.log) == 2);
        REQUIRE(read_text(fx.log).find("Prandtl executable not found") != std::string::npos);
    }
    SECTION("bad step count") {
        REQUIRE(run_cli(fx.common() + " -n ten -c " + q(cfg), fx.log) == 2);
    }
    SECTION("timeout and ranks must fit an int") {
        REQUIRE(run_cli(fx.common() + " -t 4294967297 -c " + q(cfg), fx.log) == 2);
        REQUIRE(read_text(fx.log).find("-t is out of range") != std::string::npos);
        REQUIRE(run_cli(fx.common() + " --ranks 99999999999 -c " + q(cfg), fx.log) == 2);
        REQUIRE(read_text(fx.log).find("--ranks is out of range") != std::string::npos);
        REQUIRE_FALSE(fs::exists(fx.run_dir / "Cavity"));
    }
    SECTION("help is not an error") {
        REQUIRE(run_cli("-h", fx.log) == 0);
        const auto help = read_text(fx.log);
        REQUIRE(help.find("exiting 124 or 137 on its own is also") != std::string::npos);
        REQUIRE(help.find("130 interrupted") != std::string::npos);
    }
}

TEST_CASE("list run exits 1 when one example fails and 0 when all pass", "[cli][e2e]") {
    CliFixture fx;
    const auto good = fx.config("Cavity");
    const auto bad = fx.config("NoManifestCase");

    SECTION("one failure") {
        write_text(fx.tmp.path() / "list.txt",
                   "# regression set\n" + bad.string() + "\n\n" + good.string() + "\n");
        REQUIRE(run_cli(fx.common() + " -l " + q(fx.tmp.path() / "list.txt"), fx.log) == 1);

        const auto console = read_text(fx.log);
        REQUIRE(console.find("Total: 2 | Succeeded: 1 | Failed: 1") != std::string::npos);

        const auto summary = nlohmann::json::parse(read_text(fx.run_dir / "summary.json"));
        REQUIRE(summary["failed"].size() == 1);
        REQUIRE(fs::is_regular_file(fx.run_dir / "Prandtl"));
    }
    SECTION("all pass") {
        REQUIRE(run_cli(fx.common() + " -c " + q(good), fx.log) == 0);
        const auto patched =
            nlohmann::json::parse(read_text(fx.run_dir / "Cavity" / "config.patched.json"));
        REQUIRE(patched["runTime"]["vis_steps"] == 10);
        REQUIRE(patched["runTime"]["checkpoint_load"] == false);
    }
}

TEST_CASE("an interrupt stops the run and exits with 130", "[cli][e2e][interrupt]") {
    CliFixture fx;
    write_script(fx.exe,
                 "basename \"$PWD\" >> ../starts.txt\n"
                 "kill -INT $$\n"
                 "exit 130\n");
    const auto one = fx.config("One");
    const auto two = fx.config("Two");
    write_text(fx.tmp.path() / "list.txt", one.string() + "\n" + two.string() + "\n");

    REQUIRE(run_cli(fx.common() + " -l " + q(fx.tmp.path() / "list.txt"), fx.log) == 130);

    REQUIRE(read_text(fx.run_dir / "starts.txt") == "One\n");
    const auto console = read_text(fx.log);
    REQUIRE(console.find("Total: 1 | Succeeded: 0 | Failed: 1") != std::string::npos);
    REQUIRE(console.find("Interrupted: remaining examples were not run.") != std::string::npos);

    const auto summary = nlohmann::json::parse(read_text(fx.run_dir / "summary.json"));
    REQUIRE(summary["interrupted"] == true);
    REQUIRE(summary["examples"].size() == 1);
}
