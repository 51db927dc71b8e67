#include <cstdint>
#include <exception>
#include <filesystem>
#include <iostream>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "prandtl_regression/engine.hpp"
#include "prandtl_regression/errors.hpp"
#include "prandtl_regression/example.hpp"
#include "prandtl_regression/example_resolver.hpp"
#include "prandtl_regression/sandbox.hpp"
#include "prandtl_regression/summary.hpp"
#include "prandtl_regression/summary_writer.hpp"

using prandtl::regression::Engine;
using prandtl::regression::ErrorKind;
using prandtl::regression::ExampleResolver;
using prandtl::regression::HarnessError;
using prandtl::regression::HarnessSettings;
using prandtl::regression::Reporter;
using prandtl::regression::RunParameters;
using prandtl::regression::Sandbox;
using prandtl::regression::SummaryWriter;

namespace {

constexpr std::int64_t kDefaultSteps = 100;
constexpr const char* kExecutableName = "Prandtl";

struct Args {
    std::int64_t steps{kDefaultSteps};
    std::filesystem::path build_dir{std::filesystem::current_path() / "build"};
    std::optional<std::filesystem::path> executable;
    std::filesystem::path run_dir{std::filesystem::current_path() / "RunTests"};
    std::optional<std::filesystem::path> config;
    std::optional<std::filesystem::path> list_file;
    std::filesystem::path summary_path{};
    HarnessSettings settings{};
    bool help{false};
};

void print_usage(const char* argv0) {
    std::cerr
        << "Prandtl example regression runner\n"
        << "Usage:\n"
        << "  " << argv0 << " [-n STEPS] [-b BUILDDIR] [-e EXECUTABLE] [-o RUNDIR]\n"
        << "                 (-c CONFIG.json | -l LIST.txt) [options]\n"
        << "\n"
        << "Options:\n"
        << "  -n STEPS          Number of steps to run (default: " << kDefaultSteps << ", 0 = default)\n"
        << "  -b BUILDDIR       Build directory (default: ./build)\n"
        << "  -e EXECUTABLE     Path to the Prandtl executable (default: <BUILDDIR>/" << kExecutableName << ")\n"
        << "  -o RUNDIR         Directory to run in (default: ./RunTests)\n"
        << "  -c CONFIG         Single example config.json to run\n"
        << "  -l LIST           List file with one config.json path per line (comments (#) allowed)\n"
        << "  -s PATH           Write JSON summary to this path (default: <RUNDIR>/summary.json)\n"
        << "  -t SECONDS        Kill an example after this many seconds (default: 0 = no limit).\n"
        << "                    With a limit set, a solver exiting 124 or 137 on its own is also\n"
        << "                    reported as timed out.\n"
        << "  --launcher CMD    Parallel launcher, empty to run directly (default: mpiexec)\n"
        << "  --ranks N         Number of worker processes (default: 2)\n"
        << "  --manifest-dir D  Visualisation subdirectory to check (default: ParaView)\n"
        << "  --manifest-file F Manifest file to check (default: ParaView.pvd)\n"
        << "  --default-dt DT   Time step used when a config has neither dt nor final_time (default: 1e-7)\n"
        << "  --capture-output  Redirect solver output to <example>/run.log\n"
        << "  -h, --help        Show this help message.\n"
        << "\n"
        << "Exit codes: 0 all passed, 1 an example failed, 2 usage or setup error,\n"
        << "            130 interrupted (SIGINT/SIGQUIT), remaining examples skipped.\n"
        << "\n"
        << "Examples:\n"
        << "  " << argv0 << " -c TestCases/NavierStokes/2D/LidDrivenCavity/config.json\n"
        << "  " << argv0 << " -l examples.txt\n"
        << std::endl;
}

std::int64_t parse_integer(std::string_view flag, const std::string& value) {
    std::size_t consumed = 0;
    long long parsed = 0;
    try {
        parsed = std::stoll(value, &consumed);
    } catch (const std::exception&) {
        throw HarnessError(ErrorKind::UsageError,
                           std::string(flag) + " expects an integer, got '" + value + "'");
    }
    if (consumed != value.size()) {
        throw HarnessError(ErrorKind::UsageError,
                           std::string(flag) + " expects an integer, got '" + value + "'");
    }
    return parsed;
}

int parse_int(std::string_view flag, const std::string& value) {
    const auto parsed = parse_integer(flag, value);
    if (parsed > std::numeric_limits<int>::max() || parsed < std::numeric_limits<int>::min()) {
        throw HarnessError(ErrorKind::UsageError, std::string(flag) + " is out of range: " + value);
    }
    return static_cast<int>(parsed);
}

double parse_positive_double(std::string_view flag, const std::string& value) {
    std::size_t consumed = 0;
    double parsed = 0.0;
    try {
        parsed = std::stod(value, &consumed);
    } catch (const std::exception&) {
        throw HarnessError(ErrorKind::UsageError,
                           std::string(flag) + " expects a number, got '" + value + "'");
    }
    if (consumed != value.size() || !(parsed > 0.0)) {
        throw HarnessError(ErrorKind::UsageError,
                           std::string(flag) + " expects a positive number, got '" + value + "'");
    }
    return parsed;
}

Args parse_args(int argc, char** argv) {
    Args args;
    auto next_value = [&](int& i, std::string_view flag) -> std::string {
        if (i + 1 >= argc) {
            throw HarnessError(ErrorKind::UsageError, "Option " + std::string(flag) + " requires an argument.");
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string_view tok = argv[i];
        if (tok == "-h" || tok == "--help") {
            args.help = true;
            break;
        } else if (tok == "-n") {
            const auto steps = parse_integer(tok, next_value(i, tok));
            if (steps < 0) {
                throw HarnessError(ErrorKind::UsageError, "-n must not be negative");
            }
            args.steps = steps == 0 ? kDefaultSteps : steps;
        } else if (tok == "-b") {
            args.build_dir = next_value(i, tok);
        } else if (tok == "-e") {
            args.executable = std::filesystem::path(next_value(i, tok));
        } else if (tok == "-o") {
            args.run_dir = next_value(i, tok);
        } else if (tok == "-c") {
            args.config = std::filesystem::path(next_value(i, tok));
        } else if (tok == "-l") {
            args.list_file = std::filesystem::path(next_value(i, tok));
        } else if (tok == "-s") {
            args.summary_path = next_value(i, tok);
        } else if (tok == "-t") {
            const auto timeout = parse_int(tok, next_value(i, tok));
            if (timeout < 0) {
                throw HarnessError(ErrorKind::UsageError, "-t must not be negative");
            }
            args.settings.timeout_sec = timeout;
        } else if (tok == "--launcher") {
            args.settings.launcher = next_value(i, tok);
        } else if (tok == "--ranks") {
            const auto ranks = parse_int(tok, next_value(i, tok));
            if (ranks < 1) {
                throw HarnessError(ErrorKind::UsageError, "--ranks must be at least 1");
            }
            args.settings.ranks = ranks;
        } else if (tok == "--manifest-dir") {
            args.settings.manifest_subdir = next_value(i, tok);
        } else if (tok == "--manifest-file") {
            args.settings.manifest_file = next_value(i, tok);
        } else if (tok == "--default-dt") {
            args.settings.default_dt = parse_positive_double(tok, next_value(i, tok));
        } else if (tok == "--capture-output") {
            args.settings.capture_output = true;
        } else {
            throw HarnessError(ErrorKind::UsageError, "Unknown option " + std::string(tok));
        }
    }

    if (args.summary_path.empty()) {
        args.summary_path = args.run_dir / "summary.json";
    }
    return args;
}

}  // namespace

int main(int argc, char** argv) {
    try {
        const auto args = parse_args(argc, argv);
        if (args.help) {
            print_usage(argv[0]);
            return 0;
        }

        RunParameters params;
        params.step_count = args.steps;
        params.work_root = args.run_dir;
        params.executable_path = args.executable ? *args.executable : args.build_dir / kExecutableName;

        // Resolve which configs to run
        ExampleResolver resolver;
        const auto examples = resolver.resolve(ExampleResolver::Input{
            .config = args.config,
            .list_file = args.list_file,
        });

        // Ensure run sandbox and stage the executable
        Sandbox sandbox(params.work_root, args.settings.staged_name);
        sandbox.prepare(params.executable_path);

        Reporter reporter(std::cout);
        Engine engine(Engine::Config{.params = params, .settings = args.settings}, reporter);
        const auto results = engine.run(examples);

        const auto summary = prandtl::regression::summarize(results);
        reporter.summary(summary);

        try {
            SummaryWriter writer;
            writer.write_summary(args.summary_path, params, results);
            std::cout << "JSON summary: " << args.summary_path.string() << "\n";
        } catch (const std::exception& ex) {
            std::cerr << "WARNING: could not write JSON summary: " << ex.what() << "\n";
        }

        return summary.exit_code();
    } catch (const HarnessError& ex) {
        std::cerr << "ERROR: " << ex.what() << "\n";
        if (ex.kind() == ErrorKind::UsageError || ex.kind() == ErrorKind::NoInputSpecified ||
            ex.kind() == ErrorKind::ConflictingInputs) {
            print_usage(argv[0]);
        }
        return 2;  // usage/dependency issue
    } catch (const std::exception& ex) {
        std::cerr << "ERROR: " << ex.what() << "\n";
        return 2;
    }
}
