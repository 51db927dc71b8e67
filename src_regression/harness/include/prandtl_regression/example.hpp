#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace prandtl::regression {

/**
 * \brief One example to run: a configuration document and its logical name.
 *
 * The name is the parent directory of the configuration file, e.g.
 * `TestCases/NavierStokes/2D/LidDrivenCavity/config.json` is `LidDrivenCavity`.
 */
struct ExampleSpec {
    std::filesystem::path config_path;
    std::string name;
};

/**
 * \brief Invocation-wide run parameters. Set once, read-only afterwards.
 */
struct RunParameters {
    std::int64_t step_count{100};
    std::filesystem::path work_root{"RunTests"};
    std::filesystem::path executable_path{};
    std::string output_subdir{"out"};
};

/**
 * \brief Tunables that are not part of the per-run parameters.
 */
struct HarnessSettings {
    std::string launcher{"mpiexec"};  ///< Empty runs the executable directly
    int ranks{2};
    std::string staged_name{"Prandtl"};
    std::string manifest_subdir{"ParaView"};
    std::string manifest_file{"ParaView.pvd"};
    double default_dt{1e-7};
    int timeout_sec{0};  ///< 0 = wait forever
    bool capture_output{false};
};

/// How far an example progressed before it reached its terminal state.
enum class Stage {
    Pending,
    Patched,
    Executed,
    Validated,
};

[[nodiscard]] const char* to_string(Stage stage) noexcept;

struct RunResult {
    ExampleSpec example;
    Stage stage{Stage::Pending};
    std::optional<int> exit_code;
    bool timed_out{false};
    bool interrupted{false};  ///< Run stopped by the user, later examples are skipped
    std::vector<std::string> missing_artifacts;
    std::string message;  ///< Per-example error, empty when none

    [[nodiscard]] bool succeeded() const noexcept {
        return stage == Stage::Validated && exit_code && *exit_code == 0 && !interrupted &&
               missing_artifacts.empty() && message.empty();
    }
};

/**
 * \brief Builds an ExampleSpec for a configuration path.
 */
[[nodiscard]] ExampleSpec make_example(const std::filesystem::path& config_path);

}  // namespace prandtl::regression
