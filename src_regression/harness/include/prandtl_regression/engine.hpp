#pragma once

#include "example.hpp"
#include "summary.hpp"

#include <filesystem>
#include <vector>

namespace prandtl::regression {

/**
 * \brief Runs examples one after another: patch, execute, validate.
 *
 * Every example ends in a RunResult. Errors raised while handling one example
 * are recorded in its result and never stop the loop. The one exception is a
 * solver stopped by SIGINT or SIGQUIT: its result is marked interrupted and
 * no further example is started. The sandbox is expected to be prepared
 * already (see Sandbox::prepare()).
 */
class Engine {
public:
    struct Config {
        RunParameters params{};
        HarnessSettings settings{};
    };

    Engine(Config config, Reporter& reporter);

    [[nodiscard]] std::vector<RunResult> run(const std::vector<ExampleSpec>& examples) const;

    [[nodiscard]] RunResult run_one(const ExampleSpec& example) const;

    [[nodiscard]] std::filesystem::path work_dir(const ExampleSpec& example) const;
    [[nodiscard]] std::filesystem::path output_dir(const ExampleSpec& example) const;
    [[nodiscard]] std::filesystem::path patched_config_path(const ExampleSpec& example) const;
    [[nodiscard]] const std::filesystem::path& staged_executable() const noexcept { return staged_executable_; }

private:
    Config config_;
    std::filesystem::path staged_executable_;
    Reporter& reporter_;
};

}  // namespace prandtl::regression
