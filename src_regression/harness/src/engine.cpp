#include "prandtl_regression/engine.hpp"
#include "prandtl_regression/config_patcher.hpp"
#include "prandtl_regression/output_validator.hpp"
#include "prandtl_regression/run_executor.hpp"
#include "prandtl_regression/sandbox.hpp"

#include <exception>
#include <filesystem>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace prandtl::regression {

Engine::Engine(Config config, Reporter& reporter) : config_{std::move(config)}, reporter_{reporter} {
    // The solver runs from the example directory, so every path handed to it
    // has to survive the change of directory.
    config_.params.work_root = fs::absolute(config_.params.work_root).lexically_normal();
    staged_executable_ = Sandbox(config_.params.work_root, config_.settings.staged_name).staged_executable();
}

fs::path Engine::work_dir(const ExampleSpec& example) const {
    return config_.params.work_root / example.name;
}

fs::path Engine::output_dir(const ExampleSpec& example) const {
    return work_dir(example) / config_.params.output_subdir;
}

fs::path Engine::patched_config_path(const ExampleSpec& example) const {
    return work_dir(example) / "config.patched.json";
}

std::vector<RunResult> Engine::run(const std::vector<ExampleSpec>& examples) const {
    std::vector<RunResult> results;
    results.reserve(examples.size());
    for (const auto& example : examples) {
        results.push_back(run_one(example));
        if (results.back().interrupted) {
            break;
        }
    }
    return results;
}

RunResult Engine::run_one(const ExampleSpec& example) const {
    const auto& params = config_.params;
    const auto& settings = config_.settings;

    RunResult result;
    result.example = example;

    const fs::path work = work_dir(example);
    const fs::path out = output_dir(example);
    const fs::path patched_path = patched_config_path(example);

    reporter_.example_started(example, params.work_root);

    try {
        ConfigPatcher patcher(PatchParameters{
            .step_count = params.step_count,
            .output_directory = out.string(),
            .default_dt = settings.default_dt,
        });
        const auto patched = patcher.patch(patcher.load(example.config_path));

        RunExecutor executor(RunExecutor::Config{
            .executable = staged_executable_,
            .launcher = settings.launcher,
            .ranks = settings.ranks,
            .timeout_sec = settings.timeout_sec,
            .capture_output = settings.capture_output,
        });
        executor.prepare_workdir(work, out);
        patcher.write(patched_path, patched);
        result.stage = Stage::Patched;

        const auto outcome = executor.run(work, patched_path);
        result.exit_code = outcome.exit_code;
        result.timed_out = outcome.timed_out;
        result.interrupted = outcome.interrupted;
        result.stage = Stage::Executed;

        if (!result.interrupted) {
            OutputValidator validator(OutputValidator::Config{
                .manifest_subdir = settings.manifest_subdir,
                .manifest_file = settings.manifest_file,
            });
            result.missing_artifacts = validator.missing_artifacts(out, params.step_count);
            result.stage = Stage::Validated;
        }
    } catch (const std::exception& ex) {
        result.message = ex.what();
    }

    reporter_.example_finished(result, out);
    return result;
}

}  // namespace prandtl::regression
