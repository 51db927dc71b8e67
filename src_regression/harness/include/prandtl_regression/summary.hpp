#pragma once

#include "example.hpp"

#include <cstddef>
#include <filesystem>
#include <ostream>
#include <vector>

namespace prandtl::regression {

/**
 * \brief Aggregate over all example results of one invocation.
 */
struct Summary {
    /// 128 + SIGINT, as a shell reports a command stopped by Ctrl-C.
    static constexpr int kInterruptedExitCode = 130;

    std::size_t total{0};
    std::vector<ExampleSpec> succeeded;
    std::vector<ExampleSpec> failed;
    bool interrupted{false};

    void record(const RunResult& result);

    [[nodiscard]] bool all_passed() const noexcept { return failed.empty(); }

    /// 130 when the run was interrupted, else 0 when every example succeeded and 1 otherwise.
    [[nodiscard]] int exit_code() const noexcept {
        if (interrupted) {
            return kInterruptedExitCode;
        }
        return all_passed() ? 0 : 1;
    }
};

[[nodiscard]] Summary summarize(const std::vector<RunResult>& results);

/**
 * \brief Human-readable console output: per-example progress and the final summary.
 */
class Reporter {
public:
    explicit Reporter(std::ostream& out);

    void example_started(const ExampleSpec& example, const std::filesystem::path& work_root);
    void example_finished(const RunResult& result, const std::filesystem::path& output_dir);
    void summary(const Summary& summary);

private:
    std::ostream& out_;
};

}  // namespace prandtl::regression
