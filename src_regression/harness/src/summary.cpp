#include "prandtl_regression/summary.hpp"

#include <filesystem>
#include <ostream>
#include <vector>

namespace prandtl::regression {

void Summary::record(const RunResult& result) {
    ++total;
    interrupted = interrupted || result.interrupted;
    if (result.succeeded()) {
        succeeded.push_back(result.example);
    } else {
        failed.push_back(result.example);
    }
}

Summary summarize(const std::vector<RunResult>& results) {
    Summary summary;
    for (const auto& result : results) {
        summary.record(result);
    }
    return summary;
}

Reporter::Reporter(std::ostream& out) : out_{out} {}

void Reporter::example_started(const ExampleSpec& example, const std::filesystem::path& work_root) {
    out_ << "==> Running example: " << example.config_path.string() << "\n"
         << "    Working dir: " << work_root.string() << std::endl;
}

void Reporter::example_finished(const RunResult& result, const std::filesystem::path& output_dir) {
    if (result.succeeded()) {
        out_ << "✓ Example OK: " << result.example.name << " (outputs in " << output_dir.string()
             << ")" << std::endl;
        return;
    }

    out_ << "✗ Example FAILED: " << result.example.name << "\n";
    if (!result.message.empty()) {
        out_ << "  - error (" << to_string(result.stage) << "): " << result.message << "\n";
    }
    if (result.timed_out) {
        out_ << "  - timed out\n";
    }
    if (result.interrupted) {
        out_ << "  - interrupted\n";
    }
    if (result.exit_code && *result.exit_code != 0) {
        out_ << "  - runtime exit code: " << *result.exit_code << "\n";
    }
    for (const auto& artifact : result.missing_artifacts) {
        out_ << "  - missing: " << artifact << "\n";
    }
    out_.flush();
}

void Reporter::summary(const Summary& summary) {
    out_ << "\n"
         << "===== Example Summary =====\n"
         << "Total: " << summary.total << " | Succeeded: " << summary.succeeded.size()
         << " | Failed: " << summary.failed.size() << "\n";
    for (const auto& example : summary.succeeded) {
        out_ << "  ✓ " << example.config_path.string() << "\n";
    }
    for (const auto& example : summary.failed) {
        out_ << "  ✗ " << example.config_path.string() << "\n";
    }
    if (summary.interrupted) {
        out_ << "Interrupted: remaining examples were not run.\n";
    }
    out_.flush();
}

}  // namespace prandtl::regression
