#include "prandtl_regression/summary_writer.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace {

using nlohmann::json;
using prandtl::regression::ExampleSpec;
using prandtl::regression::RunParameters;
using prandtl::regression::RunResult;
using prandtl::regression::Summary;

json example_to_json(const ExampleSpec& example) {
    return json{
        {"name", example.name},
        {"config", example.config_path.string()},
    };
}

json result_to_json(const RunResult& result) {
    json entry = example_to_json(result.example);
    entry["status"] = result.succeeded() ? "PASS" : "FAIL";
    entry["stage"] = prandtl::regression::to_string(result.stage);
    entry["exit_code"] = result.exit_code ? json(*result.exit_code) : json(nullptr);
    entry["timed_out"] = result.timed_out;
    entry["interrupted"] = result.interrupted;
    entry["missing_artifacts"] = result.missing_artifacts;
    if (!result.message.empty()) {
        entry["message"] = result.message;
    }
    return entry;
}

json build_summary(const RunParameters& params, const std::vector<RunResult>& results) {
    const Summary summary = prandtl::regression::summarize(results);

    json doc = {
        {"total", summary.total},
        {"succeeded", json::array()},
        {"failed", json::array()},
        {"interrupted", summary.interrupted},
        {"step_count", params.step_count},
        {"run_directory", params.work_root.string()},
        {"examples", json::array()},
    };
    for (const auto& example : summary.succeeded) {
        doc["succeeded"].push_back(example.config_path.string());
    }
    for (const auto& example : summary.failed) {
        doc["failed"].push_back(example.config_path.string());
    }
    for (const auto& result : results) {
        doc["examples"].push_back(result_to_json(result));
    }
    return doc;
}

void ensure_parent(const std::filesystem::path& destination) {
    const auto parent = destination.parent_path();
    if (!parent.empty() && !std::filesystem::exists(parent)) {
        std::filesystem::create_directories(parent);
    }
}

void write_file(const std::filesystem::path& destination, const std::string& content) {
    ensure_parent(destination);
    std::ofstream output(destination, std::ios::binary);
    if (!output.is_open()) {
        throw std::runtime_error("Unable to open output file: " + destination.string());
    }
    output << content << '\n';
}

}  // namespace

namespace prandtl::regression {

void SummaryWriter::write_summary(const std::filesystem::path& destination,
                                  const RunParameters& params,
                                  const std::vector<RunResult>& results) const {
    write_file(destination, build_summary(params, results).dump(2));
}

}  // namespace prandtl::regression
