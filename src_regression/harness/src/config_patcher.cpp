#include "prandtl_regression/config_patcher.hpp"
#include "prandtl_regression/errors.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace {

using nlohmann::json;

// Field readers: take the value into `out` when its JSON type matches,
// otherwise leave it in the passthrough object.
void take_bool(json& rest, const char* key, std::optional<bool>& out) {
    auto it = rest.find(key);
    if (it != rest.end() && it->is_boolean()) {
        out = it->get<bool>();
        rest.erase(it);
    }
}

void take_number(json& rest, const char* key, std::optional<double>& out) {
    auto it = rest.find(key);
    if (it != rest.end() && it->is_number()) {
        out = it->get<double>();
        rest.erase(it);
    }
}

void take_integer(json& rest, const char* key, std::optional<std::int64_t>& out) {
    auto it = rest.find(key);
    if (it != rest.end() && it->is_number_integer()) {
        out = it->get<std::int64_t>();
        rest.erase(it);
    }
}

void take_string(json& rest, const char* key, std::optional<std::string>& out) {
    auto it = rest.find(key);
    if (it != rest.end() && it->is_string()) {
        out = it->get<std::string>();
        rest.erase(it);
    }
}

template <typename T>
void put(json& doc, const char* key, const std::optional<T>& value) {
    if (value) {
        doc[key] = *value;
    }
}

}  // namespace

namespace prandtl::regression {

RunTimeOptions RunTimeOptions::from_json(const json& block) {
    if (!block.is_object()) {
        throw HarnessError(ErrorKind::MalformedConfig,
                           std::string("'") + kRunTimeKey + "' must be a JSON object");
    }

    RunTimeOptions options;
    json rest = block;
    take_bool(rest, "visualize", options.visualize);
    take_bool(rest, "paraview", options.paraview);
    take_bool(rest, "visit", options.visit);
    take_bool(rest, "nancheck", options.nancheck);
    take_integer(rest, "vis_steps", options.vis_steps);
    take_bool(rest, "variable_dt", options.variable_dt);
    take_number(rest, "dt", options.dt);
    take_number(rest, "final_time", options.final_time);
    take_number(rest, "initial_save_dt", options.initial_save_dt);
    take_string(rest, "output_file_path", options.output_file_path);
    take_bool(rest, "checkpoint_load", options.checkpoint_load);
    options.passthrough = std::move(rest);
    return options;
}

json RunTimeOptions::to_json() const {
    json doc = passthrough.is_object() ? passthrough : json::object();
    put(doc, "visualize", visualize);
    put(doc, "paraview", paraview);
    put(doc, "visit", visit);
    put(doc, "nancheck", nancheck);
    put(doc, "vis_steps", vis_steps);
    put(doc, "variable_dt", variable_dt);
    put(doc, "dt", dt);
    put(doc, "final_time", final_time);
    put(doc, "initial_save_dt", initial_save_dt);
    put(doc, "output_file_path", output_file_path);
    put(doc, "checkpoint_load", checkpoint_load);
    return doc;
}

std::int64_t compute_vis_steps(std::int64_t step_count) noexcept {
    if (step_count % 10 == 0) {
        return 10;
    }
    return std::max<std::int64_t>(1, step_count / 2);
}

RunTimeOptions derive_run_time(const RunTimeOptions& original, const PatchParameters& params) {
    const auto n = params.step_count;
    RunTimeOptions patched = original;

    patched.visualize = true;
    patched.paraview = true;
    patched.visit = false;
    patched.nancheck = true;

    patched.vis_steps = compute_vis_steps(n);
    patched.variable_dt = false;

    if (original.dt) {
        patched.dt = original.dt;
    } else if (original.final_time) {
        patched.dt = *original.final_time / static_cast<double>(n);
    } else {
        patched.dt = params.default_dt;
    }
    // A non-numeric dt in the source is superseded by the typed value.
    patched.passthrough.erase("dt");

    patched.final_time = *patched.dt * static_cast<double>(n);
    patched.passthrough.erase("final_time");
    patched.initial_save_dt = *patched.dt * static_cast<double>(*patched.vis_steps);
    patched.passthrough.erase("initial_save_dt");

    patched.output_file_path = params.output_directory;
    patched.checkpoint_load = false;

    for (const char* key : {"visualize", "paraview", "visit", "nancheck", "vis_steps",
                            "variable_dt", "output_file_path", "checkpoint_load"}) {
        patched.passthrough.erase(key);
    }
    return patched;
}

ConfigPatcher::ConfigPatcher(PatchParameters params) : params_{std::move(params)} {}

json ConfigPatcher::load(const fs::path& file) const {
    if (!fs::exists(file)) {
        throw HarnessError(ErrorKind::ConfigNotFound, "config not found: " + file.string());
    }
    if (!fs::is_regular_file(file)) {
        throw HarnessError(ErrorKind::ConfigNotFound, "config is not a regular file: " + file.string());
    }

    std::ifstream input(file);
    if (!input.is_open()) {
        throw HarnessError(ErrorKind::ConfigNotFound, "Unable to open config: " + file.string());
    }

    try {
        return json::parse(input);
    } catch (const json::parse_error& ex) {
        throw HarnessError(ErrorKind::MalformedConfig,
                           "Malformed config " + file.string() + ": " + ex.what());
    }
}

json ConfigPatcher::patch(const json& original) const {
    if (!original.is_object()) {
        throw HarnessError(ErrorKind::MalformedConfig, "config root must be a JSON object");
    }
    if (params_.step_count < 1) {
        throw HarnessError(ErrorKind::UsageError,
                           "step count must be at least 1, got " + std::to_string(params_.step_count));
    }

    const auto it = original.find(kRunTimeKey);
    const auto run_time = (it == original.end() || it->is_null())
                              ? RunTimeOptions{}
                              : RunTimeOptions::from_json(*it);

    json patched = original;
    patched[kRunTimeKey] = derive_run_time(run_time, params_).to_json();
    return patched;
}

void ConfigPatcher::write(const fs::path& destination, const json& document) const {
    std::error_code ec;
    if (const auto parent = destination.parent_path(); !parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            throw HarnessError(ErrorKind::PatchWriteFailed,
                               "Failed to create directory " + parent.string() + ": " + ec.message());
        }
    }

    std::ofstream output(destination, std::ios::binary | std::ios::trunc);
    if (!output.is_open()) {
        throw HarnessError(ErrorKind::PatchWriteFailed,
                           "Unable to open patched config for writing: " + destination.string());
    }
    output << document.dump(2) << '\n';
    output.flush();
    if (!output) {
        throw HarnessError(ErrorKind::PatchWriteFailed,
                           "Short write on patched config: " + destination.string());
    }
}

json ConfigPatcher::patch_file(const fs::path& source, const fs::path& destination) const {
    auto patched = patch(load(source));
    write(destination, patched);
    return patched;
}

}  // namespace prandtl::regression
