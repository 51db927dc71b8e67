#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace prandtl::regression {

/// Key of the run-time options block inside a solver configuration.
inline constexpr const char* kRunTimeKey = "runTime";

/**
 * \brief Typed view of the `runTime` block of a solver configuration.
 *
 * Only the fields the harness reads or overrides are typed. A known key whose
 * value has an unexpected JSON type is left in `passthrough` untouched, as is
 * every unknown key, so from_json()/to_json() never drop data.
 */
struct RunTimeOptions {
    std::optional<bool> visualize;
    std::optional<bool> paraview;
    std::optional<bool> visit;
    std::optional<bool> nancheck;
    std::optional<std::int64_t> vis_steps;
    std::optional<bool> variable_dt;
    std::optional<double> dt;
    std::optional<double> final_time;
    std::optional<double> initial_save_dt;
    std::optional<std::string> output_file_path;
    std::optional<bool> checkpoint_load;
    nlohmann::json passthrough = nlohmann::json::object();

    [[nodiscard]] static RunTimeOptions from_json(const nlohmann::json& block);
    [[nodiscard]] nlohmann::json to_json() const;
};

struct PatchParameters {
    std::int64_t step_count{100};
    std::string output_directory;
    double default_dt{1e-7};
};

/**
 * \brief Snapshot cadence for a run of `step_count` steps.
 *
 * 10 when `step_count` is a multiple of 10 (so cycle 0 and cycle N are both
 * written), otherwise half the step count, never less than 1.
 */
[[nodiscard]] std::int64_t compute_vis_steps(std::int64_t step_count) noexcept;

/**
 * \brief Applies the harness overrides to a run-time block.
 *
 * Pure function: the input is not modified. Order of derivation:
 *  1. visualize/paraview on, visit off, nancheck on
 *  2. vis_steps from compute_vis_steps()
 *  3. variable_dt off
 *  4. dt kept if set, else final_time / N, else the default
 *  5. final_time = dt * N
 *  6. initial_save_dt = dt * vis_steps
 *  7. output_file_path = output directory
 *  8. checkpoint_load off
 */
[[nodiscard]] RunTimeOptions derive_run_time(const RunTimeOptions& original,
                                             const PatchParameters& params);

/**
 * \brief Loads, patches and stores solver configuration documents.
 */
class ConfigPatcher {
public:
    explicit ConfigPatcher(PatchParameters params);

    /// Throws HarnessError (ConfigNotFound, MalformedConfig).
    [[nodiscard]] nlohmann::json load(const std::filesystem::path& file) const;

    /// Returns a new document; `original` is left as is. Throws MalformedConfig.
    [[nodiscard]] nlohmann::json patch(const nlohmann::json& original) const;

    /// Throws HarnessError (PatchWriteFailed).
    void write(const std::filesystem::path& destination, const nlohmann::json& document) const;

    /// load() + patch() + write(). Returns the patched document.
    nlohmann::json patch_file(const std::filesystem::path& source,
                              const std::filesystem::path& destination) const;


private:
    PatchParameters params_;
};

}  // namespace prandtl::regression
