#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace prandtl::regression {

/**
 * \brief Checks that a run left its visualisation output behind.
 *
 * Required under `<output>/<manifest_subdir>/`:
 *  - the manifest file (regular file)
 *  - `Cycle000000/` (directory)
 *  - `Cycle%06d/` for the final cycle (directory)
 */
class OutputValidator {
public:
    struct Config {
        std::string manifest_subdir{"ParaView"};
        std::string manifest_file{"ParaView.pvd"};
    };

    explicit OutputValidator(Config config);

    /// Missing artifacts as full paths, in the order listed above. Empty = pass.
    [[nodiscard]] std::vector<std::string> missing_artifacts(const std::filesystem::path& output_dir,
                                                             std::int64_t step_count) const;

    [[nodiscard]] std::filesystem::path manifest_path(const std::filesystem::path& output_dir) const;
    [[nodiscard]] std::filesystem::path cycle_path(const std::filesystem::path& output_dir,
                                                   std::int64_t cycle) const;

    /// `Cycle` followed by the 6-digit zero-padded cycle index.
    [[nodiscard]] static std::string cycle_directory_name(std::int64_t cycle);

private:
    Config config_;
};

}  // namespace prandtl::regression
