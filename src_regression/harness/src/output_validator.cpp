#include "prandtl_regression/output_validator.hpp"

#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace prandtl::regression {

OutputValidator::OutputValidator(Config config) : config_{std::move(config)} {}

std::string OutputValidator::cycle_directory_name(std::int64_t cycle) {
    std::ostringstream os;
    os << "Cycle" << std::setw(6) << std::setfill('0') << cycle;
    return os.str();
}

fs::path OutputValidator::manifest_path(const fs::path& output_dir) const {
    return output_dir / config_.manifest_subdir / config_.manifest_file;
}

fs::path OutputValidator::cycle_path(const fs::path& output_dir, std::int64_t cycle) const {
    return output_dir / config_.manifest_subdir / cycle_directory_name(cycle);
}

std::vector<std::string> OutputValidator::missing_artifacts(const fs::path& output_dir,
                                                            std::int64_t step_count) const {
    std::vector<std::string> missing;
    std::error_code ec;

    const auto manifest = manifest_path(output_dir);
    if (!fs::is_regular_file(manifest, ec)) {
        missing.push_back(manifest.string());
    }

    const auto first = cycle_path(output_dir, 0);
    if (!fs::is_directory(first, ec)) {
        missing.push_back(first.string());
    }

    const auto last = cycle_path(output_dir, step_count);
    if (!fs::is_directory(last, ec)) {
        missing.push_back(last.string());
    }
    return missing;
}

}  // namespace prandtl::regression
