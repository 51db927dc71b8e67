#include "prandtl_regression/example.hpp"

#include <filesystem>

namespace prandtl::regression {

const char* to_string(Stage stage) noexcept {
    switch (stage) {
        case Stage::Pending: return "pending";
        case Stage::Patched: return "patched";
        case Stage::Executed: return "executed";
        case Stage::Validated: return "validated";
    }
    return "unknown";
}

ExampleSpec make_example(const std::filesystem::path& config_path) {
    ExampleSpec spec;
    spec.config_path = config_path;
    // Resolve against the current directory so `config.json` and `./a/../b/config.json`
    // still name their real parent directory.
    const auto absolute = std::filesystem::absolute(config_path).lexically_normal();
    spec.name = absolute.parent_path().filename().string();
    if (spec.name.empty()) {
        spec.name = absolute.stem().string();
    }
    return spec;
}

}  // namespace prandtl::regression
