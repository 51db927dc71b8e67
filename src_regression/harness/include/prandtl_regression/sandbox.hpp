#pragma once

#include <filesystem>
#include <string>

namespace prandtl::regression {

/**
 * \brief Prepares the run root and stages a private copy of the executable.
 *
 * The staged copy is what every example invokes, so rebuilding the original
 * executable while the harness runs does not affect it.
 */
class Sandbox {
public:
    Sandbox(std::filesystem::path root, std::string staged_name);

    /// Throws HarnessError (ExecutableNotFound, SandboxCreateFailed).
    std::filesystem::path prepare(const std::filesystem::path& executable) const;

    [[nodiscard]] std::filesystem::path staged_executable() const { return root_ / staged_name_; }

    [[nodiscard]] static bool is_executable_file(const std::filesystem::path& path);

private:
    std::filesystem::path root_;
    std::string staged_name_;
};

}  // namespace prandtl::regression
