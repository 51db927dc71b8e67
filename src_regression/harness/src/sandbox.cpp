#include "prandtl_regression/sandbox.hpp"
#include "prandtl_regression/errors.hpp"

#include <filesystem>
#include <string>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace prandtl::regression {

Sandbox::Sandbox(fs::path root, std::string staged_name)
    : root_{std::move(root)}, staged_name_{std::move(staged_name)} {}

bool Sandbox::is_executable_file(const fs::path& path) {
    std::error_code ec;
    const auto status = fs::status(path, ec);
    if (ec || !fs::is_regular_file(status)) {
        return false;
    }
    const auto exec_bits = fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec;
    return (status.permissions() & exec_bits) != fs::perms::none;
}

fs::path Sandbox::prepare(const fs::path& executable) const {
    if (!is_executable_file(executable)) {
        throw HarnessError(ErrorKind::ExecutableNotFound,
                           "Prandtl executable not found at " + executable.string());
    }

    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec) {
        throw HarnessError(ErrorKind::SandboxCreateFailed,
                           "Failed to create run directory " + root_.string() + ": " + ec.message());
    }

    const auto staged = staged_executable();
    if (fs::exists(staged) && fs::equivalent(executable, staged, ec)) {
        return staged;
    }
    fs::copy_file(executable, staged, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        throw HarnessError(ErrorKind::SandboxCreateFailed,
                           "Failed to copy " + executable.string() + " to " + staged.string() + ": " +
                               ec.message());
    }

    // The copy has to stay runnable even when the source mode was owner-only.
    fs::permissions(staged, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                                fs::perms::others_read | fs::perms::others_exec,
                    fs::perm_options::add, ec);
    if (ec) {
        throw HarnessError(ErrorKind::SandboxCreateFailed,
                           "Failed to set permissions on " + staged.string() + ": " + ec.message());
    }
    return staged;
}

}  // namespace prandtl::regression
