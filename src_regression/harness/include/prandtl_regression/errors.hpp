#pragma once

#include <stdexcept>
#include <string>

namespace prandtl::regression {

/**
 * \brief Classifies harness failures.
 *
 * Setup-phase kinds (usage, input selection, executable, sandbox) abort the
 * whole run. Per-example kinds (config lookup, parsing, patch persistence) are
 * caught by the engine and turned into a failed example.
 */
enum class ErrorKind {
    UsageError,
    NoInputSpecified,
    ConflictingInputs,
    ExecutableNotFound,
    SandboxCreateFailed,
    ConfigNotFound,
    MalformedConfig,
    PatchWriteFailed,
};

[[nodiscard]] const char* to_string(ErrorKind kind) noexcept;

class HarnessError : public std::runtime_error {
public:
    HarnessError(ErrorKind kind, const std::string& message);

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

}  // namespace prandtl::regression
