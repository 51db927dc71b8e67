#include "prandtl_regression/errors.hpp"

#include <string>

namespace prandtl::regression {

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::UsageError: return "UsageError";
        case ErrorKind::NoInputSpecified: return "NoInputSpecified";
        case ErrorKind::ConflictingInputs: return "ConflictingInputs";
        case ErrorKind::ExecutableNotFound: return "ExecutableNotFound";
        case ErrorKind::SandboxCreateFailed: return "SandboxCreateFailed";
        case ErrorKind::ConfigNotFound: return "ConfigNotFound";
        case ErrorKind::MalformedConfig: return "MalformedConfig";
        case ErrorKind::PatchWriteFailed: return "PatchWriteFailed";
    }
    return "Unknown";
}

HarnessError::HarnessError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_{kind} {}

}  // namespace prandtl::regression
