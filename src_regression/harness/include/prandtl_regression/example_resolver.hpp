#pragma once

#include "example.hpp"

#include <filesystem>
#include <optional>
#include <vector>

namespace prandtl::regression {

/**
 * \brief Turns the harness input selection into an ordered list of examples.
 *
 * Exactly one of a single configuration path or a list file must be given.
 * A list file holds one configuration path per line:
 *
 * \code{.txt}
 * # Navier-Stokes
 * TestCases/NavierStokes/2D/LidDrivenCavity/config.json
 *
 *   # TestCases/NavierStokes/3D/Channel/config.json
 * TestCases/Heat/2D/Plate/config.json
 * \endcode
 *
 * Empty or whitespace-only lines and lines whose first non-whitespace
 * character is `#` are skipped. Every other line is taken literally (a trailing
 * carriage return is dropped) and file order is kept.
 */
class ExampleResolver {
public:
    struct Input {
        std::optional<std::filesystem::path> config;
        std::optional<std::filesystem::path> list_file;
    };

    ExampleResolver() = default;

    /// Throws HarnessError (NoInputSpecified, ConflictingInputs, UsageError).
    [[nodiscard]] std::vector<ExampleSpec> resolve(const Input& input) const;

    [[nodiscard]] std::vector<std::filesystem::path> read_list(
        const std::filesystem::path& list_file) const;
};

}  // namespace prandtl::regression
