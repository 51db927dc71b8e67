#pragma once

#include "example.hpp"
#include "summary.hpp"

#include <filesystem>
#include <vector>

namespace prandtl::regression {

/**
 * \brief Emits the machine-readable report of a harness run.
 *
 * write_summary() produces a JSON document with the aggregate counts, the
 * succeeded/failed example lists and one entry per example result.
 */
class SummaryWriter {
public:
    SummaryWriter() = default;

    void write_summary(const std::filesystem::path& destination,
                       const RunParameters& params,
                       const std::vector<RunResult>& results) const;
};

}  // namespace prandtl::regression
