#include "prandtl_regression/example_resolver.hpp"
#include "prandtl_regression/errors.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <vector>

namespace {

constexpr std::string_view kWhitespace = " \t\n\r\f\v";

bool is_skipped_line(std::string_view line) {
    const auto first = line.find_first_not_of(kWhitespace);
    return first == std::string_view::npos || line[first] == '#';
}

}  // namespace

namespace prandtl::regression {

std::vector<std::filesystem::path> ExampleResolver::read_list(
    const std::filesystem::path& list_file) const {
    if (!std::filesystem::is_regular_file(list_file)) {
        throw HarnessError(ErrorKind::UsageError, "List file does not exist: " + list_file.string());
    }

    std::ifstream input(list_file);
    if (!input.is_open()) {
        throw HarnessError(ErrorKind::UsageError, "Unable to open list file: " + list_file.string());
    }

    std::vector<std::filesystem::path> paths;
    std::string raw_line;
    while (std::getline(input, raw_line)) {
        if (!raw_line.empty() && raw_line.back() == '\r') {
            raw_line.pop_back();
        }
        if (is_skipped_line(raw_line)) {
            continue;
        }
        paths.emplace_back(raw_line);
    }
    if (input.bad()) {
        throw HarnessError(ErrorKind::UsageError, "Error while reading list file: " + list_file.string());
    }
    return paths;
}

std::vector<ExampleSpec> ExampleResolver::resolve(const Input& input) const {
    if (input.config && input.list_file) {
        throw HarnessError(ErrorKind::ConflictingInputs, "choose either -c or -l, not both.");
    }
    if (!input.config && !input.list_file) {
        throw HarnessError(ErrorKind::NoInputSpecified, "must provide -c CONFIG.json or -l LIST.txt");
    }

    std::vector<ExampleSpec> examples;
    if (input.config) {
        examples.push_back(make_example(*input.config));
        return examples;
    }

    for (const auto& path : read_list(*input.list_file)) {
        examples.push_back(make_example(path));
    }
    if (examples.empty()) {
        throw HarnessError(ErrorKind::NoInputSpecified,
                           "List file contains no configuration paths: " + input.list_file->string());
    }
    return examples;
}

}  // namespace prandtl::regression
