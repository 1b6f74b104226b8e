#pragma once

#include "kiln/executor.hpp"

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace kiln {

struct Options {
    std::filesystem::path build_file = "kiln.build";
    ExecutorConfig executor;
    std::string tool;
    std::optional<std::filesystem::path> report;
    size_t root_depth = 0;
    bool use_environment = true;
    std::unordered_map<std::string, std::string> overrides;
    std::vector<std::string> goals;
    bool help = false;
};

// Parses the command line without the program name. The error is a one-line
// message for the user.
std::expected<Options, std::string> parse_args(const std::vector<std::string_view> &args);

// Whole `kiln` invocation; returns the process exit code.
int run_cli(int argc, char **argv);

} // namespace kiln
