#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace kiln {

// A target as written in a definition file. Headers are templates until the
// builder expands them.
struct TargetDef {
    std::string name;
    std::string prerequisites; // Comma-separated list
    std::string outputs;       // Comma-separated list
    std::vector<std::string> commands;
    bool phony = false;
    bool stamp = false;
    std::string origin; // file:line, for diagnostics
};

struct Variable {
    std::optional<std::string> value;    // DEF
    std::optional<std::string> fallback; // DEF?
    std::vector<std::string> appended;   // DEF+
};

using Definitions = std::unordered_map<std::string, Variable>;

struct ResolverContext {
    std::filesystem::path build_file; // top-level definition file
    size_t root_depth = 0;
    std::unordered_map<std::string, std::string> overrides;
    bool use_environment = true;
    std::string shell = "/bin/sh";
};

} // namespace kiln
