#pragma once

#include "kiln/builder.hpp"
#include "kiln/utility.hpp"

#include <filesystem>

namespace kiln {

/**
 * @brief Parses a build definition file into the builder.
 *
 * One directive per line, fields separated by `|`:
 * `DEF`, `DEF+`, `DEF?`, `INCLUDE`, `JSON`, `TARGET`, `PHONY`, `STAMP`,
 * `CMD` and `GOAL`. Leading whitespace is ignored, `#` starts a comment and a
 * trailing backslash continues the line.
 *
 * @param builder The builder to populate with targets and definitions.
 * @param path The definition file (typically "kiln.build").
 * @return Success or a Parse/Io error naming file and line.
 */
Result<void> parse(KilnBuilder &builder, const std::filesystem::path &path);

} // namespace kiln
