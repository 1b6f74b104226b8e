#pragma once

#include "kiln/utility.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace kiln {

struct ProcessOutput {
    int exit_code = 0; // 128 + signal number when the child was killed
    std::string out;
    std::string err;
    bool timed_out = false;
};

// Runs args[0] (searched in PATH) and collects its stdout and stderr. With a
// timeout the child runs in its own process group; when it outlives the
// deadline, closed output or not, the group is killed and timed_out is set.
// Errors only come from the spawning machinery itself.
Result<ProcessOutput> process_exec(std::vector<std::string> args,
                                   std::optional<std::chrono::milliseconds> timeout = std::nullopt);

} // namespace kiln
