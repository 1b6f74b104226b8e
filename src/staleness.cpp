#include "kiln/staleness.hpp"

#include <format>

namespace kiln {

Result<bool> is_stale(const BuildGraph &graph, size_t target_id, StatCache &stat_cache,
                      const std::function<bool(size_t)> &was_rebuilt) {
    const auto &target = graph.target(target_id);

    std::optional<std::filesystem::file_time_type> newest_input;
    auto note_input = [&newest_input](std::filesystem::file_time_type t) {
        if (!newest_input || t > *newest_input)
            newest_input = t;
    };

    bool prerequisite_rebuilt = false;
    bool prerequisite_missing = false;
    for (const auto &pre : target.prerequisites) {
        if (!pre.target_id) {
            auto time = stat_cache.mtime(pre.path);
            if (!time) {
                return fail(ErrorKind::UnknownTarget,
                            std::format("No rule to make target {}, needed by {}", pre.path, target.name));
            }
            note_input(*time);
            continue;
        }

        if (was_rebuilt(*pre.target_id)) {
            prerequisite_rebuilt = true;
            continue;
        }
        for (const auto &out : graph.target(*pre.target_id).outputs) {
            auto time = stat_cache.mtime(out);
            if (!time) {
                prerequisite_missing = true;
                continue;
            }
            note_input(*time);
        }
    }

    if (target.phony || target.outputs.empty())
        return true;
    if (prerequisite_rebuilt || prerequisite_missing)
        return true;

    std::optional<std::filesystem::file_time_type> oldest_output;
    for (const auto &out : target.outputs) {
        auto time = stat_cache.mtime(out);
        if (!time)
            return true;
        if (!oldest_output || *time < *oldest_output)
            oldest_output = *time;
    }

    return newest_input && *newest_input > *oldest_output;
}

} // namespace kiln
