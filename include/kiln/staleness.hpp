#pragma once

#include "kiln/graph.hpp"
#include "kiln/stat_cache.hpp"
#include "kiln/utility.hpp"

#include <functional>
#include <optional>

namespace kiln {

/**
 * @brief Decides whether a target has to run.
 *
 * All prerequisite targets must have finished before this is called.
 * `was_rebuilt(id)` reports whether prerequisite target `id` ran (or, in a
 * dry run, would have run) in this invocation; such a prerequisite makes the
 * target stale whatever the timestamps say.
 *
 * Fails with ErrorKind::UnknownTarget when a plain file prerequisite does not
 * exist.
 */
Result<bool> is_stale(const BuildGraph &graph, size_t target_id, StatCache &stat_cache,
                      const std::function<bool(size_t)> &was_rebuilt);

} // namespace kiln
