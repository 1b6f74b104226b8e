#include "kiln/graph.hpp"

#include "kiln/utility.hpp"

#include <algorithm>
#include <cstdint>
#include <format>
#include <functional>

namespace kiln {

Result<size_t> BuildGraph::add_target(TargetSpec spec) {
    if (spec.name.empty()) {
        return fail(ErrorKind::Parse, "Target with an empty name");
    }
    if (auto it = index_.find(spec.name); it != index_.end()) {
        const auto &other = targets_[it->second];
        if (other.name == spec.name) {
            return fail(ErrorKind::DuplicateTarget, std::format("Duplicate target: {}", spec.name));
        }
        return fail(ErrorKind::DuplicateTarget,
                    std::format("Target name {} is already an output of {}", spec.name, other.name));
    }

    size_t id = targets_.size();
    for (const auto &out : spec.outputs) {
        if (out == spec.name)
            continue;
        if (auto it = index_.find(out); it != index_.end()) { // 2 different targets create the same file.
            return fail(ErrorKind::DuplicateTarget,
                        std::format("Duplicate producer for output: {} ({} and {})", out,
                                    targets_[it->second].name, spec.name));
        }
    }

    index_.emplace(spec.name, id);
    for (const auto &out : spec.outputs) {
        index_.emplace(out, id);
    }

    Target target;
    target.name = std::move(spec.name);
    target.outputs = std::move(spec.outputs);
    target.commands = std::move(spec.commands);
    target.phony = spec.phony;
    target.stamp = spec.stamp;
    target.prerequisites.reserve(spec.prerequisites.size());
    for (auto &pre : spec.prerequisites) {
        target.prerequisites.push_back({std::move(pre), std::nullopt});
    }
    targets_.push_back(std::move(target));
    return id;
}

void BuildGraph::link() {
    for (auto &target : targets_) {
        target.deps.clear();
        target.out_edges.clear();
    }
    for (size_t id = 0; id < targets_.size(); ++id) {
        auto &target = targets_[id];
        for (auto &pre : target.prerequisites) {
            auto it = index_.find(pre.path);
            if (it == index_.end()) {
                pre.target_id.reset();
                continue;
            }
            pre.target_id = it->second;
            if (std::find(target.deps.begin(), target.deps.end(), it->second) == target.deps.end()) {
                target.deps.push_back(it->second);
            }
        }
    }
    for (size_t id = 0; id < targets_.size(); ++id) {
        for (size_t dep : targets_[id].deps) {
            targets_[dep].out_edges.push_back(id);
        }
    }
}

std::optional<size_t> BuildGraph::find(std::string_view name_or_output) const {
    if (auto it = index_.find(std::string(name_or_output)); it != index_.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::vector<std::string> BuildGraph::default_goals() const {
    if (!default_goals_.empty())
        return default_goals_;
    if (targets_.empty())
        return {};
    return {targets_.front().name};
}

Result<std::vector<size_t>> BuildGraph::topo_sort() const {
    enum class STATUS : uint8_t { UNSTARTED, WORKING, FINISHED };

    std::vector<STATUS> status(targets_.size(), STATUS::UNSTARTED);
    std::vector<size_t> order;
    std::vector<size_t> stack;
    order.reserve(targets_.size());

    std::function<Result<void>(size_t)> dfs = [&](size_t u) -> Result<void> {
        status[u] = STATUS::WORKING;
        stack.push_back(u);
        for (size_t v : targets_[u].deps) {
            if (status[v] == STATUS::UNSTARTED) {
                if (auto res = dfs(v); !res)
                    return res;
            } else if (status[v] == STATUS::WORKING) {
                std::string path;
                auto first = std::find(stack.begin(), stack.end(), v);
                for (auto it = first; it != stack.end(); ++it) {
                    path += targets_[*it].name;
                    path += " -> ";
                }
                path += targets_[v].name;
                return fail(ErrorKind::Cycle, std::format("Cycle detected in the build graph: {}", path));
            }
        }
        stack.pop_back();
        status[u] = STATUS::FINISHED;
        order.push_back(u);
        return {};
    };

    for (size_t i = 0; i < targets_.size(); ++i) {
        if (status[i] == STATUS::UNSTARTED) {
            if (auto res = dfs(i); !res)
                return std::unexpected(res.error());
        }
    }

    // Post-order over dependency edges already puts prerequisites first.
    return order;
}

Result<BuildGraph> build_graph(std::vector<TargetSpec> definitions, std::vector<std::string> default_goals) {
    BuildGraph graph;
    for (auto &def : definitions) {
        if (auto res = graph.add_target(std::move(def)); !res)
            return std::unexpected(res.error());
    }
    graph.link();

    for (const auto &goal : default_goals) {
        if (!graph.find(goal)) {
            return fail(ErrorKind::UnknownTarget, std::format("Default goal {} is not a declared target", goal));
        }
    }
    graph.set_default_goals(std::move(default_goals));

    if (auto res = graph.topo_sort(); !res)
        return std::unexpected(res.error());
    return graph;
}

} // namespace kiln
