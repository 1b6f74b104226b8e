#pragma once

#include "kiln/utility.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace kiln {

// Expanded target definition, the input of build_graph().
struct TargetSpec {
    std::string name;
    std::vector<std::string> prerequisites;
    std::vector<std::string> outputs;
    std::vector<std::string> commands;
    bool phony = false;
    bool stamp = false;
};

class BuildGraph {
public:
    struct Prerequisite {
        std::string path;
        std::optional<size_t> target_id; // empty for plain files
    };

    struct Target {
        std::string name;
        std::vector<Prerequisite> prerequisites;
        std::vector<std::string> outputs;
        std::vector<std::string> commands;
        bool phony = false;
        bool stamp = false;
        std::vector<size_t> deps;      // distinct prerequisite targets
        std::vector<size_t> out_edges; // targets that depend on this one
    };

    Result<size_t> add_target(TargetSpec spec);

    // Resolves prerequisites against declared names and outputs. Must be
    // called once after the last add_target().
    void link();

    std::optional<size_t> find(std::string_view name_or_output) const;

    const std::vector<Target> &targets() const {
        return targets_;
    }
    const Target &target(size_t id) const {
        return targets_[id];
    }
    size_t size() const {
        return targets_.size();
    }

    void set_default_goals(std::vector<std::string> goals) {
        default_goals_ = std::move(goals);
    }
    std::vector<std::string> default_goals() const;

    // Dependencies first. Fails with ErrorKind::Cycle and the cycle path.
    Result<std::vector<size_t>> topo_sort() const;

private:
    std::vector<Target> targets_;
    std::unordered_map<std::string, size_t> index_; // names and outputs
    std::vector<std::string> default_goals_;
};

Result<BuildGraph> build_graph(std::vector<TargetSpec> definitions, std::vector<std::string> default_goals = {});

} // namespace kiln
