#pragma once

#include "kiln/domain.hpp"
#include "kiln/graph.hpp"
#include "kiln/resolver.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace kiln {

class KilnBuilder {
public:
    KilnBuilder() = default;
    explicit KilnBuilder(ResolverContext context) : context_(std::move(context)) {
    }

    void add_target(TargetDef &&def) {
        targets_.push_back(std::move(def));
    }

    // Appends to the action of the most recently added target.
    Result<void> add_command(std::string command);

    void add_definition(std::string_view key, std::string_view value);
    void add_default(std::string_view key, std::string_view value);
    void append_definition(std::string_view key, std::string_view value);

    void add_goal(std::string_view goal) {
        goals_.emplace_back(goal);
    }

    const Definitions &definitions() const {
        return definitions_;
    }
    const std::vector<TargetDef> &targets() const {
        return targets_;
    }
    TargetDef &last_target() {
        return targets_.back();
    }
    const ResolverContext &context() const {
        return context_;
    }
    ResolverContext &context() {
        return context_;
    }

    // Expands target headers through the resolver and validates the result.
    Result<BuildGraph> emit_graph(VariableResolver &resolver) const;

private:
    Definitions definitions_;
    std::vector<TargetDef> targets_;
    std::vector<std::string> goals_; // raw, expanded in emit_graph
    ResolverContext context_;
};

} // namespace kiln
