#include "kiln/builder.hpp"

#include <format>

namespace kiln {

namespace {

// Splits a comma-separated header field, expands each entry and splits the
// expansion on whitespace.
Result<std::vector<std::string>> expand_list(std::string_view field, VariableResolver &resolver) {
    std::vector<std::string> items;
    std::string_view remaining = field;
    while (!remaining.empty()) {
        size_t comma_pos = remaining.find(',');
        std::string_view entry;
        if (comma_pos == std::string_view::npos) {
            entry = remaining;
            remaining = {};
        } else {
            entry = remaining.substr(0, comma_pos);
            remaining = remaining.substr(comma_pos + 1);
        }

        auto expanded = resolver.expand(entry);
        if (!expanded)
            return std::unexpected(expanded.error());

        std::string_view words = *expanded;
        size_t pos = 0;
        while (pos < words.size()) {
            size_t start = words.find_first_not_of(" \t", pos);
            if (start == std::string_view::npos)
                break;
            size_t end = words.find_first_of(" \t", start);
            if (end == std::string_view::npos)
                end = words.size();
            items.emplace_back(words.substr(start, end - start));
            pos = end;
        }
    }
    return items;
}

Error at(const TargetDef &def, Error err) {
    if (!def.origin.empty())
        err.message = std::format("{}: {}", def.origin, err.message);
    return err;
}

} // namespace

Result<void> KilnBuilder::add_command(std::string command) {
    if (targets_.empty()) {
        return fail(ErrorKind::Parse, "Command outside of a target");
    }
    targets_.back().commands.push_back(std::move(command));
    return {};
}

void KilnBuilder::add_definition(std::string_view key, std::string_view value) {
    auto &var = definitions_[std::string(key)];
    var.value = std::string(value);
    var.appended.clear();
}

void KilnBuilder::add_default(std::string_view key, std::string_view value) {
    definitions_[std::string(key)].fallback = std::string(value);
}

void KilnBuilder::append_definition(std::string_view key, std::string_view value) {
    definitions_[std::string(key)].appended.emplace_back(value);
}

Result<BuildGraph> KilnBuilder::emit_graph(VariableResolver &resolver) const {
    std::vector<TargetSpec> specs;
    specs.reserve(targets_.size());

    for (const auto &def : targets_) {
        TargetSpec spec;
        auto name = resolver.expand(def.name);
        if (!name)
            return std::unexpected(at(def, name.error()));
        spec.name = std::string(name->substr(0, name->find_last_not_of(" \t") + 1));

        auto prerequisites = expand_list(def.prerequisites, resolver);
        if (!prerequisites)
            return std::unexpected(at(def, prerequisites.error()));
        spec.prerequisites = std::move(*prerequisites);

        auto outputs = expand_list(def.outputs, resolver);
        if (!outputs)
            return std::unexpected(at(def, outputs.error()));
        spec.outputs = std::move(*outputs);

        if (def.stamp && spec.outputs.size() != 1) {
            return fail(ErrorKind::Parse,
                        std::format("{}: stamp target {} needs exactly one sentinel file", def.origin, spec.name));
        }
        if (def.phony && !spec.outputs.empty()) {
            return fail(ErrorKind::Parse,
                        std::format("{}: phony target {} cannot declare outputs", def.origin, spec.name));
        }

        spec.commands = def.commands;
        spec.phony = def.phony;
        spec.stamp = def.stamp;
        specs.push_back(std::move(spec));
    }

    std::vector<std::string> goals;
    for (const auto &goal : goals_) {
        auto expanded = expand_list(goal, resolver);
        if (!expanded)
            return std::unexpected(expanded.error());
        goals.insert(goals.end(), expanded->begin(), expanded->end());
    }

    return build_graph(std::move(specs), std::move(goals));
}

} // namespace kiln
