#include "kiln/executor.hpp"

#include "kiln/staleness.hpp"

#include <filesystem>
#include <format>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace kiln {

namespace {

// Body of a double-quoted DOT string.
std::string dot_escape(std::string_view text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        if (c == '"' || c == '\\')
            escaped += '\\';
        if (c == '\n') {
            escaped += "\\n";
            continue;
        }
        escaped += c;
    }
    return escaped;
}

} // namespace

Result<void> Executor::clean() {
    std::println("Cleaning build artifacts...");

    for (const auto &target : graph_.targets()) {
        if (target.phony)
            continue;
        for (const auto &out : target.outputs) {
            std::error_code ec;
            if (!std::filesystem::exists(out, ec))
                continue;
            std::filesystem::remove(out, ec);
            if (ec) {
                return fail(ErrorKind::Io, std::format("Failed to remove {}: {}", out, ec.message()));
            }
            std::println("Removed {}", out);
            stat_cache.invalidate(out);
        }
    }
    return {};
}

Result<void> Executor::emit_graph(std::ostream &os) {
    stat_cache.clear();
    auto order = graph_.topo_sort();
    if (!order)
        return std::unexpected(order.error());

    // Same propagation as a dry run: a target is green when it would run.
    std::vector<bool> rebuild(graph_.size(), false);
    std::vector<bool> broken(graph_.size(), false);
    for (size_t id : *order) {
        auto stale = is_stale(graph_, id, stat_cache, [&rebuild](size_t dep) { return rebuild[dep]; });
        if (!stale) {
            broken[id] = true;
            rebuild[id] = true;
        } else {
            rebuild[id] = *stale;
        }
    }

    os << "digraph kiln_build {\n";
    os << "  rankdir=LR;\n";
    os << "  node [shape=box, style=filled, fontname=\"Helvetica\"];\n";

    std::unordered_map<std::string, size_t> files;
    for (size_t i = 0; i < graph_.size(); ++i) {
        const auto &target = graph_.target(i);
        std::string color = broken[i] ? "red" : rebuild[i] ? "green" : "white";
        os << "  t" << i << " [label=\"" << dot_escape(target.name) << "\", fillcolor=\"" << color << "\"";
        if (target.phony)
            os << ", shape=ellipse";
        os << "];\n";

        for (const auto &pre : target.prerequisites) {
            if (pre.target_id) {
                os << "  t" << *pre.target_id << " -> t" << i << ";\n";
                continue;
            }
            auto [it, inserted] = files.emplace(pre.path, files.size());
            if (inserted) {
                // light gray for source files
                os << "  f" << it->second << " [label=\"" << dot_escape(pre.path) << "\", fillcolor=\"0.9 0.9 0.9\"];\n";
            }
            os << "  f" << it->second << " -> t" << i << ";\n";
        }
    }
    os << "}\n";
    return {};
}

Result<void> Executor::emit_commands(std::ostream &os) {
    auto order = graph_.topo_sort();
    if (!order)
        return std::unexpected(order.error());

    using json = nlohmann::json;
    json db = json::array();
    auto cwd = std::filesystem::current_path().string();

    for (size_t id : *order) {
        const auto &target = graph_.target(id);
        auto commands = expand_commands(id);
        if (!commands)
            return std::unexpected(commands.error());

        json prerequisites = json::array();
        for (const auto &pre : target.prerequisites) {
            prerequisites.push_back(pre.path);
        }

        json entry;
        entry["target"] = target.name;
        entry["directory"] = cwd;
        entry["phony"] = target.phony;
        entry["prerequisites"] = prerequisites;
        entry["outputs"] = target.outputs;
        entry["commands"] = *commands;
        db.push_back(entry);
    }

    os << db.dump(4) << "\n";
    return {};
}

Result<void> write_report(const std::filesystem::path &path, const std::vector<ExecutionResult> &results,
                          const std::optional<Error> &error) {
    using json = nlohmann::json;
    json report;
    report["success"] = !error.has_value();
    if (error) {
        report["error"] = {{"kind", error_kind_name(error->kind)}, {"message", error->message}};
    }

    json targets = json::array();
    for (const auto &result : results) {
        targets.push_back({
            {"target", result.target},
            {"outcome", outcome_name(result.outcome)},
            {"exit_code", result.exit_code},
            {"command", result.command},
            {"stdout", result.output},
            {"stderr", result.errors},
            {"seconds", result.seconds},
        });
    }
    report["targets"] = targets;

    std::ofstream f(path);
    if (!f) {
        return fail(ErrorKind::Io, std::format("Cannot write report {}", path.string()));
    }
    f << report.dump(4) << "\n";
    if (!f) {
        return fail(ErrorKind::Io, std::format("Failed writing report {}", path.string()));
    }
    return {};
}

} // namespace kiln
