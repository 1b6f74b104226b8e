#include "kiln/parser.hpp"

#include "kiln/builder.hpp"
#include "kiln/mmap.hpp"
#include "kiln/resolver.hpp"
#include "kiln/utility.hpp"

#include <algorithm>
#include <format>
#include <fstream>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace kiln {

namespace {

struct ParseState {
    KilnBuilder &builder;
    std::vector<std::filesystem::path> include_stack;
};

Result<void> parse_file(ParseState &state, const std::filesystem::path &path);

std::string_view trim(std::string_view text) {
    size_t start = text.find_first_not_of(" \t");
    if (start == std::string_view::npos)
        return {};
    size_t end = text.find_last_not_of(" \t");
    return text.substr(start, end - start + 1);
}

// Splits off the first `count` fields; the last one keeps any further pipes.
std::vector<std::string_view> split_fields(std::string_view line, size_t count) {
    std::vector<std::string_view> fields;
    while (fields.size() + 1 < count) {
        size_t pipe = line.find('|');
        if (pipe == std::string_view::npos)
            break;
        fields.push_back(line.substr(0, pipe));
        line = line.substr(pipe + 1);
    }
    fields.push_back(line);
    return fields;
}

std::string escape_dollars(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        if (c == '$')
            out += '$';
        out += c;
    }
    return out;
}

// Relative paths in INCLUDE and JSON are relative to the including file.
Result<std::filesystem::path> locate(KilnBuilder &builder, std::string_view raw, const std::filesystem::path &from) {
    VariableResolver resolver(builder.definitions(), builder.context());
    auto expanded = resolver.expand(trim(raw));
    if (!expanded)
        return std::unexpected(expanded.error());
    std::filesystem::path target(*expanded);
    if (target.is_relative())
        target = from.parent_path() / target;
    return target.lexically_normal();
}

void flatten(KilnBuilder &builder, const std::string &prefix, const nlohmann::json &node) {
    using json = nlohmann::json;
    switch (node.type()) {
    case json::value_t::object:
        for (const auto &[key, value] : node.items()) {
            flatten(builder, prefix + "_" + key, value);
        }
        break;
    case json::value_t::array: {
        bool scalars = std::all_of(node.begin(), node.end(), [](const json &e) { return e.is_primitive(); });
        if (scalars) {
            std::string joined;
            for (const auto &e : node) {
                if (!joined.empty())
                    joined += ' ';
                joined += e.is_string() ? e.get<std::string>() : e.dump();
            }
            builder.add_definition(prefix, escape_dollars(joined));
        } else {
            for (size_t i = 0; i < node.size(); ++i) {
                flatten(builder, std::format("{}_{}", prefix, i), node[i]);
            }
        }
        break;
    }
    case json::value_t::string:
        builder.add_definition(prefix, escape_dollars(node.get<std::string>()));
        break;
    case json::value_t::null:
        builder.add_definition(prefix, "");
        break;
    default:
        builder.add_definition(prefix, node.dump());
        break;
    }
}

Result<void> parse_json(ParseState &state, std::string_view prefix, const std::filesystem::path &path) {
    std::ifstream in(path);
    if (!in) {
        return fail(ErrorKind::Io, std::format("Cannot open JSON config {}", path.string()));
    }
    nlohmann::json config;
    try {
        config = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error &err) {
        return fail(ErrorKind::Parse, std::format("{}: {}", path.string(), err.what()));
    }
    flatten(state.builder, std::string(trim(prefix)), config);
    return {};
}

Result<void> parse_line(ParseState &state, std::string_view line, const std::filesystem::path &path) {
    KilnBuilder &builder = state.builder;
    std::string_view keyword = line.substr(0, line.find('|'));

    if (keyword == "CMD") {
        auto fields = split_fields(line, 2);
        if (fields.size() != 2)
            return fail(ErrorKind::Parse, "Malformed CMD line (missing pipe)");
        return builder.add_command(std::string(trim(fields[1])));
    }

    if (keyword == "DEF" || keyword == "DEF+" || keyword == "DEF?") {
        auto fields = split_fields(line, 3);
        if (fields.size() != 3) {
            return fail(ErrorKind::Parse, std::format("Malformed {} line (expected {}|name|value)", keyword, keyword));
        }
        auto key = trim(fields[1]);
        if (key.empty())
            return fail(ErrorKind::Parse, "Variable with an empty name");
        auto value = trim(fields[2]);
        if (keyword == "DEF")
            builder.add_definition(key, value);
        else if (keyword == "DEF+")
            builder.append_definition(key, value);
        else
            builder.add_default(key, value);
        return {};
    }

    if (keyword == "TARGET" || keyword == "PHONY" || keyword == "STAMP") {
        auto fields = split_fields(line, 4);
        if (fields.size() < 2 || (keyword == "STAMP" && fields.size() != 4)) {
            return fail(ErrorKind::Parse, std::format("Malformed {} line", keyword));
        }
        if (keyword == "PHONY" && fields.size() == 4) {
            return fail(ErrorKind::Parse, "PHONY targets take no outputs");
        }
        TargetDef def;
        def.name = std::string(trim(fields[1]));
        if (fields.size() > 2)
            def.prerequisites = std::string(trim(fields[2]));
        if (fields.size() > 3)
            def.outputs = std::string(trim(fields[3]));
        def.phony = keyword == "PHONY";
        def.stamp = keyword == "STAMP";
        builder.add_target(std::move(def));
        return {};
    }

    if (keyword == "GOAL") {
        auto fields = split_fields(line, 2);
        if (fields.size() != 2)
            return fail(ErrorKind::Parse, "Malformed GOAL line");
        builder.add_goal(trim(fields[1]));
        return {};
    }

    if (keyword == "INCLUDE") {
        auto fields = split_fields(line, 2);
        if (fields.size() != 2)
            return fail(ErrorKind::Parse, "Malformed INCLUDE line");
        auto included = locate(builder, fields[1], path);
        if (!included)
            return std::unexpected(included.error());
        return parse_file(state, *included);
    }

    if (keyword == "JSON") {
        auto fields = split_fields(line, 3);
        if (fields.size() != 3 || trim(fields[1]).empty())
            return fail(ErrorKind::Parse, "Malformed JSON line (expected JSON|prefix|path)");
        auto config = locate(builder, fields[2], path);
        if (!config)
            return std::unexpected(config.error());
        return parse_json(state, fields[1], *config);
    }

    return fail(ErrorKind::Parse, std::format("Unknown directive: {}", keyword));
}

Result<void> parse_file(ParseState &state, const std::filesystem::path &path) {
    std::error_code ec;
    auto canonical = std::filesystem::weakly_canonical(path, ec);
    if (ec)
        canonical = path;
    if (std::find(state.include_stack.begin(), state.include_stack.end(), canonical) != state.include_stack.end()) {
        return fail(ErrorKind::Parse, std::format("Recursive include of {}", path.string()));
    }

    auto file = MappedFile::map(path);
    if (!file)
        return std::unexpected(file.error());
    std::string_view content = (*file)->content();

    state.include_stack.push_back(canonical);
    size_t start = 0;
    size_t line_no = 0;
    std::string pending; // backslash continuation
    size_t pending_line = 0;
    while (start < content.size()) {
        size_t end = content.find('\n', start);
        if (end == std::string_view::npos) {
            end = content.size();
        }
        ++line_no;

        std::string_view raw = content.substr(start, end - start);
        if (!raw.empty() && raw.back() == '\r') {
            raw.remove_suffix(1);
        }
        start = end + 1;

        if (!raw.empty() && raw.back() == '\\') {
            if (pending.empty())
                pending_line = line_no;
            pending.append(raw.substr(0, raw.size() - 1));
            pending += ' ';
            continue;
        }

        std::string joined;
        std::string_view line = raw;
        size_t origin_line = line_no;
        if (!pending.empty()) {
            joined = std::move(pending);
            joined.append(trim(raw));
            pending.clear();
            line = joined;
            origin_line = pending_line;
        }

        line = trim(line);
        if (line.empty() || line.front() == '#')
            continue;

        size_t targets_before = state.builder.targets().size();
        if (auto res = parse_line(state, line, path); !res) {
            state.include_stack.pop_back();
            auto err = res.error();
            err.message = std::format("{}:{}: {}", path.string(), origin_line, err.message);
            return std::unexpected(err);
        }
        if (state.builder.targets().size() > targets_before && state.builder.last_target().origin.empty()) {
            state.builder.last_target().origin = std::format("{}:{}", path.string(), origin_line);
        }
    }
    state.include_stack.pop_back();

    if (!pending.empty()) {
        return fail(ErrorKind::Parse, std::format("{}:{}: Line continuation at end of file", path.string(), pending_line));
    }
    return {};
}

} // namespace

Result<void> parse(KilnBuilder &builder, const std::filesystem::path &path) {
    ParseState state{builder, {}};
    return parse_file(state, path);
}

} // namespace kiln
