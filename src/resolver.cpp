#include "kiln/resolver.hpp"

#include "kiln/process_exec.hpp"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <format>
#include <fstream>
#include <iterator>
#include <sstream>

namespace kiln {

namespace {

std::vector<std::string_view> split_words(std::string_view text) {
    std::vector<std::string_view> words;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t start = text.find_first_not_of(" \t\n", pos);
        if (start == std::string_view::npos)
            break;
        size_t end = text.find_first_of(" \t\n", start);
        if (end == std::string_view::npos)
            end = text.size();
        words.push_back(text.substr(start, end - start));
        pos = end;
    }
    return words;
}

std::string join(const std::vector<std::string> &parts, char sep = ' ') {
    std::string out;
    for (const auto &p : parts) {
        if (!out.empty())
            out += sep;
        out += p;
    }
    return out;
}

std::string_view trim(std::string_view text) {
    size_t start = text.find_first_not_of(" \t\n");
    if (start == std::string_view::npos)
        return {};
    size_t end = text.find_last_not_of(" \t\n");
    return text.substr(start, end - start + 1);
}

bool is_function(std::string_view name) {
    return name == "dir" || name == "notdir" || name == "abspath" || name == "file" || name == "shell" ||
           name == "call";
}

bool is_positional(std::string_view name) {
    return !name.empty() && std::all_of(name.begin(), name.end(), [](char c) { return c >= '0' && c <= '9'; });
}

// Splits on commas outside of nested ${...} references.
std::vector<std::string_view> split_args(std::string_view text) {
    std::vector<std::string_view> args;
    size_t depth = 0;
    size_t start = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '$' && i + 1 < text.size() && (text[i + 1] == '{' || text[i + 1] == '$')) {
            if (text[i + 1] == '{')
                ++depth;
            ++i;
        } else if (text[i] == '}' && depth > 0) {
            --depth;
        } else if (text[i] == ',' && depth == 0) {
            args.push_back(text.substr(start, i - start));
            start = i + 1;
        }
    }
    args.push_back(text.substr(start));
    return args;
}

Result<void> check_recursion(const std::vector<std::string> &stack, const std::string &name) {
    auto first = std::find(stack.begin(), stack.end(), name);
    if (first == stack.end())
        return {};
    std::string chain;
    for (auto it = first; it != stack.end(); ++it) {
        chain += *it;
        chain += " -> ";
    }
    chain += name;
    return fail(ErrorKind::CyclicVariable, std::format("Recursive variable reference: {}", chain));
}

bool is_automatic(std::string_view name, bool in_action) {
    return name == "@" || name == "<" || name == "^" || (in_action && name == "TARGET");
}

} // namespace

VariableResolver::VariableResolver(const Definitions &definitions, ResolverContext context)
    : definitions_(definitions), context_(std::move(context)) {
    if (!context_.build_file.empty()) {
        std::error_code ec;
        build_file_ = std::filesystem::absolute(context_.build_file, ec).lexically_normal();
        if (ec)
            build_file_ = context_.build_file;
    }
}

Result<std::string> VariableResolver::resolve(std::string_view name) {
    std::lock_guard lock(mtx_);
    Frame frame;
    return resolve_locked(std::string(name), frame);
}

Result<std::string> VariableResolver::expand(std::string_view text) {
    std::lock_guard lock(mtx_);
    Frame frame;
    return expand_locked(text, frame);
}

Result<std::string> VariableResolver::expand(std::string_view text, const Scope &scope) {
    std::lock_guard lock(mtx_);
    Frame frame;
    frame.scope = &scope;
    return expand_locked(text, frame);
}

Result<std::string> VariableResolver::expand_locked(std::string_view text, Frame &frame) {
    std::string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        char c = text[i];
        if (c != '$') {
            out += c;
            ++i;
            continue;
        }
        if (i + 1 < text.size() && text[i + 1] == '$') {
            out += '$';
            i += 2;
            continue;
        }
        if (i + 1 >= text.size() || text[i + 1] != '{') {
            out += '$';
            ++i;
            continue;
        }

        size_t depth = 1;
        size_t j = i + 2;
        while (j < text.size()) {
            if (text[j] == '$' && j + 1 < text.size()) {
                if (text[j + 1] == '{') {
                    ++depth;
                    j += 2;
                    continue;
                }
                if (text[j + 1] == '$') {
                    j += 2;
                    continue;
                }
            }
            if (text[j] == '}' && --depth == 0)
                break;
            ++j;
        }
        if (depth != 0) {
            return fail(ErrorKind::Parse, std::format("Unterminated variable reference in: {}", text));
        }

        std::string_view inner = text.substr(i + 2, j - (i + 2));
        Result<std::string> value;
        if (size_t space = inner.find_first_of(" \t"); space != std::string_view::npos) {
            std::string_view fn = inner.substr(0, space);
            if (!is_function(fn)) {
                return fail(ErrorKind::UndefinedVariable, std::format("Unknown function: {}", fn));
            }
            value = call_function(fn, inner.substr(space + 1), frame);
        } else {
            auto name = expand_locked(inner, frame);
            if (!name)
                return name;
            value = resolve_locked(*name, frame);
        }
        if (!value)
            return value;
        out += *value;
        i = j + 1;
    }
    return out;
}

Result<std::string> VariableResolver::resolve_locked(const std::string &name, Frame &frame) {
    if (name.empty()) {
        return fail(ErrorKind::UndefinedVariable, "Empty variable reference");
    }

    if (is_automatic(name, frame.scope != nullptr)) {
        if (frame.scope == nullptr) {
            return fail(ErrorKind::UndefinedVariable,
                        std::format("Automatic variable ${{{}}} used outside of a target action", name));
        }
        frame.scoped = true;
        const Scope &scope = *frame.scope;
        if (name == "@")
            return scope.outputs.empty() ? scope.target : scope.outputs.front();
        if (name == "<")
            return scope.prerequisites.empty() ? std::string() : scope.prerequisites.front();
        if (name == "^")
            return join(scope.prerequisites);
        return scope.target;
    }

    if (frame.args != nullptr && is_positional(name)) {
        frame.scoped = true;
        size_t index = 0;
        auto [ptr, ec] = std::from_chars(name.data(), name.data() + name.size(), index);
        if (ec != std::errc{} || index >= frame.args->size())
            return std::string();
        return (*frame.args)[index];
    }

    if (auto recursion = check_recursion(frame.stack, name); !recursion)
        return std::unexpected(recursion.error());

    if (auto it = cache_.find(name); it != cache_.end()) {
        return it->second;
    }

    bool outer_scoped = frame.scoped;
    frame.scoped = false;
    frame.stack.push_back(name);
    auto value = lookup(name, frame);
    frame.stack.pop_back();
    bool scoped = frame.scoped;
    frame.scoped = outer_scoped || scoped;

    if (value && !scoped) {
        cache_.emplace(name, *value);
    }
    return value;
}

Result<std::string> VariableResolver::lookup(const std::string &name, Frame &frame) {
    if (auto it = context_.overrides.find(name); it != context_.overrides.end()) {
        return expand_locked(it->second, frame);
    }
    if (auto value = builtin(name)) {
        return *value;
    }

    const Variable *var = nullptr;
    if (auto it = definitions_.find(name); it != definitions_.end()) {
        var = &it->second;
    }

    std::optional<std::string> base;
    if (var != nullptr && var->value) {
        auto res = expand_locked(*var->value, frame);
        if (!res)
            return res;
        base = std::move(*res);
    } else if (const char *env = context_.use_environment ? std::getenv(name.c_str()) : nullptr) {
        base = env;
    } else if (var != nullptr && var->fallback) {
        auto res = expand_locked(*var->fallback, frame);
        if (!res)
            return res;
        base = std::move(*res);
    }

    if (!base && (var == nullptr || var->appended.empty())) {
        return fail(ErrorKind::UndefinedVariable, std::format("Undefined variable: {}", name));
    }

    std::string result = base.value_or("");
    if (var != nullptr) {
        for (const auto &fragment : var->appended) {
            auto res = expand_locked(fragment, frame);
            if (!res)
                return res;
            if (!result.empty() && !res->empty())
                result += ' ';
            result += *res;
        }
    }
    return result;
}

std::optional<std::string> VariableResolver::builtin(const std::string &name) const {
    if (name == "CURDIR") {
        std::error_code ec;
        auto cwd = std::filesystem::current_path(ec);
        if (!ec)
            return cwd.string();
        return std::nullopt;
    }
    if (build_file_.empty())
        return std::nullopt;

    if (name == "KILN_FILE")
        return build_file_.string();
    if (name == "KILN_DIR") {
        auto dir = build_file_.parent_path().string();
        if (dir.empty() || dir.back() != '/')
            dir += '/';
        return dir;
    }
    if (name == "KILN_ROOT") {
        auto root = build_file_.parent_path();
        for (size_t i = 0; i < context_.root_depth && root.has_relative_path(); ++i) {
            root = root.parent_path();
        }
        return root.string();
    }
    return std::nullopt;
}

Result<std::string> VariableResolver::call_function(std::string_view fn, std::string_view args, Frame &frame) {
    if (fn == "call")
        return call_variable(args, frame);

    auto expanded = expand_locked(trim(args), frame);
    if (!expanded)
        return expanded;

    std::string key = std::format("{} {}", fn, *expanded);
    if (auto it = call_cache_.find(key); it != call_cache_.end()) {
        return it->second;
    }

    std::string value;
    if (fn == "dir" || fn == "notdir" || fn == "abspath") {
        std::vector<std::string> parts;
        for (auto word : split_words(*expanded)) {
            size_t slash = word.rfind('/');
            if (fn == "dir") {
                parts.emplace_back(slash == std::string_view::npos ? std::string("./")
                                                                   : std::string(word.substr(0, slash + 1)));
            } else if (fn == "notdir") {
                parts.emplace_back(slash == std::string_view::npos ? word : word.substr(slash + 1));
            } else {
                std::error_code ec;
                auto abs = std::filesystem::absolute(std::filesystem::path(word), ec).lexically_normal().string();
                if (ec) {
                    return fail(ErrorKind::Io, std::format("abspath {}: {}", word, ec.message()));
                }
                if (abs.size() > 1 && abs.back() == '/')
                    abs.pop_back();
                parts.push_back(std::move(abs));
            }
        }
        value = join(parts);
    } else if (fn == "file") {
        std::ifstream in{std::string(*expanded)};
        if (!in) {
            return fail(ErrorKind::Io, std::format("Cannot read file: {}", *expanded));
        }
        std::ostringstream content;
        content << in.rdbuf();
        value = content.str();
        if (!value.empty() && value.back() == '\n')
            value.pop_back();
    } else if (fn == "shell") {
        auto res = process_exec({context_.shell, "-c", *expanded});
        if (!res)
            return std::unexpected(res.error());
        if (res->exit_code != 0) {
            return fail(ErrorKind::ExternalProcess,
                        std::format("${{shell {}}} exited with code {}\n{}", *expanded, res->exit_code, res->err));
        }
        value = std::move(res->out);
        std::replace(value.begin(), value.end(), '\n', ' ');
        value = std::string(trim(value));
    }

    call_cache_.emplace(std::move(key), value);
    return value;
}

Result<std::string> VariableResolver::call_variable(std::string_view args, Frame &frame) {
    std::vector<std::string> bound;
    for (auto arg : split_args(args)) {
        auto value = expand_locked(arg, frame);
        if (!value)
            return value;
        bound.push_back(std::move(*value));
    }
    bound.front() = std::string(trim(bound.front()));
    const std::string callee = bound.front();
    if (callee.empty()) {
        return fail(ErrorKind::UndefinedVariable, "${call} without a variable name");
    }
    if (auto recursion = check_recursion(frame.stack, callee); !recursion)
        return std::unexpected(recursion.error());

    // The body goes straight to lookup: its value depends on the arguments.
    const auto *outer_args = frame.args;
    frame.args = &bound;
    frame.stack.push_back(callee);
    auto value = lookup(callee, frame);
    frame.stack.pop_back();
    frame.args = outer_args;
    return value;
}

} // namespace kiln
