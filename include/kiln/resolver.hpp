#pragma once

#include "kiln/domain.hpp"
#include "kiln/utility.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace kiln {

// Automatic variables of the target whose action is being expanded.
struct Scope {
    std::string target;
    std::vector<std::string> prerequisites;
    std::vector<std::string> outputs;
};

/**
 * @brief Lazily expands `${NAME}` references against a definition table.
 *
 * Lookup order: automatic variables, command-line overrides, builtins
 * (KILN_FILE, KILN_DIR, KILN_ROOT, CURDIR), definitions and appends, the
 * environment, `DEF?` defaults. Results are cached for the lifetime of the
 * resolver, which is one run. Safe to share between worker threads.
 *
 * `${call NAME,a,b}` expands NAME with `${1}`, `${2}` bound to the arguments
 * and `${0}` to NAME. Like automatic variables, nothing that reads them is
 * cached.
 */
class VariableResolver {
public:
    VariableResolver(const Definitions &definitions, ResolverContext context);

    Result<std::string> resolve(std::string_view name);
    Result<std::string> expand(std::string_view text);
    Result<std::string> expand(std::string_view text, const Scope &scope);

    const ResolverContext &context() const {
        return context_;
    }

private:
    struct Frame {
        const Scope *scope = nullptr;
        std::vector<std::string> stack; // variables being resolved
        bool scoped = false;            // touched an automatic variable
        const std::vector<std::string> *args = nullptr; // innermost ${call}
    };

    Result<std::string> expand_locked(std::string_view text, Frame &frame);
    Result<std::string> resolve_locked(const std::string &name, Frame &frame);
    Result<std::string> lookup(const std::string &name, Frame &frame);
    Result<std::string> call_function(std::string_view fn, std::string_view args, Frame &frame);
    Result<std::string> call_variable(std::string_view args, Frame &frame);
    std::optional<std::string> builtin(const std::string &name) const;

    const Definitions &definitions_;
    ResolverContext context_;
    std::filesystem::path build_file_;
    std::unordered_map<std::string, std::string> cache_;
    std::unordered_map<std::string, std::string> call_cache_;
    std::mutex mtx_;
};

} // namespace kiln
