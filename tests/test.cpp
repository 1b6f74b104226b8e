#include "tests/test_suite.hpp"

#include <iostream>
#include <print>
#include <string_view>

namespace {

struct TestCase {
    std::string_view name;
    bool (*run)();
};

constexpr TestCase TESTS[] = {
    {"graph_acyclic", graph_acyclic_test},
    {"graph_cycle", graph_cycle_test},
    {"graph_duplicate", graph_duplicate_test},
    {"resolver_basic", resolver_basic_test},
    {"resolver_default", resolver_default_test},
    {"resolver_cycle", resolver_cycle_test},
    {"resolver_builtin", resolver_builtin_test},
    {"resolver_function", resolver_function_test},
    {"resolver_cache", resolver_cache_test},
    {"parser_directives", parser_directives_test},
    {"parser_include", parser_include_test},
    {"parser_json", parser_json_test},
    {"parser_error", parser_error_test},
    {"staleness", staleness_test},
    {"staleness_propagation", staleness_propagation_test},
    {"process_exec", process_exec_test},
    {"mapped_file", mapped_file_test},
    {"cli", cli_test},
    {"executor_scenario", executor_scenario_test},
    {"executor_idempotence", executor_idempotence_test},
    {"executor_fail_fast", executor_fail_fast_test},
    {"executor_dry_run", executor_dry_run_test},
    {"executor_timeout", executor_timeout_test},
    {"executor_stamp", executor_stamp_test},
    {"executor_phony", executor_phony_test},
    {"executor_unknown_prerequisite", executor_unknown_prerequisite_test},
    {"executor_parallel", executor_parallel_test},
    {"executor_parallel_failure", executor_parallel_failure_test},
    {"executor_tools", executor_tools_test},
    {"integration", integration_test},
};

} // namespace

// kiln_tests [name]: runs one test, or all of them.
int main(int argc, char **argv) {
    if (argc > 1) {
        std::string_view wanted = argv[1];
        for (const auto &test : TESTS) {
            if (test.name == wanted)
                return test.run() ? 0 : 1;
        }
        std::println(std::cerr, "Unknown test: {}", wanted);
        return 1;
    }

    bool ok = true;
    for (const auto &test : TESTS) {
        ok = test.run() && ok;
    }
    return ok ? 0 : 1;
}
