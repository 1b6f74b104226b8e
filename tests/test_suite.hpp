#pragma once

bool graph_acyclic_test();
bool graph_cycle_test();
bool graph_duplicate_test();

bool resolver_basic_test();
bool resolver_default_test();
bool resolver_cycle_test();
bool resolver_builtin_test();
bool resolver_function_test();
bool resolver_cache_test();

bool parser_directives_test();
bool parser_include_test();
bool parser_json_test();
bool parser_error_test();

bool staleness_test();
bool staleness_propagation_test();

bool process_exec_test();
bool mapped_file_test();

bool cli_test();

bool executor_scenario_test();
bool executor_idempotence_test();
bool executor_fail_fast_test();
bool executor_dry_run_test();
bool executor_timeout_test();
bool executor_stamp_test();
bool executor_phony_test();
bool executor_unknown_prerequisite_test();
bool executor_parallel_test();
bool executor_parallel_failure_test();
bool executor_tools_test();

bool integration_test();
