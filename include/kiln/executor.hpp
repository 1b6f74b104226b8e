#pragma once

#include "kiln/graph.hpp"
#include "kiln/resolver.hpp"
#include "kiln/stat_cache.hpp"
#include "kiln/utility.hpp"
#include "kiln/work_estimate.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <thread>
#include <vector>

namespace kiln {

struct ExecutorConfig {
    std::filesystem::path estimates_file;
    size_t jobs = 1; // 0 = hardware concurrency
    bool dry_run = false;
    bool verbose = false;
    std::optional<std::chrono::milliseconds> timeout;
    std::string shell = "/bin/sh";
};

enum class TargetState : uint8_t { Unvisited, Visiting, Built, Skipped, Failed };

enum class Outcome : uint8_t { Skipped, Built, Failed };

const char *outcome_name(Outcome outcome);

struct ExecutionResult {
    std::string target;
    Outcome outcome = Outcome::Skipped;
    int exit_code = 0;
    std::string command; // last command run, the failing one on failure
    std::string output;  // captured stdout
    std::string errors;  // captured stderr
    double seconds = 0;
};

class Executor {
public:
    Executor(BuildGraph graph, VariableResolver &resolver, const ExecutorConfig &config = {});

    // Builds the goals (the default goals when empty). Stops at the first
    // failure; results() keeps what was recorded up to that point.
    Result<std::vector<ExecutionResult>> run(const std::vector<std::string> &goals = {});

    // Removes the declared outputs of every non-phony target.
    Result<void> clean();
    // Graphviz rendering of the graph, colored by staleness.
    Result<void> emit_graph(std::ostream &os);
    // JSON database of the expanded actions.
    Result<void> emit_commands(std::ostream &os);

    const std::vector<ExecutionResult> &results() const {
        return results_;
    }
    const BuildGraph &graph() const {
        return graph_;
    }

private:
    Result<std::vector<size_t>> resolve_goals(const std::vector<std::string> &goals) const;
    std::vector<bool> reachable(const std::vector<size_t> &goals) const;
    Result<void> visit(size_t id);
    Result<void> run_parallel(const std::vector<bool> &wanted);
    Result<void> process_target(size_t id);
    Result<std::vector<std::string>> expand_commands(size_t id);
    Result<void> fail_target(size_t id, ExecutionResult result, Error err);
    bool was_rebuilt(size_t id) const;
    void record(ExecutionResult result);

    BuildGraph graph_;
    VariableResolver &resolver_;
    ExecutorConfig config;
    std::unique_ptr<WorkEstimate> estimator;
    StatCache stat_cache;

    std::vector<std::atomic<TargetState>> states_;
    std::vector<ExecutionResult> results_;
    std::mutex results_mtx;
    std::mutex cout_tty_mtx;
    std::atomic<size_t> started_count = 0;
    size_t planned_count = 0;
    bool tty = false;
    std::vector<std::jthread> pool;
};

Result<void> write_report(const std::filesystem::path &path, const std::vector<ExecutionResult> &results,
                          const std::optional<Error> &error);

} // namespace kiln
