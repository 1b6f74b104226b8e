#include "kiln/executor.hpp"

#include "kiln/process_exec.hpp"
#include "kiln/staleness.hpp"
#include "kiln/utility.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdio>
#include <filesystem>
#include <format>
#include <fstream>
#include <mutex>
#include <print>
#include <queue>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

namespace kiln {

const char *outcome_name(Outcome outcome) {
    switch (outcome) {
    case Outcome::Skipped:
        return "skipped";
    case Outcome::Built:
        return "built";
    case Outcome::Failed:
        return "failed";
    }
    return "unknown";
}

Executor::Executor(BuildGraph graph, VariableResolver &resolver, const ExecutorConfig &config)
    : graph_(std::move(graph)), resolver_(resolver), config(config) {
    estimator = std::make_unique<WorkEstimate>(config.estimates_file);
    tty = isatty(STDOUT_FILENO) == 1;
}

Result<std::vector<size_t>> Executor::resolve_goals(const std::vector<std::string> &goals) const {
    const std::vector<std::string> requested = goals.empty() ? graph_.default_goals() : goals;
    std::vector<size_t> ids;
    ids.reserve(requested.size());
    for (const auto &goal : requested) {
        if (auto id = graph_.find(goal)) {
            ids.push_back(*id);
            continue;
        }
        std::error_code ec;
        if (std::filesystem::exists(goal, ec)) // a plain source file: nothing to do
            continue;
        return fail(ErrorKind::UnknownTarget, std::format("No rule to make target {}", goal));
    }
    return ids;
}

std::vector<bool> Executor::reachable(const std::vector<size_t> &goals) const {
    std::vector<bool> wanted(graph_.size(), false);
    std::vector<size_t> stack(goals.begin(), goals.end());
    while (!stack.empty()) {
        size_t id = stack.back();
        stack.pop_back();
        if (wanted[id])
            continue;
        wanted[id] = true;
        for (size_t dep : graph_.target(id).deps) {
            stack.push_back(dep);
        }
    }
    return wanted;
}

Result<std::vector<ExecutionResult>> Executor::run(const std::vector<std::string> &goals) {
    pool.clear(); // Ensure clean state
    stat_cache.clear();
    results_.clear();
    states_ = std::vector<std::atomic<TargetState>>(graph_.size());
    started_count = 0;

    auto ids = resolve_goals(goals);
    if (!ids)
        return std::unexpected(ids.error());

    auto wanted = reachable(*ids);
    planned_count = static_cast<size_t>(std::count(wanted.begin(), wanted.end(), true));
    if (planned_count == 0)
        return results_;

    size_t thread_count = config.jobs;
    if (thread_count == 0)
        thread_count = std::thread::hardware_concurrency();
    if (thread_count == 0)
        thread_count = 1;

    if (thread_count == 1) {
        for (size_t id : *ids) {
            if (auto res = visit(id); !res)
                return std::unexpected(res.error());
        }
    } else if (auto res = run_parallel(wanted); !res) {
        return std::unexpected(res.error());
    }
    return results_;
}

Result<void> Executor::visit(size_t id) {
    switch (states_[id].load()) {
    case TargetState::Built:
    case TargetState::Skipped:
        return {};
    case TargetState::Visiting:
        return fail(ErrorKind::Cycle, std::format("Cycle detected while building {}", graph_.target(id).name));
    case TargetState::Failed:
        return fail(ErrorKind::ExternalProcess, std::format("Target {} already failed", graph_.target(id).name));
    case TargetState::Unvisited:
        break;
    }

    states_[id] = TargetState::Visiting;
    for (size_t dep : graph_.target(id).deps) {
        if (auto res = visit(dep); !res)
            return res;
    }
    return process_target(id);
}

Result<void> Executor::run_parallel(const std::vector<bool> &wanted) {
    std::vector<size_t> in_degrees(graph_.size(), 0);
    for (size_t id = 0; id < graph_.size(); ++id) {
        if (wanted[id])
            in_degrees[id] = graph_.target(id).deps.size();
    }

    struct Task {
        size_t target_id;
        size_t estimate;
        bool operator<(const Task &other) const {
            return estimate < other.estimate;
        }
    };
    std::priority_queue<Task> ready_queue;

    auto push_ready = [&](size_t id) {
        size_t est = estimator->get_work_estimate(graph_.target(id).name);
        ready_queue.push({.target_id = id, .estimate = est});
    };

    for (size_t id = 0; id < graph_.size(); ++id) {
        if (wanted[id] && in_degrees[id] == 0) {
            push_ready(id);
        }
    }

    std::mutex mtx;
    std::condition_variable cv_ready;
    size_t remaining = planned_count;
    size_t active_workers = 0;
    std::optional<Error> first_error;

    auto worker = [&]() {
        while (true) {
            size_t id;
            {
                std::unique_lock lock(mtx);
                cv_ready.wait(lock, [&] {
                    return first_error.has_value() || remaining == 0 || !ready_queue.empty() || active_workers == 0;
                });

                // On failure nothing new starts; running actions finish on their own.
                if (first_error || ready_queue.empty())
                    return;

                id = ready_queue.top().target_id;
                ready_queue.pop();
                states_[id] = TargetState::Visiting;
                active_workers++;
            }

            auto result = process_target(id);

            {
                std::lock_guard lock(mtx);
                active_workers--;

                size_t new_work_count = 0;
                if (!result) {
                    if (!first_error)
                        first_error = result.error();
                } else {
                    remaining--;
                    for (size_t dependent : graph_.target(id).out_edges) {
                        if (wanted[dependent] && --in_degrees[dependent] == 0) {
                            push_ready(dependent);
                            new_work_count++;
                        }
                    }
                }

                bool build_finished = remaining == 0;
                bool stall_detected = active_workers == 0 && ready_queue.empty();
                constexpr auto TUNABLE__notify_all_criteria = 10;
                if (build_finished || first_error || stall_detected) {
                    cv_ready.notify_all();
                } else if (new_work_count >= TUNABLE__notify_all_criteria) {
                    cv_ready.notify_all();
                } else {
                    for (size_t ii = 0; ii < new_work_count; ++ii) {
                        cv_ready.notify_one();
                    }
                }
            }
        }
    };

    size_t thread_count = config.jobs == 0 ? std::thread::hardware_concurrency() : config.jobs;
    thread_count = std::clamp<size_t>(thread_count, 1, planned_count);
    for (size_t i = 0; i < thread_count; ++i) {
        pool.emplace_back(worker);
    }

    pool.clear(); // Join all threads

    if (first_error)
        return std::unexpected(*first_error);
    if (remaining != 0)
        return fail(ErrorKind::Cycle, "Cycle detected: build stalled with pending targets");
    return {};
}

bool Executor::was_rebuilt(size_t id) const {
    return states_[id].load() == TargetState::Built;
}

void Executor::record(ExecutionResult result) {
    std::lock_guard lock(results_mtx);
    results_.push_back(std::move(result));
}

Result<void> Executor::fail_target(size_t id, ExecutionResult result, Error err) {
    states_[id] = TargetState::Failed;
    result.outcome = Outcome::Failed;
    record(std::move(result));
    return std::unexpected(std::move(err));
}

Result<std::vector<std::string>> Executor::expand_commands(size_t id) {
    const auto &target = graph_.target(id);
    Scope scope;
    scope.target = target.name;
    scope.outputs = target.outputs;
    scope.prerequisites.reserve(target.prerequisites.size());
    for (const auto &pre : target.prerequisites) {
        scope.prerequisites.push_back(pre.path);
    }

    std::vector<std::string> commands;
    commands.reserve(target.commands.size());
    for (const auto &command : target.commands) {
        auto expanded = resolver_.expand(command, scope);
        if (!expanded) {
            auto err = expanded.error();
            err.message = std::format("In the action of {}: {}", target.name, err.message);
            return std::unexpected(err);
        }
        commands.push_back(std::move(*expanded));
    }
    return commands;
}

Result<void> Executor::process_target(size_t id) {
    // NOLINTBEGIN(performance-avoid-endl)
    const auto &target = graph_.target(id);
    ExecutionResult result;
    result.target = target.name;

    auto stale = is_stale(graph_, id, stat_cache, [this](size_t dep) { return was_rebuilt(dep); });
    if (!stale)
        return fail_target(id, std::move(result), stale.error());

    if (!*stale) {
        states_[id] = TargetState::Skipped;
        result.outcome = Outcome::Skipped;
        record(std::move(result));
#if FF_kiln__logging
        std::lock_guard lock(cout_tty_mtx);
        std::println("Skipping {} (up to date)", target.name);
#endif
        return {};
    }

    auto commands = expand_commands(id);
    if (!commands)
        return fail_target(id, std::move(result), commands.error());

    size_t seq = ++started_count;
    if (config.verbose || config.dry_run) {
        std::lock_guard lock(cout_tty_mtx);
        if (config.dry_run)
            std::print("[DRY RUN] ");
        else
            std::print("[{}/{}] ", seq, planned_count);
        if (tty)
            std::println("\033[1;32m{}\033[0m", target.name);
        else
            std::println("{}", target.name);
    }

    if (!config.dry_run) {
        for (const auto &out : target.outputs) {
            auto parent = std::filesystem::path(out).parent_path();
            if (parent.empty())
                continue;
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                return fail_target(id, std::move(result),
                                   {ErrorKind::Io, std::format("Cannot create directory {} for {}: {}",
                                                               parent.string(), target.name, ec.message())});
            }
        }
    }

    auto start = std::chrono::steady_clock::now();
    for (const auto &command : *commands) {
        if (config.verbose || config.dry_run) {
            std::lock_guard lock(cout_tty_mtx);
            std::println("  {}", command);
            std::fflush(stdout);
        }
        if (config.dry_run)
            continue;

        result.command = command;
        auto res = process_exec({config.shell, "-c", command}, config.timeout);
        if (!res) {
            auto err = res.error();
            err.message = std::format("Failed to execute `{}` for {}: {}", command, target.name, err.message);
            return fail_target(id, std::move(result), std::move(err));
        }

        result.exit_code = res->exit_code;
        result.output += res->out;
        result.errors += res->err;
        {
            std::lock_guard lock(cout_tty_mtx);
            if (!res->out.empty()) {
                std::print("{}", res->out);
                std::fflush(stdout);
            }
            // The stderr of a failing command is part of the error instead.
            if (!res->err.empty() && res->exit_code == 0 && !res->timed_out)
                std::print(stderr, "{}", res->err);
        }

        if (res->timed_out) {
            auto limit = config.timeout.value_or(std::chrono::milliseconds{0});
            return fail_target(id, std::move(result),
                               {ErrorKind::Timeout, std::format("Target {} timed out after {}ms: `{}`{}{}",
                                                                target.name, limit.count(), command,
                                                                res->err.empty() ? "" : "\n", res->err)});
        }
        if (res->exit_code != 0) {
            return fail_target(id, std::move(result),
                               {ErrorKind::ExternalProcess,
                                std::format("Target {} failed: `{}` exited with code {}{}{}", target.name, command,
                                            res->exit_code, res->err.empty() ? "" : "\n", res->err)});
        }
    }

    if (!config.dry_run) {
        if (target.stamp) {
            const auto &sentinel = target.outputs.front();
            std::ofstream touch(sentinel, std::ios::app);
            std::error_code ec;
            if (touch)
                std::filesystem::last_write_time(sentinel, std::filesystem::file_time_type::clock::now(), ec);
            if (!touch || ec) {
                return fail_target(id, std::move(result),
                                   {ErrorKind::Io, std::format("Cannot touch sentinel {} of {}", sentinel, target.name)});
            }
        }
        for (const auto &out : target.outputs) {
            stat_cache.invalidate(out);
        }
    }

    std::chrono::duration<double> diff = std::chrono::steady_clock::now() - start;
    result.seconds = diff.count();
    result.outcome = Outcome::Built;
    states_[id] = TargetState::Built;
#if FF_kiln__profiling
    {
        std::lock_guard lock(cout_tty_mtx);
        std::println("Target {} took {:.4f}s", target.name, diff.count());
    }
#endif
    record(std::move(result));
    return {};
    // NOLINTEND(performance-avoid-endl)
}

} // namespace kiln
