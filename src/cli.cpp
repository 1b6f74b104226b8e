#include "kiln/cli.hpp"

#include "kiln/builder.hpp"
#include "kiln/parser.hpp"
#include "kiln/resolver.hpp"
#include "kiln/utility.hpp"

#include <charconv>
#include <chrono>
#include <cstdio>
#include <format>
#include <iostream>
#include <print>

namespace kiln {

namespace {

void print_usage(FILE *out) {
    std::println(out, "usage: kiln [options] [NAME=value...] [target...]\n"
                      "\n"
                      "options:\n"
                      "  -f FILE            build definition file (default: kiln.build)\n"
                      "  -n                 dry run: print the actions without running them\n"
                      "  -j N               run N actions in parallel (0: one per core)\n"
                      "  -v                 verbose: echo every command before running it\n"
                      "  -t TOOL            clean | graph | commands | targets\n"
                      "  --timeout SEC      fail any command running longer than SEC seconds\n"
                      "  --report FILE      write a JSON report of the run\n"
                      "  --estimates FILE   per-target work estimates (target|cost)\n"
                      "  --root-depth N     KILN_ROOT is N directories above the definition file\n"
                      "  --no-env           do not resolve variables from the environment\n"
                      "  -h                 show this help");
}

template <typename T> bool parse_number(std::string_view text, T &out) {
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc{} && ptr == text.data() + text.size();
}

int report_error(const Error &err) {
    std::println(stderr, "kiln: {}", err.message);
    return exit_code_for(err.kind);
}

} // namespace

std::expected<Options, std::string> parse_args(const std::vector<std::string_view> &args) {
    Options options;

    for (size_t i = 0; i < args.size(); ++i) {
        std::string_view arg = args[i];
        auto value = [&](std::string_view flag) -> std::expected<std::string_view, std::string> {
            if (i + 1 >= args.size())
                return std::unexpected(std::format("{} needs an argument", flag));
            return args[++i];
        };

        if (arg == "-h" || arg == "--help") {
            options.help = true;
        } else if (arg == "-n" || arg == "--dry-run") {
            options.executor.dry_run = true;
        } else if (arg == "-v" || arg == "--verbose") {
            options.executor.verbose = true;
        } else if (arg == "--no-env") {
            options.use_environment = false;
        } else if (arg == "-f" || arg == "-t" || arg == "--report" || arg == "--estimates") {
            auto v = value(arg);
            if (!v)
                return std::unexpected(v.error());
            if (arg == "-f")
                options.build_file = *v;
            else if (arg == "-t")
                options.tool = *v;
            else if (arg == "--report")
                options.report = std::filesystem::path(*v);
            else
                options.executor.estimates_file = *v;
        } else if (arg.starts_with("-j")) {
            std::string_view count = arg.substr(2);
            if (count.empty()) {
                auto v = value(arg);
                if (!v)
                    return std::unexpected(v.error());
                count = *v;
            }
            if (!parse_number(count, options.executor.jobs))
                return std::unexpected(std::format("invalid job count: {}", count));
        } else if (arg == "--timeout") {
            auto v = value(arg);
            if (!v)
                return std::unexpected(v.error());
            unsigned seconds = 0;
            if (!parse_number(*v, seconds) || seconds == 0)
                return std::unexpected(std::format("invalid timeout: {}", *v));
            options.executor.timeout = std::chrono::seconds(seconds);
        } else if (arg == "--root-depth") {
            auto v = value(arg);
            if (!v)
                return std::unexpected(v.error());
            if (!parse_number(*v, options.root_depth))
                return std::unexpected(std::format("invalid root depth: {}", *v));
        } else if (arg.starts_with("-") && arg.size() > 1) {
            return std::unexpected(std::format("unknown option: {}", arg));
        } else if (auto eq = arg.find('='); eq != std::string_view::npos && eq > 0) {
            options.overrides.insert_or_assign(std::string(arg.substr(0, eq)), std::string(arg.substr(eq + 1)));
        } else {
            options.goals.emplace_back(arg);
        }
    }

    if (!options.tool.empty() && options.tool != "clean" && options.tool != "graph" && options.tool != "commands" &&
        options.tool != "targets") {
        return std::unexpected(std::format("unknown tool: {}", options.tool));
    }
    return options;
}

int run_cli(int argc, char **argv) {
    auto options = parse_args(std::vector<std::string_view>(argv + 1, argv + argc));
    if (!options) {
        std::println(stderr, "kiln: {}", options.error());
        print_usage(stderr);
        return EXIT_USAGE;
    }
    if (options->help) {
        print_usage(stdout);
        return EXIT_OK;
    }

    ResolverContext context;
    context.build_file = options->build_file;
    context.root_depth = options->root_depth;
    context.overrides = options->overrides;
    context.use_environment = options->use_environment;
    context.shell = options->executor.shell;

    KilnBuilder builder(std::move(context));
    if (auto res = parse(builder, options->build_file); !res)
        return report_error(res.error());

    VariableResolver resolver(builder.definitions(), builder.context());
    auto graph = builder.emit_graph(resolver);
    if (!graph)
        return report_error(graph.error());

    if (options->tool == "targets") {
        for (const auto &target : graph->targets()) {
            std::println("{}{}", target.name, target.phony ? " (phony)" : "");
        }
        return EXIT_OK;
    }

    Executor executor(std::move(*graph), resolver, options->executor);

    if (!options->tool.empty()) {
        Result<void> res;
        if (options->tool == "clean")
            res = executor.clean();
        else if (options->tool == "graph")
            res = executor.emit_graph(std::cout);
        else
            res = executor.emit_commands(std::cout);
        return res ? EXIT_OK : report_error(res.error());
    }

    auto results = executor.run(options->goals);
    std::optional<Error> error;
    if (!results)
        error = results.error();

    if (options->report) {
        if (auto res = write_report(*options->report, executor.results(), error); !res) {
            std::println(stderr, "kiln: {}", res.error().message);
            if (!error)
                return exit_code_for(res.error().kind);
        }
    }

    if (error)
        return report_error(*error);
    return EXIT_OK;
}

} // namespace kiln
