#include "tests/test_suite.hpp"
#include "tests/testing_utils.hpp"

#include "kiln/graph.hpp"
#include "kiln/staleness.hpp"
#include "kiln/stat_cache.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <print>

using namespace kiln;

namespace {

bool never_rebuilt(size_t) {
    return false;
}

BuildGraph compile_graph() {
    auto graph = build_graph({
        {.name = "compile", .prerequisites = {"src/top.sv"}, .outputs = {"work/top.o"}},
        {.name = "split", .prerequisites = {"src/top.sv"}, .outputs = {"work/a.o", "work/b.o"}},
        {.name = "check", .prerequisites = {"src/top.sv"}, .outputs = {}},
        {.name = "all", .prerequisites = {"work/top.o"}, .phony = true},
    });
    assert(graph);
    return std::move(*graph);
}

} // namespace

bool staleness_test() {
    std::println("Starting Staleness Test...");
    ScratchDir scratch("staleness");

    auto now = std::filesystem::file_time_type::clock::now();
    create_dummy_file("src/top.sv");
    create_dummy_file("work/top.o");
    std::filesystem::last_write_time("src/top.sv", now - std::chrono::seconds(20));
    std::filesystem::last_write_time("work/top.o", now - std::chrono::seconds(10));

    auto graph = compile_graph();
    size_t compile = *graph.find("compile");

    {
        StatCache cache;
        auto stale = is_stale(graph, compile, cache, never_rebuilt);
        assert(stale && !*stale);
    }

    // Equal timestamps count as up to date.
    std::filesystem::last_write_time("src/top.sv", now - std::chrono::seconds(10));
    {
        StatCache cache;
        auto stale = is_stale(graph, compile, cache, never_rebuilt);
        assert(stale && !*stale);
    }

    std::filesystem::last_write_time("src/top.sv", now);
    {
        StatCache cache;
        auto stale = is_stale(graph, compile, cache, never_rebuilt);
        assert(stale && *stale);
    }

    // The oldest output decides.
    create_dummy_file("work/a.o");
    create_dummy_file("work/b.o");
    std::filesystem::last_write_time("work/a.o", now - std::chrono::seconds(5));
    std::filesystem::last_write_time("work/b.o", now + std::chrono::seconds(5));
    {
        StatCache cache;
        auto stale = is_stale(graph, *graph.find("split"), cache, never_rebuilt);
        assert(stale && *stale);
    }
    std::filesystem::last_write_time("work/a.o", now + std::chrono::seconds(5));
    {
        StatCache cache;
        auto stale = is_stale(graph, *graph.find("split"), cache, never_rebuilt);
        assert(stale && !*stale);
    }

    // Missing output.
    std::filesystem::remove("work/b.o");
    {
        StatCache cache;
        auto stale = is_stale(graph, *graph.find("split"), cache, never_rebuilt);
        assert(stale && *stale);
    }

    // No outputs and phony targets always run.
    {
        StatCache cache;
        auto check = is_stale(graph, *graph.find("check"), cache, never_rebuilt);
        assert(check && *check);
        auto all = is_stale(graph, *graph.find("all"), cache, never_rebuilt);
        assert(all && *all);
    }

    // A missing plain prerequisite is an error.
    std::filesystem::remove("src/top.sv");
    {
        StatCache cache;
        auto stale = is_stale(graph, compile, cache, never_rebuilt);
        assert(!stale);
        assert(stale.error().kind == ErrorKind::UnknownTarget);
        assert(stale.error().message.find("src/top.sv") != std::string::npos);
        assert(stale.error().message.find("compile") != std::string::npos);
    }

    std::println("Staleness Test passed!");
    return true;
}

bool staleness_propagation_test() {
    std::println("Starting Staleness Propagation Test...");
    ScratchDir scratch("staleness_propagation");

    auto graph = build_graph({
        {.name = "gen", .prerequisites = {"src/soc_reg.hjson"}, .outputs = {"src/soc_reg.sv"}},
        {.name = "compile", .prerequisites = {"src/soc_reg.sv"}, .outputs = {"work/soc_reg.o"}},
    });
    assert(graph);
    size_t gen = *graph->find("gen");
    size_t compile = *graph->find("compile");
    // The output path is enough to reach the producing target.
    assert(graph->target(compile).deps == std::vector<size_t>{gen});

    auto now = std::filesystem::file_time_type::clock::now();
    create_dummy_file("src/soc_reg.hjson");
    create_dummy_file("src/soc_reg.sv");
    create_dummy_file("work/soc_reg.o");
    std::filesystem::last_write_time("src/soc_reg.hjson", now - std::chrono::seconds(30));
    std::filesystem::last_write_time("src/soc_reg.sv", now - std::chrono::seconds(20));
    std::filesystem::last_write_time("work/soc_reg.o", now - std::chrono::seconds(10));

    {
        StatCache cache;
        auto stale = is_stale(*graph, compile, cache, never_rebuilt);
        assert(stale && !*stale);
    }

    // A rebuilt prerequisite makes the dependent stale whatever the timestamps say.
    {
        StatCache cache;
        auto stale = is_stale(*graph, compile, cache, [gen](size_t id) { return id == gen; });
        assert(stale && *stale);
    }

    // Newer prerequisite output.
    std::filesystem::last_write_time("src/soc_reg.sv", now);
    {
        StatCache cache;
        auto stale = is_stale(*graph, compile, cache, never_rebuilt);
        assert(stale && *stale);
    }

    // Missing prerequisite output.
    std::filesystem::remove("src/soc_reg.sv");
    {
        StatCache cache;
        auto stale = is_stale(*graph, compile, cache, never_rebuilt);
        assert(stale && *stale);
    }

    // The cache holds on to what it saw until told otherwise.
    StatCache cache;
    assert(!cache.mtime("src/soc_reg.sv"));
    create_dummy_file("src/soc_reg.sv");
    assert(!cache.mtime("src/soc_reg.sv"));
    cache.invalidate("src/./soc_reg.sv");
    assert(cache.mtime("src/soc_reg.sv"));

    std::filesystem::last_write_time("src/soc_reg.sv", now + std::chrono::seconds(30));
    assert(*cache.mtime("src/soc_reg.sv") < now + std::chrono::seconds(30));
    cache.clear();
    assert(*cache.mtime("src/soc_reg.sv") > now + std::chrono::seconds(29));

    std::println("Staleness Propagation Test passed!");
    return true;
}
