#include "tests/test_suite.hpp"

#include "kiln/graph.hpp"

#include <algorithm>
#include <cassert>
#include <print>

using namespace kiln;

namespace {

size_t position(const std::vector<size_t> &order, size_t id) {
    return static_cast<size_t>(std::find(order.begin(), order.end(), id) - order.begin());
}

} // namespace

bool graph_acyclic_test() {
    std::println("Starting Graph Acyclic Test...");

    std::vector<TargetSpec> defs = {
        {.name = "link", .prerequisites = {"build/main.o", "build/util.o"}, .outputs = {"build/app"}},
        {.name = "main", .prerequisites = {"src/main.c"}, .outputs = {"build/main.o"}},
        {.name = "util", .prerequisites = {"src/util.c"}, .outputs = {"build/util.o"}},
    };

    auto graph = build_graph(std::move(defs));
    assert(graph);
    assert(graph->size() == 3);

    // Outputs resolve to their producer.
    assert(graph->find("build/main.o") == graph->find("main"));
    assert(!graph->find("src/main.c"));

    const auto &link = graph->target(*graph->find("link"));
    assert(link.deps.size() == 2);
    assert(link.prerequisites[0].target_id == graph->find("main"));

    const auto &main = graph->target(*graph->find("main"));
    assert(!main.prerequisites[0].target_id); // plain file
    assert(main.out_edges.size() == 1);

    auto order = graph->topo_sort();
    assert(order);
    size_t link_id = *graph->find("link");
    assert(position(*order, *graph->find("main")) < position(*order, link_id));
    assert(position(*order, *graph->find("util")) < position(*order, link_id));

    // First declared target is the default goal unless GOAL says otherwise.
    assert(graph->default_goals() == std::vector<std::string>{"link"});
    auto with_goal = build_graph({{.name = "a"}, {.name = "b"}}, {"b"});
    assert(with_goal && with_goal->default_goals() == std::vector<std::string>{"b"});
    auto bad_goal = build_graph({{.name = "a"}}, {"nope"});
    assert(!bad_goal && bad_goal.error().kind == ErrorKind::UnknownTarget);

    std::println("Graph Acyclic Test passed!");
    return true;
}

bool graph_cycle_test() {
    std::println("Starting Graph Cycle Test...");

    auto graph = build_graph({
        {.name = "a", .prerequisites = {"b"}},
        {.name = "b", .prerequisites = {"c"}},
        {.name = "c", .prerequisites = {"a"}},
        {.name = "d"},
    });
    assert(!graph);
    assert(graph.error().kind == ErrorKind::Cycle);
    assert(graph.error().message.find("a -> b -> c -> a") != std::string::npos);

    // A target that lists its own output.
    auto self = build_graph({{.name = "gen", .prerequisites = {"out.sv"}, .outputs = {"out.sv"}}});
    assert(!self);
    assert(self.error().kind == ErrorKind::Cycle);
    assert(self.error().message.find("gen") != std::string::npos);

    std::println("Graph Cycle Test passed!");
    return true;
}

bool graph_duplicate_test() {
    std::println("Starting Graph Duplicate Test...");

    auto twice = build_graph({{.name = "a"}, {.name = "a"}});
    assert(!twice);
    assert(twice.error().kind == ErrorKind::DuplicateTarget);

    auto producers = build_graph({
        {.name = "elf", .outputs = {"test/bootrom.elf", "test/bootrom.bin"}},
        {.name = "bin", .outputs = {"test/bootrom.bin"}},
    });
    assert(!producers);
    assert(producers.error().kind == ErrorKind::DuplicateTarget);
    assert(producers.error().message.find("test/bootrom.bin") != std::string::npos);

    // A target may be named after its own output.
    auto named = build_graph({{.name = "test", .outputs = {"test"}}});
    assert(named);

    std::println("Graph Duplicate Test passed!");
    return true;
}
