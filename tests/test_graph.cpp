#include <catch2/catch.hpp>
#include <weave/graph.hpp>

#include <string>
#include <vector>

using namespace weave;

static std::string label(const std::string& s) { return s; }

TEST_CASE("graph keeps nodes and edges in insertion order", "[graph]") {
    Graph<std::string, int> g;
    auto root = g.add_node(":test");
    auto x = g.add_node("org:x");
    auto y = g.add_node("org:y");
    g.add_edge(root, y, 0);
    g.add_edge(root, x, 1);

    REQUIRE(g.node_count() == 3);
    REQUIRE(g.edge_count() == 2);
    REQUIRE(g.node(x) == "org:x");
    REQUIRE(g.successors(root)[0].to == y);
    REQUIRE(g.successors(root)[1].data == 1);
    REQUIRE(g.has_edge(root, x));
    REQUIRE_FALSE(g.has_edge(x, root));
}

TEST_CASE("edges can be retargeted in place", "[graph]") {
    Graph<std::string> g;
    auto root = g.add_node(":test");
    auto x1 = g.add_node("org:x:1.0");
    auto x2 = g.add_node("org:x:2.0");
    g.add_edge(root, x1);

    for (auto& e : g.successors(root)) e.to = x2;
    REQUIRE(g.has_edge(root, x2));
    REQUIRE(g.reachable_from(root) == std::vector<size_t>{root, x2});
}

// ===== Reachability =====

TEST_CASE("reachable_from lists the root first, then breadth-first", "[graph]") {
    Graph<std::string> g;
    auto root = g.add_node(":test");
    auto a = g.add_node("org:a");
    auto b = g.add_node("org:b");
    auto c = g.add_node("org:c");
    auto orphan = g.add_node("org:orphan");
    g.add_edge(root, a);
    g.add_edge(root, b);
    g.add_edge(a, c);
    g.add_edge(orphan, root);

    REQUIRE(g.reachable_from(root) == std::vector<size_t>{root, a, b, c});
    REQUIRE(g.reachable_from(c) == std::vector<size_t>{c});
}

TEST_CASE("reachable_from terminates on a cycle", "[graph]") {
    Graph<std::string> g;
    auto a = g.add_node("org:a");
    auto b = g.add_node("org:b");
    g.add_edge(a, b);
    g.add_edge(b, a);
    REQUIRE(g.reachable_from(b) == std::vector<size_t>{b, a});
}

// ===== Strongly-connected components =====

TEST_CASE("an acyclic graph has no cycles", "[graph]") {
    Graph<std::string> g;
    auto root = g.add_node(":test");
    auto a = g.add_node("org:a");
    auto c = g.add_node("org:c");
    g.add_edge(root, a);
    g.add_edge(root, c);
    g.add_edge(a, c);
    REQUIRE(g.cycles().empty());
}

TEST_CASE("each cyclic component is reported once", "[graph]") {
    // a <-> b, c -> d -> e -> c, reached through a -> c
    Graph<std::string> g;
    auto a = g.add_node("org:a");
    auto b = g.add_node("org:b");
    auto c = g.add_node("org:c");
    auto d = g.add_node("org:d");
    auto e = g.add_node("org:e");
    g.add_edge(a, b);
    g.add_edge(b, a);
    g.add_edge(a, c);
    g.add_edge(c, d);
    g.add_edge(d, e);
    g.add_edge(e, c);

    auto comps = g.cycles();
    REQUIRE(comps.size() == 2);
    REQUIRE(comps[0] == std::vector<size_t>{a, b});
    REQUIRE(comps[1] == std::vector<size_t>{c, d, e});
}

TEST_CASE("a module depending on itself is a cycle", "[graph]") {
    Graph<std::string> g;
    auto a = g.add_node("org:a");
    g.add_node("org:b");
    g.add_edge(a, a);
    auto comps = g.cycles();
    REQUIRE(comps.size() == 1);
    REQUIRE(comps[0] == std::vector<size_t>{a});
}

TEST_CASE("cycle search survives a long chain", "[graph]") {
    Graph<int> g;
    const size_t n = 20000;
    for (size_t i = 0; i < n; ++i) g.add_node(static_cast<int>(i));
    for (size_t i = 0; i + 1 < n; ++i) g.add_edge(i, i + 1);
    g.add_edge(n - 1, 0);
    auto comps = g.cycles();
    REQUIRE(comps.size() == 1);
    REQUIRE(comps[0].size() == n);
}

// ===== Tree display =====

TEST_CASE("tree display draws branches", "[graph]") {
    Graph<std::string> g;
    auto root = g.add_node(":test");
    auto x = g.add_node("org:x");
    auto y = g.add_node("org:y");
    auto z = g.add_node("org:z");
    g.add_edge(root, x);
    g.add_edge(root, z);
    g.add_edge(x, y);

    REQUIRE(g.tree_display(root, label) ==
        ":test\n"
        " +--- org:x\n"
        " |    \\--- org:y\n"
        " \\--- org:z\n");
}

TEST_CASE("tree display marks a node shown before", "[graph]") {
    Graph<std::string> g;
    auto root = g.add_node(":test");
    auto a = g.add_node("org:a");
    auto b = g.add_node("org:b");
    auto c = g.add_node("org:c");
    g.add_edge(root, a);
    g.add_edge(root, b);
    g.add_edge(a, c);
    g.add_edge(b, c);

    REQUIRE(g.tree_display(root, label) ==
        ":test\n"
        " +--- org:a\n"
        " |    \\--- org:c\n"
        " \\--- org:b\n"
        "      \\--- org:c (*)\n");
}

// ===== GraphMap =====

TEST_CASE("graphmap collapses repeated names", "[graph]") {
    GraphMap<> gm;
    auto first = gm.add_node("org:x");
    auto again = gm.add_node("org:x");
    REQUIRE(first == again);
    REQUIRE(gm.node_id("org:x") == first);

    gm.add_edge(":test", "org:x");
    gm.add_edge(":test", "org:x");
    REQUIRE(gm.node_count() == 2);
    REQUIRE(gm.inner().edge_count() == 1);
}

TEST_CASE("graphmap cycles are named and sorted", "[graph]") {
    GraphMap<> gm;
    gm.add_edge("org:b", "org:a");
    gm.add_edge("org:a", "org:b");
    gm.add_edge("org:a", "org:c");
    gm.add_edge("org:d", "org:d");

    auto comps = gm.cycles();
    REQUIRE(comps.size() == 2);
    REQUIRE(comps[0] == std::vector<std::string>{"org:a", "org:b"});
    REQUIRE(comps[1] == std::vector<std::string>{"org:d"});
}
