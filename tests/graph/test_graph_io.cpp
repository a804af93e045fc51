// tests/graph/test_graph_io.cpp - Tests for Graphviz DOT export
//
// Validates:
//   1. Header, footer and one statement per node and edge
//   2. Critical nodes and edges highlighted after scheduling
//   3. Cycle edges dashed
//   4. Quoting of ids and titles with special characters

#include <critpath/graph/analyse.h>
#include <critpath/graph/graph_io_dot.h>

#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <utility>
#include <vector>

using namespace critpath::graph;
namespace io = critpath::graph::io;

namespace {

issue task(std::string id, double hours, std::vector<std::string> blocked = {}) {
    return issue{.id = std::move(id), .duration_hours = hours, .blocks_ids = std::move(blocked)};
}

std::string to_dot(dependency_graph const& g, std::string_view name = "G") {
    std::ostringstream os;
    io::write_dot(os, g, name);
    return os.str();
}

bool contains(std::string const& haystack, std::string const& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

// =============================================================================
// 1. Structure
// =============================================================================

TEST(GraphIoDot, EmptyGraph) {
    dependency_graph g;
    EXPECT_EQ(to_dot(g, "empty"), "digraph empty {\n  rankdir=LR;\n  node [shape=box];\n}\n");
}

TEST(GraphIoDot, NodesAndEdgesListed) {
    std::vector<issue> issues{task("A", 1.0, {"B"}), task("B", 1.0)};
    auto g = build_graph(issues);
    auto const dot = to_dot(g);
    EXPECT_TRUE(contains(dot, "digraph G {\n"));
    EXPECT_TRUE(contains(dot, "  \"A\" [label=\"A\"];\n"));
    EXPECT_TRUE(contains(dot, "  \"B\" [label=\"B\"];\n"));
    EXPECT_TRUE(contains(dot, "  \"A\" -> \"B\";\n"));
    EXPECT_EQ(dot.substr(dot.size() - 2), "}\n");
}

// =============================================================================
// 2. Schedule highlighting
// =============================================================================

TEST(GraphIoDot, CriticalPathHighlighted) {
    std::vector<issue> issues{task("A", 1.0, {"B", "C"}), task("B", 2.0, {"D"}),
                              task("C", 5.0, {"D"}), task("D", 1.0)};
    auto g = analyse(issues);
    auto const dot = to_dot(g);
    EXPECT_TRUE(contains(dot, "\"A\" -> \"C\" [color=red];"));
    EXPECT_TRUE(contains(dot, "\"A\" -> \"B\";"));
    EXPECT_TRUE(contains(dot, "\"C\" [label=\"C\\nES 1 EF 6 slack 0\", color=red];"));
    EXPECT_TRUE(contains(dot, "\"B\" [label=\"B\\nES 1 EF 3 slack 3\"];"));
}

// =============================================================================
// 3. Cycles
// =============================================================================

TEST(GraphIoDot, CycleEdgesDashed) {
    std::vector<issue> issues{task("A", 1.0, {"B"}), task("B", 1.0, {"A", "C"}), task("C", 1.0)};
    auto g = analyse(issues);
    auto const dot = to_dot(g);
    EXPECT_TRUE(contains(dot, "\"A\" -> \"B\" [color=red, style=dashed];"));
    EXPECT_TRUE(contains(dot, "\"B\" -> \"A\" [color=red, style=dashed];"));
    EXPECT_TRUE(contains(dot, "\"B\" -> \"C\";"));
}

// =============================================================================
// 4. Quoting
// =============================================================================

TEST(GraphIoDot, QuotesSpecialCharacters) {
    EXPECT_EQ(io::dot_quote("plain"), "\"plain\"");
    EXPECT_EQ(io::dot_quote("say \"hi\""), "\"say \\\"hi\\\"\"");
    EXPECT_EQ(io::dot_quote("a\\b"), "\"a\\\\b\"");
    EXPECT_EQ(io::dot_quote("two\nlines"), "\"two\\nlines\"");
}

TEST(GraphIoDot, TitleOnSecondLabelLine) {
    std::vector<issue> issues{issue{.id = "X-1", .title = "Fix \"login\"", .duration_hours = 1.0}};
    auto g = build_graph(issues);
    EXPECT_TRUE(contains(to_dot(g), "\"X-1\" [label=\"X-1\\nFix \\\"login\\\"\"];"));
}
