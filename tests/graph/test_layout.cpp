// tests/graph/test_layout.cpp - Tests for rank columns and row stacking
//
// Tests: compute_ranks, compute_layout, apply(layout_result), edge routes
// Coverage: longest-path ranks, parallel chains, custom box metrics,
// extents, route geometry and criticality, no overlapping boxes.

#include <critpath/graph/analyse.h>
#include <critpath/graph/layout.h>
#include <critpath/graph/topological_sort.h>

#include <gtest/gtest.h>

#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace critpath;
using namespace critpath::graph;

namespace {

issue task(std::string id, double hours, std::vector<std::string> blocked = {}) {
    return issue{.id = std::move(id), .duration_hours = hours, .blocks_ids = std::move(blocked)};
}

// A(1) -> B(2), A -> C(5), B -> D(1), C -> D.
std::vector<issue> make_diamond() {
    return {task("A", 1.0, {"B", "C"}), task("B", 2.0, {"D"}), task("C", 5.0, {"D"}),
            task("D", 1.0)};
}

edge_route const* route_for(dependency_graph const& g, std::string const& from,
                            std::string const& to) {
    for (auto const& r : g.routes()) {
        if (r.edge.from == from && r.edge.to == to) return &r;
    }
    return nullptr;
}

} // namespace

// =========================================================================
// Ranks
// =========================================================================

TEST(LayoutTest, RankIsLongestPath) {
    // A -> B -> C and the shortcut A -> C: C sits two ranks right of A.
    std::vector<issue> issues{task("A", 1.0, {"B", "C"}), task("B", 1.0, {"C"}), task("C", 1.0)};
    auto g = build_graph(issues);
    auto const order = topological_sort(g).order;
    auto const rank = compute_ranks(g, order);
    EXPECT_EQ(rank[to_index(g.index_of("A"))], 0);
    EXPECT_EQ(rank[to_index(g.index_of("B"))], 1);
    EXPECT_EQ(rank[to_index(g.index_of("C"))], 2);
}

TEST(LayoutTest, RanksRequireCompleteOrder) {
    std::vector<issue> issues{task("A", 1.0, {"B"}), task("B", 1.0)};
    auto g = build_graph(issues);
    EXPECT_THROW((void)compute_ranks(g, {}), std::logic_error);
}

// =========================================================================
// Coordinates
// =========================================================================

TEST(LayoutTest, DiamondCoordinates) {
    auto issues = make_diamond();
    auto g = analyse(issues);
    ASSERT_TRUE(g.has_layout());

    // Default metrics: 20x3 boxes, column pitch 24, row pitch 4.
    EXPECT_EQ(g.at("A").x, 0);
    EXPECT_EQ(g.at("A").y, 0);
    EXPECT_EQ(g.at("B").x, 24);
    EXPECT_EQ(g.at("B").y, 0);
    EXPECT_EQ(g.at("C").x, 24);
    EXPECT_EQ(g.at("C").y, 4);
    EXPECT_EQ(g.at("D").x, 48);
    EXPECT_EQ(g.at("D").y, 0);

    EXPECT_EQ(g.at("D").rank, 2);
    EXPECT_EQ(g.stats().rank_count, 3u);
    EXPECT_EQ(g.extent(), (layout_extent{68, 7}));
}

TEST(LayoutTest, ParallelChainsAlignByRank) {
    std::vector<issue> issues{task("A", 1.0, {"B"}), task("B", 1.0), task("X", 1.0, {"Y"}),
                              task("Y", 1.0)};
    auto g = analyse(issues);
    EXPECT_EQ(g.at("A").x, g.at("X").x);
    EXPECT_EQ(g.at("B").x, g.at("Y").x);
    EXPECT_EQ(g.at("A").y, 0);
    EXPECT_EQ(g.at("X").y, 4);
    EXPECT_EQ(g.at("B").y, 0);
    EXPECT_EQ(g.at("Y").y, 4);
}

TEST(LayoutTest, CustomMetrics) {
    schedule_options opts;
    opts.layout.node_width = 10;
    opts.layout.node_height = 1;
    opts.layout.column_gap = 2;
    opts.layout.row_gap = 0;
    auto issues = make_diamond();
    auto g = analyse(issues, opts);
    EXPECT_EQ(g.at("B").x, 12);
    EXPECT_EQ(g.at("C").y, 1);
    EXPECT_EQ(g.at("D").x, 24);
    EXPECT_EQ(g.extent(), (layout_extent{34, 2}));
}

TEST(LayoutTest, NoTwoBoxesShareAPosition) {
    std::vector<issue> issues;
    for (int i = 0; i < 12; ++i) {
        std::vector<std::string> blocked;
        if (i + 3 < 12) blocked.push_back("n" + std::to_string(i + 3));
        if (i % 2 == 0 && i + 1 < 12) blocked.push_back("n" + std::to_string(i + 1));
        issues.push_back(task("n" + std::to_string(i), 1.0, blocked));
    }
    auto g = analyse(issues);
    ASSERT_FALSE(g.has_cycle());

    std::set<std::pair<int, int>> seen;
    for (auto const& n : g.nodes()) {
        EXPECT_TRUE(seen.emplace(n.x, n.y).second) << n.id;
        EXPECT_LE(n.x + 20, g.extent().width);
        EXPECT_LE(n.y + 3, g.extent().height);
    }
}

TEST(LayoutTest, EmptyGraph) {
    std::vector<issue> none;
    auto g = analyse(none);
    EXPECT_TRUE(g.has_layout());
    EXPECT_EQ(g.extent(), (layout_extent{0, 0}));
    EXPECT_TRUE(g.routes().empty());
    EXPECT_EQ(g.stats().rank_count, 0u);
}

// =========================================================================
// Routes
// =========================================================================

TEST(LayoutTest, OneRoutePerEdgeInEdgeOrder) {
    auto issues = make_diamond();
    auto g = analyse(issues);
    ASSERT_EQ(g.routes().size(), g.edge_count());
    for (std::size_t i = 0; i < g.edge_count(); ++i) {
        EXPECT_EQ(g.routes()[i].edge, g.edges()[i]);
    }
}

TEST(LayoutTest, RouteGeometry) {
    auto issues = make_diamond();
    auto g = analyse(issues);
    auto const* r = route_for(g, "A", "C");
    ASSERT_NE(r, nullptr);
    EXPECT_EQ(r->from_x, 20);
    EXPECT_EQ(r->from_y, 1);
    EXPECT_EQ(r->to_x, 24);
    EXPECT_EQ(r->to_y, 5);
    EXPECT_EQ(r->rank_span, 1);
}

TEST(LayoutTest, RouteSpanAcrossRanks) {
    std::vector<issue> issues{task("A", 1.0, {"B", "C"}), task("B", 1.0, {"C"}), task("C", 1.0)};
    auto g = analyse(issues);
    auto const* r = route_for(g, "A", "C");
    ASSERT_NE(r, nullptr);
    EXPECT_EQ(r->rank_span, 2);
}

TEST(LayoutTest, CriticalRoutesMarked) {
    auto issues = make_diamond();
    auto g = analyse(issues);
    EXPECT_TRUE(route_for(g, "A", "C")->is_critical);
    EXPECT_TRUE(route_for(g, "C", "D")->is_critical);
    EXPECT_FALSE(route_for(g, "A", "B")->is_critical);
    EXPECT_FALSE(route_for(g, "B", "D")->is_critical);
}

TEST(LayoutTest, AttachRejectsMismatchedResult) {
    auto issues = make_diamond();
    auto g = build_graph(issues);
    layout_result bogus;
    bogus.placement.resize(2);
    EXPECT_THROW(apply(g, bogus), std::logic_error);
    EXPECT_FALSE(g.has_layout());
}
