// graph/layout.h - Rank columns and greedy row assignment
// Part of the critpath scheduling library (C++20)
//
// ALGORITHM:
// 1. Rank = longest-path distance from a source, one sweep along the
//    topological order: rank(n) = max(rank(p) + 1) over predecessors p.
//    Parallel independent chains line up by dependency depth rather than
//    by tie-break position in the order.
// 2. x = rank * (node_width + column_gap).
// 3. Within a rank column nodes are stacked top to bottom in the order
//    they appear in the topological sequence, each reserving
//    node_height + row_gap rows.  Ties in the sequence are already broken
//    by ascending issue id, so the stacking is deterministic.
// 4. One routing hint per edge: right-centre of the source box to
//    left-centre of the target box.
//
// This is a placement heuristic, not crossing minimisation.  The PERT
// view pans and zooms, so overlapping arrows are acceptable; overlapping
// boxes are not, and cannot occur: no two nodes share (rank, slot).
//
// Complexity: O(V + E)

#ifndef CRITPATH_GRAPH_LAYOUT_H
#define CRITPATH_GRAPH_LAYOUT_H

#include "dependency_graph.h"
#include "graph_concepts.h"
#include <critpath/core/schedule_options.h>

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <utility>
#include <vector>

namespace critpath::graph {

/// Result of layout assignment.
///
/// - placement[n]: rank and top-left cell of node n, indexed by node_index
/// - routes: one per edge, in dependency_graph::edges() order
/// - extent: bounding box of all node boxes
struct layout_result {
    std::vector<node_placement> placement{};
    std::vector<edge_route> routes{};
    layout_extent extent{};
    std::size_t rank_count = 0;
};

/// Longest-path rank of every node, indexed by node_index.
///
/// Throws std::logic_error if order does not cover every node.
[[nodiscard]] inline std::vector<int>
compute_ranks(dependency_graph const& g, std::vector<node_index> const& order) {
    if (order.size() != g.node_count())
        throw std::logic_error("compute_ranks: order does not cover every node");

    std::vector<int> rank(g.node_count(), 0);
    for (auto n : order) {
        int r = 0;
        for (auto p : g.in_neighbors(n)) {
            r = std::max(r, rank[to_index(p)] + 1);
        }
        rank[to_index(n)] = r;
    }
    return rank;
}

/// Assign coordinates to every node and a route to every edge.
///
/// Route criticality is read from the graph's node records, so attach the
/// CPM result first if critical arrows should be marked.
[[nodiscard]] inline layout_result
compute_layout(dependency_graph const& g,
               std::vector<node_index> const& order,
               layout_metrics const& metrics = {}) {
    layout_result result;
    auto const V = g.node_count();
    auto const rank = compute_ranks(g, order);

    result.placement.assign(V, node_placement{});
    if (V == 0) {
        return result;
    }

    int max_rank = 0;
    for (auto r : rank) max_rank = std::max(max_rank, r);
    result.rank_count = static_cast<std::size_t>(max_rank) + 1;

    // Next free slot per rank column.
    std::vector<int> next_slot(result.rank_count, 0);
    for (auto n : order) {
        auto const i = to_index(n);
        auto& p = result.placement[i];
        p.rank = rank[i];
        p.x = rank[i] * metrics.column_pitch();
        p.y = next_slot[static_cast<std::size_t>(rank[i])]++ * metrics.row_pitch();

        result.extent.width = std::max(result.extent.width, p.x + metrics.node_width);
        result.extent.height = std::max(result.extent.height, p.y + metrics.node_height);
    }

    auto const mid = metrics.node_height / 2;
    result.routes.reserve(g.edge_count());
    std::size_t eidx = 0;
    for (std::size_t u = 0; u < V; ++u) {
        auto const& pu = result.placement[u];
        for (auto v : g.out_neighbors(make_index(u))) {
            auto const& pv = result.placement[to_index(v)];
            auto const& e = g.edges()[eidx++];
            result.routes.push_back(edge_route{
                .edge = e,
                .from_x = pu.x + metrics.node_width,
                .from_y = pu.y + mid,
                .to_x = pv.x,
                .to_y = pv.y + mid,
                .rank_span = pv.rank - pu.rank,
                .is_critical = g.is_critical(e),
            });
        }
    }
    return result;
}

/// Attach a layout result onto the graph's node records.
inline void apply(dependency_graph& g, layout_result r) {
    g.attach_layout(r.placement, std::move(r.routes), r.extent);
}

} // namespace critpath::graph

#endif // CRITPATH_GRAPH_LAYOUT_H
