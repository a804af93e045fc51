// graph/focus_subgraph.h - Bounded neighbourhood of a selected node
// Part of the critpath scheduling library (C++20)
//
// ALGORITHM:
// Breadth-first traversal from the selected node, at most `depth` hops:
// - upstream:   follow incoming edges (what the node waits on)
// - downstream: follow outgoing edges (what waits on the node)
// - both:       every hop may follow either direction
// The visited set is returned as an induced subgraph (subgraph.h), so
// CPM numbers and coordinates are those of the full graph.
//
// `both` treats the graph as undirected for reachability.  With a depth
// at least the undirected diameter of a connected graph, the focus
// result is the whole graph.
//
// Complexity: O(V + E)

#ifndef CRITPATH_GRAPH_FOCUS_SUBGRAPH_H
#define CRITPATH_GRAPH_FOCUS_SUBGRAPH_H

#include "dependency_graph.h"
#include "graph_concepts.h"
#include "subgraph.h"
#include <critpath/core/engine_limits.h>

#include <cstddef>
#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace critpath::graph {

enum class focus_direction {
    upstream,
    downstream,
    both,
};

[[nodiscard]] constexpr std::string_view to_string(focus_direction d) noexcept {
    switch (d) {
    case focus_direction::upstream: return "upstream";
    case focus_direction::downstream: return "downstream";
    case focus_direction::both: return "both";
    }
    return "both";
}

/// Parse "upstream" / "downstream" / "both".
[[nodiscard]] constexpr std::optional<focus_direction>
parse_focus_direction(std::string_view s) noexcept {
    if (s == "upstream") return focus_direction::upstream;
    if (s == "downstream") return focus_direction::downstream;
    if (s == "both") return focus_direction::both;
    return std::nullopt;
}

/// Focus parameters as held by the view.
///
/// depth is clamped to [min_focus_depth, max_focus_depth] on use.
struct focus_request {
    std::string node_id;
    focus_direction direction = focus_direction::both;
    std::size_t depth = engine_limits::min_focus_depth;
};

/// Result of focus extraction.
///
/// - graph: induced subgraph (empty if the focus id is unknown)
/// - distance: hop count from the focus for every node of `graph`,
///   indexed by the subgraph's node_index
/// - depth: the clamped depth actually used
struct focus_result {
    std::string focus_id;
    focus_direction direction = focus_direction::both;
    std::size_t depth = engine_limits::min_focus_depth;
    dependency_graph graph{};
    std::vector<std::size_t> distance{};

    [[nodiscard]] bool empty() const noexcept { return graph.empty(); }
};

/// Extract the depth-bounded neighbourhood of one node.
///
/// Example:
/// ```cpp
/// // Chain A -> B -> C
/// auto r = extract_focus(g, {"C", focus_direction::upstream, 1});
/// // r.graph nodes: B, C; edges: B -> C
/// ```
[[nodiscard]] inline focus_result
extract_focus(dependency_graph const& g, focus_request const& req) {
    focus_result result;
    result.focus_id = req.node_id;
    result.direction = req.direction;
    result.depth = engine_limits::clamp_focus_depth(req.depth);

    auto const start = g.index_of(req.node_id);
    if (start == invalid_node) {
        return result;
    }

    auto const V = g.node_count();
    constexpr std::size_t unreached = static_cast<std::size_t>(-1);
    std::vector<std::size_t> dist(V, unreached);

    bool const up = req.direction != focus_direction::downstream;
    bool const down = req.direction != focus_direction::upstream;

    std::deque<node_index> queue{start};
    dist[to_index(start)] = 0;
    auto const visit = [&](node_index from, node_index to) {
        if (dist[to_index(to)] != unreached) return;
        dist[to_index(to)] = dist[to_index(from)] + 1;
        queue.push_back(to);
    };

    while (!queue.empty()) {
        auto const u = queue.front();
        queue.pop_front();
        if (dist[to_index(u)] >= result.depth) continue;

        if (up) {
            for (auto p : g.in_neighbors(u)) visit(u, p);
        }
        if (down) {
            for (auto s : g.out_neighbors(u)) visit(u, s);
        }
    }

    std::vector<bool> keep(V, false);
    for (std::size_t i = 0; i < V; ++i) {
        if (dist[i] != unreached) {
            keep[i] = true;
            result.distance.push_back(dist[i]);
        }
    }
    result.graph = induced_subgraph(g, keep);
    return result;
}

/// Convenience overload.
[[nodiscard]] inline focus_result
extract_focus(dependency_graph const& g, std::string_view node_id,
              focus_direction direction, std::size_t depth) {
    return extract_focus(g, focus_request{std::string(node_id), direction, depth});
}

} // namespace critpath::graph

#endif // CRITPATH_GRAPH_FOCUS_SUBGRAPH_H
