// graph/subgraph.h - Induced subgraph extraction
// Part of the critpath scheduling library (C++20)
//
// ALGORITHM:
// Given a dependency_graph G and a predicate P over nodes, produce the
// induced subgraph G' containing:
// - All nodes n where P(n) is true
// - All edges (u→v) from G where both P(u) and P(v) are true
//
// Nodes in G' are renumbered contiguously from 0 (still ascending by id,
// so index-order tie-breaks keep meaning "smallest id").
//
// COMPLEXITY: O(V + E)
//
// DESIGN RATIONALE:
// This is a VIEW FILTER.  Attached analysis is carried over, not
// recomputed:
// - node timing, critical flags and coordinates are copied verbatim
// - topological_order and critical_path are filtered, order preserved
// - cycle_edges are filtered; has_cycle still describes the source graph,
//   because the source's schedule was (or was not) computed on that basis
// - routes are filtered; extent is the source graph's extent
// A focused view therefore shows the same numbers as the full chart.

#ifndef CRITPATH_GRAPH_SUBGRAPH_H
#define CRITPATH_GRAPH_SUBGRAPH_H

#include "dependency_graph.h"
#include "graph_concepts.h"

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace critpath::graph {

namespace detail {

/// Friend of dependency_graph: copies a node subset with its annotations.
class subgraph_copier {
public:
    /// keep[i] selects node i of g.
    [[nodiscard]] static dependency_graph
    copy(dependency_graph const& g, std::vector<bool> const& keep) {
        using index_type = dependency_graph::index_type;
        auto const V = g.node_count();

        dependency_graph out;
        out.stats_ = g.stats_;

        // Pass 1: identify retained nodes and build the forward map.
        std::vector<node_index> forward_map(V, invalid_node);
        for (std::size_t i = 0; i < V; ++i) {
            if (!keep[i]) continue;
            forward_map[i] = make_index(out.nodes_.size());
            out.nodes_.push_back(g.nodes_[i]);
        }
        auto const W = out.nodes_.size();

        // Pass 2: edges with both endpoints retained, in CSR order.
        out.out_offsets_.assign(W + 1, 0);
        out.in_offsets_.assign(W + 1, 0);
        std::size_t eidx = 0;
        for (std::size_t u = 0; u < V; ++u) {
            for (auto v : g.out_neighbors(make_index(u))) {
                auto const& e = g.edges_[eidx++];
                auto const nu = forward_map[u];
                auto const nv = forward_map[to_index(v)];
                if (nu == invalid_node || nv == invalid_node) continue;
                out.edges_.push_back(e);
                out.out_targets_.push_back(nv);
                out.out_offsets_[to_index(nu) + 1]++;
                out.in_offsets_[to_index(nv) + 1]++;
            }
        }
        for (std::size_t i = 1; i <= W; ++i) {
            out.out_offsets_[i] = static_cast<index_type>(out.out_offsets_[i] + out.out_offsets_[i - 1]);
            out.in_offsets_[i] = static_cast<index_type>(out.in_offsets_[i] + out.in_offsets_[i - 1]);
        }
        out.in_sources_.resize(out.out_targets_.size());
        std::vector<index_type> cursor(out.in_offsets_.begin(), out.in_offsets_.end() - 1);
        for (std::size_t u = 0; u < W; ++u) {
            for (auto v : out.out_neighbors(make_index(u))) {
                out.in_sources_[cursor[to_index(v)]++] = make_index(u);
            }
        }

        // Annotations.
        auto const kept = [&](std::string const& id) {
            auto const n = g.index_of(id);
            return n != invalid_node && keep[to_index(n)];
        };
        for (auto const& id : g.order_) {
            if (kept(id)) out.order_.push_back(id);
        }
        for (auto const& id : g.critical_path_) {
            if (kept(id)) out.critical_path_.push_back(id);
        }
        out.cycles_.has_cycle = g.cycles_.has_cycle;
        for (auto const& e : g.cycles_.cycle_edges) {
            if (kept(e.from) && kept(e.to)) out.cycles_.cycle_edges.push_back(e);
        }
        for (auto const& r : g.routes_) {
            if (kept(r.edge.from) && kept(r.edge.to)) out.routes_.push_back(r);
        }
        out.extent_ = g.extent_;
        out.project_finish_ = g.project_finish_;
        out.min_slack_ = g.min_slack_;
        out.scheduled_ = g.scheduled_;
        out.laid_out_ = g.laid_out_;
        return out;
    }
};

} // namespace detail

/// Extract the induced subgraph of nodes satisfying a predicate.
///
/// Example:
/// ```cpp
/// // Diamond: A→B, A→C, B→D, C→D
/// auto left = induced_subgraph(g,
///     [](schedule_node const& n) { return n.id != "C"; });
/// // left.node_count() == 3, left.edge_count() == 2 (A→B, B→D)
/// ```
template<typename Pred>
    requires std::predicate<Pred const&, schedule_node const&>
[[nodiscard]] dependency_graph
induced_subgraph(dependency_graph const& g, Pred const& pred) {
    std::vector<bool> keep(g.node_count(), false);
    for (std::size_t i = 0; i < g.node_count(); ++i) {
        keep[i] = pred(g.nodes()[i]);
    }
    return detail::subgraph_copier::copy(g, keep);
}

/// Induced subgraph over an explicit index mask (keep[i] selects node i).
[[nodiscard]] inline dependency_graph
induced_subgraph(dependency_graph const& g, std::vector<bool> const& keep) {
    if (keep.size() != g.node_count())
        throw std::invalid_argument("induced_subgraph: mask size differs from node count");
    return detail::subgraph_copier::copy(g, keep);
}

} // namespace critpath::graph

#endif // CRITPATH_GRAPH_SUBGRAPH_H
