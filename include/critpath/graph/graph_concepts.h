// graph/graph_concepts.h - Descriptor types and graph concepts
// Part of the critpath scheduling library (C++20)
//
// DESIGN RATIONALE:
// Issues are identified by string ids, but the algorithms run over dense
// integer indices.  A dependency_graph assigns indices in ascending id
// order, so "smallest node_index" and "smallest issue id" are the same
// tie-break.  node_index is an opaque handle valid only for the graph
// that produced it; structural transforms (induced_subgraph) renumber.
//
// graph_queryable is all the index-level algorithms (scc,
// topological_sort) require.  bidirectional_graph adds reverse
// adjacency for the upstream half of focus extraction and the CPM
// forward pass.

#ifndef CRITPATH_GRAPH_CONCEPTS_H
#define CRITPATH_GRAPH_CONCEPTS_H

#include <compare>
#include <concepts>
#include <cstddef>
#include <cstdint>

namespace critpath::graph {

// =============================================================================
// Descriptor Type
// =============================================================================

/// Opaque node identifier (position in the id-sorted node arena).
struct node_index {
    std::uint32_t value{};

    friend constexpr bool operator==(node_index, node_index) = default;
    friend constexpr auto operator<=>(node_index, node_index) = default;
};

/// Convert node_index to index for array access.
[[nodiscard]] constexpr std::size_t to_index(node_index n) noexcept {
    return static_cast<std::size_t>(n.value);
}

/// Build a node_index from an array position.
[[nodiscard]] constexpr node_index make_index(std::size_t i) noexcept {
    return node_index{static_cast<std::uint32_t>(i)};
}

/// Sentinel value for invalid/unassigned node references.
inline constexpr node_index invalid_node{std::uint32_t{0xFFFFFFFF}};

// =============================================================================
// Graph Concepts
// =============================================================================

/// Immutable adjacency queries over dense node indices.
///
/// Requirements:
/// - node_count(): number of nodes
/// - out_neighbors(u): range of node_index, ascending
template<typename G>
concept graph_queryable =
    requires(G const& g, node_index u) {
        { g.node_count() } -> std::convertible_to<std::size_t>;
        { g.out_neighbors(u) };
    };

/// A graph_queryable that also answers reverse adjacency.
template<typename G>
concept bidirectional_graph =
    graph_queryable<G> &&
    requires(G const& g, node_index u) {
        { g.in_neighbors(u) };
        { g.edge_count() } -> std::convertible_to<std::size_t>;
    };

} // namespace critpath::graph

#endif // CRITPATH_GRAPH_CONCEPTS_H
