// graph/topological_sort.h - Deterministic topological ordering
// Part of the critpath scheduling library (C++20)
//
// ALGORITHM: Kahn's algorithm (BFS-based) with a min-heap of ready nodes.
// Complexity: O((V + E) log V)
// Determinism: when multiple nodes have in-degree 0, the smallest
// node_index is chosen first.  For a dependency_graph that is the
// smallest issue id, so the same snapshot always yields the same order
// (stable next/previous navigation, stable tests).
//
// DESIGN RATIONALE:
// Kahn's (not DFS-based) because:
// - Naturally produces the order in forward sequence
// - Deterministic tie-breaking is trivial (pop the smallest ready node)
// - Detects cycles (if output size < V, graph has a cycle)
// - No recursion

#ifndef CRITPATH_GRAPH_TOPOLOGICAL_SORT_H
#define CRITPATH_GRAPH_TOPOLOGICAL_SORT_H

#include "dependency_graph.h"
#include "graph_concepts.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <queue>
#include <string>
#include <vector>

namespace critpath::graph {

/// Result of topological sort.
///
/// - order: nodes in topological order (dependencies before dependents)
/// - is_dag: true if graph is a DAG; false if cycle detected
///   When is_dag is false, order contains the partial ordering of
///   non-cyclic nodes reachable before the cycle blocked progress.
struct topo_result {
    std::vector<node_index> order{};
    bool is_dag = true;
};

/// Topological sort via Kahn's algorithm.
///
/// Example:
/// ```cpp
/// // Diamond: A->B, A->C, B->D, C->D
/// auto r = topological_sort(g);
/// // r.is_dag, order: A, B, C, D (B before C by id)
/// ```
template<graph_queryable G>
[[nodiscard]] topo_result topological_sort(G const& g) {
    topo_result result;
    auto const V = g.node_count();

    if (V == 0) {
        return result;
    }

    // Step 1: Compute in-degrees.
    std::vector<std::size_t> in_degree(V, 0);
    for (std::size_t u = 0; u < V; ++u) {
        for (auto v : g.out_neighbors(make_index(u))) {
            in_degree[to_index(v)]++;
        }
    }

    // Step 2: Seed the ready set.
    std::priority_queue<node_index, std::vector<node_index>, std::greater<>> ready;
    for (std::size_t u = 0; u < V; ++u) {
        if (in_degree[u] == 0) {
            ready.push(make_index(u));
        }
    }

    // Step 3: Kahn's iteration.
    result.order.reserve(V);
    while (!ready.empty()) {
        auto const chosen = ready.top();
        ready.pop();
        result.order.push_back(chosen);

        // Decrement in-degrees of successors.
        for (auto v : g.out_neighbors(chosen)) {
            if (--in_degree[to_index(v)] == 0) {
                ready.push(v);
            }
        }
    }

    // No ready node but not all nodes emitted -> cycle.
    result.is_dag = result.order.size() == V;
    return result;
}

/// Translate an index order into issue ids.
[[nodiscard]] inline std::vector<std::string>
to_ids(dependency_graph const& g, std::vector<node_index> const& order) {
    std::vector<std::string> ids;
    ids.reserve(order.size());
    for (auto n : order) ids.push_back(g.key_of(n));
    return ids;
}

} // namespace critpath::graph

#endif // CRITPATH_GRAPH_TOPOLOGICAL_SORT_H
