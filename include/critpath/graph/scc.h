// graph/scc.h - Strongly connected components (iterative Tarjan)
// Part of the critpath scheduling library (C++20)
//
// ALGORITHM: Iterative Tarjan's algorithm.
// Complexity: O(V + E)
// Determinism: roots visited in node_index order. Component numbering
// follows reverse topological order (SCCs numbered as they are completed).
//
// DESIGN RATIONALE:
// Iterative (not recursive) because issue graphs are user data and their
// depth is unbounded.  Uses an explicit call stack with frames tracking
// DFS state; the "on stack" flags are exactly the open DFS path plus the
// Tarjan stack, so an edge into an on-stack node closes a cycle.

#ifndef CRITPATH_GRAPH_SCC_H
#define CRITPATH_GRAPH_SCC_H

#include "graph_concepts.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace critpath::graph {

/// Result of strongly connected components analysis.
///
/// - component_of[n]: component id for node n (0-based)
/// - component_size[c]: number of nodes in component c
/// - component_count: total number of SCCs
///
/// Component ids are assigned in reverse topological order of the
/// condensation DAG (i.e., source SCCs get higher ids).
struct scc_result {
    std::vector<std::uint32_t> component_of{};
    std::vector<std::size_t> component_size{};
    std::size_t component_count = 0;

    [[nodiscard]] bool same_component(node_index a, node_index b) const {
        return component_of[to_index(a)] == component_of[to_index(b)];
    }
};

/// Strongly connected components via iterative Tarjan's algorithm.
///
/// Example:
/// ```cpp
/// // A -> B -> C -> A plus C -> D
/// auto r = scc(g);
/// // r.component_count == 2; A, B, C share a component, D is alone
/// ```
template<graph_queryable G>
[[nodiscard]] scc_result scc(G const& g) {
    scc_result result;
    auto const V = g.node_count();
    result.component_of.assign(V, 0);

    if (V == 0) {
        return result;
    }

    constexpr std::uint32_t UNVISITED = 0xFFFFFFFF;

    std::vector<std::uint32_t> index_of(V, UNVISITED);  // discovery index
    std::vector<std::uint32_t> lowlink(V, 0);           // lowest reachable index
    std::vector<bool> on_stack(V, false);               // currently on Tarjan stack

    // Tarjan's stack (nodes awaiting SCC assignment).
    std::vector<std::uint32_t> tarjan_stack;
    tarjan_stack.reserve(V);

    // DFS call stack frame.
    struct frame {
        std::uint32_t node;
        std::size_t neighbor_idx;  // which neighbor we're processing next
    };
    std::vector<frame> call_stack;

    std::uint32_t next_index = 0;

    auto const open = [&](std::uint32_t n) {
        index_of[n] = next_index;
        lowlink[n] = next_index;
        ++next_index;
        on_stack[n] = true;
        tarjan_stack.push_back(n);
        call_stack.push_back(frame{n, 0});
    };

    // Process each unvisited node (deterministic: ascending node_index order).
    for (std::size_t start = 0; start < V; ++start) {
        if (index_of[start] != UNVISITED) {
            continue;
        }
        open(static_cast<std::uint32_t>(start));

        // Iterative DFS loop.
        while (!call_stack.empty()) {
            auto& top = call_stack.back();
            auto const range = g.out_neighbors(node_index{top.node});

            if (top.neighbor_idx < range.size()) {
                auto const w = range.begin()[top.neighbor_idx].value;
                top.neighbor_idx++;

                if (index_of[w] == UNVISITED) {
                    // Tree edge: "recurse" into w.  top is invalidated here.
                    open(w);
                } else if (on_stack[w]) {
                    // Back edge: update lowlink.
                    if (index_of[w] < lowlink[top.node]) {
                        lowlink[top.node] = index_of[w];
                    }
                }
            } else {
                // All neighbors processed. Check if this is an SCC root.
                auto const u = top.node;
                call_stack.pop_back();

                if (lowlink[u] == index_of[u]) {
                    // u is the root of an SCC. Pop everything up to u.
                    auto const comp_id = static_cast<std::uint32_t>(result.component_count);
                    std::size_t size = 0;
                    while (true) {
                        auto const w = tarjan_stack.back();
                        tarjan_stack.pop_back();
                        on_stack[w] = false;
                        result.component_of[w] = comp_id;
                        ++size;
                        if (w == u) break;
                    }
                    result.component_size.push_back(size);
                    result.component_count++;
                }

                // Update parent's lowlink.
                if (!call_stack.empty()) {
                    auto const parent = call_stack.back().node;
                    if (lowlink[u] < lowlink[parent]) {
                        lowlink[parent] = lowlink[u];
                    }
                }
            }
        }
    }

    return result;
}

} // namespace critpath::graph

#endif // CRITPATH_GRAPH_SCC_H
