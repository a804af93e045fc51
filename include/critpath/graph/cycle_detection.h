// graph/cycle_detection.h - Report every edge that lies on a cycle
// Part of the critpath scheduling library (C++20)
//
// ALGORITHM:
// An edge (u -> v) lies on some directed cycle iff u == v, or u and v are
// in the same strongly connected component (then v reaches u, closing
// the cycle).  One iterative Tarjan pass (scc.h) therefore yields the
// complete offending edge set, not just the first back edge found.
//
// Complexity: O(V + E)
// Determinism: cycle_edges are in (from, to) order; repeated calls on the
// same graph give identical reports.

#ifndef CRITPATH_GRAPH_CYCLE_DETECTION_H
#define CRITPATH_GRAPH_CYCLE_DETECTION_H

#include "dependency_graph.h"
#include "graph_concepts.h"
#include "scc.h"
#include <critpath/core/log.h>

#include <cstddef>
#include <deque>
#include <map>
#include <string>
#include <vector>

namespace critpath::graph {

/// Find all edges participating in at least one directed cycle.
///
/// Example:
/// ```cpp
/// // A blocks B, B blocks A
/// auto r = detect_cycles(g);
/// // r.has_cycle == true, r.cycle_edges == {A->B, B->A}
/// ```
[[nodiscard]] inline cycle_report detect_cycles(dependency_graph const& g) {
    cycle_report report;
    auto const V = g.node_count();
    if (V == 0) {
        return report;
    }

    auto const components = scc(g);

    // edges() is in CSR order, so walking u ascending and its neighbours
    // ascending visits them in the same (from, to) order.
    std::size_t eidx = 0;
    for (std::size_t u = 0; u < V; ++u) {
        auto const uid = make_index(u);
        for (auto v : g.out_neighbors(uid)) {
            if (uid == v || components.same_component(uid, v)) {
                report.cycle_edges.push_back(g.edges()[eidx]);
            }
            ++eidx;
        }
    }
    report.has_cycle = !report.cycle_edges.empty();

    if (report.has_cycle) {
        engine_log()->warn("cycle detection: {} edge(s) on dependency cycles",
                           report.cycle_edges.size());
    }
    return report;
}

/// One concrete cycle, as a closed id path (first id repeated at the end).
///
/// Chooses the smallest id with an outgoing cycle edge and returns the
/// shortest cycle through it, following only reported cycle edges.
/// Returns an empty vector when the report has no cycle.
[[nodiscard]] inline std::vector<std::string> first_cycle(cycle_report const& report) {
    if (!report.has_cycle || report.cycle_edges.empty()) {
        return {};
    }

    std::map<std::string, std::vector<std::string>> succ;
    for (auto const& e : report.cycle_edges) {
        succ[e.from].push_back(e.to);
    }

    auto const& start = report.cycle_edges.front().from;

    // BFS from start; the first edge back into start closes the cycle.
    std::map<std::string, std::string> parent;
    std::deque<std::string> queue{start};
    parent.emplace(start, std::string{});
    while (!queue.empty()) {
        auto const u = queue.front();
        queue.pop_front();
        for (auto const& v : succ[u]) {
            if (v == start) {
                std::vector<std::string> path{start};
                for (auto cur = u; cur != start; cur = parent.at(cur)) {
                    path.insert(path.begin() + 1, cur);
                }
                path.push_back(start);
                return path;
            }
            if (parent.emplace(v, u).second) {
                queue.push_back(v);
            }
        }
    }
    // Unreachable for reports produced by detect_cycles.
    return {};
}

/// Human-readable message naming one offending cycle.
///
/// "cycle detected: A -> B -> C -> A"
/// "cycle detected: A -> B -> A (+2 more edges on cycles)"
[[nodiscard]] inline std::string format_cycle_message(cycle_report const& report) {
    if (!report.has_cycle) {
        return {};
    }
    auto const path = first_cycle(report);

    std::string msg = "cycle detected: ";
    for (std::size_t i = 0; i < path.size(); ++i) {
        if (i != 0) msg += " -> ";
        msg += path[i];
    }

    auto const shown = path.empty() ? std::size_t{0} : path.size() - 1;
    if (report.cycle_edges.size() > shown) {
        auto const more = report.cycle_edges.size() - shown;
        msg += " (+" + std::to_string(more) + (more == 1 ? " more edge" : " more edges") +
               " on cycles)";
    }
    return msg;
}

} // namespace critpath::graph

#endif // CRITPATH_GRAPH_CYCLE_DETECTION_H
