// graph/analyse.h - Build and analyse a dependency graph in one call
// Part of the critpath scheduling library (C++20)
//
// PIPELINE:
//   issues -> build_graph -> detect_cycles -> [acyclic only]
//   topological_sort -> compute_cpm -> compute_layout
//
// Every stage attaches its result onto the graph.  A cyclic graph stops
// after cycle detection: its cycle report is populated, its topological
// order is empty and has_schedule() / has_layout() are false.
//
// An issue snapshot with a cycle is NOT an error; callers check
// has_cycle() and show format_cycle_message() instead of the chart.

#ifndef CRITPATH_GRAPH_ANALYSE_H
#define CRITPATH_GRAPH_ANALYSE_H

#include "critical_path.h"
#include "cycle_detection.h"
#include "dependency_graph.h"
#include "graph_builder.h"
#include "issue.h"
#include "layout.h"
#include "topological_sort.h"
#include <critpath/core/log.h>
#include <critpath/core/schedule_options.h>

#include <chrono>
#include <span>
#include <stdexcept>
#include <utility>
#include <vector>

namespace critpath::graph {

namespace detail {

/// Microseconds elapsed since `start`, for trace logging.
[[nodiscard]] inline long long elapsed_us(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::microseconds>(
               std::chrono::steady_clock::now() - start)
        .count();
}

} // namespace detail

/// Run cycle detection, ordering, CPM and layout on an existing graph.
///
/// Throws std::logic_error if the sorter disagrees with the cycle
/// detector (an internal invariant violation, never a data problem).
inline void analyse(dependency_graph& g, schedule_options const& opts = {}) {
    validate(opts);
    auto const log = engine_log();

    auto t0 = std::chrono::steady_clock::now();
    g.attach_cycles(detect_cycles(g));
    log->trace("analyse: cycle detection {} us", detail::elapsed_us(t0));
    if (g.has_cycle()) {
        return;
    }

    t0 = std::chrono::steady_clock::now();
    auto const topo = topological_sort(g);
    if (!topo.is_dag || topo.order.size() != g.node_count())
        throw std::logic_error(
            "analyse: topological order incomplete for a graph reported acyclic");
    g.attach_order(topo.order);
    log->trace("analyse: topological sort {} us", detail::elapsed_us(t0));

    t0 = std::chrono::steady_clock::now();
    apply(g, compute_cpm(g, topo.order, opts));
    log->trace("analyse: critical path {} us", detail::elapsed_us(t0));

    t0 = std::chrono::steady_clock::now();
    apply(g, compute_layout(g, topo.order, opts.layout));
    log->trace("analyse: layout {} us", detail::elapsed_us(t0));

    log->debug("analyse: {} nodes, finish {}h, {} critical, {} ranks",
               g.node_count(), g.project_finish(), g.stats().critical_nodes,
               g.stats().rank_count);
}

/// Build a graph from an issue snapshot and analyse it.
///
/// Example:
/// ```cpp
/// std::vector<issue> issues{
///     {.id = "A", .duration_hours = 2.0, .blocks_ids = {"B"}},
///     {.id = "B", .duration_hours = 3.0, .blocks_ids = {"C"}},
///     {.id = "C", .duration_hours = 1.0},
/// };
/// auto g = analyse(issues);
/// // g.topological_order() == {A, B, C}, g.project_finish() == 6
/// ```
[[nodiscard]] inline dependency_graph
analyse(std::span<issue const> issues, schedule_options const& opts = {}) {
    auto const t0 = std::chrono::steady_clock::now();
    auto g = build_graph(issues, opts);
    engine_log()->trace("analyse: build {} us", detail::elapsed_us(t0));
    analyse(g, opts);
    return g;
}

} // namespace critpath::graph

#endif // CRITPATH_GRAPH_ANALYSE_H
