// graph/critical_path.h - Critical Path Method (forward/backward pass)
// Part of the critpath scheduling library (C++20)
//
// ALGORITHM:
// Forward pass in topological order:
//   ES(n) = max EF(p) over predecessors p, 0 for sources
//   EF(n) = ES(n) + duration(n)
// Backward pass in reverse topological order:
//   LF(n) = min LS(s) over successors s, or the project end for sinks
//   LS(n) = LF(n) - duration(n)
// Slack(n) = LS(n) - ES(n).
//
// The project end is the maximum EF over sinks, or the configured
// deadline when one is set.  With a deadline every path may carry
// positive (or negative) slack, so "critical" is measured against the
// graph-wide MINIMUM slack rather than zero:
//   critical(n) <=> |slack(n) - min_slack| <= epsilon
//
// Complexity: O(V + E)

#ifndef CRITPATH_GRAPH_CRITICAL_PATH_H
#define CRITPATH_GRAPH_CRITICAL_PATH_H

#include "dependency_graph.h"
#include "graph_concepts.h"
#include <critpath/core/schedule_options.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <stdexcept>
#include <vector>

namespace critpath::graph {

/// Result of CPM analysis.
///
/// - timing[n]: per-node timing, indexed by node_index
/// - project_finish: maximum earliest finish over sinks
/// - project_end: project_finish, or the deadline when configured
/// - min_slack: graph-wide minimum slack (0 for an empty graph)
struct cpm_result {
    std::vector<node_timing> timing{};
    double project_finish = 0.0;
    double project_end = 0.0;
    double min_slack = 0.0;
};

/// Run the forward and backward passes over an acyclic graph.
///
/// Preconditions:
/// - order is a complete topological order of g (see topological_sort)
///
/// Throws std::logic_error if order does not cover every node.
[[nodiscard]] inline cpm_result
compute_cpm(dependency_graph const& g,
            std::vector<node_index> const& order,
            schedule_options const& opts = {}) {
    auto const V = g.node_count();
    if (order.size() != V)
        throw std::logic_error("compute_cpm: order does not cover every node");

    cpm_result result;
    result.timing.assign(V, node_timing{});
    if (V == 0) {
        return result;
    }
    auto& t = result.timing;

    // Forward pass.
    for (auto n : order) {
        double es = 0.0;
        for (auto p : g.in_neighbors(n)) {
            es = std::max(es, t[to_index(p)].earliest_finish);
        }
        t[to_index(n)].earliest_start = es;
        t[to_index(n)].earliest_finish = es + g.node(n).duration;
    }

    // Project finish: latest earliest finish over sinks.
    double finish = 0.0;
    for (std::size_t i = 0; i < V; ++i) {
        if (g.out_degree(make_index(i)) == 0) {
            finish = std::max(finish, t[i].earliest_finish);
        }
    }
    result.project_finish = finish;
    result.project_end = opts.deadline_hours.value_or(finish);

    // Backward pass.
    for (auto it = order.rbegin(); it != order.rend(); ++it) {
        auto const n = *it;
        auto const succ = g.out_neighbors(n);
        double lf = result.project_end;
        if (!succ.empty()) {
            lf = std::numeric_limits<double>::infinity();
            for (auto s : succ) {
                lf = std::min(lf, t[to_index(s)].latest_start);
            }
        }
        auto& tn = t[to_index(n)];
        tn.latest_finish = lf;
        tn.latest_start = lf - g.node(n).duration;
        tn.slack = tn.latest_start - tn.earliest_start;
    }

    // Critical flags against the minimum slack.
    double min_slack = std::numeric_limits<double>::infinity();
    for (auto const& tn : t) min_slack = std::min(min_slack, tn.slack);
    result.min_slack = min_slack;

    for (auto& tn : t) {
        tn.is_critical = std::abs(tn.slack - min_slack) <= opts.critical_epsilon;
    }
    return result;
}

/// Attach a CPM result onto the graph's node records.
inline void apply(dependency_graph& g, cpm_result const& r) {
    g.attach_schedule(r.timing, r.project_finish, r.min_slack);
}

} // namespace critpath::graph

#endif // CRITPATH_GRAPH_CRITICAL_PATH_H
