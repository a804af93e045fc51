// core/build_stats.h - Counters collected while building and analysing a graph
// Part of the critpath scheduling library (C++20)
//
// DESIGN RATIONALE:
// The engine never rejects malformed issue data; it normalises it.
// build_stats records how much normalisation happened so the host can
// surface it (status line, debug overlay) without the engine having to
// decide what is worth an error.
//
// Different stages populate different subsets of fields:
// - build_graph: issues_*, edges_*, durations_defaulted
// - detect_cycles: cycle_edges
// - compute_cpm / compute_layout: critical_nodes, rank_count

#ifndef CRITPATH_CORE_BUILD_STATS_H
#define CRITPATH_CORE_BUILD_STATS_H

#include <cstddef>

namespace critpath {

struct build_stats {
    // =============================================================================
    // Node normalisation
    // =============================================================================

    /// Issues in the input snapshot (including ignored repeats).
    std::size_t issues_seen = 0;

    /// Issues dropped because an earlier issue had the same id.
    std::size_t duplicate_issue_ids = 0;

    /// Nodes whose duration fell back to the default.
    std::size_t durations_defaulted = 0;

    // =============================================================================
    // Edge normalisation
    // =============================================================================

    /// Edge declarations read from dependency and blocks lists.
    std::size_t edges_declared = 0;

    /// Declarations that repeated an already-present (from, to) pair.
    /// "A blocks B" plus "B depends on A" counts one duplicate.
    std::size_t edges_duplicate = 0;

    /// Declarations naming an id outside the snapshot.
    std::size_t edges_dangling = 0;

    /// Unique self edges (an issue blocking itself).  Kept; they are cycles.
    std::size_t self_edges = 0;

    // =============================================================================
    // Analysis
    // =============================================================================

    std::size_t cycle_edges = 0;
    std::size_t critical_nodes = 0;
    std::size_t rank_count = 0;

    /// Declarations that became graph edges.
    [[nodiscard]] constexpr std::size_t edges_kept() const noexcept {
        return edges_declared - edges_duplicate - edges_dangling;
    }

    constexpr bool operator==(build_stats const&) const = default;
};

} // namespace critpath

#endif // CRITPATH_CORE_BUILD_STATS_H
