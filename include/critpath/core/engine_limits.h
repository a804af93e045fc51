// core/engine_limits.h - Fixed defaults and bounds for the scheduling engine
// Part of the critpath scheduling library (C++20)
//
// DESIGN RATIONALE:
// Every tunable the engine reads has a named default here.  Nothing in
// this header is mutable: callers override per call through
// schedule_options (see schedule_options.h), never through globals.
//
//   auto opts = schedule_options{};              // all defaults
//   opts.default_duration_hours = 8.0;           // one working day
//   auto g = analyse(issues, opts);
//
// Focus depth bounds match the interactive PERT view: one level minimum,
// ten levels maximum.

#ifndef CRITPATH_CORE_ENGINE_LIMITS_H
#define CRITPATH_CORE_ENGINE_LIMITS_H

#include <algorithm>
#include <cstddef>

namespace critpath {

namespace engine_limits {

// =============================================================================
// Scheduling
// =============================================================================

/// Duration used for issues without an estimate (hours).
/// One calendar day.
inline constexpr double default_duration_hours = 24.0;

/// Absolute tolerance (hours) when comparing slack against the minimum slack.
inline constexpr double critical_epsilon = 1e-6;

// =============================================================================
// Focus extraction
// =============================================================================

inline constexpr std::size_t min_focus_depth = 1;
inline constexpr std::size_t max_focus_depth = 10;

/// Clamp a requested focus depth into [min_focus_depth, max_focus_depth].
[[nodiscard]] constexpr std::size_t clamp_focus_depth(std::size_t depth) noexcept {
    return std::clamp(depth, min_focus_depth, max_focus_depth);
}

// =============================================================================
// Layout (terminal cells)
// =============================================================================

/// Width of one node box.
inline constexpr int node_width = 20;

/// Height of one node box.
inline constexpr int node_height = 3;

/// Horizontal gap between adjacent rank columns.
inline constexpr int column_gap = 4;

/// Vertical gap reserved below every node inside a rank column.
inline constexpr int row_gap = 1;

} // namespace engine_limits

} // namespace critpath

#endif // CRITPATH_CORE_ENGINE_LIMITS_H
