// core/schedule_options.h - Explicit configuration for one graph build
// Part of the critpath scheduling library (C++20)
//
// All configuration reaches the engine as a value.  Two views built from
// the same issue snapshot with the same options produce identical graphs.

#ifndef CRITPATH_CORE_SCHEDULE_OPTIONS_H
#define CRITPATH_CORE_SCHEDULE_OPTIONS_H

#include "engine_limits.h"

#include <cmath>
#include <optional>
#include <stdexcept>

namespace critpath {

/// Box metrics used by the layout stage (terminal cells).
struct layout_metrics {
    int node_width = engine_limits::node_width;
    int node_height = engine_limits::node_height;
    int column_gap = engine_limits::column_gap;
    int row_gap = engine_limits::row_gap;

    /// Horizontal distance between the left edges of two adjacent ranks.
    [[nodiscard]] constexpr int column_pitch() const noexcept {
        return node_width + column_gap;
    }

    /// Vertical distance between the top edges of two stacked nodes.
    [[nodiscard]] constexpr int row_pitch() const noexcept {
        return node_height + row_gap;
    }

    constexpr bool operator==(layout_metrics const&) const = default;
};

/// Per-build configuration.
///
/// - default_duration_hours: applied to issues with no usable estimate
/// - critical_epsilon: tolerance for slack == min_slack
/// - deadline_hours: when set, sinks finish at the deadline instead of the
///   project's own earliest finish; slack is then measured against it
/// - layout: box metrics for coordinate assignment
struct schedule_options {
    double default_duration_hours = engine_limits::default_duration_hours;
    double critical_epsilon = engine_limits::critical_epsilon;
    std::optional<double> deadline_hours{};
    layout_metrics layout{};

    bool operator==(schedule_options const&) const = default;
};

/// Reject option values the engine cannot normalise around.
///
/// Throws std::invalid_argument naming the offending field.
inline void validate(schedule_options const& opts) {
    if (!std::isfinite(opts.default_duration_hours) ||
        opts.default_duration_hours <= 0.0)
        throw std::invalid_argument(
            "schedule_options: default_duration_hours must be finite and > 0");
    if (!std::isfinite(opts.critical_epsilon) || opts.critical_epsilon < 0.0)
        throw std::invalid_argument(
            "schedule_options: critical_epsilon must be finite and >= 0");
    if (opts.deadline_hours && !std::isfinite(*opts.deadline_hours))
        throw std::invalid_argument(
            "schedule_options: deadline_hours must be finite");
    if (opts.layout.node_width <= 0 || opts.layout.node_height <= 0)
        throw std::invalid_argument(
            "schedule_options: layout box must have positive size");
    if (opts.layout.column_gap < 0 || opts.layout.row_gap < 0)
        throw std::invalid_argument(
            "schedule_options: layout gaps must be >= 0");
}

} // namespace critpath

#endif // CRITPATH_CORE_SCHEDULE_OPTIONS_H
