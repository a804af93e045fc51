// graph/navigation.h - Keyboard navigation helpers for the PERT view
// Part of the critpath scheduling library (C++20)
//
// Selection moves through topological_order and wraps at both ends.
// Focus direction cycles upstream -> downstream -> both -> upstream.
// Focus depth steps stay inside the engine's depth bounds.

#ifndef CRITPATH_GRAPH_NAVIGATION_H
#define CRITPATH_GRAPH_NAVIGATION_H

#include "dependency_graph.h"
#include "focus_subgraph.h"
#include <critpath/core/engine_limits.h>

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace critpath::graph {

/// Position of id in the topological order, if present.
[[nodiscard]] inline std::optional<std::size_t>
order_position(dependency_graph const& g, std::string_view id) {
    auto const& order = g.topological_order();
    auto const it = std::find(order.begin(), order.end(), id);
    if (it == order.end()) return std::nullopt;
    return static_cast<std::size_t>(it - order.begin());
}

/// Move the selection `delta` steps through the topological order.
///
/// An unknown or empty current selection lands on the first node.
/// Returns nullopt when there is no order (empty or cyclic graph).
[[nodiscard]] inline std::optional<std::string>
step_selection(dependency_graph const& g, std::optional<std::string> const& current,
               long delta) {
    auto const& order = g.topological_order();
    if (order.empty()) return std::nullopt;

    auto const pos = current ? order_position(g, *current) : std::nullopt;
    if (!pos) return order.front();

    auto const n = static_cast<long>(order.size());
    auto next = (static_cast<long>(*pos) + delta) % n;
    if (next < 0) next += n;
    return order[static_cast<std::size_t>(next)];
}

[[nodiscard]] inline std::optional<std::string>
next_selection(dependency_graph const& g, std::optional<std::string> const& current) {
    return step_selection(g, current, 1);
}

[[nodiscard]] inline std::optional<std::string>
previous_selection(dependency_graph const& g, std::optional<std::string> const& current) {
    return step_selection(g, current, -1);
}

[[nodiscard]] constexpr focus_direction next_direction(focus_direction d) noexcept {
    switch (d) {
    case focus_direction::upstream: return focus_direction::downstream;
    case focus_direction::downstream: return focus_direction::both;
    case focus_direction::both: return focus_direction::upstream;
    }
    return focus_direction::both;
}

/// Depth after one increase (+1) or decrease (-1) keystroke.
[[nodiscard]] constexpr std::size_t step_focus_depth(std::size_t depth, int delta) noexcept {
    if (delta < 0) {
        auto const down = static_cast<std::size_t>(-delta);
        depth = depth > down ? depth - down : 0;
    } else {
        depth += static_cast<std::size_t>(delta);
    }
    return engine_limits::clamp_focus_depth(depth);
}

} // namespace critpath::graph

#endif // CRITPATH_GRAPH_NAVIGATION_H
