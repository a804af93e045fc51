// graph/dependency_graph.h - Id-keyed node arena with CSR adjacency
// Part of the critpath scheduling library (C++20)
//
// DESIGN RATIONALE:
// Nodes live in an arena sorted by issue id; edges are plain (id, id)
// pairs.  Nodes never point at each other.  For the algorithms the same
// topology is also stored twice in CSR form (forward and reverse), keyed
// by node_index = position in the arena.
//
// Because the arena is sorted by id and edges are sorted by (from, to),
// edge i is exactly the i-th entry of the forward CSR targets array.
//
// Analysis results (cycle report, topological order, CPM timing, layout)
// are attached after construction through the attach_* members, each of
// which checks that the result was computed for a graph of this shape.
// A graph is never partially analysed in an observable way: timing is
// only readable once has_schedule() is true.
//
// CONSTRUCTION:
//   graph_builder (graph_builder.h) is the only producer of fresh graphs;
//   induced_subgraph (subgraph.h) derives filtered copies.

#ifndef CRITPATH_GRAPH_DEPENDENCY_GRAPH_H
#define CRITPATH_GRAPH_DEPENDENCY_GRAPH_H

#include "graph_concepts.h"
#include <critpath/core/build_stats.h>

#include <algorithm>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace critpath::graph {

// Forward declarations for friend access.
class graph_builder;

namespace detail {
class subgraph_copier;
} // namespace detail

// =============================================================================
// Records
// =============================================================================

/// One issue in the graph, with its computed schedule and position.
///
/// Timing fields stay 0 and is_critical stays false until a schedule is
/// attached.  rank/x/y stay 0 until a layout is attached.
struct schedule_node {
    std::string id;
    std::string title;
    double duration = 0.0;
    bool duration_defaulted = false;

    double earliest_start = 0.0;
    double earliest_finish = 0.0;
    double latest_start = 0.0;
    double latest_finish = 0.0;
    double slack = 0.0;
    bool is_critical = false;

    int rank = 0;
    int x = 0;
    int y = 0;
};

/// "from must complete before to starts".
struct dependency_edge {
    std::string from;
    std::string to;

    friend bool operator==(dependency_edge const&, dependency_edge const&) = default;
    friend auto operator<=>(dependency_edge const&, dependency_edge const&) = default;
};

/// Result of cycle detection.
///
/// cycle_edges holds every edge lying on at least one directed cycle,
/// sorted and unique.
struct cycle_report {
    bool has_cycle = false;
    std::vector<dependency_edge> cycle_edges{};

    [[nodiscard]] bool contains(dependency_edge const& e) const {
        return std::binary_search(cycle_edges.begin(), cycle_edges.end(), e);
    }

    bool operator==(cycle_report const&) const = default;
};

/// CPM timing for one node.
struct node_timing {
    double earliest_start = 0.0;
    double earliest_finish = 0.0;
    double latest_start = 0.0;
    double latest_finish = 0.0;
    double slack = 0.0;
    bool is_critical = false;
};

/// Layout position for one node.
struct node_placement {
    int rank = 0;
    int x = 0;
    int y = 0;
};

/// Routing hint for drawing one edge as an arrow between two boxes.
///
/// (from_x, from_y) is the exit point on the right side of the source
/// box, (to_x, to_y) the entry point on the left side of the target box.
/// rank_span > 1 means the arrow passes over intermediate rank columns.
struct edge_route {
    dependency_edge edge;
    int from_x = 0;
    int from_y = 0;
    int to_x = 0;
    int to_y = 0;
    int rank_span = 0;
    bool is_critical = false;
};

/// Bounding box of a laid-out graph, in cells.
struct layout_extent {
    int width = 0;
    int height = 0;

    bool operator==(layout_extent const&) const = default;
};

// =============================================================================
// dependency_graph
// =============================================================================

class dependency_graph {
public:
    using index_type = std::uint32_t;

    dependency_graph() = default;

    // =========================================================================
    // Size queries
    // =========================================================================

    [[nodiscard]] std::size_t node_count() const noexcept { return nodes_.size(); }
    [[nodiscard]] std::size_t edge_count() const noexcept { return edges_.size(); }
    [[nodiscard]] bool empty() const noexcept { return nodes_.empty(); }

    // =========================================================================
    // Id-keyed access
    // =========================================================================

    /// All nodes, ascending by id.
    [[nodiscard]] std::vector<schedule_node> const& nodes() const noexcept {
        return nodes_;
    }

    /// All edges, ascending by (from, to).
    [[nodiscard]] std::vector<dependency_edge> const& edges() const noexcept {
        return edges_;
    }

    /// Index of the node with this id, or invalid_node.
    [[nodiscard]] node_index index_of(std::string_view id) const noexcept {
        auto const it = std::lower_bound(
            nodes_.begin(), nodes_.end(), id,
            [](schedule_node const& n, std::string_view key) { return n.id < key; });
        if (it == nodes_.end() || it->id != id) return invalid_node;
        return make_index(static_cast<std::size_t>(it - nodes_.begin()));
    }

    [[nodiscard]] bool contains(std::string_view id) const noexcept {
        return index_of(id) != invalid_node;
    }

    /// Node with this id, or nullptr.
    [[nodiscard]] schedule_node const* find(std::string_view id) const noexcept {
        auto const n = index_of(id);
        return n == invalid_node ? nullptr : &nodes_[to_index(n)];
    }

    [[nodiscard]] schedule_node const& node(node_index n) const {
        if (to_index(n) >= nodes_.size())
            throw std::out_of_range("dependency_graph: node_index out of bounds");
        return nodes_[to_index(n)];
    }

    [[nodiscard]] std::string const& key_of(node_index n) const {
        return node(n).id;
    }

    [[nodiscard]] schedule_node const& at(std::string_view id) const {
        auto const* n = find(id);
        if (n == nullptr)
            throw std::out_of_range("dependency_graph: unknown issue id");
        return *n;
    }

    // =========================================================================
    // Adjacency access
    // =========================================================================

    struct adjacency_range {
        node_index const* begin_;
        node_index const* end_;

        [[nodiscard]] node_index const* begin() const noexcept { return begin_; }
        [[nodiscard]] node_index const* end() const noexcept { return end_; }
        [[nodiscard]] std::size_t size() const noexcept {
            return static_cast<std::size_t>(end_ - begin_);
        }
        [[nodiscard]] bool empty() const noexcept { return begin_ == end_; }
    };

    /// Successors of u, ascending.
    [[nodiscard]] adjacency_range out_neighbors(node_index u) const noexcept {
        auto const idx = to_index(u);
        return {out_targets_.data() + out_offsets_[idx],
                out_targets_.data() + out_offsets_[idx + 1]};
    }

    /// Predecessors of u, ascending.
    [[nodiscard]] adjacency_range in_neighbors(node_index u) const noexcept {
        auto const idx = to_index(u);
        return {in_sources_.data() + in_offsets_[idx],
                in_sources_.data() + in_offsets_[idx + 1]};
    }

    [[nodiscard]] std::size_t out_degree(node_index u) const noexcept {
        return out_neighbors(u).size();
    }

    [[nodiscard]] std::size_t in_degree(node_index u) const noexcept {
        return in_neighbors(u).size();
    }

    /// Position of edge u->v in edges(), or edge_count() if absent.
    [[nodiscard]] std::size_t edge_position(node_index u, node_index v) const noexcept {
        auto const range = out_neighbors(u);
        auto const it = std::lower_bound(range.begin(), range.end(), v);
        if (it == range.end() || *it != v) return edges_.size();
        return static_cast<std::size_t>(it - out_targets_.data());
    }

    [[nodiscard]] bool has_edge(std::string_view from, std::string_view to) const noexcept {
        auto const u = index_of(from);
        auto const v = index_of(to);
        if (u == invalid_node || v == invalid_node) return false;
        return edge_position(u, v) != edges_.size();
    }

    // =========================================================================
    // Analysis results
    // =========================================================================

    [[nodiscard]] cycle_report const& cycle_detection() const noexcept { return cycles_; }
    [[nodiscard]] bool has_cycle() const noexcept { return cycles_.has_cycle; }

    /// Ids in topological order.  Empty when a cycle was detected or no
    /// order has been attached yet.
    [[nodiscard]] std::vector<std::string> const& topological_order() const noexcept {
        return order_;
    }

    /// True once CPM timing has been attached.
    [[nodiscard]] bool has_schedule() const noexcept { return scheduled_; }

    /// True once layout coordinates have been attached.
    [[nodiscard]] bool has_layout() const noexcept { return laid_out_; }

    /// Latest earliest_finish over all sinks (0 before scheduling).
    [[nodiscard]] double project_finish() const noexcept { return project_finish_; }

    /// Graph-wide minimum slack (0 before scheduling).
    [[nodiscard]] double min_slack() const noexcept { return min_slack_; }

    /// Critical node ids in topological order.
    [[nodiscard]] std::vector<std::string> const& critical_path() const noexcept {
        return critical_path_;
    }

    [[nodiscard]] std::vector<edge_route> const& routes() const noexcept { return routes_; }
    [[nodiscard]] layout_extent extent() const noexcept { return extent_; }
    [[nodiscard]] build_stats const& stats() const noexcept { return stats_; }

    /// An edge is critical iff both endpoints are critical.
    [[nodiscard]] bool is_critical(dependency_edge const& e) const noexcept {
        auto const* a = find(e.from);
        auto const* b = find(e.to);
        return a != nullptr && b != nullptr && a->is_critical && b->is_critical;
    }

    /// Nodes in topological order (empty when no order is attached).
    [[nodiscard]] std::vector<schedule_node const*> nodes_in_order() const {
        return lookup_all(order_);
    }

    /// Critical nodes in topological order.
    [[nodiscard]] std::vector<schedule_node const*> critical_path_nodes() const {
        return lookup_all(critical_path_);
    }

    // =========================================================================
    // Attaching results
    // =========================================================================

    void attach_cycles(cycle_report report) {
        stats_.cycle_edges = report.cycle_edges.size();
        cycles_ = std::move(report);
        if (cycles_.has_cycle) {
            order_.clear();
            clear_schedule();
        }
    }

    /// Attach a topological order given as node indices.
    ///
    /// Throws std::logic_error unless the order visits every node exactly
    /// once and respects every edge.
    void attach_order(std::vector<node_index> const& order) {
        if (cycles_.has_cycle)
            throw std::logic_error("dependency_graph: cannot order a cyclic graph");
        if (order.size() != nodes_.size())
            throw std::logic_error("dependency_graph: topological order length mismatch");

        std::vector<std::size_t> position(nodes_.size(), nodes_.size());
        for (std::size_t i = 0; i < order.size(); ++i) {
            auto const idx = to_index(order[i]);
            if (idx >= nodes_.size() || position[idx] != nodes_.size())
                throw std::logic_error("dependency_graph: order is not a permutation");
            position[idx] = i;
        }
        for (std::size_t u = 0; u < nodes_.size(); ++u) {
            for (auto v : out_neighbors(make_index(u))) {
                if (position[u] >= position[to_index(v)])
                    throw std::logic_error("dependency_graph: order violates an edge");
            }
        }

        order_.clear();
        order_.reserve(order.size());
        for (auto n : order) order_.push_back(nodes_[to_index(n)].id);
    }

    /// Attach CPM timing, one entry per node in index order.
    void attach_schedule(std::vector<node_timing> const& timing,
                         double project_finish, double min_slack) {
        if (timing.size() != nodes_.size())
            throw std::logic_error("dependency_graph: timing size mismatch");
        if (order_.size() != nodes_.size())
            throw std::logic_error("dependency_graph: schedule requires a topological order");

        std::size_t critical = 0;
        for (std::size_t i = 0; i < nodes_.size(); ++i) {
            auto& n = nodes_[i];
            auto const& t = timing[i];
            n.earliest_start = t.earliest_start;
            n.earliest_finish = t.earliest_finish;
            n.latest_start = t.latest_start;
            n.latest_finish = t.latest_finish;
            n.slack = t.slack;
            n.is_critical = t.is_critical;
            if (t.is_critical) ++critical;
        }

        critical_path_.clear();
        for (auto const& id : order_) {
            if (find(id)->is_critical) critical_path_.push_back(id);
        }

        project_finish_ = project_finish;
        min_slack_ = min_slack;
        stats_.critical_nodes = critical;
        scheduled_ = true;
    }

    /// Attach layout, one placement per node in index order and one route
    /// per edge in edge order.
    void attach_layout(std::vector<node_placement> const& placement,
                       std::vector<edge_route> routes,
                       layout_extent extent) {
        if (placement.size() != nodes_.size())
            throw std::logic_error("dependency_graph: placement size mismatch");
        if (routes.size() != edges_.size())
            throw std::logic_error("dependency_graph: route count mismatch");

        int max_rank = -1;
        for (std::size_t i = 0; i < nodes_.size(); ++i) {
            nodes_[i].rank = placement[i].rank;
            nodes_[i].x = placement[i].x;
            nodes_[i].y = placement[i].y;
            max_rank = std::max(max_rank, placement[i].rank);
        }
        routes_ = std::move(routes);
        extent_ = extent;
        stats_.rank_count = static_cast<std::size_t>(max_rank + 1);
        laid_out_ = true;
    }

private:
    std::vector<schedule_node> nodes_;
    std::vector<dependency_edge> edges_;

    // CSR, forward and reverse.
    std::vector<index_type> out_offsets_{0};
    std::vector<node_index> out_targets_;
    std::vector<index_type> in_offsets_{0};
    std::vector<node_index> in_sources_;

    cycle_report cycles_{};
    std::vector<std::string> order_;
    std::vector<std::string> critical_path_;
    std::vector<edge_route> routes_;
    layout_extent extent_{};
    double project_finish_ = 0.0;
    double min_slack_ = 0.0;
    bool scheduled_ = false;
    bool laid_out_ = false;
    build_stats stats_{};

    void clear_schedule() {
        for (auto& n : nodes_) {
            n.earliest_start = n.earliest_finish = 0.0;
            n.latest_start = n.latest_finish = 0.0;
            n.slack = 0.0;
            n.is_critical = false;
        }
        critical_path_.clear();
        routes_.clear();
        extent_ = {};
        project_finish_ = min_slack_ = 0.0;
        scheduled_ = laid_out_ = false;
    }

    [[nodiscard]] std::vector<schedule_node const*>
    lookup_all(std::vector<std::string> const& ids) const {
        std::vector<schedule_node const*> out;
        out.reserve(ids.size());
        for (auto const& id : ids) {
            if (auto const* n = find(id)) out.push_back(n);
        }
        return out;
    }

    friend class graph_builder;
    friend class detail::subgraph_copier;
};

static_assert(graph_queryable<dependency_graph>);
static_assert(bidirectional_graph<dependency_graph>);

} // namespace critpath::graph

#endif // CRITPATH_GRAPH_DEPENDENCY_GRAPH_H
