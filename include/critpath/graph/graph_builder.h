// graph/graph_builder.h - Issue snapshot -> dependency_graph
// Part of the critpath scheduling library (C++20)
//
// Canonicalisation rules:
// 1. One node per distinct issue id; the first occurrence wins.
// 2. Edges come from both dependency_ids (dep -> issue) and blocks_ids
//    (issue -> blocked).  The union is sorted by (from, to) and
//    deduplicated.
// 3. Edges naming an id outside the snapshot are dropped.
// 4. Self-edges are KEPT: an issue blocking itself is a cycle the user
//    has to see.
// 5. A missing, non-finite or non-positive duration becomes the default.
//
// The builder never throws on issue data.  It throws only for invalid
// schedule_options (see validate()).

#ifndef CRITPATH_GRAPH_GRAPH_BUILDER_H
#define CRITPATH_GRAPH_GRAPH_BUILDER_H

#include "dependency_graph.h"
#include "graph_concepts.h"
#include "issue.h"
#include <critpath/core/build_stats.h>
#include <critpath/core/log.h>
#include <critpath/core/schedule_options.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace critpath::graph {

/// Incremental builder for dependency_graph.
///
/// add_issue() may be called in any order; finalise() sorts nodes by id
/// and resolves edge declarations against the final id set, so an edge
/// may name an issue added later.
class graph_builder {
public:
    explicit graph_builder(double default_duration_hours =
                               engine_limits::default_duration_hours)
        : default_duration_(default_duration_hours) {}

    /// Add one issue.  Returns false if the id was already present (the
    /// repeat is ignored, including its edge declarations).
    bool add_issue(issue const& src) {
        ++stats_.issues_seen;
        if (!seen_.insert(src.id).second) {
            ++stats_.duplicate_issue_ids;
            engine_log()->warn("graph_builder: duplicate issue id '{}' ignored", src.id);
            return false;
        }

        schedule_node n;
        n.id = src.id;
        n.title = src.title;
        if (src.duration_hours && std::isfinite(*src.duration_hours) &&
            *src.duration_hours > 0.0) {
            n.duration = *src.duration_hours;
        } else {
            n.duration = default_duration_;
            n.duration_defaulted = true;
            ++stats_.durations_defaulted;
        }
        pending_.push_back(std::move(n));

        for (auto const& dep : src.dependency_ids) {
            declared_.push_back(dependency_edge{dep, src.id});
        }
        for (auto const& blocked : src.blocks_ids) {
            declared_.push_back(dependency_edge{src.id, blocked});
        }
        return true;
    }

    /// Add a bare edge declaration (from must finish before to starts).
    void add_edge(std::string from, std::string to) {
        declared_.push_back(dependency_edge{std::move(from), std::move(to)});
    }

    [[nodiscard]] std::size_t node_count() const noexcept { return pending_.size(); }
    [[nodiscard]] std::size_t declared_edge_count() const noexcept { return declared_.size(); }

    /// Build the immutable dependency_graph.
    [[nodiscard]] dependency_graph finalise() const {
        dependency_graph g;
        g.stats_ = stats_;
        g.stats_.edges_declared = declared_.size();

        // Nodes, ascending by id.
        g.nodes_ = pending_;
        std::sort(g.nodes_.begin(), g.nodes_.end(),
                  [](schedule_node const& a, schedule_node const& b) { return a.id < b.id; });

        auto const V = g.nodes_.size();
        std::unordered_map<std::string, std::uint32_t> index;
        index.reserve(V);
        for (std::size_t i = 0; i < V; ++i) {
            index.emplace(g.nodes_[i].id, static_cast<std::uint32_t>(i));
        }

        // Resolve declarations to index pairs, dropping dangling ones.
        struct edge_pair {
            std::uint32_t src;
            std::uint32_t dst;

            bool operator==(edge_pair const&) const = default;
            auto operator<=>(edge_pair const&) const = default;
        };
        std::vector<edge_pair> resolved;
        resolved.reserve(declared_.size());
        for (auto const& e : declared_) {
            auto const from = index.find(e.from);
            auto const to = index.find(e.to);
            if (from == index.end() || to == index.end()) {
                ++g.stats_.edges_dangling;
                engine_log()->debug("graph_builder: dropped dangling edge {} -> {}",
                                    e.from, e.to);
                continue;
            }
            resolved.push_back(edge_pair{from->second, to->second});
        }

        // Sort, dedup.  Index order is id order, so this is (from, to) order.
        std::sort(resolved.begin(), resolved.end());
        auto const last = std::unique(resolved.begin(), resolved.end());
        g.stats_.edges_duplicate = static_cast<std::size_t>(resolved.end() - last);
        resolved.erase(last, resolved.end());

        g.edges_.reserve(resolved.size());
        for (auto const& e : resolved) {
            if (e.src == e.dst) ++g.stats_.self_edges;
            g.edges_.push_back(dependency_edge{g.nodes_[e.src].id, g.nodes_[e.dst].id});
        }

        // Forward CSR.
        using index_type = dependency_graph::index_type;
        g.out_offsets_.assign(V + 1, 0);
        for (auto const& e : resolved) {
            g.out_offsets_[e.src + 1]++;
        }
        for (std::size_t i = 1; i <= V; ++i) {
            g.out_offsets_[i] = static_cast<index_type>(g.out_offsets_[i] + g.out_offsets_[i - 1]);
        }
        g.out_targets_.resize(resolved.size());
        for (std::size_t i = 0; i < resolved.size(); ++i) {
            g.out_targets_[i] = node_index{resolved[i].dst};
        }

        // Reverse CSR.  Scanning edges in (src, dst) order fills each
        // bucket with ascending sources.
        g.in_offsets_.assign(V + 1, 0);
        for (auto const& e : resolved) {
            g.in_offsets_[e.dst + 1]++;
        }
        for (std::size_t i = 1; i <= V; ++i) {
            g.in_offsets_[i] = static_cast<index_type>(g.in_offsets_[i] + g.in_offsets_[i - 1]);
        }
        g.in_sources_.resize(resolved.size());
        std::vector<index_type> cursor(g.in_offsets_.begin(), g.in_offsets_.end() - 1);
        for (auto const& e : resolved) {
            g.in_sources_[cursor[e.dst]++] = node_index{e.src};
        }

        engine_log()->debug(
            "graph_builder: {} nodes, {} edges ({} declared, {} duplicate, {} dangling, "
            "{} defaulted durations)",
            V, g.edges_.size(), g.stats_.edges_declared, g.stats_.edges_duplicate,
            g.stats_.edges_dangling, g.stats_.durations_defaulted);

        return g;
    }

private:
    double default_duration_;
    std::vector<schedule_node> pending_;
    std::vector<dependency_edge> declared_;
    std::unordered_set<std::string> seen_;
    build_stats stats_{};
};

/// Build a graph from an issue snapshot.
///
/// Example:
/// ```cpp
/// std::vector<issue> issues{
///     {.id = "A", .title = "Design", .duration_hours = 2.0, .blocks_ids = {"B"}},
///     {.id = "B", .title = "Build",  .duration_hours = 3.0},
/// };
/// auto g = build_graph(issues);
/// // g.node_count() == 2, g.edges() == {A -> B}
/// ```
[[nodiscard]] inline dependency_graph
build_graph(std::span<issue const> issues, schedule_options const& opts = {}) {
    validate(opts);
    graph_builder b(opts.default_duration_hours);
    for (auto const& i : issues) {
        (void)b.add_issue(i);
    }
    return b.finalise();
}

} // namespace critpath::graph

#endif // CRITPATH_GRAPH_GRAPH_BUILDER_H
