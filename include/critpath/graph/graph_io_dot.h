// graph/graph_io_dot.h - Graphviz DOT export
// Part of the critpath scheduling library (C++20)
//
// Writes an analysed dependency_graph in DOT format for inspection with
// Graphviz outside the terminal.  Nodes are labelled with id, title and
// (once scheduled) ES/EF and slack.  Critical nodes and edges are red;
// edges on a cycle are red and dashed.
// No parsing.

#ifndef CRITPATH_GRAPH_IO_DOT_H
#define CRITPATH_GRAPH_IO_DOT_H

#include "dependency_graph.h"

#include <ostream>
#include <sstream>
#include <string>
#include <string_view>

namespace critpath::graph::io {

/// Quote a string as a DOT identifier.
[[nodiscard]] inline std::string dot_quote(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 2);
    out += '"';
    for (char c : s) {
        if (c == '"' || c == '\\') out += '\\';
        if (c == '\n') {
            out += "\\n";
            continue;
        }
        out += c;
    }
    out += '"';
    return out;
}

/// Write a dependency graph in Graphviz DOT format.
///
/// Example output:
/// ```dot
/// digraph G {
///   rankdir=LR;
///   "A" [label="A\nDesign\nES 0 EF 2 slack 0", color=red];
///   "A" -> "B" [color=red];
/// }
/// ```
inline void write_dot(std::ostream& os, dependency_graph const& g,
                      std::string_view graph_name = "G") {
    os << "digraph " << graph_name << " {\n";
    os << "  rankdir=LR;\n";
    os << "  node [shape=box];\n";

    for (auto const& n : g.nodes()) {
        std::ostringstream label;
        label << n.id;
        if (!n.title.empty()) label << '\n' << n.title;
        if (g.has_schedule()) {
            label << "\nES " << n.earliest_start << " EF " << n.earliest_finish
                  << " slack " << n.slack;
        }
        os << "  " << dot_quote(n.id) << " [label=" << dot_quote(label.str());
        if (g.has_schedule() && n.is_critical) os << ", color=red";
        os << "];\n";
    }

    auto const& cycles = g.cycle_detection();
    for (auto const& e : g.edges()) {
        os << "  " << dot_quote(e.from) << " -> " << dot_quote(e.to);
        if (cycles.contains(e)) {
            os << " [color=red, style=dashed]";
        } else if (g.has_schedule() && g.is_critical(e)) {
            os << " [color=red]";
        }
        os << ";\n";
    }

    os << "}\n";
}

} // namespace critpath::graph::io

#endif // CRITPATH_GRAPH_IO_DOT_H
