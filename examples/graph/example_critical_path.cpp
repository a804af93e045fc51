// examples/graph/example_critical_path.cpp - Release plan: CPM, layout and focus
//
// A small release plan as an issue tracker would hold it.  The engine
// orders the work, computes earliest/latest times and slack, marks the
// critical path, lays the chart out and extracts the neighbourhood of
// one issue.  A second snapshot with a circular dependency shows the
// cycle report instead.
//
// Compile:
//   g++ -std=c++20 -O2 -I include -o example_critical_path \
//       examples/graph/example_critical_path.cpp -lspdlog -lfmt

#include <critpath/graph/graph.h>

#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace critpath;
using namespace critpath::graph;

// =========================================================================
// Issue snapshots
// =========================================================================

// REL-1 design doc  (8h)  -> REL-2, REL-3
// REL-2 backend     (24h) -> REL-4
// REL-3 frontend    (16h) -> REL-4, REL-5
// REL-4 integration (8h)  -> REL-6
// REL-5 docs        (no estimate) -> REL-6
// REL-6 release     (2h)
std::vector<issue> release_plan() {
    return {
        {.id = "REL-1", .title = "design doc", .duration_hours = 8.0, .blocks_ids = {"REL-2", "REL-3"}},
        {.id = "REL-2", .title = "backend", .duration_hours = 24.0, .blocks_ids = {"REL-4"}},
        {.id = "REL-3", .title = "frontend", .duration_hours = 16.0, .blocks_ids = {"REL-4", "REL-5"}},
        {.id = "REL-4", .title = "integration", .duration_hours = 8.0},
        {.id = "REL-5", .title = "docs"},
        {.id = "REL-6", .title = "release", .duration_hours = 2.0,
         .dependency_ids = {"REL-4", "REL-5"}},
    };
}

// OPS-1 -> OPS-2 -> OPS-3 -> OPS-1
std::vector<issue> circular_plan() {
    return {
        {.id = "OPS-1", .title = "provision", .duration_hours = 4.0, .blocks_ids = {"OPS-2"}},
        {.id = "OPS-2", .title = "configure", .duration_hours = 2.0, .blocks_ids = {"OPS-3"}},
        {.id = "OPS-3", .title = "verify", .duration_hours = 1.0, .blocks_ids = {"OPS-1"}},
    };
}

// =========================================================================
// Printing
// =========================================================================

void print_schedule(dependency_graph const& g) {
    std::cout << std::left << std::setw(8) << "id" << std::setw(13) << "title" << std::right
              << std::setw(6) << "dur" << std::setw(6) << "ES" << std::setw(6) << "EF"
              << std::setw(6) << "LS" << std::setw(6) << "LF" << std::setw(7) << "slack"
              << "  pos\n";
    for (auto const* n : g.nodes_in_order()) {
        std::cout << std::left << std::setw(8) << n->id << std::setw(13) << n->title
                  << std::right << std::setw(6) << n->duration << std::setw(6)
                  << n->earliest_start << std::setw(6) << n->earliest_finish << std::setw(6)
                  << n->latest_start << std::setw(6) << n->latest_finish << std::setw(7)
                  << n->slack << "  (" << n->x << "," << n->y << ")"
                  << (n->is_critical ? "  *" : "") << "\n";
    }
}

int main() {
    auto plan = release_plan();
    auto g = analyse(plan);

    std::cout << "=== Release plan: critical path ===\n\n";
    print_schedule(g);

    std::cout << "\nProject finish: " << g.project_finish() << "h\n";
    std::cout << "Critical path:";
    for (auto const& id : g.critical_path()) std::cout << " " << id;
    std::cout << "\nDefaulted durations: " << g.stats().durations_defaulted << "\n";
    std::cout << "Chart extent: " << g.extent().width << " x " << g.extent().height << "\n";

    std::cout << "\n=== Focus: upstream of REL-4, depth 1 ===\n\n";
    auto focus = extract_focus(g, "REL-4", focus_direction::upstream, 1);
    for (auto const& n : focus.graph.nodes()) std::cout << "  " << n.id << " " << n.title << "\n";

    std::cout << "\n=== Navigation ===\n\n";
    auto sel = next_selection(g, std::nullopt);
    for (int i = 0; i < 7 && sel; ++i) {
        std::cout << "  " << *sel;
        sel = next_selection(g, sel);
    }
    std::cout << "\n";

    std::cout << "\n=== Graphviz ===\n\n";
    io::write_dot(std::cout, g, "release");

    std::cout << "\n=== Circular plan ===\n\n";
    auto ops = circular_plan();
    auto cyclic = analyse(ops);
    std::cout << (cyclic.has_cycle() ? format_cycle_message(cyclic.cycle_detection())
                                     : std::string("no cycle"))
              << "\n";
    return 0;
}
