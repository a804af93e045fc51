// graph/issue.h - Issue snapshot record consumed by the graph builder
// Part of the critpath scheduling library (C++20)
//
// The host application converts its own issue model into this shape.
// Only the fields the engine reads are carried; status, priority,
// labels and the rest stay with the host.

#ifndef CRITPATH_GRAPH_ISSUE_H
#define CRITPATH_GRAPH_ISSUE_H

#include <optional>
#include <string>
#include <vector>

namespace critpath::graph {

/// One issue from the tracker snapshot.
///
/// dependency_ids and blocks_ids are two views of the same relation:
/// B.dependency_ids containing A and A.blocks_ids containing B both mean
/// "A must finish before B starts".
struct issue {
    std::string id;
    std::string title;
    std::optional<double> duration_hours{};
    std::vector<std::string> dependency_ids{};
    std::vector<std::string> blocks_ids{};
};

} // namespace critpath::graph

#endif // CRITPATH_GRAPH_ISSUE_H
