// graph/graph.h - Umbrella header for the critpath graph library
// Part of the critpath scheduling library (C++20)
//
// Single-include convenience header.  Pulls in every graph component:
// representation, construction, algorithms, transforms, navigation
// and I/O.
//
// Usage:
//   #include <critpath/graph/graph.h>

#ifndef CRITPATH_GRAPH_GRAPH_H
#define CRITPATH_GRAPH_GRAPH_H

// --- Core ---
#include <critpath/core/build_stats.h>
#include <critpath/core/engine_limits.h>
#include <critpath/core/log.h>
#include <critpath/core/schedule_options.h>

// --- Representation ---
#include "graph_concepts.h"
#include "issue.h"
#include "dependency_graph.h"

// --- Construction ---
#include "graph_builder.h"

// --- Algorithms ---
#include "scc.h"
#include "cycle_detection.h"
#include "topological_sort.h"
#include "critical_path.h"
#include "layout.h"

// --- Transforms ---
#include "subgraph.h"
#include "focus_subgraph.h"

// --- Pipeline & navigation ---
#include "analyse.h"
#include "navigation.h"

// --- I/O ---
#include "graph_io_dot.h"

#endif // CRITPATH_GRAPH_GRAPH_H
