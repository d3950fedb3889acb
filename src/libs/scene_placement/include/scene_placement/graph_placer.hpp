#pragma once

#include <scene_model/ast.hpp>
#include <scene_placement/types.hpp>
#include <cstddef>

namespace scene_placement {

Extent node_extent(const scene_model::GraphNode& node);

// Bounding box of a node around its center; nodes without a center sit at 0,0.
Rect node_rect(const scene_model::GraphNode& node);

// Assigns node centers according to the graph's layout mode.
//   hierarchical: one node after another along the direction axis
//   grid:         ceil(sqrt(n)) columns of equal cells
//   manual:       authored centers, 0,0 where none was given
void place_graph_nodes(scene_model::GraphProps& graph);

} // namespace scene_placement
