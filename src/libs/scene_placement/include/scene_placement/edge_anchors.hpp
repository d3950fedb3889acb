#pragma once

#include <scene_model/ast.hpp>
#include <scene_placement/types.hpp>
#include <cstddef>

namespace scene_placement {

// Anchor points between two node boxes. The dominant axis of the center
// delta picks the sides: top/bottom when vertical dominates, left/right
// otherwise.
scene_model::EdgeAnchors edge_anchors(const Rect& from, const Rect& to);

// Resolves every edge's endpoints by node id and stores its anchors.
// Edges naming a missing node are removed; returns how many were removed.
std::size_t route_graph_edges(scene_model::GraphProps& graph);

} // namespace scene_placement
