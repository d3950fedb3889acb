#pragma once

#include <scene_model/ast.hpp>
#include <scene_placement/types.hpp>

namespace scene_placement {

// Bounding extent used to advance stack/row children:
// explicit size, else 2 x radius, else text metrics, else the summed
// extent of a nested layout plus its padding, else a 40x40 placeholder.
// Symbols take no space.
Extent measure_shape(const scene_model::Shape& shape);

// Moves a shape and everything it contains by (dx, dy). Paths cannot be
// moved point-wise, so the offset is folded into their translate.
void shift_shape(scene_model::Shape& shape, double dx, double dy);

// Positions the children of a stack/row along its axis, starting at the
// layout's "at" inside its padding and advancing by each child's extent
// plus the gap. With a size, justify distributes the free main-axis space,
// align places children across the box and wrap starts a new line when the
// next child would overflow it. Children must already have their own nested
// content placed.
void place_layout_children(scene_model::Shape& layout);

} // namespace scene_placement
