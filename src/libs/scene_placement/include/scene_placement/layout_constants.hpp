#pragma once

#include <scene_model/types.hpp>

namespace scene_placement {

// Geometry shared by the evaluator and the renderer. All values in canvas
// pixels.

namespace layout {

// Extent reported for shapes with nothing to measure.
constexpr double placeholder_extent = 40.0;

// Text metrics approximation: average glyph advance and line box height.
constexpr double glyph_width_factor = 0.6;
constexpr double line_height_factor = 1.2;

// Geometry used when a shape omits it.
constexpr scene_model::Point default_rect_size{ 100.0, 100.0 };
constexpr scene_model::Point default_image_size{ 100.0, 100.0 };
constexpr double default_circle_radius = 50.0;
constexpr scene_model::Point default_ellipse_radius{ 50.0, 30.0 };
constexpr scene_model::Point default_line_from{ 0.0, 0.0 };
constexpr scene_model::Point default_line_to{ 100.0, 100.0 };

// Graph nodes without an explicit size.
constexpr double default_node_width = 80.0;
constexpr double default_node_height = 40.0;

} // namespace layout
} // namespace scene_placement
