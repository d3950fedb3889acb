#pragma once

namespace scene_render {

namespace render {

constexpr const char* svg_namespace = "http://www.w3.org/2000/svg";

constexpr const char* default_font_family = "system-ui";
constexpr const char* default_text_fill = "#000";
constexpr const char* default_line_stroke = "#000";

// Graph primitives.
constexpr const char* node_fill = "#fff";
constexpr const char* node_stroke = "#333";
constexpr double node_label_size = 14.0;
constexpr double edge_label_size = 12.0;
constexpr const char* label_fill = "#000";
constexpr double arrow_length = 8.0;
constexpr double arrow_width = 8.0;

// Serialization aborts past this depth of nested groups/layouts.
constexpr int max_nesting_depth = 64;

// Error document palette.
constexpr const char* error_background = "#1a1a2e";
constexpr const char* error_text_fill = "#f85149";
constexpr double error_font_size = 12.0;

} // namespace render
} // namespace scene_render
