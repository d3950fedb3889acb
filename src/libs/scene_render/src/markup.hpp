#pragma once

#include <scene_model/ast.hpp>
#include <scene_model/token.hpp>
#include <scene_render/svg_escape.hpp>
#include <string>
#include <string_view>

namespace scene_render {
namespace detail {

inline void append_attr(std::string& out, std::string_view name, std::string_view value) {
    out += ' ';
    out += name;
    out += "=\"";
    out += escape_attribute(value);
    out += '"';
}

inline void append_attr(std::string& out, std::string_view name, double value) {
    out += ' ';
    out += name;
    out += "=\"";
    out += scene_model::format_number(value);
    out += '"';
}

// Graph expansion: connectors first, then node primitives.
void write_graph_content(std::string& out, const scene_model::GraphProps& graph);

} // namespace detail
} // namespace scene_render
