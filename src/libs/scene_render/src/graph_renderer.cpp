#include <scene_render/render_constants.hpp>
#include <scene_placement/graph_placer.hpp>
#include "markup.hpp"
#include <algorithm>
#include <cmath>
#include <vector>

namespace scene_render {
namespace detail {

using namespace scene_model;

namespace {

std::string point_text(Point p) {
    return format_number(p.x) + "," + format_number(p.y);
}

std::string path_point(Point p) {
    return format_number(p.x) + " " + format_number(p.y);
}

struct Connector {
    std::string d;
    // Points the path passes through before reaching each end, nearest first.
    std::vector<Point> approach_end;
    std::vector<Point> approach_start;
};

// straight:   one segment
// curved:     quadratic curve, control point on the dominant axis of the start
// orthogonal: horizontal, vertical, horizontal with the bend at mid x
Connector make_connector(const GraphEdge& edge, const EdgeAnchors& a) {
    const Point s = a.from;
    const Point e = a.to;
    const Point mid{ (s.x + e.x) * 0.5, (s.y + e.y) * 0.5 };

    Connector c;
    switch (edge.style) {
    case EdgeStyle::Straight:
        c.d = "M " + path_point(s) + " L " + path_point(e);
        c.approach_end = { s };
        c.approach_start = { e };
        break;
    case EdgeStyle::Curved: {
        const Point ctrl = a.vertical ? Point{ s.x, mid.y } : Point{ mid.x, s.y };
        c.d = "M " + path_point(s) + " Q " + path_point(ctrl) + " " + path_point(e);
        c.approach_end = { ctrl, s };
        c.approach_start = { ctrl, e };
        break;
    }
    case EdgeStyle::Orthogonal: {
        const Point bend1{ mid.x, s.y };
        const Point bend2{ mid.x, e.y };
        c.d = "M " + path_point(s) + " L " + path_point(bend1) + " L " + path_point(bend2)
            + " L " + path_point(e);
        c.approach_end = { bend2, bend1, s };
        c.approach_start = { bend1, bend2, e };
        break;
    }
    }
    return c;
}

void write_arrowhead(std::string& out, Point tip, const std::vector<Point>& approach, const std::string& color) {
    auto from = std::find_if(approach.begin(), approach.end(),
        [tip](Point p) { return p.x != tip.x || p.y != tip.y; });
    if (from == approach.end()) return;

    const double dx = tip.x - from->x;
    const double dy = tip.y - from->y;
    const double len = std::sqrt(dx * dx + dy * dy);
    const double ux = dx / len;
    const double uy = dy / len;

    const Point base{ tip.x - ux * render::arrow_length, tip.y - uy * render::arrow_length };
    const double hw = render::arrow_width * 0.5;
    const Point left{ base.x - uy * hw, base.y + ux * hw };
    const Point right{ base.x + uy * hw, base.y - ux * hw };

    out += "<polygon";
    append_attr(out, "points", point_text(tip) + " " + point_text(left) + " " + point_text(right));
    append_attr(out, "fill", color);
    out += "/>";
}

void write_label(std::string& out, Point at, const std::string& text, double size) {
    out += "<text";
    append_attr(out, "x", at.x);
    append_attr(out, "y", at.y);
    append_attr(out, "font-family", render::default_font_family);
    append_attr(out, "font-size", size);
    out += " text-anchor=\"middle\" dominant-baseline=\"middle\"";
    append_attr(out, "fill", render::label_fill);
    out += '>';
    out += escape_text(text);
    out += "</text>";
}

void write_edge(std::string& out, const GraphEdge& edge) {
    if (!edge.anchors) return;
    const EdgeAnchors& a = *edge.anchors;
    const Connector c = make_connector(edge, a);

    out += "<path";
    append_attr(out, "d", c.d);
    out += " fill=\"none\"";
    append_attr(out, "stroke", edge.stroke);
    append_attr(out, "stroke-width", edge.stroke_width);
    out += "/>";

    if (edge.arrow == ArrowDirection::Forward || edge.arrow == ArrowDirection::Both) {
        write_arrowhead(out, a.to, c.approach_end, edge.stroke);
    }
    if (edge.arrow == ArrowDirection::Backward || edge.arrow == ArrowDirection::Both) {
        write_arrowhead(out, a.from, c.approach_start, edge.stroke);
    }

    if (!edge.label.empty()) {
        const Point mid{ (a.from.x + a.to.x) * 0.5, (a.from.y + a.to.y) * 0.5 };
        write_label(out, mid, edge.label, render::edge_label_size);
    }
}

void write_node(std::string& out, const GraphNode& node) {
    const auto r = scene_placement::node_rect(node);

    switch (node.shape) {
    case NodeShape::Rect:
        out += "<rect";
        append_attr(out, "x", r.x);
        append_attr(out, "y", r.y);
        append_attr(out, "width", r.width);
        append_attr(out, "height", r.height);
        break;
    case NodeShape::Circle:
        out += "<circle";
        append_attr(out, "cx", r.cx());
        append_attr(out, "cy", r.cy());
        append_attr(out, "r", std::min(r.width, r.height) * 0.5);
        break;
    case NodeShape::Ellipse:
        out += "<ellipse";
        append_attr(out, "cx", r.cx());
        append_attr(out, "cy", r.cy());
        append_attr(out, "rx", r.width * 0.5);
        append_attr(out, "ry", r.height * 0.5);
        break;
    case NodeShape::Diamond:
        out += "<polygon";
        append_attr(out, "points",
            point_text({ r.cx(), r.top() }) + " " + point_text({ r.right(), r.cy() }) + " "
            + point_text({ r.cx(), r.bottom() }) + " " + point_text({ r.left(), r.cy() }));
        break;
    }

    append_attr(out, "fill", node.style.fill.value_or(render::node_fill));
    append_attr(out, "stroke", node.style.stroke.value_or(render::node_stroke));
    if (node.style.stroke_width != 1.0) append_attr(out, "stroke-width", node.style.stroke_width);
    out += "/>";

    if (!node.label.empty()) write_label(out, { r.cx(), r.cy() }, node.label, render::node_label_size);
}

} // namespace

void write_graph_content(std::string& out, const GraphProps& graph) {
    for (const auto& edge : graph.edges) write_edge(out, edge);
    for (const auto& node : graph.nodes) write_node(out, node);
}

} // namespace detail
} // namespace scene_render
