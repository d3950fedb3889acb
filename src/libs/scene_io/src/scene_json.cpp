#include <scene_io/scene_json.hpp>
#include <type_traits>
#include <variant>

namespace scene_io {

using namespace scene_model;

namespace {

nlohmann::json point_json(const Point& p) {
    return nlohmann::json::array({ p.x, p.y });
}

void put(nlohmann::json& j, const char* key, const std::optional<Point>& p) {
    if (p) j[key] = point_json(*p);
}

nlohmann::json value_json(const TokenValue& value) {
    if (const auto* d = std::get_if<double>(&value)) return *d;
    if (const auto* s = std::get_if<std::string>(&value)) return *s;
    if (const auto* p = std::get_if<Point>(&value)) return point_json(*p);
    return nullptr;
}

// Only fields that differ from their defaults.
nlohmann::json style_json(const Style& s) {
    const Style defaults;
    nlohmann::json j = nlohmann::json::object();
    if (s.fill) j["fill"] = *s.fill;
    if (s.stroke) j["stroke"] = *s.stroke;
    if (s.stroke_width != defaults.stroke_width) j["stroke_width"] = s.stroke_width;
    if (s.opacity != defaults.opacity) j["opacity"] = s.opacity;
    if (s.corner != defaults.corner) j["corner"] = s.corner;
    if (s.font) j["font"] = *s.font;
    if (s.font_size != defaults.font_size) j["font_size"] = s.font_size;
    if (s.font_weight != defaults.font_weight) j["font_weight"] = s.font_weight;
    if (s.text_anchor != defaults.text_anchor) j["text_anchor"] = s.text_anchor;
    if (s.shadow) {
        j["shadow"] = { { "x", s.shadow->x }, { "y", s.shadow->y }, { "blur", s.shadow->blur },
            { "color", s.shadow->color } };
    }
    if (s.gradient) {
        j["gradient"] = { { "type", s.gradient->kind == GradientKind::Radial ? "radial" : "linear" },
            { "from", s.gradient->from }, { "to", s.gradient->to }, { "angle", s.gradient->angle } };
    }
    return j;
}

nlohmann::json transform_json(const Transform& t) {
    nlohmann::json j = nlohmann::json::object();
    put(j, "translate", t.translate);
    if (t.rotate != 0) j["rotate"] = t.rotate;
    put(j, "scale", t.scale);
    put(j, "origin", t.origin);
    return j;
}

nlohmann::json node_json(const GraphNode& n) {
    nlohmann::json j;
    j["id"] = n.id;
    j["shape"] = node_shape_name(n.shape);
    put(j, "at", n.at);
    put(j, "size", n.size);
    if (!n.label.empty()) j["label"] = n.label;
    j["style"] = style_json(n.style);
    return j;
}

nlohmann::json edge_json(const GraphEdge& e) {
    nlohmann::json j;
    j["from"] = e.from;
    j["to"] = e.to;
    j["style"] = edge_style_name(e.style);
    j["arrow"] = arrow_direction_name(e.arrow);
    if (!e.label.empty()) j["label"] = e.label;
    j["stroke"] = e.stroke;
    j["stroke_width"] = e.stroke_width;
    return j;
}

nlohmann::json props_json(const ShapeProps& props) {
    nlohmann::json j = nlohmann::json::object();
    std::visit([&j](const auto& p) {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, RectProps>) {
            put(j, "at", p.at);
            put(j, "size", p.size);
        } else if constexpr (std::is_same_v<T, CircleProps>) {
            put(j, "at", p.at);
            if (p.radius) j["radius"] = *p.radius;
        } else if constexpr (std::is_same_v<T, EllipseProps>) {
            put(j, "at", p.at);
            put(j, "radius", p.radius);
            put(j, "size", p.size);
        } else if constexpr (std::is_same_v<T, LineProps>) {
            put(j, "from", p.from);
            put(j, "to", p.to);
        } else if constexpr (std::is_same_v<T, PathProps>) {
            j["d"] = p.d;
        } else if constexpr (std::is_same_v<T, PolygonProps>) {
            j["points"] = nlohmann::json::array();
            for (const auto& pt : p.points) j["points"].push_back(point_json(pt));
        } else if constexpr (std::is_same_v<T, TextProps>) {
            put(j, "at", p.at);
            j["content"] = p.content;
        } else if constexpr (std::is_same_v<T, ImageProps>) {
            put(j, "at", p.at);
            put(j, "size", p.size);
            j["href"] = p.href;
        } else if constexpr (std::is_same_v<T, GroupProps>) {
            if (!p.name.empty()) j["name"] = p.name;
        } else if constexpr (std::is_same_v<T, LayoutProps>) {
            j["direction"] = direction_name(p.direction);
            j["gap"] = p.gap;
            put(j, "at", p.at);
            put(j, "size", p.size);
            j["justify"] = justify_name(p.justify);
            j["align"] = align_name(p.align);
            if (p.wrap) j["wrap"] = true;
            const Padding& pad = p.padding;
            if (pad.top != 0 || pad.right != 0 || pad.bottom != 0 || pad.left != 0) {
                j["padding"] = nlohmann::json::array({ pad.top, pad.right, pad.bottom, pad.left });
            }
        } else if constexpr (std::is_same_v<T, SymbolProps>) {
            j["id"] = p.id;
            if (p.viewbox) {
                j["viewbox"] = nlohmann::json::array({ p.viewbox->x, p.viewbox->y, p.viewbox->width, p.viewbox->height });
            }
        } else if constexpr (std::is_same_v<T, UseProps>) {
            j["id"] = p.id;
            put(j, "at", p.at);
            put(j, "size", p.size);
        } else if constexpr (std::is_same_v<T, GraphProps>) {
            j["layout"] = graph_layout_name(p.layout);
            j["direction"] = direction_name(p.direction);
            j["spacing"] = p.spacing;
            j["nodes"] = nlohmann::json::array();
            for (const auto& n : p.nodes) j["nodes"].push_back(node_json(n));
            j["edges"] = nlohmann::json::array();
            for (const auto& e : p.edges) j["edges"].push_back(edge_json(e));
        }
    }, props);
    return j;
}

} // namespace

nlohmann::json shape_to_json(const Shape& shape) {
    nlohmann::json j;
    j["type"] = "shape";
    j["kind"] = shape_kind_name(shape.kind);
    j["props"] = props_json(shape.props);
    if (shape.width) j["width"] = *shape.width;
    j["style"] = style_json(shape.style);
    j["transform"] = transform_json(shape.transform);
    j["children"] = nlohmann::json::array();
    for (const auto& child : shape.children) j["children"].push_back(shape_to_json(child));
    return j;
}

nlohmann::json scene_to_json(const Scene& scene) {
    nlohmann::json statements = nlohmann::json::array();
    for (const auto& statement : scene.statements) {
        if (const auto* canvas = std::get_if<Canvas>(&statement)) {
            statements.push_back({ { "type", "canvas" }, { "size", canvas_size_name(canvas->size) },
                { "fill", canvas->fill } });
        } else if (const auto* binding = std::get_if<VariableBinding>(&statement)) {
            nlohmann::json j;
            j["type"] = "variable";
            j["name"] = binding->name;
            j["value"] = binding->value ? value_json(*binding->value) : nlohmann::json(nullptr);
            statements.push_back(std::move(j));
        } else if (const auto* shape = std::get_if<Shape>(&statement)) {
            statements.push_back(shape_to_json(*shape));
        }
    }
    return { { "statements", std::move(statements) } };
}

} // namespace scene_io
