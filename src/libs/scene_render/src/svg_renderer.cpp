#include <scene_render/svg_renderer.hpp>
#include <scene_render/render_constants.hpp>
#include <scene_placement/layout_constants.hpp>
#include <scene_model/log.hpp>
#include "markup.hpp"
#include <exception>
#include <stdexcept>
#include <unordered_set>

namespace scene_render {

using namespace scene_model;
using detail::append_attr;
namespace layout = scene_placement::layout;

namespace {

class ShapeSerializer {
public:
    ShapePass run(const std::vector<Shape>& shapes) {
        for (const auto& shape : shapes) write_shape(shape, 0);
        return { std::move(out_), std::move(resources_), std::move(symbols_) };
    }

private:
    void write_shape(const Shape& shape, int depth);
    void write_children(const Shape& shape, int depth);
    void write_style(const Style& style, const char* default_fill = nullptr, const char* default_stroke = nullptr);
    void write_transform(const Transform& transform);
    void write_symbol(const Shape& shape, const SymbolProps& props, int depth);

    std::string out_;
    ResourceRegistry resources_;
    std::string symbols_;
    std::unordered_set<std::string> symbol_ids_;
};

// Gradient registers before shadow so a shape's ids stay in that order.
void ShapeSerializer::write_style(const Style& style, const char* default_fill, const char* default_stroke) {
    if (style.gradient) {
        append_attr(out_, "fill", "url(#" + resources_.register_gradient(*style.gradient) + ")");
    } else if (style.fill) {
        append_attr(out_, "fill", *style.fill);
    } else if (default_fill) {
        append_attr(out_, "fill", default_fill);
    }

    if (style.stroke) append_attr(out_, "stroke", *style.stroke);
    else if (default_stroke) append_attr(out_, "stroke", default_stroke);
    if (style.stroke_width != 1.0) append_attr(out_, "stroke-width", style.stroke_width);
    if (style.opacity < 1.0) append_attr(out_, "opacity", style.opacity);

    if (style.shadow) {
        append_attr(out_, "filter", "url(#" + resources_.register_shadow(*style.shadow) + ")");
    }
}

void ShapeSerializer::write_transform(const Transform& t) {
    std::string value;
    auto add = [&value](const std::string& part) {
        if (!value.empty()) value += ' ';
        value += part;
    };

    if (t.translate) add("translate(" + format_number(t.translate->x) + "," + format_number(t.translate->y) + ")");
    if (t.rotate != 0) {
        if (t.origin) {
            add("rotate(" + format_number(t.rotate) + "," + format_number(t.origin->x) + ","
                + format_number(t.origin->y) + ")");
        } else {
            add("rotate(" + format_number(t.rotate) + ")");
        }
    }
    if (t.scale) add("scale(" + format_number(t.scale->x) + "," + format_number(t.scale->y) + ")");

    if (!value.empty()) append_attr(out_, "transform", value);
}

void ShapeSerializer::write_children(const Shape& shape, int depth) {
    for (const auto& child : shape.children) write_shape(child, depth + 1);
}

// Written in place, then moved from the markup to the symbol buffer.
// Later definitions of an id are dropped.
void ShapeSerializer::write_symbol(const Shape& shape, const SymbolProps& props, int depth) {
    if (props.id.empty() || !symbol_ids_.insert(props.id).second) return;

    const std::size_t start = out_.size();
    out_ += "<symbol";
    append_attr(out_, "id", props.id);
    if (props.viewbox) {
        const ViewBox& v = *props.viewbox;
        append_attr(out_, "viewBox", format_number(v.x) + " " + format_number(v.y) + " "
            + format_number(v.width) + " " + format_number(v.height));
    }
    write_style(shape.style);
    out_ += '>';
    write_children(shape, depth);
    out_ += "</symbol>";

    symbols_.append(out_, start, std::string::npos);
    out_.resize(start);
}

void ShapeSerializer::write_shape(const Shape& shape, int depth) {
    if (depth > render::max_nesting_depth) {
        throw std::runtime_error("maximum nesting depth exceeded");
    }

    switch (shape.kind) {
    case ShapeKind::Rect: {
        const auto* p = props_if<RectProps>(shape);
        const Point at = p && p->at ? *p->at : Point{};
        const Point size = p && p->size ? *p->size : layout::default_rect_size;
        out_ += "<rect";
        append_attr(out_, "x", at.x);
        append_attr(out_, "y", at.y);
        append_attr(out_, "width", size.x);
        append_attr(out_, "height", size.y);
        if (shape.style.corner != 0) append_attr(out_, "rx", shape.style.corner);
        write_style(shape.style);
        write_transform(shape.transform);
        out_ += "/>";
        break;
    }
    case ShapeKind::Circle: {
        const auto* p = props_if<CircleProps>(shape);
        const Point at = p && p->at ? *p->at : Point{};
        out_ += "<circle";
        append_attr(out_, "cx", at.x);
        append_attr(out_, "cy", at.y);
        append_attr(out_, "r", p && p->radius ? *p->radius : layout::default_circle_radius);
        write_style(shape.style);
        write_transform(shape.transform);
        out_ += "/>";
        break;
    }
    case ShapeKind::Ellipse: {
        const auto* p = props_if<EllipseProps>(shape);
        const Point at = p && p->at ? *p->at : Point{};
        Point radius = layout::default_ellipse_radius;
        if (p && p->radius) radius = *p->radius;
        else if (p && p->size) radius = *p->size;
        out_ += "<ellipse";
        append_attr(out_, "cx", at.x);
        append_attr(out_, "cy", at.y);
        append_attr(out_, "rx", radius.x);
        append_attr(out_, "ry", radius.y);
        write_style(shape.style);
        write_transform(shape.transform);
        out_ += "/>";
        break;
    }
    case ShapeKind::Line: {
        const auto* p = props_if<LineProps>(shape);
        const Point from = p && p->from ? *p->from : layout::default_line_from;
        const Point to = p && p->to ? *p->to : layout::default_line_to;
        out_ += "<line";
        append_attr(out_, "x1", from.x);
        append_attr(out_, "y1", from.y);
        append_attr(out_, "x2", to.x);
        append_attr(out_, "y2", to.y);
        write_style(shape.style, nullptr, render::default_line_stroke);
        write_transform(shape.transform);
        out_ += "/>";
        break;
    }
    case ShapeKind::Path: {
        const auto* p = props_if<PathProps>(shape);
        out_ += "<path";
        append_attr(out_, "d", p ? p->d : std::string());
        write_style(shape.style);
        write_transform(shape.transform);
        out_ += "/>";
        break;
    }
    case ShapeKind::Polygon: {
        const auto* p = props_if<PolygonProps>(shape);
        std::string points;
        if (p) {
            for (const auto& pt : p->points) {
                if (!points.empty()) points += ' ';
                points += format_number(pt.x) + "," + format_number(pt.y);
            }
        }
        out_ += "<polygon";
        append_attr(out_, "points", points);
        write_style(shape.style);
        write_transform(shape.transform);
        out_ += "/>";
        break;
    }
    case ShapeKind::Text: {
        const auto* p = props_if<TextProps>(shape);
        const Point at = p && p->at ? *p->at : Point{};
        out_ += "<text";
        append_attr(out_, "x", at.x);
        append_attr(out_, "y", at.y);
        append_attr(out_, "font-family", shape.style.font.value_or(render::default_font_family));
        append_attr(out_, "font-size", shape.style.font_size);
        append_attr(out_, "font-weight", shape.style.font_weight);
        append_attr(out_, "text-anchor", shape.style.text_anchor);
        write_style(shape.style, render::default_text_fill);
        write_transform(shape.transform);
        out_ += '>';
        out_ += escape_text(p ? p->content : std::string());
        out_ += "</text>";
        break;
    }
    case ShapeKind::Image: {
        const auto* p = props_if<ImageProps>(shape);
        const Point at = p && p->at ? *p->at : Point{};
        const Point size = p && p->size ? *p->size : layout::default_image_size;
        out_ += "<image";
        append_attr(out_, "x", at.x);
        append_attr(out_, "y", at.y);
        append_attr(out_, "width", size.x);
        append_attr(out_, "height", size.y);
        append_attr(out_, "href", p ? p->href : std::string());
        write_style(shape.style);
        write_transform(shape.transform);
        out_ += "/>";
        break;
    }
    case ShapeKind::Group:
    case ShapeKind::Layout:
        out_ += "<g";
        write_style(shape.style);
        write_transform(shape.transform);
        out_ += '>';
        write_children(shape, depth);
        out_ += "</g>";
        break;
    case ShapeKind::Graph:
        out_ += "<g";
        write_style(shape.style);
        write_transform(shape.transform);
        out_ += '>';
        if (const auto* g = props_if<GraphProps>(shape)) detail::write_graph_content(out_, *g);
        out_ += "</g>";
        break;
    case ShapeKind::Symbol:
        if (const auto* p = props_if<SymbolProps>(shape)) write_symbol(shape, *p, depth);
        break;
    case ShapeKind::Use: {
        const auto* p = props_if<UseProps>(shape);
        const Point at = p && p->at ? *p->at : Point{};
        out_ += "<use";
        append_attr(out_, "href", "#" + (p ? p->id : std::string()));
        append_attr(out_, "x", at.x);
        append_attr(out_, "y", at.y);
        if (p && p->size) {
            append_attr(out_, "width", p->size->x);
            append_attr(out_, "height", p->size->y);
        }
        write_style(shape.style);
        write_transform(shape.transform);
        out_ += "/>";
        break;
    }
    }
}

std::string document_open(const Canvas& canvas) {
    const int px = canvas_pixels(canvas.size);
    std::string out = "<svg";
    append_attr(out, "xmlns", render::svg_namespace);
    append_attr(out, "width", px);
    append_attr(out, "height", px);
    out += '>';
    return out;
}

} // namespace

ShapePass serialize_shapes(const std::vector<Shape>& shapes) {
    ShapeSerializer serializer;
    return serializer.run(shapes);
}

std::string render_error_document(const Canvas& canvas, std::string_view message) {
    std::string out = document_open(canvas);
    out += "<rect width=\"100%\" height=\"100%\"";
    append_attr(out, "fill", render::error_background);
    out += "/><text x=\"20\" y=\"30\"";
    append_attr(out, "fill", render::error_text_fill);
    out += " font-family=\"monospace\"";
    append_attr(out, "font-size", render::error_font_size);
    out += ">Render Error: ";
    out += escape_text(message);
    out += "</text></svg>";
    return out;
}

RenderResult render_scene(const scene_eval::SceneState& state) {
    RenderResult result;
    result.errors = state.errors;

    try {
        ShapePass pass = serialize_shapes(state.shapes);
        std::string document = document_open(state.canvas);
        document += "<rect width=\"100%\" height=\"100%\"";
        append_attr(document, "fill", state.canvas.fill);
        document += "/>";
        document += serialize_definitions(pass.resources, pass.symbols);
        document += pass.markup;
        document += "</svg>";

        result.document = std::move(document);
        result.resources = std::move(pass.resources);
    } catch (const std::exception& ex) {
        pipeline_logger()->error("render failed: {}", ex.what());

        ErrorInfo e;
        e.code = ErrorCode::RenderFailed;
        e.message = std::string("Render failed: ") + ex.what();
        e.recovery = RecoveryAction::FallbackDocument;
        result.errors.push_back(std::move(e));
        result.document = render_error_document(state.canvas, ex.what());
        result.fallback = true;
    }
    return result;
}

} // namespace scene_render
