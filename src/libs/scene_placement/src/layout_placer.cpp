#include <scene_placement/layout_placer.hpp>
#include <scene_placement/layout_constants.hpp>
#include <algorithm>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace scene_placement {

using namespace scene_model;

namespace {

std::size_t count_code_points(const std::string& text) {
    std::size_t n = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) ++n;
    }
    return n;
}

Point moved(const std::optional<Point>& p, Point fallback, double dx, double dy) {
    const Point base = p.value_or(fallback);
    return { base.x + dx, base.y + dy };
}

double main_of(const Extent& e, bool vertical) { return vertical ? e.height : e.width; }
double cross_of(const Extent& e, bool vertical) { return vertical ? e.width : e.height; }

// Children [begin, end) laid out along one line of the main axis.
struct LayoutLine {
    std::size_t begin = 0;
    std::size_t end = 0;
    double main = 0; // extents plus gaps
    double cross = 0; // largest cross extent
};

// A new line starts when the next child would pass the limit; without a
// limit every child shares one line.
std::vector<LayoutLine> break_lines(const std::vector<Extent>& extents, bool vertical, double gap,
    std::optional<double> limit)
{
    std::vector<LayoutLine> lines;
    LayoutLine line;
    for (std::size_t i = 0; i < extents.size(); ++i) {
        const double main = main_of(extents[i], vertical);
        if (limit && line.end > line.begin && line.main + gap + main > *limit) {
            lines.push_back(line);
            line = LayoutLine{ i, i };
        }
        if (line.end > line.begin) line.main += gap;
        line.main += main;
        line.cross = std::max(line.cross, cross_of(extents[i], vertical));
        line.end = i + 1;
    }
    if (line.end > line.begin) lines.push_back(line);
    return lines;
}

std::vector<Extent> measure_children(const Shape& shape) {
    std::vector<Extent> extents;
    extents.reserve(shape.children.size());
    for (const auto& child : shape.children) extents.push_back(measure_shape(child));
    return extents;
}

Extent measure_layout(const Shape& shape, const LayoutProps& props) {
    if (props.size) return { props.size->x, props.size->y };

    const bool vertical = props.direction == Direction::Vertical;
    const auto lines = break_lines(measure_children(shape), vertical, props.gap, std::nullopt);
    const LayoutLine line = lines.empty() ? LayoutLine{} : lines.front();
    const Padding& pad = props.padding;
    if (vertical) return { line.cross + pad.left + pad.right, line.main + pad.top + pad.bottom };
    return { line.main + pad.left + pad.right, line.cross + pad.top + pad.bottom };
}

// Offset of the first child and extra space after each one.
std::pair<double, double> distribute(Justify justify, double remaining, std::size_t count) {
    switch (justify) {
    case Justify::Start:
        break;
    case Justify::End:
        return { remaining, 0 };
    case Justify::Center:
        return { remaining / 2, 0 };
    case Justify::SpaceBetween:
        if (count > 1) return { 0, remaining / static_cast<double>(count - 1) };
        break;
    case Justify::SpaceAround: {
        const double space = remaining / static_cast<double>(count);
        return { space / 2, space };
    }
    case Justify::SpaceEvenly: {
        const double space = remaining / static_cast<double>(count + 1);
        return { space, space };
    }
    }
    return { 0, 0 };
}

double align_offset(Align align, double cross_size, double child_cross) {
    switch (align) {
    case Align::End: return cross_size - child_cross;
    case Align::Center: return (cross_size - child_cross) / 2;
    default: return 0;
    }
}

// Only shapes with a size box stretch.
void stretch_cross(Shape& shape, const Extent& extent, double cross_size, bool vertical) {
    std::optional<Point>* size = nullptr;
    if (auto* p = props_if<RectProps>(shape)) size = &p->size;
    else if (auto* p = props_if<ImageProps>(shape)) size = &p->size;
    if (!size) return;

    Point s = size->value_or(Point{ extent.width, extent.height });
    if (vertical) s.x = cross_size;
    else s.y = cross_size;
    *size = s;
}

} // namespace

Extent measure_shape(const Shape& shape) {
    const Extent placeholder{ layout::placeholder_extent, layout::placeholder_extent };

    if (const auto* p = props_if<RectProps>(shape)) {
        if (p->size) return { p->size->x, p->size->y };
    } else if (const auto* p = props_if<ImageProps>(shape)) {
        if (p->size) return { p->size->x, p->size->y };
    } else if (const auto* p = props_if<EllipseProps>(shape)) {
        if (p->size) return { p->size->x, p->size->y };
        if (p->radius) return { p->radius->x * 2, p->radius->y * 2 };
    } else if (const auto* p = props_if<CircleProps>(shape)) {
        if (p->radius) return { *p->radius * 2, *p->radius * 2 };
    } else if (const auto* p = props_if<TextProps>(shape)) {
        const double chars = static_cast<double>(count_code_points(p->content));
        return { chars * shape.style.font_size * layout::glyph_width_factor,
            shape.style.font_size * layout::line_height_factor };
    } else if (const auto* p = props_if<LayoutProps>(shape)) {
        return measure_layout(shape, *p);
    } else if (const auto* p = props_if<UseProps>(shape)) {
        if (p->size) return { p->size->x, p->size->y };
    } else if (props_if<SymbolProps>(shape)) {
        return {};
    }
    return placeholder;
}

void shift_shape(Shape& shape, double dx, double dy) {
    if (dx == 0 && dy == 0) return;
    if (props_if<SymbolProps>(shape)) return;

    std::visit([&](auto& p) {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, LineProps>) {
            p.from = moved(p.from, layout::default_line_from, dx, dy);
            p.to = moved(p.to, layout::default_line_to, dx, dy);
        } else if constexpr (std::is_same_v<T, PathProps>) {
            shape.transform.translate = moved(shape.transform.translate, Point{}, dx, dy);
        } else if constexpr (std::is_same_v<T, PolygonProps>) {
            for (auto& pt : p.points) {
                pt.x += dx;
                pt.y += dy;
            }
        } else if constexpr (std::is_same_v<T, GroupProps> || std::is_same_v<T, SymbolProps>) {
            // Groups have no position of their own.
        } else if constexpr (std::is_same_v<T, GraphProps>) {
            for (auto& node : p.nodes) node.at = moved(node.at, Point{}, dx, dy);
            for (auto& edge : p.edges) {
                if (!edge.anchors) continue;
                edge.anchors->from.x += dx;
                edge.anchors->from.y += dy;
                edge.anchors->to.x += dx;
                edge.anchors->to.y += dy;
            }
        } else {
            p.at = moved(p.at, Point{}, dx, dy);
        }
    }, shape.props);

    for (auto& child : shape.children) shift_shape(child, dx, dy);
}

void place_layout_children(Shape& shape) {
    const auto* props = props_if<LayoutProps>(shape);
    if (!props) return;

    const bool vertical = props->direction == Direction::Vertical;
    const Padding& pad = props->padding;
    const Point at = props->at.value_or(Point{});
    const Point origin{ at.x + pad.left, at.y + pad.top };

    std::optional<Extent> box;
    if (props->size) {
        box = Extent{ std::max(0.0, props->size->x - pad.left - pad.right),
            std::max(0.0, props->size->y - pad.top - pad.bottom) };
    }
    std::optional<double> limit;
    if (props->wrap && box) limit = main_of(*box, vertical);

    const std::vector<Extent> extents = measure_children(shape);
    const std::vector<LayoutLine> lines = break_lines(extents, vertical, props->gap, limit);

    double line_offset = 0;
    for (const auto& line : lines) {
        const double main_size = box ? main_of(*box, vertical) : line.main;
        // A lone line spans the box; wrapped lines are as thick as their content.
        const double cross_size = box && lines.size() == 1 ? cross_of(*box, vertical) : line.cross;
        const auto [start, extra] = distribute(props->justify, std::max(0.0, main_size - line.main),
            line.end - line.begin);

        double offset = start;
        for (std::size_t i = line.begin; i < line.end; ++i) {
            Shape& child = shape.children[i];
            const Extent& e = extents[i];
            if (props->align == Align::Stretch) stretch_cross(child, e, cross_size, vertical);

            const double cross = line_offset + align_offset(props->align, cross_size, cross_of(e, vertical));
            if (vertical) shift_shape(child, origin.x + cross, origin.y + offset);
            else shift_shape(child, origin.x + offset, origin.y + cross);
            offset += main_of(e, vertical) + props->gap + extra;
        }
        line_offset += line.cross + props->gap;
    }
}

} // namespace scene_placement
