#include <scene_model/ast.hpp>

namespace scene_model {

const char* shape_kind_name(ShapeKind kind) {
    switch (kind) {
    case ShapeKind::Rect: return "rect";
    case ShapeKind::Circle: return "circle";
    case ShapeKind::Ellipse: return "ellipse";
    case ShapeKind::Line: return "line";
    case ShapeKind::Path: return "path";
    case ShapeKind::Polygon: return "polygon";
    case ShapeKind::Text: return "text";
    case ShapeKind::Image: return "image";
    case ShapeKind::Group: return "group";
    case ShapeKind::Layout: return "layout";
    case ShapeKind::Graph: return "graph";
    case ShapeKind::Symbol: return "symbol";
    case ShapeKind::Use: return "use";
    }
    return "unknown";
}

std::optional<ShapeKind> shape_kind_from_keyword(std::string_view keyword) {
    if (keyword == "rect") return ShapeKind::Rect;
    if (keyword == "circle") return ShapeKind::Circle;
    if (keyword == "ellipse") return ShapeKind::Ellipse;
    if (keyword == "line") return ShapeKind::Line;
    if (keyword == "path") return ShapeKind::Path;
    if (keyword == "polygon") return ShapeKind::Polygon;
    if (keyword == "text") return ShapeKind::Text;
    if (keyword == "image") return ShapeKind::Image;
    if (keyword == "graph") return ShapeKind::Graph;
    if (keyword == "use") return ShapeKind::Use;
    return std::nullopt;
}

const char* direction_name(Direction direction) {
    return direction == Direction::Horizontal ? "horizontal" : "vertical";
}

const char* graph_layout_name(GraphLayout layout) {
    switch (layout) {
    case GraphLayout::Manual: return "manual";
    case GraphLayout::Hierarchical: return "hierarchical";
    case GraphLayout::Grid: return "grid";
    }
    return "manual";
}

const char* node_shape_name(NodeShape shape) {
    switch (shape) {
    case NodeShape::Rect: return "rect";
    case NodeShape::Circle: return "circle";
    case NodeShape::Ellipse: return "ellipse";
    case NodeShape::Diamond: return "diamond";
    }
    return "rect";
}

const char* edge_style_name(EdgeStyle style) {
    switch (style) {
    case EdgeStyle::Straight: return "straight";
    case EdgeStyle::Curved: return "curved";
    case EdgeStyle::Orthogonal: return "orthogonal";
    }
    return "straight";
}

const char* arrow_direction_name(ArrowDirection arrow) {
    switch (arrow) {
    case ArrowDirection::None: return "none";
    case ArrowDirection::Forward: return "forward";
    case ArrowDirection::Backward: return "backward";
    case ArrowDirection::Both: return "both";
    }
    return "forward";
}

const char* justify_name(Justify justify) {
    switch (justify) {
    case Justify::Start: return "start";
    case Justify::End: return "end";
    case Justify::Center: return "center";
    case Justify::SpaceBetween: return "space-between";
    case Justify::SpaceAround: return "space-around";
    case Justify::SpaceEvenly: return "space-evenly";
    }
    return "start";
}

const char* align_name(Align align) {
    switch (align) {
    case Align::Start: return "start";
    case Align::End: return "end";
    case Align::Center: return "center";
    case Align::Stretch: return "stretch";
    case Align::Baseline: return "baseline";
    }
    return "start";
}

std::optional<GraphLayout> parse_graph_layout(std::string_view name) {
    if (name == "manual") return GraphLayout::Manual;
    if (name == "hierarchical") return GraphLayout::Hierarchical;
    if (name == "grid") return GraphLayout::Grid;
    return std::nullopt;
}

std::optional<NodeShape> parse_node_shape(std::string_view name) {
    if (name == "rect") return NodeShape::Rect;
    if (name == "circle") return NodeShape::Circle;
    if (name == "ellipse") return NodeShape::Ellipse;
    if (name == "diamond") return NodeShape::Diamond;
    return std::nullopt;
}

std::optional<EdgeStyle> parse_edge_style(std::string_view name) {
    if (name == "straight") return EdgeStyle::Straight;
    if (name == "curved") return EdgeStyle::Curved;
    if (name == "orthogonal") return EdgeStyle::Orthogonal;
    return std::nullopt;
}

std::optional<ArrowDirection> parse_arrow_direction(std::string_view name) {
    if (name == "none") return ArrowDirection::None;
    if (name == "forward") return ArrowDirection::Forward;
    if (name == "backward") return ArrowDirection::Backward;
    if (name == "both") return ArrowDirection::Both;
    return std::nullopt;
}

std::optional<Justify> parse_justify(std::string_view name) {
    if (name == "start") return Justify::Start;
    if (name == "end") return Justify::End;
    if (name == "center") return Justify::Center;
    if (name == "space-between") return Justify::SpaceBetween;
    if (name == "space-around") return Justify::SpaceAround;
    if (name == "space-evenly") return Justify::SpaceEvenly;
    return std::nullopt;
}

std::optional<Align> parse_align(std::string_view name) {
    if (name == "start") return Align::Start;
    if (name == "end") return Align::End;
    if (name == "center") return Align::Center;
    if (name == "stretch") return Align::Stretch;
    if (name == "baseline") return Align::Baseline;
    return std::nullopt;
}

} // namespace scene_model
