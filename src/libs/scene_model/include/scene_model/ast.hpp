#pragma once

#include <scene_model/canvas.hpp>
#include <scene_model/token.hpp>
#include <scene_model/types.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace scene_model {

struct ShadowDef {
    double x = 0;
    double y = 4;
    double blur = 8;
    std::string color = "#0004";
};

enum class GradientKind { Linear, Radial };

struct GradientDef {
    GradientKind kind = GradientKind::Linear;
    std::string from = "#fff";
    std::string to = "#000";
    double angle = 90;
};

struct Style {
    std::optional<std::string> fill;
    std::optional<std::string> stroke;
    double stroke_width = 1.0;
    double opacity = 1.0;
    double corner = 0;
    std::optional<std::string> font;
    double font_size = 16;
    std::string font_weight = "normal";
    std::string text_anchor = "start";
    std::optional<ShadowDef> shadow;
    std::optional<GradientDef> gradient;
};

struct Transform {
    std::optional<Point> translate;
    double rotate = 0;
    std::optional<Point> scale;
    std::optional<Point> origin;

    bool empty() const { return !translate && rotate == 0 && !scale; }
};

enum class ShapeKind {
    Rect,
    Circle,
    Ellipse,
    Line,
    Path,
    Polygon,
    Text,
    Image,
    Group,
    Layout,
    Graph,
    Symbol,
    Use
};

enum class Direction { Vertical, Horizontal };

struct RectProps {
    std::optional<Point> at;
    std::optional<Point> size;
};

struct CircleProps {
    std::optional<Point> at;
    std::optional<double> radius;
};

// Radius is (rx, ry); a single number is stored as (r, r).
struct EllipseProps {
    std::optional<Point> at;
    std::optional<Point> radius;
    std::optional<Point> size;
};

struct LineProps {
    std::optional<Point> from;
    std::optional<Point> to;
};

struct PathProps {
    std::string d;
};

struct PolygonProps {
    std::vector<Point> points;
};

struct TextProps {
    std::optional<Point> at;
    std::string content;
};

struct ImageProps {
    std::optional<Point> at;
    std::optional<Point> size;
    std::string href;
};

struct GroupProps {
    std::string name;
};

// Main-axis distribution of stack/row children.
enum class Justify { Start, End, Center, SpaceBetween, SpaceAround, SpaceEvenly };

// Cross-axis alignment. Baseline places like Start.
enum class Align { Start, End, Center, Stretch, Baseline };

struct Padding {
    double top = 0;
    double right = 0;
    double bottom = 0;
    double left = 0;
};

struct LayoutProps {
    Direction direction = Direction::Vertical;
    double gap = 0;
    std::optional<Point> at;
    // Container box; without it the box is the children's own extent.
    std::optional<Point> size;
    Justify justify = Justify::Start;
    Align align = Align::Start;
    bool wrap = false;
    Padding padding;
};

struct ViewBox {
    double x = 0;
    double y = 0;
    double width = 0;
    double height = 0;
};

// Reusable content. Written once into <defs> and drawn only through Use;
// its children keep their own coordinate space.
struct SymbolProps {
    std::string id;
    std::optional<ViewBox> viewbox;
};

struct UseProps {
    std::string id;
    std::optional<Point> at;
    std::optional<Point> size;
};

enum class GraphLayout { Manual, Hierarchical, Grid };
enum class NodeShape { Rect, Circle, Ellipse, Diamond };
enum class EdgeStyle { Straight, Curved, Orthogonal };
enum class ArrowDirection { None, Forward, Backward, Both };

struct GraphNode {
    std::string id;
    NodeShape shape = NodeShape::Rect;
    std::optional<Point> at; // center
    std::optional<Point> size;
    std::string label;
    Style style;
};

// Resolved connector endpoints, filled in by the evaluator.
struct EdgeAnchors {
    Point from;
    Point to;
    bool vertical = false; // vertical delta dominates
};

struct GraphEdge {
    std::string from;
    std::string to;
    EdgeStyle style = EdgeStyle::Straight;
    ArrowDirection arrow = ArrowDirection::Forward;
    std::string label;
    std::string stroke = "#333";
    double stroke_width = 2;
    std::optional<EdgeAnchors> anchors;
};

struct GraphProps {
    GraphLayout layout = GraphLayout::Manual;
    Direction direction = Direction::Vertical;
    double spacing = 50;
    std::vector<GraphNode> nodes;
    std::vector<GraphEdge> edges;
};

using ShapeProps = std::variant<
    RectProps,
    CircleProps,
    EllipseProps,
    LineProps,
    PathProps,
    PolygonProps,
    TextProps,
    ImageProps,
    GroupProps,
    LayoutProps,
    GraphProps,
    SymbolProps,
    UseProps>;

struct Shape {
    ShapeKind kind = ShapeKind::Rect;
    ShapeProps props;
    Style style;
    Transform transform;
    std::optional<double> width; // unlabeled number that did not fill a radius
    std::vector<Shape> children;
};

struct VariableBinding {
    std::string name;
    std::optional<TokenValue> value;
};

using Statement = std::variant<Canvas, VariableBinding, Shape>;

struct Scene {
    std::vector<Statement> statements;
};

const char* shape_kind_name(ShapeKind kind);
// Primitive keywords plus "graph" and "use"; group/stack/row/symbol are
// dispatched separately.
std::optional<ShapeKind> shape_kind_from_keyword(std::string_view keyword);

const char* direction_name(Direction direction);
const char* graph_layout_name(GraphLayout layout);
const char* node_shape_name(NodeShape shape);
const char* edge_style_name(EdgeStyle style);
const char* arrow_direction_name(ArrowDirection arrow);
const char* justify_name(Justify justify);
const char* align_name(Align align);

std::optional<GraphLayout> parse_graph_layout(std::string_view name);
std::optional<NodeShape> parse_node_shape(std::string_view name);
std::optional<EdgeStyle> parse_edge_style(std::string_view name);
std::optional<ArrowDirection> parse_arrow_direction(std::string_view name);
std::optional<Justify> parse_justify(std::string_view name);
std::optional<Align> parse_align(std::string_view name);

// nullptr when the shape holds another kind's props.
template <typename Props>
Props* props_if(Shape& shape) {
    return std::get_if<Props>(&shape.props);
}

template <typename Props>
const Props* props_if(const Shape& shape) {
    return std::get_if<Props>(&shape.props);
}

} // namespace scene_model
