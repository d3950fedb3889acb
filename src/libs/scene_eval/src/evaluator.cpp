#include <scene_eval/evaluator.hpp>
#include <scene_model/log.hpp>
#include <scene_placement/edge_anchors.hpp>
#include <scene_placement/graph_placer.hpp>
#include <scene_placement/layout_placer.hpp>
#include <exception>
#include <unordered_set>

namespace scene_eval {

using namespace scene_model;

namespace {

void collect_symbols(const Shape& shape, std::vector<const SymbolProps*>& symbols,
    std::vector<const UseProps*>& uses)
{
    if (const auto* symbol = props_if<SymbolProps>(shape)) symbols.push_back(symbol);
    else if (const auto* use = props_if<UseProps>(shape)) uses.push_back(use);
    for (const auto& child : shape.children) collect_symbols(child, symbols, uses);
}

} // namespace

SceneState Evaluator::evaluate(const Scene& scene, std::vector<ErrorInfo> parse_errors) {
    errors_ = std::move(parse_errors);
    SceneState state;

    for (const auto& statement : scene.statements) {
        if (const auto* canvas = std::get_if<Canvas>(&statement)) {
            state.canvas = *canvas;
            continue;
        }
        const auto* source = std::get_if<Shape>(&statement);
        if (!source) continue;

        try {
            Shape shape = *source;
            resolve_shape(shape);
            state.shapes.push_back(std::move(shape));
        } catch (const std::exception& ex) {
            ErrorInfo e;
            e.code = ErrorCode::EvalInvalidShape;
            e.message = std::string("Failed to evaluate ") + shape_kind_name(source->kind) + ": " + ex.what();
            e.recovery = RecoveryAction::Skip;
            errors_.push_back(std::move(e));
            pipeline_logger()->warn("evaluation: {}", errors_.back().message);
        }
    }

    check_symbols(state.shapes);

    pipeline_logger()->debug("evaluation: canvas={} shapes={} errors={}",
        canvas_size_name(state.canvas.size), state.shapes.size(), errors_.size());
    state.errors = std::move(errors_);
    errors_.clear();
    return state;
}

// Children first, so a layout measures and moves content that is already
// in place relative to itself.
void Evaluator::resolve_shape(Shape& shape) {
    for (auto& child : shape.children) resolve_shape(child);

    if (auto* graph = props_if<GraphProps>(shape)) {
        resolve_graph(*graph);
    } else if (shape.kind == ShapeKind::Layout) {
        scene_placement::place_layout_children(shape);
    }
}

void Evaluator::resolve_graph(GraphProps& graph) {
    std::unordered_set<std::string> seen;
    std::vector<GraphNode> unique;
    unique.reserve(graph.nodes.size());
    for (auto& node : graph.nodes) {
        if (seen.insert(node.id).second) {
            unique.push_back(std::move(node));
            continue;
        }
        warn(ErrorCode::EvalInvalidShape, "Duplicate graph node '" + node.id + "' ignored");
    }
    graph.nodes = std::move(unique);

    scene_placement::place_graph_nodes(graph);
    const std::size_t dropped = scene_placement::route_graph_edges(graph);
    if (dropped > 0) pipeline_logger()->debug("evaluation: dropped {} edge(s) with unknown endpoints", dropped);
}

// Symbols may be used before they are defined, so this runs over the
// whole scene. The first definition of an id wins.
void Evaluator::check_symbols(const std::vector<Shape>& shapes) {
    std::vector<const SymbolProps*> symbols;
    std::vector<const UseProps*> uses;
    for (const auto& shape : shapes) collect_symbols(shape, symbols, uses);

    std::unordered_set<std::string> defined;
    for (const auto* symbol : symbols) {
        if (symbol->id.empty() || defined.insert(symbol->id).second) continue;
        warn(ErrorCode::EvalInvalidShape, "Duplicate symbol '" + symbol->id + "' ignored");
    }
    for (const auto* use : uses) {
        if (use->id.empty() || defined.count(use->id) > 0) continue;
        warn(ErrorCode::EvalMissingProperty, "Symbol '" + use->id + "' is not defined");
    }
}

void Evaluator::warn(ErrorCode code, std::string message) {
    ErrorInfo e;
    e.code = code;
    e.message = std::move(message);
    e.severity = Severity::Warning;
    e.recovery = RecoveryAction::Skip;
    errors_.push_back(std::move(e));
}

SceneState evaluate_scene(const Scene& scene, std::vector<ErrorInfo> parse_errors) {
    Evaluator evaluator;
    return evaluator.evaluate(scene, std::move(parse_errors));
}

} // namespace scene_eval
