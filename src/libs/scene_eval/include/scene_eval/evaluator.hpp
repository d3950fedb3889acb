#pragma once

#include <scene_model/ast.hpp>
#include <scene_model/canvas.hpp>
#include <scene_model/errors.hpp>
#include <scene_model/resources.hpp>
#include <string>
#include <vector>

namespace scene_eval {

struct SceneState {
    scene_model::Canvas canvas;
    std::vector<scene_model::Shape> shapes;
    std::vector<scene_model::ErrorInfo> errors;
    // Filled by rendering; empty after evaluation.
    scene_model::ResourceRegistry resources;
};

// Walks a parsed scene in document order. Canvas statements replace the
// canvas, shapes are appended with stack/row children and graph nodes
// placed and edges anchored, variable statements are already resolved.
// Duplicate symbol ids and uses of unknown symbols are reported as warnings.
class Evaluator {
public:
    SceneState evaluate(const scene_model::Scene& scene,
        std::vector<scene_model::ErrorInfo> parse_errors = {});

private:
    void resolve_shape(scene_model::Shape& shape);
    void resolve_graph(scene_model::GraphProps& graph);
    void check_symbols(const std::vector<scene_model::Shape>& shapes);
    void warn(scene_model::ErrorCode code, std::string message);

    std::vector<scene_model::ErrorInfo> errors_;
};

SceneState evaluate_scene(const scene_model::Scene& scene,
    std::vector<scene_model::ErrorInfo> parse_errors = {});

} // namespace scene_eval
