#pragma once

#include <scene_eval/evaluator.hpp>
#include <scene_model/ast.hpp>
#include <scene_model/canvas.hpp>
#include <scene_model/errors.hpp>
#include <scene_model/resources.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace scene_render {

// First pass: shape markup plus the gradients and shadows it references.
// Symbol markup is kept apart for <defs>.
struct ShapePass {
    std::string markup;
    scene_model::ResourceRegistry resources;
    std::string symbols;
};

// Throws std::runtime_error when nesting exceeds render::max_nesting_depth.
ShapePass serialize_shapes(const std::vector<scene_model::Shape>& shapes);

// Second pass: the <defs> block for a registry followed by symbol markup,
// empty when there is neither.
std::string serialize_definitions(const scene_model::ResourceRegistry& resources,
    std::string_view symbols = {});

struct RenderResult {
    std::string document;
    std::vector<scene_model::ErrorInfo> errors; // scene errors plus render errors
    scene_model::ResourceRegistry resources;
    bool fallback = false;
};

// Serializes the scene. A failure is recorded as a render error and the
// document is replaced by render_error_document().
RenderResult render_scene(const scene_eval::SceneState& state);

// Canvas-sized document that shows the escaped message.
std::string render_error_document(const scene_model::Canvas& canvas, std::string_view message);

} // namespace scene_render
