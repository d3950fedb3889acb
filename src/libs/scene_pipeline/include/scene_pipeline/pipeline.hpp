#pragma once

#include <scene_eval/evaluator.hpp>
#include <scene_render/svg_renderer.hpp>
#include <string>
#include <string_view>

namespace scene_pipeline {

// Lex, parse and evaluate. Parse and evaluation errors end up in the
// returned state.
scene_eval::SceneState evaluate(std::string_view source);

// Full pipeline with the accumulated error list.
scene_render::RenderResult render_with_errors(std::string_view source);

// Full pipeline, document only. Failures produce an error document rather
// than an exception.
std::string render(std::string_view source);

} // namespace scene_pipeline
