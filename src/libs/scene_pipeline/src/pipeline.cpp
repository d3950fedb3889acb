#include <scene_pipeline/pipeline.hpp>
#include <dsl_lexer/lexer.hpp>
#include <dsl_parser/parser.hpp>
#include <scene_model/log.hpp>
#include <exception>

namespace scene_pipeline {

scene_eval::SceneState evaluate(std::string_view source) {
    auto log = scene_model::pipeline_logger();

    dsl_lexer::LexResult lexed = dsl_lexer::tokenize(source);
    log->debug("lexer: {} tokens, {} skipped characters", lexed.tokens.size(), lexed.skipped.size());

    dsl_parser::ParseResult parsed = dsl_parser::parse(std::move(lexed.tokens));
    log->debug("parser: {} statements, {}", parsed.scene.statements.size(),
        scene_model::error_summary(parsed.errors));

    return scene_eval::evaluate_scene(parsed.scene, std::move(parsed.errors));
}

scene_render::RenderResult render_with_errors(std::string_view source) {
    scene_eval::SceneState state = evaluate(source);
    scene_render::RenderResult result = scene_render::render_scene(state);
    scene_model::pipeline_logger()->debug("render: {} bytes, {} resources, {}",
        result.document.size(), result.resources.size(), scene_model::error_summary(result.errors));
    return result;
}

std::string render(std::string_view source) {
    try {
        return render_with_errors(source).document;
    } catch (const std::exception& ex) {
        scene_model::pipeline_logger()->error("pipeline failed: {}", ex.what());
        return scene_render::render_error_document(scene_model::Canvas{}, ex.what());
    }
}

} // namespace scene_pipeline
