#pragma once

#include <scene_model/ast.hpp>
#include <optional>
#include <string>
#include <vector>

namespace dsl_parser {

// Everything a shape line and its block may set, before the kind decides
// which fields it keeps.
struct RawShapeProps {
    std::optional<scene_model::Point> at;
    std::optional<scene_model::Point> size;
    std::optional<scene_model::Point> from;
    std::optional<scene_model::Point> to;
    std::optional<double> radius;
    std::optional<scene_model::Point> radius_pair;
    std::optional<double> width;
    std::optional<std::string> content;
    std::optional<std::string> d;
    std::optional<std::string> href;
    std::vector<scene_model::Point> points;
};

// Builds the closed per-kind props for a primitive or graph kind.
// Path falls back to the unlabeled string when no "d" was given.
scene_model::ShapeProps build_props(scene_model::ShapeKind kind, const RawShapeProps& raw);

} // namespace dsl_parser
