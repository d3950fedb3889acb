#pragma once

#include <scene_model/ast.hpp>
#include <nlohmann/json.hpp>

namespace scene_io {

// Structural dump of a parsed scene, for inspection and tooling.
nlohmann::json scene_to_json(const scene_model::Scene& scene);
nlohmann::json shape_to_json(const scene_model::Shape& shape);

} // namespace scene_io
