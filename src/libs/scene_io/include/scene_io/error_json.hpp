#pragma once

#include <scene_model/errors.hpp>
#include <nlohmann/json.hpp>
#include <vector>

namespace scene_io {

// {code, category, message, line, column, severity, context?}
nlohmann::json error_to_json(const scene_model::ErrorInfo& error);

// Info and warning records are dropped unless include_warnings is set.
nlohmann::json errors_to_json(const std::vector<scene_model::ErrorInfo>& errors, bool include_warnings = true);

} // namespace scene_io
