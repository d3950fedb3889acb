#include <scene_io/error_json.hpp>

namespace scene_io {

nlohmann::json error_to_json(const scene_model::ErrorInfo& error) {
    nlohmann::json j;
    j["code"] = scene_model::code_value(error.code);
    j["category"] = scene_model::category_name(error.category());
    j["message"] = error.message;
    j["line"] = error.line;
    j["column"] = error.column;
    j["severity"] = scene_model::severity_name(error.severity);
    if (error.context) j["context"] = *error.context;
    return j;
}

nlohmann::json errors_to_json(const std::vector<scene_model::ErrorInfo>& errors, bool include_warnings) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& e : errors) {
        const bool minor = e.severity == scene_model::Severity::Info || e.severity == scene_model::Severity::Warning;
        if (minor && !include_warnings) continue;
        out.push_back(error_to_json(e));
    }
    return out;
}

} // namespace scene_io
