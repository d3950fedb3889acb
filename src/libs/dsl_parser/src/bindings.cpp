#include <dsl_parser/bindings.hpp>

namespace dsl_parser {

void VariableBindings::bind(const std::string& name, scene_model::TokenValue value) {
    for (auto& entry : entries_) {
        if (entry.first == name) {
            entry.second = std::move(value);
            return;
        }
    }
    entries_.emplace_back(name, std::move(value));
}

const scene_model::TokenValue* VariableBindings::find(const std::string& name) const {
    for (const auto& entry : entries_) {
        if (entry.first == name) return &entry.second;
    }
    return nullptr;
}

scene_model::TokenValue resolve_value(const scene_model::Token& token,
    const VariableBindings& bindings,
    std::vector<scene_model::ErrorInfo>& errors)
{
    if (token.kind != scene_model::TokenKind::VariableRef) return token.value;

    const std::string& name = token.text();
    if (const auto* value = bindings.find(name)) return *value;

    scene_model::ErrorInfo e;
    e.code = scene_model::ErrorCode::ParseUndefinedVar;
    e.message = "Undefined variable '$" + name + "'";
    e.line = token.line;
    e.column = token.column;
    e.recovery = scene_model::RecoveryAction::PassThroughLiteral;
    errors.push_back(std::move(e));
    return std::string("$" + name);
}

std::string resolve_text(const scene_model::Token& token,
    const VariableBindings& bindings,
    std::vector<scene_model::ErrorInfo>& errors)
{
    return scene_model::value_to_text(resolve_value(token, bindings, errors));
}

} // namespace dsl_parser
