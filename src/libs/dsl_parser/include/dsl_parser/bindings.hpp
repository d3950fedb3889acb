#pragma once

#include <scene_model/errors.hpp>
#include <scene_model/token.hpp>
#include <string>
#include <utility>
#include <vector>

namespace dsl_parser {

// Variables bound so far in one parse, in binding order. Rebinding a name
// replaces its value in place.
class VariableBindings {
public:
    void bind(const std::string& name, scene_model::TokenValue value);
    const scene_model::TokenValue* find(const std::string& name) const;

    std::size_t size() const { return entries_.size(); }
    const std::vector<std::pair<std::string, scene_model::TokenValue>>& entries() const { return entries_; }

private:
    std::vector<std::pair<std::string, scene_model::TokenValue>> entries_;
};

// Literal value of a token. A variable reference resolves through the
// bindings; an unknown name records UndefinedVar and yields the literal
// reference text ("$name").
scene_model::TokenValue resolve_value(const scene_model::Token& token,
    const VariableBindings& bindings,
    std::vector<scene_model::ErrorInfo>& errors);

// resolve_value() rendered as text, for colors and names.
std::string resolve_text(const scene_model::Token& token,
    const VariableBindings& bindings,
    std::vector<scene_model::ErrorInfo>& errors);

} // namespace dsl_parser
