#pragma once

#include <scene_model/types.hpp>
#include <string>
#include <string_view>
#include <variant>

namespace scene_model {

enum class TokenKind {
    Number,
    String,
    Pair,
    Color,
    Identifier,
    VariableRef,
    Indent,
    Dedent,
    Newline,
    EndOfInput,
    LeftBracket,
    RightBracket,
    Colon,
    Equals,
    Arrow
};

// Literal payload. Structural tokens carry std::monostate.
// Number -> double, Pair -> Point, all text kinds -> std::string.
using TokenValue = std::variant<std::monostate, double, std::string, Point>;

struct Token {
    TokenKind kind = TokenKind::EndOfInput;
    TokenValue value;
    int line = 1;
    int column = 1;

    bool is(TokenKind k) const { return kind == k; }
    bool is_identifier(std::string_view name) const;

    double number() const;
    const std::string& text() const;
    Point pair() const;
};

const char* token_kind_name(TokenKind kind);

// Canonical text of a literal value: numbers in shortest form, pairs as "x,y".
std::string value_to_text(const TokenValue& value);

// Shortest round-trip formatting in fixed notation, used for markup and
// messages ("10", "0.5", "0.00001").
std::string format_number(double value);

} // namespace scene_model
