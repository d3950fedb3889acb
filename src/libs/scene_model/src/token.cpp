#include <scene_model/token.hpp>
#include <spdlog/fmt/fmt.h>
#include <charconv>
#include <system_error>

namespace scene_model {

namespace {

const std::string empty_text;

// Fits any finite double written out in fixed notation.
constexpr std::size_t max_fixed_chars = 1400;

} // namespace

bool Token::is_identifier(std::string_view name) const {
    if (kind != TokenKind::Identifier) return false;
    const auto* s = std::get_if<std::string>(&value);
    return s && *s == name;
}

double Token::number() const {
    if (const auto* d = std::get_if<double>(&value)) return *d;
    return 0;
}

const std::string& Token::text() const {
    if (const auto* s = std::get_if<std::string>(&value)) return *s;
    return empty_text;
}

Point Token::pair() const {
    if (const auto* p = std::get_if<Point>(&value)) return *p;
    return {};
}

const char* token_kind_name(TokenKind kind) {
    switch (kind) {
    case TokenKind::Number: return "NUMBER";
    case TokenKind::String: return "STRING";
    case TokenKind::Pair: return "PAIR";
    case TokenKind::Color: return "COLOR";
    case TokenKind::Identifier: return "IDENT";
    case TokenKind::VariableRef: return "VAR";
    case TokenKind::Indent: return "INDENT";
    case TokenKind::Dedent: return "DEDENT";
    case TokenKind::Newline: return "NEWLINE";
    case TokenKind::EndOfInput: return "EOF";
    case TokenKind::LeftBracket: return "LBRACKET";
    case TokenKind::RightBracket: return "RBRACKET";
    case TokenKind::Colon: return "COLON";
    case TokenKind::Equals: return "EQUALS";
    case TokenKind::Arrow: return "ARROW";
    }
    return "UNKNOWN";
}

// Shortest round-trip digits, never in exponent form.
std::string format_number(double value) {
    if (value == 0) return "0"; // folds -0
    char buf[max_fixed_chars];
    const auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), value, std::chars_format::fixed);
    if (ec != std::errc{}) return fmt::format("{}", value);
    return std::string(buf, end);
}

std::string value_to_text(const TokenValue& value) {
    if (const auto* d = std::get_if<double>(&value)) return format_number(*d);
    if (const auto* s = std::get_if<std::string>(&value)) return *s;
    if (const auto* p = std::get_if<Point>(&value)) {
        return format_number(p->x) + "," + format_number(p->y);
    }
    return "";
}

} // namespace scene_model
