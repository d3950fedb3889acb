#include <dsl_lexer/lexer.hpp>
#include <cstdlib>
#include <string>

namespace dsl_lexer {

using scene_model::Point;
using scene_model::TokenKind;

namespace {

bool is_digit(char c) { return c >= '0' && c <= '9'; }
bool is_alpha(char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); }
bool is_hex(char c) { return is_digit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F'); }
bool is_word(char c) { return is_alpha(c) || is_digit(c) || c == '_'; }
bool is_space(char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v'; }

// -?\d+\.?\d*  Returns the match length, 0 when there is none.
std::size_t scan_decimal(std::string_view text, std::size_t pos) {
    std::size_t i = pos;
    if (i < text.size() && text[i] == '-') ++i;
    const std::size_t digits_start = i;
    while (i < text.size() && is_digit(text[i])) ++i;
    if (i == digits_start) return 0;
    if (i < text.size() && text[i] == '.') {
        ++i;
        while (i < text.size() && is_digit(text[i])) ++i;
    }
    return i - pos;
}

// strtod saturates instead of throwing on out-of-range literals.
double to_number(std::string_view text) {
    const std::string buffer(text);
    return std::strtod(buffer.c_str(), nullptr);
}

// \$[a-zA-Z_][a-zA-Z0-9_]*
std::size_t scan_variable(std::string_view text, std::size_t pos) {
    if (text[pos] != '$') return 0;
    std::size_t i = pos + 1;
    if (i >= text.size() || !(is_alpha(text[i]) || text[i] == '_')) return 0;
    while (i < text.size() && is_word(text[i])) ++i;
    return i - pos;
}

// #[0-9a-fA-F]{3|4|6|8} followed by a word boundary.
std::size_t scan_color(std::string_view text, std::size_t pos) {
    if (text[pos] != '#') return 0;
    std::size_t i = pos + 1;
    while (i < text.size() && is_hex(text[i])) ++i;
    const std::size_t digits = i - pos - 1;
    if (digits != 3 && digits != 4 && digits != 6 && digits != 8) return 0;
    if (i < text.size() && is_word(text[i])) return 0;
    return i - pos;
}

std::size_t scan_pair(std::string_view text, std::size_t pos, Point& out) {
    const std::size_t first = scan_decimal(text, pos);
    if (first == 0) return 0;
    const std::size_t sep = pos + first;
    if (sep >= text.size() || (text[sep] != ',' && text[sep] != 'x')) return 0;
    const std::size_t second = scan_decimal(text, sep + 1);
    if (second == 0) return 0;
    out.x = to_number(text.substr(pos, first));
    out.y = to_number(text.substr(sep + 1, second));
    return first + 1 + second;
}

std::size_t scan_string(std::string_view text, std::size_t pos) {
    const char quote = text[pos];
    if (quote != '"' && quote != '\'') return 0;
    const std::size_t close = text.find(quote, pos + 1);
    if (close == std::string_view::npos) return 0;
    return close - pos + 1;
}

std::size_t scan_identifier(std::string_view text, std::size_t pos) {
    if (!(is_alpha(text[pos]) || text[pos] == '_')) return 0;
    std::size_t i = pos + 1;
    while (i < text.size() && (is_word(text[i]) || text[i] == '-')) ++i;
    return i - pos;
}

} // namespace

Lexer::Lexer(std::string_view source)
    : source_(source)
    , indent_stack_{ 0 }
{
}

void Lexer::push(TokenKind kind, scene_model::TokenValue value, int line, int column) {
    scene_model::Token t;
    t.kind = kind;
    t.value = std::move(value);
    t.line = line;
    t.column = column;
    result_.tokens.push_back(std::move(t));
}

LexResult Lexer::tokenize() {
    result_ = LexResult{};
    indent_stack_.assign(1, 0);

    int line_no = 0;
    std::size_t start = 0;
    while (start <= source_.size()) {
        std::size_t end = source_.find('\n', start);
        if (end == std::string_view::npos) end = source_.size();
        std::string_view line = source_.substr(start, end - start);
        ++line_no;
        start = end + 1;

        std::size_t indent = 0;
        while (indent < line.size() && is_space(line[indent])) ++indent;
        std::string_view stripped = line.substr(indent);
        if (stripped.empty() || stripped.substr(0, 2) == "//") {
            if (end == source_.size()) break;
            continue;
        }

        const int width = static_cast<int>(indent);
        if (width > indent_stack_.back()) {
            indent_stack_.push_back(width);
            push(TokenKind::Indent, {}, line_no, 1);
        } else {
            while (indent_stack_.size() > 1 && width < indent_stack_.back()) {
                indent_stack_.pop_back();
                push(TokenKind::Dedent, {}, line_no, 1);
            }
        }

        tokenize_line(line, line_no, width);
        if (end == source_.size()) break;
    }

    const int last_line = line_no > 0 ? line_no : 1;
    while (indent_stack_.size() > 1) {
        indent_stack_.pop_back();
        push(TokenKind::Dedent, {}, last_line, 1);
    }
    push(TokenKind::EndOfInput, {}, last_line, 1);
    return std::move(result_);
}

void Lexer::tokenize_line(std::string_view text, int line_no, int indent_width) {
    std::size_t pos = static_cast<std::size_t>(indent_width);

    while (pos < text.size()) {
        const char c = text[pos];
        if (is_space(c)) {
            ++pos;
            continue;
        }
        const int column = static_cast<int>(pos) + 1;

        if (text.substr(pos, 2) == "//") break;

        std::size_t n = scan_variable(text, pos);
        if (n > 0) {
            push(TokenKind::VariableRef, std::string(text.substr(pos + 1, n - 1)), line_no, column);
            pos += n;
            continue;
        }

        n = scan_color(text, pos);
        if (n > 0) {
            push(TokenKind::Color, std::string(text.substr(pos, n)), line_no, column);
            pos += n;
            continue;
        }

        Point pair;
        n = scan_pair(text, pos, pair);
        if (n > 0) {
            push(TokenKind::Pair, pair, line_no, column);
            pos += n;
            continue;
        }

        n = scan_string(text, pos);
        if (n > 0) {
            push(TokenKind::String, std::string(text.substr(pos + 1, n - 2)), line_no, column);
            pos += n;
            continue;
        }

        n = scan_decimal(text, pos);
        if (n > 0) {
            push(TokenKind::Number, to_number(text.substr(pos, n)), line_no, column);
            pos += n;
            continue;
        }

        if (text.substr(pos, 2) == "->") {
            push(TokenKind::Arrow, {}, line_no, column);
            pos += 2;
            continue;
        }

        TokenKind single = TokenKind::EndOfInput;
        switch (c) {
        case ':': single = TokenKind::Colon; break;
        case '=': single = TokenKind::Equals; break;
        case '[': single = TokenKind::LeftBracket; break;
        case ']': single = TokenKind::RightBracket; break;
        default: break;
        }
        if (single != TokenKind::EndOfInput) {
            push(single, {}, line_no, column);
            ++pos;
            continue;
        }

        n = scan_identifier(text, pos);
        if (n > 0) {
            push(TokenKind::Identifier, std::string(text.substr(pos, n)), line_no, column);
            pos += n;
            continue;
        }

        result_.skipped.push_back({ line_no, column, c, scene_model::RecoveryAction::Skip });
        ++pos;
    }

    push(TokenKind::Newline, {}, line_no, static_cast<int>(text.size()) + 1);
}

LexResult tokenize(std::string_view source) {
    Lexer lexer(source);
    return lexer.tokenize();
}

} // namespace dsl_lexer
