#include <dsl_parser/parser.hpp>
#include <dsl_lexer/lexer.hpp>
#include <string>

namespace dsl_parser {

using scene_model::ErrorCode;
using scene_model::RecoveryAction;
using scene_model::Token;
using scene_model::TokenKind;

Parser::Parser(std::vector<Token> tokens)
    : tokens_(std::move(tokens))
{
    eof_.kind = TokenKind::EndOfInput;
    if (!tokens_.empty()) {
        eof_.line = tokens_.back().line;
        eof_.column = tokens_.back().column;
    }
}

const Token& Parser::current() const {
    return pos_ < tokens_.size() ? tokens_[pos_] : eof_;
}

const Token& Parser::peek(std::size_t offset) const {
    return pos_ + offset < tokens_.size() ? tokens_[pos_ + offset] : eof_;
}

const Token& Parser::advance() {
    const Token& t = current();
    if (pos_ < tokens_.size()) ++pos_;
    return t;
}

bool Parser::at_line_end() const {
    switch (current().kind) {
    case TokenKind::Newline:
    case TokenKind::EndOfInput:
    case TokenKind::Indent:
    case TokenKind::Dedent:
        return true;
    default:
        return false;
    }
}

void Parser::skip_newlines() {
    while (check(TokenKind::Newline)) advance();
}

void Parser::skip_to_line_end() {
    while (!at_line_end()) advance();
}

// Consumes an Indent ... matching Dedent run without interpreting it.
void Parser::skip_block() {
    if (!check(TokenKind::Indent)) return;
    int depth = 0;
    do {
        if (check(TokenKind::Indent)) ++depth;
        else if (check(TokenKind::Dedent)) --depth;
        advance();
    } while (depth > 0 && !at_end());
}

// Called at an Indent. Past max_block_depth the whole block is consumed
// unparsed and false is returned.
bool Parser::enter_block() {
    if (depth_ < max_block_depth) {
        ++depth_;
        return true;
    }
    error(ErrorCode::ParseInvalidProperty,
        "Block nested deeper than " + std::to_string(max_block_depth) + " levels skipped",
        current(), RecoveryAction::Skip);
    skip_block();
    return false;
}

void Parser::error(ErrorCode code, std::string message, const Token& at,
    RecoveryAction recovery, scene_model::Severity severity)
{
    scene_model::ErrorInfo e;
    e.code = code;
    e.message = std::move(message);
    e.line = at.line;
    e.column = at.column;
    e.severity = severity;
    e.recovery = recovery;
    errors_.push_back(std::move(e));
}

ParseResult Parser::parse() {
    pos_ = 0;
    depth_ = 0;
    bindings_ = VariableBindings{};
    errors_.clear();

    ParseResult result;
    skip_newlines();
    while (!at_end()) {
        auto statement = parse_statement();
        if (statement) result.scene.statements.push_back(std::move(*statement));
        skip_newlines();
    }

    result.errors = std::move(errors_);
    result.bindings = std::move(bindings_);
    return result;
}

bool Parser::is_shape_statement(std::string_view keyword) const {
    return keyword == "group" || keyword == "stack" || keyword == "row" || keyword == "symbol"
        || scene_model::shape_kind_from_keyword(keyword).has_value();
}

std::optional<scene_model::Statement> Parser::parse_statement() {
    const Token& tok = current();

    if (tok.is(TokenKind::VariableRef)) return parse_variable();

    if (!tok.is(TokenKind::Identifier)) {
        error(ErrorCode::ParseUnexpectedToken,
            std::string("Unexpected token ") + scene_model::token_kind_name(tok.kind),
            tok, RecoveryAction::ResumeAtNextToken);
        advance();
        return std::nullopt;
    }

    const std::string keyword = tok.text();
    if (keyword == "canvas") return parse_canvas();
    if (keyword == "group") return parse_group();
    if (keyword == "stack") return parse_layout(scene_model::Direction::Vertical);
    if (keyword == "row") return parse_layout(scene_model::Direction::Horizontal);
    if (keyword == "symbol") return parse_symbol();
    if (auto kind = scene_model::shape_kind_from_keyword(keyword)) {
        if (*kind == scene_model::ShapeKind::Graph) return parse_graph();
        return parse_shape(*kind);
    }

    error(ErrorCode::ParseUnknownCommand, "Unknown command '" + keyword + "'",
        tok, RecoveryAction::ResumeAtLineEnd);
    advance();
    skip_to_line_end();
    return std::nullopt;
}

scene_model::VariableBinding Parser::parse_variable() {
    scene_model::VariableBinding binding;
    binding.name = advance().text();

    if (!check(TokenKind::Equals)) {
        error(ErrorCode::ParseMissingEquals,
            "Expected '=' after variable '$" + binding.name + "'",
            current(), RecoveryAction::ResumeAtNextToken);
        return binding;
    }
    advance();

    if (at_line_end()) {
        error(ErrorCode::ParseEmptyValue,
            "Variable '$" + binding.name + "' has no value",
            current(), RecoveryAction::UseDefault);
        return binding;
    }

    binding.value = resolve_value(advance(), bindings_, errors_);
    bindings_.bind(binding.name, *binding.value);
    return binding;
}

scene_model::Canvas Parser::parse_canvas() {
    advance();
    scene_model::Canvas canvas;

    if (check(TokenKind::Identifier)) {
        if (auto size = scene_model::parse_canvas_size(current().text())) {
            canvas.size = *size;
            advance();
        }
    }

    while (check(TokenKind::Identifier)) {
        const std::string key = advance().text();
        if (key == "fill") {
            if (auto color = parse_color_value(true)) canvas.fill = *color;
            continue;
        }
        // Unrecognized key: drop its value as well.
        switch (current().kind) {
        case TokenKind::Number:
        case TokenKind::String:
        case TokenKind::Pair:
        case TokenKind::Color:
        case TokenKind::VariableRef:
            advance();
            break;
        default:
            break;
        }
    }
    return canvas;
}

scene_model::Shape Parser::parse_shape(scene_model::ShapeKind kind) {
    const Token keyword = advance();
    scene_model::Shape shape;
    shape.kind = kind;
    RawShapeProps raw;

    parse_inline_props(shape, raw);
    if (kind == scene_model::ShapeKind::Use && !raw.content && !raw.href) {
        error(ErrorCode::ParseExpectedString, "Expected symbol id after 'use'",
            keyword, RecoveryAction::UseDefault);
    }
    skip_newlines();
    if (check(TokenKind::Indent)) parse_block(shape, raw);

    shape.width = raw.width;
    shape.props = build_props(kind, raw);
    return shape;
}

scene_model::Shape Parser::parse_group() {
    advance();
    scene_model::Shape shape;
    shape.kind = scene_model::ShapeKind::Group;
    scene_model::GroupProps props;
    if (check(TokenKind::String)) props.name = advance().text();

    RawShapeProps raw;
    skip_newlines();
    if (check(TokenKind::Indent)) parse_block(shape, raw);
    shape.props = std::move(props);
    return shape;
}

scene_model::Shape Parser::parse_layout(scene_model::Direction direction) {
    advance();
    scene_model::Shape shape;
    shape.kind = scene_model::ShapeKind::Layout;
    scene_model::LayoutProps props;
    props.direction = direction;

    while (!at_line_end()) {
        const Token& tok = advance();
        if (tok.is(TokenKind::Number)) {
            props.gap = tok.number(); // bare number is the gap
        } else if (tok.is(TokenKind::Identifier)) {
            parse_layout_option(tok.text(), tok, props);
        }
    }

    RawShapeProps raw;
    skip_newlines();
    if (check(TokenKind::Indent)) parse_block(shape, raw);
    shape.props = std::move(props);
    return shape;
}

// vertical | horizontal | gap N | at X,Y | size WxH | justify J | align A
// | center | wrap | padding N [N [N N]]
void Parser::parse_layout_option(const std::string& key, const Token& at, scene_model::LayoutProps& props) {
    if (key == "vertical") {
        props.direction = scene_model::Direction::Vertical;
    } else if (key == "horizontal") {
        props.direction = scene_model::Direction::Horizontal;
    } else if (key == "gap") {
        if (check(TokenKind::Number)) props.gap = advance().number();
    } else if (key == "at") {
        if (check(TokenKind::Pair)) props.at = advance().pair();
    } else if (key == "size") {
        if (check(TokenKind::Pair)) props.size = advance().pair();
    } else if (key == "justify") {
        if (!check(TokenKind::Identifier)) {
            error(ErrorCode::ParseExpectedValue, "Expected value after 'justify'", current(), RecoveryAction::UseDefault);
            return;
        }
        const Token& value = advance();
        if (auto justify = scene_model::parse_justify(value.text())) {
            props.justify = *justify;
        } else {
            error(ErrorCode::ParseInvalidProperty, "Unknown justify value '" + value.text() + "'",
                value, RecoveryAction::UseDefault, scene_model::Severity::Warning);
        }
    } else if (key == "align") {
        if (!check(TokenKind::Identifier)) {
            error(ErrorCode::ParseExpectedValue, "Expected value after 'align'", current(), RecoveryAction::UseDefault);
            return;
        }
        const Token& value = advance();
        if (auto align = scene_model::parse_align(value.text())) {
            props.align = *align;
        } else {
            error(ErrorCode::ParseInvalidProperty, "Unknown align value '" + value.text() + "'",
                value, RecoveryAction::UseDefault, scene_model::Severity::Warning);
        }
    } else if (key == "center") {
        props.justify = scene_model::Justify::Center;
        props.align = scene_model::Align::Center;
    } else if (key == "wrap") {
        props.wrap = true;
    } else if (key == "padding") {
        props.padding = parse_padding(at);
    }
}

// One value for all sides, two for vertical/horizontal, four clockwise from
// the top. Any other count leaves no padding.
scene_model::Padding Parser::parse_padding(const Token& at) {
    std::vector<double> values;
    while (values.size() < 4 && check(TokenKind::Number)) values.push_back(advance().number());

    scene_model::Padding padding;
    switch (values.size()) {
    case 1:
        padding = { values[0], values[0], values[0], values[0] };
        break;
    case 2:
        padding = { values[0], values[1], values[0], values[1] };
        break;
    case 4:
        padding = { values[0], values[1], values[2], values[3] };
        break;
    default:
        error(ErrorCode::ParseExpectedNumber, "Expected 1, 2 or 4 numbers after 'padding'",
            at, RecoveryAction::UseDefault);
        break;
    }
    return padding;
}

// symbol "id" [viewbox X,Y W,H | viewbox W,H]
//   shapes
scene_model::Shape Parser::parse_symbol() {
    advance();
    scene_model::Shape shape;
    shape.kind = scene_model::ShapeKind::Symbol;
    scene_model::SymbolProps props;

    if (check(TokenKind::String)) {
        props.id = advance().text();
    } else {
        error(ErrorCode::ParseExpectedString, "Expected symbol id after 'symbol'",
            current(), RecoveryAction::UseDefault);
    }

    while (!at_line_end()) {
        const Token& tok = advance();
        if (!tok.is_identifier("viewbox") || !check(TokenKind::Pair)) continue;
        const scene_model::Point first = advance().pair();
        if (check(TokenKind::Pair)) {
            const scene_model::Point size = advance().pair();
            props.viewbox = scene_model::ViewBox{ first.x, first.y, size.x, size.y };
        } else {
            props.viewbox = scene_model::ViewBox{ 0, 0, first.x, first.y };
        }
    }

    RawShapeProps raw;
    skip_newlines();
    if (check(TokenKind::Indent)) parse_block(shape, raw);
    shape.props = std::move(props);
    return shape;
}

ParseResult parse(std::vector<Token> tokens) {
    Parser parser(std::move(tokens));
    return parser.parse();
}

ParseResult parse_source(std::string_view source) {
    return parse(dsl_lexer::tokenize(source).tokens);
}

} // namespace dsl_parser
