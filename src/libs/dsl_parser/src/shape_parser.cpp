#include <dsl_parser/parser.hpp>

namespace dsl_parser {

using scene_model::ErrorCode;
using scene_model::Point;
using scene_model::RecoveryAction;
using scene_model::ShapeKind;
using scene_model::Token;
using scene_model::TokenKind;

scene_model::ShapeProps build_props(ShapeKind kind, const RawShapeProps& raw) {
    switch (kind) {
    case ShapeKind::Rect:
        return scene_model::RectProps{ raw.at, raw.size };
    case ShapeKind::Circle:
        return scene_model::CircleProps{ raw.at, raw.radius };
    case ShapeKind::Ellipse: {
        scene_model::EllipseProps p;
        p.at = raw.at;
        p.size = raw.size;
        if (raw.radius_pair) p.radius = raw.radius_pair;
        else if (raw.radius) p.radius = Point{ *raw.radius, *raw.radius };
        return p;
    }
    case ShapeKind::Line:
        return scene_model::LineProps{ raw.from, raw.to };
    case ShapeKind::Path:
        return scene_model::PathProps{ raw.d ? *raw.d : raw.content.value_or("") };
    case ShapeKind::Polygon:
        return scene_model::PolygonProps{ raw.points };
    case ShapeKind::Text:
        return scene_model::TextProps{ raw.at, raw.content.value_or("") };
    case ShapeKind::Image:
        return scene_model::ImageProps{ raw.at, raw.size, raw.href.value_or("") };
    case ShapeKind::Group:
        return scene_model::GroupProps{};
    case ShapeKind::Layout:
        return scene_model::LayoutProps{};
    case ShapeKind::Graph:
        return scene_model::GraphProps{};
    case ShapeKind::Symbol:
        return scene_model::SymbolProps{};
    case ShapeKind::Use:
        return scene_model::UseProps{ raw.content ? *raw.content : raw.href.value_or(""), raw.at, raw.size };
    }
    return scene_model::RectProps{};
}

void Parser::parse_inline_props(scene_model::Shape& shape, RawShapeProps& raw) {
    while (!at_line_end()) {
        const Token& tok = current();
        switch (tok.kind) {
        case TokenKind::Pair:
            if (!raw.at) raw.at = tok.pair();
            else if (!raw.size) raw.size = tok.pair();
            advance();
            break;
        case TokenKind::Number:
            if (shape.kind == ShapeKind::Circle && !raw.radius) raw.radius = tok.number();
            else if (!raw.width) raw.width = tok.number();
            advance();
            break;
        case TokenKind::String:
            raw.content = tok.text();
            advance();
            break;
        case TokenKind::LeftBracket:
            if (shape.kind == ShapeKind::Polygon) raw.points = parse_points();
            else advance();
            break;
        case TokenKind::Color:
        case TokenKind::VariableRef: {
            // Later colors are dropped but still resolved, so undefined names report.
            std::string fill = resolve_text(advance(), bindings_, errors_);
            if (!shape.style.fill) shape.style.fill = std::move(fill);
            break;
        }
        case TokenKind::Identifier: {
            const std::string key = advance().text();
            parse_labeled_prop(key, shape.kind, raw);
            break;
        }
        default:
            advance();
            break;
        }
    }
}

// Labeled geometry. A key whose value has the wrong type leaves the field
// unset and the value token in place.
void Parser::parse_labeled_prop(const std::string& key, ShapeKind kind, RawShapeProps& raw) {
    if (key == "at" || key == "size" || key == "from" || key == "to") {
        if (!check(TokenKind::Pair)) return;
        const Point p = advance().pair();
        if (key == "at") raw.at = p;
        else if (key == "size") raw.size = p;
        else if (key == "from") raw.from = p;
        else raw.to = p;
        return;
    }
    if (key == "radius") {
        if (check(TokenKind::Number)) raw.radius = advance().number();
        else if (kind == ShapeKind::Ellipse && check(TokenKind::Pair)) raw.radius_pair = advance().pair();
        return;
    }
    if (key == "d" || key == "href") {
        if (!check(TokenKind::String)) return;
        if (key == "d") raw.d = advance().text();
        else raw.href = advance().text();
        return;
    }
    if (key == "points") {
        if (check(TokenKind::LeftBracket)) raw.points = parse_points();
        return;
    }
}

void Parser::parse_block(scene_model::Shape& shape, RawShapeProps& raw) {
    if (!enter_block()) return;
    advance(); // Indent
    const bool container = shape.kind == ShapeKind::Group || shape.kind == ShapeKind::Layout
        || shape.kind == ShapeKind::Symbol;

    while (true) {
        skip_newlines();
        if (check(TokenKind::Dedent)) {
            advance();
            break;
        }
        if (at_end()) break;

        if (!check(TokenKind::Identifier)) {
            advance();
            continue;
        }

        const Token& tok = current();
        const std::string key = tok.text();

        if (is_shape_statement(key)) {
            const Token keyword_token = tok;
            auto child = parse_statement();
            if (!child) continue;
            if (container) {
                shape.children.push_back(std::get<scene_model::Shape>(std::move(*child)));
            } else {
                error(ErrorCode::ParseInvalidProperty,
                    "Nested '" + key + "' ignored inside " + scene_model::shape_kind_name(shape.kind),
                    keyword_token, RecoveryAction::Skip, scene_model::Severity::Warning);
            }
            continue;
        }

        advance();
        if (parse_style_prop(key, shape.style)) continue;
        if (parse_text_prop(key, shape.style)) continue;
        if (parse_transform_prop(key, shape.transform)) continue;

        if (key == "width") {
            if (check(TokenKind::Number)) shape.style.stroke_width = advance().number();
        } else if (key == "d") {
            if (check(TokenKind::String)) raw.d = advance().text();
        } else if (key == "points") {
            if (check(TokenKind::LeftBracket)) raw.points = parse_points();
        }
        // Anything else is skipped silently.
    }
    leave_block();
}

std::optional<std::string> Parser::parse_color_value(bool allow_identifier) {
    const Token& tok = current();
    if (tok.is(TokenKind::Color) || tok.is(TokenKind::VariableRef)
        || (allow_identifier && tok.is(TokenKind::Identifier))) {
        return resolve_text(advance(), bindings_, errors_);
    }
    error(ErrorCode::ParseExpectedColor, "Expected color", tok, RecoveryAction::UseDefault);
    return std::nullopt;
}

bool Parser::parse_style_prop(const std::string& key, scene_model::Style& style) {
    if (key == "fill") {
        if (auto color = parse_color_value(true)) style.fill = *color;
        return true;
    }
    if (key == "stroke") {
        if (auto color = parse_color_value(false)) style.stroke = *color;
        if (check(TokenKind::Number)) {
            style.stroke_width = advance().number();
        } else if (current().is_identifier("width") && peek().is(TokenKind::Number)) {
            advance();
            style.stroke_width = advance().number();
        }
        return true;
    }
    if (key == "opacity" || key == "corner") {
        if (!check(TokenKind::Number)) {
            error(ErrorCode::ParseExpectedNumber, "Expected number after '" + key + "'",
                current(), RecoveryAction::UseDefault);
            return true;
        }
        const double value = advance().number();
        if (key == "opacity") style.opacity = value;
        else style.corner = value;
        return true;
    }
    if (key == "shadow") {
        style.shadow = parse_shadow();
        return true;
    }
    if (key == "gradient") {
        style.gradient = parse_gradient();
        return true;
    }
    return false;
}

bool Parser::parse_text_prop(const std::string& key, scene_model::Style& style) {
    if (key == "font") {
        if (check(TokenKind::String)) style.font = advance().text();
        if (check(TokenKind::Number)) style.font_size = advance().number();
        return true;
    }
    if (key == "bold") {
        style.font_weight = "bold";
        return true;
    }
    if (key == "italic") {
        style.font_weight = "italic";
        return true;
    }
    if (key == "center") {
        style.text_anchor = "middle";
        return true;
    }
    if (key == "end") {
        style.text_anchor = "end";
        return true;
    }
    return false;
}

bool Parser::parse_transform_prop(const std::string& key, scene_model::Transform& transform) {
    if (key == "translate" || key == "origin") {
        if (!check(TokenKind::Pair)) {
            error(ErrorCode::ParseExpectedPair, "Expected pair after '" + key + "'",
                current(), RecoveryAction::UseDefault);
            return true;
        }
        if (key == "translate") transform.translate = advance().pair();
        else transform.origin = advance().pair();
        return true;
    }
    if (key == "rotate") {
        if (check(TokenKind::Number)) {
            transform.rotate = advance().number();
        } else {
            error(ErrorCode::ParseExpectedNumber, "Expected number after 'rotate'",
                current(), RecoveryAction::UseDefault);
        }
        return true;
    }
    if (key == "scale") {
        if (check(TokenKind::Pair)) {
            transform.scale = advance().pair();
        } else if (check(TokenKind::Number)) {
            const double s = advance().number();
            transform.scale = Point{ s, s };
        } else {
            error(ErrorCode::ParseExpectedValue, "Expected pair or number after 'scale'",
                current(), RecoveryAction::UseDefault);
        }
        return true;
    }
    return false;
}

scene_model::ShadowDef Parser::parse_shadow() {
    scene_model::ShadowDef shadow;
    if (check(TokenKind::Pair)) {
        const Point offset = advance().pair();
        shadow.x = offset.x;
        shadow.y = offset.y;
    }
    if (check(TokenKind::Number)) shadow.blur = advance().number();
    if (check(TokenKind::Color)) shadow.color = advance().text();
    return shadow;
}

scene_model::GradientDef Parser::parse_gradient() {
    scene_model::GradientDef gradient;
    bool kind_set = false;
    int colors_seen = 0;

    while (check(TokenKind::Identifier) || check(TokenKind::Color) || check(TokenKind::Number)) {
        const Token& tok = advance();
        if (tok.is(TokenKind::Number)) {
            gradient.angle = tok.number();
        } else if (tok.is(TokenKind::Color)) {
            if (colors_seen == 0) gradient.from = tok.text();
            else gradient.to = tok.text();
            ++colors_seen;
        } else if (!kind_set && (tok.text() == "linear" || tok.text() == "radial")) {
            gradient.kind = tok.text() == "radial" ? scene_model::GradientKind::Radial
                                                   : scene_model::GradientKind::Linear;
            kind_set = true;
        } else if ((tok.text() == "from" || tok.text() == "to") && check(TokenKind::Color)) {
            if (tok.text() == "from") gradient.from = advance().text();
            else gradient.to = advance().text();
            ++colors_seen;
        }
    }
    return gradient;
}

// "[" pair* "]". Stops at the end of the line when the bracket is never
// closed and keeps what was collected.
std::vector<Point> Parser::parse_points() {
    std::vector<Point> points;
    advance(); // [

    while (!check(TokenKind::RightBracket)) {
        if (at_line_end()) {
            error(ErrorCode::ParseMissingBracket, "Expected ']' to close point list",
                current(), RecoveryAction::ReturnPartial);
            return points;
        }
        const Token& tok = advance();
        if (tok.is(TokenKind::Pair)) points.push_back(tok.pair());
    }
    advance(); // ]
    return points;
}

} // namespace dsl_parser
