#include <dsl_parser/parser.hpp>

namespace dsl_parser {

using scene_model::ErrorCode;
using scene_model::RecoveryAction;
using scene_model::Token;
using scene_model::TokenKind;

// graph [hierarchical|grid|manual] [vertical|horizontal] [spacing N]
//   node "a" ...
//   edge "a" -> "b" ...
scene_model::Shape Parser::parse_graph() {
    advance();
    scene_model::Shape shape;
    shape.kind = scene_model::ShapeKind::Graph;
    scene_model::GraphProps graph;

    while (!at_line_end()) {
        const Token& tok = advance();
        if (!tok.is(TokenKind::Identifier)) continue;
        if (auto layout = scene_model::parse_graph_layout(tok.text())) {
            graph.layout = *layout;
        } else if (tok.text() == "vertical") {
            graph.direction = scene_model::Direction::Vertical;
        } else if (tok.text() == "horizontal") {
            graph.direction = scene_model::Direction::Horizontal;
        } else if (tok.text() == "spacing" && check(TokenKind::Number)) {
            graph.spacing = advance().number();
        }
    }

    skip_newlines();
    if (check(TokenKind::Indent)) parse_graph_block(graph);
    shape.props = std::move(graph);
    return shape;
}

void Parser::parse_graph_block(scene_model::GraphProps& graph) {
    if (!enter_block()) return;
    advance(); // Indent

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

        const Token& key_token = current();
        const std::string key = key_token.text();

        if (key == "node") {
            if (auto node = parse_node()) graph.nodes.push_back(std::move(*node));
            continue;
        }
        if (key == "edge") {
            if (auto edge = parse_edge()) graph.edges.push_back(std::move(*edge));
            continue;
        }

        advance();
        if (key == "layout") {
            if (!check(TokenKind::Identifier)) {
                error(ErrorCode::ParseExpectedValue, "Expected layout name after 'layout'",
                    current(), RecoveryAction::UseDefault);
            } else if (auto layout = scene_model::parse_graph_layout(current().text())) {
                graph.layout = *layout;
                advance();
            } else {
                error(ErrorCode::ParseInvalidProperty, "Unknown graph layout '" + current().text() + "'",
                    current(), RecoveryAction::UseDefault);
                advance();
            }
        } else if (key == "direction") {
            if (current().is_identifier("vertical")) {
                graph.direction = scene_model::Direction::Vertical;
                advance();
            } else if (current().is_identifier("horizontal")) {
                graph.direction = scene_model::Direction::Horizontal;
                advance();
            } else {
                error(ErrorCode::ParseInvalidProperty, "Expected 'vertical' or 'horizontal' after 'direction'",
                    current(), RecoveryAction::UseDefault);
            }
        } else if (key == "spacing") {
            if (check(TokenKind::Number)) {
                graph.spacing = advance().number();
            } else {
                error(ErrorCode::ParseExpectedNumber, "Expected number after 'spacing'",
                    current(), RecoveryAction::UseDefault);
            }
        } else {
            error(ErrorCode::ParseInvalidProperty, "Unknown graph property '" + key + "'",
                key_token, RecoveryAction::ResumeAtLineEnd);
            skip_to_line_end();
        }
    }
    leave_block();
}

// node "id" [at] [size] [fill] [shape S] [label "text"]
std::optional<scene_model::GraphNode> Parser::parse_node() {
    advance();
    scene_model::GraphNode node;

    if (!check(TokenKind::String)) {
        error(ErrorCode::ParseExpectedString, "Expected node id after 'node'",
            current(), RecoveryAction::ResumeAtLineEnd);
        skip_to_line_end();
        skip_newlines();
        skip_block();
        return std::nullopt;
    }
    node.id = advance().text();

    while (!at_line_end()) {
        const Token& tok = current();
        if (tok.is(TokenKind::Pair)) {
            if (!node.at) node.at = tok.pair();
            else if (!node.size) node.size = tok.pair();
            advance();
        } else if (tok.is(TokenKind::Color) || tok.is(TokenKind::VariableRef)) {
            std::string fill = resolve_text(advance(), bindings_, errors_);
            if (!node.style.fill) node.style.fill = std::move(fill);
        } else if (tok.is(TokenKind::Identifier)) {
            const std::string key = advance().text();
            parse_node_prop(key, node);
        } else {
            advance();
        }
    }

    skip_newlines();
    if (!check(TokenKind::Indent)) return node;

    advance();
    while (true) {
        skip_newlines();
        if (check(TokenKind::Dedent)) {
            advance();
            break;
        }
        if (at_end()) break;
        if (check(TokenKind::Indent)) {
            skip_block();
            continue;
        }
        const Token& tok = advance();
        if (tok.is(TokenKind::Identifier)) parse_node_prop(tok.text(), node);
    }
    return node;
}

void Parser::parse_node_prop(const std::string& key, scene_model::GraphNode& node) {
    if (key == "at" || key == "size") {
        if (!check(TokenKind::Pair)) {
            error(ErrorCode::ParseExpectedPair, "Expected pair after '" + key + "'",
                current(), RecoveryAction::UseDefault);
            return;
        }
        if (key == "at") node.at = advance().pair();
        else node.size = advance().pair();
    } else if (key == "shape") {
        if (!check(TokenKind::Identifier)) {
            error(ErrorCode::ParseExpectedValue, "Expected node shape after 'shape'",
                current(), RecoveryAction::UseDefault);
        } else if (auto shape = scene_model::parse_node_shape(current().text())) {
            node.shape = *shape;
            advance();
        } else {
            error(ErrorCode::ParseInvalidProperty, "Unknown node shape '" + current().text() + "'",
                current(), RecoveryAction::UseDefault);
            advance();
        }
    } else if (key == "label") {
        if (check(TokenKind::String)) {
            node.label = advance().text();
        } else {
            error(ErrorCode::ParseExpectedString, "Expected string after 'label'",
                current(), RecoveryAction::UseDefault);
        }
    } else if (key == "fill") {
        if (auto color = parse_color_value(true)) node.style.fill = *color;
    } else if (key == "stroke") {
        if (auto color = parse_color_value(false)) node.style.stroke = *color;
        if (check(TokenKind::Number)) node.style.stroke_width = advance().number();
    }
}

// edge "from" -> "to" [color] [width] [style S] [arrow A] [label "text"]
std::optional<scene_model::GraphEdge> Parser::parse_edge() {
    advance();
    scene_model::GraphEdge edge;

    auto abandon = [this](ErrorCode code, const std::string& message) {
        error(code, message, current(), RecoveryAction::ResumeAtLineEnd);
        skip_to_line_end();
        skip_newlines();
        skip_block();
    };

    if (!check(TokenKind::String)) {
        abandon(ErrorCode::ParseExpectedString, "Expected source node id after 'edge'");
        return std::nullopt;
    }
    edge.from = advance().text();

    if (!check(TokenKind::Arrow)) {
        abandon(ErrorCode::ParseUnexpectedToken, "Expected '->' between edge endpoints");
        return std::nullopt;
    }
    advance();

    if (!check(TokenKind::String)) {
        abandon(ErrorCode::ParseExpectedString, "Expected target node id after '->'");
        return std::nullopt;
    }
    edge.to = advance().text();

    while (!at_line_end()) {
        const Token& tok = current();
        if (tok.is(TokenKind::Color) || tok.is(TokenKind::VariableRef)) {
            edge.stroke = resolve_text(advance(), bindings_, errors_);
        } else if (tok.is(TokenKind::Number)) {
            edge.stroke_width = advance().number();
        } else if (tok.is(TokenKind::Identifier)) {
            const std::string key = advance().text();
            parse_edge_prop(key, edge);
        } else {
            advance();
        }
    }

    skip_newlines();
    if (!check(TokenKind::Indent)) return edge;

    advance();
    while (true) {
        skip_newlines();
        if (check(TokenKind::Dedent)) {
            advance();
            break;
        }
        if (at_end()) break;
        if (check(TokenKind::Indent)) {
            skip_block();
            continue;
        }
        const Token& tok = advance();
        if (tok.is(TokenKind::Identifier)) parse_edge_prop(tok.text(), edge);
    }
    return edge;
}

void Parser::parse_edge_prop(const std::string& key, scene_model::GraphEdge& edge) {
    if (auto style = scene_model::parse_edge_style(key)) {
        edge.style = *style;
        return;
    }
    if (auto arrow = scene_model::parse_arrow_direction(key)) {
        edge.arrow = *arrow;
        return;
    }

    if (key == "style") {
        const Token& tok = current();
        auto style = tok.is(TokenKind::Identifier) ? scene_model::parse_edge_style(tok.text()) : std::nullopt;
        if (style) {
            edge.style = *style;
            advance();
        } else {
            error(ErrorCode::ParseInvalidProperty, "Expected straight, curved or orthogonal after 'style'",
                tok, RecoveryAction::UseDefault);
            if (tok.is(TokenKind::Identifier)) advance();
        }
    } else if (key == "arrow") {
        const Token& tok = current();
        auto arrow = tok.is(TokenKind::Identifier) ? scene_model::parse_arrow_direction(tok.text()) : std::nullopt;
        if (arrow) {
            edge.arrow = *arrow;
            advance();
        } else {
            error(ErrorCode::ParseInvalidProperty, "Expected none, forward, backward or both after 'arrow'",
                tok, RecoveryAction::UseDefault);
            if (tok.is(TokenKind::Identifier)) advance();
        }
    } else if (key == "label") {
        if (check(TokenKind::String)) {
            edge.label = advance().text();
        } else {
            error(ErrorCode::ParseExpectedString, "Expected string after 'label'",
                current(), RecoveryAction::UseDefault);
        }
    } else if (key == "stroke") {
        if (auto color = parse_color_value(false)) edge.stroke = *color;
    } else if (key == "width") {
        if (check(TokenKind::Number)) {
            edge.stroke_width = advance().number();
        } else {
            error(ErrorCode::ParseExpectedNumber, "Expected number after 'width'",
                current(), RecoveryAction::UseDefault);
        }
    }
}

} // namespace dsl_parser
