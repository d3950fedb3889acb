#pragma once

#include <dsl_parser/bindings.hpp>
#include <dsl_parser/shape_props.hpp>
#include <scene_model/ast.hpp>
#include <scene_model/errors.hpp>
#include <scene_model/token.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dsl_parser {

// Blocks nested deeper than this are skipped with an error, so later stages
// never walk an unbounded tree.
constexpr int max_block_depth = 256;

struct ParseResult {
    scene_model::Scene scene;
    std::vector<scene_model::ErrorInfo> errors;
    VariableBindings bindings;
};

// Recursive-descent parser over a token stream. Always returns a usable
// scene; problems are collected as errors and parsing resumes:
//   unexpected token   -> skip that token
//   unknown command    -> skip to the end of its line
//   missing value      -> leave the field at its default
//   unterminated [..]  -> keep the points collected so far
//   block too deep     -> skip the block
class Parser {
public:
    explicit Parser(std::vector<scene_model::Token> tokens);

    ParseResult parse();

private:
    // Cursor
    const scene_model::Token& current() const;
    const scene_model::Token& peek(std::size_t offset = 1) const;
    const scene_model::Token& advance();
    bool check(scene_model::TokenKind kind) const { return current().kind == kind; }
    bool at_end() const { return check(scene_model::TokenKind::EndOfInput); }
    bool at_line_end() const;
    void skip_newlines();
    void skip_to_line_end();
    void skip_block();
    bool enter_block();
    void leave_block() { --depth_; }
    void error(scene_model::ErrorCode code, std::string message,
        const scene_model::Token& at, scene_model::RecoveryAction recovery,
        scene_model::Severity severity = scene_model::Severity::Error);

    // Statements
    std::optional<scene_model::Statement> parse_statement();
    scene_model::VariableBinding parse_variable();
    scene_model::Canvas parse_canvas();
    scene_model::Shape parse_shape(scene_model::ShapeKind kind);
    scene_model::Shape parse_group();
    scene_model::Shape parse_layout(scene_model::Direction direction);
    void parse_layout_option(const std::string& key, const scene_model::Token& at, scene_model::LayoutProps& props);
    scene_model::Padding parse_padding(const scene_model::Token& at);
    scene_model::Shape parse_symbol();
    bool is_shape_statement(std::string_view keyword) const;

    // Shape properties and blocks
    void parse_inline_props(scene_model::Shape& shape, RawShapeProps& raw);
    void parse_labeled_prop(const std::string& key, scene_model::ShapeKind kind, RawShapeProps& raw);
    void parse_block(scene_model::Shape& shape, RawShapeProps& raw);
    bool parse_style_prop(const std::string& key, scene_model::Style& style);
    bool parse_text_prop(const std::string& key, scene_model::Style& style);
    bool parse_transform_prop(const std::string& key, scene_model::Transform& transform);
    std::optional<std::string> parse_color_value(bool allow_identifier);
    scene_model::ShadowDef parse_shadow();
    scene_model::GradientDef parse_gradient();
    std::vector<scene_model::Point> parse_points();

    // Graphs
    scene_model::Shape parse_graph();
    void parse_graph_block(scene_model::GraphProps& graph);
    std::optional<scene_model::GraphNode> parse_node();
    void parse_node_prop(const std::string& key, scene_model::GraphNode& node);
    std::optional<scene_model::GraphEdge> parse_edge();
    void parse_edge_prop(const std::string& key, scene_model::GraphEdge& edge);

    std::vector<scene_model::Token> tokens_;
    std::size_t pos_ = 0;
    scene_model::Token eof_;
    VariableBindings bindings_;
    std::vector<scene_model::ErrorInfo> errors_;
    int depth_ = 0;
};

ParseResult parse(std::vector<scene_model::Token> tokens);

// Lexes and parses in one step.
ParseResult parse_source(std::string_view source);

} // namespace dsl_parser
