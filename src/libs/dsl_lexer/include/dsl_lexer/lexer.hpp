#pragma once

#include <scene_model/errors.hpp>
#include <scene_model/token.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace dsl_lexer {

// A character no pattern recognized. Never an error, kept for inspection.
struct SkippedChar {
    int line = 0;
    int column = 0;
    char character = 0;
    scene_model::RecoveryAction recovery = scene_model::RecoveryAction::Skip;
};

struct LexResult {
    std::vector<scene_model::Token> tokens;
    std::vector<SkippedChar> skipped;
};

// Line-based tokenizer. Indentation becomes Indent/Dedent tokens; every kept
// line ends with one Newline and the stream always ends with EndOfInput.
//
// Indentation that lands between two open levels is accepted as the level
// popping stopped at:
//
//     rect          -> [0]
//         fill      -> [0, 4]  Indent
//       stroke      -> [0]     Dedent (2 is treated as 0)
class Lexer {
public:
    explicit Lexer(std::string_view source);

    LexResult tokenize();

private:
    void tokenize_line(std::string_view text, int line_no, int indent_width);
    void push(scene_model::TokenKind kind, scene_model::TokenValue value, int line, int column);

    std::string_view source_;
    std::vector<int> indent_stack_;
    LexResult result_;
};

LexResult tokenize(std::string_view source);

} // namespace dsl_lexer
