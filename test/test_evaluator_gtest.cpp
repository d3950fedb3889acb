#include <gtest/gtest.h>
#include <dsl_parser/parser.hpp>
#include <scene_eval/evaluator.hpp>
#include <string>

using namespace scene_model;

class EvaluatorTest : public ::testing::Test {
protected:
    scene_eval::SceneState state;

    void evaluate(const std::string& source) {
        auto parsed = dsl_parser::parse_source(source);
        state = scene_eval::evaluate_scene(parsed.scene, std::move(parsed.errors));
    }

    std::size_t count_errors(ErrorCode code) const {
        std::size_t n = 0;
        for (const auto& e : state.errors) {
            if (e.code == code) ++n;
        }
        return n;
    }
};

TEST_F(EvaluatorTest, EmptySceneKeepsDefaultCanvas) {
    evaluate("");
    EXPECT_EQ(state.canvas.size, CanvasSize::Medium);
    EXPECT_EQ(state.canvas.fill, "#fff");
    EXPECT_TRUE(state.shapes.empty());
    EXPECT_TRUE(state.errors.empty());
    EXPECT_TRUE(state.resources.empty());
}

TEST_F(EvaluatorTest, LastCanvasWins) {
    evaluate("canvas small fill #111\nrect\ncanvas large\n");
    EXPECT_EQ(state.canvas.size, CanvasSize::Large);
    EXPECT_EQ(state.canvas.fill, "#fff") << "a canvas statement replaces the whole canvas";
    EXPECT_EQ(state.shapes.size(), 1u);
}

TEST_F(EvaluatorTest, ShapesKeepDocumentOrder) {
    evaluate("$c = #123\nrect\ncircle\n$d = 4\nline\n");
    ASSERT_EQ(state.shapes.size(), 3u);
    EXPECT_EQ(state.shapes[0].kind, ShapeKind::Rect);
    EXPECT_EQ(state.shapes[1].kind, ShapeKind::Circle);
    EXPECT_EQ(state.shapes[2].kind, ShapeKind::Line);
}

TEST_F(EvaluatorTest, ParseErrorsAreCarriedFirst) {
    evaluate("bogus\nrect\n");
    ASSERT_EQ(state.errors.size(), 1u);
    EXPECT_EQ(state.errors[0].code, ErrorCode::ParseUnknownCommand);
    EXPECT_EQ(state.shapes.size(), 1u);
}

TEST_F(EvaluatorTest, StackChildrenDifferByHeightPlusGap) {
    evaluate("stack gap 10\n  rect size 50x30\n  rect size 50x30\n  rect size 50x30\n");
    ASSERT_EQ(state.shapes.size(), 1u);
    const auto& children = state.shapes[0].children;
    ASSERT_EQ(children.size(), 3u);
    const double y0 = props_if<RectProps>(children[0])->at->y;
    const double y1 = props_if<RectProps>(children[1])->at->y;
    const double y2 = props_if<RectProps>(children[2])->at->y;
    EXPECT_DOUBLE_EQ(y1 - y0, 40);
    EXPECT_DOUBLE_EQ(y2 - y1, 40);
}

TEST_F(EvaluatorTest, NestedLayoutsArePlacedInsideOut) {
    evaluate("row at 10,10\n"
             "  stack gap 5\n"
             "    rect size 20x20\n"
             "    rect size 20x20\n"
             "  rect size 30x30\n");
    const Shape& row = state.shapes[0];
    ASSERT_EQ(row.children.size(), 2u);

    const Shape& stack = row.children[0];
    const auto* top = props_if<RectProps>(stack.children[0]);
    const auto* bottom = props_if<RectProps>(stack.children[1]);
    EXPECT_DOUBLE_EQ(top->at->x, 10);
    EXPECT_DOUBLE_EQ(top->at->y, 10);
    EXPECT_DOUBLE_EQ(bottom->at->y, 35);

    const auto* side = props_if<RectProps>(row.children[1]);
    EXPECT_DOUBLE_EQ(side->at->x, 30) << "stack width 20 plus the row origin";
    EXPECT_DOUBLE_EQ(side->at->y, 10);
}

TEST_F(EvaluatorTest, GraphNodesPlacedAndEdgesAnchored) {
    evaluate("graph hierarchical\n"
             "  node \"a\"\n"
             "  node \"b\"\n"
             "  edge \"a\" -> \"b\"\n");
    const auto* g = props_if<GraphProps>(state.shapes[0]);
    ASSERT_NE(g, nullptr);
    ASSERT_EQ(g->nodes.size(), 2u);
    EXPECT_DOUBLE_EQ(g->nodes[0].at->y, 70);
    EXPECT_DOUBLE_EQ(g->nodes[1].at->y, 160);
    ASSERT_EQ(g->edges.size(), 1u);
    ASSERT_TRUE(g->edges[0].anchors.has_value());
    EXPECT_TRUE(g->edges[0].anchors->vertical);
    EXPECT_DOUBLE_EQ(g->edges[0].anchors->from.y, 90);
    EXPECT_DOUBLE_EQ(g->edges[0].anchors->to.y, 140);
}

TEST_F(EvaluatorTest, DuplicateNodeIsDroppedWithWarning) {
    evaluate("graph\n  node \"a\" at 0,0\n  node \"a\" at 500,500\n");
    const auto* g = props_if<GraphProps>(state.shapes[0]);
    ASSERT_EQ(g->nodes.size(), 1u);
    EXPECT_DOUBLE_EQ(g->nodes[0].at->x, 0) << "the first definition is kept";
    ASSERT_EQ(count_errors(ErrorCode::EvalInvalidShape), 1u);
    EXPECT_EQ(state.errors[0].severity, Severity::Warning);
    EXPECT_FALSE(has_errors(state.errors));
}

TEST_F(EvaluatorTest, SymbolsMayBeUsedBeforeTheirDefinition) {
    evaluate("use \"dot\" at 20,20\nsymbol \"dot\"\n  circle at 8,8 8\n");
    EXPECT_TRUE(state.errors.empty());
    ASSERT_EQ(state.shapes.size(), 2u);
}

TEST_F(EvaluatorTest, UnknownAndDuplicateSymbolsWarn) {
    evaluate("symbol \"dot\"\n  circle 8\n"
             "group\n  symbol \"dot\"\n    rect\n"
             "use \"dot\"\nuse \"ghost\"\n");
    EXPECT_EQ(count_errors(ErrorCode::EvalInvalidShape), 1u) << "second 'dot' definition";
    ASSERT_EQ(count_errors(ErrorCode::EvalMissingProperty), 1u);
    for (const auto& e : state.errors) {
        EXPECT_EQ(e.severity, Severity::Warning) << e.message;
        if (e.code == ErrorCode::EvalMissingProperty) EXPECT_EQ(e.message, "Symbol 'ghost' is not defined");
    }
    EXPECT_EQ(state.shapes.size(), 4u) << "warnings never remove shapes";
}

TEST_F(EvaluatorTest, LayoutOptionsApplyDuringEvaluation) {
    evaluate("row size 100x40 justify center align center\n  rect size 20x20\n");
    const auto* p = props_if<RectProps>(state.shapes[0].children[0]);
    ASSERT_TRUE(p && p->at);
    EXPECT_DOUBLE_EQ(p->at->x, 40);
    EXPECT_DOUBLE_EQ(p->at->y, 10);
}

TEST_F(EvaluatorTest, EdgeToMissingNodeIsRemovedSilently) {
    evaluate("graph\n  node \"a\"\n  edge \"a\" -> \"nowhere\"\n");
    const auto* g = props_if<GraphProps>(state.shapes[0]);
    EXPECT_TRUE(g->edges.empty());
    EXPECT_TRUE(state.errors.empty());
}

TEST_F(EvaluatorTest, GraphInsideStackMovesWithItsAnchors) {
    evaluate("stack at 100,0\n"
             "  rect size 10x10\n"
             "  graph\n"
             "    node \"a\" at 0,0\n"
             "    node \"b\" at 200,0\n"
             "    edge \"a\" -> \"b\"\n");
    const auto* g = props_if<GraphProps>(state.shapes[0].children[1]);
    ASSERT_NE(g, nullptr);
    EXPECT_DOUBLE_EQ(g->nodes[0].at->x, 100);
    EXPECT_DOUBLE_EQ(g->nodes[0].at->y, 10);
    ASSERT_TRUE(g->edges[0].anchors.has_value());
    EXPECT_DOUBLE_EQ(g->edges[0].anchors->from.x, 140);
    EXPECT_DOUBLE_EQ(g->edges[0].anchors->from.y, 10);
    EXPECT_DOUBLE_EQ(g->edges[0].anchors->to.x, 260);
}

TEST_F(EvaluatorTest, EvaluatorIsReusable) {
    scene_eval::Evaluator evaluator;
    auto first = dsl_parser::parse_source("bogus");
    auto second = dsl_parser::parse_source("rect");

    auto a = evaluator.evaluate(first.scene, first.errors);
    auto b = evaluator.evaluate(second.scene, second.errors);
    EXPECT_EQ(a.errors.size(), 1u);
    EXPECT_TRUE(b.errors.empty()) << "errors do not leak between runs";
    EXPECT_EQ(b.shapes.size(), 1u);
}
