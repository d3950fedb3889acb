#include <gtest/gtest.h>
#include <scene_pipeline/pipeline.hpp>
#include <scene_render/svg_escape.hpp>
#include <scene_render/svg_renderer.hpp>
#include <string>

using namespace scene_model;

class RendererTest : public ::testing::Test {
protected:
    scene_render::RenderResult result;

    const std::string& render(const std::string& source) {
        result = scene_pipeline::render_with_errors(source);
        return result.document;
    }

    static bool contains(const std::string& haystack, const std::string& needle) {
        return haystack.find(needle) != std::string::npos;
    }

    static std::size_t occurrences(const std::string& haystack, const std::string& needle) {
        std::size_t n = 0;
        for (auto pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + 1)) ++n;
        return n;
    }
};

TEST_F(RendererTest, CanvasDeclaresSizeAndBackground) {
    const std::string& doc = render("canvas giant fill #1a1a2e");
    EXPECT_TRUE(contains(doc, "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"512\" height=\"512\">")) << doc;
    EXPECT_TRUE(contains(doc, "<rect width=\"100%\" height=\"100%\" fill=\"#1a1a2e\"/>")) << doc;
    EXPECT_FALSE(result.fallback);
}

TEST_F(RendererTest, EveryCanvasTierHasItsPixelSize) {
    const std::pair<const char*, int> tiers[] = {
        { "nano", 16 }, { "micro", 24 }, { "tiny", 32 }, { "small", 48 }, { "medium", 64 },
        { "large", 96 }, { "xlarge", 128 }, { "huge", 192 }, { "massive", 256 }, { "giant", 512 } };
    for (const auto& [name, px] : tiers) {
        const std::string& doc = render(std::string("canvas ") + name);
        const std::string expected = "width=\"" + std::to_string(px) + "\" height=\"" + std::to_string(px) + "\"";
        EXPECT_TRUE(contains(doc, expected)) << name << ": " << doc;
    }
}

TEST_F(RendererTest, DefaultCanvasIsMediumWhite) {
    const std::string& doc = render("");
    EXPECT_TRUE(contains(doc, "width=\"64\" height=\"64\""));
    EXPECT_TRUE(contains(doc, "fill=\"#fff\""));
    EXPECT_EQ(doc.rfind("</svg>"), doc.size() - 6);
}

TEST_F(RendererTest, RectElement) {
    const std::string& doc = render("rect at 10,10 size 100x50\n  fill #f00");
    EXPECT_TRUE(contains(doc, "<rect x=\"10\" y=\"10\" width=\"100\" height=\"50\" fill=\"#f00\"/>")) << doc;
}

TEST_F(RendererTest, NumbersAreWrittenInFixedNotation) {
    const std::string& doc = render("rect at 0.00001,-0 size 100000000000000000000x50");
    EXPECT_TRUE(contains(doc, "<rect x=\"0.00001\" y=\"0\" width=\"100000000000000000000\" height=\"50\"")) << doc;

    const std::string& line = render("line from -0.000002,-1500000000000 to 0.5,3");
    EXPECT_TRUE(contains(line, "x1=\"-0.000002\" y1=\"-1500000000000\" x2=\"0.5\" y2=\"3\"")) << line;
    EXPECT_FALSE(contains(line, "e+")) << line;
    EXPECT_FALSE(contains(line, "e-")) << line;
}

TEST_F(RendererTest, FormatNumberIsShortestFixed) {
    EXPECT_EQ(format_number(10), "10");
    EXPECT_EQ(format_number(0.5), "0.5");
    EXPECT_EQ(format_number(-0.0), "0");
    EXPECT_EQ(format_number(1e20), "100000000000000000000");
    EXPECT_EQ(format_number(1e-5), "0.00001");
    EXPECT_EQ(format_number(-2.25e-7), "-0.000000225");
    EXPECT_EQ(format_number(0.1 + 0.2), "0.30000000000000004");
}

TEST_F(RendererTest, UnknownCommandStillProducesDocument) {
    const std::string& doc = render("unknown_shape at 50,50");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].code, ErrorCode::ParseUnknownCommand);
    EXPECT_EQ(doc.find("<svg"), 0u);
    EXPECT_EQ(doc.rfind("</svg>"), doc.size() - 6);
    EXPECT_EQ(occurrences(doc, "<rect"), 1u) << "only the background";
}

TEST_F(RendererTest, PrimitiveElements) {
    const std::string& doc = render("circle at 5,6 7\n"
                                    "ellipse at 1,2 radius 3,4\n"
                                    "line from 0,0 to 10,10\n"
                                    "path \"M0 0 L5 5\"\n"
                                    "polygon [0,0 10,0 5,5]\n"
                                    "image at 1,1 size 20x20 href \"a.png\"\n");
    EXPECT_TRUE(contains(doc, "<circle cx=\"5\" cy=\"6\" r=\"7\"/>")) << doc;
    EXPECT_TRUE(contains(doc, "<ellipse cx=\"1\" cy=\"2\" rx=\"3\" ry=\"4\"/>")) << doc;
    EXPECT_TRUE(contains(doc, "<line x1=\"0\" y1=\"0\" x2=\"10\" y2=\"10\" stroke=\"#000\"/>")) << doc;
    EXPECT_TRUE(contains(doc, "<path d=\"M0 0 L5 5\"/>")) << doc;
    EXPECT_TRUE(contains(doc, "<polygon points=\"0,0 10,0 5,5\"/>")) << doc;
    EXPECT_TRUE(contains(doc, "<image x=\"1\" y=\"1\" width=\"20\" height=\"20\" href=\"a.png\"/>")) << doc;
}

TEST_F(RendererTest, StyleAndTransformAttributes) {
    const std::string& doc = render("rect\n"
                                    "  stroke #000 2\n"
                                    "  opacity 0.5\n"
                                    "  corner 4\n"
                                    "  translate 10,20\n"
                                    "  rotate 45\n"
                                    "  origin 5,5\n"
                                    "  scale 2\n");
    EXPECT_TRUE(contains(doc, " rx=\"4\"")) << doc;
    EXPECT_TRUE(contains(doc, " stroke=\"#000\" stroke-width=\"2\" opacity=\"0.5\"")) << doc;
    EXPECT_TRUE(contains(doc, " transform=\"translate(10,20) rotate(45,5,5) scale(2,2)\"")) << doc;
}

TEST_F(RendererTest, TextIsEscaped) {
    const std::string& doc = render("text \"a<b & c\" at 10,20\n  bold\n  center");
    EXPECT_TRUE(contains(doc, ">a&lt;b &amp; c</text>")) << doc;
    EXPECT_TRUE(contains(doc, "font-weight=\"bold\" text-anchor=\"middle\"")) << doc;
    EXPECT_TRUE(contains(doc, "fill=\"#000\"")) << "text defaults to a black fill";
}

TEST_F(RendererTest, GradientAndShadowGoIntoDefinitions) {
    const std::string& doc = render("rect\n  gradient #f00 #00f\n  shadow 2,2 4 #000\n");
    EXPECT_TRUE(contains(doc, "fill=\"url(#d1)\"")) << doc;
    EXPECT_TRUE(contains(doc, "filter=\"url(#d2)\"")) << doc;
    EXPECT_TRUE(contains(doc, "<linearGradient id=\"d1\"")) << doc;
    EXPECT_TRUE(contains(doc, "<filter id=\"d2\"")) << doc;
    EXPECT_TRUE(contains(doc, "stdDeviation=\"4\"")) << doc;
    EXPECT_LT(doc.find("<defs>"), doc.find("<rect x=")) << "definitions come before shapes";
    EXPECT_EQ(result.resources.size(), 2u);
}

TEST_F(RendererTest, NoDefinitionsWithoutResources) {
    const std::string& doc = render("rect\n  fill #f00");
    EXPECT_FALSE(contains(doc, "<defs>"));
    EXPECT_TRUE(result.resources.empty());
}

TEST_F(RendererTest, ResourceIdsRestartForEveryRender) {
    const std::string source = "circle\n  gradient radial #fff #000\n";
    const std::string first = render(source);
    const std::string second = render(source);
    EXPECT_TRUE(contains(second, "<radialGradient id=\"d1\""));
    EXPECT_FALSE(contains(second, "d2"));
    EXPECT_EQ(first, second);
}

TEST_F(RendererTest, RenderingIsDeterministic) {
    const std::string source = "canvas large\n"
                               "$c = #e94560\n"
                               "stack gap 4\n  rect size 10x10\n    fill $c\n  circle 5\n"
                               "graph grid\n  node \"a\"\n  node \"b\"\n  edge \"a\" -> \"b\" curved\n";
    const std::string first = render(source);
    for (int i = 0; i < 3; ++i) EXPECT_EQ(render(source), first);
}

TEST_F(RendererTest, GroupsWrapChildren) {
    const std::string& doc = render("group \"g\"\n  rect\n  circle\n  opacity 0.5\n");
    EXPECT_TRUE(contains(doc, "<g opacity=\"0.5\"><rect")) << doc;
    EXPECT_TRUE(contains(doc, "/></g>")) << doc;
}

TEST_F(RendererTest, GraphNodesAndStraightEdge) {
    const std::string& doc = render("graph\n"
                                    "  node \"a\" at 0,0 label \"A\"\n"
                                    "  node \"b\" at 0,200\n"
                                    "  edge \"a\" -> \"b\"\n");
    EXPECT_TRUE(contains(doc, "<path d=\"M 0 20 L 0 180\" fill=\"none\" stroke=\"#333\" stroke-width=\"2\"/>")) << doc;
    EXPECT_TRUE(contains(doc, "<polygon points=\"0,180 ")) << "arrowhead tip sits on the target anchor";
    EXPECT_TRUE(contains(doc, "<rect x=\"-40\" y=\"-20\" width=\"80\" height=\"40\" fill=\"#fff\" stroke=\"#333\"/>")) << doc;
    EXPECT_TRUE(contains(doc, ">A</text>")) << doc;
    EXPECT_LT(doc.find("<path"), doc.find("<rect x=\"-40\"")) << "edges are drawn under nodes";
}

TEST_F(RendererTest, CurvedAndOrthogonalConnectors) {
    const std::string& curved = render("graph\n"
                                       "  node \"a\" at 0,0\n"
                                       "  node \"b\" at 200,50\n"
                                       "  edge \"a\" -> \"b\" curved none\n");
    EXPECT_TRUE(contains(curved, "d=\"M 40 0 Q 100 0 160 50\"")) << curved;
    EXPECT_FALSE(contains(curved, "<polygon")) << "no arrowhead";

    const std::string& ortho = render("graph\n"
                                      "  node \"a\" at 0,0\n"
                                      "  node \"b\" at 200,50\n"
                                      "  edge \"a\" -> \"b\" orthogonal both\n");
    EXPECT_TRUE(contains(ortho, "d=\"M 40 0 L 100 0 L 100 50 L 160 50\"")) << ortho;
    EXPECT_EQ(occurrences(ortho, "<polygon"), 2u);
}

TEST_F(RendererTest, NodeShapes) {
    const std::string& doc = render("graph\n"
                                    "  node \"c\" at 0,0 shape circle\n"
                                    "  node \"e\" at 100,0 shape ellipse\n"
                                    "  node \"d\" at 200,0 shape diamond\n");
    EXPECT_TRUE(contains(doc, "<circle cx=\"0\" cy=\"0\" r=\"20\"")) << doc;
    EXPECT_TRUE(contains(doc, "<ellipse cx=\"100\" cy=\"0\" rx=\"40\" ry=\"20\"")) << doc;
    EXPECT_TRUE(contains(doc, "<polygon points=\"200,-20 240,0 200,20 160,0\"")) << doc;
}

TEST_F(RendererTest, SymbolsGoIntoDefinitionsAndUsesReferenceThem) {
    const std::string& doc = render("symbol \"star\" viewbox 0,0 24,24\n"
                                    "  polygon [12,2 22,9 2,9] #f59e0b\n"
                                    "use \"star\" at 8,20 48x48\n"
                                    "use \"star\" at 32,20\n"
                                    "  scale 1.5\n");
    EXPECT_TRUE(contains(doc, "<defs><symbol id=\"star\" viewBox=\"0 0 24 24\">"
                              "<polygon points=\"12,2 22,9 2,9\" fill=\"#f59e0b\"/></symbol></defs>")) << doc;
    EXPECT_TRUE(contains(doc, "<use href=\"#star\" x=\"8\" y=\"20\" width=\"48\" height=\"48\"/>")) << doc;
    EXPECT_TRUE(contains(doc, "<use href=\"#star\" x=\"32\" y=\"20\" transform=\"scale(1.5,1.5)\"/>")) << doc;
    EXPECT_EQ(occurrences(doc, "<polygon"), 1u) << "symbol content is written once";
    EXPECT_LT(doc.find("</defs>"), doc.find("<use")) << doc;
}

TEST_F(RendererTest, SymbolDefinitionsShareDefsWithResources) {
    const std::string& doc = render("symbol \"s\"\n  rect\n    gradient #f00 #00f\n"
                                    "symbol \"s\"\n  circle\n");
    EXPECT_EQ(occurrences(doc, "<defs>"), 1u) << doc;
    EXPECT_LT(doc.find("<linearGradient"), doc.find("<symbol")) << doc;
    EXPECT_EQ(occurrences(doc, "<symbol"), 1u) << "the first definition wins";
    EXPECT_FALSE(contains(doc, "<circle")) << doc;
}

TEST_F(RendererTest, DeepNestingFallsBackToErrorDocument) {
    std::string source;
    for (int depth = 0; depth < 70; ++depth) source += std::string(static_cast<std::size_t>(depth) * 2, ' ') + "group\n";
    source += std::string(140, ' ') + "rect\n";

    const std::string& doc = render(source);
    EXPECT_TRUE(result.fallback);
    ASSERT_FALSE(result.errors.empty());
    EXPECT_EQ(result.errors.back().code, ErrorCode::RenderFailed);
    EXPECT_EQ(result.errors.back().recovery, RecoveryAction::FallbackDocument);
    EXPECT_TRUE(contains(doc, "Render Error: maximum nesting depth exceeded")) << doc;
    EXPECT_EQ(doc.rfind("</svg>"), doc.size() - 6);
}

TEST_F(RendererTest, ModerateNestingRendersNormally) {
    std::string source;
    for (int depth = 0; depth < 10; ++depth) source += std::string(static_cast<std::size_t>(depth) * 2, ' ') + "group\n";
    const std::string& doc = render(source);
    EXPECT_FALSE(result.fallback);
    EXPECT_EQ(occurrences(doc, "<g>"), 10u);
}

TEST_F(RendererTest, ErrorDocumentEscapesMessage) {
    Canvas canvas;
    canvas.size = CanvasSize::Small;
    const std::string doc = scene_render::render_error_document(canvas, "bad <input> & more");
    EXPECT_TRUE(contains(doc, "width=\"48\""));
    EXPECT_TRUE(contains(doc, "Render Error: bad &lt;input&gt; &amp; more"));
}

TEST_F(RendererTest, EscapeHelpers) {
    EXPECT_EQ(scene_render::escape_text("\"a\" & <b>"), "\"a\" &amp; &lt;b&gt;");
    EXPECT_EQ(scene_render::escape_attribute("\"a\" & <b>"), "&quot;a&quot; &amp; &lt;b&gt;");
}
