#include <gtest/gtest.h>
#include <routegraph/routegraph.h>

#include "../TestRoutes.h"

#include <cstdio>
#include <fstream>
#include <sstream>
#include <utility>

using namespace routegraph;

namespace {

size_t countOccurrences(const std::string& text, const std::string& needle) {
    size_t count = 0;
    size_t pos = 0;
    while ((pos = text.find(needle, pos)) != std::string::npos) {
        ++count;
        ++pos;
    }
    return count;
}

RouteGraph laidOut(Route root, Direction direction = Direction::LeftToRight) {
    return LayeredLayout{}.layout(GraphBuilder{}.build(makeRouteTree(std::move(root))),
                                  LayoutConfig{}.setDirection(direction));
}

}  // namespace

// ============================================================================
// SvgExportTest
// ============================================================================

TEST(SvgExportTest, SampleTree_ProducesValidSvg) {
    Route root = test::sampleTree();
    SvgExport svg;
    std::string output = svg.exportToString(laidOut(root));

    EXPECT_NE(output.find("<svg"), std::string::npos);
    EXPECT_NE(output.find("</svg>"), std::string::npos);

    EXPECT_EQ(countOccurrences(output, "<rect"), 5);   // background + 4 nodes
    EXPECT_EQ(countOccurrences(output, "<path"), 3);
    EXPECT_EQ(countOccurrences(output, "<text"), 4);
}

TEST(SvgExportTest, RootFilledWithRootColor) {
    Route root = test::sampleTree();
    std::string output = SvgExport{}.exportToString(laidOut(root));

    EXPECT_NE(output.find("class=\"root\" fill=\"#2563EB\""), std::string::npos);
    EXPECT_NE(output.find("root-label"), std::string::npos);
}

TEST(SvgExportTest, BranchColorsUsedForStrokes) {
    Route root = test::sampleTree();
    std::string output = SvgExport{}.exportToString(laidOut(root));

    std::string branch = colors::branchColor(0).toHex();
    EXPECT_NE(output.find("class=\"route\" stroke=\"" + branch + "\""), std::string::npos);
    EXPECT_NE(output.find("stroke=\"" + colors::NEUTRAL_EDGE.toHex() + "\""), std::string::npos);
}

TEST(SvgExportTest, OneMarkerPerEdgeColor) {
    Route root = test::sampleTree();
    std::string output = SvgExport{}.exportToString(laidOut(root));

    // Neutral root edges plus the branch of "a"
    EXPECT_EQ(countOccurrences(output, "<marker"), 2);
    EXPECT_NE(output.find("id=\"arrow-1F2937\""), std::string::npos);
}

TEST(SvgExportTest, AnimatedEdgesAreDashed) {
    Route root = test::sampleTree();
    RouteGraph graph = laidOut(root);
    graph.edges[0].animated = false;

    std::string output = SvgExport{}.exportToString(graph);
    EXPECT_EQ(countOccurrences(output, "class=\"edge animated\""), 2);
    EXPECT_EQ(countOccurrences(output, "class=\"edge\""), 1);
}

TEST(SvgExportTest, LabelsAreEscaped) {
    Route root("home", "/search?q=<x>&y", "Search");
    std::string output = SvgExport{}.exportToString(laidOut(root));

    EXPECT_NE(output.find("/search?q=&lt;x&gt;&amp;y"), std::string::npos);
    EXPECT_EQ(output.find("<x>"), std::string::npos);
}

TEST(SvgExportTest, HideLabels) {
    SvgExportOptions options;
    options.showNodeLabels = false;
    options.embedStyles = false;

    Route root = test::sampleTree();
    std::string output = SvgExport(options).exportToString(laidOut(root));

    EXPECT_EQ(countOccurrences(output, "<text"), 0);
    EXPECT_EQ(output.find("<style>"), std::string::npos);
}

TEST(SvgExportTest, EmptyGraph_StillValidDocument) {
    std::string output = SvgExport{}.exportToString(RouteGraph{});
    EXPECT_NE(output.find("<svg"), std::string::npos);
    EXPECT_NE(output.find("</svg>"), std::string::npos);
    EXPECT_EQ(output.find("<defs>"), std::string::npos);
}

TEST(SvgExportTest, SmoothStepPath_Vertical) {
    std::string d = SvgExport::smoothStepPath({0, 0}, {100, 100}, Direction::TopToBottom, 5.0f);

    EXPECT_EQ(d.rfind("M 0 0", 0), 0u);
    EXPECT_NE(d.find("Q 0 50"), std::string::npos);     // first bend
    EXPECT_NE(d.find("Q 100 50"), std::string::npos);   // second bend
    EXPECT_NE(d.find("L 100 100"), std::string::npos);
}

TEST(SvgExportTest, SmoothStepPath_Horizontal) {
    std::string d = SvgExport::smoothStepPath({0, 0}, {100, 40}, Direction::LeftToRight, 5.0f);
    EXPECT_NE(d.find("Q 50 0"), std::string::npos);
    EXPECT_NE(d.find("Q 50 40"), std::string::npos);
}

TEST(SvgExportTest, SmoothStepPath_StraightWhenAligned) {
    std::string d = SvgExport::smoothStepPath({10, 0}, {10, 80}, Direction::TopToBottom, 5.0f);
    EXPECT_EQ(d.find("Q"), std::string::npos);
}

TEST(SvgExportTest, EscapeXml) {
    EXPECT_EQ(SvgExport::escapeXml("a<b>&\"c'"), "a&lt;b&gt;&amp;&quot;c&apos;");
    EXPECT_EQ(SvgExport::escapeXml("/plain"), "/plain");
}

TEST(SvgExportTest, ExportToFile) {
    Route root = test::sampleTree();
    RouteGraph graph = laidOut(root, Direction::TopToBottom);
    std::string path = ::testing::TempDir() + "routegraph_svg_test.svg";

    SvgExport svg;
    ASSERT_TRUE(svg.exportToFile(graph, path));

    std::ifstream file(path);
    std::stringstream buffer;
    buffer << file.rdbuf();
    EXPECT_EQ(buffer.str(), svg.exportToString(graph));
    std::remove(path.c_str());

    EXPECT_FALSE(svg.exportToFile(graph, "/nonexistent-dir/out.svg"));
}

TEST(SvgExportTest, FormatInfo) {
    SvgExport svg;
    const IExporter& exporter = svg;
    EXPECT_EQ(exporter.fileExtension(), "svg");
    EXPECT_EQ(exporter.mimeType(), "image/svg+xml");
}
