#pragma once

#include "../graph/RouteGraph.h"
#include "IExporter.h"

#include <ostream>
#include <string>

namespace routegraph {

/// Options for SVG export
struct SvgExportOptions {
    // Canvas settings
    float padding = 20.0f;
    std::string backgroundColor = "white";

    // Node styling. Fill comes from each node's color.
    std::string routeFill = "#F9FAFB";
    std::string routeText = "#374151";
    std::string rootText = "#FFFFFF";
    float nodeStrokeWidth = 2.0f;
    float nodeCornerRadius = 2.0f;
    float markerRadius = 4.0f;      // Dot drawn left of the label

    // Edge styling. Stroke comes from each edge's color.
    float edgeStrokeWidth = 1.5f;
    float edgeCornerRadius = 5.0f;  // Rounding of smooth-step bends
    std::string animatedDasharray = "5,5";

    // Text styling
    std::string fontFamily = "Arial, sans-serif";
    float fontSize = 12.0f;

    bool showNodeLabels = true;

    // Include CSS styling
    bool embedStyles = true;
};

/// Renders a positioned route graph to SVG.
///
/// The root is filled with its color and labelled in white. Other routes get a
/// light box whose border and marker dot carry the branch color. Edges are
/// drawn as smooth-step paths between their anchor points, dashed when
/// animated.
class SvgExport : public IExporter {
public:
    SvgExport() = default;
    explicit SvgExport(const SvgExportOptions& options);
    ~SvgExport() override = default;

    std::string exportToString(const RouteGraph& graph) override;
    void exportToStream(const RouteGraph& graph, std::ostream& out) override;
    bool exportToFile(const RouteGraph& graph, const std::string& filename) override;

    std::string fileExtension() const override { return "svg"; }
    std::string mimeType() const override { return "image/svg+xml"; }

    void setOptions(const SvgExportOptions& options) { options_ = options; }
    const SvgExportOptions& options() const { return options_; }

    /// Escape XML special characters
    static std::string escapeXml(const std::string& text);

    /// SVG path data for a smooth-step connector between two anchors.
    /// The path leaves `source` along the layout direction, turns once halfway
    /// and enters `target` along the same direction.
    static std::string smoothStepPath(Point source, Point target, Direction direction,
                                      float cornerRadius);

private:
    SvgExportOptions options_;

    /// XML prolog, <svg> element sized to `canvas` and its background
    void openDocument(std::ostream& out, const Rect& canvas);
    void writeStyles(std::ostream& out);
    void writeMarkers(std::ostream& out, const RouteGraph& graph);

    void writeNode(std::ostream& out, const GraphNode& node);
    void writeEdge(std::ostream& out, const GraphEdge& edge, Direction direction);
};

}  // namespace routegraph
