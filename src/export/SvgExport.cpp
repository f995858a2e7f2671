#include "routegraph/export/SvgExport.h"

#include <algorithm>
#include <fstream>
#include <set>
#include <sstream>
#include <vector>

namespace routegraph {

namespace {

    std::string markerId(const Color& color) {
        std::string hex = color.toHex();
        return "arrow-" + hex.substr(1);
    }

    Point towards(Point from, Point to, float distance) {
        float length = from.distanceTo(to);
        if (length <= 0.0f) {
            return from;
        }
        return from + (to - from) * (distance / length);
    }

}  // namespace

SvgExport::SvgExport(const SvgExportOptions& options)
    : options_(options) {}

std::string SvgExport::exportToString(const RouteGraph& graph) {
    std::ostringstream out;
    exportToStream(graph, out);
    return out.str();
}

void SvgExport::exportToStream(const RouteGraph& graph, std::ostream& out) {
    openDocument(out, graph.bounds(options_.padding));
    writeStyles(out);
    writeMarkers(out, graph);

    // Nodes paint over the ends of their edges
    for (const auto& edge : graph.edges) {
        writeEdge(out, edge, graph.direction);
    }
    for (const auto& node : graph.nodes) {
        writeNode(out, node);
    }

    out << "</svg>\n";
}

bool SvgExport::exportToFile(const RouteGraph& graph, const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }
    exportToStream(graph, file);
    return true;
}

void SvgExport::openDocument(std::ostream& out, const Rect& canvas) {
    std::ostringstream box;
    box << "width=\"" << canvas.width << "\" height=\"" << canvas.height << "\"";

    out << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
        << "<svg xmlns=\"http://www.w3.org/2000/svg\" " << box.str() << " viewBox=\""
        << canvas.x << " " << canvas.y << " " << canvas.width << " " << canvas.height << "\">\n"
        << "  <rect x=\"" << canvas.x << "\" y=\"" << canvas.y << "\" " << box.str()
        << " fill=\"" << options_.backgroundColor << "\"/>\n";
}

void SvgExport::writeStyles(std::ostream& out) {
    if (!options_.embedStyles) return;

    const auto& o = options_;
    out << "  <style>\n"
        << "    .route { fill: " << o.routeFill << "; stroke-width: " << o.nodeStrokeWidth << "; }\n"
        << "    .root { stroke-width: " << o.nodeStrokeWidth << "; }\n"
        << "    .edge { fill: none; stroke-width: " << o.edgeStrokeWidth << "; }\n"
        << "    .animated { stroke-dasharray: " << o.animatedDasharray << "; }\n"
        << "    .label { font-family: " << o.fontFamily << "; font-size: " << o.fontSize
        << "px; font-weight: bold; dominant-baseline: central; }\n"
        << "    .route-label { fill: " << o.routeText << "; }\n"
        << "    .root-label { fill: " << o.rootText << "; }\n"
        << "  </style>\n";
}

void SvgExport::writeMarkers(std::ostream& out, const RouteGraph& graph) {
    // One arrowhead per edge color, in a stable order
    std::set<uint32_t> rgbs;
    for (const auto& edge : graph.edges) {
        rgbs.insert(edge.color.toRgb());
    }
    if (rgbs.empty()) return;

    out << "  <defs>\n";
    for (uint32_t rgb : rgbs) {
        Color color = Color::fromRgb(rgb);
        out << "    <marker id=\"" << markerId(color) << "\" markerWidth=\"10\" markerHeight=\"7\" "
            << "refX=\"9\" refY=\"3.5\" orient=\"auto\">\n";
        out << "      <polygon points=\"0 0, 10 3.5, 0 7\" fill=\"" << color.toHex() << "\"/>\n";
        out << "    </marker>\n";
    }
    out << "  </defs>\n";
}

void SvgExport::writeNode(std::ostream& out, const GraphNode& node) {
    const std::string color = node.color.toHex();

    out << "  <g class=\"node\" id=\"node-" << escapeXml(node.id) << "\">\n";
    if (node.isRoot()) {
        out << "    <rect class=\"root\" fill=\"" << color << "\" stroke=\"" << color << "\" ";
    } else {
        out << "    <rect class=\"route\" stroke=\"" << color << "\" ";
    }
    out << "x=\"" << node.x << "\" "
        << "y=\"" << node.y << "\" "
        << "width=\"" << node.width << "\" "
        << "height=\"" << node.height << "\" "
        << "rx=\"" << options_.nodeCornerRadius << "\"/>\n";

    // Marker dot, then the label to its right
    float padding = node.height / 3.0f;
    Point c = node.center();
    float dotX = node.x + padding + options_.markerRadius;
    out << "    <circle cx=\"" << dotX << "\" cy=\"" << c.y << "\" "
        << "r=\"" << options_.markerRadius << "\" "
        << "fill=\"" << (node.isRoot() ? options_.rootText : color) << "\"/>\n";

    if (options_.showNodeLabels && !node.label.empty()) {
        out << "    <text class=\"label " << (node.isRoot() ? "root-label" : "route-label") << "\" "
            << "x=\"" << dotX + options_.markerRadius + padding << "\" "
            << "y=\"" << c.y << "\">"
            << escapeXml(node.label) << "</text>\n";
    }
    out << "  </g>\n";
}

void SvgExport::writeEdge(std::ostream& out, const GraphEdge& edge, Direction direction) {
    out << "  <path class=\"edge" << (edge.animated ? " animated" : "") << "\" "
        << "id=\"" << escapeXml(edge.id) << "\" "
        << "stroke=\"" << edge.color.toHex() << "\" "
        << "d=\"" << smoothStepPath(edge.sourcePoint, edge.targetPoint, direction,
                                    options_.edgeCornerRadius) << "\" "
        << "marker-end=\"url(#" << markerId(edge.color) << ")\"/>\n";
}

std::string SvgExport::smoothStepPath(Point source, Point target, Direction direction,
                                      float cornerRadius) {
    std::vector<Point> points;
    points.push_back(source);
    if (isHorizontal(direction)) {
        float midX = (source.x + target.x) / 2.0f;
        points.push_back({midX, source.y});
        points.push_back({midX, target.y});
    } else {
        float midY = (source.y + target.y) / 2.0f;
        points.push_back({source.x, midY});
        points.push_back({target.x, midY});
    }
    points.push_back(target);

    std::ostringstream d;
    d << "M " << source.x << " " << source.y;

    for (size_t i = 1; i + 1 < points.size(); ++i) {
        Point prev = points[i - 1];
        Point corner = points[i];
        Point next = points[i + 1];

        float r = std::min({cornerRadius,
                            prev.distanceTo(corner) / 2.0f,
                            corner.distanceTo(next) / 2.0f});
        if (r <= 0.0f) {
            // Straight run through this point
            d << " L " << corner.x << " " << corner.y;
            continue;
        }

        Point before = towards(corner, prev, r);
        Point after = towards(corner, next, r);
        d << " L " << before.x << " " << before.y
          << " Q " << corner.x << " " << corner.y << " " << after.x << " " << after.y;
    }

    d << " L " << target.x << " " << target.y;
    return d.str();
}

std::string SvgExport::escapeXml(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': escaped += "&amp;"; break;
            case '<': escaped += "&lt;"; break;
            case '>': escaped += "&gt;"; break;
            case '"': escaped += "&quot;"; break;
            case '\'': escaped += "&apos;"; break;
            default: escaped += c; break;
        }
    }
    return escaped;
}

}  // namespace routegraph
