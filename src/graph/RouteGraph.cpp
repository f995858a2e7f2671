#include "routegraph/graph/RouteGraph.h"

#include <algorithm>
#include <limits>

namespace routegraph {

const char* toString(NodeKind kind) {
    return kind == NodeKind::Root ? "root" : "route";
}

const GraphNode* RouteGraph::root() const {
    for (const auto& node : nodes) {
        if (node.isRoot()) {
            return &node;
        }
    }
    return nullptr;
}

const GraphNode* RouteGraph::findNode(const std::string& id) const {
    auto it = std::find_if(nodes.begin(), nodes.end(),
                           [&id](const GraphNode& n) { return n.id == id; });
    return it != nodes.end() ? &*it : nullptr;
}

const GraphEdge* RouteGraph::findEdge(const std::string& id) const {
    auto it = std::find_if(edges.begin(), edges.end(),
                           [&id](const GraphEdge& e) { return e.id == id; });
    return it != edges.end() ? &*it : nullptr;
}

RoutePtr RouteGraph::routeOf(const GraphNode& node) const {
    if (!node.route || !tree) {
        return nullptr;
    }
    return aliasRoute(tree, *node.route);
}

Rect RouteGraph::bounds(float padding) const {
    if (nodes.empty()) {
        return {};
    }

    float minX = std::numeric_limits<float>::max();
    float minY = std::numeric_limits<float>::max();
    float maxX = std::numeric_limits<float>::lowest();
    float maxY = std::numeric_limits<float>::lowest();

    for (const auto& node : nodes) {
        minX = std::min(minX, node.x);
        minY = std::min(minY, node.y);
        maxX = std::max(maxX, node.x + node.width);
        maxY = std::max(maxY, node.y + node.height);
    }

    return Rect{minX, minY, maxX - minX, maxY - minY}.expanded(padding);
}

int RouteGraph::rankCount() const {
    int maxRank = -1;
    for (const auto& node : nodes) {
        maxRank = std::max(maxRank, node.rank);
    }
    return maxRank + 1;
}

}  // namespace routegraph
