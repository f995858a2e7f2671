#pragma once

#include "../core/Color.h"
#include "../core/Route.h"
#include "../core/Types.h"
#include "../layout/LayoutConfig.h"

#include <string>
#include <vector>

namespace routegraph {

enum class NodeKind {
    Root,      ///< The single node without incoming edges
    Internal   ///< Every other route
};

/// "root" or "route"
const char* toString(NodeKind kind);

/// Node of a route graph.
///
/// `id` is a pre-order sequence number valid for one build pass only. Two
/// builds of the same tree give the same ids, but consumers must not keep
/// them past the snapshot they came from.
struct GraphNode {
    std::string id;
    NodeKind kind = NodeKind::Internal;
    const Route* route = nullptr;   ///< Owned by RouteGraph::tree, or by the caller when tree is null
    std::string label;              ///< Text shown on the node (the route path)
    int depth = 0;                  ///< Distance from the root in the route tree

    // Written by the layout engine
    int rank = 0;
    int orderInRank = 0;
    float x = 0.0f;                 ///< Top-left corner
    float y = 0.0f;
    float width = 0.0f;
    float height = 0.0f;
    NodeSide targetSide = NodeSide::Left;
    NodeSide sourceSide = NodeSide::Right;

    Color color;

    bool isRoot() const { return kind == NodeKind::Root; }
    Point position() const { return {x, y}; }
    Rect bounds() const { return {x, y, width, height}; }
    Point center() const { return {x + width / 2, y + height / 2}; }
};

/// Parent to child edge
struct GraphEdge {
    std::string id;
    std::string source;
    std::string target;
    Color color;
    bool animated = true;

    // Written by the layout engine: attach points on the anchor sides
    Point sourcePoint;
    Point targetPoint;
};

/// Positioned snapshot handed to the rendering surface.
///
/// Keeps the route tree it was built from alive so every GraphNode::route
/// stays valid for as long as the snapshot exists. A rebuild produces a new
/// snapshot; snapshots are never patched in place.
struct RouteGraph {
    std::vector<GraphNode> nodes;
    std::vector<GraphEdge> edges;
    Direction direction = Direction::LeftToRight;
    RoutePtr tree;

    bool empty() const { return nodes.empty(); }

    /// The root node, or nullptr for an empty graph
    const GraphNode* root() const;

    const GraphNode* findNode(const std::string& id) const;
    const GraphEdge* findEdge(const std::string& id) const;

    /// Handle to a node's route that shares the snapshot's tree lifetime
    RoutePtr routeOf(const GraphNode& node) const;

    /// Bounding box of all node boxes, optionally padded
    Rect bounds(float padding = 0.0f) const;

    int rankCount() const;
};

}  // namespace routegraph
