#pragma once

#include "RouteGraph.h"

namespace routegraph {

/// Turns a route tree into a flat list of nodes and parent-to-child edges.
///
/// Traversal is pre-order: the root becomes node "1" and every child takes the
/// next free sequence number before its own children are visited. Edge ids are
/// "e<parentId><childId>".
///
/// Colors encode branch membership:
/// - the root uses colors::ROOT
/// - the n-th child of the root uses colors::branchColor(n)
/// - deeper nodes inherit their parent's color
/// Edges leaving the root are colors::NEUTRAL_EDGE, every other edge takes the
/// color of the branch it belongs to.
///
/// The input tree is never modified. Positions are left at zero; run the
/// result through LayeredLayout.
class GraphBuilder {
public:
    GraphBuilder() = default;

    /// Build a graph that shares ownership of `tree`.
    /// @throws StructuralViolation if a route id occurs twice in the tree
    /// @throws std::invalid_argument if `tree` is null
    RouteGraph build(const RoutePtr& tree) const;

    /// Build a graph that points into `root` without owning it.
    ///
    /// Every GraphNode::route of the result points into `root`, and the
    /// result's `tree` stays null. The caller keeps `root` alive, unmoved and
    /// unmodified for as long as the graph or any copy of it is read. Use the
    /// RoutePtr overload when the graph must outlive the caller's tree.
    /// @throws StructuralViolation if a route id occurs twice in the tree
    RouteGraph build(const Route& root) const;

    /// A temporary tree would be gone before the graph is read
    RouteGraph build(Route&& root) const = delete;
    RouteGraph build(const Route&& root) const = delete;
};

}  // namespace routegraph
