#include "routegraph/layout/LayeredLayout.h"
#include "routegraph/common/Logger.h"
#include "layered/CoordinateAssignment.h"
#include "layered/CrossingMinimization.h"
#include "layered/LayerAssignment.h"

#include <algorithm>

namespace routegraph {

namespace {

    /// Offset of the index-th of `count` attach points spread `separation`
    /// apart and centered on the side, clamped to the side itself
    float spreadOffset(size_t index, size_t count, float separation, float sideLength) {
        if (count <= 1) {
            return 0.0f;
        }
        float offset = (static_cast<float>(index) - static_cast<float>(count - 1) / 2.0f) * separation;
        float limit = sideLength / 2.0f;
        return std::clamp(offset, -limit, limit);
    }

    Point sidePoint(const GraphNode& node, NodeSide side, float offset) {
        Point c = node.center();
        switch (side) {
            case NodeSide::Top: return {c.x + offset, node.y};
            case NodeSide::Bottom: return {c.x + offset, node.y + node.height};
            case NodeSide::Left: return {node.x, c.y + offset};
            case NodeSide::Right: return {node.x + node.width, c.y + offset};
        }
        return c;
    }

    float sideLength(const GraphNode& node, NodeSide side) {
        return (side == NodeSide::Top || side == NodeSide::Bottom) ? node.width : node.height;
    }

}  // namespace

LayeredLayout::LayeredLayout()
    : LayeredLayout(LayoutConfig{}) {}

LayeredLayout::LayeredLayout(const LayoutConfig& config)
    : config_(config)
    , layerAssignment_(std::make_shared<algorithms::LongestPathLayerAssignment>())
    , crossingMinimization_(std::make_shared<algorithms::DepthFirstOrdering>())
    , coordinateAssignment_(std::make_shared<algorithms::SubtreeCenteringCoordinateAssignment>()) {}

LayeredLayout::~LayeredLayout() = default;

LayeredLayout::LayeredLayout(LayeredLayout&&) noexcept = default;
LayeredLayout& LayeredLayout::operator=(LayeredLayout&&) noexcept = default;

void LayeredLayout::setLayerAssignment(std::shared_ptr<algorithms::ILayerAssignment> impl) {
    if (impl) layerAssignment_ = std::move(impl);
}

void LayeredLayout::setCrossingMinimization(std::shared_ptr<algorithms::ICrossingMinimization> impl) {
    if (impl) crossingMinimization_ = std::move(impl);
}

void LayeredLayout::setCoordinateAssignment(std::shared_ptr<algorithms::ICoordinateAssignment> impl) {
    if (impl) coordinateAssignment_ = std::move(impl);
}

RouteGraph LayeredLayout::layout(RouteGraph graph) {
    return layout(std::move(graph), config_);
}

RouteGraph LayeredLayout::layout(RouteGraph graph, const LayoutConfig& config) {
    layout(graph.nodes, graph.edges, config);
    graph.direction = config.direction;
    return graph;
}

void LayeredLayout::layout(std::vector<GraphNode>& nodes, std::vector<GraphEdge>& edges,
                           const LayoutConfig& config) {
    // Reject bad configuration before touching anything
    config.validate();

    // Fresh working graph for this call only. NodeId i is nodes[i], EdgeId j is edges[j].
    Graph working;
    for (const auto& node : nodes) {
        working.addNode(node.id, config.nodeSize());
    }
    for (const auto& edge : edges) {
        working.addEdge(edge.source, edge.target, edge.id);
    }

    if (nodes.empty()) {
        stats_ = LayoutStats{};
        return;
    }

    // Phase 1: Rank assignment
    algorithms::LayerAssignmentResult layers = layerAssignment_->assignLayers(working);

    // Phase 2: Ordering within ranks
    algorithms::CrossingMinimizationResult ordering =
        crossingMinimization_->minimize(working, layers);

    // Phase 3: Coordinates
    algorithms::CoordinateAssignmentResult coords =
        coordinateAssignment_->assign(working, layers, ordering, config);

    const NodeSide inSide = targetSide(config.direction);
    const NodeSide outSide = sourceSide(config.direction);

    for (NodeId id : working.nodes()) {
        GraphNode& node = nodes[id];
        node.rank = layers.nodeRank[id];
        node.orderInRank = ordering.nodeOrder[id];
        node.width = config.nodeWidth;
        node.height = config.nodeHeight;
        node.x = coords.centers[id].x - config.nodeWidth / 2.0f;
        node.y = coords.centers[id].y - config.nodeHeight / 2.0f;
        node.targetSide = inSide;
        node.sourceSide = outSide;
    }

    // Phase 4: Anchor points. Edges sharing a side are spread in the order of
    // their far endpoints so they leave the side without crossing.
    auto byFarEnd = [&](bool outgoing) {
        return [&, outgoing](EdgeId a, EdgeId b) {
            const EdgeData& ea = working.getEdge(a);
            const EdgeData& eb = working.getEdge(b);
            NodeId fa = outgoing ? ea.to : ea.from;
            NodeId fb = outgoing ? eb.to : eb.from;
            if (ordering.nodeOrder[fa] != ordering.nodeOrder[fb]) {
                return ordering.nodeOrder[fa] < ordering.nodeOrder[fb];
            }
            return a < b;
        };
    };

    for (NodeId id : working.nodes()) {
        const GraphNode& node = nodes[id];

        std::vector<EdgeId> out = working.outEdges(id);
        std::sort(out.begin(), out.end(), byFarEnd(true));
        for (size_t i = 0; i < out.size(); ++i) {
            float offset = spreadOffset(i, out.size(), config.edgeSeparation, sideLength(node, outSide));
            edges[out[i]].sourcePoint = sidePoint(node, outSide, offset);
        }

        std::vector<EdgeId> in = working.inEdges(id);
        std::sort(in.begin(), in.end(), byFarEnd(false));
        for (size_t i = 0; i < in.size(); ++i) {
            float offset = spreadOffset(i, in.size(), config.edgeSeparation, sideLength(node, inSide));
            edges[in[i]].targetPoint = sidePoint(node, inSide, offset);
        }
    }

    stats_ = LayoutStats{};
    stats_.rankCount = layers.rankCount;
    stats_.edgeCrossings = ordering.crossingCount;
    for (const auto& rank : ordering.ranks) {
        stats_.maxRankWidth = std::max(stats_.maxRankWidth, static_cast<int>(rank.size()));
    }

    LOG_DEBUG("Layout {} using {}/{}/{}: {} nodes, {} ranks, widest rank {}, {} crossings",
              toString(config.direction),
              layerAssignment_->algorithmName(),
              crossingMinimization_->algorithmName(),
              coordinateAssignment_->algorithmName(),
              nodes.size(), stats_.rankCount, stats_.maxRankWidth, stats_.edgeCrossings);
}

}  // namespace routegraph
