#pragma once

#include "routegraph/layout/ICrossingMinimization.h"

namespace routegraph {
namespace algorithms {

/// Orders each rank by depth-first discovery from the sources.
///
/// Sources are visited in insertion order and every node follows its outgoing
/// edges in insertion order (for a route graph: the declaration order of the
/// child routes). A node takes the next free position of its rank the first
/// time it is reached. On a tree this never produces a crossing, and unlike a
/// barycenter sweep it cannot reshuffle siblings between rebuilds.
class DepthFirstOrdering : public ICrossingMinimization {
public:
    DepthFirstOrdering() = default;

    const char* algorithmName() const override { return "DepthFirst"; }

    CrossingMinimizationResult minimize(
        const Graph& graph,
        const LayerAssignmentResult& layers) const override;

    int countCrossings(
        const Graph& graph,
        const std::vector<NodeId>& upperRank,
        const std::vector<NodeId>& lowerRank) const override;

    int countTotalCrossings(
        const Graph& graph,
        const std::vector<std::vector<NodeId>>& ranks) const override;
};

}  // namespace algorithms
}  // namespace routegraph
