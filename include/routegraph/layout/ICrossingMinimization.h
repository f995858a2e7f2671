#pragma once

#include "ILayerAssignment.h"

#include <vector>

namespace routegraph {
namespace algorithms {

/// Result of ordering nodes within their ranks
struct CrossingMinimizationResult {
    std::vector<std::vector<NodeId>> ranks;   ///< Rank -> nodes, in final order
    std::vector<int> nodeOrder;               ///< NodeId -> position within its rank
    int crossingCount = 0;                    ///< Crossings between adjacent ranks
};

/// Abstract interface for within-rank ordering
///
/// Implementations must be deterministic; reordering on every rebuild makes
/// the drawing jump around.
class ICrossingMinimization {
public:
    virtual ~ICrossingMinimization() = default;

    /// Order the nodes of every rank
    virtual CrossingMinimizationResult minimize(
        const Graph& graph,
        const LayerAssignmentResult& layers) const = 0;

    /// Count edge crossings between two adjacent ranks
    virtual int countCrossings(
        const Graph& graph,
        const std::vector<NodeId>& upperRank,
        const std::vector<NodeId>& lowerRank) const = 0;

    /// Count crossings over all pairs of adjacent ranks
    virtual int countTotalCrossings(
        const Graph& graph,
        const std::vector<std::vector<NodeId>>& ranks) const = 0;

    /// Get algorithm name for debugging/logging
    virtual const char* algorithmName() const = 0;
};

}  // namespace algorithms
}  // namespace routegraph
