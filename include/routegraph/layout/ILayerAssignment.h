#pragma once

#include "../core/Graph.h"
#include "../core/Types.h"

#include <vector>

namespace routegraph {
namespace algorithms {

/// Result of layer (rank) assignment
struct LayerAssignmentResult {
    std::vector<int> nodeRank;                ///< NodeId -> rank
    int rankCount = 0;                        ///< Total number of ranks
    std::vector<std::vector<NodeId>> ranks;   ///< Rank -> nodes, in NodeId order (unordered)
};

/// Abstract interface for rank assignment algorithms
///
/// Implementations must be deterministic: the same graph yields the same ranks.
class ILayerAssignment {
public:
    virtual ~ILayerAssignment() = default;

    /// Assign every node a rank so that each edge points to a higher rank
    /// @throws StructuralViolation if the graph contains a cycle
    virtual LayerAssignmentResult assignLayers(const Graph& graph) const = 0;

    /// Get algorithm name for debugging/logging
    virtual const char* algorithmName() const = 0;
};

}  // namespace algorithms
}  // namespace routegraph
