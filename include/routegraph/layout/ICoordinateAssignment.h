#pragma once

#include "ICrossingMinimization.h"
#include "LayoutConfig.h"

#include <vector>

namespace routegraph {
namespace algorithms {

/// Result of coordinate assignment
struct CoordinateAssignmentResult {
    std::vector<Point> centers;   ///< NodeId -> center of the node box
};

/// Abstract interface for coordinate assignment algorithms
///
/// Input is the ordered ranks; output is one center per node such that boxes of
/// `config.nodeSize()` in the same rank do not overlap.
class ICoordinateAssignment {
public:
    virtual ~ICoordinateAssignment() = default;

    virtual CoordinateAssignmentResult assign(
        const Graph& graph,
        const LayerAssignmentResult& layers,
        const CrossingMinimizationResult& ordering,
        const LayoutConfig& config) const = 0;

    /// Get algorithm name for debugging/logging
    virtual const char* algorithmName() const = 0;
};

}  // namespace algorithms
}  // namespace routegraph
