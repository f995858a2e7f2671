#pragma once

#include "routegraph/layout/ILayerAssignment.h"

namespace routegraph {
namespace algorithms {

/// Longest-path layer assignment, measured from the sources
///
/// Sources get rank 0 and every other node gets one more than the highest rank
/// among its predecessors. On a tree this is exactly the depth, and the result
/// is a pure function of the edge set, so no tie-breaking is involved.
class LongestPathLayerAssignment : public ILayerAssignment {
public:
    LongestPathLayerAssignment() = default;

    const char* algorithmName() const override { return "LongestPath"; }

    /// @throws StructuralViolation if the graph contains a cycle
    LayerAssignmentResult assignLayers(const Graph& graph) const override;
};

}  // namespace algorithms
}  // namespace routegraph
