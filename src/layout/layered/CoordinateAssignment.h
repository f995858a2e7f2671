#pragma once

#include "routegraph/layout/ICoordinateAssignment.h"

namespace routegraph {
namespace algorithms {

/// Tidy-tree style coordinate assignment
///
/// Along the rank axis, rank r sits at r * (extent + rankSeparation), mirrored
/// for BT and RL. Along the other axis, positions are measured in slots of
/// (extent + nodeSeparation):
/// - nodes without children in the next rank take consecutive slots in
///   depth-first order
/// - a parent sits halfway between its first and last child
/// - a final sweep pushes apart any two neighbours of a rank that ended up
///   closer than one slot (only possible with a custom ordering phase)
///
/// Every node has the same box, `config.nodeSize()`.
class SubtreeCenteringCoordinateAssignment : public ICoordinateAssignment {
public:
    SubtreeCenteringCoordinateAssignment() = default;

    const char* algorithmName() const override { return "SubtreeCentering"; }

    CoordinateAssignmentResult assign(
        const Graph& graph,
        const LayerAssignmentResult& layers,
        const CrossingMinimizationResult& ordering,
        const LayoutConfig& config) const override;

private:
    /// Slot of every node along the within-rank axis
    std::vector<float> assignSlots(const Graph& graph,
                                   const LayerAssignmentResult& layers,
                                   const CrossingMinimizationResult& ordering) const;
};

}  // namespace algorithms
}  // namespace routegraph
