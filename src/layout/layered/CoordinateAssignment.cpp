#include "CoordinateAssignment.h"

#include <algorithm>
#include <utility>

namespace routegraph {
namespace algorithms {

CoordinateAssignmentResult SubtreeCenteringCoordinateAssignment::assign(
    const Graph& graph,
    const LayerAssignmentResult& layers,
    const CrossingMinimizationResult& ordering,
    const LayoutConfig& config) const {

    CoordinateAssignmentResult result;
    if (graph.nodeCount() == 0) {
        return result;
    }

    const bool horizontal = isHorizontal(config.direction);
    const bool mirrored = config.direction == Direction::BottomToTop ||
                          config.direction == Direction::RightToLeft;

    // Extents along the rank axis and along the within-rank axis
    const float rankExtent = horizontal ? config.nodeWidth : config.nodeHeight;
    const float slotExtent = horizontal ? config.nodeHeight : config.nodeWidth;
    const float rankPitch = rankExtent + config.rankSeparation;
    const float slotPitch = slotExtent + config.nodeSeparation;

    std::vector<float> slots = assignSlots(graph, layers, ordering);

    result.centers.resize(graph.nodeCount());
    for (NodeId node : graph.nodes()) {
        int rank = layers.nodeRank[node];
        if (mirrored) {
            rank = layers.rankCount - 1 - rank;
        }

        float along = rank * rankPitch + rankExtent / 2.0f;
        float across = slots[node] * slotPitch + slotExtent / 2.0f;

        result.centers[node] = horizontal ? Point{along, across} : Point{across, along};
    }

    return result;
}

std::vector<float> SubtreeCenteringCoordinateAssignment::assignSlots(
    const Graph& graph,
    const LayerAssignmentResult& layers,
    const CrossingMinimizationResult& ordering) const {

    const size_t nodeCount = graph.nodeCount();

    // Spanning forest: each non-source node hangs below the first predecessor in
    // the previous rank (rank by rank, in rank order) that reaches it.
    std::vector<std::vector<NodeId>> children(nodeCount);
    std::vector<bool> claimed(nodeCount, false);
    for (const auto& rank : ordering.ranks) {
        for (NodeId parent : rank) {
            for (NodeId successor : graph.successors(parent)) {
                if (!claimed[successor] &&
                    layers.nodeRank[successor] == layers.nodeRank[parent] + 1) {
                    claimed[successor] = true;
                    children[parent].push_back(successor);
                }
            }
            std::sort(children[parent].begin(), children[parent].end(),
                      [&ordering](NodeId a, NodeId b) {
                          return ordering.nodeOrder[a] < ordering.nodeOrder[b];
                      });
        }
    }

    std::vector<float> slots(nodeCount, 0.0f);
    float nextLeafSlot = 0.0f;

    // Iterative post-order over each tree of the forest, roots in rank order
    std::vector<std::pair<NodeId, size_t>> stack;
    for (const auto& rank : ordering.ranks) {
        for (NodeId root : rank) {
            if (claimed[root]) {
                continue;
            }
            stack.emplace_back(root, 0);

            while (!stack.empty()) {
                auto& [node, nextChild] = stack.back();
                if (nextChild < children[node].size()) {
                    NodeId child = children[node][nextChild++];
                    stack.emplace_back(child, 0);
                    continue;
                }

                const auto& kids = children[node];
                if (kids.empty()) {
                    slots[node] = nextLeafSlot;
                    nextLeafSlot += 1.0f;
                } else {
                    slots[node] = (slots[kids.front()] + slots[kids.back()]) / 2.0f;
                }
                stack.pop_back();
            }
        }
    }

    // Keep neighbours at least one slot apart, in the order chosen for the rank
    for (const auto& rank : ordering.ranks) {
        for (size_t i = 1; i < rank.size(); ++i) {
            slots[rank[i]] = std::max(slots[rank[i]], slots[rank[i - 1]] + 1.0f);
        }
    }

    return slots;
}

}  // namespace algorithms
}  // namespace routegraph
