#include "LayerAssignment.h"
#include "routegraph/core/Errors.h"

#include <algorithm>

namespace routegraph {
namespace algorithms {

LayerAssignmentResult LongestPathLayerAssignment::assignLayers(const Graph& graph) const {
    LayerAssignmentResult result;

    const size_t nodeCount = graph.nodeCount();
    if (nodeCount == 0) {
        return result;
    }

    result.nodeRank.assign(nodeCount, 0);

    // Kahn's algorithm: a node is ranked once all its predecessors are
    std::vector<size_t> pendingIn(nodeCount, 0);
    std::vector<NodeId> ready;
    ready.reserve(nodeCount);
    for (NodeId node : graph.nodes()) {
        pendingIn[node] = graph.inDegree(node);
        if (pendingIn[node] == 0) {
            ready.push_back(node);
        }
    }

    size_t processed = 0;
    while (processed < ready.size()) {
        NodeId current = ready[processed++];
        int currentRank = result.nodeRank[current];

        for (EdgeId edgeId : graph.outEdges(current)) {
            NodeId successor = graph.getEdge(edgeId).to;
            result.nodeRank[successor] = std::max(result.nodeRank[successor], currentRank + 1);
            if (--pendingIn[successor] == 0) {
                ready.push_back(successor);
            }
        }
    }

    if (processed != nodeCount) {
        // Every unprocessed node sits on or behind a cycle
        for (NodeId node : graph.nodes()) {
            if (pendingIn[node] > 0) {
                throw StructuralViolation("Edge list contains a cycle through node '" +
                                          graph.getNode(node).key + "'");
            }
        }
    }

    for (int rank : result.nodeRank) {
        result.rankCount = std::max(result.rankCount, rank + 1);
    }

    result.ranks.resize(result.rankCount);
    for (NodeId node : graph.nodes()) {
        result.ranks[result.nodeRank[node]].push_back(node);
    }

    return result;
}

}  // namespace algorithms
}  // namespace routegraph
