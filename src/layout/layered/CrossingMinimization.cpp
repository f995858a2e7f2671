#include "CrossingMinimization.h"

#include <unordered_map>
#include <utility>

namespace routegraph {
namespace algorithms {

CrossingMinimizationResult DepthFirstOrdering::minimize(
    const Graph& graph,
    const LayerAssignmentResult& layers) const {

    CrossingMinimizationResult result;
    result.ranks.resize(layers.rankCount);
    result.nodeOrder.assign(graph.nodeCount(), -1);

    if (graph.nodeCount() == 0) {
        return result;
    }

    std::vector<bool> visited(graph.nodeCount(), false);
    std::vector<NodeId> stack;

    for (NodeId source : graph.sources()) {
        stack.push_back(source);

        while (!stack.empty()) {
            NodeId current = stack.back();
            stack.pop_back();
            if (visited[current]) {
                continue;
            }
            visited[current] = true;

            auto& rank = result.ranks[layers.nodeRank[current]];
            result.nodeOrder[current] = static_cast<int>(rank.size());
            rank.push_back(current);

            // Reverse push so the first edge is visited first
            const auto& out = graph.outEdges(current);
            for (auto it = out.rbegin(); it != out.rend(); ++it) {
                NodeId successor = graph.getEdge(*it).to;
                if (!visited[successor]) {
                    stack.push_back(successor);
                }
            }
        }
    }

    result.crossingCount = countTotalCrossings(graph, result.ranks);
    return result;
}

int DepthFirstOrdering::countCrossings(
    const Graph& graph,
    const std::vector<NodeId>& upperRank,
    const std::vector<NodeId>& lowerRank) const {

    std::unordered_map<NodeId, int> upperPos, lowerPos;
    for (size_t i = 0; i < upperRank.size(); ++i) {
        upperPos[upperRank[i]] = static_cast<int>(i);
    }
    for (size_t i = 0; i < lowerRank.size(); ++i) {
        lowerPos[lowerRank[i]] = static_cast<int>(i);
    }

    // Edges between these two ranks as (upper position, lower position)
    std::vector<std::pair<int, int>> edges;
    for (NodeId upper : upperRank) {
        for (EdgeId edgeId : graph.outEdges(upper)) {
            auto it = lowerPos.find(graph.getEdge(edgeId).to);
            if (it != lowerPos.end()) {
                edges.emplace_back(upperPos[upper], it->second);
            }
        }
    }

    int crossings = 0;
    for (size_t i = 0; i < edges.size(); ++i) {
        for (size_t j = i + 1; j < edges.size(); ++j) {
            // Edges sharing an endpoint never cross
            if (edges[i].first == edges[j].first || edges[i].second == edges[j].second) {
                continue;
            }
            bool upperInverted = edges[i].first > edges[j].first;
            bool lowerInverted = edges[i].second > edges[j].second;
            if (upperInverted != lowerInverted) {
                ++crossings;
            }
        }
    }

    return crossings;
}

int DepthFirstOrdering::countTotalCrossings(
    const Graph& graph,
    const std::vector<std::vector<NodeId>>& ranks) const {

    int total = 0;
    for (size_t i = 0; i + 1 < ranks.size(); ++i) {
        total += countCrossings(graph, ranks[i], ranks[i + 1]);
    }
    return total;
}

}  // namespace algorithms
}  // namespace routegraph
