#include "routegraph/graph/GraphBuilder.h"
#include "routegraph/common/Logger.h"
#include "routegraph/core/Errors.h"

#include <iterator>
#include <stdexcept>
#include <unordered_set>

namespace routegraph {

namespace {

    struct Subtree {
        std::vector<GraphNode> nodes;
        std::vector<GraphEdge> edges;
    };

    void requireUniqueIds(const Route& route, std::unordered_set<std::string>& seen) {
        if (!seen.insert(route.id).second) {
            throw StructuralViolation("Route id '" + route.id + "' occurs more than once");
        }
        for (const Route& child : route.routes) {
            requireUniqueIds(child, seen);
        }
    }

    Color nodeColor(int depth, size_t siblingIndex, const GraphNode* parent) {
        if (!parent) {
            return colors::ROOT;
        }
        if (depth == 1) {
            return colors::branchColor(siblingIndex);
        }
        return parent->color;
    }

    /// Build the subtree rooted at `route`. Its nodes take ids firstId, firstId + 1, ...
    /// in pre-order, so the result holds exactly route.subtreeSize() nodes.
    Subtree buildSubtree(const Route& route, int depth, size_t siblingIndex,
                         const GraphNode* parent, size_t firstId) {
        Subtree result;

        GraphNode node;
        node.id = std::to_string(firstId);
        node.kind = parent ? NodeKind::Internal : NodeKind::Root;
        node.route = &route;
        node.label = route.path.empty() ? route.name : route.path;
        node.depth = depth;
        node.color = nodeColor(depth, siblingIndex, parent);
        result.nodes.push_back(node);

        const Color edgeColor = parent ? node.color : colors::NEUTRAL_EDGE;

        size_t nextId = firstId + 1;
        for (size_t i = 0; i < route.routes.size(); ++i) {
            Subtree child = buildSubtree(route.routes[i], depth + 1, i, &node, nextId);
            const std::string& childId = child.nodes.front().id;

            GraphEdge edge;
            edge.id = "e" + node.id + childId;
            edge.source = node.id;
            edge.target = childId;
            edge.color = edgeColor;
            result.edges.push_back(std::move(edge));

            nextId += child.nodes.size();
            result.nodes.insert(result.nodes.end(),
                                std::make_move_iterator(child.nodes.begin()),
                                std::make_move_iterator(child.nodes.end()));
            result.edges.insert(result.edges.end(),
                                std::make_move_iterator(child.edges.begin()),
                                std::make_move_iterator(child.edges.end()));
        }

        return result;
    }

}  // namespace

RouteGraph GraphBuilder::build(const RoutePtr& tree) const {
    if (!tree) {
        throw std::invalid_argument("Cannot build a graph from a null route tree");
    }
    RouteGraph graph = build(*tree);
    graph.tree = tree;
    return graph;
}

RouteGraph GraphBuilder::build(const Route& root) const {
    std::unordered_set<std::string> seen;
    requireUniqueIds(root, seen);

    Subtree built = buildSubtree(root, 0, 0, nullptr, 1);

    RouteGraph graph;
    graph.nodes = std::move(built.nodes);
    graph.edges = std::move(built.edges);

    LOG_DEBUG("Built graph for route '{}': {} nodes, {} edges",
              root.id, graph.nodes.size(), graph.edges.size());
    return graph;
}

}  // namespace routegraph
