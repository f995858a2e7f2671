#include "routegraph/core/Graph.h"
#include "routegraph/core/Errors.h"

#include <numeric>
#include <stdexcept>

namespace routegraph {

namespace {

    [[noreturn]] void throwBadId(const char* what, uint32_t id) {
        throw std::out_of_range(std::string("Invalid ") + what + " ID: " + std::to_string(id));
    }

}  // namespace

NodeId Graph::addNode(const std::string& key) {
    return addNode(NodeData{key});
}

NodeId Graph::addNode(const std::string& key, Size size) {
    return addNode(NodeData{key, size});
}

NodeId Graph::addNode(const NodeData& data) {
    if (!data.key.empty() && keyIndex_.count(data.key) > 0) {
        throw StructuralViolation("Duplicate node id '" + data.key + "'");
    }

    NodeId id = static_cast<NodeId>(nodes_.size());

    NodeData nodeData = data;
    nodeData.id = id;
    if (!nodeData.key.empty()) {
        keyIndex_[nodeData.key] = id;
    }

    nodes_.push_back(std::move(nodeData));
    outEdges_.emplace_back();
    inEdges_.emplace_back();

    return id;
}

const NodeData& Graph::getNode(NodeId id) const {
    if (!hasNode(id)) throwBadId("node", id);
    return nodes_[id];
}

std::optional<NodeId> Graph::findNode(const std::string& key) const {
    auto it = keyIndex_.find(key);
    if (it == keyIndex_.end()) {
        return std::nullopt;
    }
    return it->second;
}

EdgeId Graph::addEdge(NodeId from, NodeId to) {
    return addEdge(EdgeData{from, to});
}

EdgeId Graph::addEdge(const EdgeData& data) {
    if (!hasNode(data.from) || !hasNode(data.to)) {
        throw StructuralViolation("Invalid node ID in edge '" + data.key + "'");
    }

    EdgeId id = static_cast<EdgeId>(edges_.size());

    EdgeData edgeData = data;
    edgeData.id = id;
    edges_.push_back(std::move(edgeData));

    outEdges_[data.from].push_back(id);
    inEdges_[data.to].push_back(id);

    return id;
}

EdgeId Graph::addEdge(const std::string& fromKey, const std::string& toKey,
                      const std::string& edgeKey) {
    auto from = findNode(fromKey);
    if (!from) {
        throw StructuralViolation("Edge '" + edgeKey + "' references unknown source node '" +
                                  fromKey + "'");
    }
    auto to = findNode(toKey);
    if (!to) {
        throw StructuralViolation("Edge '" + edgeKey + "' references unknown target node '" +
                                  toKey + "'");
    }
    return addEdge(EdgeData{*from, *to, edgeKey});
}

const EdgeData& Graph::getEdge(EdgeId id) const {
    if (!hasEdge(id)) throwBadId("edge", id);
    return edges_[id];
}

std::vector<NodeId> Graph::nodes() const {
    std::vector<NodeId> ids(nodes_.size());
    std::iota(ids.begin(), ids.end(), NodeId{0});
    return ids;
}

std::vector<EdgeId> Graph::edges() const {
    std::vector<EdgeId> ids(edges_.size());
    std::iota(ids.begin(), ids.end(), EdgeId{0});
    return ids;
}

std::vector<NodeId> Graph::successors(NodeId id) const {
    const auto& out = outEdges(id);
    std::vector<NodeId> children;
    children.reserve(out.size());
    for (EdgeId e : out) children.push_back(edges_[e].to);
    return children;
}

std::vector<NodeId> Graph::predecessors(NodeId id) const {
    const auto& in = inEdges(id);
    std::vector<NodeId> parents;
    parents.reserve(in.size());
    for (EdgeId e : in) parents.push_back(edges_[e].from);
    return parents;
}

const std::vector<EdgeId>& Graph::outEdges(NodeId id) const {
    if (!hasNode(id)) throwBadId("node", id);
    return outEdges_[id];
}

const std::vector<EdgeId>& Graph::inEdges(NodeId id) const {
    if (!hasNode(id)) throwBadId("node", id);
    return inEdges_[id];
}

std::vector<NodeId> Graph::sources() const {
    std::vector<NodeId> roots;
    for (NodeId id = 0; id < nodes_.size(); ++id) {
        if (inEdges_[id].empty()) roots.push_back(id);
    }
    return roots;
}

}  // namespace routegraph
