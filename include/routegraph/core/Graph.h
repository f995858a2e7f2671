#pragma once

#include "Types.h"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace routegraph {

struct NodeData {
    NodeId id = INVALID_NODE;
    std::string key;                  ///< External identity (GraphNode::id)
    Size size = {172.0f, 36.0f};

    NodeData() = default;
    explicit NodeData(std::string k) : key(std::move(k)) {}
    NodeData(std::string k, Size s) : key(std::move(k)), size(s) {}
};

struct EdgeData {
    EdgeId id = INVALID_EDGE;
    NodeId from = INVALID_NODE;
    NodeId to = INVALID_NODE;
    std::string key;                  ///< External identity (GraphEdge::id)

    EdgeData() = default;
    EdgeData(NodeId f, NodeId t) : from(f), to(t) {}
    EdgeData(NodeId f, NodeId t, std::string k) : from(f), to(t), key(std::move(k)) {}
};

/// Directed working graph used for one layout pass.
///
/// Nodes and edges are append-only and indexed densely from 0 in insertion
/// order, so iteration order is always the order the caller added things in.
/// Adjacency lists keep edge insertion order as well; the layout phases rely on
/// that for deterministic ordering.
class Graph {
public:
    Graph() = default;

    // Node operations
    NodeId addNode(const std::string& key);
    NodeId addNode(const std::string& key, Size size);
    NodeId addNode(const NodeData& data);

    bool hasNode(NodeId id) const { return id < nodes_.size(); }

    // Node access:
    // - getNode(): throws std::out_of_range if ID is invalid.
    // - findNode(): lookup by external key, nullopt if absent.
    const NodeData& getNode(NodeId id) const;
    std::optional<NodeId> findNode(const std::string& key) const;

    // Edge operations
    // Throws StructuralViolation if either endpoint is not in the graph.
    EdgeId addEdge(NodeId from, NodeId to);
    EdgeId addEdge(const EdgeData& data);

    /// Add an edge between two nodes named by external key.
    /// Throws StructuralViolation if either key is unknown.
    EdgeId addEdge(const std::string& fromKey, const std::string& toKey,
                   const std::string& edgeKey = {});

    bool hasEdge(EdgeId id) const { return id < edges_.size(); }
    const EdgeData& getEdge(EdgeId id) const;

    // Queries
    size_t nodeCount() const { return nodes_.size(); }
    size_t edgeCount() const { return edges_.size(); }

    std::vector<NodeId> nodes() const;
    std::vector<EdgeId> edges() const;

    std::vector<NodeId> successors(NodeId id) const;
    std::vector<NodeId> predecessors(NodeId id) const;
    const std::vector<EdgeId>& outEdges(NodeId id) const;
    const std::vector<EdgeId>& inEdges(NodeId id) const;

    size_t inDegree(NodeId id) const { return inEdges(id).size(); }
    size_t outDegree(NodeId id) const { return outEdges(id).size(); }

    /// Nodes without incoming edges, in insertion order
    std::vector<NodeId> sources() const;

private:
    std::vector<NodeData> nodes_;
    std::vector<EdgeData> edges_;
    std::unordered_map<std::string, NodeId> keyIndex_;

    // Adjacency lists, indexed by NodeId
    std::vector<std::vector<EdgeId>> outEdges_;
    std::vector<std::vector<EdgeId>> inEdges_;
};

}  // namespace routegraph
