#pragma once

#include "../core/Types.h"

#include <string>

namespace routegraph {

/// Direction of hierarchical layout
enum class Direction {
    TopToBottom,   // TB: root at top, leaves at bottom
    BottomToTop,   // BT: root at bottom, leaves at top
    LeftToRight,   // LR: root at left, leaves at right
    RightToLeft    // RL: root at right, leaves at left
};

/// Which side of a node's bounding box an edge attaches to
enum class NodeSide {
    Top,
    Bottom,
    Left,
    Right
};

/// "TB", "BT", "LR" or "RL"
const char* toString(Direction direction);

/// Parse "TB", "BT", "LR" or "RL" (exact, upper-case).
/// @throws UnknownDirection for anything else
Direction parseDirection(const std::string& value);

/// Throws UnknownDirection if `direction` is not one of the four enumerators
/// (guards against values forged with static_cast)
void requireValidDirection(Direction direction);

/// True for LR and RL, where ranks advance along the x axis
bool isHorizontal(Direction direction);

/// "top", "bottom", "left" or "right"
const char* toString(NodeSide side);

/// Side where a node's incoming edges attach
NodeSide targetSide(Direction direction);

/// Side where a node's outgoing edges leave
NodeSide sourceSide(Direction direction);

/// Parameters for one layout pass. Immutable while the pass runs.
///
/// Defaults match the route explorer's stock look: 172x36 nodes laid out
/// left to right with wide rank gaps so long paths stay readable.
struct LayoutConfig {
    Direction direction = Direction::LeftToRight;

    float nodeWidth = 172.0f;
    float nodeHeight = 36.0f;

    float nodeSeparation = 50.0f;   // Gap between neighbours in the same rank
    float rankSeparation = 250.0f;  // Gap between consecutive ranks
    float edgeSeparation = 10.0f;   // Gap between edges leaving the same node

    Size nodeSize() const { return {nodeWidth, nodeHeight}; }

    /// @throws UnknownDirection if direction is not a valid enumerator
    /// @throws InvalidLayoutConfig for non-positive node size or negative separations
    void validate() const;

    // Builder pattern for convenient configuration
    LayoutConfig& setDirection(Direction d) { direction = d; return *this; }
    LayoutConfig& setNodeSize(float w, float h) {
        nodeWidth = w;
        nodeHeight = h;
        return *this;
    }
    LayoutConfig& setNodeSeparation(float s) { nodeSeparation = s; return *this; }
    LayoutConfig& setRankSeparation(float s) { rankSeparation = s; return *this; }
    LayoutConfig& setEdgeSeparation(float s) { edgeSeparation = s; return *this; }

    bool operator==(const LayoutConfig& o) const {
        return direction == o.direction &&
               nodeWidth == o.nodeWidth && nodeHeight == o.nodeHeight &&
               nodeSeparation == o.nodeSeparation &&
               rankSeparation == o.rankSeparation &&
               edgeSeparation == o.edgeSeparation;
    }
    bool operator!=(const LayoutConfig& o) const { return !(*this == o); }
};

}  // namespace routegraph
