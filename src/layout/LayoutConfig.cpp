#include "routegraph/layout/LayoutConfig.h"
#include "routegraph/core/Errors.h"

#include <cmath>

namespace routegraph {

const char* toString(Direction direction) {
    switch (direction) {
        case Direction::TopToBottom: return "TB";
        case Direction::BottomToTop: return "BT";
        case Direction::LeftToRight: return "LR";
        case Direction::RightToLeft: return "RL";
    }
    throw UnknownDirection(std::to_string(static_cast<int>(direction)));
}

Direction parseDirection(const std::string& value) {
    if (value == "TB") return Direction::TopToBottom;
    if (value == "BT") return Direction::BottomToTop;
    if (value == "LR") return Direction::LeftToRight;
    if (value == "RL") return Direction::RightToLeft;
    throw UnknownDirection(value);
}

void requireValidDirection(Direction direction) {
    switch (direction) {
        case Direction::TopToBottom:
        case Direction::BottomToTop:
        case Direction::LeftToRight:
        case Direction::RightToLeft:
            return;
    }
    throw UnknownDirection(std::to_string(static_cast<int>(direction)));
}

bool isHorizontal(Direction direction) {
    return direction == Direction::LeftToRight || direction == Direction::RightToLeft;
}

const char* toString(NodeSide side) {
    switch (side) {
        case NodeSide::Top: return "top";
        case NodeSide::Bottom: return "bottom";
        case NodeSide::Left: return "left";
        case NodeSide::Right: return "right";
    }
    return "bottom";
}

NodeSide targetSide(Direction direction) {
    switch (direction) {
        case Direction::TopToBottom: return NodeSide::Top;
        case Direction::BottomToTop: return NodeSide::Bottom;
        case Direction::LeftToRight: return NodeSide::Left;
        case Direction::RightToLeft: return NodeSide::Right;
    }
    throw UnknownDirection(std::to_string(static_cast<int>(direction)));
}

NodeSide sourceSide(Direction direction) {
    switch (direction) {
        case Direction::TopToBottom: return NodeSide::Bottom;
        case Direction::BottomToTop: return NodeSide::Top;
        case Direction::LeftToRight: return NodeSide::Right;
        case Direction::RightToLeft: return NodeSide::Left;
    }
    throw UnknownDirection(std::to_string(static_cast<int>(direction)));
}

void LayoutConfig::validate() const {
    requireValidDirection(direction);

    if (!(nodeWidth > 0.0f) || !(nodeHeight > 0.0f) ||
        !std::isfinite(nodeWidth) || !std::isfinite(nodeHeight)) {
        throw InvalidLayoutConfig("Node size must be positive, got " +
                                  std::to_string(nodeWidth) + "x" + std::to_string(nodeHeight));
    }
    if (!(nodeSeparation >= 0.0f) || !(rankSeparation >= 0.0f) || !(edgeSeparation >= 0.0f)) {
        throw InvalidLayoutConfig("Separations must be non-negative");
    }
}

}  // namespace routegraph
