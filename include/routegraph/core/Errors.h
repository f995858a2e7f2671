#pragma once

#include <stdexcept>
#include <string>

namespace routegraph {

/// Broken structural invariant of the input: an edge that references a node
/// missing from the node set, a route id used twice, or a cycle.
///
/// Signals a bug in whoever produced the data. Never retried or repaired.
class StructuralViolation : public std::logic_error {
public:
    explicit StructuralViolation(const std::string& what) : std::logic_error(what) {}
};

/// Direction value outside TB, BT, LR, RL
class UnknownDirection : public std::invalid_argument {
public:
    explicit UnknownDirection(const std::string& value)
        : std::invalid_argument("Unknown layout direction: '" + value + "'")
        , value_(value) {}

    const std::string& value() const { return value_; }

private:
    std::string value_;
};

/// Layout configuration that cannot produce a valid layout
/// (non-positive node size, negative separation)
class InvalidLayoutConfig : public std::invalid_argument {
public:
    explicit InvalidLayoutConfig(const std::string& what) : std::invalid_argument(what) {}
};

}  // namespace routegraph
