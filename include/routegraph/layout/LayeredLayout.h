#pragma once

#include "../graph/RouteGraph.h"
#include "ICoordinateAssignment.h"
#include "ICrossingMinimization.h"
#include "ILayerAssignment.h"
#include "LayoutConfig.h"

#include <memory>
#include <vector>

namespace routegraph {

/// Layered (Sugiyama-style) layout of a route graph
///
/// Phases:
/// 1. Rank assignment - longest path from the root
/// 2. Ordering - depth-first, following child declaration order
/// 3. Coordinate assignment - parents centered over their children
/// 4. Anchors - attach sides and points for every edge
///
/// Every call builds its own working graph from the input and discards it
/// before returning, so consecutive calls never share state. Identical input
/// and configuration give identical output, bit for bit.
class LayeredLayout {
public:
    LayeredLayout();
    explicit LayeredLayout(const LayoutConfig& config);
    ~LayeredLayout();

    // Non-copyable, movable
    LayeredLayout(const LayeredLayout&) = delete;
    LayeredLayout& operator=(const LayeredLayout&) = delete;
    LayeredLayout(LayeredLayout&&) noexcept;
    LayeredLayout& operator=(LayeredLayout&&) noexcept;

    void setConfig(const LayoutConfig& config) { config_ = config; }
    const LayoutConfig& config() const { return config_; }

    /// Position `graph` with the stored configuration
    RouteGraph layout(RouteGraph graph);

    /// Position `graph` with an explicit configuration.
    ///
    /// Writes rank, orderInRank, x, y, width, height and anchor sides of every
    /// node and the anchor points of every edge; ids, colors and routes are
    /// untouched.
    ///
    /// @throws UnknownDirection / InvalidLayoutConfig before any work is done
    /// @throws StructuralViolation if an edge names a missing node, a node id
    ///         repeats, or the edges form a cycle
    RouteGraph layout(RouteGraph graph, const LayoutConfig& config);

    /// Position bare node and edge lists in place
    void layout(std::vector<GraphNode>& nodes, std::vector<GraphEdge>& edges,
                const LayoutConfig& config);

    /// Statistics from the last successful layout
    struct LayoutStats {
        int rankCount = 0;
        int maxRankWidth = 0;
        int edgeCrossings = 0;
    };
    const LayoutStats& lastStats() const { return stats_; }

    /// Algorithm injection (for swapping implementations)
    /// Null arguments are ignored
    void setLayerAssignment(std::shared_ptr<algorithms::ILayerAssignment> impl);
    void setCrossingMinimization(std::shared_ptr<algorithms::ICrossingMinimization> impl);
    void setCoordinateAssignment(std::shared_ptr<algorithms::ICoordinateAssignment> impl);

private:
    LayoutConfig config_;
    LayoutStats stats_;

    std::shared_ptr<algorithms::ILayerAssignment> layerAssignment_;
    std::shared_ptr<algorithms::ICrossingMinimization> crossingMinimization_;
    std::shared_ptr<algorithms::ICoordinateAssignment> coordinateAssignment_;
};

}  // namespace routegraph
