#pragma once

#include "../core/TaskScheduler.h"
#include "../graph/GraphBuilder.h"
#include "../layout/LayeredLayout.h"
#include "../view/ViewportController.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace routegraph {

/// Rendering collaborator. Paints snapshots and moves the camera.
class IRenderSurface {
public:
    virtual ~IRenderSurface() = default;

    /// Replace everything on screen with `graph`
    virtual void commit(const RouteGraph& graph) = 0;

    /// Move (or animate) the camera
    virtual void setCamera(const CameraTransform& camera) = 0;
};

/// Called with the route behind a clicked node. The handle shares the
/// lifetime of the tree it came from.
using NodeSelectHandler = std::function<void(const RoutePtr& route)>;

/// Drives rebuilds of the displayed route graph.
///
/// The displayed tree is rebuilt when the active route changes (memoized on
/// route id) or when the layout direction changes. A direction change also
/// queues a refocus on the root through the scheduler, so the camera moves
/// only after the surface has committed the new positions.
///
/// Usage:
///   DeferredTaskQueue queue;
///   InteractionController controller(surface, queue, onSelect);
///   controller.setRoute(tree);
///   controller.setDirection("TB");
///   ...surface commits...
///   queue.runPending();   // camera centers on the root
///
/// Each rebuild bumps generation(). A queued refocus from an older
/// generation does nothing; a current one reads the root from the current
/// snapshot at the time it runs.
class InteractionController {
public:
    InteractionController(IRenderSurface& surface,
                          ITaskScheduler& scheduler,
                          NodeSelectHandler onNodeSelect,
                          const LayoutConfig& config = LayoutConfig{},
                          const ViewportOptions& viewport = ViewportOptions{});
    ~InteractionController();

    // Queued tasks refer back to the controller
    InteractionController(const InteractionController&) = delete;
    InteractionController& operator=(const InteractionController&) = delete;

    // =========================================================================
    // Events
    // =========================================================================

    /// Show `tree`. Same root id as the active route: nothing happens.
    /// @return true if the graph was rebuilt and committed
    /// @throws std::invalid_argument if `tree` is null
    /// @throws StructuralViolation for a malformed tree (state is left unchanged)
    bool setRoute(RoutePtr tree);

    /// Relayout the active route in `direction`, commit, then queue a refocus
    /// on the root. Without an active route only the direction is stored.
    /// @throws UnknownDirection before anything changes
    void setDirection(Direction direction);

    /// String form: "TB", "BT", "LR" or "RL"
    /// @throws UnknownDirection before anything changes
    void setDirection(const std::string& direction);

    /// Forward the clicked node's route to the selection handler unless it is
    /// the active route. Ids missing from the current snapshot are ignored.
    /// @return true if the handler was called
    bool handleNodeClick(const std::string& nodeId);

    /// Fit the whole snapshot into a viewport of the given size right away
    void fitView(Size viewport);

    // =========================================================================
    // State (read-only)
    // =========================================================================

    const RouteGraph& snapshot() const { return snapshot_; }
    const RoutePtr& activeRoute() const { return tree_; }
    Direction direction() const { return config_.direction; }
    const LayoutConfig& config() const { return config_; }
    const ViewportController& viewport() const { return viewport_; }
    uint64_t generation() const { return generation_; }

    /// Statistics of the most recent layout
    const LayeredLayout::LayoutStats& lastLayoutStats() const { return layout_.lastStats(); }

private:
    IRenderSurface& surface_;
    ITaskScheduler& scheduler_;
    NodeSelectHandler onNodeSelect_;

    LayoutConfig config_;
    GraphBuilder builder_;
    LayeredLayout layout_;
    ViewportController viewport_;

    RoutePtr tree_;
    RouteGraph snapshot_;
    uint64_t generation_ = 0;

    // Expires with the controller so queued tasks can tell it is gone
    std::shared_ptr<InteractionController*> self_;

    /// Build and lay out `tree` with `config`; commits nothing
    RouteGraph rebuild(const RoutePtr& tree, const LayoutConfig& config);

    /// Store and commit a new snapshot
    void publish(RouteGraph graph);

    void scheduleRootFocus();
    void focusRoot(uint64_t generation);
};

}  // namespace routegraph
