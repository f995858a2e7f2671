#include "routegraph/interactive/InteractionController.h"
#include "routegraph/common/Logger.h"

#include <stdexcept>

namespace routegraph {

InteractionController::InteractionController(IRenderSurface& surface,
                                             ITaskScheduler& scheduler,
                                             NodeSelectHandler onNodeSelect,
                                             const LayoutConfig& config,
                                             const ViewportOptions& viewport)
    : surface_(surface)
    , scheduler_(scheduler)
    , onNodeSelect_(std::move(onNodeSelect))
    , config_(config)
    , layout_(config)
    , viewport_(viewport)
    , self_(std::make_shared<InteractionController*>(this)) {
    config_.validate();
    snapshot_.direction = config_.direction;
}

InteractionController::~InteractionController() = default;

bool InteractionController::setRoute(RoutePtr tree) {
    if (!tree) {
        throw std::invalid_argument("InteractionController::setRoute: null route tree");
    }

    if (tree_ && tree_->id == tree->id) {
        LOG_TRACE("Route '{}' already active, keeping current layout", tree->id);
        return false;
    }

    RouteGraph graph = rebuild(tree, config_);
    tree_ = std::move(tree);
    publish(std::move(graph));

    LOG_INFO("Active route '{}': {} nodes, {} ranks",
             tree_->id, snapshot_.nodes.size(), snapshot_.rankCount());
    return true;
}

void InteractionController::setDirection(const std::string& direction) {
    setDirection(parseDirection(direction));
}

void InteractionController::setDirection(Direction direction) {
    requireValidDirection(direction);

    LayoutConfig next = config_;
    next.direction = direction;

    if (!tree_) {
        config_ = next;
        snapshot_.direction = direction;
        LOG_DEBUG("Direction set to {} with no active route", toString(direction));
        return;
    }

    RouteGraph graph = rebuild(tree_, next);
    config_ = next;
    publish(std::move(graph));

    LOG_DEBUG("Direction changed to {}, refocus queued for generation {}",
              toString(direction), generation_);
    scheduleRootFocus();
}

bool InteractionController::handleNodeClick(const std::string& nodeId) {
    const GraphNode* node = snapshot_.findNode(nodeId);
    if (!node) {
        LOG_WARN("Click on node '{}' which is not in the current graph (generation {})",
                 nodeId, generation_);
        return false;
    }

    RoutePtr route = snapshot_.routeOf(*node);
    if (!route) {
        LOG_WARN("Node '{}' has no route attached", nodeId);
        return false;
    }

    if (tree_ && route->id == tree_->id) {
        return false;
    }

    LOG_DEBUG("Node '{}' selects route '{}'", nodeId, route->id);
    if (onNodeSelect_) {
        onNodeSelect_(route);
    }
    return true;
}

void InteractionController::fitView(Size viewport) {
    surface_.setCamera(viewport_.fit(snapshot_, viewport));
}

RouteGraph InteractionController::rebuild(const RoutePtr& tree, const LayoutConfig& config) {
    RouteGraph graph = builder_.build(tree);
    return layout_.layout(std::move(graph), config);
}

void InteractionController::publish(RouteGraph graph) {
    snapshot_ = std::move(graph);
    ++generation_;
    surface_.commit(snapshot_);
}

void InteractionController::scheduleRootFocus() {
    std::weak_ptr<InteractionController*> weak = self_;
    uint64_t generation = generation_;
    scheduler_.submit([weak, generation]() {
        if (auto self = weak.lock()) {
            (*self)->focusRoot(generation);
        }
    });
}

void InteractionController::focusRoot(uint64_t generation) {
    if (generation != generation_) {
        LOG_TRACE("Skipping refocus for generation {}, current is {}", generation, generation_);
        return;
    }

    const GraphNode* root = snapshot_.root();
    if (!root) {
        return;
    }
    surface_.setCamera(viewport_.focus(*root));
}

}  // namespace routegraph
