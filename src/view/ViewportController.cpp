#include "routegraph/view/ViewportController.h"
#include "routegraph/core/Errors.h"

#include <algorithm>

namespace routegraph {

void ViewportOptions::validate() const {
    if (minZoom < 0.0f || maxZoom <= 0.0f || minZoom > maxZoom) {
        throw InvalidLayoutConfig("zoom range must satisfy 0 <= minZoom <= maxZoom, maxZoom > 0");
    }
    if (focusZoom < minZoom || focusZoom > maxZoom || focusZoom <= 0.0f) {
        throw InvalidLayoutConfig("focusZoom must be positive and within [minZoom, maxZoom]");
    }
    if (fitPadding < 0.0f) {
        throw InvalidLayoutConfig("fitPadding must not be negative");
    }
    if (focusDurationMs < 0 || fitDurationMs < 0) {
        throw InvalidLayoutConfig("camera durations must not be negative");
    }
}

ViewportController::ViewportController(const ViewportOptions& options) {
    setOptions(options);
}

void ViewportController::setOptions(const ViewportOptions& options) {
    options.validate();
    options_ = options;
}

CameraTransform ViewportController::focus(const GraphNode& node) const {
    Point c = node.center();
    return {c.x, c.y, options_.focusZoom, options_.focusDurationMs};
}

CameraTransform ViewportController::fit(const RouteGraph& graph, Size viewport) const {
    if (graph.empty() || viewport.width <= 0.0f || viewport.height <= 0.0f) {
        return {};
    }

    Rect box = graph.bounds();
    float padX = box.width * options_.fitPadding;
    float padY = box.height * options_.fitPadding;
    float w = box.width + 2 * padX;
    float h = box.height + 2 * padY;

    float zoom = std::min(viewport.width / w, viewport.height / h);
    Point c = box.center();
    return {c.x, c.y, clampZoom(zoom), options_.fitDurationMs};
}

float ViewportController::clampZoom(float zoom) const {
    return std::clamp(zoom, options_.minZoom, options_.maxZoom);
}

}  // namespace routegraph
