#pragma once

#include "../core/Types.h"
#include "../graph/RouteGraph.h"

namespace routegraph {

/// Camera state requested from the rendering surface.
///
/// (x, y) is the world point placed at the middle of the viewport. A non-zero
/// duration asks the surface to animate from its current camera.
struct CameraTransform {
    float x = 0.0f;
    float y = 0.0f;
    float zoom = 1.0f;
    int durationMs = 0;

    Point center() const { return {x, y}; }

    bool operator==(const CameraTransform& o) const {
        return x == o.x && y == o.y && zoom == o.zoom && durationMs == o.durationMs;
    }
    bool operator!=(const CameraTransform& o) const { return !(*this == o); }
};

struct ViewportOptions {
    float focusZoom = 0.5f;     // Zoom used when centering on a single node
    int focusDurationMs = 1000;
    float minZoom = 0.0f;
    float maxZoom = 2.0f;
    float fitPadding = 0.1f;    // Fraction of the graph size kept free around it by fit()
    int fitDurationMs = 0;

    /// @throws InvalidLayoutConfig for negative zoom bounds, minZoom > maxZoom,
    ///         a focus zoom outside the bounds, negative padding or durations
    void validate() const;

    ViewportOptions& setFocusZoom(float z) { focusZoom = z; return *this; }
    ViewportOptions& setFocusDuration(int ms) { focusDurationMs = ms; return *this; }
    ViewportOptions& setZoomRange(float lo, float hi) {
        minZoom = lo;
        maxZoom = hi;
        return *this;
    }
    ViewportOptions& setFitPadding(float p) { fitPadding = p; return *this; }

    bool operator==(const ViewportOptions& o) const {
        return focusZoom == o.focusZoom && focusDurationMs == o.focusDurationMs &&
               minZoom == o.minZoom && maxZoom == o.maxZoom &&
               fitPadding == o.fitPadding && fitDurationMs == o.fitDurationMs;
    }
};

/// Computes camera transforms for a positioned graph. Stateless apart from
/// its options; it never talks to the surface itself.
class ViewportController {
public:
    ViewportController() = default;
    explicit ViewportController(const ViewportOptions& options);

    const ViewportOptions& options() const { return options_; }
    void setOptions(const ViewportOptions& options);

    /// Center on the middle of `node` at the focus zoom.
    /// Only meaningful once the node's position has been committed.
    CameraTransform focus(const GraphNode& node) const;

    /// Show the whole graph inside a viewport of the given size.
    /// An empty graph or a degenerate viewport gives the identity camera.
    CameraTransform fit(const RouteGraph& graph, Size viewport) const;

private:
    ViewportOptions options_;

    float clampZoom(float zoom) const;
};

}  // namespace routegraph
