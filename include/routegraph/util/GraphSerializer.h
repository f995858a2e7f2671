#pragma once

#include "../core/Route.h"
#include "../graph/RouteGraph.h"
#include "../layout/LayoutConfig.h"
#include "../view/ViewportController.h"

#include <string>

namespace routegraph {

/// Settings read from a configuration file
struct RenderSettings {
    LayoutConfig layout;
    ViewportOptions viewport;
};

/// JSON reading and writing for route trees, settings and positioned graphs
///
/// Route tree format (child order is the key order of "routes"):
///   {"id": "root", "path": "/", "name": "Home",
///    "routes": {"a": {"path": "/a", "routes": {}}, ...}}
///
/// Settings format (every key optional):
///   {"direction": "TB", "nodeWidth": 172, "nodeHeight": 36,
///    "nodeSeparation": 50, "rankSeparation": 250, "edgeSeparation": 10,
///    "viewport": {"focusZoom": 0.5, "focusDurationMs": 1000, "minZoom": 0,
///                 "maxZoom": 2, "fitPadding": 0.1, "fitDurationMs": 0}}
class GraphSerializer {
public:
    // === Route trees ===

    /// Parse a route tree.
    /// A child without "id" takes its key in the parent's "routes" object.
    /// @throws std::runtime_error on malformed JSON or a wrongly typed field
    static Route routeFromJson(const std::string& json);

    /// Serialize a route tree, children in declaration order
    static std::string toJson(const Route& route);

    /// Read and parse a route file
    /// @throws std::runtime_error if the file cannot be read or parsed
    static RoutePtr loadRouteFile(const std::string& path);

    // === Settings ===

    /// Parse settings; absent keys keep their defaults.
    /// @throws std::runtime_error on malformed JSON or a wrongly typed field
    /// @throws UnknownDirection for an unsupported "direction"
    /// @throws InvalidLayoutConfig if the resulting values are out of range
    static RenderSettings settingsFromJson(const std::string& json);

    /// @throws std::runtime_error if the file cannot be read; see settingsFromJson
    static RenderSettings loadSettingsFile(const std::string& path);

    // === Positioned graphs ===

    /// Serialize a laid-out graph snapshot
    static std::string toJson(const RouteGraph& graph);

    /// @return true if the file was written
    static bool saveToFile(const RouteGraph& graph, const std::string& path);

private:
    static std::string readFile(const std::string& path);
};

}  // namespace routegraph
