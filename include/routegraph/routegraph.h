#pragma once

/// @file routegraph.h
/// @brief Main header for the RouteGraph library
///
/// RouteGraph turns a tree of application routes into a positioned, layered
/// graph ready for an interactive route explorer.
///
/// Example usage:
/// @code
/// #include <routegraph/routegraph.h>
///
/// auto tree = routegraph::GraphSerializer::loadRouteFile("routes.json");
///
/// routegraph::GraphBuilder builder;
/// routegraph::LayeredLayout layout(routegraph::LayoutConfig{}.setDirection(
///     routegraph::Direction::TopToBottom));
/// routegraph::RouteGraph graph = layout.layout(builder.build(tree));
///
/// routegraph::SvgExport svg;
/// svg.exportToFile(graph, "routes.svg");
/// @endcode

#include <string>

// Core module - Route tree, colors, geometry
#include "core/Types.h"
#include "core/Errors.h"
#include "core/Color.h"
#include "core/Route.h"
#include "core/TaskScheduler.h"

// Graph module - Tree to graph transformation
#include "graph/RouteGraph.h"
#include "graph/GraphBuilder.h"

// Layout module
#include "layout/LayoutConfig.h"
#include "layout/LayeredLayout.h"

// View and interaction
#include "view/ViewportController.h"
#include "interactive/InteractionController.h"

// Serialization and export
#include "util/GraphSerializer.h"
#include "export/IExporter.h"
#include "export/SvgExport.h"

// Logging
#include "common/Logger.h"

namespace routegraph {

/// Library version
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

/// Get version as string (computed from constants)
inline std::string versionString() {
    return std::to_string(VERSION_MAJOR) + "." +
           std::to_string(VERSION_MINOR) + "." +
           std::to_string(VERSION_PATCH);
}

}  // namespace routegraph
