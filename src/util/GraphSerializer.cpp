#include "routegraph/util/GraphSerializer.h"
#include "routegraph/common/Logger.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;
using ordered_json = nlohmann::ordered_json;

namespace routegraph {

namespace {

    Route parseRoute(const ordered_json& j, const std::string& key) {
        if (!j.is_object()) {
            throw std::runtime_error("Route '" + key + "' must be a JSON object");
        }

        // Only children may take their id from the key they are stored under
        if (key.empty() && !j.contains("id")) {
            throw std::runtime_error("Route has no \"id\" and no key to take it from");
        }

        Route route;
        route.id = j.value("id", key);
        if (route.id.empty()) {
            throw std::runtime_error("Route id must not be empty");
        }
        route.path = j.value("path", std::string{});
        route.name = j.value("name", std::string{});

        if (!key.empty() && route.id != key) {
            throw std::runtime_error("Route key '" + key + "' does not match its id '" +
                                     route.id + "'");
        }

        if (j.contains("routes")) {
            const auto& children = j.at("routes");
            if (!children.is_object()) {
                throw std::runtime_error("\"routes\" of '" + route.id + "' must be an object");
            }
            route.routes.reserve(children.size());
            for (const auto& [childKey, child] : children.items()) {
                route.routes.push_back(parseRoute(child, childKey));
            }
        }
        return route;
    }

    ordered_json routeToJson(const Route& route) {
        ordered_json j;
        j["id"] = route.id;
        j["path"] = route.path;
        j["name"] = route.name;

        ordered_json children = ordered_json::object();
        for (const auto& child : route.routes) {
            children[child.id] = routeToJson(child);
        }
        j["routes"] = children;
        return j;
    }

    json point(const Point& p) {
        return {{"x", p.x}, {"y", p.y}};
    }

}  // namespace

Route GraphSerializer::routeFromJson(const std::string& jsonStr) {
    try {
        ordered_json j = ordered_json::parse(jsonStr);
        return parseRoute(j, "");
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Failed to parse route JSON: ") + e.what());
    }
}

std::string GraphSerializer::toJson(const Route& route) {
    return routeToJson(route).dump(2);
}

RoutePtr GraphSerializer::loadRouteFile(const std::string& path) {
    Route root = routeFromJson(readFile(path));
    LOG_DEBUG("Loaded route '{}' ({} routes) from {}", root.id, root.subtreeSize(), path);
    return makeRouteTree(std::move(root));
}

RenderSettings GraphSerializer::settingsFromJson(const std::string& jsonStr) {
    RenderSettings settings;

    try {
        json j = json::parse(jsonStr);
        if (!j.is_object()) {
            throw std::runtime_error("Settings must be a JSON object");
        }

        LayoutConfig& layout = settings.layout;
        if (j.contains("direction")) {
            layout.direction = parseDirection(j.at("direction").get<std::string>());
        }
        layout.nodeWidth = j.value("nodeWidth", layout.nodeWidth);
        layout.nodeHeight = j.value("nodeHeight", layout.nodeHeight);
        layout.nodeSeparation = j.value("nodeSeparation", layout.nodeSeparation);
        layout.rankSeparation = j.value("rankSeparation", layout.rankSeparation);
        layout.edgeSeparation = j.value("edgeSeparation", layout.edgeSeparation);

        if (j.contains("viewport")) {
            const auto& v = j.at("viewport");
            ViewportOptions& viewport = settings.viewport;
            viewport.focusZoom = v.value("focusZoom", viewport.focusZoom);
            viewport.focusDurationMs = v.value("focusDurationMs", viewport.focusDurationMs);
            viewport.minZoom = v.value("minZoom", viewport.minZoom);
            viewport.maxZoom = v.value("maxZoom", viewport.maxZoom);
            viewport.fitPadding = v.value("fitPadding", viewport.fitPadding);
            viewport.fitDurationMs = v.value("fitDurationMs", viewport.fitDurationMs);
        }
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Failed to parse settings JSON: ") + e.what());
    }

    settings.layout.validate();
    settings.viewport.validate();
    return settings;
}

RenderSettings GraphSerializer::loadSettingsFile(const std::string& path) {
    return settingsFromJson(readFile(path));
}

std::string GraphSerializer::toJson(const RouteGraph& graph) {
    json j;
    j["direction"] = toString(graph.direction);

    json nodes = json::array();
    for (const auto& node : graph.nodes) {
        json nodeJson;
        nodeJson["id"] = node.id;
        nodeJson["type"] = toString(node.kind);
        nodeJson["label"] = node.label;
        nodeJson["routeId"] = node.route ? node.route->id : std::string{};
        nodeJson["rank"] = node.rank;
        nodeJson["order"] = node.orderInRank;
        nodeJson["position"] = point(node.position());
        nodeJson["width"] = node.width;
        nodeJson["height"] = node.height;
        nodeJson["color"] = node.color.toHex();
        nodeJson["sourcePosition"] = toString(node.sourceSide);
        nodeJson["targetPosition"] = toString(node.targetSide);
        nodes.push_back(nodeJson);
    }
    j["nodes"] = nodes;

    json edges = json::array();
    for (const auto& edge : graph.edges) {
        json edgeJson;
        edgeJson["id"] = edge.id;
        edgeJson["source"] = edge.source;
        edgeJson["target"] = edge.target;
        edgeJson["color"] = edge.color.toHex();
        edgeJson["animated"] = edge.animated;
        edgeJson["sourcePoint"] = point(edge.sourcePoint);
        edgeJson["targetPoint"] = point(edge.targetPoint);
        edges.push_back(edgeJson);
    }
    j["edges"] = edges;

    return j.dump(2);
}

bool GraphSerializer::saveToFile(const RouteGraph& graph, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) return false;
    file << toJson(graph);
    return true;
}

std::string GraphSerializer::readFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

}  // namespace routegraph
