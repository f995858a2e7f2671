#include <routegraph/routegraph.h>

#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>

using namespace routegraph;

namespace {

/// Surface without a screen: keeps the last committed snapshot and camera
class HeadlessSurface : public IRenderSurface {
public:
    void commit(const RouteGraph& graph) override {
        graph_ = graph;
        ++commits_;
    }

    void setCamera(const CameraTransform& camera) override {
        camera_ = camera;
    }

    const RouteGraph& graph() const { return graph_; }
    const CameraTransform& camera() const { return camera_; }
    int commits() const { return commits_; }

private:
    RouteGraph graph_;
    CameraTransform camera_;
    int commits_ = 0;
};

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " <routes.json> [options]\n"
              << "  -d, --direction TB|BT|LR|RL   Layout direction\n"
              << "  -c, --config FILE             Settings JSON\n"
              << "  -s, --select ROUTE_ID         Click the node of ROUTE_ID before rendering\n"
              << "  -o, --svg FILE                Write SVG (default routes.svg)\n"
              << "  -j, --json FILE               Write positioned graph JSON\n"
              << "  -v, --verbose                 Debug logging\n";
}

const GraphNode* findByRoute(const RouteGraph& graph, const std::string& routeId) {
    for (const auto& node : graph.nodes) {
        if (node.route && node.route->id == routeId) {
            return &node;
        }
    }
    return nullptr;
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    std::string routesFile;
    std::string configFile;
    std::string direction;
    std::string select;
    std::string svgFile = "routes.svg";
    std::string jsonFile;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                std::exit(1);
            }
            return argv[++i];
        };

        if (arg == "-d" || arg == "--direction") {
            direction = next();
        } else if (arg == "-c" || arg == "--config") {
            configFile = next();
        } else if (arg == "-s" || arg == "--select") {
            select = next();
        } else if (arg == "-o" || arg == "--svg") {
            svgFile = next();
        } else if (arg == "-j" || arg == "--json") {
            jsonFile = next();
        } else if (arg == "-v" || arg == "--verbose") {
            verbose = true;
        } else if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (routesFile.empty()) {
            routesFile = arg;
        } else {
            std::cerr << "Unexpected argument: " << arg << "\n";
            printUsage(argv[0]);
            return 1;
        }
    }

    if (routesFile.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    Logger::initialize();
    if (verbose) {
        Logger::setLevel(LogLevel::Debug);
    }

    try {
        RenderSettings settings;
        if (!configFile.empty()) {
            settings = GraphSerializer::loadSettingsFile(configFile);
        }

        RoutePtr tree = GraphSerializer::loadRouteFile(routesFile);

        HeadlessSurface surface;
        DeferredTaskQueue queue;
        RoutePtr selected;
        InteractionController controller(
            surface, queue,
            [&selected](const RoutePtr& route) { selected = route; },
            settings.layout, settings.viewport);

        controller.setRoute(tree);
        if (!direction.empty()) {
            controller.setDirection(direction);
        }

        if (!select.empty()) {
            const GraphNode* node = findByRoute(controller.snapshot(), select);
            if (!node) {
                LOG_ERROR("No route '{}' in {}", select, routesFile);
                return 1;
            }
            if (controller.handleNodeClick(node->id) && selected) {
                controller.setRoute(selected);
            }
        }

        // Surface has committed; let the queued refocus run
        queue.runPending();

        const RouteGraph& graph = surface.graph();
        const auto& stats = controller.lastLayoutStats();
        LOG_INFO("Laid out {} nodes in {} ranks ({}), widest rank {}, {} crossings, {} commits",
                 graph.nodes.size(), stats.rankCount, toString(graph.direction),
                 stats.maxRankWidth, stats.edgeCrossings, surface.commits());

        SvgExport svg;
        if (!svg.exportToFile(graph, svgFile)) {
            LOG_ERROR("Cannot write {}", svgFile);
            return 1;
        }
        std::cout << "Generated: " << svgFile << "\n";

        if (!jsonFile.empty()) {
            if (!GraphSerializer::saveToFile(graph, jsonFile)) {
                LOG_ERROR("Cannot write {}", jsonFile);
                return 1;
            }
            std::cout << "Generated: " << jsonFile << "\n";
        }
    } catch (const std::exception& e) {
        LOG_ERROR("{}", e.what());
        Logger::flush();
        return 1;
    }

    Logger::flush();
    return 0;
}
