#include <gtest/gtest.h>
#include <routegraph/common/Logger.h>
#include <routegraph/core/Errors.h>
#include <routegraph/interactive/InteractionController.h>

#include "../TestRoutes.h"

#include <memory>
#include <vector>

using namespace routegraph;

namespace {

class RecordingSurface : public IRenderSurface {
public:
    void commit(const RouteGraph& graph) override { commits.push_back(graph); }
    void setCamera(const CameraTransform& camera) override { cameras.push_back(camera); }

    std::vector<RouteGraph> commits;
    std::vector<CameraTransform> cameras;
};

const GraphNode* nodeFor(const RouteGraph& graph, const std::string& routeId) {
    for (const auto& node : graph.nodes) {
        if (node.route && node.route->id == routeId) {
            return &node;
        }
    }
    return nullptr;
}

class InteractionControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        controller = std::make_unique<InteractionController>(
            surface, queue,
            [this](const RoutePtr& route) { selected.push_back(route); });
        tree = makeRouteTree(test::sampleTree());
    }

    RecordingSurface surface;
    DeferredTaskQueue queue;
    std::vector<RoutePtr> selected;
    std::unique_ptr<InteractionController> controller;
    RoutePtr tree;
};

}  // namespace

// --- Route changes ---

TEST_F(InteractionControllerTest, SetRoute_BuildsAndCommits) {
    EXPECT_TRUE(controller->setRoute(tree));

    ASSERT_EQ(surface.commits.size(), 1);
    EXPECT_EQ(surface.commits[0].nodes.size(), 4);
    EXPECT_EQ(controller->snapshot().nodes.size(), 4);
    EXPECT_EQ(controller->activeRoute(), tree);
    EXPECT_EQ(controller->generation(), 1);
    EXPECT_EQ(controller->snapshot().direction, Direction::LeftToRight);

    // First display queues no camera move
    EXPECT_EQ(queue.pendingCount(), 0);
}

TEST_F(InteractionControllerTest, SetRoute_MemoizedOnRouteId) {
    controller->setRoute(tree);

    // Different object, same root id
    EXPECT_FALSE(controller->setRoute(makeRouteTree(test::sampleTree())));
    EXPECT_FALSE(controller->setRoute(tree));

    EXPECT_EQ(surface.commits.size(), 1);
    EXPECT_EQ(controller->generation(), 1);
    EXPECT_EQ(controller->activeRoute(), tree);
}

TEST_F(InteractionControllerTest, SetRoute_NewIdRebuilds) {
    controller->setRoute(tree);
    RoutePtr other = makeRouteTree(Route("other", "/other", "", {Route("x", "/other/x")}));

    EXPECT_TRUE(controller->setRoute(other));
    EXPECT_EQ(surface.commits.size(), 2);
    EXPECT_EQ(controller->snapshot().nodes.size(), 2);
    EXPECT_EQ(controller->generation(), 2);
}

TEST_F(InteractionControllerTest, SetRoute_NullThrows) {
    EXPECT_THROW(controller->setRoute(nullptr), std::invalid_argument);
}

TEST_F(InteractionControllerTest, SetRoute_MalformedTreeLeavesStateUnchanged) {
    controller->setRoute(tree);
    RoutePtr broken = makeRouteTree(Route("bad", "/", "", {Route("x", "/x"), Route("x", "/y")}));

    EXPECT_THROW(controller->setRoute(broken), StructuralViolation);
    EXPECT_EQ(controller->activeRoute(), tree);
    EXPECT_EQ(surface.commits.size(), 1);
    EXPECT_EQ(controller->generation(), 1);
}

// --- Direction changes ---

TEST_F(InteractionControllerTest, SetDirection_RelayoutsAndQueuesRefocus) {
    controller->setRoute(tree);
    controller->setDirection("TB");

    ASSERT_EQ(surface.commits.size(), 2);
    EXPECT_EQ(surface.commits[1].direction, Direction::TopToBottom);
    EXPECT_EQ(controller->direction(), Direction::TopToBottom);

    // Camera waits until the surface drains the queue
    EXPECT_TRUE(surface.cameras.empty());
    EXPECT_EQ(queue.pendingCount(), 1);

    queue.runPending();

    ASSERT_EQ(surface.cameras.size(), 1);
    const GraphNode* root = controller->snapshot().root();
    EXPECT_FLOAT_EQ(surface.cameras[0].x, root->center().x);
    EXPECT_FLOAT_EQ(surface.cameras[0].y, root->center().y);
    EXPECT_FLOAT_EQ(surface.cameras[0].zoom, 0.5f);
    EXPECT_EQ(surface.cameras[0].durationMs, 1000);
}

TEST_F(InteractionControllerTest, SetDirection_SameDirectionStillRefocuses) {
    controller->setRoute(tree);
    controller->setDirection(Direction::LeftToRight);

    EXPECT_EQ(surface.commits.size(), 2);
    queue.runPending();
    EXPECT_EQ(surface.cameras.size(), 1);
}

TEST_F(InteractionControllerTest, SetDirection_UnknownRejectedBeforeWork) {
    controller->setRoute(tree);

    EXPECT_THROW(controller->setDirection("up"), UnknownDirection);
    EXPECT_THROW(controller->setDirection(static_cast<Direction>(9)), UnknownDirection);

    EXPECT_EQ(surface.commits.size(), 1);
    EXPECT_EQ(queue.pendingCount(), 0);
    EXPECT_EQ(controller->direction(), Direction::LeftToRight);
}

TEST_F(InteractionControllerTest, SetDirection_WithoutRouteOnlyStoresDirection) {
    controller->setDirection("BT");

    EXPECT_TRUE(surface.commits.empty());
    EXPECT_EQ(queue.pendingCount(), 0);

    controller->setRoute(tree);
    EXPECT_EQ(surface.commits[0].direction, Direction::BottomToTop);
}

TEST_F(InteractionControllerTest, StaleRefocusIsIgnored) {
    controller->setRoute(tree);
    controller->setDirection("TB");
    controller->setDirection("BT");
    EXPECT_EQ(queue.pendingCount(), 2);

    queue.runPending();

    // Only the refocus of the latest rebuild moves the camera
    ASSERT_EQ(surface.cameras.size(), 1);
    EXPECT_FLOAT_EQ(surface.cameras[0].y, controller->snapshot().root()->center().y);
}

TEST_F(InteractionControllerTest, RefocusSupersededByRouteChange) {
    controller->setRoute(tree);
    controller->setDirection("TB");
    controller->setRoute(makeRouteTree(Route("other", "/other")));

    queue.runPending();
    EXPECT_TRUE(surface.cameras.empty());
}

TEST_F(InteractionControllerTest, RefocusAfterControllerDestroyedIsHarmless) {
    controller->setRoute(tree);
    controller->setDirection("TB");
    controller.reset();

    EXPECT_EQ(queue.runPending(), 1);
    EXPECT_TRUE(surface.cameras.empty());
}

// --- Clicks ---

TEST_F(InteractionControllerTest, ClickOnActiveRoute_NoCallback) {
    controller->setRoute(tree);
    const GraphNode* root = controller->snapshot().root();

    EXPECT_FALSE(controller->handleNodeClick(root->id));
    EXPECT_TRUE(selected.empty());
}

TEST_F(InteractionControllerTest, ClickOnOtherRoute_ExactlyOneCallback) {
    controller->setRoute(tree);
    const GraphNode* a1 = nodeFor(controller->snapshot(), "a1");
    ASSERT_NE(a1, nullptr);

    EXPECT_TRUE(controller->handleNodeClick(a1->id));

    ASSERT_EQ(selected.size(), 1);
    EXPECT_EQ(selected[0]->id, "a1");
    EXPECT_EQ(selected[0]->path, "/a/1");
}

TEST_F(InteractionControllerTest, ClickOnEveryNonActiveNode) {
    controller->setRoute(tree);
    for (const auto& node : controller->snapshot().nodes) {
        controller->handleNodeClick(node.id);
    }
    EXPECT_EQ(selected.size(), 3);
}

TEST_F(InteractionControllerTest, SelectedRouteOutlivesTree) {
    controller->setRoute(tree);
    controller->handleNodeClick(nodeFor(controller->snapshot(), "a")->id);
    ASSERT_EQ(selected.size(), 1);

    // Drop every other owner of the tree
    controller->setRoute(makeRouteTree(Route("other", "/other")));
    tree.reset();
    surface.commits.clear();

    EXPECT_EQ(selected[0]->id, "a");
    ASSERT_EQ(selected[0]->routes.size(), 1);
    EXPECT_EQ(selected[0]->routes[0].id, "a1");
}

TEST_F(InteractionControllerTest, ClickDrivesNavigation) {
    controller->setRoute(tree);
    controller->handleNodeClick(nodeFor(controller->snapshot(), "a")->id);
    ASSERT_EQ(selected.size(), 1);

    EXPECT_TRUE(controller->setRoute(selected[0]));
    EXPECT_EQ(controller->activeRoute()->id, "a");
    EXPECT_EQ(controller->snapshot().nodes.size(), 2);

    // Clicking the new root is now a no-op
    EXPECT_FALSE(controller->handleNodeClick(controller->snapshot().root()->id));
    EXPECT_EQ(selected.size(), 1);
}

TEST_F(InteractionControllerTest, ClickOnUnknownNode_IgnoredWithWarning) {
    controller->setRoute(tree);
    Logger::enableCapture(true);
    Logger::clearCapturedLogs();

    EXPECT_FALSE(controller->handleNodeClick("99"));

    EXPECT_TRUE(selected.empty());
    auto logs = Logger::getCapturedLogs("[warn]");
    Logger::enableCapture(false);
    ASSERT_FALSE(logs.empty());
    EXPECT_NE(logs.back().find("'99'"), std::string::npos);
}

TEST_F(InteractionControllerTest, ClickBeforeAnyRoute_Ignored) {
    EXPECT_FALSE(controller->handleNodeClick("1"));
    EXPECT_TRUE(selected.empty());
}

// --- Viewport ---

TEST_F(InteractionControllerTest, FitViewSetsCameraImmediately) {
    controller->setRoute(tree);
    controller->fitView(Size{800.0f, 600.0f});

    ASSERT_EQ(surface.cameras.size(), 1);
    Rect bounds = controller->snapshot().bounds();
    EXPECT_FLOAT_EQ(surface.cameras[0].x, bounds.center().x);
    EXPECT_EQ(queue.pendingCount(), 0);
}

TEST(InteractionControllerConfigTest, InvalidConfigRejected) {
    RecordingSurface surface;
    DeferredTaskQueue queue;
    EXPECT_THROW(InteractionController(surface, queue, nullptr,
                                       LayoutConfig{}.setNodeSize(0.0f, 0.0f)),
                 InvalidLayoutConfig);
}

TEST(InteractionControllerConfigTest, ConfiguredDefaultDirection) {
    RecordingSurface surface;
    DeferredTaskQueue queue;
    InteractionController controller(surface, queue, nullptr,
                                     LayoutConfig{}.setDirection(Direction::RightToLeft));

    EXPECT_EQ(controller.direction(), Direction::RightToLeft);
    controller.setRoute(makeRouteTree(test::sampleTree()));
    EXPECT_EQ(surface.commits.back().direction, Direction::RightToLeft);
}
