/*
 * Unit tests for NavigationGraph class
 */
#include <gtest/gtest.h>
#include "../model/NavigationGraph.h"
#include <memory>

using namespace scoutbot;

class RecordingListener : public NavigationGraphListener {
public:
    void onAddScreen(const std::string &screenId, bool blocker) override {
        added.push_back(screenId);
        if (blocker)
            blockers++;
    }

    void onConditionalEdge(const std::string &fromScreen, const std::string &elementId) override {
        conditional.push_back(fromScreen + ":" + elementId);
    }

    std::vector<std::string> added;
    std::vector<std::string> conditional;
    int blockers = 0;
};

class NavigationGraphTest : public ::testing::Test {
protected:
    void SetUp() override {
        patterns = {"login", "sign in", "password", "verify"};
        listener = std::make_shared<RecordingListener>();
        graph.addListener(listener);
        for (const auto &name: {"Home", "List", "Detail", "Settings", "Orphan"}) {
            auto screen = std::make_shared<Screen>(name, "com.shop", 1080, 1920);
            graph.addScreen(screen, patterns);
            ids[name] = screen->getId();
        }
        // Home -> List -> Detail, Home -> Settings
        graph.recordTransition(ids["Home"], "open_list", ids["List"]);
        graph.recordTransition(ids["List"], "row_1", ids["Detail"]);
        graph.recordTransition(ids["Home"], "open_settings", ids["Settings"]);
        graph.recordTransition(ids["Settings"], "up", ids["Home"]);
    }

    stringVec patterns;
    NavigationGraph graph;
    std::shared_ptr<RecordingListener> listener;
    std::map<std::string, std::string> ids;
};

TEST_F(NavigationGraphTest, AddScreenOnlyOnce) {
    auto again = std::make_shared<Screen>("Home", "com.shop", 1080, 1920);
    EXPECT_FALSE(graph.addScreen(again, patterns));
    EXPECT_EQ(graph.screenCount(), 5u);
    EXPECT_EQ(listener->added.size(), 5u);
}

TEST_F(NavigationGraphTest, FindPathStepsLandOnDestination) {
    NavigationPath path;
    ASSERT_TRUE(graph.findPath(ids["Settings"], ids["Detail"], path));
    ASSERT_EQ(path.size(), 3u);
    EXPECT_EQ(path[0].screenId, ids["Settings"]);
    // every step starts where the previous one landed, the last lands on the destination
    std::string cursor = ids["Settings"];
    for (const auto &step: path) {
        EXPECT_EQ(step.screenId, cursor);
        const ElementNavigation *navigation = graph.getNavigation(step.screenId, step.elementId);
        ASSERT_NE(navigation, nullptr);
        cursor = navigation->mostFrequentDestination();
    }
    EXPECT_EQ(cursor, ids["Detail"]);
}

TEST_F(NavigationGraphTest, FindPathToSelfIsEmpty) {
    NavigationPath path;
    EXPECT_TRUE(graph.findPath(ids["List"], ids["List"], path));
    EXPECT_TRUE(path.empty());
}

TEST_F(NavigationGraphTest, FindPathToUnknownScreenFails) {
    NavigationPath path;
    EXPECT_FALSE(graph.findPath(ids["Home"], "unknown", path));
    EXPECT_FALSE(graph.findPath("unknown", ids["Home"], path));
    EXPECT_TRUE(path.empty());
}

TEST_F(NavigationGraphTest, FindPathToUnconnectedScreenFails) {
    NavigationPath path;
    EXPECT_FALSE(graph.findPath(ids["Home"], ids["Orphan"], path));
    EXPECT_FALSE(graph.findOptimalPath(ids["Home"], ids["Orphan"], path));
}

TEST_F(NavigationGraphTest, ConditionalElementKeepsAllDestinations) {
    graph.recordTransition(ids["List"], "row_1", ids["Settings"]);
    graph.recordTransition(ids["List"], "row_1", ids["Detail"]);
    const ElementNavigation *navigation = graph.getNavigation(ids["List"], "row_1");
    ASSERT_NE(navigation, nullptr);
    EXPECT_TRUE(navigation->isConditional());
    EXPECT_EQ(navigation->occurrencesOf(ids["Detail"]), 2);
    EXPECT_EQ(navigation->occurrencesOf(ids["Settings"]), 1);
    EXPECT_EQ(navigation->totalOccurrences(), 3);
    EXPECT_EQ(navigation->mostFrequentDestination(), ids["Detail"]);
    ASSERT_EQ(listener->conditional.size(), 1u);
    EXPECT_EQ(graph.conditionalEdges().size(), 1u);
}

TEST_F(NavigationGraphTest, EdgeReliability) {
    // single observation: 1.0 share + 0.02 bonus, clamped to 1
    EXPECT_DOUBLE_EQ(graph.edgeReliability(ids["Home"], "open_list", ids["List"]), 1.0);
    EXPECT_DOUBLE_EQ(graph.edgeReliability(ids["Home"], "missing", ids["List"]), 0.5);

    graph.recordTransition(ids["List"], "row_1", ids["Settings"]);
    // 1/2 + 0.04 - 0.1
    EXPECT_NEAR(graph.edgeReliability(ids["List"], "row_1", ids["Detail"]), 0.44, 1e-9);
}

TEST_F(NavigationGraphTest, OptimalPathPrefersReliableEdges) {
    // a shortcut that only sometimes reaches Detail
    graph.recordTransition(ids["Home"], "flaky", ids["Detail"]);
    for (int i = 0; i < 4; i++) {
        graph.recordTransition(ids["Home"], "flaky", ids["Orphan"]);
    }
    NavigationPath shortest;
    ASSERT_TRUE(graph.findPath(ids["Home"], ids["Detail"], shortest));
    NavigationPath optimal;
    ASSERT_TRUE(graph.findOptimalPath(ids["Home"], ids["Detail"], optimal));
    ASSERT_EQ(optimal.size(), 2u);
    EXPECT_EQ(optimal[0].elementId, "open_list");
    EXPECT_EQ(optimal[1].elementId, "row_1");
}

TEST_F(NavigationGraphTest, BlockerScreensAreNeverDestinations) {
    auto login = std::make_shared<Screen>("LoginActivity", "com.shop", 1080, 1920);
    EXPECT_TRUE(graph.addScreen(login, patterns));
    EXPECT_TRUE(login->isBlocker());
    EXPECT_TRUE(graph.isBlocker(login->getId()));
    EXPECT_EQ(listener->blockers, 1);
    graph.recordTransition(ids["Home"], "account", login->getId());
    NavigationPath path;
    EXPECT_FALSE(graph.findPath(ids["Home"], login->getId(), path));
}

TEST_F(NavigationGraphTest, PathsMayPassThroughBlockers) {
    auto gate = std::make_shared<Screen>("LoginActivity", "com.shop", 1080, 1920);
    ASSERT_TRUE(graph.addScreen(gate, patterns));
    ASSERT_TRUE(graph.isBlocker(gate->getId()));
    // Orphan is only reachable across the gate
    graph.recordTransition(ids["Home"], "unlock", gate->getId());
    graph.recordTransition(gate->getId(), "skip", ids["Orphan"]);

    NavigationPath path;
    ASSERT_TRUE(graph.findPath(ids["Home"], ids["Orphan"], path));
    ASSERT_EQ(path.size(), 2u);
    EXPECT_EQ(path[1].screenId, gate->getId());
    EXPECT_EQ(path[1].elementId, "skip");

    NavigationPath optimal;
    ASSERT_TRUE(graph.findOptimalPath(ids["Home"], ids["Orphan"], optimal));
    ASSERT_EQ(optimal.size(), 2u);
    EXPECT_EQ(optimal[0].elementId, "unlock");
    EXPECT_EQ(optimal[1].screenId, gate->getId());
}

TEST_F(NavigationGraphTest, BlockerClassifier) {
    Screen passwordScreen("Account", "com.shop", 1080, 1920);
    InputField field;
    field.id = "pw";
    field.isPassword = true;
    passwordScreen.addInput(field);
    EXPECT_TRUE(NavigationGraph::isBlockerScreen(passwordScreen, patterns));

    Screen oneText("Profile", "com.shop", 1080, 1920);
    oneText.addText(TextElement{"Sign in to sync", "", Rect()});
    EXPECT_FALSE(NavigationGraph::isBlockerScreen(oneText, patterns));
    oneText.addText(TextElement{"Verify your email", "", Rect()});
    EXPECT_TRUE(NavigationGraph::isBlockerScreen(oneText, patterns));
}

TEST_F(NavigationGraphTest, BlockerPatternMatchesWords) {
    EXPECT_TRUE(NavigationGraph::matchesBlockerPattern("SignInActivity", patterns));
    EXPECT_TRUE(NavigationGraph::matchesBlockerPattern("user_login_page", patterns));
    EXPECT_FALSE(NavigationGraph::matchesBlockerPattern("Blogin", patterns));
    EXPECT_FALSE(NavigationGraph::matchesBlockerPattern("", patterns));
}

TEST_F(NavigationGraphTest, NeighboursAndDestinations) {
    std::set<std::string> next = graph.neighbours(ids["Home"]);
    EXPECT_EQ(next.size(), 2u);
    EXPECT_TRUE(next.count(ids["List"]));
    graph.recordTransition(ids["Home"], "open_list", ids["List"]);
    std::map<std::string, int> destinations = graph.destinationsOf(ids["Home"]);
    EXPECT_EQ(destinations[ids["List"]], 2);
    EXPECT_EQ(destinations[ids["Settings"]], 1);
    EXPECT_EQ(graph.edgeCount(), 4u);
}

TEST_F(NavigationGraphTest, EmptyEndpointIgnored) {
    graph.recordTransition("", "x", ids["Home"]);
    EXPECT_EQ(graph.edgeCount(), 4u);
}

TEST_F(NavigationGraphTest, ToJson) {
    std::string json = graph.toJson();
    EXPECT_NE(json.find("\"edges\""), std::string::npos);
    EXPECT_NE(json.find("open_list"), std::string::npos);
}
