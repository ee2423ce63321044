/*
 * Unit tests for ExplorationState and CoverageTracker
 */
#include <gtest/gtest.h>
#include "../model/ExplorationState.h"
#include "../model/CoverageTracker.h"
#include <memory>

using namespace scoutbot;

class ExplorationStateTest : public ::testing::Test {
protected:
    void SetUp() override {
        home = addScreen("Home", 3);
        list = addScreen("List", 2);
    }

    ScreenPtr addScreen(const std::string &name, int elements) {
        auto screen = std::make_shared<Screen>(name, "com.shop", 1080, 1920);
        for (int i = 0; i < elements; i++) {
            screen->addClickable(std::make_shared<ClickableElement>(
                    "com.shop:id/" + name + std::to_string(i), "", "", "android.widget.Button",
                    Rect(0, 200 + i * 200, 1080, 350 + i * 200)));
        }
        state.screens()[screen->getId()] = screen;
        return screen;
    }

    std::string keyOf(const ScreenPtr &screen, size_t index) {
        return compositeKey(screen->getId(), screen->getClickables()[index]->getId());
    }

    ExplorationState state{"com.shop"};
    ScreenPtr home;
    ScreenPtr list;
};

TEST_F(ExplorationStateTest, InitialValues) {
    ExplorationState fresh("com.other");
    EXPECT_EQ(fresh.getTargetPackage(), "com.other");
    EXPECT_EQ(fresh.getPassNumber(), 1);
    EXPECT_EQ(fresh.getStatus(), RunStatus::NotStarted);
    EXPECT_EQ(fresh.visitedCount(), 0u);
}

TEST_F(ExplorationStateTest, VisitedSetOnlyGrowsWithinPass) {
    EXPECT_TRUE(state.markVisited(keyOf(home, 0)));
    EXPECT_FALSE(state.markVisited(keyOf(home, 0)));
    size_t before = state.visitedCount();
    state.markVisited(keyOf(list, 1));
    EXPECT_GE(state.visitedCount(), before);
    EXPECT_TRUE(state.isVisited(keyOf(home, 0)));
    EXPECT_EQ(state.visitedCount(), 2u);
}

TEST_F(ExplorationStateTest, Issues) {
    state.addIssue(IssueType::BackFailed, home->getId(), "", "back stayed", 10);
    state.addIssue(IssueType::BackFailed, list->getId(), "", "back stayed", 20);
    state.addIssue(IssueType::BlockerScreen, list->getId(), "", "login", 30);
    EXPECT_EQ(state.issues().size(), 3u);
    EXPECT_EQ(state.countIssues(IssueType::BackFailed), 2u);
    EXPECT_EQ(state.countIssues(IssueType::Timeout), 0u);
    EXPECT_STREQ(issueTypeName(IssueType::BranchUnreachable), "branch_unreachable");
}

TEST_F(ExplorationStateTest, BeginNextPassKeepsKnowledge) {
    state.markVisited(keyOf(home, 0));
    home->getClickables()[0]->setExplored(true);
    home->getClickables()[1]->setExcluded(true);
    state.dangerousPatterns().insert("Button|close|top");
    state.markUnreachable(list->getId());
    ExplorationTarget target;
    target.screenId = home->getId();
    target.elementId = "x";
    state.queue().append(target);

    state.beginNextPass();
    EXPECT_EQ(state.getPassNumber(), 2);
    EXPECT_EQ(state.visitedCount(), 0u);
    EXPECT_TRUE(state.queue().empty());
    EXPECT_FALSE(state.isUnreachable(list->getId()));
    EXPECT_FALSE(home->getClickables()[0]->isExplored());
    EXPECT_TRUE(home->getClickables()[1]->isExcluded());
    EXPECT_EQ(state.dangerousPatterns().size(), 1u);
    EXPECT_EQ(state.screens().size(), 2u);
}

TEST_F(ExplorationStateTest, BeginNextPassScrollsContainersAgain) {
    auto feed = std::make_shared<ScrollableContainer>("com.shop:id/feed", "RecyclerView", Rect(0, 0, 1080, 1600));
    home->addScrollable(feed);
    for (int i = 0; i < 5; i++) {
        feed->increaseScrollCount();
    }
    feed->setReachedEnd(true);

    state.beginNextPass();
    EXPECT_EQ(feed->getScrollCount(), 0);
    EXPECT_FALSE(feed->reachedEnd());
}

TEST_F(ExplorationStateTest, Counters) {
    state.increaseActionsTaken();
    state.increaseRestarts();
    state.increaseBacktracks();
    state.increaseBacktracks();
    EXPECT_EQ(state.getActionsTaken(), 1);
    EXPECT_EQ(state.getRestarts(), 1);
    EXPECT_EQ(state.getBacktracks(), 2);
    EXPECT_EQ(state.elementCount(), 5u);
}

// ==================== Coverage ====================

TEST_F(ExplorationStateTest, CoverageOfUntouchedRun) {
    CoverageMetrics metrics = CoverageTracker::compute(state);
    EXPECT_EQ(metrics.discoveredScreens, 2);
    EXPECT_EQ(metrics.discoveredElements, 5);
    EXPECT_EQ(metrics.visitedElements, 0);
    EXPECT_EQ(metrics.unexploredBranches, 2);
    // no scrollables at all counts as fully scrolled
    EXPECT_DOUBLE_EQ(metrics.overall(), 0.2);
}

TEST_F(ExplorationStateTest, CoverageCountsVisitedAndExcluded) {
    state.markVisited(keyOf(list, 0));
    list->getClickables()[1]->setExcluded(true);
    home->getClickables()[0]->setExplored(true);
    CoverageMetrics metrics = CoverageTracker::compute(state);
    EXPECT_EQ(metrics.discoveredElements, 4);
    EXPECT_EQ(metrics.visitedElements, 2);
    EXPECT_EQ(metrics.fullyExploredScreens, 1);
    EXPECT_DOUBLE_EQ(metrics.elementCoverage(), 0.5);
    EXPECT_DOUBLE_EQ(metrics.screenCoverage(), 0.5);
    EXPECT_DOUBLE_EQ(metrics.overall(), 0.5 * 0.5 + 0.3 * 0.5 + 0.2);
}

TEST_F(ExplorationStateTest, CoverageOfScrollContainers) {
    auto list2 = std::make_shared<ScrollableContainer>("com.shop:id/list", "ListView", Rect(0, 0, 1080, 1500));
    auto list3 = std::make_shared<ScrollableContainer>("com.shop:id/grid", "GridView", Rect(0, 0, 1080, 1400));
    home->addScrollable(list2);
    home->addScrollable(list3);
    list2->increaseScrollCount();
    CoverageMetrics metrics = CoverageTracker::compute(state);
    EXPECT_EQ(metrics.scrollContainers, 2);
    EXPECT_EQ(metrics.scrolledContainers, 1);
    EXPECT_DOUBLE_EQ(metrics.scrollCoverage(), 0.5);
}

TEST_F(ExplorationStateTest, UnreachableScreensCountAsDone) {
    state.markUnreachable(list->getId());
    CoverageMetrics metrics = CoverageTracker::compute(state);
    EXPECT_EQ(metrics.fullyExploredScreens, 1);
    std::vector<FrontierSummary> frontier = CoverageTracker::frontier(state);
    ASSERT_EQ(frontier.size(), 1u);
    EXPECT_EQ(frontier[0].screenId, home->getId());
    EXPECT_EQ(frontier[0].unexplored, 3);
}

TEST_F(ExplorationStateTest, TargetOnlyForCoverageGoal) {
    CoverageMetrics metrics;
    metrics.discoveredScreens = 1;
    metrics.fullyExploredScreens = 1;
    metrics.discoveredElements = 1;
    metrics.visitedElements = 1;
    ExplorationConfig config = ExplorationConfig::forCoverage(80.0);
    EXPECT_TRUE(CoverageTracker::hasReachedTarget(metrics, config));
    config.goal = ExplorationGoal::DeepMap;
    EXPECT_FALSE(CoverageTracker::hasReachedTarget(metrics, config));
    EXPECT_NE(metrics.toString().find("100.0%"), std::string::npos);
}
