/*
 * Unit tests for StalenessTracker and StuckRecovery
 */
#include <gtest/gtest.h>
#include "../agent/StuckRecovery.h"
#include <string>
#include <vector>

using namespace scoutbot;

namespace {
    class ScriptedActions : public RecoveryActions {
    public:
        bool scrollNearestContainer() override {
            calls.push_back("scroll");
            return succeedAt == "scroll";
        }

        bool navigateBack() override {
            calls.push_back("back");
            return succeedAt == "back";
        }

        bool tapNavigationEntry() override {
            calls.push_back("tab");
            return succeedAt == "tab";
        }

        bool restartApp() override {
            calls.push_back("restart");
            return succeedAt == "restart";
        }

        bool requestHumanHelp(long waitMs) override {
            calls.push_back("human");
            lastWaitMs = waitMs;
            return succeedAt == "human";
        }

        std::string succeedAt;
        std::vector<std::string> calls;
        long lastWaitMs = 0;
    };
}

class StalenessTrackerTest : public ::testing::Test {
protected:
    StalenessTracker tracker{5, 15, 120000};
};

TEST_F(StalenessTrackerTest, StuckAfterFiveOnSameScreen) {
    for (int i = 1; i <= 4; i++) {
        EXPECT_EQ(tracker.recordNoProgress("screenA"), i);
        EXPECT_FALSE(tracker.isStuck(0));
    }
    EXPECT_EQ(tracker.recordNoProgress("screenA"), 5);
    EXPECT_TRUE(tracker.isStuck(0));
}

TEST_F(StalenessTrackerTest, DifferentScreenRestartsCount) {
    for (int i = 0; i < 4; i++)
        tracker.recordNoProgress("screenA");
    EXPECT_EQ(tracker.recordNoProgress("screenB"), 1);
    EXPECT_EQ(tracker.getScreenId(), "screenB");
    for (int i = 0; i < 3; i++)
        tracker.recordNoProgress("screenB");
    EXPECT_FALSE(tracker.isStuck(0));
    EXPECT_EQ(tracker.getSinceDiscovery(), 8);
}

TEST_F(StalenessTrackerTest, NewScreenRestartsCountAtOne) {
    for (int i = 0; i < 4; i++)
        tracker.recordNoProgress("screenA");
    tracker.recordDiscovery("screenB", 100);
    EXPECT_EQ(tracker.getCount(), 1);
    EXPECT_EQ(tracker.getScreenId(), "screenB");
    EXPECT_EQ(tracker.getSinceDiscovery(), 0);
    for (int i = 0; i < 3; i++)
        tracker.recordNoProgress("screenB");
    EXPECT_FALSE(tracker.isStuck(100));
    EXPECT_EQ(tracker.recordNoProgress("screenB"), 5);
    EXPECT_TRUE(tracker.isStuck(100));
}

TEST_F(StalenessTrackerTest, ResetKeepsRestartCounter) {
    for (int i = 0; i < 15; i++)
        tracker.recordNoProgress("screenA");
    EXPECT_TRUE(tracker.needsRestart());
    tracker.reset(0);
    EXPECT_EQ(tracker.getCount(), 0);
    EXPECT_FALSE(tracker.isStuck(0));
    EXPECT_TRUE(tracker.needsRestart());
    EXPECT_EQ(tracker.recordNoProgress("screenA"), 1);
}

TEST_F(StalenessTrackerTest, PlateauNeedsStaleAction) {
    tracker.recordDiscovery("screenA", 0);
    EXPECT_FALSE(tracker.isStuck(200000));
    tracker.recordNoProgress("screenA");
    EXPECT_FALSE(tracker.hasPlateaued(119999));
    EXPECT_TRUE(tracker.hasPlateaued(120000));
    EXPECT_TRUE(tracker.isStuck(120000));
}

TEST(StuckRecoveryTest, FirstLevelSuccessEndsEpisode) {
    StuckRecovery recovery(3, 1000);
    ScriptedActions actions;
    actions.succeedAt = "scroll";
    recovery.beginEpisode(false);
    RecoveryOutcome outcome = recovery.attempt(actions);
    EXPECT_EQ(outcome.level, RecoveryLevel::Scroll);
    EXPECT_EQ(outcome.result, RecoveryResult::Succeeded);
    EXPECT_FALSE(recovery.inEpisode());
    EXPECT_EQ(recovery.getEpisodes(), 1);
}

TEST(StuckRecoveryTest, EscalatesAfterTwoAttemptsPerLevel) {
    StuckRecovery recovery(3, 1000);
    ScriptedActions actions;
    actions.succeedAt = "tab";
    recovery.beginEpisode(false);
    RecoveryOutcome outcome;
    do {
        outcome = recovery.attempt(actions);
    } while (outcome.result == RecoveryResult::Failed);
    EXPECT_EQ(outcome.result, RecoveryResult::Succeeded);
    EXPECT_EQ(outcome.level, RecoveryLevel::NavigationTab);
    std::vector<std::string> expected = {"scroll", "scroll", "back", "back", "tab"};
    EXPECT_EQ(actions.calls, expected);
}

TEST(StuckRecoveryTest, FullLadderExhausts) {
    StuckRecovery recovery(3, 30000);
    ScriptedActions actions;
    recovery.beginEpisode(false);
    RecoveryOutcome outcome;
    int attempts = 0;
    do {
        outcome = recovery.attempt(actions);
        attempts++;
    } while (outcome.result == RecoveryResult::Failed);
    EXPECT_EQ(outcome.result, RecoveryResult::Exhausted);
    EXPECT_EQ(attempts, 10);
    EXPECT_EQ(actions.lastWaitMs, 30000);
    EXPECT_EQ(recovery.getRestarts(), 2);
    EXPECT_FALSE(recovery.inEpisode());
}

TEST(StuckRecoveryTest, HardThresholdStartsAtRestart) {
    StuckRecovery recovery(3, 1000);
    ScriptedActions actions;
    actions.succeedAt = "restart";
    recovery.beginEpisode(true);
    EXPECT_EQ(recovery.currentLevel(), RecoveryLevel::Restart);
    RecoveryOutcome outcome = recovery.attempt(actions);
    EXPECT_EQ(outcome.result, RecoveryResult::Succeeded);
    ASSERT_EQ(actions.calls.size(), 1u);
    EXPECT_EQ(actions.calls[0], "restart");
}

TEST(StuckRecoveryTest, RestartBudgetIsFatal) {
    StuckRecovery recovery(1, 1000);
    ScriptedActions actions;
    recovery.beginEpisode(true);
    EXPECT_EQ(recovery.attempt(actions).result, RecoveryResult::Failed);
    RecoveryOutcome outcome = recovery.attempt(actions);
    EXPECT_EQ(outcome.result, RecoveryResult::RunFatal);
    EXPECT_EQ(outcome.level, RecoveryLevel::Restart);
    EXPECT_EQ(actions.calls.size(), 1u);
}

TEST(StuckRecoveryTest, AttemptOutsideEpisodeStartsOne) {
    StuckRecovery recovery(3, 1000);
    ScriptedActions actions;
    actions.succeedAt = "scroll";
    EXPECT_FALSE(recovery.inEpisode());
    EXPECT_EQ(recovery.attempt(actions).result, RecoveryResult::Succeeded);
    EXPECT_EQ(recovery.getEpisodes(), 1);
}

TEST(StuckRecoveryTest, RecommendsProvenLevel) {
    StuckRecovery recovery(10, 1000);
    ScriptedActions actions;
    EXPECT_EQ(recovery.recommendedLevel(), RecoveryLevel::Exhausted);
    actions.succeedAt = "scroll";
    for (int i = 0; i < 3; i++) {
        recovery.beginEpisode(false);
        recovery.attempt(actions);
    }
    EXPECT_EQ(recovery.recommendedLevel(), RecoveryLevel::Scroll);
    EXPECT_DOUBLE_EQ(recovery.getStatistics().at(RecoveryLevel::Scroll).successRate(), 1.0);
}
