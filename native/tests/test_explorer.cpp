/*
 * End to end tests of the Explorer against scripted applications
 */
#include <gtest/gtest.h>
#include "../model/Explorer.h"
#include "../project/sim/SimulatedApp.h"
#include <memory>
#include <vector>

using namespace scoutbot;

namespace {
    class RecordingSink : public StatusSink {
    public:
        void onTransition(LifecycleState /* from */, LifecycleState to, LifecycleEvent /* event */) override {
            states.push_back(to);
            if (to == LifecycleState::Stuck && app) {
                int taps = 0;
                for (const auto &entry: app->getTapCounts())
                    taps += entry.second;
                tapsWhenStuck.push_back(taps);
            }
        }

        void onProgress(const ProgressReport & /* report */) override {
            progressReports++;
        }

        void onIssue(const ExplorationIssue &issue) override {
            issues.push_back(issue.type);
        }

        SimulatedAppPtr app;
        std::vector<LifecycleState> states;
        std::vector<int> tapsWhenStuck;
        std::vector<IssueType> issues;
        int progressReports = 0;
    };

    const char *const TreeApp = R"({
        "package": "com.demo",
        "screens": [
            {"name": "Home", "elements": [
                {"id": "profile", "text": "Profile", "to": "Profile"},
                {"id": "gallery", "text": "Gallery", "to": "Gallery"},
                {"id": "refresh", "text": "Refresh"}
            ]},
            {"name": "Profile", "elements": [
                {"id": "avatar", "text": "Avatar"},
                {"id": "edit_name", "text": "Edit name", "to": "Editor"}
            ]},
            {"name": "Gallery", "elements": [
                {"id": "picture", "text": "Picture", "to": "Viewer"}
            ]},
            {"name": "Editor", "elements": [{"id": "apply", "text": "Apply"}]},
            {"name": "Viewer", "elements": [{"id": "zoom", "text": "Zoom"}]}
        ]
    })";
}

class ExplorerTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock = std::make_shared<ManualClock>(1000);
        store = std::make_shared<MemoryPolicyStore>();
        sink = std::make_shared<RecordingSink>();
        config.strategy = StrategyType::ScreenFirst;
        config.actionDelayMs = 100;
        config.transitionWaitMs = 1000;
        config.stabilizationWaitMs = 1000;
        config.scrollDelayMs = 100;
    }

    ExplorerPtr load(const char *description) {
        app = SimulatedApp::fromJson(description);
        EXPECT_TRUE(app != nullptr);
        sink->app = app;
        return Explorer::create(app, app, clock, store, sink);
    }

    int countIssues(const ExplorationResult &result, IssueType type) {
        int count = 0;
        for (const auto &issue: result.issues) {
            if (issue.type == type)
                count++;
        }
        return count;
    }

    ClickableElementPtr findElement(const ExplorerPtr &explorer, const std::string &activity,
                                    const std::string &resourceEntry, ScreenPtr *owner = nullptr) {
        for (const auto &entry: explorer->getState()->screens()) {
            if (entry.second->getActivity() != activity)
                continue;
            for (const auto &element: entry.second->getClickables()) {
                if (element->getResourceId() == "com.demo:id/" + resourceEntry) {
                    if (owner)
                        *owner = entry.second;
                    return element;
                }
            }
        }
        return nullptr;
    }

    ManualClockPtr clock;
    std::shared_ptr<MemoryPolicyStore> store;
    std::shared_ptr<RecordingSink> sink;
    SimulatedAppPtr app;
    ExplorationConfig config;
};

TEST_F(ExplorerTest, CreateNeedsCollaborators) {
    auto demo = SimulatedApp::fromJson(TreeApp);
    EXPECT_TRUE(Explorer::create(nullptr, demo, clock, store, sink) == nullptr);
    EXPECT_TRUE(Explorer::create(demo, nullptr, clock, store, sink) == nullptr);
    EXPECT_TRUE(Explorer::create(demo, demo, nullptr, store, sink) == nullptr);
    EXPECT_TRUE(Explorer::create(demo, demo, clock, nullptr, nullptr) != nullptr);
}

TEST_F(ExplorerTest, ExploresWholeTree) {
    ExplorerPtr explorer = load(TreeApp);
    ExplorationResult result = explorer->explore("com.demo", config);

    EXPECT_EQ(result.status, RunStatus::Completed);
    EXPECT_EQ(result.lifecycle, LifecycleState::Completed);
    EXPECT_EQ(result.screens, 5);
    EXPECT_EQ(result.visitedElements, 8);
    EXPECT_EQ(result.passes, 1);
    EXPECT_EQ(countIssues(result, IssueType::BranchUnreachable), 0);
    EXPECT_EQ(app->tapsOn("Editor", "apply"), 1);
    EXPECT_EQ(app->tapsOn("Viewer", "zoom"), 1);
    EXPECT_GT(result.backtracks, 0);
    EXPECT_GT(sink->progressReports, 0);
    EXPECT_FALSE(explorer->getOperationLog().empty());
    EXPECT_NE(result.toJson().find("\"status\":\"completed\""), std::string::npos);
}

TEST_F(ExplorerTest, EveryElementExploredAtMostOncePerPass) {
    ExplorerPtr explorer = load(TreeApp);
    explorer->explore("com.demo", config);
    for (const auto &entry: explorer->getState()->screens()) {
        for (const auto &element: entry.second->getClickables()) {
            EXPECT_LE(element->getTapCount(), 1) << entry.second->getActivity() << " " << element->label();
        }
    }
}

TEST_F(ExplorerTest, LifecycleRunsThroughToCompleted) {
    ExplorerPtr explorer = load(TreeApp);
    explorer->explore("com.demo", config);
    ASSERT_GE(sink->states.size(), 4u);
    EXPECT_EQ(sink->states[0], LifecycleState::Initializing);
    EXPECT_EQ(sink->states[1], LifecycleState::Exploring);
    EXPECT_EQ(sink->states[sink->states.size() - 2], LifecycleState::Completing);
    EXPECT_EQ(sink->states.back(), LifecycleState::Completed);
}

TEST_F(ExplorerTest, GraphRecordsTransitions) {
    ExplorerPtr explorer = load(TreeApp);
    explorer->explore("com.demo", config);
    ScreenPtr home;
    ClickableElementPtr profile = findElement(explorer, "Home", "profile", &home);
    ASSERT_TRUE(profile != nullptr);
    const ElementNavigation *navigation = explorer->getState()->graph().getNavigation(home->getId(),
                                                                                      profile->getId());
    ASSERT_TRUE(navigation != nullptr);
    EXPECT_FALSE(navigation->isConditional());
    EXPECT_EQ(profile->getOutcome(), ElementOutcome::Navigation);

    ClickableElementPtr refresh = findElement(explorer, "Home", "refresh");
    ASSERT_TRUE(refresh != nullptr);
    EXPECT_EQ(refresh->getOutcome(), ElementOutcome::NoEffect);
}

TEST_F(ExplorerTest, ConditionalNavigationKeepsBothDestinations) {
    ExplorerPtr explorer = load(R"({
        "package": "com.demo",
        "screens": [
            {"name": "Home", "elements": [{"id": "shuffle", "text": "Shuffle", "to": ["Alpha", "Beta"]}]},
            {"name": "Alpha"},
            {"name": "Beta"}
        ]
    })");
    config.maxPasses = 2;
    ExplorationResult result = explorer->explore("com.demo", config);
    EXPECT_EQ(result.status, RunStatus::Completed);
    EXPECT_EQ(result.passes, 2);
    EXPECT_EQ(result.screens, 3);
    EXPECT_EQ(app->tapsOn("Home", "shuffle"), 2);

    ScreenPtr home;
    ClickableElementPtr shuffle = findElement(explorer, "Home", "shuffle", &home);
    ASSERT_TRUE(shuffle != nullptr);
    const ElementNavigation *navigation = explorer->getState()->graph().getNavigation(home->getId(),
                                                                                      shuffle->getId());
    ASSERT_TRUE(navigation != nullptr);
    EXPECT_TRUE(navigation->isConditional());
    EXPECT_EQ(navigation->getDestinations().size(), 2u);
    for (const auto &destination: navigation->getDestinations())
        EXPECT_EQ(destination.second, 1);
}

TEST_F(ExplorerTest, ClosingElementBecomesDangerous) {
    ExplorerPtr explorer = load(R"({
        "package": "com.demo",
        "screens": [
            {"name": "Home", "elements": [
                {"id": "leave", "text": "Leave", "to": "@close"},
                {"id": "stay", "text": "Stay"}
            ]}
        ]
    })");
    config.maxPasses = 2;
    ExplorationResult result = explorer->explore("com.demo", config);
    EXPECT_EQ(result.status, RunStatus::Completed);
    EXPECT_EQ(countIssues(result, IssueType::AppMinimized), 1);
    EXPECT_GE(result.restarts, 1);

    ScreenPtr home;
    ClickableElementPtr leave = findElement(explorer, "Home", "leave", &home);
    ASSERT_TRUE(leave != nullptr);
    std::string actionKey = PolicyAgent::computeActionKey(*leave, home->getHeight());
    EXPECT_TRUE(explorer->getPolicy()->isDangerous(actionKey));
    EXPECT_EQ(explorer->getState()->dangerousPatterns().count(actionKey), 1u);
    // the second pass does not repeat the closing tap
    EXPECT_EQ(app->tapsOn("Home", "leave"), 1);
    EXPECT_EQ(app->tapsOn("Home", "stay"), 2);
}

TEST_F(ExplorerTest, CrashIsReportedAndRelaunched) {
    ExplorerPtr explorer = load(R"({
        "package": "com.demo",
        "screens": [
            {"name": "Home", "elements": [
                {"id": "boom", "text": "Boom", "to": "@crash"},
                {"id": "stay", "text": "Stay"}
            ]}
        ]
    })");
    ExplorationResult result = explorer->explore("com.demo", config);
    EXPECT_EQ(result.status, RunStatus::Completed);
    EXPECT_EQ(countIssues(result, IssueType::DangerousElement), 1);
    EXPECT_EQ(app->tapsOn("Home", "stay"), 1);
    EXPECT_EQ(app->getLaunches(), 2);
}

TEST_F(ExplorerTest, BlockerScreenIsReportedOnceAndLeft) {
    ExplorerPtr explorer = load(R"({
        "package": "com.demo",
        "screens": [
            {"name": "Home", "elements": [
                {"id": "account", "text": "Account", "to": "Gate"},
                {"id": "stay", "text": "Stay"}
            ]},
            {"name": "Gate", "password": true, "texts": ["Log in", "Forgot password"],
             "elements": [{"id": "submit", "text": "Submit", "to": "Home"}]}
        ]
    })");
    ExplorationResult result = explorer->explore("com.demo", config);
    EXPECT_EQ(result.status, RunStatus::Completed);
    EXPECT_EQ(countIssues(result, IssueType::BlockerScreen), 1);
    EXPECT_EQ(app->tapsOn("Gate", "submit"), 0);
    EXPECT_EQ(app->tapsOn("Home", "stay"), 1);

    ScreenPtr gate;
    findElement(explorer, "Gate", "submit", &gate);
    ASSERT_TRUE(gate != nullptr);
    EXPECT_TRUE(explorer->getState()->graph().isBlocker(gate->getId()));
}

TEST_F(ExplorerTest, ScrollRevealsHiddenElements) {
    ExplorerPtr explorer = load(R"({
        "package": "com.demo",
        "screens": [
            {"name": "Home",
             "elements": [
                {"id": "first", "text": "First"},
                {"id": "hidden", "text": "Hidden", "page": 1, "bounds": [40, 1000, 1040, 1120]}
             ],
             "scrollables": [{"id": "feed"}]}
        ]
    })");
    ExplorationResult result = explorer->explore("com.demo", config);
    EXPECT_EQ(result.status, RunStatus::Completed);
    EXPECT_EQ(app->tapsOn("Home", "first"), 1);
    EXPECT_EQ(app->tapsOn("Home", "hidden"), 1);
    EXPECT_EQ(result.visitedElements, 2);
}

TEST_F(ExplorerTest, StuckAfterFiveFruitlessTaps) {
    ExplorerPtr explorer = load(R"({
        "package": "com.demo",
        "screens": [
            {"name": "Home", "elements": [
                {"id": "a1", "text": "Alder"},
                {"id": "a2", "text": "Birch"},
                {"id": "a3", "text": "Cedar"},
                {"id": "a4", "text": "Elm"},
                {"id": "a5", "text": "Fir"},
                {"id": "a6", "text": "Hazel"},
                {"id": "hidden", "text": "Juniper", "page": 1, "bounds": [40, 1200, 1040, 1320]}
             ],
             "scrollables": [{"id": "feed"}]}
        ]
    })");
    ExplorationResult result = explorer->explore("com.demo", config);
    EXPECT_EQ(result.status, RunStatus::Completed);
    ASSERT_FALSE(sink->tapsWhenStuck.empty());
    EXPECT_EQ(sink->tapsWhenStuck[0], 5);
    const LifecycleCounters &counters = explorer->getLifecycle()->getCounters();
    EXPECT_GE(counters.stuckDetections, 1);
    EXPECT_GE(counters.recoveries, 1);
    EXPECT_EQ(app->tapsOn("Home", "a6"), 1);
    // the recovery scroll revealed the last element
    EXPECT_EQ(app->tapsOn("Home", "hidden"), 1);
    EXPECT_EQ(app->tapsOn("Home", "a2"), 1);
}

TEST_F(ExplorerTest, CaptureUnavailableFailsStart) {
    ExplorerPtr explorer = load(TreeApp);
    app->setUnavailable(true);
    EXPECT_FALSE(explorer->start("com.demo", config));
    ExplorationResult result = explorer->getResult();
    EXPECT_EQ(result.status, RunStatus::Error);
    EXPECT_EQ(result.lifecycle, LifecycleState::Completed);
    EXPECT_EQ(countIssues(result, IssueType::CaptureFailed), 1);
    EXPECT_FALSE(explorer->startAnotherPass());
}

TEST_F(ExplorerTest, BrokenLaunchHitsRelaunchLimit) {
    ExplorerPtr explorer = load(TreeApp);
    app->setLaunchBroken(true);
    ExplorationResult result = explorer->explore("com.demo", config);
    EXPECT_EQ(result.status, RunStatus::Error);
    EXPECT_EQ(countIssues(result, IssueType::RelaunchLimit), 1);
    EXPECT_EQ(app->getLaunches(), config.maxLaunchRetries);
}

TEST_F(ExplorerTest, TransientCaptureFailuresAreAbsorbed) {
    ExplorerPtr explorer = load(TreeApp);
    app->failNextCaptures(2);
    ExplorationResult result = explorer->explore("com.demo", config);
    EXPECT_EQ(result.status, RunStatus::Completed);
    EXPECT_EQ(result.screens, 5);
}

TEST_F(ExplorerTest, StopEndsRunAfterCurrentAction) {
    ExplorerPtr explorer = load(TreeApp);
    Explorer *raw = explorer.get();
    app->setTapHook([raw](const std::string & /* key */) { raw->stop(); });
    ExplorationResult result = explorer->explore("com.demo", config);
    EXPECT_EQ(result.status, RunStatus::Stopped);
    EXPECT_EQ(result.lifecycle, LifecycleState::Completed);
    EXPECT_EQ(result.actions, 1);
}

TEST_F(ExplorerTest, PauseAndResume) {
    ExplorerPtr explorer = load(TreeApp);
    ASSERT_TRUE(explorer->start("com.demo", config));
    EXPECT_FALSE(explorer->start("com.demo", config));
    EXPECT_EQ(explorer->getLifecycleState(), LifecycleState::Exploring);

    explorer->pause();
    EXPECT_TRUE(explorer->step());
    EXPECT_EQ(explorer->getLifecycleState(), LifecycleState::Paused);
    EXPECT_EQ(explorer->getResult().status, RunStatus::Paused);
    int actions = explorer->getResult().actions;
    EXPECT_TRUE(explorer->step());
    EXPECT_EQ(explorer->getResult().actions, actions);

    explorer->resume();
    EXPECT_TRUE(explorer->step());
    EXPECT_EQ(explorer->getLifecycleState(), LifecycleState::Exploring);
    ExplorationResult result = explorer->runToCompletion();
    EXPECT_EQ(result.status, RunStatus::Completed);
    EXPECT_EQ(result.screens, 5);
}

TEST_F(ExplorerTest, AnotherPassKeepsGraphAndClearsVisited) {
    ExplorerPtr explorer = load(TreeApp);
    explorer->explore("com.demo", config);
    int edges = static_cast<int>(explorer->getState()->graph().edgeCount());
    ASSERT_TRUE(explorer->startAnotherPass());
    EXPECT_EQ(explorer->getState()->getPassNumber(), 2);
    EXPECT_GE(static_cast<int>(explorer->getState()->graph().edgeCount()), edges);
    ExplorationResult result = explorer->runToCompletion();
    EXPECT_EQ(result.status, RunStatus::Completed);
    EXPECT_EQ(result.passes, 2);
    EXPECT_EQ(app->tapsOn("Editor", "apply"), 2);
}

TEST_F(ExplorerTest, TimeBudgetEndsRun) {
    ExplorerPtr explorer = load(TreeApp);
    config.maxDurationMs = 1;
    ExplorationResult result = explorer->explore("com.demo", config);
    EXPECT_EQ(result.status, RunStatus::Completed);
    EXPECT_EQ(result.actions, 0);
}

TEST_F(ExplorerTest, ScreenBudgetEndsRun) {
    ExplorerPtr explorer = load(TreeApp);
    config.maxScreens = 2;
    ExplorationResult result = explorer->explore("com.demo", config);
    EXPECT_EQ(result.status, RunStatus::Completed);
    EXPECT_EQ(result.screens, 2);
}

TEST_F(ExplorerTest, AdaptiveRunRemembersBestStrategy) {
    ExplorerPtr explorer = load(TreeApp);
    config.strategy = StrategyType::Adaptive;
    ExplorationResult result = explorer->explore("com.demo", config);
    EXPECT_EQ(result.status, RunStatus::Completed);
    std::string remembered;
    EXPECT_TRUE(store->getBestStrategy("com.demo", remembered));
    StrategyType parsed;
    EXPECT_TRUE(parseStrategy(remembered, parsed));
    EXPECT_FALSE(store->entries().empty());
}

TEST_F(ExplorerTest, PolicyCarriesOverToNextExplorer) {
    ExplorerPtr first = load(TreeApp);
    first->explore("com.demo", config);
    size_t learned = store->entries().size();
    ASSERT_GT(learned, 0u);

    auto again = SimulatedApp::fromJson(TreeApp);
    ExplorerPtr second = Explorer::create(again, again, clock, store, nullptr);
    ExplorationResult result = second->explore("com.demo", config);
    EXPECT_EQ(result.status, RunStatus::Completed);
    EXPECT_GE(result.policy.entries, learned);
}

TEST_F(ExplorerTest, NewScreenCountsAsFirstStaleStep) {
    ExplorerPtr explorer = load(R"({
        "package": "com.demo",
        "screens": [
            {"name": "Home", "elements": [{"id": "open", "text": "Open", "to": "Grove"}]},
            {"name": "Grove", "elements": [
                {"id": "oak", "text": "Oak"},
                {"id": "pine", "text": "Pine"},
                {"id": "maple", "text": "Maple"},
                {"id": "willow", "text": "Willow"},
                {"id": "poplar", "text": "Poplar"}
            ]}
        ]
    })");
    ExplorationResult result = explorer->explore("com.demo", config);
    EXPECT_EQ(result.status, RunStatus::Completed);
    ASSERT_FALSE(sink->tapsWhenStuck.empty());
    // the tap that found Grove plus four fruitless taps on it
    EXPECT_EQ(sink->tapsWhenStuck[0], 5);
    EXPECT_EQ(app->tapsOn("Grove", "oak"), 1);
}

TEST_F(ExplorerTest, SuccessfulRelaunchesDoNotAddUp) {
    ExplorerPtr explorer = load(R"({
        "package": "com.demo",
        "screens": [
            {"name": "Home", "elements": [
                {"id": "website", "text": "Website", "to": "@external:com.android.chrome"},
                {"id": "mail", "text": "Email us", "to": "@external:com.android.email"},
                {"id": "map", "text": "Map", "to": "@external:com.google.maps"},
                {"id": "forum", "text": "Forum", "to": "@external:com.android.chrome"}
            ]}
        ]
    })");
    ASSERT_EQ(config.maxLaunchRetries, 3);
    ExplorationResult result = explorer->explore("com.demo", config);
    EXPECT_EQ(result.status, RunStatus::Completed);
    EXPECT_EQ(countIssues(result, IssueType::RelaunchLimit), 0);
    EXPECT_EQ(countIssues(result, IssueType::AppLeft), 4);
    EXPECT_EQ(app->tapsOn("Home", "website"), 1);
    EXPECT_EQ(app->tapsOn("Home", "forum"), 1);
    EXPECT_EQ(app->getLaunches(), 5);
}

TEST_F(ExplorerTest, DangerousPatternsStayWithTheirPackage) {
    auto crashing = SimulatedApp::fromJson(R"({
        "package": "com.first",
        "screens": [
            {"name": "Home", "elements": [
                {"id": "boom", "text": "Boom", "to": "@crash"},
                {"id": "stay", "text": "Stay"}
            ]}
        ]
    })");
    ASSERT_TRUE(crashing != nullptr);
    ExplorerPtr first = Explorer::create(crashing, crashing, clock, store, nullptr);
    first->explore("com.first", config);
    EXPECT_EQ(store->dangerousPatterns("com.first").size(), 1u);

    ExplorerPtr second = load(R"({
        "package": "com.second",
        "screens": [
            {"name": "Home", "elements": [
                {"id": "boom", "text": "Boom"},
                {"id": "stay", "text": "Stay"}
            ]}
        ]
    })");
    ExplorationResult result = second->explore("com.second", config);
    EXPECT_EQ(result.status, RunStatus::Completed);
    EXPECT_EQ(app->tapsOn("Home", "boom"), 1);
    EXPECT_TRUE(store->dangerousPatterns("com.second").empty());
}

TEST_F(ExplorerTest, OpenEndedPassesStopWhenNothingIsLeft) {
    ExplorerPtr explorer = load(TreeApp);
    config.maxPasses = 0;
    ExplorationResult result = explorer->explore("com.demo", config);
    EXPECT_EQ(result.status, RunStatus::Completed);
    EXPECT_EQ(result.passes, 1);
}

TEST_F(ExplorerTest, OpenEndedPassesStopWithoutProgress) {
    ExplorerPtr explorer = load(TreeApp);
    config.maxPasses = 0;
    // Editor and Viewer stay out of reach, so branches remain unexplored
    config.maxDepth = 1;
    ExplorationResult result = explorer->explore("com.demo", config);
    EXPECT_EQ(result.status, RunStatus::Completed);
    EXPECT_EQ(result.passes, 1 + ExplorerConstants::MaxUnchangedPasses);
    EXPECT_EQ(app->tapsOn("Editor", "apply"), 0);
}
