/*
 * Unit tests for the scripted SimulatedApp
 */
#include <gtest/gtest.h>
#include "../project/sim/SimulatedApp.h"
#include <memory>

using namespace scoutbot;

class SimulatedAppTest : public ::testing::Test {
protected:
    void SetUp() override {
        app = SimulatedApp::fromJson(R"({
            "package": "com.demo",
            "width": 1080,
            "height": 1920,
            "screens": [
                {"name": "Home", "elements": [
                    {"id": "profile", "text": "Profile", "to": "Profile"},
                    {"id": "shuffle", "text": "Shuffle", "to": ["Alpha", "Beta"]},
                    {"id": "leave", "text": "Leave", "to": "@close"},
                    {"id": "boom", "text": "Boom", "to": "@crash"},
                    {"id": "share", "text": "Share", "to": "@external:com.other"}
                ], "scrollables": [{"id": "feed"}]},
                {"name": "Profile", "elements": [
                    {"id": "avatar", "text": "Avatar"},
                    {"id": "hidden", "text": "Hidden", "page": 1}
                ], "scrollables": [{"id": "feed"}]},
                {"name": "Alpha"},
                {"name": "Beta"}
            ]
        })");
        ASSERT_TRUE(app != nullptr);
        ASSERT_TRUE(app->launchApp("com.demo", false));
    }

    /// center of the row-th auto laid out element
    void tapRow(int row) {
        app->tap(540, 200 + row * 160 + 60);
    }

    ScreenPtr capture() {
        ScreenPtr screen;
        EXPECT_EQ(app->captureCurrentScreen(screen), CaptureStatus::Ok);
        return screen;
    }

    SimulatedAppPtr app;
};

TEST_F(SimulatedAppTest, FromJsonRejectsMissingPackage) {
    EXPECT_TRUE(SimulatedApp::fromJson(R"({"screens": []})") == nullptr);
    EXPECT_TRUE(SimulatedApp::fromJson("not json") == nullptr);
}

TEST_F(SimulatedAppTest, LaunchShowsHome) {
    EXPECT_EQ(app->currentName(), "Home");
    ScreenPtr screen = capture();
    EXPECT_EQ(screen->getActivity(), "Home");
    EXPECT_EQ(screen->getPackageName(), "com.demo");
    EXPECT_EQ(screen->getClickables().size(), 5u);
    EXPECT_EQ(screen->getScrollables().size(), 1u);
    EXPECT_FALSE(app->launchApp("com.other", false));
}

TEST_F(SimulatedAppTest, TapFollowsTransitionAndBackPops) {
    tapRow(0);
    EXPECT_EQ(app->currentName(), "Profile");
    EXPECT_EQ(app->tapsOn("Home", "profile"), 1);
    app->pressBack();
    EXPECT_EQ(app->currentName(), "Home");
    app->pressBack();
    EXPECT_EQ(app->currentName(), SimulatedTargets::LauncherPackage);
    EXPECT_EQ(app->getBackPresses(), 2);
}

TEST_F(SimulatedAppTest, ConditionalTargetsCycle) {
    tapRow(1);
    EXPECT_EQ(app->currentName(), "Alpha");
    app->pressBack();
    tapRow(1);
    EXPECT_EQ(app->currentName(), "Beta");
    app->pressBack();
    tapRow(1);
    EXPECT_EQ(app->currentName(), "Alpha");
}

TEST_F(SimulatedAppTest, SpecialTargets) {
    tapRow(2);
    ScreenPtr launcher = capture();
    EXPECT_EQ(launcher->getPackageName(), SimulatedTargets::LauncherPackage);

    app->launchApp("com.demo", false);
    tapRow(3);
    EXPECT_EQ(capture()->getActivity(), SimulatedTargets::CrashActivity);

    app->launchApp("com.demo", false);
    tapRow(4);
    EXPECT_EQ(capture()->getPackageName(), "com.other");
    app->pressBack();
    EXPECT_EQ(app->currentName(), "Home");
    EXPECT_EQ(app->getLaunches(), 3);
}

TEST_F(SimulatedAppTest, ScrollRevealsNextPage) {
    tapRow(0);
    EXPECT_EQ(capture()->getClickables().size(), 1u);
    app->scroll(540, 900, ScrollDirection::Down);
    EXPECT_EQ(capture()->getClickables().size(), 2u);
    app->launchApp("com.demo", true);
    EXPECT_EQ(app->currentName(), "Home");
}

TEST_F(SimulatedAppTest, MissTapChangesNothing) {
    app->tap(540, 1800);
    EXPECT_EQ(app->currentName(), "Home");
    EXPECT_TRUE(app->getTapCounts().empty());
}

TEST_F(SimulatedAppTest, FailureInjection) {
    ScreenPtr screen;
    app->failNextCaptures(1);
    EXPECT_EQ(app->captureCurrentScreen(screen), CaptureStatus::TransientFailure);
    EXPECT_EQ(app->captureCurrentScreen(screen), CaptureStatus::Ok);

    app->failNextTaps(1);
    EXPECT_FALSE(app->tap(540, 260));
    EXPECT_EQ(app->currentName(), "Home");

    app->setUnavailable(true);
    EXPECT_EQ(app->captureCurrentScreen(screen), CaptureStatus::Unavailable);
    app->setUnavailable(false);

    app->setLaunchBroken(true);
    app->launchApp("com.demo", true);
    EXPECT_EQ(app->currentName(), SimulatedTargets::LauncherPackage);
}

TEST_F(SimulatedAppTest, RawXmlScreensUseTransitions) {
    SimulatedScreen raw;
    raw.name = "Raw";
    SimulatedScreen source;
    source.name = "Raw";
    SimulatedElement next;
    next.resourceId = "next_button";
    next.text = "Go";
    next.bounds = Rect(40, 200, 1040, 320);
    source.elements.push_back(next);
    raw.xml = SimulatedApp::renderXml(source, "com.demo", 1080, 1920, 0);
    raw.transitions["next_button"] = {"Profile"};

    SimulatedApp rawApp("com.demo", 1080, 1920);
    rawApp.addScreen(raw);
    SimulatedScreen profile;
    profile.name = "Profile";
    rawApp.addScreen(profile);
    rawApp.setHome("Raw");
    rawApp.launchApp("com.demo", false);
    rawApp.tap(540, 260);
    EXPECT_EQ(rawApp.currentName(), "Profile");
    EXPECT_EQ(rawApp.tapsOn("Raw", "next_button"), 1);
}
