/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef SimulatedApp_H_
#define SimulatedApp_H_

#include "../../Base.h"
#include "../../desc/Screen.h"
#include "../../model/Collaborators.h"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace scoutbot {

    /// special transition targets of a simulated element
    namespace SimulatedTargets {
        constexpr const char *Close = "@close";
        constexpr const char *Crash = "@crash";
        constexpr const char *Back = "@back";
        /// "@external:<package>" opens another app
        constexpr const char *ExternalPrefix = "@external:";
        constexpr const char *LauncherPackage = "com.android.launcher";
        constexpr const char *CrashActivity = "com.android.server.am.AppErrorDialog";
    }

    struct SimulatedElement {
        std::string resourceId;
        std::string text;
        std::string contentDescription;
        std::string className = "android.widget.Button";
        Rect bounds;
        /// visible after this many scrolls of the screen
        int page = 0;
        /// destinations in turn; more than one makes the transition conditional
        stringVec targets;
    };

    struct SimulatedScroll {
        std::string resourceId;
        std::string className = "androidx.recyclerview.widget.RecyclerView";
        Rect bounds;
    };

    struct SimulatedScreen {
        std::string name;
        /// raw uiautomator dump; used as is when set
        std::string xml;
        std::vector<SimulatedElement> elements;
        std::vector<SimulatedScroll> scrollables;
        stringVec texts;
        bool passwordField = false;
        /// resource id (or text) -> destinations, for raw dumps
        std::map<std::string, stringVec> transitions;
    };

    /**
     * @brief Scripted application driving the engine without a device
     *
     * Screens are rendered to uiautomator XML and parsed with ScreenFactory, so
     * the engine sees exactly what a device dump would give. Taps are hit
     * tested against the rendered bounds; back pops the navigation stack and
     * leaves the app from its root. Failures can be injected per call kind.
     */
    class SimulatedApp : public ScreenProvider, public Actuator {
    public:
        SimulatedApp(std::string packageName, int width, int height);

        /**
         * @brief Load a description: {"package", "width", "height", "home", "screens": [...]}
         *
         * @return nullptr when the document is not valid
         */
        static std::shared_ptr<SimulatedApp> fromJson(const std::string &jsonContent);

        static std::shared_ptr<SimulatedApp> fromFile(const std::string &path);

        void addScreen(const SimulatedScreen &screen);

        void setHome(const std::string &name) { this->_home = name; }

        const std::string &getPackageName() const { return this->_packageName; }

        CaptureStatus captureCurrentScreen(ScreenPtr &screen) override;

        bool tap(int x, int y) override;

        bool scroll(int x, int y, ScrollDirection direction) override;

        bool pressBack() override;

        bool launchApp(const std::string &packageName, bool forceRestart) override;

        /// name of the screen on top, or the foreign app state
        std::string currentName() const;

        /// taps that hit element key "screen/resourceId" (text when there is no id)
        int tapsOn(const std::string &screenName, const std::string &elementKey) const;

        const std::map<std::string, int> &getTapCounts() const { return this->_tapCounts; }

        int getLaunches() const { return this->_launches; }

        int getBackPresses() const { return this->_backPresses; }

        // failure injection
        void failNextCaptures(int count) { this->_failCaptures = count; }

        void failNextTaps(int count) { this->_failTaps = count; }

        void setUnavailable(bool unavailable) { this->_unavailable = unavailable; }

        /// relaunches always land on the launcher
        void setLaunchBroken(bool broken) { this->_launchBroken = broken; }

        /// executed when a tap hit an element, before the transition
        void setTapHook(const std::function<void(const std::string &)> &hook) { this->_tapHook = hook; }

        static std::string renderXml(const SimulatedScreen &screen, const std::string &packageName, int width,
                                     int height, int page);

    private:
        enum class Foreground {
            Target,
            Launcher,
            External,
            CrashDialog
        };

        const SimulatedScreen *topScreen() const;

        void applyTarget(const std::string &target);

        std::string _packageName;
        int _width;
        int _height;
        std::string _home;
        std::map<std::string, SimulatedScreen> _screens;
        std::vector<std::string> _stack;
        Foreground _foreground;
        std::string _externalPackage;
        /// scrolls per screen name
        std::map<std::string, int> _pages;
        /// taps per "screen/element", also the turn of conditional targets
        std::map<std::string, int> _tapCounts;
        int _launches;
        int _backPresses;
        int _failCaptures;
        int _failTaps;
        bool _unavailable;
        bool _launchBroken;
        std::function<void(const std::string &)> _tapHook;
        mutable std::mutex _deviceLock;
    };

    typedef std::shared_ptr<SimulatedApp> SimulatedAppPtr;

}

#endif //SimulatedApp_H_
