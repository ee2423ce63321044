/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef Explorer_H_
#define Explorer_H_

#include "../Base.h"
#include "../events/Preference.h"
#include "../agent/PolicyAgent.h"
#include "../agent/PriorityCalculator.h"
#include "../agent/QueueManager.h"
#include "../agent/Strategy.h"
#include "../agent/StuckRecovery.h"
#include "Clock.h"
#include "Collaborators.h"
#include "CoverageTracker.h"
#include "ExplorationState.h"
#include "LifecycleStateMachine.h"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace scoutbot {

    /**
     * @brief Constants of the main loop
     */
    namespace ExplorerConstants {
        /// capture interval while waiting for the UI to settle
        constexpr long PollIntervalMs = 250;
        /// path attempts before a screen's targets are dropped
        constexpr int MaxRouteAttempts = 3;
        /// verification rounds without discovery or new visits before the queue counts as exhausted
        constexpr int MaxVerificationRounds = 2;
        /// interval of the background policy save
        constexpr int PolicySaveIntervalMs = 5000;
        /// sleep of runToCompletion() while paused
        constexpr long PausedPollMs = 200;
        /// passes in a row with an unchanged visit count that end an open-ended run
        constexpr int MaxUnchangedPasses = 3;
    }

    /**
     * @brief Summary of a finished (or stopped) run
     */
    struct ExplorationResult {
        RunStatus status = RunStatus::NotStarted;
        std::string targetPackage;
        int screens = 0;
        int elements = 0;
        int visitedElements = 0;
        CoverageMetrics coverage;
        std::vector<ExplorationIssue> issues;
        int passes = 0;
        long durationMs = 0;
        StrategyType finalStrategy = StrategyType::Adaptive;
        int actions = 0;
        int restarts = 0;
        int backtracks = 0;
        LifecycleState lifecycle = LifecycleState::Idle;
        PolicyStatistics policy;

        std::string toJson() const;
    };

    /**
     * @brief Classification of one observation after a gesture
     */
    enum class ObservationKind {
        NewScreen,
        KnownScreen,
        SameScreen,
        LeftApp,
        ClosedApp,
        Crashed,
        Failed
    };

    /**
     * @brief The orchestrator: owns one run and executes it one iteration at a time
     *
     * Single writer of the ExplorationState. Every component gets only the
     * narrow view it needs. stop(), pause() and resume() may be called from
     * any thread; they are observed at the top of every iteration and at each
     * wait inside it.
     */
    class Explorer : public RecoveryActions {
    public:
        /**
         * @brief Factory method
         *
         * @param provider captures the device screen
         * @param actuator executes gestures
         * @param clock time source of every wait
         * @param store policy persistence, null for an in-memory table
         * @param sink status receiver, may be null
         */
        static std::shared_ptr<Explorer> create(const ScreenProviderPtr &provider, const ActuatorPtr &actuator,
                                                const ClockPtr &clock, const PolicyPersistencePtr &store,
                                                const StatusSinkPtr &sink);

        /**
         * @brief Begin a run: launch the target, capture and queue its home screen
         *
         * @return false if a run is active or the app cannot be brought up; the
         * issues of the failed start stay available through getResult()
         */
        bool start(const std::string &targetPackage, const ExplorationConfig &config);

        /**
         * @brief Execute one decide-act-observe iteration
         *
         * @return false once the run reached Completed
         */
        bool step();

        /// step until completion, continuing with further passes as maxPasses allows
        ExplorationResult runToCompletion();

        /// start() followed by runToCompletion()
        ExplorationResult explore(const std::string &targetPackage, const ExplorationConfig &config);

        void stop();

        void pause();

        void resume();

        /**
         * @brief Sweep the app again, keeping graph, policy and dangerous patterns
         *
         * @return false unless the previous pass completed
         */
        bool startAnotherPass();

        ExplorationResult getResult() const;

        LifecycleState getLifecycleState() const;

        /// null before the first start()
        const ExplorationState *getState() const;

        const LifecycleStateMachine *getLifecycle() const;

        const PolicyAgentPtr &getPolicy() const { return this->_policy; }

        /// the concrete strategy currently choosing targets
        StrategyType activeStrategy() const;

        const std::vector<DeviceOperation> &getOperationLog() const { return this->_operationLog; }

        // recovery ladder levels
        bool scrollNearestContainer() override;

        bool navigateBack() override;

        bool tapNavigationEntry() override;

        bool restartApp() override;

        bool requestHumanHelp(long waitMs) override;

        virtual ~Explorer();

    protected:
        Explorer(ScreenProviderPtr provider, ActuatorPtr actuator, ClockPtr clock, PolicyPersistencePtr store,
                 StatusSinkPtr sink);

    private:
        struct RunContext;

        /// result of observing the device after a gesture
        struct Observation {
            ObservationKind kind = ObservationKind::Failed;
            ScreenPtr screen;
            int newElements = 0;
            bool cancelled = false;
        };

        bool initializePass(bool forceRestart);

        bool handleControlRequests();

        bool checkTermination();

        bool wantsAnotherPass();

        void selectAndExecute();

        bool navigateTo(ExplorationTarget &target);

        bool followPath(const NavigationPath &path, const std::string &destination);

        bool backtrackTowards(const std::string &destination);

        bool tryBottomNavigation(const std::string &destination);

        void executeTap(const ExplorationTarget &target);

        void executeScroll(const ExplorationTarget &target);

        bool perform(const DeviceOperation &operation);

        Observation observe(const std::string &fromScreenId, const std::string &triggerId, int fromDepth);

        ScreenPtr registerScreen(const ScreenPtr &observed, int depth, bool &isNew, int &newElements);

        bool queueScreen(const ScreenPtr &screen);

        void learnFromObservation(const std::string &stateHash, const std::string &actionKey,
                                  const Observation &observation, int depth);

        void afterObservation(const Observation &observation, const ClickableElementPtr &trigger);

        bool relaunchAfterExit(const char *why);

        void escapeBlocker(const ScreenPtr &blocker);

        bool resync();

        void runRecovery();

        bool runVerificationPass();

        void trackProgress(int discoveries);

        void finish(RunStatus status, LifecycleEvent event);

        void failRun(IssueType type, const std::string &message);

        void reportIssue(IssueType type, const std::string &screenId, const std::string &elementId,
                         const std::string &message);

        void reportProgress();

        ScreenPtr currentScreen() const;

        bool isTargetScreen(const Screen &screen) const;

        ObservationKind classifyForeign(const Screen &screen) const;

        static bool isCrashScreen(const Screen &screen);

        ScreenProviderPtr _provider;
        ActuatorPtr _actuator;
        ClockPtr _clock;
        PolicyPersistencePtr _store;
        StatusSinkPtr _sink;
        PolicyAgentPtr _policy;
        bool _policyLoaded;

        std::shared_ptr<RunContext> _run;
        std::vector<DeviceOperation> _operationLog;

        std::atomic<bool> _stopRequested;
        std::atomic<bool> _pauseRequested;
        /// cancellation flag of every wait, set by stop() and pause()
        std::atomic<bool> _interrupted;
        mutable std::mutex _runLock;
    };

    typedef std::shared_ptr<Explorer> ExplorerPtr;

}

#endif //Explorer_H_
