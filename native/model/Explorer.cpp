/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef Explorer_CPP_
#define Explorer_CPP_

#include "Explorer.h"
#include "../utils.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <set>

namespace scoutbot {

    namespace {
        /// logs conditional navigation as soon as the graph sees it
        class GraphLogListener : public NavigationGraphListener {
        public:
            void onAddScreen(const std::string &screenId, bool blocker) override {
                BDLOG("graph: screen %s added%s", screenId.c_str(), blocker ? " (blocker)" : "");
            }

            void onConditionalEdge(const std::string &fromScreen, const std::string &elementId) override {
                BLOG("graph: %s:%s leads to more than one screen", fromScreen.c_str(), elementId.c_str());
            }
        };
    }

    struct Explorer::RunContext {
        RunContext(const std::string &targetPackage, const ExplorationConfig &config, const Clock &clock,
                   const PolicyAdvisor *advisor)
                : preference(config), state(targetPackage), calculator(preference),
                  queueManager(preference, calculator, advisor), lifecycle(clock),
                  staleness(config.stuckThreshold, config.restartThreshold, config.plateauMs),
                  recovery(config.maxLaunchRetries, config.humanHelpWaitMs), verificationRounds(0),
                  visitedAtVerification(0), consecutiveRelaunches(0), lastPassVisited(-1), unchangedPasses(0),
                  needsResync(false),
                  runStartMs(clock.nowMs()), endMs(0) {
        }

        Preference preference;
        ExplorationState state;
        PriorityCalculator calculator;
        QueueManager queueManager;
        LifecycleStateMachine lifecycle;
        StalenessTracker staleness;
        StuckRecovery recovery;
        AdaptiveStrategy adaptive;
        int verificationRounds;
        /// visited count at the previous verification round
        size_t visitedAtVerification;
        int consecutiveRelaunches;
        /// visited elements at the end of the previous pass
        int lastPassVisited;
        int unchangedPasses;
        bool needsResync;
        long runStartMs;
        long endMs;
        std::set<std::string> reportedBlockers;
    };

    std::string ExplorationResult::toJson() const {
        nlohmann::json j;
        j["status"] = runStatusName(this->status);
        j["targetPackage"] = this->targetPackage;
        j["screens"] = this->screens;
        j["elements"] = this->elements;
        j["visitedElements"] = this->visitedElements;
        j["passes"] = this->passes;
        j["durationMs"] = this->durationMs;
        j["finalStrategy"] = strategyName(this->finalStrategy);
        j["actions"] = this->actions;
        j["restarts"] = this->restarts;
        j["backtracks"] = this->backtracks;
        j["lifecycle"] = lifecycleStateName(this->lifecycle);

        nlohmann::json coverageJson;
        coverageJson["overall"] = this->coverage.overall();
        coverageJson["elements"] = this->coverage.elementCoverage();
        coverageJson["screens"] = this->coverage.screenCoverage();
        coverageJson["scroll"] = this->coverage.scrollCoverage();
        coverageJson["fullyExploredScreens"] = this->coverage.fullyExploredScreens;
        coverageJson["unexploredBranches"] = this->coverage.unexploredBranches;
        j["coverage"] = coverageJson;

        nlohmann::json issuesJson = nlohmann::json::array();
        for (const auto &issue: this->issues) {
            nlohmann::json item;
            item["type"] = issueTypeName(issue.type);
            item["screenId"] = issue.screenId;
            item["elementId"] = issue.elementId;
            item["message"] = issue.message;
            item["timestampMs"] = issue.timestampMs;
            issuesJson.push_back(item);
        }
        j["issues"] = issuesJson;

        nlohmann::json policyJson;
        policyJson["updates"] = this->policy.totalUpdates;
        policyJson["entries"] = this->policy.entries;
        policyJson["deadEnds"] = this->policy.deadEnds;
        policyJson["dangerousPatterns"] = this->policy.dangerousPatterns;
        policyJson["epsilon"] = this->policy.epsilon;
        policyJson["restartAttempts"] = this->policy.restartAttempts;
        policyJson["restartSuccesses"] = this->policy.restartSuccesses;
        j["policy"] = policyJson;
        return j.dump();
    }

    Explorer::Explorer(ScreenProviderPtr provider, ActuatorPtr actuator, ClockPtr clock, PolicyPersistencePtr store,
                       StatusSinkPtr sink)
            : _provider(std::move(provider)), _actuator(std::move(actuator)), _clock(std::move(clock)),
              _store(std::move(store)), _sink(std::move(sink)), _policyLoaded(false),
              _stopRequested(false), _pauseRequested(false), _interrupted(false) {
        if (!this->_store)
            this->_store = std::make_shared<MemoryPolicyStore>();
        this->_policy = std::make_shared<PolicyAgent>(this->_store);
    }

    std::shared_ptr<Explorer> Explorer::create(const ScreenProviderPtr &provider, const ActuatorPtr &actuator,
                                               const ClockPtr &clock, const PolicyPersistencePtr &store,
                                               const StatusSinkPtr &sink) {
        if (!provider || !actuator || !clock) {
            BLOGE("explorer needs a screen provider, an actuator and a clock");
            return nullptr;
        }
        // constructor is protected, make_shared cannot reach it
        return std::shared_ptr<Explorer>(new Explorer(provider, actuator, clock, store, sink));
    }

    Explorer::~Explorer() {
        if (this->_policy)
            this->_policy->flush();
    }

    // ==================== run control ====================

    bool Explorer::start(const std::string &targetPackage, const ExplorationConfig &config) {
        std::lock_guard<std::mutex> guard(this->_runLock);
        if (this->_run && !this->_run->lifecycle.canStart()) {
            BLOGE("start %s rejected, a run is %s", targetPackage.c_str(),
                  lifecycleStateName(this->_run->lifecycle.getState()));
            return false;
        }
        this->_stopRequested = false;
        this->_pauseRequested = false;
        this->_interrupted = false;
        this->_operationLog.clear();
        this->_run = std::make_shared<RunContext>(targetPackage, config, *this->_clock, this->_policy.get());

        this->_run->state.graph().addListener(std::make_shared<GraphLogListener>());
        StatusSinkPtr sink = this->_sink;
        this->_run->lifecycle.setTransitionCallback(
                [sink](LifecycleState from, LifecycleState to, LifecycleEvent event) {
                    if (sink)
                        sink->onTransition(from, to, event);
                });

        if (!this->_policyLoaded) {
            this->_policy->loadFromStore();
            this->_policyLoaded = true;
        }
        this->_policy->setTarget(targetPackage);
        if (config.strategy == StrategyType::Adaptive) {
            StrategyType initial = StrategyType::ScreenFirst;
            std::string remembered;
            if (this->_store->getBestStrategy(targetPackage, remembered) && parseStrategy(remembered, initial)) {
                BLOG("best strategy of earlier runs on %s: %s", targetPackage.c_str(), remembered.c_str());
            }
            this->_run->adaptive.begin(initial);
        }

        logLongStringInfo("run config: " + this->_run->preference.toJson());
        long now = this->_clock->nowMs();
        ExplorationState &state = this->_run->state;
        state.setStartMs(now);
        state.setLastDiscoveryMs(now);
        state.setStatus(RunStatus::Running);
        this->_run->staleness.reset(now);
        this->_run->lifecycle.handle(LifecycleEvent::StartRequested);
        return this->initializePass(false);
    }

    bool Explorer::initializePass(bool forceRestart) {
        const ExplorationConfig &config = this->_run->preference.getConfig();
        ExplorationState &state = this->_run->state;
        state.setCurrentScreenId("");
        int attempts = std::max(1, config.maxLaunchRetries);
        for (int attempt = 0; attempt < attempts; attempt++) {
            if (this->_stopRequested) {
                this->finish(RunStatus::Stopped, LifecycleEvent::StopRequested);
                return false;
            }
            if (attempt > 0)
                this->_clock->sleepMs(config.actionDelayMs);
            if (!this->perform(DeviceOperation::launch(state.getTargetPackage(), forceRestart))) {
                this->reportIssue(IssueType::AppLeft, "", "", "launch request was not delivered");
                continue;
            }
            PollResult poll = pollUntilStable(*this->_provider, *this->_clock, config.stabilizationWaitMs,
                                              ExplorerConstants::PollIntervalMs, this->_interrupted);
            if (poll.status == CaptureStatus::Unavailable) {
                this->failRun(IssueType::CaptureFailed, "screen provider unavailable at launch");
                return false;
            }
            if (poll.status == CaptureStatus::Cancelled) {
                this->finish(RunStatus::Stopped, LifecycleEvent::StopRequested);
                return false;
            }
            if (!poll.screen) {
                this->reportIssue(IssueType::CaptureFailed, "", "", "no screen captured after launch");
                continue;
            }
            if (!this->isTargetScreen(*poll.screen)) {
                this->reportIssue(IssueType::AppLeft, poll.screen->getId(), "",
                                  "launch showed " + poll.screen->getPackageName());
                continue;
            }
            bool isNew = false;
            int newElements = 0;
            ScreenPtr home = this->registerScreen(poll.screen, 0, isNew, newElements);
            state.setHomeScreenId(home->getId());
            this->queueScreen(home);
            this->_run->lifecycle.handle(LifecycleEvent::InitializationComplete);
            BLOG("pass %d of %s starts on %s, %zu targets queued", state.getPassNumber(),
                 state.getTargetPackage().c_str(), home->getActivity().c_str(), state.queue().size());
            this->reportProgress();
            return true;
        }
        this->failRun(IssueType::RelaunchLimit, "target could not be brought up");
        return false;
    }

    void Explorer::stop() {
        this->_stopRequested = true;
        this->_interrupted = true;
    }

    void Explorer::pause() {
        this->_pauseRequested = true;
        this->_interrupted = true;
    }

    void Explorer::resume() {
        this->_pauseRequested = false;
        if (!this->_stopRequested)
            this->_interrupted = false;
    }

    bool Explorer::startAnotherPass() {
        std::lock_guard<std::mutex> guard(this->_runLock);
        if (!this->_run || !this->_run->lifecycle.isTerminal()) {
            BLOGE("another pass needs a completed run");
            return false;
        }
        ExplorationState &state = this->_run->state;
        if (state.getStatus() == RunStatus::Error) {
            BLOGE("previous pass ended with an error, no further pass");
            return false;
        }
        this->_stopRequested = false;
        this->_pauseRequested = false;
        this->_interrupted = false;
        state.beginNextPass();
        long now = this->_clock->nowMs();
        state.setStartMs(now);
        state.setLastDiscoveryMs(now);
        state.setStatus(RunStatus::Running);
        this->_run->staleness.reset(now);
        this->_run->verificationRounds = 0;
        this->_run->visitedAtVerification = 0;
        this->_run->consecutiveRelaunches = 0;
        this->_run->needsResync = false;
        this->_run->lifecycle.handle(LifecycleEvent::StartRequested);
        return this->initializePass(true);
    }

    ExplorationResult Explorer::explore(const std::string &targetPackage, const ExplorationConfig &config) {
        if (!this->start(targetPackage, config))
            return this->getResult();
        return this->runToCompletion();
    }

    /**
     * @brief Decide whether a finished pass is followed by another one
     *
     * A positive maxPasses is a fixed limit. With maxPasses 0 passes go on
     * until the coverage target is met, no unexplored branch is left, or the
     * visit count stayed the same for MaxUnchangedPasses passes in a row.
     */
    bool Explorer::wantsAnotherPass() {
        const ExplorationState &state = this->_run->state;
        const ExplorationConfig &config = this->_run->preference.getConfig();
        if (this->_stopRequested || state.getStatus() != RunStatus::Completed)
            return false;
        if (config.maxPasses > 0)
            return state.getPassNumber() < config.maxPasses;

        CoverageMetrics metrics = CoverageTracker::compute(state);
        if (metrics.overall() * 100.0 >= config.targetCoveragePct) {
            BLOG("pass %d reached the coverage target: %s", state.getPassNumber(), metrics.toString().c_str());
            return false;
        }
        if (metrics.unexploredBranches == 0) {
            BLOG("pass %d left no unexplored branch", state.getPassNumber());
            return false;
        }
        if (metrics.visitedElements == this->_run->lastPassVisited) {
            if (++this->_run->unchangedPasses >= ExplorerConstants::MaxUnchangedPasses) {
                BLOG("no progress for %d passes, stop", this->_run->unchangedPasses);
                return false;
            }
        } else {
            this->_run->lastPassVisited = metrics.visitedElements;
            this->_run->unchangedPasses = 0;
        }
        return true;
    }

    ExplorationResult Explorer::runToCompletion() {
        while (true) {
            if (this->step()) {
                if (this->getLifecycleState() == LifecycleState::Paused)
                    this->_clock->sleepMs(ExplorerConstants::PausedPollMs);
                continue;
            }
            bool anotherPass = false;
            {
                std::lock_guard<std::mutex> guard(this->_runLock);
                if (!this->_run)
                    break;
                anotherPass = this->wantsAnotherPass();
            }
            if (!anotherPass || !this->startAnotherPass())
                break;
        }
        return this->getResult();
    }

    ExplorationResult Explorer::getResult() const {
        std::lock_guard<std::mutex> guard(this->_runLock);
        ExplorationResult result;
        if (!this->_run)
            return result;
        const ExplorationState &state = this->_run->state;
        result.status = state.getStatus();
        result.targetPackage = state.getTargetPackage();
        result.screens = static_cast<int>(state.screens().size());
        result.elements = static_cast<int>(state.elementCount());
        result.visitedElements = static_cast<int>(state.visitedCount());
        result.coverage = CoverageTracker::compute(state);
        result.issues = state.issues();
        result.passes = state.getPassNumber();
        long end = this->_run->lifecycle.isTerminal() ? this->_run->endMs : this->_clock->nowMs();
        result.durationMs = std::max(0L, end - this->_run->runStartMs);
        result.finalStrategy = this->activeStrategy();
        result.actions = state.getActionsTaken();
        result.restarts = state.getRestarts();
        result.backtracks = state.getBacktracks();
        result.lifecycle = this->_run->lifecycle.getState();
        result.policy = this->_policy->getStatistics();
        return result;
    }

    LifecycleState Explorer::getLifecycleState() const {
        std::lock_guard<std::mutex> guard(this->_runLock);
        return this->_run ? this->_run->lifecycle.getState() : LifecycleState::Idle;
    }

    const ExplorationState *Explorer::getState() const {
        return this->_run ? &this->_run->state : nullptr;
    }

    const LifecycleStateMachine *Explorer::getLifecycle() const {
        return this->_run ? &this->_run->lifecycle : nullptr;
    }

    StrategyType Explorer::activeStrategy() const {
        if (!this->_run)
            return StrategyType::Adaptive;
        StrategyType configured = this->_run->preference.getConfig().strategy;
        return configured == StrategyType::Adaptive ? this->_run->adaptive.current() : configured;
    }

    // ==================== main loop ====================

    bool Explorer::step() {
        std::lock_guard<std::mutex> guard(this->_runLock);
        if (!this->_run)
            return false;
        LifecycleStateMachine &lifecycle = this->_run->lifecycle;
        if (lifecycle.isTerminal())
            return false;
        if (!this->handleControlRequests())
            return !lifecycle.isTerminal();
        if (!lifecycle.isActive()) {
            BLOGE("step in state %s", lifecycleStateName(lifecycle.getState()));
            return !lifecycle.isTerminal();
        }
        if (this->checkTermination())
            return false;

        if (lifecycle.getState() == LifecycleState::Stuck) {
            this->runRecovery();
        } else {
            this->selectAndExecute();
        }
        if (lifecycle.isTerminal())
            return false;
        this->reportProgress();
        this->_clock->sleepMs(this->_run->preference.getConfig().actionDelayMs);
        return true;
    }

    bool Explorer::handleControlRequests() {
        LifecycleStateMachine &lifecycle = this->_run->lifecycle;
        ExplorationState &state = this->_run->state;
        if (this->_stopRequested) {
            this->finish(RunStatus::Stopped, LifecycleEvent::StopRequested);
            return false;
        }
        if (this->_pauseRequested) {
            if (lifecycle.getState() != LifecycleState::Paused && lifecycle.handle(LifecycleEvent::PauseRequested)) {
                state.setStatus(RunStatus::Paused);
                this->reportProgress();
            }
            return false;
        }
        if (lifecycle.getState() == LifecycleState::Paused) {
            lifecycle.handle(LifecycleEvent::ResumeRequested);
            state.setStatus(RunStatus::Running);
        }
        if (this->_run->needsResync && !this->resync())
            return false;
        return !lifecycle.isTerminal();
    }

    bool Explorer::checkTermination() {
        const ExplorationConfig &config = this->_run->preference.getConfig();
        const ExplorationState &state = this->_run->state;
        long elapsed = this->_clock->nowMs() - state.getStartMs();
        if (elapsed >= config.effectiveDurationMs()) {
            BLOG("time budget of %ld ms used up", config.effectiveDurationMs());
            this->finish(RunStatus::Completed, LifecycleEvent::MaxIterationsReached);
            return true;
        }
        if (static_cast<int>(state.screens().size()) >= config.maxScreens) {
            BLOG("screen budget of %d reached", config.maxScreens);
            this->finish(RunStatus::Completed, LifecycleEvent::MaxIterationsReached);
            return true;
        }
        if (static_cast<int>(state.visitedCount()) >= config.maxElements) {
            BLOG("element budget of %d reached", config.maxElements);
            this->finish(RunStatus::Completed, LifecycleEvent::MaxIterationsReached);
            return true;
        }
        if (config.goal == ExplorationGoal::CoverageTarget && config.stopAtTargetCoverage) {
            CoverageMetrics metrics = CoverageTracker::compute(state);
            if (CoverageTracker::hasReachedTarget(metrics, config)) {
                BLOG("coverage target %.1f%% reached: %s", config.targetCoveragePct, metrics.toString().c_str());
                this->finish(RunStatus::Completed, LifecycleEvent::CoverageReached);
                return true;
            }
        }
        return false;
    }

    void Explorer::selectAndExecute() {
        ExplorationState &state = this->_run->state;
        FrontierQueue &queue = state.queue();
        if (queue.empty()) {
            if (!this->runVerificationPass() && !this->_run->lifecycle.isTerminal())
                this->finish(RunStatus::Completed, LifecycleEvent::QueueExhausted);
            return;
        }

        StrategyType strategy = this->activeStrategy();
        SelectionContext context{queue, state.screens(), state.getCurrentScreenId()};
        int index = selectTarget(strategy, context);
        ExplorationTarget target;
        if (index < 0 || !queue.take(static_cast<size_t>(index), target)) {
            this->finish(RunStatus::Completed, LifecycleEvent::QueueExhausted);
            return;
        }
        BDLOG("%s selected %s, %zu left", strategyName(strategy), target.toString().c_str(), queue.size());

        if (state.isUnreachable(target.screenId) || state.graph().isBlocker(target.screenId))
            return;
        if (target.screenId != state.getCurrentScreenId() && !this->navigateTo(target))
            return;
        if (this->_run->lifecycle.isTerminal() || this->_run->needsResync)
            return;
        if (target.type == TargetType::ScrollContainer) {
            this->executeScroll(target);
        } else {
            this->executeTap(target);
        }
    }

    // ==================== routing ====================

    bool Explorer::navigateTo(ExplorationTarget &target) {
        ExplorationState &state = this->_run->state;
        const std::string from = state.getCurrentScreenId();
        const std::string &destination = target.screenId;
        NavigationPath path;
        bool found = state.graph().findOptimalPath(from, destination, path)
                     || state.graph().findPath(from, destination, path);
        if (found && this->followPath(path, destination))
            return true;
        if (this->_run->lifecycle.isTerminal() || this->_interrupted)
            return false;
        if (state.getCurrentScreenId() != destination && this->backtrackTowards(destination))
            return true;
        if (this->_run->lifecycle.isTerminal() || this->_interrupted)
            return false;
        if (state.getCurrentScreenId() != destination && this->tryBottomNavigation(destination))
            return true;
        if (state.getCurrentScreenId() == destination)
            return true;

        target.routeAttempts++;
        if (target.routeAttempts >= ExplorerConstants::MaxRouteAttempts) {
            size_t dropped = state.queue().removeScreen(destination);
            state.markUnreachable(destination);
            this->reportIssue(IssueType::BranchUnreachable, destination, target.elementId,
                              "screen unreachable after " + std::to_string(target.routeAttempts)
                              + " path attempts, dropped " + std::to_string(dropped + 1) + " targets");
        } else {
            BLOG("no route to %s (attempt %d), continue on the current screen", destination.c_str(),
                 target.routeAttempts);
            target.priority = FrontierQueue::decayedPriority(target.priority);
            state.queue().append(target);
        }
        return false;
    }

    bool Explorer::followPath(const NavigationPath &path, const std::string &destination) {
        ExplorationState &state = this->_run->state;
        for (const auto &hop: path) {
            if (this->_interrupted || this->_run->lifecycle.isTerminal())
                return false;
            if (state.getCurrentScreenId() != hop.screenId) {
                BLOG("route left its path: on %s, expected %s", state.getCurrentScreenId().c_str(),
                     hop.screenId.c_str());
                return false;
            }
            ScreenPtr screen = state.getScreen(hop.screenId);
            ClickableElementPtr element = screen ? screen->findClickable(hop.elementId) : nullptr;
            if (!element)
                return false;
            if (!this->perform(DeviceOperation::tap(screen->getId(), element->getId(), element->getBounds())))
                return false;
            Observation observation = this->observe(screen->getId(), element->getId(), screen->getDepth());
            if (observation.cancelled || this->_run->lifecycle.isTerminal())
                return false;
            switch (observation.kind) {
                case ObservationKind::NewScreen:
                    this->queueScreen(observation.screen);
                    break;
                case ObservationKind::KnownScreen:
                case ObservationKind::SameScreen:
                    if (observation.newElements > 0)
                        this->queueScreen(observation.screen);
                    break;
                case ObservationKind::LeftApp:
                case ObservationKind::ClosedApp:
                case ObservationKind::Crashed:
                    this->relaunchAfterExit("app left while routing");
                    return false;
                case ObservationKind::Failed:
                    return false;
            }
        }
        return state.getCurrentScreenId() == destination;
    }

    /**
     * @brief Press back towards the home screen
     *
     * At most one press per level of depth of the current screen; after every
     * press a graph route from the new screen is tried.
     */
    bool Explorer::backtrackTowards(const std::string &destination) {
        ExplorationState &state = this->_run->state;
        ScreenPtr current = this->currentScreen();
        if (!state.getScreen(destination) || !current)
            return false;
        for (int presses = current->getDepth(); presses > 0; presses--) {
            if (this->_interrupted || this->_run->lifecycle.isTerminal())
                return false;
            if (!this->navigateBack())
                return false;
            state.increaseBacktracks();
            if (state.getCurrentScreenId() == destination)
                return true;
            NavigationPath path;
            if (state.graph().findPath(state.getCurrentScreenId(), destination, path))
                return this->followPath(path, destination);
        }
        return state.getCurrentScreenId() == destination;
    }

    bool Explorer::tryBottomNavigation(const std::string &destination) {
        ExplorationState &state = this->_run->state;
        ScreenPtr screen = this->currentScreen();
        if (!screen)
            return false;
        for (const auto &element: screen->getClickables()) {
            if (!PriorityCalculator::isBottomNavigation(*element, *screen))
                continue;
            const ElementNavigation *navigation = state.graph().getNavigation(screen->getId(), element->getId());
            if (!navigation)
                continue;
            std::string via = navigation->mostFrequentDestination();
            NavigationPath rest;
            if (via != destination && !state.graph().findPath(via, destination, rest))
                continue;
            NavigationPath path;
            path.push_back(PathStep{screen->getId(), element->getId()});
            path.insert(path.end(), rest.begin(), rest.end());
            BLOG("try bottom navigation %s towards %s", element->label().c_str(), destination.c_str());
            return this->followPath(path, destination);
        }
        return false;
    }

    // ==================== actions ====================

    bool Explorer::perform(const DeviceOperation &operation) {
        this->_operationLog.push_back(operation);
        BDLOG("perform %s", operation.toString().c_str());
        bool delivered = performOperation(*this->_actuator, operation);
        if (!delivered) {
            BLOG("gesture %s was not delivered", actionTypeName(operation.act));
            return false;
        }
        if (operation.act == ActionType::TAP || operation.act == ActionType::SCROLL
            || operation.act == ActionType::BACK)
            this->_run->state.increaseActionsTaken();
        return true;
    }

    void Explorer::executeTap(const ExplorationTarget &target) {
        ExplorationState &state = this->_run->state;
        const ExplorationConfig &config = this->_run->preference.getConfig();
        ScreenPtr screen = state.getScreen(target.screenId);
        ClickableElementPtr element = screen ? screen->findClickable(target.elementId) : nullptr;
        if (!element) {
            BDLOG("stale target %s discarded", target.toString().c_str());
            return;
        }
        std::string key = compositeKey(screen->getId(), element->getId());
        if (state.isVisited(key)) {
            BDLOG("target %s already visited", key.c_str());
            return;
        }
        std::string stateHash = PolicyAgent::computeScreenHash(*screen);
        std::string actionKey = PolicyAgent::computeActionKey(*element, screen->getHeight());
        if (this->_policy->isDangerous(actionKey) || this->_policy->shouldSkip(stateHash, actionKey)) {
            BLOG("skip %s, learned to avoid %s", element->label().c_str(), actionKey.c_str());
            element->setExcluded(true);
            return;
        }

        DeviceOperation operation = DeviceOperation::tap(screen->getId(), element->getId(), element->getBounds());
        operation.waitTime = config.transitionWaitMs;
        if (!this->perform(operation)) {
            if (!state.queue().requeue(target, config.maxActionRetries)) {
                this->reportIssue(IssueType::ElementStuck, screen->getId(), element->getId(),
                                  "tap of " + element->label() + " failed past its retry cap");
                element->setExcluded(true);
            }
            return;
        }
        state.markVisited(key);
        element->setExplored(true);
        element->increaseTapCount();
        this->_policy->onActionTaken();
        this->_run->lifecycle.handle(LifecycleEvent::ElementTapped);

        Observation observation = this->observe(screen->getId(), element->getId(), screen->getDepth());
        if (observation.cancelled || this->_run->lifecycle.isTerminal())
            return;
        this->learnFromObservation(stateHash, actionKey, observation,
                                   observation.screen ? observation.screen->getDepth() : 0);
        this->afterObservation(observation, element);
    }

    void Explorer::executeScroll(const ExplorationTarget &target) {
        ExplorationState &state = this->_run->state;
        const ExplorationConfig &config = this->_run->preference.getConfig();
        ScreenPtr screen = state.getScreen(target.screenId);
        ScrollableContainerPtr container = screen ? screen->findScrollable(target.elementId) : nullptr;
        if (!container || container->reachedEnd() || container->getScrollCount() >= config.maxScrollsPerContainer)
            return;

        ClickableElement proxy(container->getResourceId(), "", "", container->getClassName(),
                               container->getBounds());
        std::string stateHash = PolicyAgent::computeScreenHash(*screen);
        std::string actionKey = PolicyAgent::computeActionKey(proxy, screen->getHeight());
        ScrollDirection direction = container->isHorizontal() ? ScrollDirection::Right : ScrollDirection::Down;
        DeviceOperation operation = DeviceOperation::scroll(screen->getId(), container->getId(),
                                                            container->getBounds(), direction);
        operation.waitTime = config.scrollDelayMs;
        if (!this->perform(operation)) {
            if (!state.queue().requeue(target, config.maxActionRetries))
                this->reportIssue(IssueType::ScrollFailed, screen->getId(), container->getId(),
                                  "scroll failed past its retry cap");
            return;
        }
        container->increaseScrollCount();
        this->_policy->onActionTaken();

        Observation observation = this->observe(screen->getId(), "", screen->getDepth());
        if (observation.cancelled || this->_run->lifecycle.isTerminal())
            return;
        if (observation.kind == ObservationKind::SameScreen) {
            if (observation.newElements == 0) {
                container->setReachedEnd(true);
            } else if (container->getScrollCount() < config.maxScrollsPerContainer) {
                state.queue().append(target);
            }
        }
        this->learnFromObservation(stateHash, actionKey, observation,
                                   observation.screen ? observation.screen->getDepth() : 0);
        this->afterObservation(observation, nullptr);
    }

    // ==================== observation ====================

    bool Explorer::isTargetScreen(const Screen &screen) const {
        return screen.getPackageName() == this->_run->state.getTargetPackage();
    }

    bool Explorer::isCrashScreen(const Screen &screen) {
        std::string activity = toLowerCase(screen.getActivity());
        return activity.find("apperrordialog") != std::string::npos || activity.find("crash") != std::string::npos
               || activity.find("notresponding") != std::string::npos;
    }

    ObservationKind Explorer::classifyForeign(const Screen &screen) const {
        if (isCrashScreen(screen))
            return ObservationKind::Crashed;
        const std::string &packageName = screen.getPackageName();
        if (packageName.empty())
            return ObservationKind::ClosedApp;
        for (const auto &systemPackage: this->_run->preference.systemPackages()) {
            if (packageName == systemPackage)
                return ObservationKind::ClosedApp;
        }
        return ObservationKind::LeftApp;
    }

    ScreenPtr Explorer::currentScreen() const {
        return this->_run->state.getScreen(this->_run->state.getCurrentScreenId());
    }

    ScreenPtr Explorer::registerScreen(const ScreenPtr &observed, int depth, bool &isNew, int &newElements) {
        ExplorationState &state = this->_run->state;
        ScreenPtr stored = state.getScreen(observed->getId());
        isNew = stored == nullptr;
        newElements = 0;
        if (isNew) {
            observed->setDepth(std::max(0, depth));
            state.screens()[observed->getId()] = observed;
            state.graph().addScreen(observed, this->_run->preference.blockerPatterns());
            stored = observed;
            if (state.getHomeScreenId().empty())
                state.setHomeScreenId(stored->getId());
            BLOG("new screen %s (%s) at depth %d with %zu elements", stored->getId().c_str(),
                 stored->getActivity().c_str(), stored->getDepth(), stored->getClickables().size());
        } else {
            newElements = stored->mergeObservation(*observed);
            if (depth >= 0 && depth < stored->getDepth())
                stored->setDepth(depth);
        }
        if (isNew || stored->getId() != state.getCurrentScreenId()) {
            stored->increaseVisitCount();
            this->_policy->recordScreenVisit(PolicyAgent::computeScreenHash(*stored));
        }
        state.setCurrentScreenId(stored->getId());
        return stored;
    }

    Explorer::Observation Explorer::observe(const std::string &fromScreenId, const std::string &triggerId,
                                            int fromDepth) {
        Observation observation;
        const ExplorationConfig &config = this->_run->preference.getConfig();
        PollResult poll = pollUntilStable(*this->_provider, *this->_clock, config.transitionWaitMs,
                                          ExplorerConstants::PollIntervalMs, this->_interrupted);
        if (poll.status == CaptureStatus::Cancelled) {
            observation.cancelled = true;
            this->_run->needsResync = true;
            return observation;
        }
        if (poll.status == CaptureStatus::Unavailable) {
            this->failRun(IssueType::CaptureFailed, "screen provider unavailable");
            return observation;
        }
        if (!poll.screen) {
            this->reportIssue(IssueType::Timeout, fromScreenId, triggerId, "no screen captured after the action");
            return observation;
        }
        if (!this->isTargetScreen(*poll.screen)) {
            observation.kind = this->classifyForeign(*poll.screen);
            observation.screen = poll.screen;
            return observation;
        }

        bool isNew = false;
        int newElements = 0;
        ScreenPtr stored = this->registerScreen(poll.screen, fromDepth + 1, isNew, newElements);
        observation.screen = stored;
        observation.newElements = newElements;
        if (isNew) {
            observation.kind = ObservationKind::NewScreen;
        } else if (stored->getId() == fromScreenId) {
            observation.kind = ObservationKind::SameScreen;
        } else {
            observation.kind = ObservationKind::KnownScreen;
        }
        if (!fromScreenId.empty() && !triggerId.empty() && stored->getId() != fromScreenId)
            this->_run->state.graph().recordTransition(fromScreenId, triggerId, stored->getId());
        return observation;
    }

    bool Explorer::queueScreen(const ScreenPtr &screen) {
        if (!screen)
            return false;
        ExplorationState &state = this->_run->state;
        const ExplorationConfig &config = this->_run->preference.getConfig();
        if (screen->isBlocker()) {
            if (this->_run->reportedBlockers.insert(screen->getId()).second)
                this->reportIssue(IssueType::BlockerScreen, screen->getId(), "",
                                  screen->getActivity() + " needs credentials, not explored");
            return false;
        }
        if (state.isUnreachable(screen->getId()))
            return false;
        if (screen->getDepth() > config.maxDepth) {
            BDLOG("screen %s beyond max depth %d", screen->getActivity().c_str(), config.maxDepth);
            return false;
        }
        QueueResult result = this->_run->queueManager.queueScreen(*screen, state, state.queue(), config.strategy);
        return result.queued + result.scrollTargets > 0;
    }

    void Explorer::learnFromObservation(const std::string &stateHash, const std::string &actionKey,
                                        const Observation &observation, int depth) {
        TapOutcome outcome;
        outcome.depth = depth;
        std::string nextHash;
        if (observation.screen && this->isTargetScreen(*observation.screen))
            nextHash = PolicyAgent::computeScreenHash(*observation.screen);
        switch (observation.kind) {
            case ObservationKind::NewScreen:
                outcome.result = TapResult::NewScreen;
                outcome.priorScreenVisits = std::max(0, this->_policy->getScreenVisits(nextHash) - 1);
                break;
            case ObservationKind::KnownScreen:
                outcome.result = observation.newElements > 0 ? TapResult::NewElements : TapResult::BackNavigation;
                break;
            case ObservationKind::SameScreen:
                outcome.result = observation.newElements > 0 ? TapResult::NewElements : TapResult::NoChange;
                break;
            case ObservationKind::LeftApp:
            case ObservationKind::ClosedApp:
                outcome.result = TapResult::ClosedApp;
                break;
            case ObservationKind::Crashed:
                outcome.result = TapResult::Crashed;
                break;
            case ObservationKind::Failed:
                return;
        }
        this->_policy->learn(stateHash, actionKey, outcome, nextHash);
        if (outcome.result == TapResult::ClosedApp || outcome.result == TapResult::Crashed)
            this->_run->state.dangerousPatterns().insert(actionKey);
    }

    void Explorer::afterObservation(const Observation &observation, const ClickableElementPtr &trigger) {
        ExplorationState &state = this->_run->state;
        LifecycleStateMachine &lifecycle = this->_run->lifecycle;
        const ExplorationConfig &config = this->_run->preference.getConfig();
        switch (observation.kind) {
            case ObservationKind::NewScreen: {
                if (trigger) {
                    trigger->setOutcome(ElementOutcome::Navigation);
                    trigger->setLeadsTo(observation.screen->getId());
                }
                lifecycle.handle(LifecycleEvent::NewScreenDiscovered);
                bool queued = this->queueScreen(observation.screen);
                this->trackProgress(1);
                if (observation.screen->isBlocker()) {
                    this->escapeBlocker(observation.screen);
                } else if (config.backtrackAfterNewScreen && !queued) {
                    if (this->navigateBack())
                        state.increaseBacktracks();
                }
                break;
            }
            case ObservationKind::KnownScreen:
                if (trigger) {
                    trigger->setOutcome(ElementOutcome::Navigation);
                    trigger->setLeadsTo(observation.screen->getId());
                }
                if (observation.newElements > 0) {
                    lifecycle.handle(LifecycleEvent::NewElementsFound);
                    this->queueScreen(observation.screen);
                } else {
                    lifecycle.handle(LifecycleEvent::NoProgressDetected);
                }
                this->trackProgress(observation.newElements);
                if (observation.screen->isBlocker())
                    this->escapeBlocker(observation.screen);
                break;
            case ObservationKind::SameScreen:
                if (observation.newElements > 0) {
                    lifecycle.handle(LifecycleEvent::NewElementsFound);
                    this->queueScreen(observation.screen);
                } else {
                    if (trigger)
                        trigger->setOutcome(ElementOutcome::NoEffect);
                    lifecycle.handle(LifecycleEvent::NoProgressDetected);
                }
                this->trackProgress(observation.newElements);
                break;
            case ObservationKind::LeftApp:
            case ObservationKind::ClosedApp:
            case ObservationKind::Crashed: {
                std::string screenId = trigger ? state.getCurrentScreenId() : "";
                std::string elementId = trigger ? trigger->getId() : "";
                if (trigger)
                    trigger->setOutcome(observation.kind == ObservationKind::LeftApp ? ElementOutcome::External
                                                                                     : ElementOutcome::ClosesApp);
                if (observation.kind == ObservationKind::Crashed) {
                    this->reportIssue(IssueType::DangerousElement, screenId, elementId, "action crashed the app");
                } else if (observation.kind == ObservationKind::ClosedApp) {
                    this->reportIssue(IssueType::AppMinimized, screenId, elementId,
                                      "action closed or minimized the app");
                } else {
                    this->reportIssue(IssueType::AppLeft, screenId, elementId,
                                      "action opened " + observation.screen->getPackageName());
                }
                if (!this->relaunchAfterExit("target app left"))
                    return;
                this->trackProgress(0);
                break;
            }
            case ObservationKind::Failed:
                this->trackProgress(0);
                break;
        }
    }

    void Explorer::trackProgress(int discoveries) {
        if (this->_run->lifecycle.isTerminal())
            return;
        long now = this->_clock->nowMs();
        StalenessTracker &staleness = this->_run->staleness;
        if (discoveries > 0) {
            staleness.recordDiscovery(this->_run->state.getCurrentScreenId(), now);
            this->_run->state.setLastDiscoveryMs(now);
            this->_run->verificationRounds = 0;
            this->_run->consecutiveRelaunches = 0;
        } else {
            staleness.recordNoProgress(this->_run->state.getCurrentScreenId());
        }
        if (this->_run->preference.getConfig().strategy == StrategyType::Adaptive)
            this->_run->adaptive.recordOutcome(discoveries);

        if (this->_run->lifecycle.getState() == LifecycleState::Exploring && staleness.isStuck(now)) {
            BLOG("stuck on %s after %d actions without progress (%d since last discovery)",
                 staleness.getScreenId().c_str(), staleness.getCount(), staleness.getSinceDiscovery());
            this->_run->lifecycle.handle(LifecycleEvent::StuckThresholdReached);
            this->_run->recovery.beginEpisode(staleness.needsRestart());
        }
    }

    bool Explorer::relaunchAfterExit(const char *why) {
        ExplorationState &state = this->_run->state;
        const ExplorationConfig &config = this->_run->preference.getConfig();
        while (!this->_run->lifecycle.isTerminal()) {
            this->_run->consecutiveRelaunches++;
            if (this->_run->consecutiveRelaunches > config.maxLaunchRetries) {
                this->failRun(IssueType::RelaunchLimit,
                              std::string(why) + ": relaunch limit of " + std::to_string(config.maxLaunchRetries)
                              + " exceeded");
                return false;
            }
            BLOG("%s, relaunch %d", why, this->_run->consecutiveRelaunches);
            state.increaseRestarts();
            if (!this->perform(DeviceOperation::launch(state.getTargetPackage(), false)))
                continue;
            state.setCurrentScreenId("");
            Observation observation = this->observe("", "", -1);
            if (observation.cancelled || this->_run->lifecycle.isTerminal())
                return false;
            switch (observation.kind) {
                case ObservationKind::NewScreen:
                case ObservationKind::KnownScreen:
                case ObservationKind::SameScreen:
                    this->_run->consecutiveRelaunches = 0;
                    this->queueScreen(observation.screen);
                    return true;
                default:
                    break;
            }
        }
        return false;
    }

    void Explorer::escapeBlocker(const ScreenPtr &blocker) {
        BLOG("leave blocker screen %s", blocker->getActivity().c_str());
        if (this->navigateBack() && this->_run->state.getCurrentScreenId() != blocker->getId())
            return;
        if (this->_run->lifecycle.isTerminal() || this->_interrupted)
            return;
        ExplorationState &state = this->_run->state;
        if (!this->perform(DeviceOperation::launch(state.getTargetPackage(), true)))
            return;
        state.increaseRestarts();
        state.setCurrentScreenId("");
        Observation observation = this->observe("", "", -1);
        if (observation.screen && observation.kind == ObservationKind::NewScreen)
            this->queueScreen(observation.screen);
    }

    bool Explorer::resync() {
        const ExplorationConfig &config = this->_run->preference.getConfig();
        ScreenPtr before = this->currentScreen();
        PollResult poll = pollUntilStable(*this->_provider, *this->_clock, config.stabilizationWaitMs,
                                          ExplorerConstants::PollIntervalMs, this->_interrupted);
        if (poll.status == CaptureStatus::Cancelled)
            return false;
        if (poll.status == CaptureStatus::Unavailable) {
            this->failRun(IssueType::CaptureFailed, "screen provider unavailable");
            return false;
        }
        this->_run->needsResync = false;
        if (!poll.screen) {
            this->reportIssue(IssueType::CaptureFailed, "", "", "no screen captured while resuming");
            return true;
        }
        if (!this->isTargetScreen(*poll.screen))
            return this->relaunchAfterExit("target app left while paused");
        bool isNew = false;
        int newElements = 0;
        ScreenPtr screen = this->registerScreen(poll.screen, before ? before->getDepth() + 1 : 0, isNew,
                                                newElements);
        if (isNew || newElements > 0)
            this->queueScreen(screen);
        BLOG("resumed on %s", screen->getActivity().c_str());
        return true;
    }

    // ==================== recovery ====================

    void Explorer::runRecovery() {
        ExplorationState &state = this->_run->state;
        LifecycleStateMachine &lifecycle = this->_run->lifecycle;
        std::string stuckScreen = state.getCurrentScreenId();
        RecoveryOutcome outcome = this->_run->recovery.attempt(*this);
        if (lifecycle.isTerminal())
            return;
        if (outcome.level == RecoveryLevel::Restart && outcome.result != RecoveryResult::RunFatal)
            this->_policy->recordRestartRecovery(outcome.result == RecoveryResult::Succeeded);

        long now = this->_clock->nowMs();
        switch (outcome.result) {
            case RecoveryResult::Succeeded:
                this->_run->staleness.reset(now);
                lifecycle.handle(outcome.level == RecoveryLevel::HumanHelp ? LifecycleEvent::UserHelped
                                                                           : LifecycleEvent::RecoverySucceeded);
                break;
            case RecoveryResult::Failed:
                lifecycle.handle(LifecycleEvent::RecoveryFailed);
                break;
            case RecoveryResult::Exhausted: {
                size_t dropped = state.queue().removeScreen(stuckScreen);
                state.markUnreachable(stuckScreen);
                ScreenPtr screen = state.getScreen(stuckScreen);
                if (screen)
                    this->_policy->markScreenAsDeadEnd(PolicyAgent::computeScreenHash(*screen));
                this->reportIssue(IssueType::RecoveryFailed, stuckScreen, "", "every recovery level failed");
                this->reportIssue(IssueType::BranchUnreachable, stuckScreen, "",
                                  "branch abandoned, dropped " + std::to_string(dropped) + " targets");
                this->_run->staleness.reset(now);
                lifecycle.handle(LifecycleEvent::BranchAbandoned);
                break;
            }
            case RecoveryResult::RunFatal:
                this->failRun(IssueType::RelaunchLimit, "restart limit reached during stuck recovery");
                break;
        }
    }

    bool Explorer::scrollNearestContainer() {
        const ExplorationConfig &config = this->_run->preference.getConfig();
        ScreenPtr screen = this->currentScreen();
        if (!screen)
            return false;
        ScrollableContainerPtr chosen;
        for (const auto &container: screen->getScrollables()) {
            if (!container->reachedEnd() && container->getScrollCount() < config.maxScrollsPerContainer) {
                chosen = container;
                break;
            }
        }
        if (!chosen)
            return false;
        ScrollDirection direction = chosen->isHorizontal() ? ScrollDirection::Right : ScrollDirection::Down;
        if (!this->perform(DeviceOperation::scroll(screen->getId(), chosen->getId(), chosen->getBounds(),
                                                   direction))) {
            this->reportIssue(IssueType::ScrollFailed, screen->getId(), chosen->getId(), "recovery scroll failed");
            return false;
        }
        chosen->increaseScrollCount();
        Observation observation = this->observe(screen->getId(), "", screen->getDepth());
        if (observation.cancelled || this->_run->lifecycle.isTerminal())
            return false;
        switch (observation.kind) {
            case ObservationKind::SameScreen:
                if (observation.newElements > 0) {
                    this->queueScreen(observation.screen);
                    return true;
                }
                chosen->setReachedEnd(true);
                return false;
            case ObservationKind::NewScreen:
                this->queueScreen(observation.screen);
                return true;
            case ObservationKind::KnownScreen:
                return true;
            case ObservationKind::Failed:
                return false;
            default:
                this->relaunchAfterExit("app left during recovery scroll");
                return false;
        }
    }

    bool Explorer::navigateBack() {
        ScreenPtr before = this->currentScreen();
        std::string beforeId = before ? before->getId() : "";
        if (!this->perform(DeviceOperation::back(beforeId))) {
            this->reportIssue(IssueType::BackFailed, beforeId, "", "back was not delivered");
            return false;
        }
        int fromDepth = before ? std::max(-1, before->getDepth() - 2) : -1;
        Observation observation = this->observe(beforeId, "", fromDepth);
        if (observation.cancelled || this->_run->lifecycle.isTerminal())
            return false;
        switch (observation.kind) {
            case ObservationKind::NewScreen:
                this->queueScreen(observation.screen);
                return true;
            case ObservationKind::KnownScreen:
                if (observation.newElements > 0)
                    this->queueScreen(observation.screen);
                return true;
            case ObservationKind::SameScreen:
                this->reportIssue(IssueType::BackFailed, beforeId, "", "back did not leave the screen");
                return false;
            case ObservationKind::Failed:
                return false;
            default:
                this->reportIssue(IssueType::AppMinimized, beforeId, "", "back left the app");
                this->relaunchAfterExit("back left the app");
                return false;
        }
    }

    bool Explorer::tapNavigationEntry() {
        ExplorationState &state = this->_run->state;
        ScreenPtr screen = this->currentScreen();
        if (!screen)
            return false;
        for (const auto &element: screen->getClickables()) {
            if (!this->_run->calculator.isLikelyNavigation(*element, *screen))
                continue;
            std::string reason;
            if (this->_run->queueManager.isExcluded(*element, *screen, state, reason))
                continue;
            std::string stateHash = PolicyAgent::computeScreenHash(*screen);
            std::string actionKey = PolicyAgent::computeActionKey(*element, screen->getHeight());
            if (!this->perform(DeviceOperation::tap(screen->getId(), element->getId(), element->getBounds())))
                return false;
            state.markVisited(compositeKey(screen->getId(), element->getId()));
            element->setExplored(true);
            element->increaseTapCount();
            this->_policy->onActionTaken();
            Observation observation = this->observe(screen->getId(), element->getId(), screen->getDepth());
            if (observation.cancelled || this->_run->lifecycle.isTerminal())
                return false;
            this->learnFromObservation(stateHash, actionKey, observation,
                                       observation.screen ? observation.screen->getDepth() : 0);
            switch (observation.kind) {
                case ObservationKind::NewScreen:
                    element->setOutcome(ElementOutcome::Navigation);
                    this->queueScreen(observation.screen);
                    return true;
                case ObservationKind::KnownScreen:
                    element->setOutcome(ElementOutcome::Navigation);
                    if (observation.newElements > 0)
                        this->queueScreen(observation.screen);
                    return true;
                case ObservationKind::SameScreen:
                    if (observation.newElements > 0) {
                        this->queueScreen(observation.screen);
                        return true;
                    }
                    element->setOutcome(ElementOutcome::NoEffect);
                    return false;
                case ObservationKind::Failed:
                    return false;
                default:
                    element->setOutcome(ElementOutcome::ClosesApp);
                    this->relaunchAfterExit("navigation entry left the app");
                    return false;
            }
        }
        return false;
    }

    bool Explorer::restartApp() {
        ExplorationState &state = this->_run->state;
        std::string stuckScreen = state.getCurrentScreenId();
        if (!this->perform(DeviceOperation::launch(state.getTargetPackage(), true)))
            return false;
        state.increaseRestarts();
        state.setCurrentScreenId("");
        Observation observation = this->observe("", "", -1);
        if (observation.cancelled || this->_run->lifecycle.isTerminal())
            return false;
        switch (observation.kind) {
            case ObservationKind::NewScreen:
            case ObservationKind::KnownScreen:
            case ObservationKind::SameScreen: {
                bool queued = this->queueScreen(observation.screen);
                return queued || observation.screen->getId() != stuckScreen;
            }
            default:
                return false;
        }
    }

    bool Explorer::requestHumanHelp(long waitMs) {
        ExplorationState &state = this->_run->state;
        std::string before = state.getCurrentScreenId();
        if (this->_sink)
            this->_sink->onHumanHelpRequested(before, "exploration is stuck, please move the app to a new screen");
        BLOG("waiting up to %ld ms for help on %s", waitMs, before.c_str());
        long deadline = this->_clock->nowMs() + waitMs;
        while (this->_clock->nowMs() < deadline) {
            if (this->_interrupted)
                return false;
            this->_clock->sleepMs(std::min(1000L, deadline - this->_clock->nowMs()));
            ScreenPtr captured;
            CaptureStatus status = this->_provider->captureCurrentScreen(captured);
            if (status == CaptureStatus::Unavailable)
                return false;
            if (status != CaptureStatus::Ok || !captured || captured->getId() == before)
                continue;
            if (!this->isTargetScreen(*captured))
                return this->relaunchAfterExit("app left during human help");
            bool isNew = false;
            int newElements = 0;
            ScreenPtr screen = this->registerScreen(captured, 0, isNew, newElements);
            ScreenPtr previous = state.getScreen(before);
            if (isNew && previous)
                screen->setDepth(previous->getDepth() + 1);
            this->queueScreen(screen);
            return true;
        }
        return false;
    }

    bool Explorer::runVerificationPass() {
        ExplorationState &state = this->_run->state;
        const ExplorationConfig &config = this->_run->preference.getConfig();
        if (state.visitedCount() > this->_run->visitedAtVerification)
            this->_run->verificationRounds = 0;
        this->_run->visitedAtVerification = state.visitedCount();
        if (++this->_run->verificationRounds > ExplorerConstants::MaxVerificationRounds)
            return false;
        BLOG("queue empty, verification round %d", this->_run->verificationRounds);

        // re-scan the current screen
        PollResult poll = pollUntilStable(*this->_provider, *this->_clock, config.stabilizationWaitMs,
                                          ExplorerConstants::PollIntervalMs, this->_interrupted);
        if (poll.status == CaptureStatus::Cancelled) {
            this->_run->needsResync = true;
            return true;
        }
        if (poll.status == CaptureStatus::Unavailable) {
            this->failRun(IssueType::CaptureFailed, "screen provider unavailable");
            return true;
        }
        if (poll.screen) {
            if (!this->isTargetScreen(*poll.screen))
                return this->relaunchAfterExit("target app left before verification");
            bool isNew = false;
            int newElements = 0;
            ScreenPtr current = this->currentScreen();
            ScreenPtr screen = this->registerScreen(poll.screen, current ? current->getDepth() + 1 : 0, isNew,
                                                    newElements);
            this->queueScreen(screen);
            if (!state.queue().empty())
                return true;
        }

        // known screens with elements left
        for (const auto &entry: state.screens()) {
            this->queueScreen(entry.second);
        }
        if (!state.queue().empty()) {
            BLOG("verification re-queued %zu targets", state.queue().size());
            return true;
        }

        // graph guided backtrack towards home
        const std::string &home = state.getHomeScreenId();
        if (!home.empty() && state.getCurrentScreenId() != home) {
            NavigationPath path;
            bool moved = state.graph().findPath(state.getCurrentScreenId(), home, path)
                         ? this->followPath(path, home) : this->navigateBack();
            if (moved)
                state.increaseBacktracks();
            return !state.queue().empty();
        }
        return false;
    }

    // ==================== reporting ====================

    void Explorer::reportIssue(IssueType type, const std::string &screenId, const std::string &elementId,
                               const std::string &message) {
        ExplorationState &state = this->_run->state;
        state.addIssue(type, screenId, elementId, message, this->_clock->nowMs());
        if (this->_sink)
            this->_sink->onIssue(state.issues().back());
    }

    void Explorer::failRun(IssueType type, const std::string &message) {
        BLOGE("run failed: %s", message.c_str());
        this->reportIssue(type, this->_run->state.getCurrentScreenId(), "", message);
        this->finish(RunStatus::Error, LifecycleEvent::ErrorOccurred);
    }

    void Explorer::finish(RunStatus status, LifecycleEvent event) {
        LifecycleStateMachine &lifecycle = this->_run->lifecycle;
        ExplorationState &state = this->_run->state;
        if (lifecycle.isTerminal())
            return;
        lifecycle.handle(event);
        if (lifecycle.getState() != LifecycleState::Completing && !lifecycle.isTerminal())
            lifecycle.handle(LifecycleEvent::StopRequested);
        if (lifecycle.getState() == LifecycleState::Completing)
            lifecycle.handle(LifecycleEvent::FinalizeComplete);
        state.setStatus(status);
        this->_run->endMs = this->_clock->nowMs();

        if (this->_run->preference.getConfig().strategy == StrategyType::Adaptive) {
            StrategyType best = this->_run->adaptive.best();
            this->_store->recordBestStrategy(state.getTargetPackage(), strategyName(best));
        }
        if (!this->_policy->flush())
            BLOGE("policy could not be saved");

        CoverageMetrics metrics = CoverageTracker::compute(state);
        BLOG("pass %d finished %s on %s: %s, %zu issues", state.getPassNumber(), runStatusName(status),
             lifecycleEventName(event), metrics.toString().c_str(), state.issues().size());
        this->reportProgress();
    }

    void Explorer::reportProgress() {
        if (!this->_sink)
            return;
        const ExplorationState &state = this->_run->state;
        CoverageMetrics metrics = CoverageTracker::compute(state);
        ProgressReport report;
        report.screensExplored = metrics.discoveredScreens;
        report.elementsExplored = static_cast<int>(state.visitedCount());
        report.frontierSize = state.queue().size();
        report.coverage = metrics.overall();
        report.status = state.getStatus();
        report.lifecycle = this->_run->lifecycle.getState();
        this->_sink->onProgress(report);
    }

}

#endif //Explorer_CPP_
