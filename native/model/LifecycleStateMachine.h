/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef LifecycleStateMachine_H_
#define LifecycleStateMachine_H_

#include "Clock.h"
#include <functional>
#include <map>
#include <string>

namespace scoutbot {

    enum class LifecycleState {
        Idle,
        Initializing,
        Exploring,
        Paused,
        Stuck,
        Completing,
        Completed
    };

    const char *lifecycleStateName(LifecycleState state);

    enum class LifecycleEvent {
        StartRequested,
        InitializationComplete,
        ElementTapped,
        NewScreenDiscovered,
        NewElementsFound,
        NoProgressDetected,
        StuckThresholdReached,
        RecoverySucceeded,
        RecoveryFailed,
        UserHelped,
        BranchAbandoned,
        PauseRequested,
        ResumeRequested,
        StopRequested,
        MaxIterationsReached,
        CoverageReached,
        QueueExhausted,
        CompleteRequested,
        ErrorOccurred,
        FinalizeComplete
    };

    const char *lifecycleEventName(LifecycleEvent event);

    /// (old state, new state, event), fired only when the state changes
    typedef std::function<void(LifecycleState, LifecycleState, LifecycleEvent)> TransitionCallback;

    struct LifecycleCounters {
        int stuckDetections = 0;
        int recoveries = 0;
        int failedRecoveries = 0;
        int pauses = 0;
        int tapsObserved = 0;
        int screensObserved = 0;
    };

    /**
     * @brief Run lifecycle: Idle -> Initializing -> Exploring <-> Paused,
     * Exploring -> Stuck -> Exploring | Completing, Exploring -> Completing -> Completed
     *
     * Every (state, event) pair has a defined result; events that do not apply
     * to the current state leave it unchanged. Completed is terminal except for
     * StartRequested, which begins another pass.
     */
    class LifecycleStateMachine {
    public:
        explicit LifecycleStateMachine(const Clock &clock);

        LifecycleState getState() const { return this->_state; }

        /**
         * @brief Apply an event
         *
         * @return true if the state changed
         */
        bool handle(LifecycleEvent event);

        /// state the machine would move to, without applying the event
        static LifecycleState resolve(LifecycleState state, LifecycleEvent event);

        void setTransitionCallback(const TransitionCallback &callback) { this->_callback = callback; }

        bool canStart() const;

        /// Exploring or Stuck: the main loop may act
        bool isActive() const;

        bool isTerminal() const { return this->_state == LifecycleState::Completed; }

        const LifecycleCounters &getCounters() const { return this->_counters; }

        /// milliseconds spent in state, including the current stay
        long timeIn(LifecycleState state) const;

        std::string toJson() const;

    private:
        void countEvent(LifecycleEvent event);

        const Clock &_clock;
        LifecycleState _state;
        long _enteredMs;
        std::map<LifecycleState, long> _timeInState;
        LifecycleCounters _counters;
        TransitionCallback _callback;
    };

}

#endif //LifecycleStateMachine_H_
