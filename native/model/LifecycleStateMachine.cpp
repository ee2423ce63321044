/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef LifecycleStateMachine_CPP_
#define LifecycleStateMachine_CPP_

#include "LifecycleStateMachine.h"
#include "../utils.hpp"
#include <nlohmann/json.hpp>

namespace scoutbot {

    const char *lifecycleStateName(LifecycleState state) {
        switch (state) {
            case LifecycleState::Idle:
                return "idle";
            case LifecycleState::Initializing:
                return "initializing";
            case LifecycleState::Exploring:
                return "exploring";
            case LifecycleState::Paused:
                return "paused";
            case LifecycleState::Stuck:
                return "stuck";
            case LifecycleState::Completing:
                return "completing";
            case LifecycleState::Completed:
                return "completed";
        }
        return "idle";
    }

    const char *lifecycleEventName(LifecycleEvent event) {
        switch (event) {
            case LifecycleEvent::StartRequested:
                return "start_requested";
            case LifecycleEvent::InitializationComplete:
                return "initialization_complete";
            case LifecycleEvent::ElementTapped:
                return "element_tapped";
            case LifecycleEvent::NewScreenDiscovered:
                return "new_screen_discovered";
            case LifecycleEvent::NewElementsFound:
                return "new_elements_found";
            case LifecycleEvent::NoProgressDetected:
                return "no_progress_detected";
            case LifecycleEvent::StuckThresholdReached:
                return "stuck_threshold_reached";
            case LifecycleEvent::RecoverySucceeded:
                return "recovery_succeeded";
            case LifecycleEvent::RecoveryFailed:
                return "recovery_failed";
            case LifecycleEvent::UserHelped:
                return "user_helped";
            case LifecycleEvent::BranchAbandoned:
                return "branch_abandoned";
            case LifecycleEvent::PauseRequested:
                return "pause_requested";
            case LifecycleEvent::ResumeRequested:
                return "resume_requested";
            case LifecycleEvent::StopRequested:
                return "stop_requested";
            case LifecycleEvent::MaxIterationsReached:
                return "max_iterations_reached";
            case LifecycleEvent::CoverageReached:
                return "coverage_reached";
            case LifecycleEvent::QueueExhausted:
                return "queue_exhausted";
            case LifecycleEvent::CompleteRequested:
                return "complete_requested";
            case LifecycleEvent::ErrorOccurred:
                return "error_occurred";
            case LifecycleEvent::FinalizeComplete:
                return "finalize_complete";
        }
        return "unknown";
    }

    LifecycleStateMachine::LifecycleStateMachine(const Clock &clock)
            : _clock(clock), _state(LifecycleState::Idle), _enteredMs(clock.nowMs()) {
    }

    LifecycleState LifecycleStateMachine::resolve(LifecycleState state, LifecycleEvent event) {
        switch (state) {
            case LifecycleState::Idle:
                if (event == LifecycleEvent::StartRequested)
                    return LifecycleState::Initializing;
                break;
            case LifecycleState::Initializing:
                switch (event) {
                    case LifecycleEvent::InitializationComplete:
                        return LifecycleState::Exploring;
                    case LifecycleEvent::StopRequested:
                    case LifecycleEvent::ErrorOccurred:
                        return LifecycleState::Completed;
                    default:
                        break;
                }
                break;
            case LifecycleState::Exploring:
                switch (event) {
                    case LifecycleEvent::StuckThresholdReached:
                        return LifecycleState::Stuck;
                    case LifecycleEvent::PauseRequested:
                        return LifecycleState::Paused;
                    case LifecycleEvent::StopRequested:
                    case LifecycleEvent::MaxIterationsReached:
                    case LifecycleEvent::CoverageReached:
                    case LifecycleEvent::QueueExhausted:
                    case LifecycleEvent::CompleteRequested:
                    case LifecycleEvent::ErrorOccurred:
                        return LifecycleState::Completing;
                    default:
                        break;
                }
                break;
            case LifecycleState::Paused:
                switch (event) {
                    case LifecycleEvent::ResumeRequested:
                        return LifecycleState::Exploring;
                    case LifecycleEvent::StopRequested:
                    case LifecycleEvent::ErrorOccurred:
                        return LifecycleState::Completing;
                    default:
                        break;
                }
                break;
            case LifecycleState::Stuck:
                switch (event) {
                    case LifecycleEvent::RecoverySucceeded:
                    case LifecycleEvent::UserHelped:
                    case LifecycleEvent::NewScreenDiscovered:
                    case LifecycleEvent::BranchAbandoned:
                        return LifecycleState::Exploring;
                    case LifecycleEvent::PauseRequested:
                        return LifecycleState::Paused;
                    case LifecycleEvent::StopRequested:
                    case LifecycleEvent::MaxIterationsReached:
                    case LifecycleEvent::CompleteRequested:
                    case LifecycleEvent::ErrorOccurred:
                        return LifecycleState::Completing;
                    default:
                        break;
                }
                break;
            case LifecycleState::Completing:
                if (event == LifecycleEvent::FinalizeComplete || event == LifecycleEvent::StopRequested)
                    return LifecycleState::Completed;
                break;
            case LifecycleState::Completed:
                if (event == LifecycleEvent::StartRequested)
                    return LifecycleState::Initializing;
                break;
        }
        return state;
    }

    void LifecycleStateMachine::countEvent(LifecycleEvent event) {
        switch (event) {
            case LifecycleEvent::ElementTapped:
                this->_counters.tapsObserved++;
                break;
            case LifecycleEvent::NewScreenDiscovered:
                this->_counters.screensObserved++;
                break;
            case LifecycleEvent::RecoveryFailed:
                if (this->_state == LifecycleState::Stuck)
                    this->_counters.failedRecoveries++;
                break;
            default:
                break;
        }
    }

    bool LifecycleStateMachine::handle(LifecycleEvent event) {
        this->countEvent(event);
        LifecycleState next = resolve(this->_state, event);
        if (next == this->_state) {
            BDLOG("event %s ignored in state %s", lifecycleEventName(event), lifecycleStateName(this->_state));
            return false;
        }
        LifecycleState previous = this->_state;
        long now = this->_clock.nowMs();
        this->_timeInState[previous] += now - this->_enteredMs;
        this->_enteredMs = now;
        this->_state = next;

        if (next == LifecycleState::Stuck)
            this->_counters.stuckDetections++;
        if (next == LifecycleState::Paused)
            this->_counters.pauses++;
        if (previous == LifecycleState::Stuck && next == LifecycleState::Exploring
            && event != LifecycleEvent::BranchAbandoned)
            this->_counters.recoveries++;

        BLOG("lifecycle %s -> %s on %s", lifecycleStateName(previous), lifecycleStateName(next),
             lifecycleEventName(event));
        if (this->_callback)
            this->_callback(previous, next, event);
        return true;
    }

    bool LifecycleStateMachine::canStart() const {
        return this->_state == LifecycleState::Idle || this->_state == LifecycleState::Completed;
    }

    bool LifecycleStateMachine::isActive() const {
        return this->_state == LifecycleState::Exploring || this->_state == LifecycleState::Stuck;
    }

    long LifecycleStateMachine::timeIn(LifecycleState state) const {
        long total = 0;
        auto iter = this->_timeInState.find(state);
        if (iter != this->_timeInState.end())
            total = iter->second;
        if (state == this->_state)
            total += this->_clock.nowMs() - this->_enteredMs;
        return total;
    }

    std::string LifecycleStateMachine::toJson() const {
        nlohmann::json j;
        j["state"] = lifecycleStateName(this->_state);
        j["stuckDetections"] = this->_counters.stuckDetections;
        j["recoveries"] = this->_counters.recoveries;
        j["failedRecoveries"] = this->_counters.failedRecoveries;
        j["pauses"] = this->_counters.pauses;
        nlohmann::json times;
        for (const auto &entry: this->_timeInState) {
            times[lifecycleStateName(entry.first)] = this->timeIn(entry.first);
        }
        times[lifecycleStateName(this->_state)] = this->timeIn(this->_state);
        j["timeInState"] = times;
        return j.dump();
    }

}

#endif //LifecycleStateMachine_CPP_
