/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef Collaborators_H_
#define Collaborators_H_

#include "../Base.h"
#include "../desc/Screen.h"
#include "../desc/DeviceOperation.h"
#include "Clock.h"
#include "ExplorationState.h"
#include "LifecycleStateMachine.h"
#include <atomic>
#include <memory>

namespace scoutbot {

    enum class CaptureStatus {
        Ok,
        /// nothing usable this time, a retry may succeed
        TransientFailure,
        /// the provider is gone; the run cannot continue
        Unavailable,
        Cancelled
    };

    const char *captureStatusName(CaptureStatus status);

    /**
     * @brief Structured snapshot of whatever is on the device right now
     *
     * Implementations must be idempotent and free of side effects. A screen of
     * another package than the target means the app was left.
     */
    class ScreenProvider {
    public:
        virtual CaptureStatus captureCurrentScreen(ScreenPtr &screen) = 0;

        virtual ~ScreenProvider() = default;
    };

    typedef std::shared_ptr<ScreenProvider> ScreenProviderPtr;

    /**
     * @brief Executes gestures on the device
     *
     * A true return only means the gesture was delivered; the engine always
     * re-observes the screen to learn what it did.
     */
    class Actuator {
    public:
        virtual bool tap(int x, int y) = 0;

        virtual bool scroll(int x, int y, ScrollDirection direction) = 0;

        virtual bool pressBack() = 0;

        virtual bool launchApp(const std::string &packageName, bool forceRestart) = 0;

        virtual ~Actuator() = default;
    };

    typedef std::shared_ptr<Actuator> ActuatorPtr;

    /// dispatch a planned operation to the matching actuator call
    bool performOperation(Actuator &actuator, const DeviceOperation &operation);

    struct ProgressReport {
        int screensExplored = 0;
        int elementsExplored = 0;
        size_t frontierSize = 0;
        double coverage = 0.0;
        RunStatus status = RunStatus::NotStarted;
        LifecycleState lifecycle = LifecycleState::Idle;
    };

    /**
     * @brief Receives status for display or telemetry, fire and forget
     */
    class StatusSink {
    public:
        virtual void onTransition(LifecycleState from, LifecycleState to, LifecycleEvent event) = 0;

        virtual void onProgress(const ProgressReport &report) = 0;

        virtual void onIssue(const ExplorationIssue & /* issue */) {}

        /// the engine is waiting for a person to get it past screenId
        virtual void onHumanHelpRequested(const std::string & /* screenId */, const std::string & /* message */) {}

        virtual ~StatusSink() = default;
    };

    typedef std::shared_ptr<StatusSink> StatusSinkPtr;

    struct PollResult {
        CaptureStatus status = CaptureStatus::TransientFailure;
        ScreenPtr screen;
        /// two consecutive captures agreed before the timeout
        bool stable = false;
        int captures = 0;
    };

    /**
     * @brief Capture until two consecutive captures show the same screen id and
     * element count, or until timeoutMs elapsed on the clock
     *
     * Transient failures are retried with a doubling backoff starting at
     * intervalMs. The cancellation flag is checked before every capture and
     * after every wait. On timeout the last successful capture is returned
     * with stable == false.
     */
    PollResult pollUntilStable(ScreenProvider &provider, Clock &clock, long timeoutMs, long intervalMs,
                               const std::atomic<bool> &cancelled);

}

#endif //Collaborators_H_
