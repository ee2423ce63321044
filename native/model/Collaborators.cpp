/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef Collaborators_CPP_
#define Collaborators_CPP_

#include "Collaborators.h"
#include "../utils.hpp"
#include <algorithm>

namespace scoutbot {

    namespace {
        constexpr long MaxBackoffMs = 2000;
    }

    const char *captureStatusName(CaptureStatus status) {
        switch (status) {
            case CaptureStatus::Ok:
                return "ok";
            case CaptureStatus::TransientFailure:
                return "transient_failure";
            case CaptureStatus::Unavailable:
                return "unavailable";
            case CaptureStatus::Cancelled:
                return "cancelled";
        }
        return "transient_failure";
    }

    bool performOperation(Actuator &actuator, const DeviceOperation &operation) {
        Point center = operation.pos.center();
        switch (operation.act) {
            case ActionType::TAP:
                return actuator.tap(center.x, center.y);
            case ActionType::SCROLL:
                return actuator.scroll(center.x, center.y, operation.direction);
            case ActionType::BACK:
                return actuator.pressBack();
            case ActionType::LAUNCH:
                return actuator.launchApp(operation.packageName, false);
            case ActionType::RESTART:
                return actuator.launchApp(operation.packageName, true);
            default:
                BLOGE("operation %s cannot be performed", operation.toString().c_str());
                return false;
        }
    }

    PollResult pollUntilStable(ScreenProvider &provider, Clock &clock, long timeoutMs, long intervalMs,
                               const std::atomic<bool> &cancelled) {
        PollResult result;
        long deadline = clock.nowMs() + std::max(0L, timeoutMs);
        long backoff = std::max(1L, intervalMs);
        ScreenPtr previous;

        while (true) {
            if (cancelled.load()) {
                result.status = CaptureStatus::Cancelled;
                return result;
            }
            ScreenPtr captured;
            CaptureStatus status = provider.captureCurrentScreen(captured);
            result.captures++;
            if (status == CaptureStatus::Unavailable) {
                BLOGE("screen provider unavailable after %d captures", result.captures);
                result.status = CaptureStatus::Unavailable;
                return result;
            }
            if (status == CaptureStatus::Ok && captured) {
                result.status = CaptureStatus::Ok;
                result.screen = captured;
                if (previous && previous->getId() == captured->getId()
                    && previous->getClickables().size() == captured->getClickables().size()) {
                    result.stable = true;
                    return result;
                }
                previous = captured;
                backoff = std::max(1L, intervalMs);
            } else {
                BDLOG("capture failed (%s), retry in %ld ms", captureStatusName(status), backoff);
            }

            long remaining = deadline - clock.nowMs();
            if (remaining <= 0) {
                if (!result.screen)
                    result.status = CaptureStatus::TransientFailure;
                BLOG("screen not stable after %ld ms, %d captures", timeoutMs, result.captures);
                return result;
            }
            long wait = std::min(remaining, status == CaptureStatus::Ok ? std::max(1L, intervalMs) : backoff);
            clock.sleepMs(wait);
            if (status != CaptureStatus::Ok)
                backoff = std::min(MaxBackoffMs, backoff * 2);
        }
    }

}

#endif //Collaborators_CPP_
