/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef DeviceOperation_H_
#define DeviceOperation_H_

#include <string>
#include <memory>
#include "../Base.h"

namespace scoutbot {

    /**
     * @brief One gesture the engine asks the device to perform
     *
     * Built by the Explorer from the selected target, handed to the Actuator
     * and kept in the run log. Carries everything needed to replay the gesture.
     */
    class DeviceOperation {
    public:
        /// Gesture kind
        ActionType act;

        /// Target rectangle; taps and scrolls start at its center
        Rect pos;

        /// Screen the gesture was planned on
        std::string sid;

        /// Element or container id
        std::string aid;

        ScrollDirection direction;

        /// package for LAUNCH and RESTART
        std::string packageName;

        /// Wait in milliseconds after the gesture before observing
        long waitTime;

        DeviceOperation();

        static DeviceOperation tap(const std::string &screenId, const std::string &elementId, const Rect &bounds);

        static DeviceOperation scroll(const std::string &screenId, const std::string &containerId,
                                      const Rect &bounds, ScrollDirection direction);

        static DeviceOperation back(const std::string &screenId);

        static DeviceOperation launch(const std::string &packageName, bool forceRestart);

        /// parse the toString() form; false on malformed input
        static bool fromJson(const std::string &jsonContent, DeviceOperation &operation);

        std::string toString() const;
    };

    typedef std::shared_ptr<DeviceOperation> DeviceOperationPtr;

}

#endif //DeviceOperation_H_
