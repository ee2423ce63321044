/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef ExplorationTarget_H_
#define ExplorationTarget_H_

#include "../Base.h"
#include <string>
#include <sstream>

namespace scoutbot {

    enum class TargetType {
        TapElement,
        ScrollContainer,
        NavigateToScreen
    };

    inline const char *targetTypeName(TargetType type) {
        switch (type) {
            case TargetType::TapElement:
                return "tap";
            case TargetType::ScrollContainer:
                return "scroll";
            case TargetType::NavigateToScreen:
                return "navigate";
        }
        return "tap";
    }

    /**
     * @brief One queued unit of work
     *
     * Created by QueueManager, popped exactly once by the Explorer. A transient
     * failure may put it back with a decayed priority (see retries).
     */
    struct ExplorationTarget {
        TargetType type = TargetType::TapElement;
        std::string screenId;
        std::string elementId;
        int priority = 0;
        Rect bounds;
        bool hasBounds = false;
        /// bottom navigation, tabs and list rows; preferred by the depth-first strategy
        bool likelyNavigation = false;
        int retries = 0;
        int routeAttempts = 0;
        /// insertion order, stable tie breaker
        long sequence = 0;

        std::string key() const {
            return screenId + ":" + elementId;
        }

        std::string toString() const {
            std::stringstream ss;
            ss << targetTypeName(type) << " " << screenId << ":" << elementId << " p=" << priority;
            if (hasBounds)
                ss << " " << bounds.toString();
            return ss.str();
        }
    };

}

#endif //ExplorationTarget_H_
