/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef CoverageTracker_H_
#define CoverageTracker_H_

#include "ExplorationState.h"
#include "../events/Preference.h"
#include <string>
#include <vector>

namespace scoutbot {

    /**
     * @brief Aggregate discovery metrics, derived from an ExplorationState
     */
    struct CoverageMetrics {
        int discoveredScreens = 0;
        int fullyExploredScreens = 0;
        int discoveredElements = 0;
        int visitedElements = 0;
        int scrollContainers = 0;
        int scrolledContainers = 0;
        int unexploredBranches = 0;

        double elementCoverage() const;

        double screenCoverage() const;

        double scrollCoverage() const;

        /// 0.5 element + 0.3 screen + 0.2 scroll, in [0, 1]
        double overall() const;

        std::string toString() const;
    };

    struct FrontierSummary {
        std::string screenId;
        std::string activity;
        int unexplored;
    };

    class CoverageTracker {
    public:
        /**
         * @brief Recompute the metrics; a screen is fully explored when every
         * clickable element is explored, visited or excluded from the queue
         */
        static CoverageMetrics compute(const ExplorationState &state);

        /// screens with unexplored elements, most unexplored first
        static std::vector<FrontierSummary> frontier(const ExplorationState &state);

        /// only the coverage-target goal has a target
        static bool hasReachedTarget(const CoverageMetrics &metrics, const ExplorationConfig &config);
    };

}

#endif //CoverageTracker_H_
