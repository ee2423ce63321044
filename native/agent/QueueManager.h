/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef QueueManager_H_
#define QueueManager_H_

#include "ElementFilter.h"
#include "PriorityCalculator.h"
#include "PolicyAgent.h"
#include "../model/FrontierQueue.h"
#include <map>
#include <string>

namespace scoutbot {

    /**
     * @brief Counters of one queueScreen() call
     */
    struct QueueResult {
        int queued = 0;
        int scrollTargets = 0;
        int excluded = 0;
        int alreadyQueued = 0;
        /// rejection reason -> count
        std::map<std::string, int> reasons;

        int countOf(const std::string &reason) const;
    };

    /**
     * @brief Turns a captured screen into frontier entries
     *
     * Every clickable element passes the exclusion rules of
     * defaultElementFilters(), is scored by the PriorityCalculator and appended
     * through the write-only QueueAppender. The manager never reads the queue.
     */
    class QueueManager {
    public:
        /**
         * @param advisor learned knowledge, null to queue on heuristics only
         */
        QueueManager(const Preference &preference, const PriorityCalculator &calculator,
                     const PolicyAdvisor *advisor);

        QueueResult queueScreen(const Screen &screen, const VisitedView &visited, QueueAppender &queue,
                                StrategyType strategy) const;

        /**
         * @brief Check one element against the exclusion rules
         *
         * @param reason receives the rule name when excluded
         * @return true when the element may not be queued
         */
        bool isExcluded(const ClickableElement &element, const Screen &screen, const VisitedView &visited,
                        std::string &reason) const;

        /// priority a tap target would get, including mode adjustments
        int tapPriority(const ClickableElement &element, const Screen &screen, StrategyType strategy) const;

        int scrollPriority(const ScrollableContainer &container, StrategyType strategy) const;

    private:
        FilterContext makeContext(const ClickableElement &element, const Screen &screen,
                                  const VisitedView &visited) const;

        const Preference &_preference;
        const PriorityCalculator &_calculator;
        const PolicyAdvisor *_advisor;
        ElementFilterPtrVec _filters;
    };

}

#endif //QueueManager_H_
