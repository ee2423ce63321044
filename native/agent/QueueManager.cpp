/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef QueueManager_CPP_
#define QueueManager_CPP_

#include "QueueManager.h"
#include "../utils.hpp"
#include <algorithm>

namespace scoutbot {

    int QueueResult::countOf(const std::string &reason) const {
        auto iter = this->reasons.find(reason);
        return iter == this->reasons.end() ? 0 : iter->second;
    }

    QueueManager::QueueManager(const Preference &preference, const PriorityCalculator &calculator,
                               const PolicyAdvisor *advisor)
            : _preference(preference), _calculator(calculator), _advisor(advisor),
              _filters(defaultElementFilters()) {
    }

    FilterContext QueueManager::makeContext(const ClickableElement &element, const Screen &screen,
                                            const VisitedView &visited) const {
        return FilterContext{screen, this->_preference, this->_calculator, visited, this->_advisor,
                             PolicyAgent::computeScreenHash(screen),
                             PolicyAgent::computeActionKey(element, screen.getHeight())};
    }

    bool QueueManager::isExcluded(const ClickableElement &element, const Screen &screen, const VisitedView &visited,
                                  std::string &reason) const {
        FilterContext context = this->makeContext(element, screen, visited);
        for (const auto &filter: this->_filters) {
            if (!filter->include(element, context)) {
                reason = filter->reason();
                return true;
            }
        }
        return false;
    }

    int QueueManager::tapPriority(const ClickableElement &element, const Screen &screen,
                                  StrategyType strategy) const {
        if (strategy == StrategyType::Systematic)
            return PriorityCalculator::systematicPriority(element.getBounds());
        LearnedSignal learned;
        if (this->_advisor) {
            std::string stateHash = PolicyAgent::computeScreenHash(screen);
            std::string actionKey = PolicyAgent::computeActionKey(element, screen.getHeight());
            learned.boost = this->_advisor->priorityBoost(stateHash, actionKey);
            learned.deadEnd = this->_advisor->isDeadEnd(stateHash, actionKey);
            learned.dangerous = this->_advisor->isDangerous(actionKey);
        }
        int priority = this->_calculator.score(element, screen, strategy, learned);
        if (this->_preference.getConfig().mode == ExplorationMode::Deep)
            priority += PriorityConstants::DeepModeBonus;
        return priority;
    }

    int QueueManager::scrollPriority(const ScrollableContainer &container, StrategyType strategy) const {
        if (strategy == StrategyType::Systematic)
            return PriorityConstants::SystematicScrollBase
                   - std::max(0, container.getBounds().top) / PriorityConstants::SystematicCell;
        if (this->_preference.getConfig().mode == ExplorationMode::Deep)
            return PriorityConstants::DeepScrollPriority;
        return PriorityConstants::ScrollPriority;
    }

    QueueResult QueueManager::queueScreen(const Screen &screen, const VisitedView &visited, QueueAppender &queue,
                                          StrategyType strategy) const {
        QueueResult result;
        if (screen.isBlocker()) {
            BLOG("screen %s is a blocker, nothing queued", screen.getActivity().c_str());
            return result;
        }
        bool quick = this->_preference.getConfig().mode == ExplorationMode::Quick;

        for (const auto &element: screen.getClickables()) {
            std::string reason;
            FilterContext context = this->makeContext(*element, screen, visited);
            bool rejected = false;
            for (const auto &filter: this->_filters) {
                if (!filter->include(*element, context)) {
                    reason = filter->reason();
                    rejected = true;
                    if (filter->marksExcluded())
                        element->setExcluded(true);
                    break;
                }
            }
            if (!rejected && quick && !this->_calculator.isLikelyNavigation(*element, screen)) {
                reason = "quick_mode";
                rejected = true;
            }
            if (rejected) {
                result.excluded++;
                result.reasons[reason]++;
                BDLOG("exclude %s on %s: %s", element->label().c_str(), screen.getActivity().c_str(),
                      reason.c_str());
                continue;
            }

            ExplorationTarget target;
            target.type = TargetType::TapElement;
            target.screenId = screen.getId();
            target.elementId = element->getId();
            target.bounds = element->getBounds();
            target.hasBounds = true;
            target.likelyNavigation = this->_calculator.isLikelyNavigation(*element, screen);
            target.priority = this->tapPriority(*element, screen, strategy);
            if (queue.append(target)) {
                result.queued++;
            } else {
                result.alreadyQueued++;
            }
        }

        if (!quick) {
            int maxScrolls = this->_preference.getConfig().maxScrollsPerContainer;
            for (const auto &container: screen.getScrollables()) {
                if (container->reachedEnd() || container->getScrollCount() >= maxScrolls)
                    continue;
                ExplorationTarget target;
                target.type = TargetType::ScrollContainer;
                target.screenId = screen.getId();
                target.elementId = container->getId();
                target.bounds = container->getBounds();
                target.hasBounds = true;
                target.priority = this->scrollPriority(*container, strategy);
                if (queue.append(target)) {
                    result.scrollTargets++;
                } else {
                    result.alreadyQueued++;
                }
            }
        }

        BLOG("queued %d taps, %d scrolls from %s, excluded %d", result.queued, result.scrollTargets,
             screen.getActivity().c_str(), result.excluded);
        return result;
    }

}

#endif //QueueManager_CPP_
