/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef CoverageTracker_CPP_
#define CoverageTracker_CPP_

#include "CoverageTracker.h"
#include <algorithm>
#include <sstream>
#include <iomanip>

namespace scoutbot {

    static double ratio(int part, int total) {
        if (total <= 0)
            return 0.0;
        return std::min(1.0, static_cast<double>(part) / static_cast<double>(total));
    }

    double CoverageMetrics::elementCoverage() const {
        return ratio(this->visitedElements, this->discoveredElements);
    }

    double CoverageMetrics::screenCoverage() const {
        return ratio(this->fullyExploredScreens, this->discoveredScreens);
    }

    double CoverageMetrics::scrollCoverage() const {
        // no scrollable content means nothing left to scroll
        if (this->scrollContainers == 0)
            return this->discoveredScreens > 0 ? 1.0 : 0.0;
        return ratio(this->scrolledContainers, this->scrollContainers);
    }

    double CoverageMetrics::overall() const {
        return 0.5 * this->elementCoverage() + 0.3 * this->screenCoverage() + 0.2 * this->scrollCoverage();
    }

    std::string CoverageMetrics::toString() const {
        std::stringstream ss;
        ss << std::fixed << std::setprecision(1)
           << "screens " << this->fullyExploredScreens << "/" << this->discoveredScreens
           << " elements " << this->visitedElements << "/" << this->discoveredElements
           << " scroll " << this->scrolledContainers << "/" << this->scrollContainers
           << " branches " << this->unexploredBranches
           << " overall " << this->overall() * 100.0 << "%";
        return ss.str();
    }

    static bool elementDone(const ExplorationState &state, const Screen &screen, const ClickableElement &element) {
        return element.isExplored() || state.isVisited(compositeKey(screen.getId(), element.getId()));
    }

    CoverageMetrics CoverageTracker::compute(const ExplorationState &state) {
        CoverageMetrics metrics;
        for (const auto &entry: state.screens()) {
            const Screen &screen = *entry.second;
            metrics.discoveredScreens++;
            int remaining = 0;
            for (const auto &element: screen.getClickables()) {
                if (element->isExcluded())
                    continue;
                metrics.discoveredElements++;
                if (elementDone(state, screen, *element)) {
                    metrics.visitedElements++;
                } else {
                    remaining++;
                }
            }
            for (const auto &container: screen.getScrollables()) {
                metrics.scrollContainers++;
                if (container->getScrollCount() > 0 || container->reachedEnd())
                    metrics.scrolledContainers++;
            }
            if (remaining == 0 || state.isUnreachable(screen.getId()) || screen.isBlocker()) {
                metrics.fullyExploredScreens++;
            } else {
                metrics.unexploredBranches++;
            }
        }
        return metrics;
    }

    std::vector<FrontierSummary> CoverageTracker::frontier(const ExplorationState &state) {
        std::vector<FrontierSummary> result;
        for (const auto &entry: state.screens()) {
            const Screen &screen = *entry.second;
            if (screen.isBlocker() || state.isUnreachable(screen.getId()))
                continue;
            int remaining = 0;
            for (const auto &element: screen.getClickables()) {
                if (!element->isExcluded() && !elementDone(state, screen, *element))
                    remaining++;
            }
            if (remaining > 0)
                result.push_back(FrontierSummary{screen.getId(), screen.getActivity(), remaining});
        }
        std::stable_sort(result.begin(), result.end(), [](const FrontierSummary &a, const FrontierSummary &b) {
            return a.unexplored > b.unexplored;
        });
        return result;
    }

    bool CoverageTracker::hasReachedTarget(const CoverageMetrics &metrics, const ExplorationConfig &config) {
        if (config.goal != ExplorationGoal::CoverageTarget)
            return false;
        return metrics.overall() * 100.0 >= config.targetCoveragePct;
    }

}

#endif //CoverageTracker_CPP_
