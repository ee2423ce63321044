/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef PriorityCalculator_CPP_
#define PriorityCalculator_CPP_

#include "PriorityCalculator.h"
#include "../utils.hpp"
#include <algorithm>
#include <cmath>

namespace scoutbot {

    PriorityCalculator::PriorityCalculator(const Preference &preference)
            : _preference(preference) {
    }

    bool PriorityCalculator::isBottomNavigation(const ClickableElement &element, const Screen &screen) {
        const Rect &bounds = element.getBounds();
        int height = bounds.height();
        return bounds.center().y > screen.getHeight() - PriorityConstants::BottomBandHeight
               && height > PriorityConstants::BottomNavMinHeight
               && height < PriorityConstants::BottomNavMaxHeight;
    }

    bool PriorityCalculator::isMetaElement(const ClickableElement &element) const {
        return containsAnyWord(element.searchableText(), this->_preference.metaWords());
    }

    bool PriorityCalculator::isLikelyBackButton(const ClickableElement &element) const {
        std::string resourceEntry = element.getResourceId();
        size_t slash = resourceEntry.rfind('/');
        if (slash != std::string::npos)
            resourceEntry = resourceEntry.substr(slash + 1);
        std::string candidates[] = {toLowerCase(element.getText()),
                                    toLowerCase(element.getContentDescription()),
                                    toLowerCase(resourceEntry)};
        for (const auto &pattern: this->_preference.backButtonPatterns()) {
            for (const auto &candidate: candidates) {
                if (!candidate.empty() && candidate == pattern)
                    return true;
            }
        }
        return false;
    }

    bool PriorityCalculator::isLikelyNavigation(const ClickableElement &element, const Screen &screen) const {
        if (isBottomNavigation(element, screen))
            return true;
        std::string identity = toLowerCase(element.getResourceId() + " " + element.getClassName());
        return containsAnyWord(identity, this->_preference.navigationWords());
    }

    int PriorityCalculator::systematicPriority(const Rect &bounds) {
        int row = std::max(0, bounds.top) / PriorityConstants::SystematicCell;
        int col = std::max(0, bounds.left) / PriorityConstants::SystematicCell;
        return 1000 - std::max(0, std::min(999, row * 100 + col));
    }

    int PriorityCalculator::score(const ClickableElement &element, const Screen &screen, StrategyType strategy,
                                  const LearnedSignal &learned) const {
        if (learned.deadEnd)
            return PriorityConstants::DeadEndPriority;

        bool adaptive = strategy == StrategyType::Adaptive;
        int width = screen.getWidth();
        int height = screen.getHeight();
        Point center = element.getBounds().center();
        int score = 0;

        if (!element.getText().empty() || !element.getContentDescription().empty())
            score += PriorityConstants::TextBonus;
        if (!element.getResourceId().empty())
            score += PriorityConstants::ResourceIdBonus;

        if (isBottomNavigation(element, screen)) {
            bool visited = element.isExplored() || element.getTapCount() > 0;
            if (adaptive) {
                score += visited ? PriorityConstants::AdaptiveBottomNavVisited
                                 : PriorityConstants::AdaptiveBottomNavUnvisited;
            } else {
                score += visited ? PriorityConstants::BottomNavVisited : PriorityConstants::BottomNavUnvisited;
            }
        } else if (center.x < PriorityConstants::EdgeZoneWidth
                   || center.x > width - PriorityConstants::EdgeZoneWidth) {
            score += adaptive ? PriorityConstants::AdaptiveEdgePenalty : PriorityConstants::EdgePenalty;
        }

        if (center.y < PriorityConstants::TopZoneHeight)
            score += adaptive ? PriorityConstants::AdaptiveTopPenalty : PriorityConstants::TopPenalty;

        if (center.x >= width / 4 && center.x <= width * 3 / 4
            && center.y >= height / 4 && center.y <= height * 3 / 4) {
            score += adaptive ? PriorityConstants::AdaptiveCentralBonus : PriorityConstants::CentralBonus;
        }

        if (this->isMetaElement(element))
            score += PriorityConstants::MetaPenalty;

        double boost = adaptive ? learned.boost * PriorityConstants::AdaptiveBoostScale : learned.boost;
        score += static_cast<int>(std::lround(boost));

        if (learned.dangerous)
            score += PriorityConstants::DangerousPenalty;

        BDLOG("score %s on %s = %d (boost %.1f)", element.label().c_str(), screen.getActivity().c_str(), score,
              boost);
        return score;
    }

}

#endif //PriorityCalculator_CPP_
