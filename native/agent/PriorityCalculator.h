/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef PriorityCalculator_H_
#define PriorityCalculator_H_

#include "../Base.h"
#include "../desc/Screen.h"
#include "../events/Preference.h"

namespace scoutbot {

    namespace PriorityConstants {
        constexpr int TextBonus = 10;
        constexpr int ResourceIdBonus = 5;

        /// height of the bottom navigation band, measured from the screen bottom
        constexpr int BottomBandHeight = 200;
        constexpr int BottomNavMinHeight = 40;
        constexpr int BottomNavMaxHeight = 150;
        constexpr int BottomNavUnvisited = 50;
        constexpr int BottomNavVisited = 15;
        constexpr int AdaptiveBottomNavUnvisited = 10;
        constexpr int AdaptiveBottomNavVisited = 5;

        constexpr int EdgeZoneWidth = 100;
        constexpr int EdgePenalty = -5;
        constexpr int AdaptiveEdgePenalty = -2;
        constexpr int TopZoneHeight = 200;
        constexpr int TopPenalty = -3;
        constexpr int AdaptiveTopPenalty = -1;
        constexpr int CentralBonus = 5;
        constexpr int AdaptiveCentralBonus = 15;

        constexpr int MetaPenalty = -30;
        constexpr double AdaptiveBoostScale = 1.5;
        constexpr int DangerousPenalty = -100;
        constexpr int DeadEndPriority = -80;

        constexpr int DeepModeBonus = 10;
        constexpr int ScrollPriority = 5;
        constexpr int DeepScrollPriority = 15;
        constexpr int SystematicScrollBase = 500;
        /// reading order cell size of the systematic strategy
        constexpr int SystematicCell = 100;
    }

    /**
     * @brief What the policy knows about an element, fed into the score
     */
    struct LearnedSignal {
        double boost = 0.0;
        bool deadEnd = false;
        bool dangerous = false;
    };

    /**
     * @brief Pure heuristic scorer of candidate elements
     *
     * Holds no state besides the lexicons of the run; identical inputs always
     * produce the same score.
     */
    class PriorityCalculator {
    public:
        explicit PriorityCalculator(const Preference &preference);

        /**
         * @brief Score one element of a screen
         *
         * @param element the candidate
         * @param screen screen the element belongs to, gives the geometry
         * @param strategy active strategy; adaptive lowers the hand tuned bonuses
         * @param learned the policy's opinion of the element
         * @return the score, higher is tapped first
         */
        int score(const ClickableElement &element, const Screen &screen, StrategyType strategy,
                  const LearnedSignal &learned) const;

        static bool isBottomNavigation(const ClickableElement &element, const Screen &screen);

        /// settings, about, legal, rate-app and the like
        bool isMetaElement(const ClickableElement &element) const;

        /// exact match of the label or resource entry against the back lexicon
        bool isLikelyBackButton(const ClickableElement &element) const;

        /// bottom navigation, tabs, menu entries and list rows
        bool isLikelyNavigation(const ClickableElement &element, const Screen &screen) const;

        /// 1000 - clamp(row * 100 + col, 0, 999), row and col in 100 px cells
        static int systematicPriority(const Rect &bounds);

    private:
        const Preference &_preference;
    };

}

#endif //PriorityCalculator_H_
