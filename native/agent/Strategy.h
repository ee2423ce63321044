/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef Strategy_H_
#define Strategy_H_

#include "../desc/Screen.h"
#include "../events/Preference.h"
#include "../model/FrontierQueue.h"
#include <map>
#include <string>
#include <vector>

namespace scoutbot {

    /**
     * @brief Read-only inputs of a selection function
     */
    struct SelectionContext {
        const QueueView &queue;
        const ScreenPtrMap &screens;
        std::string currentScreenId;
    };

    /// index into context.queue.entries(), -1 when nothing can be selected
    typedef int (*SelectFunction)(const SelectionContext &context);

    /// exhaust the current screen before leaving it
    int selectScreenFirst(const SelectionContext &context);

    /// global maximum priority
    int selectPriorityBased(const SelectionContext &context);

    /// navigation-like targets first, current screen before deeper screens
    int selectDepthFirst(const SelectionContext &context);

    /// targets of the least visited screen first
    int selectBreadthFirst(const SelectionContext &context);

    /// reading order: top to bottom, left to right, scrolls after taps
    int selectSystematic(const SelectionContext &context);

    /**
     * @brief The single dispatch table of the concrete strategies
     *
     * Adaptive has no entry; it resolves to one of the others through
     * AdaptiveStrategy::current().
     */
    const std::map<StrategyType, SelectFunction> &strategyTable();

    /**
     * @brief Select with the given strategy; Adaptive falls back to priority based
     */
    int selectTarget(StrategyType type, const SelectionContext &context);

    struct StrategyPerformance {
        int actions = 0;
        int discoveries = 0;
        int activations = 0;

        double rate() const;
    };

    namespace AdaptiveConstants {
        /// actions a strategy gets before it has to hand over
        constexpr int Quota = 15;
        /// consecutive actions without discovery that count as stagnation
        constexpr int StagnationLimit = 5;
    }

    /**
     * @brief Meta strategy cycling through the concrete strategies
     *
     * Each strategy runs until it stagnates or uses up its quota. Untried
     * strategies are tried in cycle order first; once all were tried the
     * best discovery rate wins, and a stagnating strategy hands over to the
     * best other one.
     */
    class AdaptiveStrategy {
    public:
        explicit AdaptiveStrategy(int quota = AdaptiveConstants::Quota,
                                  int stagnationLimit = AdaptiveConstants::StagnationLimit);

        /// start over with initial, e.g. the best strategy of an earlier run
        void begin(StrategyType initial);

        StrategyType current() const { return this->_current; }

        /**
         * @brief Account one action of the current strategy
         *
         * @param discoveries new screens plus new elements the action revealed
         * @return true if the active strategy changed
         */
        bool recordOutcome(int discoveries);

        /// best discovery rate among strategies with at least one action
        StrategyType best() const;

        int getSwitchCount() const { return this->_switches; }

        const std::map<StrategyType, StrategyPerformance> &getPerformance() const { return this->_performance; }

        static const std::vector<StrategyType> &cycle();

    private:
        StrategyType chooseNext(bool stagnated) const;

        void switchTo(StrategyType next, const char *why);

        int _quota;
        int _stagnationLimit;
        StrategyType _current;
        int _slotActions;
        int _stagnation;
        int _switches;
        std::map<StrategyType, StrategyPerformance> _performance;
    };

}

#endif //Strategy_H_
