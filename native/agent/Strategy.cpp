/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef Strategy_CPP_
#define Strategy_CPP_

#include "Strategy.h"
#include "../utils.hpp"
#include <functional>
#include <limits>
#include <algorithm>

namespace scoutbot {

    namespace {
        typedef std::function<bool(const ExplorationTarget &)> TargetPredicate;

        /// highest priority entry accepted by predicate, earliest on ties
        int highestWhere(const std::vector<ExplorationTarget> &entries, const TargetPredicate &predicate) {
            int best = -1;
            for (size_t i = 0; i < entries.size(); i++) {
                if (predicate && !predicate(entries[i]))
                    continue;
                if (best < 0 || entries[i].priority > entries[static_cast<size_t>(best)].priority)
                    best = static_cast<int>(i);
            }
            return best;
        }

        const Screen *findScreen(const SelectionContext &context, const std::string &screenId) {
            auto iter = context.screens.find(screenId);
            return iter == context.screens.end() ? nullptr : iter->second.get();
        }

        int screenDepth(const SelectionContext &context, const std::string &screenId) {
            const Screen *screen = findScreen(context, screenId);
            return screen ? screen->getDepth() : 0;
        }

        int screenVisits(const SelectionContext &context, const std::string &screenId) {
            const Screen *screen = findScreen(context, screenId);
            return screen ? screen->getVisitCount() : 0;
        }

        /// (row, col) of the 100 px reading grid, scrolls sort after every tap
        long readingOrder(const ExplorationTarget &target) {
            long row = std::max(0, target.bounds.top) / 100;
            long col = std::max(0, target.bounds.left) / 100;
            long order = row * 1000 + col;
            if (target.type == TargetType::ScrollContainer)
                order += 1000000;
            return order;
        }

        int firstInReadingOrder(const std::vector<ExplorationTarget> &entries, const TargetPredicate &predicate) {
            int best = -1;
            long bestOrder = std::numeric_limits<long>::max();
            for (size_t i = 0; i < entries.size(); i++) {
                if (predicate && !predicate(entries[i]))
                    continue;
                long order = readingOrder(entries[i]);
                if (order < bestOrder) {
                    best = static_cast<int>(i);
                    bestOrder = order;
                }
            }
            return best;
        }
    }

    int selectScreenFirst(const SelectionContext &context) {
        const auto &entries = context.queue.entries();
        const std::string &current = context.currentScreenId;
        int index = highestWhere(entries, [&current](const ExplorationTarget &target) {
            return target.screenId == current;
        });
        if (index >= 0)
            return index;
        return highestWhere(entries, nullptr);
    }

    int selectPriorityBased(const SelectionContext &context) {
        return highestWhere(context.queue.entries(), nullptr);
    }

    int selectDepthFirst(const SelectionContext &context) {
        const auto &entries = context.queue.entries();
        const std::string &current = context.currentScreenId;
        int index = highestWhere(entries, [&current](const ExplorationTarget &target) {
            return target.screenId == current && target.likelyNavigation;
        });
        if (index >= 0)
            return index;
        index = highestWhere(entries, [&current](const ExplorationTarget &target) {
            return target.screenId == current;
        });
        if (index >= 0)
            return index;

        int deepest = -1;
        for (const auto &target: entries) {
            if (target.likelyNavigation)
                deepest = std::max(deepest, screenDepth(context, target.screenId));
        }
        if (deepest >= 0) {
            index = highestWhere(entries, [&context, deepest](const ExplorationTarget &target) {
                return target.likelyNavigation && screenDepth(context, target.screenId) == deepest;
            });
            if (index >= 0)
                return index;
        }
        return highestWhere(entries, nullptr);
    }

    int selectBreadthFirst(const SelectionContext &context) {
        const auto &entries = context.queue.entries();
        std::string chosenScreen;
        int chosenVisits = std::numeric_limits<int>::max();
        int chosenDepth = std::numeric_limits<int>::max();
        for (const auto &target: entries) {
            int visits = screenVisits(context, target.screenId);
            int depth = screenDepth(context, target.screenId);
            if (visits < chosenVisits || (visits == chosenVisits && depth < chosenDepth)) {
                chosenScreen = target.screenId;
                chosenVisits = visits;
                chosenDepth = depth;
            }
        }
        if (chosenScreen.empty())
            return -1;
        return highestWhere(entries, [&chosenScreen](const ExplorationTarget &target) {
            return target.screenId == chosenScreen;
        });
    }

    int selectSystematic(const SelectionContext &context) {
        const auto &entries = context.queue.entries();
        const std::string &current = context.currentScreenId;
        int index = firstInReadingOrder(entries, [&current](const ExplorationTarget &target) {
            return target.screenId == current;
        });
        if (index >= 0)
            return index;
        return firstInReadingOrder(entries, nullptr);
    }

    const std::map<StrategyType, SelectFunction> &strategyTable() {
        static const std::map<StrategyType, SelectFunction> table = {
                {StrategyType::ScreenFirst,   &selectScreenFirst},
                {StrategyType::PriorityBased, &selectPriorityBased},
                {StrategyType::DepthFirst,    &selectDepthFirst},
                {StrategyType::BreadthFirst,  &selectBreadthFirst},
                {StrategyType::Systematic,    &selectSystematic},
        };
        return table;
    }

    int selectTarget(StrategyType type, const SelectionContext &context) {
        const auto &table = strategyTable();
        auto iter = table.find(type);
        if (iter == table.end())
            iter = table.find(StrategyType::PriorityBased);
        return iter->second(context);
    }

    double StrategyPerformance::rate() const {
        if (this->actions <= 0)
            return 0.0;
        return static_cast<double>(this->discoveries) / static_cast<double>(this->actions);
    }

    AdaptiveStrategy::AdaptiveStrategy(int quota, int stagnationLimit)
            : _quota(quota), _stagnationLimit(stagnationLimit), _current(StrategyType::ScreenFirst),
              _slotActions(0), _stagnation(0), _switches(0) {
        this->_performance[this->_current].activations = 1;
    }

    const std::vector<StrategyType> &AdaptiveStrategy::cycle() {
        static const std::vector<StrategyType> order = {StrategyType::ScreenFirst, StrategyType::PriorityBased,
                                                        StrategyType::DepthFirst, StrategyType::BreadthFirst,
                                                        StrategyType::Systematic};
        return order;
    }

    void AdaptiveStrategy::begin(StrategyType initial) {
        if (initial == StrategyType::Adaptive)
            initial = StrategyType::ScreenFirst;
        this->_performance.clear();
        this->_current = initial;
        this->_performance[initial].activations = 1;
        this->_slotActions = 0;
        this->_stagnation = 0;
        this->_switches = 0;
        BLOG("adaptive strategy starts with %s", strategyName(initial));
    }

    StrategyType AdaptiveStrategy::best() const {
        StrategyType bestType = this->_current;
        double bestRate = -1.0;
        for (StrategyType type: cycle()) {
            auto iter = this->_performance.find(type);
            if (iter == this->_performance.end() || iter->second.actions == 0)
                continue;
            if (iter->second.rate() > bestRate) {
                bestType = type;
                bestRate = iter->second.rate();
            }
        }
        return bestType;
    }

    StrategyType AdaptiveStrategy::chooseNext(bool stagnated) const {
        const auto &order = cycle();
        size_t position = 0;
        for (size_t i = 0; i < order.size(); i++) {
            if (order[i] == this->_current)
                position = i;
        }
        for (size_t step = 1; step < order.size(); step++) {
            StrategyType candidate = order[(position + step) % order.size()];
            auto iter = this->_performance.find(candidate);
            if (iter == this->_performance.end() || iter->second.actions == 0)
                return candidate;
        }

        // every strategy has a track record
        StrategyType bestOther = this->_current;
        double bestRate = -1.0;
        for (StrategyType type: order) {
            if (type == this->_current)
                continue;
            double rate = this->_performance.at(type).rate();
            if (rate > bestRate) {
                bestOther = type;
                bestRate = rate;
            }
        }
        if (stagnated)
            return bestOther;
        return this->_performance.at(this->_current).rate() >= bestRate ? this->_current : bestOther;
    }

    void AdaptiveStrategy::switchTo(StrategyType next, const char *why) {
        this->_slotActions = 0;
        this->_stagnation = 0;
        if (next == this->_current)
            return;
        const StrategyPerformance &previous = this->_performance[this->_current];
        BLOG("adaptive strategy %s -> %s (%s, rate %.2f over %d actions)", strategyName(this->_current),
             strategyName(next), why, previous.rate(), previous.actions);
        this->_current = next;
        this->_performance[next].activations++;
        this->_switches++;
    }

    bool AdaptiveStrategy::recordOutcome(int discoveries) {
        StrategyPerformance &performance = this->_performance[this->_current];
        performance.actions++;
        this->_slotActions++;
        if (discoveries > 0) {
            performance.discoveries += discoveries;
            this->_stagnation = 0;
        } else {
            this->_stagnation++;
        }

        bool stagnated = this->_stagnation >= this->_stagnationLimit;
        if (!stagnated && this->_slotActions < this->_quota)
            return false;
        StrategyType previous = this->_current;
        this->switchTo(this->chooseNext(stagnated), stagnated ? "stagnation" : "quota");
        return previous != this->_current;
    }

}

#endif //Strategy_CPP_
