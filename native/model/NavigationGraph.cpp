/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef NavigationGraph_CPP_
#define NavigationGraph_CPP_

#include "NavigationGraph.h"
#include "../utils.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <deque>
#include <queue>
#include <limits>
#include <utility>

namespace scoutbot {

    namespace NavigationConstants {
        constexpr double DefaultReliability = 0.5;
        constexpr double MinReliability = 0.1;
        constexpr double MaxReliability = 1.0;
        constexpr double OccurrenceBonusPerTap = 0.02;
        constexpr double MaxOccurrenceBonus = 0.2;
        constexpr double ConditionalPenalty = 0.1;
        constexpr double BlockerPenalty = 0.3;
        constexpr double BaseEdgeCost = 0.01;
    }

    ElementNavigation::ElementNavigation()
            : _total(0) {}

    void ElementNavigation::recordDestination(const std::string &screenId) {
        this->_destinations[screenId]++;
        this->_total++;
    }

    int ElementNavigation::occurrencesOf(const std::string &screenId) const {
        auto iter = this->_destinations.find(screenId);
        return iter == this->_destinations.end() ? 0 : iter->second;
    }

    std::string ElementNavigation::mostFrequentDestination() const {
        std::string best;
        int bestCount = 0;
        for (const auto &destination: this->_destinations) {
            if (destination.second > bestCount) {
                bestCount = destination.second;
                best = destination.first;
            }
        }
        return best;
    }

    NavigationGraph::NavigationGraph() = default;

    // split "SignInActivity", "sign_in" and "Sign in" alike into " sign in activity "
    static std::string normalizeWords(const std::string &text) {
        std::string words = " ";
        char previous = ' ';
        for (char c: text) {
            unsigned char uc = static_cast<unsigned char>(c);
            if (std::isalnum(uc)) {
                if (std::isupper(uc) && std::islower(static_cast<unsigned char>(previous)))
                    words.push_back(' ');
                words.push_back(static_cast<char>(std::tolower(uc)));
            } else if (words.back() != ' ') {
                words.push_back(' ');
            }
            previous = c;
        }
        if (words.back() != ' ')
            words.push_back(' ');
        return words;
    }

    bool NavigationGraph::matchesBlockerPattern(const std::string &text, const stringVec &patterns) {
        std::string words = normalizeWords(text);
        if (words.size() <= 1)
            return false;
        for (const auto &pattern: patterns) {
            std::string normalizedPattern = normalizeWords(pattern);
            if (normalizedPattern.size() <= 1)
                continue;
            if (words.find(normalizedPattern) != std::string::npos)
                return true;
        }
        return false;
    }

    bool NavigationGraph::isBlockerScreen(const Screen &screen, const stringVec &patterns) {
        if (matchesBlockerPattern(screen.getActivity(), patterns))
            return true;
        for (const auto &input: screen.getInputs()) {
            if (input.isPassword)
                return true;
        }
        int hits = 0;
        for (const auto &text: screen.getTexts()) {
            if (matchesBlockerPattern(text.text, patterns))
                hits++;
        }
        return hits >= 2;
    }

    bool NavigationGraph::addScreen(const ScreenPtr &screen, const stringVec &blockerPatterns) {
        if (!screen)
            return false;
        const std::string &screenId = screen->getId();
        if (this->_screens.find(screenId) != this->_screens.end())
            return false;
        this->_screens.insert(screenId);
        bool blocker = isBlockerScreen(*screen, blockerPatterns);
        if (blocker) {
            this->_blockers.insert(screenId);
            screen->setBlocker(true);
            BLOG("screen %s (%s) classified as blocker", screenId.c_str(), screen->getActivity().c_str());
        }
        for (const auto &listener: this->_listeners) {
            listener->onAddScreen(screenId, blocker);
        }
        return true;
    }

    void NavigationGraph::recordTransition(const std::string &fromScreen, const std::string &elementId,
                                           const std::string &toScreen) {
        if (fromScreen.empty() || toScreen.empty()) {
            BLOGE("%s", "ignore transition with an empty endpoint");
            return;
        }
        this->_screens.insert(fromScreen);
        this->_screens.insert(toScreen);
        ElementNavigation &navigation = this->_edges[fromScreen][elementId];
        bool wasConditional = navigation.isConditional();
        navigation.recordDestination(toScreen);
        BDLOG("transition %s -[%s]-> %s (%d)", fromScreen.c_str(), elementId.c_str(), toScreen.c_str(),
              navigation.occurrencesOf(toScreen));
        if (!wasConditional && navigation.isConditional()) {
            BLOG("element %s on %s is conditional, %zu destinations", elementId.c_str(), fromScreen.c_str(),
                 navigation.getDestinations().size());
            for (const auto &listener: this->_listeners) {
                listener->onConditionalEdge(fromScreen, elementId);
            }
        }
    }

    bool NavigationGraph::hasScreen(const std::string &screenId) const {
        return this->_screens.find(screenId) != this->_screens.end();
    }

    bool NavigationGraph::isBlocker(const std::string &screenId) const {
        return this->_blockers.find(screenId) != this->_blockers.end();
    }

    bool NavigationGraph::findPath(const std::string &from, const std::string &to, NavigationPath &path) const {
        path.clear();
        if (!this->hasScreen(from) || !this->hasScreen(to) || this->isBlocker(to))
            return false;
        if (from == to)
            return true;

        // screen -> (previous screen, trigger element)
        std::map<std::string, PathStep> parents;
        std::set<std::string> seen;
        std::deque<std::string> frontier;
        frontier.push_back(from);
        seen.insert(from);
        bool found = false;
        while (!frontier.empty() && !found) {
            std::string current = frontier.front();
            frontier.pop_front();
            auto edges = this->_edges.find(current);
            if (edges == this->_edges.end())
                continue;
            for (const auto &elementEdge: edges->second) {
                for (const auto &destination: elementEdge.second.getDestinations()) {
                    const std::string &next = destination.first;
                    if (seen.find(next) != seen.end())
                        continue;
                    seen.insert(next);
                    parents[next] = PathStep{current, elementEdge.first};
                    if (next == to) {
                        found = true;
                        break;
                    }
                    frontier.push_back(next);
                }
                if (found)
                    break;
            }
        }
        if (!found)
            return false;

        for (std::string cursor = to; cursor != from;) {
            const PathStep &step = parents[cursor];
            path.push_back(step);
            cursor = step.screenId;
        }
        std::reverse(path.begin(), path.end());
        return true;
    }

    double NavigationGraph::edgeReliability(const std::string &fromScreen, const std::string &elementId,
                                            const std::string &toScreen) const {
        const ElementNavigation *navigation = this->getNavigation(fromScreen, elementId);
        if (!navigation || navigation->totalOccurrences() == 0)
            return NavigationConstants::DefaultReliability;
        double reliability = static_cast<double>(navigation->occurrencesOf(toScreen))
                             / static_cast<double>(navigation->totalOccurrences());
        reliability += std::min(NavigationConstants::MaxOccurrenceBonus,
                                NavigationConstants::OccurrenceBonusPerTap * navigation->totalOccurrences());
        if (navigation->isConditional())
            reliability -= NavigationConstants::ConditionalPenalty;
        if (this->isBlocker(toScreen))
            reliability -= NavigationConstants::BlockerPenalty;
        return std::max(NavigationConstants::MinReliability, std::min(NavigationConstants::MaxReliability, reliability));
    }

    bool NavigationGraph::findOptimalPath(const std::string &from, const std::string &to,
                                          NavigationPath &path) const {
        path.clear();
        if (!this->hasScreen(from) || !this->hasScreen(to) || this->isBlocker(to))
            return false;
        if (from == to)
            return true;

        typedef std::pair<double, std::string> CostEntry;
        std::priority_queue<CostEntry, std::vector<CostEntry>, std::greater<CostEntry>> open;
        std::map<std::string, double> costs;
        std::map<std::string, PathStep> parents;
        costs[from] = 0.0;
        open.push(std::make_pair(0.0, from));
        while (!open.empty()) {
            CostEntry entry = open.top();
            open.pop();
            const std::string &current = entry.second;
            if (entry.first > costs[current])
                continue;
            if (current == to)
                break;
            auto edges = this->_edges.find(current);
            if (edges == this->_edges.end())
                continue;
            for (const auto &elementEdge: edges->second) {
                for (const auto &destination: elementEdge.second.getDestinations()) {
                    const std::string &next = destination.first;
                    if (next == current)
                        continue;
                    double stepCost = 1.0 - this->edgeReliability(current, elementEdge.first, next)
                                      + NavigationConstants::BaseEdgeCost;
                    double candidate = entry.first + stepCost;
                    auto known = costs.find(next);
                    if (known == costs.end() || candidate < known->second) {
                        costs[next] = candidate;
                        parents[next] = PathStep{current, elementEdge.first};
                        open.push(std::make_pair(candidate, next));
                    }
                }
            }
        }
        if (parents.find(to) == parents.end())
            return false;

        for (std::string cursor = to; cursor != from;) {
            const PathStep &step = parents[cursor];
            path.push_back(step);
            cursor = step.screenId;
        }
        std::reverse(path.begin(), path.end());
        return true;
    }

    std::set<std::string> NavigationGraph::neighbours(const std::string &screenId) const {
        std::set<std::string> result;
        auto edges = this->_edges.find(screenId);
        if (edges == this->_edges.end())
            return result;
        for (const auto &elementEdge: edges->second) {
            for (const auto &destination: elementEdge.second.getDestinations()) {
                if (destination.first != screenId)
                    result.insert(destination.first);
            }
        }
        return result;
    }

    const ElementNavigation *NavigationGraph::getNavigation(const std::string &fromScreen,
                                                            const std::string &elementId) const {
        auto edges = this->_edges.find(fromScreen);
        if (edges == this->_edges.end())
            return nullptr;
        auto navigation = edges->second.find(elementId);
        if (navigation == edges->second.end())
            return nullptr;
        return &navigation->second;
    }

    std::vector<PathStep> NavigationGraph::conditionalEdges() const {
        std::vector<PathStep> result;
        for (const auto &screenEdges: this->_edges) {
            for (const auto &elementEdge: screenEdges.second) {
                if (elementEdge.second.isConditional())
                    result.push_back(PathStep{screenEdges.first, elementEdge.first});
            }
        }
        return result;
    }

    std::map<std::string, int> NavigationGraph::destinationsOf(const std::string &screenId) const {
        std::map<std::string, int> result;
        auto edges = this->_edges.find(screenId);
        if (edges == this->_edges.end())
            return result;
        for (const auto &elementEdge: edges->second) {
            for (const auto &destination: elementEdge.second.getDestinations()) {
                result[destination.first] += destination.second;
            }
        }
        return result;
    }

    size_t NavigationGraph::edgeCount() const {
        size_t count = 0;
        for (const auto &screenEdges: this->_edges) {
            for (const auto &elementEdge: screenEdges.second) {
                count += elementEdge.second.getDestinations().size();
            }
        }
        return count;
    }

    void NavigationGraph::addListener(const NavigationGraphListenerPtr &listener) {
        if (listener)
            this->_listeners.push_back(listener);
    }

    std::string NavigationGraph::toJson() const {
        nlohmann::json j;
        j["screens"] = this->_screens;
        j["blockers"] = this->_blockers;
        nlohmann::json edges = nlohmann::json::array();
        for (const auto &screenEdges: this->_edges) {
            for (const auto &elementEdge: screenEdges.second) {
                nlohmann::json edge;
                edge["from"] = screenEdges.first;
                edge["element"] = elementEdge.first;
                edge["destinations"] = elementEdge.second.getDestinations();
                edge["conditional"] = elementEdge.second.isConditional();
                edges.push_back(edge);
            }
        }
        j["edges"] = edges;
        return j.dump();
    }

}

#endif //NavigationGraph_CPP_
