/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef  NavigationGraph_H_
#define  NavigationGraph_H_

#include "../Base.h"
#include "../desc/Screen.h"
#include <map>
#include <set>
#include <vector>
#include <string>

namespace scoutbot {

    /**
     * @brief One hop of a path: on screen screenId, activate elementId
     */
    struct PathStep {
        std::string screenId;
        std::string elementId;

        bool operator==(const PathStep &other) const {
            return screenId == other.screenId && elementId == other.elementId;
        }
    };

    typedef std::vector<PathStep> NavigationPath;

    /**
     * @brief Everything observed about one trigger element
     *
     * Every destination the element ever led to is kept with its occurrence
     * count; an element with more than one destination is conditional.
     */
    class ElementNavigation {
    public:
        ElementNavigation();

        void recordDestination(const std::string &screenId);

        const std::map<std::string, int> &getDestinations() const { return this->_destinations; }

        int occurrencesOf(const std::string &screenId) const;

        int totalOccurrences() const { return this->_total; }

        bool isConditional() const { return this->_destinations.size() > 1; }

        /// the destination seen most often, ties broken by screen id order
        std::string mostFrequentDestination() const;

    private:
        std::map<std::string, int> _destinations;
        int _total;
    };

    /**
     * @brief Interface for objects interested in graph growth
     */
    class NavigationGraphListener {
    public:
        virtual void onAddScreen(const std::string &screenId, bool blocker) = 0;

        virtual void onConditionalEdge(const std::string &fromScreen, const std::string &elementId) = 0;

        virtual ~NavigationGraphListener() = default;
    };

    typedef std::shared_ptr<NavigationGraphListener> NavigationGraphListenerPtr;

    /**
     * @brief Read-only queries over the navigation graph
     *
     * Components that plan routes get this view; only the Explorer records
     * transitions.
     */
    class NavigationGraphView {
    public:
        virtual bool hasScreen(const std::string &screenId) const = 0;

        virtual bool isBlocker(const std::string &screenId) const = 0;

        /**
         * @brief Unweighted shortest path by breadth first search
         *
         * @param from screen the path starts on
         * @param to wanted destination; blocker screens are never returned as destination
         * @param path receives the steps; empty when from == to
         * @return false when there is no path, including unknown screens
         */
        virtual bool findPath(const std::string &from, const std::string &to, NavigationPath &path) const = 0;

        /**
         * @brief Path through the most reliably reproduced transitions (Dijkstra,
         * cost = 1 - reliability)
         */
        virtual bool findOptimalPath(const std::string &from, const std::string &to,
                                     NavigationPath &path) const = 0;

        /// screens reachable with one step from screenId
        virtual std::set<std::string> neighbours(const std::string &screenId) const = 0;

        virtual ~NavigationGraphView() = default;
    };

    class NavigationGraph : public NavigationGraphView {
    public:
        NavigationGraph();

        /**
         * @brief Register a screen; classifies it as blocker on first sight
         *
         * @return true if the screen was not known before
         */
        bool addScreen(const ScreenPtr &screen, const stringVec &blockerPatterns);

        /**
         * @brief Record that activating elementId on fromScreen led to toScreen
         *
         * Increments the occurrence count of that destination; an element that
         * reaches a second destination becomes conditional and keeps both.
         */
        void recordTransition(const std::string &fromScreen, const std::string &elementId,
                              const std::string &toScreen);

        bool hasScreen(const std::string &screenId) const override;

        bool isBlocker(const std::string &screenId) const override;

        bool findPath(const std::string &from, const std::string &to, NavigationPath &path) const override;

        bool findOptimalPath(const std::string &from, const std::string &to,
                             NavigationPath &path) const override;

        std::set<std::string> neighbours(const std::string &screenId) const override;

        /**
         * @brief Reliability of reaching toScreen through (fromScreen, elementId)
         *
         * share of occurrences that reached toScreen, + min(0.2, 0.02 * occurrences),
         * - 0.1 if conditional, - 0.3 if toScreen is a blocker, clamped to [0.1, 1].
         * Unknown edges report 0.5.
         */
        double edgeReliability(const std::string &fromScreen, const std::string &elementId,
                               const std::string &toScreen) const;

        const ElementNavigation *getNavigation(const std::string &fromScreen, const std::string &elementId) const;

        /// (screen, element) pairs that led to more than one destination
        std::vector<PathStep> conditionalEdges() const;

        /// every screen any element of screenId led to, with summed occurrences
        std::map<std::string, int> destinationsOf(const std::string &screenId) const;

        size_t screenCount() const { return this->_screens.size(); }

        size_t edgeCount() const;

        void addListener(const NavigationGraphListenerPtr &listener);

        std::string toJson() const;

        /// word-level match; camelCase and snake_case are split into words first
        static bool matchesBlockerPattern(const std::string &text, const stringVec &patterns);

        /**
         * @brief Credential/authentication classifier
         *
         * A screen is a blocker when its activity name matches a pattern, when it
         * has a password field, or when at least two of its texts match.
         */
        static bool isBlockerScreen(const Screen &screen, const stringVec &patterns);

    private:
        typedef std::map<std::string, ElementNavigation> ElementNavigationMap;

        std::set<std::string> _screens;
        std::set<std::string> _blockers;
        std::map<std::string, ElementNavigationMap> _edges;
        std::vector<NavigationGraphListenerPtr> _listeners;
    };

    typedef std::shared_ptr<NavigationGraph> NavigationGraphPtr;
}

#endif //NavigationGraph_H_
