/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef ExplorationState_H_
#define ExplorationState_H_

#include "../Base.h"
#include "../desc/Screen.h"
#include "NavigationGraph.h"
#include "FrontierQueue.h"
#include <string>
#include <vector>
#include <set>
#include <map>

namespace scoutbot {

    enum class IssueType {
        ElementStuck,
        BackFailed,
        AppMinimized,
        AppLeft,
        Timeout,
        ScrollFailed,
        DangerousElement,
        RecoveryFailed,
        BlockerScreen,
        BranchUnreachable,
        CaptureFailed,
        RelaunchLimit
    };

    const char *issueTypeName(IssueType type);

    struct ExplorationIssue {
        IssueType type;
        std::string screenId;
        std::string elementId;
        std::string message;
        long timestampMs;
    };

    enum class RunStatus {
        NotStarted,
        Running,
        Paused,
        Completed,
        Stopped,
        Error
    };

    const char *runStatusName(RunStatus status);

    /**
     * @brief Membership test for the visited composite keys
     */
    class VisitedView {
    public:
        virtual bool isVisited(const std::string &compositeKey) const = 0;

        virtual ~VisitedView() = default;
    };

    /**
     * @brief The mutable aggregate of one run
     *
     * Owned by the Explorer; other components only see the narrow views
     * (VisitedView, QueueAppender, NavigationGraphView). The visited set only
     * grows while a pass runs.
     */
    class ExplorationState : public VisitedView {
    public:
        explicit ExplorationState(std::string targetPackage);

        const std::string &getTargetPackage() const { return this->_targetPackage; }

        ScreenPtrMap &screens() { return this->_screens; }

        const ScreenPtrMap &screens() const { return this->_screens; }

        ScreenPtr getScreen(const std::string &screenId) const;

        /// @return false if the composite key was already visited
        bool markVisited(const std::string &compositeKey);

        bool isVisited(const std::string &compositeKey) const override;

        size_t visitedCount() const { return this->_visited.size(); }

        const std::set<std::string> &visitedKeys() const { return this->_visited; }

        FrontierQueue &queue() { return this->_queue; }

        const FrontierQueue &queue() const { return this->_queue; }

        NavigationGraph &graph() { return this->_graph; }

        const NavigationGraph &graph() const { return this->_graph; }

        void addIssue(IssueType type, const std::string &screenId, const std::string &elementId,
                      const std::string &message, long timestampMs);

        const std::vector<ExplorationIssue> &issues() const { return this->_issues; }

        size_t countIssues(IssueType type) const;

        std::set<std::string> &dangerousPatterns() { return this->_dangerousPatterns; }

        const std::set<std::string> &dangerousPatterns() const { return this->_dangerousPatterns; }

        /// screens whose remaining targets can never be reached in this pass
        void markUnreachable(const std::string &screenId) { this->_unreachable.insert(screenId); }

        bool isUnreachable(const std::string &screenId) const;

        int getPassNumber() const { return this->_passNumber; }

        /**
         * @brief Start another sweep: keeps screens, graph and learned patterns,
         * clears the visited set, queue and explored flags
         */
        void beginNextPass();

        const std::string &getCurrentScreenId() const { return this->_currentScreenId; }

        void setCurrentScreenId(const std::string &screenId) { this->_currentScreenId = screenId; }

        const std::string &getHomeScreenId() const { return this->_homeScreenId; }

        void setHomeScreenId(const std::string &screenId) { this->_homeScreenId = screenId; }

        RunStatus getStatus() const { return this->_status; }

        void setStatus(RunStatus status) { this->_status = status; }

        long getStartMs() const { return this->_startMs; }

        void setStartMs(long startMs) { this->_startMs = startMs; }

        long getLastDiscoveryMs() const { return this->_lastDiscoveryMs; }

        void setLastDiscoveryMs(long stamp) { this->_lastDiscoveryMs = stamp; }

        int getActionsTaken() const { return this->_actionsTaken; }

        void increaseActionsTaken() { this->_actionsTaken++; }

        int getRestarts() const { return this->_restarts; }

        void increaseRestarts() { this->_restarts++; }

        int getBacktracks() const { return this->_backtracks; }

        void increaseBacktracks() { this->_backtracks++; }

        size_t elementCount() const;

    private:
        std::string _targetPackage;
        ScreenPtrMap _screens;
        std::set<std::string> _visited;
        FrontierQueue _queue;
        NavigationGraph _graph;
        std::vector<ExplorationIssue> _issues;
        std::set<std::string> _dangerousPatterns;
        std::set<std::string> _unreachable;
        int _passNumber;
        std::string _currentScreenId;
        std::string _homeScreenId;
        RunStatus _status;
        long _startMs;
        long _lastDiscoveryMs;
        int _actionsTaken;
        int _restarts;
        int _backtracks;
    };

}

#endif //ExplorationState_H_
