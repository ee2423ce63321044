/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef ExplorationState_CPP_
#define ExplorationState_CPP_

#include "ExplorationState.h"
#include "../utils.hpp"
#include <utility>

namespace scoutbot {

    const char *issueTypeName(IssueType type) {
        switch (type) {
            case IssueType::ElementStuck:
                return "element_stuck";
            case IssueType::BackFailed:
                return "back_failed";
            case IssueType::AppMinimized:
                return "app_minimized";
            case IssueType::AppLeft:
                return "app_left";
            case IssueType::Timeout:
                return "timeout";
            case IssueType::ScrollFailed:
                return "scroll_failed";
            case IssueType::DangerousElement:
                return "dangerous_element";
            case IssueType::RecoveryFailed:
                return "recovery_failed";
            case IssueType::BlockerScreen:
                return "blocker_screen";
            case IssueType::BranchUnreachable:
                return "branch_unreachable";
            case IssueType::CaptureFailed:
                return "capture_failed";
            case IssueType::RelaunchLimit:
                return "relaunch_limit";
        }
        return "unknown";
    }

    const char *runStatusName(RunStatus status) {
        switch (status) {
            case RunStatus::NotStarted:
                return "not_started";
            case RunStatus::Running:
                return "running";
            case RunStatus::Paused:
                return "paused";
            case RunStatus::Completed:
                return "completed";
            case RunStatus::Stopped:
                return "stopped";
            case RunStatus::Error:
                return "error";
        }
        return "unknown";
    }

    ExplorationState::ExplorationState(std::string targetPackage)
            : _targetPackage(std::move(targetPackage)), _passNumber(1), _status(RunStatus::NotStarted),
              _startMs(0), _lastDiscoveryMs(0), _actionsTaken(0), _restarts(0), _backtracks(0) {
    }

    ScreenPtr ExplorationState::getScreen(const std::string &screenId) const {
        auto iter = this->_screens.find(screenId);
        if (iter == this->_screens.end())
            return nullptr;
        return iter->second;
    }

    bool ExplorationState::markVisited(const std::string &compositeKey) {
        return this->_visited.insert(compositeKey).second;
    }

    bool ExplorationState::isVisited(const std::string &compositeKey) const {
        return this->_visited.find(compositeKey) != this->_visited.end();
    }

    void ExplorationState::addIssue(IssueType type, const std::string &screenId, const std::string &elementId,
                                    const std::string &message, long timestampMs) {
        BLOG("issue %s on %s:%s %s", issueTypeName(type), screenId.c_str(), elementId.c_str(), message.c_str());
        this->_issues.push_back(ExplorationIssue{type, screenId, elementId, message, timestampMs});
    }

    size_t ExplorationState::countIssues(IssueType type) const {
        size_t count = 0;
        for (const auto &issue: this->_issues) {
            if (issue.type == type)
                count++;
        }
        return count;
    }

    bool ExplorationState::isUnreachable(const std::string &screenId) const {
        return this->_unreachable.find(screenId) != this->_unreachable.end();
    }

    void ExplorationState::beginNextPass() {
        this->_passNumber++;
        this->_visited.clear();
        this->_queue.clear();
        this->_unreachable.clear();
        for (const auto &screen: this->_screens) {
            for (const auto &element: screen.second->getClickables()) {
                element->setExplored(false);
            }
            for (const auto &container: screen.second->getScrollables()) {
                container->resetScrolling();
            }
        }
        BLOG("begin pass %d, %zu known screens", this->_passNumber, this->_screens.size());
    }

    size_t ExplorationState::elementCount() const {
        size_t count = 0;
        for (const auto &screen: this->_screens) {
            count += screen.second->getClickables().size();
        }
        return count;
    }

}

#endif //ExplorationState_CPP_
