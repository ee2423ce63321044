/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef StuckRecovery_CPP_
#define StuckRecovery_CPP_

#include "StuckRecovery.h"
#include "../utils.hpp"

namespace scoutbot {

    StalenessTracker::StalenessTracker(int stuckThreshold, int restartThreshold, long plateauMs)
            : _stuckThreshold(stuckThreshold), _restartThreshold(restartThreshold), _plateauMs(plateauMs),
              _count(0), _sinceDiscovery(0), _stale(false), _lastDiscoveryMs(0) {
    }

    int StalenessTracker::recordNoProgress(const std::string &screenId) {
        if (screenId != this->_screenId) {
            this->_screenId = screenId;
            this->_count = 1;
        } else {
            this->_count++;
        }
        this->_sinceDiscovery++;
        this->_stale = true;
        BDLOG("no progress on %s, staleness %d/%d", screenId.c_str(), this->_count, this->_stuckThreshold);
        return this->_count;
    }

    void StalenessTracker::recordDiscovery(const std::string &screenId, long nowMs) {
        this->_screenId = screenId;
        this->_count = 1;
        this->_sinceDiscovery = 0;
        this->_stale = false;
        this->_lastDiscoveryMs = nowMs;
    }

    void StalenessTracker::reset(long nowMs) {
        this->_count = 0;
        this->_stale = false;
        this->_screenId.clear();
        this->_lastDiscoveryMs = nowMs;
    }

    bool StalenessTracker::hasPlateaued(long nowMs) const {
        return this->_plateauMs > 0 && this->_stale && nowMs - this->_lastDiscoveryMs >= this->_plateauMs;
    }

    bool StalenessTracker::isStuck(long nowMs) const {
        return this->_count >= this->_stuckThreshold || this->hasPlateaued(nowMs);
    }

    const char *recoveryLevelName(RecoveryLevel level) {
        switch (level) {
            case RecoveryLevel::Scroll:
                return "scroll";
            case RecoveryLevel::Back:
                return "back";
            case RecoveryLevel::NavigationTab:
                return "navigation_tab";
            case RecoveryLevel::Restart:
                return "restart";
            case RecoveryLevel::HumanHelp:
                return "human_help";
            case RecoveryLevel::Exhausted:
                return "exhausted";
        }
        return "exhausted";
    }

    const char *recoveryResultName(RecoveryResult result) {
        switch (result) {
            case RecoveryResult::Succeeded:
                return "succeeded";
            case RecoveryResult::Failed:
                return "failed";
            case RecoveryResult::Exhausted:
                return "exhausted";
            case RecoveryResult::RunFatal:
                return "run_fatal";
        }
        return "failed";
    }

    double LevelStatistics::successRate() const {
        if (this->attempts <= 0)
            return 0.0;
        return static_cast<double>(this->successes) / static_cast<double>(this->attempts);
    }

    StuckRecovery::StuckRecovery(int maxRestarts, long humanHelpWaitMs)
            : _maxRestarts(maxRestarts), _humanHelpWaitMs(humanHelpWaitMs), _inEpisode(false),
              _level(RecoveryLevel::Scroll), _levelAttempts(0), _restarts(0), _episodes(0) {
    }

    void StuckRecovery::beginEpisode(bool startAtRestart) {
        this->_inEpisode = true;
        this->_episodes++;
        this->_levelAttempts = 0;
        this->_level = startAtRestart ? RecoveryLevel::Restart : RecoveryLevel::Scroll;
        BLOG("stuck recovery episode %d starts at %s", this->_episodes, recoveryLevelName(this->_level));
    }

    void StuckRecovery::escalate() {
        this->_levelAttempts = 0;
        this->_level = static_cast<RecoveryLevel>(static_cast<int>(this->_level) + 1);
        if (this->_level != RecoveryLevel::Exhausted)
            BLOG("stuck recovery escalates to %s", recoveryLevelName(this->_level));
    }

    bool StuckRecovery::runLevel(RecoveryLevel level, RecoveryActions &actions) {
        switch (level) {
            case RecoveryLevel::Scroll:
                return actions.scrollNearestContainer();
            case RecoveryLevel::Back:
                return actions.navigateBack();
            case RecoveryLevel::NavigationTab:
                return actions.tapNavigationEntry();
            case RecoveryLevel::Restart:
                this->_restarts++;
                return actions.restartApp();
            case RecoveryLevel::HumanHelp:
                return actions.requestHumanHelp(this->_humanHelpWaitMs);
            case RecoveryLevel::Exhausted:
                break;
        }
        return false;
    }

    RecoveryOutcome StuckRecovery::attempt(RecoveryActions &actions) {
        RecoveryOutcome outcome;
        if (!this->_inEpisode)
            this->beginEpisode(false);
        outcome.level = this->_level;

        if (this->_level == RecoveryLevel::Restart && this->_restarts >= this->_maxRestarts) {
            BLOGE("restart limit %d reached, cannot recover", this->_maxRestarts);
            this->_inEpisode = false;
            outcome.result = RecoveryResult::RunFatal;
            return outcome;
        }
        if (this->_level == RecoveryLevel::Exhausted) {
            this->_inEpisode = false;
            outcome.result = RecoveryResult::Exhausted;
            return outcome;
        }

        LevelStatistics &statistics = this->_statistics[this->_level];
        statistics.attempts++;
        bool success = this->runLevel(this->_level, actions);
        BLOG("recovery level %s %s", recoveryLevelName(this->_level), success ? "succeeded" : "failed");
        if (success) {
            statistics.successes++;
            this->_inEpisode = false;
            outcome.result = RecoveryResult::Succeeded;
            return outcome;
        }

        this->_levelAttempts++;
        if (this->_levelAttempts >= RecoveryConstants::AttemptsPerLevel)
            this->escalate();
        if (this->_level == RecoveryLevel::Exhausted) {
            BLOG("stuck recovery ladder exhausted");
            this->_inEpisode = false;
            outcome.result = RecoveryResult::Exhausted;
            return outcome;
        }
        outcome.result = RecoveryResult::Failed;
        return outcome;
    }

    RecoveryLevel StuckRecovery::recommendedLevel() const {
        RecoveryLevel best = RecoveryLevel::Exhausted;
        double bestRate = -1.0;
        for (const auto &entry: this->_statistics) {
            if (entry.second.attempts < RecoveryConstants::MinAttemptsForRecommendation)
                continue;
            if (entry.second.successRate() > bestRate) {
                best = entry.first;
                bestRate = entry.second.successRate();
            }
        }
        return best;
    }

}

#endif //StuckRecovery_CPP_
