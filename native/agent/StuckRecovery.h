/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef StuckRecovery_H_
#define StuckRecovery_H_

#include <map>
#include <string>
#include <memory>

namespace scoutbot {

    /**
     * @brief The one staleness signal of a run
     *
     * Counts consecutive actions without any discovery. The count restarts at
     * 1 when the no-progress observation is made on a different screen id than
     * the previous one, and on any discovery it restarts at 1 bound to the
     * screen the discovery was made on. Besides the count, a
     * time plateau (no discovery for plateauMs) also reports stuck. Actions
     * since the last discovery are counted separately; recoveries do not reset
     * them, and they decide when a recovery has to begin with a restart.
     */
    class StalenessTracker {
    public:
        StalenessTracker(int stuckThreshold, int restartThreshold, long plateauMs);

        /// @return the counter after the observation
        int recordNoProgress(const std::string &screenId);

        /// a new screen or new elements were found; screenId is where the app is now
        void recordDiscovery(const std::string &screenId, long nowMs);

        /// forget the counter, e.g. after a successful recovery
        void reset(long nowMs);

        int getCount() const { return this->_count; }

        const std::string &getScreenId() const { return this->_screenId; }

        bool isStuck(long nowMs) const;

        int getSinceDiscovery() const { return this->_sinceDiscovery; }

        /// the harder threshold at which recovery starts at the restart level
        bool needsRestart() const { return this->_sinceDiscovery >= this->_restartThreshold; }

        bool hasPlateaued(long nowMs) const;

        int getStuckThreshold() const { return this->_stuckThreshold; }

    private:
        int _stuckThreshold;
        int _restartThreshold;
        long _plateauMs;
        int _count;
        int _sinceDiscovery;
        /// a no-progress action was seen since the last discovery or reset
        bool _stale;
        std::string _screenId;
        long _lastDiscoveryMs;
    };

    enum class RecoveryLevel {
        Scroll,
        Back,
        NavigationTab,
        Restart,
        HumanHelp,
        Exhausted
    };

    const char *recoveryLevelName(RecoveryLevel level);

    enum class RecoveryResult {
        Succeeded,
        /// this attempt failed, the ladder continues
        Failed,
        /// every level was tried; the branch is unreachable
        Exhausted,
        /// restart budget used up, the run has to end
        RunFatal
    };

    const char *recoveryResultName(RecoveryResult result);

    /**
     * @brief The device side of every ladder level, implemented by the Explorer
     *
     * Each call performs the gesture, re-observes and reports whether progress
     * was made.
     */
    class RecoveryActions {
    public:
        /// scroll the nearest scrollable container; true if it revealed something
        virtual bool scrollNearestContainer() = 0;

        /// true if back led to another screen of the target app
        virtual bool navigateBack() = 0;

        /// tap a primary navigation entry that was not tapped before
        virtual bool tapNavigationEntry() = 0;

        /// relaunch the app cleanly and resume from its home screen
        virtual bool restartApp() = 0;

        /// ask a person for help and wait at most waitMs for the screen to change
        virtual bool requestHumanHelp(long waitMs) = 0;

        virtual ~RecoveryActions() = default;
    };

    struct LevelStatistics {
        int attempts = 0;
        int successes = 0;

        double successRate() const;
    };

    struct RecoveryOutcome {
        RecoveryLevel level = RecoveryLevel::Scroll;
        RecoveryResult result = RecoveryResult::Failed;
    };

    namespace RecoveryConstants {
        constexpr int AttemptsPerLevel = 2;
        /// attempts a level needs before its history is trusted
        constexpr int MinAttemptsForRecommendation = 3;
    }

    /**
     * @brief Escalating recovery ladder: scroll, back, navigation tab, restart,
     * human help
     *
     * One episode runs from stuck detection to success or exhaustion. A level
     * is retried at most AttemptsPerLevel times before escalating. Learned
     * state is never touched here; the caller decides what a result means.
     */
    class StuckRecovery {
    public:
        StuckRecovery(int maxRestarts, long humanHelpWaitMs);

        /**
         * @brief Start a new episode
         *
         * @param startAtRestart begin at the restart level, used when the
         * harder threshold was crossed
         */
        void beginEpisode(bool startAtRestart);

        bool inEpisode() const { return this->_inEpisode; }

        RecoveryLevel currentLevel() const { return this->_level; }

        /// run one attempt of the current level and escalate on failure
        RecoveryOutcome attempt(RecoveryActions &actions);

        /// level with the best success rate among levels with enough attempts, Exhausted if none
        RecoveryLevel recommendedLevel() const;

        const std::map<RecoveryLevel, LevelStatistics> &getStatistics() const { return this->_statistics; }

        int getRestarts() const { return this->_restarts; }

        int getEpisodes() const { return this->_episodes; }

    private:
        bool runLevel(RecoveryLevel level, RecoveryActions &actions);

        void escalate();

        int _maxRestarts;
        long _humanHelpWaitMs;
        bool _inEpisode;
        RecoveryLevel _level;
        int _levelAttempts;
        int _restarts;
        int _episodes;
        std::map<RecoveryLevel, LevelStatistics> _statistics;
    };

    typedef std::shared_ptr<StuckRecovery> StuckRecoveryPtr;

}

#endif //StuckRecovery_H_
