/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef PolicyAgent_H_
#define PolicyAgent_H_

#include "../Base.h"
#include "../desc/Screen.h"
#include "../storage/PolicyStore.h"
#include <string>
#include <vector>
#include <map>
#include <set>
#include <unordered_map>
#include <random>

namespace scoutbot {

    /**
     * @brief Constants of the exploration Q-learning policy
     */
    namespace QLearningConstants {
        // ========== Update Rule ==========
        /// Learning rate (alpha)
        constexpr double Alpha = 0.15;
        /// Discount factor (gamma)
        constexpr double Gamma = 0.9;
        /// Weight of the human feedback signal (beta)
        constexpr double Beta = 0.25;

        // ========== Epsilon Greedy ==========
        constexpr double EpsilonStart = 0.30;
        constexpr double EpsilonMin = 0.05;
        /// epsilon is multiplied by this once per action taken
        constexpr double EpsilonDecay = 0.995;
        /// Upper confidence bound coefficient (c)
        constexpr double UcbCoefficient = 1.5;

        // ========== Rewards ==========
        constexpr double RewardNewScreen = 1.0;
        constexpr double RewardNewElements = 0.5;
        constexpr double RewardBackNavigation = 0.2;
        constexpr double RewardNoChange = -0.1;
        constexpr double RewardClosedApp = -1.5;
        constexpr double RewardCrash = -2.0;
        constexpr double DepthBonusPerLevel = 0.15;
        constexpr double MaxDepthBonus = 0.6;
        constexpr double NoveltyBonus = 0.3;
        constexpr double RevisitPenaltyPerVisit = 0.05;
        constexpr int MaxPenalizedRevisits = 5;

        // ========== Dead Ends ==========
        /// Q below this after DeadEndMinVisits visits is a confirmed dead end
        constexpr double DeadEndThreshold = -0.05;
        constexpr int DeadEndMinVisits = 3;
        /// Q below this after SkipMinVisits visits is never surfaced again
        constexpr double SkipThreshold = -0.08;
        constexpr int SkipMinVisits = 5;
        /// value forced onto every action of a screen marked as dead end
        constexpr double DeadEndScreenValue = -0.5;
        /// selection score of a confirmed dead end
        constexpr double DeadEndSelectionScore = -1000.0;

        // ========== Human Feedback ==========
        constexpr double FeedbackMin = -3.0;
        constexpr double FeedbackMax = 3.0;

        // ========== Priority Boost ==========
        constexpr int DeadEndPriority = -80;
        constexpr double QBoostScale = 40.0;
        constexpr double MaxQBoost = 40.0;
        constexpr double UntriedBonus = 25.0;
        constexpr double FewTriesBonus = 10.0;
        constexpr int FewTries = 2;
        constexpr double UcbBoostScale = 10.0;
        constexpr double MaxUcbBoost = 15.0;
        constexpr double MinBoost = -80.0;
        constexpr double MaxBoost = 60.0;

        // ========== Import ==========
        /// weight of imported values when merging with the local table
        constexpr double ImportedWeight = 0.7;
    }

    /**
     * @brief Observable effect of one action, input of the reward schedule
     */
    enum class TapResult {
        NewScreen,
        NewElements,
        BackNavigation,
        NoChange,
        ClosedApp,
        Crashed
    };

    const char *tapResultName(TapResult result);

    struct TapOutcome {
        TapResult result = TapResult::NoChange;
        /// depth of the destination screen for NewScreen
        int depth = 0;
        /// how often the destination screen was seen before this action
        int priorScreenVisits = 0;
    };

    struct PolicyStatistics {
        long totalUpdates = 0;
        long positiveUpdates = 0;
        long negativeUpdates = 0;
        size_t entries = 0;
        size_t deadEnds = 0;
        size_t dangerousPatterns = 0;
        double averageQ = 0.0;
        double epsilon = 0.0;
        long actionsTaken = 0;
        int restartAttempts = 0;
        int restartSuccesses = 0;
    };

    /**
     * @brief Read-only advice of the policy, used while building the frontier
     */
    class PolicyAdvisor {
    public:
        /// learned contribution to an element's priority, in [-80, 60]
        virtual double priorityBoost(const std::string &stateHash, const std::string &actionKey) const = 0;

        virtual bool isDeadEnd(const std::string &stateHash, const std::string &actionKey) const = 0;

        virtual bool shouldSkip(const std::string &stateHash, const std::string &actionKey) const = 0;

        virtual bool isDangerous(const std::string &actionKey) const = 0;

        virtual ~PolicyAdvisor() = default;
    };

    /**
     * @brief Q-learning policy over (screen state, generalized action) pairs
     *
     * Q <- Q + alpha * (reward + gamma * max Q(s', a') + beta * H(s, a) - Q)
     *
     * The in-memory table is authoritative; every change is written through to
     * the PolicyPersistence, which may save it asynchronously. Unknown pairs
     * read as value 0 and are created on first update.
     */
    class PolicyAgent : public PolicyAdvisor {
    public:
        explicit PolicyAgent(PolicyPersistencePtr store);

        PolicyAgent(PolicyPersistencePtr store, unsigned int seed);

        /// pull the persisted table into memory; returns number of entries
        size_t loadFromStore();

        /**
         * @brief Switch the target package the dangerous patterns belong to
         *
         * The learned values are shared by every target; dangerous patterns
         * are not, so the set of the new target is read from the store.
         */
        void setTarget(const std::string &targetPackage);

        const std::string &getTarget() const { return this->_target; }

        /// xxhash of "activity|sorted element ids", 16 hex characters
        static std::string computeScreenHash(const Screen &screen);

        /// "SimpleClass|resource-pattern|zone"; zone is the top, center or bottom third of the screen
        static std::string computeActionKey(const ClickableElement &element, int screenHeight);

        static std::string makeKey(const std::string &stateHash, const std::string &actionKey);

        double getQValue(const std::string &stateHash, const std::string &actionKey) const;

        int getVisitCount(const std::string &stateHash, const std::string &actionKey) const;

        /// highest Q of any known action of stateHash, 0 if none
        double maxQValue(const std::string &stateHash) const;

        /**
         * @brief Apply one Q-learning update and consume pending feedback
         *
         * @param nextStateHash state observed after the action, empty when the app is gone
         * @return the new value
         */
        double updateQValue(const std::string &stateHash, const std::string &actionKey, double reward,
                            const std::string &nextStateHash);

        double computeReward(const TapOutcome &outcome) const;

        /**
         * @brief Reward, update, and remember actions that closed or crashed the app
         *
         * @return the reward that was applied
         */
        double learn(const std::string &stateHash, const std::string &actionKey, const TapOutcome &outcome,
                     const std::string &nextStateHash);

        void recordImitation(const std::string &stateHash, const std::string &actionKey);

        void recordVeto(const std::string &stateHash, const std::string &actionKey);

        /// signal is clamped to [-1, 1], the accumulated value to [-3, 3]
        void recordHumanFeedback(const std::string &stateHash, const std::string &actionKey, double signal);

        double pendingFeedback(const std::string &stateHash, const std::string &actionKey) const;

        /// max(EpsilonMin, EpsilonStart * EpsilonDecay^actionsTaken)
        double getEpsilon() const;

        void onActionTaken();

        long getActionsTaken() const { return this->_actionsTaken; }

        /// c * sqrt(ln(N_screen) / n_action); 2c for untried actions
        double ucbBonus(const std::string &stateHash, const std::string &actionKey) const;

        /**
         * @brief Epsilon greedy choice among candidate action keys
         *
         * Dangerous and skipped candidates are never chosen. With probability
         * epsilon an untried candidate is drawn uniformly, otherwise the best
         * Q + UCB wins, earliest candidate on ties.
         *
         * @return index into actionKeys, -1 when every candidate is filtered out
         */
        int selectAction(const std::string &stateHash, const std::vector<std::string> &actionKeys);

        double priorityBoost(const std::string &stateHash, const std::string &actionKey) const override;

        bool isDeadEnd(const std::string &stateHash, const std::string &actionKey) const override;

        bool shouldSkip(const std::string &stateHash, const std::string &actionKey) const override;

        bool isDangerous(const std::string &actionKey) const override;

        void markDangerous(const std::string &actionKey);

        void recordScreenVisit(const std::string &stateHash);

        int getScreenVisits(const std::string &stateHash) const;

        /// push every known action of stateHash down to DeadEndScreenValue
        void markScreenAsDeadEnd(const std::string &stateHash);

        void recordRestartRecovery(bool success);

        PolicyStatistics getStatistics() const;

        std::string exportJson() const;

        /**
         * @brief Merge a table exported by exportJson()
         *
         * Known keys become 0.7 imported + 0.3 local; unknown keys are copied.
         *
         * @param merged receives the number of merged entries
         * @return false when the document cannot be parsed
         */
        bool mergeImported(const std::string &jsonContent, size_t &merged);

        bool flush();

        virtual ~PolicyAgent() = default;

    private:
        PolicyEntry &entryFor(const std::string &stateHash, const std::string &actionKey);

        const PolicyEntry *findEntry(const std::string &stateHash, const std::string &actionKey) const;

        void persist(const std::string &stateHash, const std::string &actionKey, const PolicyEntry &entry);

        PolicyPersistencePtr _store;
        std::unordered_map<std::string, PolicyEntry> _table;
        /// state hash -> action keys seen in that state
        std::map<std::string, std::set<std::string>> _stateActions;
        std::map<std::string, int> _screenVisits;
        std::string _target;
        /// dangerous patterns of _target
        std::set<std::string> _dangerous;

        std::mt19937 _rng;
        long _actionsTaken;
        long _totalUpdates;
        long _positiveUpdates;
        long _negativeUpdates;
        int _restartAttempts;
        int _restartSuccesses;
    };

    typedef std::shared_ptr<PolicyAgent> PolicyAgentPtr;

}

#endif //PolicyAgent_H_
