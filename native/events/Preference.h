/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef Preference_H_
#define Preference_H_

#include "../Base.h"
#include <string>
#include <vector>
#include <set>
#include <memory>

namespace scoutbot {

    enum class StrategyType {
        ScreenFirst,
        PriorityBased,
        DepthFirst,
        BreadthFirst,
        Systematic,
        Adaptive
    };

    const char *strategyName(StrategyType type);

    bool parseStrategy(const std::string &name, StrategyType &type);

    enum class ExplorationGoal {
        QuickScan,
        DeepMap,
        CoverageTarget
    };

    const char *goalName(ExplorationGoal goal);

    bool parseGoal(const std::string &name, ExplorationGoal &goal);

    enum class ExplorationMode {
        Quick,
        Normal,
        Deep,
        Manual
    };

    const char *modeName(ExplorationMode mode);

    bool parseMode(const std::string &name, ExplorationMode &mode);

    /**
     * @brief Run options of one exploration
     *
     * All durations are milliseconds. targetCoveragePct is 0..100.
     */
    struct ExplorationConfig {
        StrategyType strategy = StrategyType::Adaptive;
        ExplorationGoal goal = ExplorationGoal::DeepMap;
        ExplorationMode mode = ExplorationMode::Normal;
        int maxDepth = 5;
        int maxScreens = 50;
        int maxElements = 500;
        long maxDurationMs = 10L * 60 * 1000;
        long actionDelayMs = 1000;
        long transitionWaitMs = 2500;
        long scrollDelayMs = 500;
        double targetCoveragePct = 90.0;
        bool stopAtTargetCoverage = true;
        bool backtrackAfterNewScreen = true;
        bool nonDestructive = true;

        int maxLaunchRetries = 3;
        int maxScrollsPerContainer = 5;
        long stabilizationWaitMs = 3000;
        long maxDurationForCoverageMs = 30L * 60 * 1000;
        /// 0 runs passes until the coverage target or until they stop making progress
        int maxPasses = 1;
        int maxActionRetries = 2;
        int stuckThreshold = 5;
        int restartThreshold = 15;
        long plateauMs = 120000;
        long humanHelpWaitMs = 30000;
        std::string policyModelPath;

        static ExplorationConfig forQuickScan();

        static ExplorationConfig forDeepExploration();

        static ExplorationConfig forCoverage(double targetPct);

        /// the time budget that applies to the configured goal
        long effectiveDurationMs() const;
    };

    /**
     * @brief Run-scoped settings: the configuration plus the word lists used by
     * the classifiers
     *
     * One Preference is created per run and handed by reference to the
     * components that need it.
     */
    class Preference {
    public:
        Preference();

        explicit Preference(const ExplorationConfig &config);

        const ExplorationConfig &getConfig() const { return this->_config; }

        ExplorationConfig &mutableConfig() { return this->_config; }

        void setConfig(const ExplorationConfig &config) { this->_config = config; }

        /**
         * @brief Parse a JSON configuration document
         *
         * Unknown keys are ignored; a key holding the wrong type keeps its
         * default and is logged. Optional "dangerousWords", "metaWords",
         * "blockedResourceIds" arrays extend the built-in lists.
         *
         * @return false if the document is not valid JSON
         */
        bool loadConfigJson(const std::string &jsonContent);

        bool loadConfigFile(const std::string &path);

        std::string toJson() const;

        const stringVec &dangerousWords() const { return this->_dangerousWords; }

        const stringVec &metaWords() const { return this->_metaWords; }

        const stringVec &blockerPatterns() const { return this->_blockerPatterns; }

        const stringVec &sensitiveWords() const { return this->_sensitiveWords; }

        const stringVec &systemPackages() const { return this->_systemPackages; }

        const stringVec &backButtonPatterns() const { return this->_backButtonPatterns; }

        const stringVec &navigationWords() const { return this->_navigationWords; }

        bool isBlockedResourceId(const std::string &resourceId) const;

        static std::string loadFileContent(const std::string &fileAbsolutePath);

    private:
        ExplorationConfig _config;

        stringVec _dangerousWords;
        stringVec _metaWords;
        stringVec _blockerPatterns;
        stringVec _sensitiveWords;
        stringVec _systemPackages;
        stringVec _backButtonPatterns;
        stringVec _navigationWords;
        std::set<std::string> _blockedResourceIds;
    };

    typedef std::shared_ptr<Preference> PreferencePtr;

}

#endif //Preference_H_
