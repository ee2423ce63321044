/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#include <fstream>
#include <sstream>
#include <algorithm>
#include "../utils.hpp"
#include "Preference.h"
#include <nlohmann/json.hpp>

namespace scoutbot {

    namespace {
        template<class T>
        T getJsonValue(const nlohmann::json &data, const char *key, const T &defaultValue) {
            auto iter = data.find(key);
            if (iter == data.end() || iter->is_null())
                return defaultValue;
            try {
                return iter->get<T>();
            } catch (nlohmann::json::exception &ex) {
                BLOGE("config key %s has a wrong type, keep default: %s", key, ex.what());
            }
            return defaultValue;
        }

        void appendWords(const nlohmann::json &data, const char *key, stringVec &words) {
            auto iter = data.find(key);
            if (iter == data.end() || !iter->is_array())
                return;
            for (const auto &word: *iter) {
                if (!word.is_string())
                    continue;
                std::string lower = toLowerCase(word.get<std::string>());
                if (std::find(words.begin(), words.end(), lower) == words.end())
                    words.push_back(lower);
            }
        }
    }

    const char *strategyName(StrategyType type) {
        switch (type) {
            case StrategyType::ScreenFirst:
                return "screen_first";
            case StrategyType::PriorityBased:
                return "priority";
            case StrategyType::DepthFirst:
                return "depth_first";
            case StrategyType::BreadthFirst:
                return "breadth_first";
            case StrategyType::Systematic:
                return "systematic";
            case StrategyType::Adaptive:
                return "adaptive";
        }
        return "adaptive";
    }

    bool parseStrategy(const std::string &name, StrategyType &type) {
        static const StrategyType all[] = {StrategyType::ScreenFirst, StrategyType::PriorityBased,
                                           StrategyType::DepthFirst, StrategyType::BreadthFirst,
                                           StrategyType::Systematic, StrategyType::Adaptive};
        std::string lower = toLowerCase(name);
        for (StrategyType candidate: all) {
            if (lower == strategyName(candidate)) {
                type = candidate;
                return true;
            }
        }
        return false;
    }

    const char *goalName(ExplorationGoal goal) {
        switch (goal) {
            case ExplorationGoal::QuickScan:
                return "quick_scan";
            case ExplorationGoal::DeepMap:
                return "deep_map";
            case ExplorationGoal::CoverageTarget:
                return "coverage_target";
        }
        return "deep_map";
    }

    bool parseGoal(const std::string &name, ExplorationGoal &goal) {
        std::string lower = toLowerCase(name);
        if (lower == "quick_scan") {
            goal = ExplorationGoal::QuickScan;
        } else if (lower == "deep_map") {
            goal = ExplorationGoal::DeepMap;
        } else if (lower == "coverage_target" || lower == "complete_coverage") {
            goal = ExplorationGoal::CoverageTarget;
        } else {
            return false;
        }
        return true;
    }

    const char *modeName(ExplorationMode mode) {
        switch (mode) {
            case ExplorationMode::Quick:
                return "quick";
            case ExplorationMode::Normal:
                return "normal";
            case ExplorationMode::Deep:
                return "deep";
            case ExplorationMode::Manual:
                return "manual";
        }
        return "normal";
    }

    bool parseMode(const std::string &name, ExplorationMode &mode) {
        std::string lower = toLowerCase(name);
        if (lower == "quick") {
            mode = ExplorationMode::Quick;
        } else if (lower == "normal") {
            mode = ExplorationMode::Normal;
        } else if (lower == "deep") {
            mode = ExplorationMode::Deep;
        } else if (lower == "manual") {
            mode = ExplorationMode::Manual;
        } else {
            return false;
        }
        return true;
    }

    ExplorationConfig ExplorationConfig::forQuickScan() {
        ExplorationConfig config;
        config.goal = ExplorationGoal::QuickScan;
        config.mode = ExplorationMode::Quick;
        config.maxDepth = 3;
        config.maxScreens = 20;
        config.maxElements = 100;
        config.maxDurationMs = 3L * 60 * 1000;
        return config;
    }

    ExplorationConfig ExplorationConfig::forDeepExploration() {
        ExplorationConfig config;
        config.goal = ExplorationGoal::DeepMap;
        config.mode = ExplorationMode::Deep;
        config.maxDepth = 15;
        config.maxScreens = 200;
        config.maxElements = 2000;
        config.maxDurationMs = 30L * 60 * 1000;
        config.maxScrollsPerContainer = 10;
        return config;
    }

    ExplorationConfig ExplorationConfig::forCoverage(double targetPct) {
        ExplorationConfig config = forDeepExploration();
        config.goal = ExplorationGoal::CoverageTarget;
        config.targetCoveragePct = std::max(0.0, std::min(100.0, targetPct));
        config.stopAtTargetCoverage = true;
        return config;
    }

    long ExplorationConfig::effectiveDurationMs() const {
        if (this->goal == ExplorationGoal::CoverageTarget)
            return this->maxDurationForCoverageMs;
        return this->maxDurationMs;
    }

    Preference::Preference()
            : Preference(ExplorationConfig()) {
    }

    Preference::Preference(const ExplorationConfig &config)
            : _config(config) {
        this->_dangerousWords = {"delete", "remove", "logout", "log out", "sign out", "signout",
                                 "uninstall", "exit", "quit", "clear data", "clear all", "reset",
                                 "format", "unsubscribe", "deactivate", "pay", "purchase", "buy",
                                 "factory", "erase", "wipe"};
        this->_metaWords = {"setting", "about", "contact", "help", "support", "privacy", "terms",
                            "legal", "license", "feedback", "rate", "review", "share app", "invite",
                            "refer", "version", "changelog", "what's new", "faq", "policy", "agreement",
                            "tos", "preferences", "report", "bug", "issue"};
        this->_blockerPatterns = {"password", "login", "log in", "signin", "sign_in", "sign in", "signup",
                                  "sign_up", "sign up", "auth", "verify", "verification", "setup", "pin",
                                  "otp", "2fa", "two_factor", "security", "lock", "unlock", "register",
                                  "registration", "forgot", "reset", "confirm"};
        this->_sensitiveWords = {"password", "credit card", "card number", "cvv", "ssn", "bank",
                                 "account number", "routing"};
        this->_systemPackages = {"com.android.systemui", "com.android.launcher",
                                 "com.google.android.apps.nexuslauncher", "com.android.settings",
                                 "com.google.android.permissioncontroller", "com.android.packageinstaller"};
        this->_backButtonPatterns = {"navigate up", "back", "go back", "up", "close", "action_bar_up",
                                     "toolbar_back", "btn_back", "iv_back", "navigation_up"};
        this->_navigationWords = {"tab", "nav", "menu", "drawer", "item", "row", "cell", "card",
                                  "more", "next", "open", "view", "details", "list"};
    }

    bool Preference::isBlockedResourceId(const std::string &resourceId) const {
        if (resourceId.empty())
            return false;
        return this->_blockedResourceIds.find(resourceId) != this->_blockedResourceIds.end();
    }

    bool Preference::loadConfigJson(const std::string &jsonContent) {
        nlohmann::json data;
        try {
            data = nlohmann::json::parse(jsonContent);
        } catch (nlohmann::json::exception &ex) {
            BLOGE("parse config error happened: id,%d: %s", ex.id, ex.what());
            return false;
        }
        if (!data.is_object()) {
            BLOGE("%s", "config root must be an object");
            return false;
        }

        ExplorationConfig &config = this->_config;
        std::string text = getJsonValue<std::string>(data, "strategy", "");
        if (!text.empty() && !parseStrategy(text, config.strategy))
            BLOGE("unknown strategy %s", text.c_str());
        text = getJsonValue<std::string>(data, "goal", "");
        if (!text.empty() && !parseGoal(text, config.goal))
            BLOGE("unknown goal %s", text.c_str());
        text = getJsonValue<std::string>(data, "mode", "");
        if (!text.empty() && !parseMode(text, config.mode))
            BLOGE("unknown mode %s", text.c_str());

        config.maxDepth = getJsonValue<int>(data, "maxDepth", config.maxDepth);
        config.maxScreens = getJsonValue<int>(data, "maxScreens", config.maxScreens);
        config.maxElements = getJsonValue<int>(data, "maxElements", config.maxElements);
        config.maxDurationMs = getJsonValue<long>(data, "maxDurationMs", config.maxDurationMs);
        config.actionDelayMs = getJsonValue<long>(data, "actionDelayMs", config.actionDelayMs);
        config.transitionWaitMs = getJsonValue<long>(data, "transitionWaitMs", config.transitionWaitMs);
        config.scrollDelayMs = getJsonValue<long>(data, "scrollDelayMs", config.scrollDelayMs);
        config.targetCoveragePct = getJsonValue<double>(data, "targetCoveragePct", config.targetCoveragePct);
        config.stopAtTargetCoverage = getJsonValue<bool>(data, "stopAtTargetCoverage", config.stopAtTargetCoverage);
        config.backtrackAfterNewScreen = getJsonValue<bool>(data, "backtrackAfterNewScreen",
                                                            config.backtrackAfterNewScreen);
        config.nonDestructive = getJsonValue<bool>(data, "nonDestructive", config.nonDestructive);
        config.maxLaunchRetries = getJsonValue<int>(data, "maxLaunchRetries", config.maxLaunchRetries);
        config.maxScrollsPerContainer = getJsonValue<int>(data, "maxScrollsPerContainer",
                                                          config.maxScrollsPerContainer);
        config.stabilizationWaitMs = getJsonValue<long>(data, "stabilizationWaitMs", config.stabilizationWaitMs);
        config.maxDurationForCoverageMs = getJsonValue<long>(data, "maxDurationForCoverageMs",
                                                             config.maxDurationForCoverageMs);
        config.maxPasses = getJsonValue<int>(data, "maxPasses", config.maxPasses);
        config.maxActionRetries = getJsonValue<int>(data, "maxActionRetries", config.maxActionRetries);
        config.stuckThreshold = getJsonValue<int>(data, "stuckThreshold", config.stuckThreshold);
        config.restartThreshold = getJsonValue<int>(data, "restartThreshold", config.restartThreshold);
        config.plateauMs = getJsonValue<long>(data, "plateauMs", config.plateauMs);
        config.humanHelpWaitMs = getJsonValue<long>(data, "humanHelpWaitMs", config.humanHelpWaitMs);
        config.policyModelPath = getJsonValue<std::string>(data, "policyModelPath", config.policyModelPath);
        config.targetCoveragePct = std::max(0.0, std::min(100.0, config.targetCoveragePct));
        config.maxPasses = std::max(0, config.maxPasses);

        appendWords(data, "dangerousWords", this->_dangerousWords);
        appendWords(data, "metaWords", this->_metaWords);
        appendWords(data, "blockerPatterns", this->_blockerPatterns);
        auto blocked = data.find("blockedResourceIds");
        if (blocked != data.end() && blocked->is_array()) {
            for (const auto &resourceId: *blocked) {
                if (resourceId.is_string()) {
                    BLOG("loading blocked widget %s", resourceId.get<std::string>().c_str());
                    this->_blockedResourceIds.insert(resourceId.get<std::string>());
                }
            }
        }
        BLOG("config loaded: strategy %s goal %s mode %s", strategyName(config.strategy),
             goalName(config.goal), modeName(config.mode));
        return true;
    }

    bool Preference::loadConfigFile(const std::string &path) {
        std::string content = loadFileContent(path);
        if (content.empty()) {
            BLOGE("config file %s is empty or missing", path.c_str());
            return false;
        }
        logLongStringInfo(content);
        return this->loadConfigJson(content);
    }

    std::string Preference::toJson() const {
        const ExplorationConfig &config = this->_config;
        nlohmann::json j;
        j["strategy"] = strategyName(config.strategy);
        j["goal"] = goalName(config.goal);
        j["mode"] = modeName(config.mode);
        j["maxDepth"] = config.maxDepth;
        j["maxScreens"] = config.maxScreens;
        j["maxElements"] = config.maxElements;
        j["maxDurationMs"] = config.maxDurationMs;
        j["actionDelayMs"] = config.actionDelayMs;
        j["transitionWaitMs"] = config.transitionWaitMs;
        j["scrollDelayMs"] = config.scrollDelayMs;
        j["targetCoveragePct"] = config.targetCoveragePct;
        j["stopAtTargetCoverage"] = config.stopAtTargetCoverage;
        j["backtrackAfterNewScreen"] = config.backtrackAfterNewScreen;
        j["nonDestructive"] = config.nonDestructive;
        j["maxLaunchRetries"] = config.maxLaunchRetries;
        j["maxScrollsPerContainer"] = config.maxScrollsPerContainer;
        j["stabilizationWaitMs"] = config.stabilizationWaitMs;
        j["maxDurationForCoverageMs"] = config.maxDurationForCoverageMs;
        j["maxPasses"] = config.maxPasses;
        j["maxActionRetries"] = config.maxActionRetries;
        j["stuckThreshold"] = config.stuckThreshold;
        j["restartThreshold"] = config.restartThreshold;
        j["plateauMs"] = config.plateauMs;
        j["humanHelpWaitMs"] = config.humanHelpWaitMs;
        j["policyModelPath"] = config.policyModelPath;
        j["blockedResourceIds"] = this->_blockedResourceIds;
        return j.dump(2);
    }

    std::string Preference::loadFileContent(const std::string &fileAbsolutePath) {
        std::string retStr;
        std::ifstream fileStringReader(fileAbsolutePath);
        if (fileStringReader.good()) {
            retStr = std::string((std::istreambuf_iterator<char>(fileStringReader)),
                                 std::istreambuf_iterator<char>());
        } else {
            LOGW("load file %s not exists!!!", fileAbsolutePath.c_str());
        }
        return retStr;
    }

}
