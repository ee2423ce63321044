/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef PolicyAgent_CPP_
#define PolicyAgent_CPP_

#include "PolicyAgent.h"
#include "../utils.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <utility>

namespace scoutbot {

    const char *tapResultName(TapResult result) {
        switch (result) {
            case TapResult::NewScreen:
                return "new_screen";
            case TapResult::NewElements:
                return "new_elements";
            case TapResult::BackNavigation:
                return "back_navigation";
            case TapResult::NoChange:
                return "no_change";
            case TapResult::ClosedApp:
                return "closed_app";
            case TapResult::Crashed:
                return "crashed";
        }
        return "no_change";
    }

    PolicyAgent::PolicyAgent(PolicyPersistencePtr store)
            : PolicyAgent(std::move(store), std::random_device{}()) {
    }

    PolicyAgent::PolicyAgent(PolicyPersistencePtr store, unsigned int seed)
            : _store(std::move(store)), _rng(seed), _actionsTaken(0), _totalUpdates(0),
              _positiveUpdates(0), _negativeUpdates(0), _restartAttempts(0), _restartSuccesses(0) {
    }

    size_t PolicyAgent::loadFromStore() {
        if (!this->_store)
            return 0;
        this->_table.clear();
        this->_stateActions.clear();
        for (const auto &entry: this->_store->entries()) {
            size_t separator = entry.first.find('|');
            if (separator == std::string::npos)
                continue;
            this->_table[entry.first] = entry.second;
            this->_stateActions[entry.first.substr(0, separator)].insert(entry.first.substr(separator + 1));
        }
        this->_dangerous = this->_store->dangerousPatterns(this->_target);
        this->_screenVisits = this->_store->screenVisits();
        BLOG("policy loaded %zu entries, %zu dangerous patterns", this->_table.size(), this->_dangerous.size());
        return this->_table.size();
    }

    void PolicyAgent::setTarget(const std::string &targetPackage) {
        if (targetPackage == this->_target)
            return;
        this->_target = targetPackage;
        this->_dangerous = this->_store ? this->_store->dangerousPatterns(targetPackage) : std::set<std::string>();
        BLOG("policy target %s, %zu dangerous patterns", targetPackage.c_str(), this->_dangerous.size());
    }

    std::string PolicyAgent::computeScreenHash(const Screen &screen) {
        std::vector<std::string> elementIds;
        elementIds.reserve(screen.getClickables().size());
        for (const auto &element: screen.getClickables()) {
            elementIds.push_back(element->getId());
        }
        std::sort(elementIds.begin(), elementIds.end());
        std::string signature = screen.getActivity();
        for (const auto &elementId: elementIds) {
            signature += "|" + elementId;
        }
        return hashHex(signature, 16);
    }

    std::string PolicyAgent::computeActionKey(const ClickableElement &element, int screenHeight) {
        const std::string &className = element.getClassName();
        std::string simpleClass = className.substr(className.rfind('.') == std::string::npos
                                                   ? 0 : className.rfind('.') + 1);
        if (simpleClass.empty())
            simpleClass = "View";

        std::string pattern = "none";
        const std::string &resourceId = element.getResourceId();
        if (!resourceId.empty()) {
            std::string entry = resourceId.substr(resourceId.rfind('/') == std::string::npos
                                                  ? 0 : resourceId.rfind('/') + 1);
            pattern.clear();
            bool inDigits = false;
            for (char c: entry) {
                if (std::isdigit(static_cast<unsigned char>(c))) {
                    if (!inDigits)
                        pattern.push_back('*');
                    inDigits = true;
                } else {
                    pattern.push_back(c);
                    inDigits = false;
                }
            }
            if (pattern.empty())
                pattern = "none";
        }

        std::string zone = "center";
        if (screenHeight > 0) {
            int centerY = element.getBounds().center().y;
            if (centerY < screenHeight / 3) {
                zone = "top";
            } else if (centerY >= 2 * screenHeight / 3) {
                zone = "bottom";
            }
        }
        return simpleClass + "|" + pattern + "|" + zone;
    }

    std::string PolicyAgent::makeKey(const std::string &stateHash, const std::string &actionKey) {
        return stateHash + "|" + actionKey;
    }

    const PolicyEntry *PolicyAgent::findEntry(const std::string &stateHash, const std::string &actionKey) const {
        auto iter = this->_table.find(makeKey(stateHash, actionKey));
        if (iter == this->_table.end())
            return nullptr;
        return &iter->second;
    }

    PolicyEntry &PolicyAgent::entryFor(const std::string &stateHash, const std::string &actionKey) {
        this->_stateActions[stateHash].insert(actionKey);
        return this->_table[makeKey(stateHash, actionKey)];
    }

    void PolicyAgent::persist(const std::string &stateHash, const std::string &actionKey, const PolicyEntry &entry) {
        if (this->_store)
            this->_store->upsert(makeKey(stateHash, actionKey), entry);
    }

    double PolicyAgent::getQValue(const std::string &stateHash, const std::string &actionKey) const {
        const PolicyEntry *entry = this->findEntry(stateHash, actionKey);
        return entry ? entry->value : 0.0;
    }

    int PolicyAgent::getVisitCount(const std::string &stateHash, const std::string &actionKey) const {
        const PolicyEntry *entry = this->findEntry(stateHash, actionKey);
        return entry ? entry->visits : 0;
    }

    double PolicyAgent::maxQValue(const std::string &stateHash) const {
        if (stateHash.empty())
            return 0.0;
        auto actions = this->_stateActions.find(stateHash);
        if (actions == this->_stateActions.end() || actions->second.empty())
            return 0.0;
        double best = -std::numeric_limits<double>::infinity();
        for (const auto &actionKey: actions->second) {
            best = std::max(best, this->getQValue(stateHash, actionKey));
        }
        return best;
    }

    double PolicyAgent::updateQValue(const std::string &stateHash, const std::string &actionKey, double reward,
                                     const std::string &nextStateHash) {
        double nextMaxQ = this->maxQValue(nextStateHash);
        PolicyEntry &entry = this->entryFor(stateHash, actionKey);
        double feedback = entry.feedback;
        double oldValue = entry.value;
        entry.value = oldValue + QLearningConstants::Alpha * (reward + QLearningConstants::Gamma * nextMaxQ
                                                              + QLearningConstants::Beta * feedback - oldValue);
        entry.visits++;
        entry.feedback = 0.0;

        this->_totalUpdates++;
        if (entry.value > oldValue) {
            this->_positiveUpdates++;
        } else if (entry.value < oldValue) {
            this->_negativeUpdates++;
        }
        BDLOG("Q(%s|%s) %.4f -> %.4f r=%.3f next=%.3f h=%.2f visits=%d", stateHash.c_str(), actionKey.c_str(),
              oldValue, entry.value, reward, nextMaxQ, feedback, entry.visits);
        PolicyEntry snapshot = entry;
        this->persist(stateHash, actionKey, snapshot);
        return snapshot.value;
    }

    double PolicyAgent::computeReward(const TapOutcome &outcome) const {
        switch (outcome.result) {
            case TapResult::NewScreen: {
                double reward = QLearningConstants::RewardNewScreen;
                reward += std::min(QLearningConstants::MaxDepthBonus,
                                   QLearningConstants::DepthBonusPerLevel * std::max(0, outcome.depth));
                if (outcome.priorScreenVisits <= 0) {
                    reward += QLearningConstants::NoveltyBonus;
                } else {
                    reward -= QLearningConstants::RevisitPenaltyPerVisit
                              * std::min(outcome.priorScreenVisits, QLearningConstants::MaxPenalizedRevisits);
                }
                return reward;
            }
            case TapResult::NewElements:
                return QLearningConstants::RewardNewElements;
            case TapResult::BackNavigation:
                return QLearningConstants::RewardBackNavigation;
            case TapResult::NoChange:
                return QLearningConstants::RewardNoChange;
            case TapResult::ClosedApp:
                return QLearningConstants::RewardClosedApp;
            case TapResult::Crashed:
                return QLearningConstants::RewardCrash;
        }
        return QLearningConstants::RewardNoChange;
    }

    double PolicyAgent::learn(const std::string &stateHash, const std::string &actionKey, const TapOutcome &outcome,
                              const std::string &nextStateHash) {
        double reward = this->computeReward(outcome);
        this->updateQValue(stateHash, actionKey, reward, nextStateHash);
        if (outcome.result == TapResult::ClosedApp || outcome.result == TapResult::Crashed) {
            this->markDangerous(actionKey);
        }
        return reward;
    }

    void PolicyAgent::recordImitation(const std::string &stateHash, const std::string &actionKey) {
        this->recordHumanFeedback(stateHash, actionKey, 1.0);
    }

    void PolicyAgent::recordVeto(const std::string &stateHash, const std::string &actionKey) {
        this->recordHumanFeedback(stateHash, actionKey, -1.0);
    }

    void PolicyAgent::recordHumanFeedback(const std::string &stateHash, const std::string &actionKey,
                                          double signal) {
        double clampedSignal = std::max(-1.0, std::min(1.0, signal));
        PolicyEntry &entry = this->entryFor(stateHash, actionKey);
        entry.feedback = std::max(QLearningConstants::FeedbackMin,
                                  std::min(QLearningConstants::FeedbackMax, entry.feedback + clampedSignal));
        BLOG("human feedback %.1f on %s|%s, pending %.1f", clampedSignal, stateHash.c_str(), actionKey.c_str(),
             entry.feedback);
        PolicyEntry snapshot = entry;
        this->persist(stateHash, actionKey, snapshot);
    }

    double PolicyAgent::pendingFeedback(const std::string &stateHash, const std::string &actionKey) const {
        const PolicyEntry *entry = this->findEntry(stateHash, actionKey);
        return entry ? entry->feedback : 0.0;
    }

    double PolicyAgent::getEpsilon() const {
        double epsilon = QLearningConstants::EpsilonStart
                         * std::pow(QLearningConstants::EpsilonDecay, static_cast<double>(this->_actionsTaken));
        return std::max(QLearningConstants::EpsilonMin, epsilon);
    }

    void PolicyAgent::onActionTaken() {
        this->_actionsTaken++;
    }

    double PolicyAgent::ucbBonus(const std::string &stateHash, const std::string &actionKey) const {
        int actionVisits = this->getVisitCount(stateHash, actionKey);
        if (actionVisits <= 0)
            return 2.0 * QLearningConstants::UcbCoefficient;
        int screenVisits = this->getScreenVisits(stateHash);
        if (screenVisits <= 1)
            return 0.0;
        return QLearningConstants::UcbCoefficient
               * std::sqrt(std::log(static_cast<double>(screenVisits)) / static_cast<double>(actionVisits));
    }

    int PolicyAgent::selectAction(const std::string &stateHash, const std::vector<std::string> &actionKeys) {
        std::vector<int> valid;
        std::vector<int> untried;
        for (size_t i = 0; i < actionKeys.size(); i++) {
            const std::string &actionKey = actionKeys[i];
            if (this->isDangerous(actionKey) || this->shouldSkip(stateHash, actionKey))
                continue;
            valid.push_back(static_cast<int>(i));
            if (this->getVisitCount(stateHash, actionKey) == 0)
                untried.push_back(static_cast<int>(i));
        }
        if (valid.empty())
            return -1;

        std::uniform_real_distribution<double> unit(0.0, 1.0);
        if (unit(this->_rng) < this->getEpsilon()) {
            const std::vector<int> &pool = untried.empty() ? valid : untried;
            std::uniform_int_distribution<size_t> pick(0, pool.size() - 1);
            int chosen = pool[pick(this->_rng)];
            BDLOG("explore: pick %s", actionKeys[static_cast<size_t>(chosen)].c_str());
            return chosen;
        }

        int best = -1;
        double bestScore = 0.0;
        for (int index: valid) {
            const std::string &actionKey = actionKeys[static_cast<size_t>(index)];
            double score = this->isDeadEnd(stateHash, actionKey)
                           ? QLearningConstants::DeadEndSelectionScore
                           : this->getQValue(stateHash, actionKey) + this->ucbBonus(stateHash, actionKey);
            if (best < 0 || score > bestScore) {
                best = index;
                bestScore = score;
            }
        }
        return best;
    }

    double PolicyAgent::priorityBoost(const std::string &stateHash, const std::string &actionKey) const {
        if (this->isDeadEnd(stateHash, actionKey))
            return QLearningConstants::DeadEndPriority;
        double q = this->getQValue(stateHash, actionKey);
        int visits = this->getVisitCount(stateHash, actionKey);
        double boost = std::max(-QLearningConstants::MaxQBoost,
                                std::min(QLearningConstants::MaxQBoost, q * QLearningConstants::QBoostScale));
        if (visits == 0) {
            boost += QLearningConstants::UntriedBonus;
        } else if (visits <= QLearningConstants::FewTries) {
            boost += QLearningConstants::FewTriesBonus;
        }
        if (visits > 0 && this->getScreenVisits(stateHash) > 1) {
            boost += std::min(QLearningConstants::MaxUcbBoost,
                              this->ucbBonus(stateHash, actionKey) * QLearningConstants::UcbBoostScale);
        }
        return std::max(QLearningConstants::MinBoost, std::min(QLearningConstants::MaxBoost, boost));
    }

    bool PolicyAgent::isDeadEnd(const std::string &stateHash, const std::string &actionKey) const {
        const PolicyEntry *entry = this->findEntry(stateHash, actionKey);
        return entry && entry->visits >= QLearningConstants::DeadEndMinVisits
               && entry->value < QLearningConstants::DeadEndThreshold;
    }

    bool PolicyAgent::shouldSkip(const std::string &stateHash, const std::string &actionKey) const {
        const PolicyEntry *entry = this->findEntry(stateHash, actionKey);
        return entry && entry->visits >= QLearningConstants::SkipMinVisits
               && entry->value < QLearningConstants::SkipThreshold;
    }

    bool PolicyAgent::isDangerous(const std::string &actionKey) const {
        return this->_dangerous.find(actionKey) != this->_dangerous.end();
    }

    void PolicyAgent::markDangerous(const std::string &actionKey) {
        if (!this->_dangerous.insert(actionKey).second)
            return;
        BLOG("action pattern %s marked dangerous on %s", actionKey.c_str(), this->_target.c_str());
        if (this->_store)
            this->_store->addDangerousPattern(this->_target, actionKey);
    }

    void PolicyAgent::recordScreenVisit(const std::string &stateHash) {
        int visits = ++this->_screenVisits[stateHash];
        if (this->_store)
            this->_store->setScreenVisits(stateHash, visits);
    }

    int PolicyAgent::getScreenVisits(const std::string &stateHash) const {
        auto iter = this->_screenVisits.find(stateHash);
        return iter == this->_screenVisits.end() ? 0 : iter->second;
    }

    void PolicyAgent::markScreenAsDeadEnd(const std::string &stateHash) {
        auto actions = this->_stateActions.find(stateHash);
        if (actions == this->_stateActions.end())
            return;
        for (const auto &actionKey: actions->second) {
            PolicyEntry &entry = this->_table[makeKey(stateHash, actionKey)];
            entry.value = std::min(entry.value, QLearningConstants::DeadEndScreenValue);
            PolicyEntry snapshot = entry;
            this->persist(stateHash, actionKey, snapshot);
        }
        BLOG("screen state %s marked as dead end (%zu actions)", stateHash.c_str(), actions->second.size());
    }

    void PolicyAgent::recordRestartRecovery(bool success) {
        this->_restartAttempts++;
        if (success)
            this->_restartSuccesses++;
        BLOG("restart recovery %s (%d/%d)", success ? "helped" : "did not help", this->_restartSuccesses,
             this->_restartAttempts);
    }

    PolicyStatistics PolicyAgent::getStatistics() const {
        PolicyStatistics statistics;
        statistics.totalUpdates = this->_totalUpdates;
        statistics.positiveUpdates = this->_positiveUpdates;
        statistics.negativeUpdates = this->_negativeUpdates;
        statistics.entries = this->_table.size();
        statistics.dangerousPatterns = this->_dangerous.size();
        statistics.epsilon = this->getEpsilon();
        statistics.actionsTaken = this->_actionsTaken;
        statistics.restartAttempts = this->_restartAttempts;
        statistics.restartSuccesses = this->_restartSuccesses;
        double sum = 0.0;
        for (const auto &entry: this->_table) {
            sum += entry.second.value;
            if (entry.second.visits >= QLearningConstants::DeadEndMinVisits
                && entry.second.value < QLearningConstants::DeadEndThreshold)
                statistics.deadEnds++;
        }
        if (!this->_table.empty())
            statistics.averageQ = sum / static_cast<double>(this->_table.size());
        return statistics;
    }

    std::string PolicyAgent::exportJson() const {
        nlohmann::json j;
        nlohmann::json entries = nlohmann::json::array();
        for (const auto &entry: this->_table) {
            nlohmann::json item;
            item["key"] = entry.first;
            item["value"] = entry.second.value;
            item["visits"] = entry.second.visits;
            entries.push_back(item);
        }
        j["entries"] = entries;
        j["target"] = this->_target;
        j["dangerous"] = this->_dangerous;
        return j.dump();
    }

    bool PolicyAgent::mergeImported(const std::string &jsonContent, size_t &merged) {
        merged = 0;
        try {
            nlohmann::json j = nlohmann::json::parse(jsonContent);
            if (j.contains("entries")) {
                for (const auto &item: j.at("entries")) {
                    std::string key = item.at("key").get<std::string>();
                    size_t separator = key.find('|');
                    if (separator == std::string::npos)
                        continue;
                    std::string stateHash = key.substr(0, separator);
                    std::string actionKey = key.substr(separator + 1);
                    double importedValue = item.at("value").get<double>();
                    int importedVisits = item.value("visits", 0);
                    bool known = this->findEntry(stateHash, actionKey) != nullptr;
                    PolicyEntry &entry = this->entryFor(stateHash, actionKey);
                    if (known) {
                        entry.value = QLearningConstants::ImportedWeight * importedValue
                                      + (1.0 - QLearningConstants::ImportedWeight) * entry.value;
                        entry.visits = std::max(entry.visits, importedVisits);
                    } else {
                        entry.value = importedValue;
                        entry.visits = importedVisits;
                    }
                    PolicyEntry snapshot = entry;
                    this->persist(stateHash, actionKey, snapshot);
                    merged++;
                }
            }
            if (j.contains("dangerous") && j.value("target", this->_target) == this->_target) {
                for (const auto &pattern: j.at("dangerous")) {
                    this->markDangerous(pattern.get<std::string>());
                }
            }
        } catch (nlohmann::json::exception &ex) {
            BLOGE("merge policy table error happened: id,%d: %s", ex.id, ex.what());
            return false;
        }
        BLOG("merged %zu imported policy entries", merged);
        return true;
    }

    bool PolicyAgent::flush() {
        return this->_store ? this->_store->flush() : true;
    }

}

#endif //PolicyAgent_CPP_
