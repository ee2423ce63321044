/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef FrontierQueue_CPP_
#define FrontierQueue_CPP_

#include "FrontierQueue.h"
#include "../utils.hpp"
#include <algorithm>
#include <cmath>

namespace scoutbot {

    FrontierQueue::FrontierQueue()
            : _nextSequence(0) {}

    bool FrontierQueue::append(const ExplorationTarget &target) {
        if (this->contains(target.key()))
            return false;
        ExplorationTarget entry = target;
        entry.sequence = this->_nextSequence++;
        this->_entries.push_back(entry);
        return true;
    }

    bool FrontierQueue::contains(const std::string &key) const {
        for (const auto &entry: this->_entries) {
            if (entry.key() == key)
                return true;
        }
        return false;
    }

    bool FrontierQueue::take(size_t index, ExplorationTarget &target) {
        if (index >= this->_entries.size())
            return false;
        target = this->_entries[index];
        this->_entries.erase(this->_entries.begin() + static_cast<long>(index));
        return true;
    }

    bool FrontierQueue::requeue(ExplorationTarget target, int maxRetries) {
        target.retries++;
        if (target.retries > maxRetries) {
            BLOG("drop %s after %d retries", target.toString().c_str(), target.retries - 1);
            return false;
        }
        target.priority = decayedPriority(target.priority);
        return this->append(target);
    }

    int FrontierQueue::decayedPriority(int priority) {
        return static_cast<int>(std::floor(priority * 0.5));
    }

    size_t FrontierQueue::removeScreen(const std::string &screenId) {
        return this->removeIf([&screenId](const ExplorationTarget &entry) {
            return entry.screenId == screenId;
        });
    }

    size_t FrontierQueue::removeIf(const std::function<bool(const ExplorationTarget &)> &predicate) {
        size_t before = this->_entries.size();
        this->_entries.erase(std::remove_if(this->_entries.begin(), this->_entries.end(), predicate),
                             this->_entries.end());
        return before - this->_entries.size();
    }

    void FrontierQueue::clear() {
        this->_entries.clear();
    }

    int FrontierQueue::indexOfHighest(const std::function<bool(const ExplorationTarget &)> &filter) const {
        int best = -1;
        for (size_t i = 0; i < this->_entries.size(); i++) {
            const ExplorationTarget &entry = this->_entries[i];
            if (filter && !filter(entry))
                continue;
            if (best < 0 || entry.priority > this->_entries[static_cast<size_t>(best)].priority)
                best = static_cast<int>(i);
        }
        return best;
    }

}

#endif //FrontierQueue_CPP_
