/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef FrontierQueue_H_
#define FrontierQueue_H_

#include "../desc/ExplorationTarget.h"
#include <vector>
#include <string>
#include <functional>

namespace scoutbot {

    /**
     * @brief Write-only side of the frontier, handed to QueueManager
     */
    class QueueAppender {
    public:
        /// @return false when an entry with the same key is already queued
        virtual bool append(const ExplorationTarget &target) = 0;

        virtual ~QueueAppender() = default;
    };

    /**
     * @brief Read-only side of the frontier, handed to the selection functions
     */
    class QueueView {
    public:
        virtual const std::vector<ExplorationTarget> &entries() const = 0;

        virtual bool contains(const std::string &key) const = 0;

        virtual ~QueueView() = default;
    };

    /**
     * @brief The not yet executed targets of a run
     *
     * Entries keep insertion order; selection picks by index so every
     * strategy sees the same stable ordering for equal priorities.
     */
    class FrontierQueue : public QueueAppender, public QueueView {
    public:
        FrontierQueue();

        bool append(const ExplorationTarget &target) override;

        const std::vector<ExplorationTarget> &entries() const override { return this->_entries; }

        bool contains(const std::string &key) const override;

        /// remove and return the entry at index
        bool take(size_t index, ExplorationTarget &target);

        /**
         * @brief Put a target back after a transient failure
         *
         * The priority is halved and the retry counter increased; nothing is
         * queued once retries exceeds maxRetries.
         */
        bool requeue(ExplorationTarget target, int maxRetries);

        /// priority * 0.5 rounded down, also for negative priorities
        static int decayedPriority(int priority);

        size_t removeScreen(const std::string &screenId);

        size_t removeIf(const std::function<bool(const ExplorationTarget &)> &predicate);

        size_t size() const { return this->_entries.size(); }

        bool empty() const { return this->_entries.empty(); }

        void clear();

        /// index of the highest priority entry, earliest on ties; -1 when empty
        int indexOfHighest(const std::function<bool(const ExplorationTarget &)> &filter = nullptr) const;

    private:
        std::vector<ExplorationTarget> _entries;
        long _nextSequence;
    };

}

#endif //FrontierQueue_H_
