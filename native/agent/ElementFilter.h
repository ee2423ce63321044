/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef ElementFilter_H_
#define ElementFilter_H_

#include "../desc/Screen.h"
#include "../events/Preference.h"
#include "../model/ExplorationState.h"
#include "PolicyAgent.h"
#include "PriorityCalculator.h"
#include <memory>
#include <vector>

namespace scoutbot {

    /**
     * @brief Everything a filter may look at for one candidate
     */
    struct FilterContext {
        const Screen &screen;
        const Preference &preference;
        const PriorityCalculator &calculator;
        const VisitedView &visited;
        /// may be null when no policy is attached
        const PolicyAdvisor *advisor;
        std::string stateHash;
        std::string actionKey;
    };

    /**
     * @brief Base class of the queue exclusion rules
     *
     * A filter rejects a candidate element; QueueManager runs them in order
     * and stops at the first rejection.
     */
    class ElementFilter {
    public:
        /**
         * @brief Check if an element may be queued
         *
         * @param element candidate element
         * @param context screen, lexicons and learned knowledge
         * @return true if the element passes this rule
         */
        virtual bool include(const ClickableElement &element, const FilterContext &context) const = 0;

        /// short name of the rule, used in logs and exclusion counters
        virtual const char *reason() const = 0;

        /// excluded elements never count against coverage
        virtual bool marksExcluded() const { return true; }

        virtual ~ElementFilter() = default;
    };

    typedef std::shared_ptr<ElementFilter> ElementFilterPtr;
    typedef std::vector<ElementFilterPtr> ElementFilterPtrVec;

    /**
     * @brief Rejects empty, off-screen and tiny (< 20 px) bounds
     */
    class ElementFilterBounds : public ElementFilter {
    public:
        bool include(const ClickableElement &element, const FilterContext &context) const override;

        const char *reason() const override { return "bounds"; }
    };

    /**
     * @brief Rejects status bar, navigation bar and other system UI
     */
    class ElementFilterSystemUi : public ElementFilter {
    public:
        bool include(const ClickableElement &element, const FilterContext &context) const override;

        const char *reason() const override { return "system_ui"; }
    };

    class ElementFilterSensitive : public ElementFilter {
    public:
        bool include(const ClickableElement &element, const FilterContext &context) const override {
            return !containsAnyWord(element.searchableText(), context.preference.sensitiveWords());
        }

        const char *reason() const override { return "sensitive"; }
    };

    /**
     * @brief Rejects delete, logout, purchase and similar when the run is non destructive
     */
    class ElementFilterDestructive : public ElementFilter {
    public:
        bool include(const ClickableElement &element, const FilterContext &context) const override {
            if (!context.preference.getConfig().nonDestructive)
                return true;
            return !containsAnyWord(element.searchableText(), context.preference.dangerousWords());
        }

        const char *reason() const override { return "destructive"; }
    };

    class ElementFilterBlockedId : public ElementFilter {
    public:
        bool include(const ClickableElement &element, const FilterContext &context) const override {
            return !context.preference.isBlockedResourceId(element.getResourceId());
        }

        const char *reason() const override { return "blocked_id"; }
    };

    /**
     * @brief Back buttons are reached through the back action, never queued
     */
    class ElementFilterBackButton : public ElementFilter {
    public:
        bool include(const ClickableElement &element, const FilterContext &context) const override {
            return !context.calculator.isLikelyBackButton(element);
        }

        const char *reason() const override { return "back_button"; }
    };

    class ElementFilterVisited : public ElementFilter {
    public:
        bool include(const ClickableElement &element, const FilterContext &context) const override {
            return !context.visited.isVisited(compositeKey(context.screen.getId(), element.getId()));
        }

        const char *reason() const override { return "visited"; }

        bool marksExcluded() const override { return false; }
    };

    class ElementFilterDangerousPattern : public ElementFilter {
    public:
        bool include(const ClickableElement & /* element */, const FilterContext &context) const override {
            return context.advisor == nullptr || !context.advisor->isDangerous(context.actionKey);
        }

        const char *reason() const override { return "dangerous_pattern"; }
    };

    /**
     * @brief Actions the policy gave up on after repeated negative outcomes
     */
    class ElementFilterPolicySkip : public ElementFilter {
    public:
        bool include(const ClickableElement & /* element */, const FilterContext &context) const override {
            return context.advisor == nullptr || !context.advisor->shouldSkip(context.stateHash, context.actionKey);
        }

        const char *reason() const override { return "policy_skip"; }
    };

    /// the exclusion rules in evaluation order
    ElementFilterPtrVec defaultElementFilters();

}

#endif //ElementFilter_H_
