/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef Screen_H_
#define Screen_H_

#include "../Base.h"
#include <string>
#include <vector>
#include <map>
#include <memory>

namespace scoutbot {

    /**
     * @brief What happened the last time an element was activated
     */
    enum class ElementOutcome {
        Unknown,
        Navigation,
        Toggle,
        ExpandCollapse,
        Dialog,
        Menu,
        Back,
        External,
        ClosesApp,
        NoEffect,
        TriggersDialog
    };

    const char *elementOutcomeName(ElementOutcome outcome);

    /**
     * @brief An interactive widget of one screen
     *
     * The id is a digest of (resource id, text, class, bounds). The same widget
     * on another screen has the same id but a different composite key, see
     * compositeKey().
     */
    class ClickableElement {
    public:
        ClickableElement(std::string resourceId, std::string text, std::string contentDescription,
                         std::string className, const Rect &bounds);

        static std::string computeId(const std::string &resourceId, const std::string &text,
                                     const std::string &className, const Rect &bounds);

        const std::string &getId() const { return this->_id; }

        const std::string &getResourceId() const { return this->_resourceId; }

        const std::string &getText() const { return this->_text; }

        const std::string &getContentDescription() const { return this->_contentDescription; }

        const std::string &getClassName() const { return this->_className; }

        const Rect &getBounds() const { return this->_bounds; }

        /// text, then content description, then the resource entry name
        std::string label() const;

        /// label, resource id, content description and class joined, lower case
        std::string searchableText() const;

        bool isExplored() const { return this->_explored; }

        void setExplored(bool explored) { this->_explored = explored; }

        /// filtered out by the queue rules; not counted by coverage
        bool isExcluded() const { return this->_excluded; }

        void setExcluded(bool excluded) { this->_excluded = excluded; }

        ElementOutcome getOutcome() const { return this->_outcome; }

        void setOutcome(ElementOutcome outcome) { this->_outcome = outcome; }

        const std::string &getLeadsTo() const { return this->_leadsTo; }

        void setLeadsTo(const std::string &screenId) { this->_leadsTo = screenId; }

        int getTapCount() const { return this->_tapCount; }

        void increaseTapCount() { this->_tapCount++; }

    private:
        std::string _id;
        std::string _resourceId;
        std::string _text;
        std::string _contentDescription;
        std::string _className;
        Rect _bounds;
        bool _explored;
        bool _excluded;
        ElementOutcome _outcome;
        std::string _leadsTo;
        int _tapCount;
    };

    typedef std::shared_ptr<ClickableElement> ClickableElementPtr;
    typedef std::vector<ClickableElementPtr> ClickableElementPtrVec;

    class ScrollableContainer {
    public:
        ScrollableContainer(std::string resourceId, std::string className, const Rect &bounds);

        const std::string &getId() const { return this->_id; }

        const std::string &getResourceId() const { return this->_resourceId; }

        const std::string &getClassName() const { return this->_className; }

        const Rect &getBounds() const { return this->_bounds; }

        bool isHorizontal() const;

        int getScrollCount() const { return this->_scrollCount; }

        void increaseScrollCount() { this->_scrollCount++; }

        bool reachedEnd() const { return this->_reachedEnd; }

        void setReachedEnd(bool reachedEnd) { this->_reachedEnd = reachedEnd; }

        /// drops scroll progress so the container is scrolled again next pass
        void resetScrolling() {
            this->_scrollCount = 0;
            this->_reachedEnd = false;
        }

    private:
        std::string _id;
        std::string _resourceId;
        std::string _className;
        Rect _bounds;
        int _scrollCount;
        bool _reachedEnd;
    };

    typedef std::shared_ptr<ScrollableContainer> ScrollableContainerPtr;

    struct TextElement {
        std::string text;
        std::string resourceId;
        Rect bounds;
    };

    struct InputField {
        std::string id;
        std::string resourceId;
        std::string hint;
        Rect bounds;
        bool isPassword;
    };

    /**
     * @brief A deduplicated UI state of the target application
     *
     * Identity is a digest of (activity or view identifier, package) and never
     * depends on dynamic content. Observations of an already known screen are
     * folded in with mergeObservation(), which only ever adds elements.
     */
    class Screen : public HashNode, public Serializable {
    public:
        Screen(std::string activity, std::string packageName, int width, int height);

        static std::string computeId(const std::string &activity, const std::string &packageName);

        const std::string &getId() const { return this->_id; }

        const std::string &getActivity() const { return this->_activity; }

        const std::string &getPackageName() const { return this->_packageName; }

        int getWidth() const { return this->_width; }

        int getHeight() const { return this->_height; }

        const ClickableElementPtrVec &getClickables() const { return this->_clickables; }

        const std::vector<ScrollableContainerPtr> &getScrollables() const { return this->_scrollables; }

        const std::vector<TextElement> &getTexts() const { return this->_texts; }

        const std::vector<InputField> &getInputs() const { return this->_inputs; }

        /// appends unless an element with the same id exists; returns false for duplicates
        bool addClickable(const ClickableElementPtr &element);

        bool addScrollable(const ScrollableContainerPtr &container);

        void addText(const TextElement &text);

        void addInput(const InputField &input);

        ClickableElementPtr findClickable(const std::string &elementId) const;

        ScrollableContainerPtr findScrollable(const std::string &containerId) const;

        /**
         * @brief Fold a fresh observation of this screen into the stored one
         *
         * @return number of clickable elements that were not known before
         */
        int mergeObservation(const Screen &observed);

        int getVisitCount() const { return this->_visitCount; }

        void increaseVisitCount() { this->_visitCount++; }

        int getDepth() const { return this->_depth; }

        void setDepth(int depth) { this->_depth = depth; }

        bool isBlocker() const { return this->_blocker; }

        void setBlocker(bool blocker) { this->_blocker = blocker; }

        /// all visible texts joined, lower case, used by the classifiers
        std::string allTextLower() const;

        int exploredCount() const;

        int unexploredCount() const;

        uintptr_t hash() const override;

        std::string toString() const override;

    private:
        std::string _id;
        std::string _activity;
        std::string _packageName;
        int _width;
        int _height;
        ClickableElementPtrVec _clickables;
        std::map<std::string, ClickableElementPtr> _clickableIndex;
        std::vector<ScrollableContainerPtr> _scrollables;
        std::vector<TextElement> _texts;
        std::vector<InputField> _inputs;
        int _visitCount;
        int _depth;
        bool _blocker;
    };

    typedef std::shared_ptr<Screen> ScreenPtr;
    typedef std::map<std::string, ScreenPtr> ScreenPtrMap;

    /// "screenId:elementId"
    std::string compositeKey(const std::string &screenId, const std::string &elementId);

}

#endif //Screen_H_
