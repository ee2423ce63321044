/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef Screen_CPP_
#define Screen_CPP_

#include "Screen.h"
#include <nlohmann/json.hpp>
#include <sstream>
#include <utility>

namespace scoutbot {

    const char *elementOutcomeName(ElementOutcome outcome) {
        switch (outcome) {
            case ElementOutcome::Navigation:
                return "navigation";
            case ElementOutcome::Toggle:
                return "toggle";
            case ElementOutcome::ExpandCollapse:
                return "expand_collapse";
            case ElementOutcome::Dialog:
                return "dialog";
            case ElementOutcome::Menu:
                return "menu";
            case ElementOutcome::Back:
                return "back";
            case ElementOutcome::External:
                return "external";
            case ElementOutcome::ClosesApp:
                return "closes_app";
            case ElementOutcome::NoEffect:
                return "no_effect";
            case ElementOutcome::TriggersDialog:
                return "triggers_dialog";
            default:
                return "unknown";
        }
    }

    std::string compositeKey(const std::string &screenId, const std::string &elementId) {
        return screenId + ":" + elementId;
    }

    ClickableElement::ClickableElement(std::string resourceId, std::string text,
                                       std::string contentDescription, std::string className,
                                       const Rect &bounds)
            : _resourceId(std::move(resourceId)), _text(std::move(text)),
              _contentDescription(std::move(contentDescription)), _className(std::move(className)),
              _bounds(bounds), _explored(false), _excluded(false), _outcome(ElementOutcome::Unknown), _tapCount(0) {
        this->_id = computeId(this->_resourceId, this->_text, this->_className, this->_bounds);
    }

    std::string ClickableElement::computeId(const std::string &resourceId, const std::string &text,
                                            const std::string &className, const Rect &bounds) {
        std::stringstream ss;
        ss << resourceId << "|" << text << "|" << className << "|" << bounds.toString();
        return hashHex(ss.str(), 16);
    }

    std::string ClickableElement::label() const {
        if (!this->_text.empty())
            return this->_text;
        if (!this->_contentDescription.empty())
            return this->_contentDescription;
        size_t slash = this->_resourceId.rfind('/');
        if (slash != std::string::npos)
            return this->_resourceId.substr(slash + 1);
        return this->_resourceId;
    }

    std::string ClickableElement::searchableText() const {
        return toLowerCase(this->_text + " " + this->_contentDescription + " "
                           + this->_resourceId + " " + this->_className);
    }

    ScrollableContainer::ScrollableContainer(std::string resourceId, std::string className,
                                             const Rect &bounds)
            : _resourceId(std::move(resourceId)), _className(std::move(className)),
              _bounds(bounds), _scrollCount(0), _reachedEnd(false) {
        this->_id = hashHex(this->_resourceId + "|" + this->_className + "|" + this->_bounds.toString(), 16);
    }

    bool ScrollableContainer::isHorizontal() const {
        if (this->_className.find("Horizontal") != std::string::npos
            || this->_className.find("ViewPager") != std::string::npos)
            return true;
        return this->_bounds.width() > 2 * this->_bounds.height();
    }

    Screen::Screen(std::string activity, std::string packageName, int width, int height)
            : _activity(std::move(activity)), _packageName(std::move(packageName)),
              _width(width), _height(height), _visitCount(0), _depth(0), _blocker(false) {
        this->_id = computeId(this->_activity, this->_packageName);
    }

    std::string Screen::computeId(const std::string &activity, const std::string &packageName) {
        return hashHex(packageName + "/" + activity, 16);
    }

    bool Screen::addClickable(const ClickableElementPtr &element) {
        if (!element)
            return false;
        if (this->_clickableIndex.find(element->getId()) != this->_clickableIndex.end())
            return false;
        this->_clickableIndex.emplace(element->getId(), element);
        this->_clickables.push_back(element);
        return true;
    }

    bool Screen::addScrollable(const ScrollableContainerPtr &container) {
        if (!container || this->findScrollable(container->getId()))
            return false;
        this->_scrollables.push_back(container);
        return true;
    }

    void Screen::addText(const TextElement &text) {
        for (const auto &existing: this->_texts) {
            if (existing.text == text.text && existing.resourceId == text.resourceId)
                return;
        }
        this->_texts.push_back(text);
    }

    void Screen::addInput(const InputField &input) {
        for (const auto &existing: this->_inputs) {
            if (existing.id == input.id)
                return;
        }
        this->_inputs.push_back(input);
    }

    ClickableElementPtr Screen::findClickable(const std::string &elementId) const {
        auto iter = this->_clickableIndex.find(elementId);
        if (iter == this->_clickableIndex.end())
            return nullptr;
        return iter->second;
    }

    ScrollableContainerPtr Screen::findScrollable(const std::string &containerId) const {
        for (const auto &container: this->_scrollables) {
            if (container->getId() == containerId)
                return container;
        }
        return nullptr;
    }

    int Screen::mergeObservation(const Screen &observed) {
        int added = 0;
        for (const auto &element: observed.getClickables()) {
            if (this->addClickable(element))
                added++;
        }
        for (const auto &container: observed.getScrollables()) {
            this->addScrollable(container);
        }
        for (const auto &text: observed.getTexts()) {
            this->addText(text);
        }
        for (const auto &input: observed.getInputs()) {
            this->addInput(input);
        }
        return added;
    }

    std::string Screen::allTextLower() const {
        std::string joined = this->_activity;
        for (const auto &text: this->_texts) {
            joined += " " + text.text;
        }
        for (const auto &element: this->_clickables) {
            joined += " " + element->label();
        }
        return toLowerCase(joined);
    }

    int Screen::exploredCount() const {
        int count = 0;
        for (const auto &element: this->_clickables) {
            if (element->isExplored())
                count++;
        }
        return count;
    }

    int Screen::unexploredCount() const {
        int count = 0;
        for (const auto &element: this->_clickables) {
            if (!element->isExplored() && !element->isExcluded())
                count++;
        }
        return count;
    }

    uintptr_t Screen::hash() const {
        return static_cast<uintptr_t>(fastStringHash(this->_id));
    }

    std::string Screen::toString() const {
        nlohmann::json j;
        j["id"] = this->_id;
        j["activity"] = this->_activity;
        j["package"] = this->_packageName;
        j["clickables"] = this->_clickables.size();
        j["scrollables"] = this->_scrollables.size();
        j["explored"] = this->exploredCount();
        j["visits"] = this->_visitCount;
        j["depth"] = this->_depth;
        j["blocker"] = this->_blocker;
        return j.dump();
    }

}

#endif //Screen_CPP_
