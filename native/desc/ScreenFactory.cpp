/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef ScreenFactory_CPP_
#define ScreenFactory_CPP_

#include "ScreenFactory.h"
#include "../utils.hpp"

namespace scoutbot {

    static std::string firstDescendantText(const ElementPtr &element) {
        for (const auto &child: element->getChildren()) {
            if (!child->getText().empty())
                return child->getText();
            if (!child->getContentDesc().empty())
                return child->getContentDesc();
            std::string nested = firstDescendantText(child);
            if (!nested.empty())
                return nested;
        }
        return std::string();
    }

    static void collectNode(const ElementPtr &element, const ScreenPtr &screen, bool insideClickable) {
        const Rect &bounds = element->getBounds();
        bool actionable = (element->getClickable() || element->getLongClickable()) && element->getEnable();

        if (element->isEditText()) {
            InputField input;
            input.resourceId = element->getResourceID();
            input.hint = element->getText().empty() ? element->getContentDesc() : element->getText();
            input.bounds = bounds;
            input.isPassword = element->getPassword();
            input.id = hashHex(input.resourceId + "|" + bounds.toString(), 16);
            screen->addInput(input);
        } else if (!element->getText().empty()) {
            TextElement text;
            text.text = element->getText();
            text.resourceId = element->getResourceID();
            text.bounds = bounds;
            screen->addText(text);
        }

        if (element->getScrollable() && !bounds.isEmpty()) {
            screen->addScrollable(std::make_shared<ScrollableContainer>(
                    element->getResourceID(), element->getClassname(), bounds));
        }

        bool emitted = false;
        if (actionable && !insideClickable && !bounds.isEmpty()) {
            std::string text = element->getText();
            if (text.empty() && element->getContentDesc().empty())
                text = firstDescendantText(element);
            screen->addClickable(std::make_shared<ClickableElement>(
                    element->getResourceID(), text, element->getContentDesc(),
                    element->getClassname(), bounds));
            emitted = true;
        }

        for (const auto &child: element->getChildren()) {
            collectNode(child, screen, insideClickable || emitted);
        }
    }

    ScreenPtr ScreenFactory::createScreen(const std::string &activity, const std::string &packageName,
                                          const ElementPtr &root, int width, int height) {
        if (!root) {
            BLOGE("%s", "cannot create screen without a hierarchy root");
            return nullptr;
        }
        int screenWidth = width > 0 ? width : root->getBounds().width();
        int screenHeight = height > 0 ? height : root->getBounds().height();
        auto screen = std::make_shared<Screen>(activity, packageName, screenWidth, screenHeight);
        collectNode(root, screen, false);
        BDLOG("screen %s (%s) clickables %zu scrollables %zu", screen->getId().c_str(), activity.c_str(),
              screen->getClickables().size(), screen->getScrollables().size());
        return screen;
    }

    ScreenPtr ScreenFactory::createScreenFromXml(const std::string &activity, const std::string &packageName,
                                                 const std::string &xmlContent, int width, int height) {
        ElementPtr root = Element::createFromXml(xmlContent);
        if (!root)
            return nullptr;
        std::string screenActivity = activity.empty() ? root->getActivity() : activity;
        std::string screenPackage = packageName.empty() ? root->getPackageName() : packageName;
        return createScreen(screenActivity, screenPackage, root, width, height);
    }
}

#endif //ScreenFactory_CPP_
