/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef Element_CPP_
#define Element_CPP_

#include "../utils.hpp"
#include "Element.h"
#include <tinyxml2.h>
#include <nlohmann/json.hpp>
#include <cstring>


namespace scoutbot {

    /// Parse one integer (optional '-', then digits) and advance p past it. Used for bounds "[xl,yl][xr,yr]".
    static int parseIntAndAdvance(const char *&p) {
        bool neg = (*p == '-');
        if (neg) ++p;
        int v = 0;
        while (*p >= '0' && *p <= '9')
            v = v * 10 + (*p++ - '0');
        return neg ? -v : v;
    }

    static bool parseBounds(const char *boundingBoxStr, Rect &out) {
        if (!boundingBoxStr || *boundingBoxStr != '[')
            return false;
        const char *p = boundingBoxStr + 1;
        int xl = parseIntAndAdvance(p);
        if (*p != ',')
            return false;
        ++p;
        int yl = parseIntAndAdvance(p);
        if (p[0] != ']' || p[1] != '[')
            return false;
        p += 2;
        int xr = parseIntAndAdvance(p);
        if (*p != ',')
            return false;
        ++p;
        int yr = parseIntAndAdvance(p);
        if (*p != ']')
            return false;
        out = Rect(xl, yl, xr, yr);
        return true;
    }

    static std::string stringAttribute(const tinyxml2::XMLElement *xmlNode, const char *name) {
        const char *value = nullptr;
        if (xmlNode->QueryStringAttribute(name, &value) == tinyxml2::XML_SUCCESS && value && *value != '\0') {
            return std::string(value);
        }
        return std::string();
    }

    Element::Element()
            : _enabled(true), _checked(false), _checkable(false), _clickable(false),
              _scrollable(false), _longClickable(false), _index(0), _password(false),
              _selected(false) {
        this->_bounds = Rect::RectZero;
    }

    bool Element::isEditText() const {
        return this->_classname.find("EditText") != std::string::npos;
    }

    void Element::reAddChild(const std::shared_ptr<Element> &child) {
        child->_parent = shared_from_this();
        this->_children.emplace_back(child);
    }

    /**
     * @brief Collect every descendant for which func returns true, depth first
     */
    void Element::recursiveElements(const std::function<bool(ElementPtr)> &func,
                                    std::vector<ElementPtr> &result) const {
        if (func != nullptr) {
            for (const auto &child: this->_children) {
                if (func(child)) {
                    result.push_back(child);
                }
                child->recursiveElements(func, result);
            }
        }
    }

    void Element::recursiveDoElements(const std::function<void(std::shared_ptr<Element>)> &doFunc) {
        if (doFunc != nullptr) {
            for (const auto &child: this->_children) {
                doFunc(child);
                child->recursiveDoElements(doFunc);
            }
        }
    }

    ElementPtr Element::createFromXml(const std::string &xmlContent) {
        tinyxml2::XMLDocument doc;
        BDLOG("guitree size=%zu", xmlContent.size());

        tinyxml2::XMLError errXml = doc.Parse(xmlContent.c_str());
        if (errXml != tinyxml2::XML_SUCCESS) {
            BLOGE("parse xml error %d", static_cast<int>(errXml));
            return nullptr;
        }

        const tinyxml2::XMLElement *rootNode = doc.RootElement();
        if (nullptr == rootNode) {
            BLOGE("%s", "xml document has no root element");
            return nullptr;
        }

        std::string activity;
        std::string package;
        if (0 == std::strcmp(rootNode->Name(), "hierarchy")) {
            activity = stringAttribute(rootNode, "activity");
            package = stringAttribute(rootNode, "package");
            rootNode = rootNode->FirstChildElement("node");
            if (nullptr == rootNode) {
                BLOGE("%s", "hierarchy without node");
                return nullptr;
            }
        }

        ElementPtr elementPtr = std::make_shared<Element>();
        elementPtr->fromXMLNode(rootNode, nullptr);
        elementPtr->_activity = activity;
        if (elementPtr->_packageName.empty())
            elementPtr->_packageName = package;
        return elementPtr;
    }

    void Element::fromXMLNode(const tinyxml2::XMLElement *xmlNode, const ElementPtr &parentOfNode) {
        if (nullptr == xmlNode)
            return;
        if (parentOfNode)
            this->_parent = parentOfNode;
        int indexOfNode = 0;
        if (xmlNode->QueryIntAttribute("index", &indexOfNode) == tinyxml2::XML_SUCCESS) {
            this->_index = indexOfNode;
        }
        const char *boundingBoxStr = nullptr;
        if (xmlNode->QueryStringAttribute("bounds", &boundingBoxStr) == tinyxml2::XML_SUCCESS) {
            Rect parsed;
            if (parseBounds(boundingBoxStr, parsed) && !parsed.isEmpty()) {
                this->_bounds = parsed;
            }
        }
        this->_text = stringAttribute(xmlNode, "text");
        this->_resourceID = stringAttribute(xmlNode, "resource-id");
        this->_classname = stringAttribute(xmlNode, "class");
        this->_packageName = stringAttribute(xmlNode, "package");
        this->_contentDesc = stringAttribute(xmlNode, "content-desc");

        bool b = false;
        if (xmlNode->QueryBoolAttribute("checkable", &b) == tinyxml2::XML_SUCCESS) this->_checkable = b;
        if (xmlNode->QueryBoolAttribute("clickable", &b) == tinyxml2::XML_SUCCESS) this->_clickable = b;
        if (xmlNode->QueryBoolAttribute("checked", &b) == tinyxml2::XML_SUCCESS) this->_checked = b;
        if (xmlNode->QueryBoolAttribute("enabled", &b) == tinyxml2::XML_SUCCESS) this->_enabled = b;
        if (xmlNode->QueryBoolAttribute("scrollable", &b) == tinyxml2::XML_SUCCESS) this->_scrollable = b;
        if (xmlNode->QueryBoolAttribute("long-clickable", &b) == tinyxml2::XML_SUCCESS) this->_longClickable = b;
        if (xmlNode->QueryBoolAttribute("password", &b) == tinyxml2::XML_SUCCESS) this->_password = b;
        if (xmlNode->QueryBoolAttribute("selected", &b) == tinyxml2::XML_SUCCESS) this->_selected = b;

        // inherit the package from the parent when the dump omits it on children
        if (this->_packageName.empty() && parentOfNode)
            this->_packageName = parentOfNode->_packageName;

        if (!xmlNode->NoChildren()) {
            const ElementPtr self = shared_from_this();
            for (const tinyxml2::XMLElement *childNode = xmlNode->FirstChildElement("node");
                 childNode != nullptr; childNode = childNode->NextSiblingElement("node")) {
                ElementPtr childElement = std::make_shared<Element>();
                this->_children.emplace_back(childElement);
                childElement->fromXMLNode(childNode, self);
            }
        }
    }

    std::string Element::toJson() const {
        nlohmann::json j;
        j["bounds"] = this->_bounds.toString();
        j["index"] = this->_index;
        j["class"] = this->_classname;
        j["resource-id"] = this->_resourceID;
        j["package"] = this->_packageName;
        j["text"] = this->_text;
        j["content-desc"] = this->_contentDesc;
        j["clickable"] = this->_clickable;
        j["scrollable"] = this->_scrollable;
        j["enabled"] = this->_enabled;
        j["password"] = this->_password;
        j["children"] = this->_children.size();
        return j.dump();
    }

    std::string Element::toString() const {
        return this->toJson();
    }

}

#endif //Element_CPP_
