/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef Element_H_
#define Element_H_

#include "../Base.h"
#include <string>
#include <utility>
#include <vector>
#include <memory>
#include <functional>

namespace tinyxml2 {
    class XMLElement;

    class XMLDocument;
}


namespace scoutbot {

    /**
     * @brief One node of a UI hierarchy dump
     *
     * Element is the raw, uninterpreted view of the accessibility tree as the
     * screen provider reports it: class, resource id, text, bounds and the
     * interaction flags. ScreenFactory turns a tree of Elements into a Screen.
     *
     * The expected dump format is the uiautomator one:
     * <hierarchy activity="..." package="..."><node bounds="[l,t][r,b]" .../></hierarchy>
     * A bare <node> root is accepted as well.
     */
    class Element : public Serializable, public std::enable_shared_from_this<Element> {
    public:
        Element();

        bool isEditText() const;

        const std::vector<std::shared_ptr<Element> > &
        getChildren() const { return this->_children; }

        // recursive get elements depends func
        void recursiveElements(const std::function<bool(std::shared_ptr<Element>)> &func,
                               std::vector<std::shared_ptr<Element>> &result) const;

        void recursiveDoElements(const std::function<void(std::shared_ptr<Element>)> &doFunc);

        std::weak_ptr<Element> getParent() const { return this->_parent; }

        const std::string &getClassname() const { return this->_classname; }

        const std::string &getResourceID() const { return this->_resourceID; }

        const std::string &getText() const { return this->_text; }

        const std::string &getContentDesc() const { return this->_contentDesc; }

        const std::string &getPackageName() const { return this->_packageName; }

        const Rect &getBounds() const { return this->_bounds; }

        int getIndex() const { return this->_index; }

        bool getClickable() const { return this->_clickable; }

        bool getLongClickable() const { return this->_longClickable; }

        bool getCheckable() const { return this->_checkable; }

        bool getScrollable() const { return this->_scrollable; }

        bool getEnable() const { return this->_enabled; }

        bool getPassword() const { return this->_password; }

        bool getSelected() const { return this->_selected; }

        void reSetText(const std::string &text) { this->_text = text; }

        void reSetResourceID(const std::string &resourceID) { this->_resourceID = resourceID; }

        void reSetClassname(const std::string &className) { this->_classname = className; }

        void reSetClickable(bool clickable) { this->_clickable = clickable; }

        void reSetScrollable(bool scrollable) { this->_scrollable = scrollable; }

        void reSetEnabled(bool enable) { this->_enabled = enable; }

        void reSetBounds(const Rect &rect) { this->_bounds = rect; }

        void reAddChild(const std::shared_ptr<Element> &child);

        /// Attributes of the enclosing <hierarchy> tag, empty for bare node dumps
        const std::string &getActivity() const { return this->_activity; }

        std::string toJson() const;

        std::string toString() const override;

        /**
         * @brief Parse a UI hierarchy dump
         *
         * @param xmlContent XML text
         * @return root Element, or nullptr when the document cannot be parsed
         */
        static std::shared_ptr<Element> createFromXml(const std::string &xmlContent);

        virtual ~Element() = default;

    protected:
        void fromXMLNode(const tinyxml2::XMLElement *xmlNode,
                         const std::shared_ptr<Element> &parentOfNode);

        std::string _resourceID;
        std::string _classname;
        std::string _packageName;
        std::string _text;
        std::string _contentDesc;
        std::string _activity;

        bool _enabled;
        bool _checked;
        bool _checkable;
        bool _clickable;
        bool _scrollable;
        bool _longClickable;
        int _index;
        bool _password;
        bool _selected;

        Rect _bounds;
        std::vector<std::shared_ptr<Element> > _children;
        std::weak_ptr<Element> _parent;
    };

    typedef std::shared_ptr<Element> ElementPtr;
    typedef std::vector<ElementPtr> ElementPtrVec;

}

#endif //Element_H_
