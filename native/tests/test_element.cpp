/*
 * Unit tests for Element class
 */
#include <gtest/gtest.h>
#include "../desc/Element.h"
#include <memory>

using namespace scoutbot;

class ElementTest : public ::testing::Test {
protected:
    void SetUp() override {
        element = std::make_shared<Element>();
    }

    ElementPtr element;

    std::string createSimpleXML() {
        return R"(<?xml version="1.0" encoding="UTF-8"?>
<hierarchy activity="com.shop.MainActivity" package="com.shop">
    <node bounds="[0,0][1080,1920]" class="android.widget.FrameLayout">
        <node bounds="[0,0][100,100]"
              clickable="true"
              class="android.widget.Button"
              text="Click Me"
              resource-id="com.shop:id/button"
              content-desc="Button Description"/>
        <node bounds="[0,200][1080,900]" scrollable="true" class="android.widget.ListView"/>
    </node>
</hierarchy>)";
    }
};

TEST_F(ElementTest, DefaultConstructor) {
    EXPECT_FALSE(element->getClickable());
    EXPECT_FALSE(element->getLongClickable());
    EXPECT_FALSE(element->getScrollable());
    EXPECT_TRUE(element->getEnable());
    EXPECT_TRUE(element->getBounds().isEmpty());
}

TEST_F(ElementTest, PropertySetters) {
    element->reSetClickable(true);
    element->reSetScrollable(true);
    element->reSetEnabled(false);
    element->reSetText("Save");
    element->reSetResourceID("com.shop:id/save");
    element->reSetBounds(Rect(1, 2, 3, 4));
    EXPECT_TRUE(element->getClickable());
    EXPECT_TRUE(element->getScrollable());
    EXPECT_FALSE(element->getEnable());
    EXPECT_EQ(element->getText(), "Save");
    EXPECT_EQ(element->getResourceID(), "com.shop:id/save");
    EXPECT_EQ(element->getBounds(), Rect(1, 2, 3, 4));
}

TEST_F(ElementTest, IsEditText) {
    element->reSetClassname("android.widget.EditText");
    EXPECT_TRUE(element->isEditText());
    element->reSetClassname("android.widget.Button");
    EXPECT_FALSE(element->isEditText());
}

TEST_F(ElementTest, CreateFromXml) {
    auto root = Element::createFromXml(createSimpleXML());
    ASSERT_NE(root, nullptr);
    EXPECT_EQ(root->getActivity(), "com.shop.MainActivity");
    EXPECT_EQ(root->getPackageName(), "com.shop");
    ASSERT_EQ(root->getChildren().size(), 2u);

    auto button = root->getChildren()[0];
    EXPECT_TRUE(button->getClickable());
    EXPECT_EQ(button->getText(), "Click Me");
    EXPECT_EQ(button->getResourceID(), "com.shop:id/button");
    EXPECT_EQ(button->getContentDesc(), "Button Description");
    EXPECT_EQ(button->getBounds(), Rect(0, 0, 100, 100));
    // children inherit the package of the hierarchy
    EXPECT_EQ(button->getPackageName(), "com.shop");
    EXPECT_EQ(button->getParent().lock(), root);

    EXPECT_TRUE(root->getChildren()[1]->getScrollable());
}

TEST_F(ElementTest, CreateFromXml_Invalid) {
    EXPECT_EQ(Element::createFromXml("<hierarchy><node"), nullptr);
}

TEST_F(ElementTest, CreateFromXml_Empty) {
    EXPECT_EQ(Element::createFromXml(""), nullptr);
    EXPECT_EQ(Element::createFromXml("<hierarchy></hierarchy>"), nullptr);
}

TEST_F(ElementTest, MalformedBoundsStayEmpty) {
    auto root = Element::createFromXml(R"(<node bounds="0,0,10,10" clickable="true"/>)");
    ASSERT_NE(root, nullptr);
    EXPECT_TRUE(root->getBounds().isEmpty());
}

TEST_F(ElementTest, LongClickableAndPassword) {
    auto root = Element::createFromXml(
            R"(<node bounds="[0,0][10,10]" long-clickable="true" password="true" class="android.widget.EditText"/>)");
    ASSERT_NE(root, nullptr);
    EXPECT_TRUE(root->getLongClickable());
    EXPECT_TRUE(root->getPassword());
}

TEST_F(ElementTest, RecursiveElements) {
    auto root = Element::createFromXml(createSimpleXML());
    ASSERT_NE(root, nullptr);
    std::vector<ElementPtr> result;
    root->recursiveElements([](const ElementPtr &e) { return e->getClickable(); }, result);
    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result[0]->getText(), "Click Me");
}

TEST_F(ElementTest, RecursiveDoElements) {
    auto child = std::make_shared<Element>();
    element->reAddChild(child);
    child->reAddChild(std::make_shared<Element>());
    int count = 0;
    element->recursiveDoElements([&count](const ElementPtr &) { count++; });
    EXPECT_EQ(count, 2);
}

TEST_F(ElementTest, ToJson) {
    element->reSetText("Hello");
    std::string json = element->toJson();
    EXPECT_NE(json.find("\"text\":\"Hello\""), std::string::npos);
    EXPECT_EQ(element->toString(), json);
}
