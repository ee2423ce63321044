/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef SimulatedApp_CPP_
#define SimulatedApp_CPP_

#include "SimulatedApp.h"
#include "../../desc/ScreenFactory.h"
#include "../../events/Preference.h"
#include "../../utils.hpp"
#include <nlohmann/json.hpp>
#include <cstring>
#include <sstream>

namespace scoutbot {

    namespace {
        constexpr int RowTop = 200;
        constexpr int RowHeight = 120;
        constexpr int RowGap = 40;
        constexpr int RowMargin = 40;

        std::string xmlEscape(const std::string &text) {
            std::string escaped;
            escaped.reserve(text.size());
            for (char c: text) {
                switch (c) {
                    case '&':
                        escaped += "&amp;";
                        break;
                    case '<':
                        escaped += "&lt;";
                        break;
                    case '>':
                        escaped += "&gt;";
                        break;
                    case '"':
                        escaped += "&quot;";
                        break;
                    default:
                        escaped += c;
                }
            }
            return escaped;
        }

        std::string boundsAttribute(const Rect &rect) {
            std::stringstream ss;
            ss << "[" << rect.left << "," << rect.top << "][" << rect.right << "," << rect.bottom << "]";
            return ss.str();
        }

        std::string qualifiedId(const std::string &packageName, const std::string &resourceId) {
            if (resourceId.empty() || resourceId.find(':') != std::string::npos)
                return resourceId;
            return packageName + ":id/" + resourceId;
        }

        std::string elementKey(const SimulatedElement &element) {
            return element.resourceId.empty() ? element.text : element.resourceId;
        }

        Rect parseBounds(const nlohmann::json &value) {
            if (!value.is_array() || value.size() != 4)
                return Rect();
            return Rect(value[0].get<int>(), value[1].get<int>(), value[2].get<int>(), value[3].get<int>());
        }

        stringVec parseTargets(const nlohmann::json &value) {
            stringVec targets;
            if (value.is_string()) {
                targets.push_back(value.get<std::string>());
            } else if (value.is_array()) {
                for (const auto &item: value) {
                    if (item.is_string())
                        targets.push_back(item.get<std::string>());
                }
            }
            return targets;
        }
    }

    SimulatedApp::SimulatedApp(std::string packageName, int width, int height)
            : _packageName(std::move(packageName)), _width(width), _height(height),
              _foreground(Foreground::Launcher), _launches(0), _backPresses(0), _failCaptures(0), _failTaps(0),
              _unavailable(false), _launchBroken(false) {
    }

    std::shared_ptr<SimulatedApp> SimulatedApp::fromJson(const std::string &jsonContent) {
        try {
            nlohmann::json doc = nlohmann::json::parse(jsonContent);
            std::string packageName = doc.value("package", std::string());
            if (packageName.empty()) {
                BLOGE("app description without package");
                return nullptr;
            }
            auto app = std::make_shared<SimulatedApp>(packageName, doc.value("width", 1080),
                                                      doc.value("height", 1920));
            std::string home;
            for (const auto &item: doc.at("screens")) {
                SimulatedScreen screen;
                screen.name = item.at("name").get<std::string>();
                screen.xml = item.value("xml", std::string());
                screen.passwordField = item.value("password", false);
                if (item.contains("texts"))
                    screen.texts = item["texts"].get<stringVec>();
                if (item.contains("elements")) {
                    for (const auto &node: item["elements"]) {
                        SimulatedElement element;
                        element.resourceId = node.value("id", std::string());
                        element.text = node.value("text", std::string());
                        element.contentDescription = node.value("desc", std::string());
                        element.className = node.value("class", element.className);
                        element.page = node.value("page", 0);
                        if (node.contains("bounds"))
                            element.bounds = parseBounds(node["bounds"]);
                        if (node.contains("to"))
                            element.targets = parseTargets(node["to"]);
                        screen.elements.push_back(element);
                    }
                }
                if (item.contains("scrollables")) {
                    for (const auto &node: item["scrollables"]) {
                        SimulatedScroll scroll;
                        scroll.resourceId = node.value("id", std::string());
                        scroll.className = node.value("class", scroll.className);
                        if (node.contains("bounds"))
                            scroll.bounds = parseBounds(node["bounds"]);
                        screen.scrollables.push_back(scroll);
                    }
                }
                if (item.contains("transitions")) {
                    for (auto it = item["transitions"].begin(); it != item["transitions"].end(); ++it) {
                        screen.transitions[it.key()] = parseTargets(it.value());
                    }
                }
                if (home.empty())
                    home = screen.name;
                app->addScreen(screen);
            }
            app->setHome(doc.value("home", home));
            return app;
        } catch (nlohmann::json::exception &ex) {
            BLOGE("parse app description error happened: id,%d: %s", ex.id, ex.what());
        }
        return nullptr;
    }

    std::shared_ptr<SimulatedApp> SimulatedApp::fromFile(const std::string &path) {
        std::string content = Preference::loadFileContent(path);
        if (content.empty()) {
            BLOGE("app description %s is empty or missing", path.c_str());
            return nullptr;
        }
        return fromJson(content);
    }

    void SimulatedApp::addScreen(const SimulatedScreen &screen) {
        SimulatedScreen laidOut = screen;
        std::map<int, int> rowOfPage;
        for (auto &element: laidOut.elements) {
            int row = rowOfPage[element.page]++;
            if (element.bounds.isEmpty()) {
                int top = RowTop + row * (RowHeight + RowGap);
                element.bounds = Rect(RowMargin, top, this->_width - RowMargin, top + RowHeight);
            }
        }
        for (auto &scroll: laidOut.scrollables) {
            if (scroll.bounds.isEmpty())
                scroll.bounds = Rect(0, RowTop, this->_width, this->_height - RowTop);
        }
        std::lock_guard<std::mutex> guard(this->_deviceLock);
        this->_screens[laidOut.name] = laidOut;
    }

    std::string SimulatedApp::renderXml(const SimulatedScreen &screen, const std::string &packageName, int width,
                                        int height, int page) {
        if (!screen.xml.empty())
            return screen.xml;
        std::stringstream xml;
        xml << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>"
            << "<hierarchy rotation=\"0\" activity=\"" << xmlEscape(screen.name) << "\" package=\""
            << xmlEscape(packageName) << "\">"
            << "<node index=\"0\" text=\"\" resource-id=\"\" class=\"android.widget.FrameLayout\" package=\""
            << xmlEscape(packageName) << "\" content-desc=\"\" clickable=\"false\" enabled=\"true\" "
            << "scrollable=\"false\" bounds=\"" << boundsAttribute(Rect(0, 0, width, height)) << "\">";
        int index = 0;
        for (size_t i = 0; i < screen.texts.size(); i++) {
            Rect bounds(RowMargin, 40 + static_cast<int>(i) * 50, width - RowMargin, 80 + static_cast<int>(i) * 50);
            xml << "<node index=\"" << ++index << "\" text=\"" << xmlEscape(screen.texts[i])
                << "\" resource-id=\"\" class=\"android.widget.TextView\" package=\"" << xmlEscape(packageName)
                << "\" content-desc=\"\" clickable=\"false\" enabled=\"true\" scrollable=\"false\" bounds=\""
                << boundsAttribute(bounds) << "\"/>";
        }
        if (screen.passwordField) {
            Rect bounds(RowMargin, height - 400, width - RowMargin, height - 300);
            xml << "<node index=\"" << ++index << "\" text=\"\" resource-id=\""
                << xmlEscape(qualifiedId(packageName, "password")) << "\" class=\"android.widget.EditText\" "
                << "package=\"" << xmlEscape(packageName) << "\" content-desc=\"\" clickable=\"true\" "
                << "enabled=\"true\" scrollable=\"false\" password=\"true\" bounds=\"" << boundsAttribute(bounds)
                << "\"/>";
        }
        for (const auto &scroll: screen.scrollables) {
            xml << "<node index=\"" << ++index << "\" text=\"\" resource-id=\""
                << xmlEscape(qualifiedId(packageName, scroll.resourceId)) << "\" class=\""
                << xmlEscape(scroll.className) << "\" package=\"" << xmlEscape(packageName)
                << "\" content-desc=\"\" clickable=\"false\" enabled=\"true\" scrollable=\"true\" bounds=\""
                << boundsAttribute(scroll.bounds) << "\"/>";
        }
        for (const auto &element: screen.elements) {
            if (element.page > page)
                continue;
            xml << "<node index=\"" << ++index << "\" text=\"" << xmlEscape(element.text) << "\" resource-id=\""
                << xmlEscape(qualifiedId(packageName, element.resourceId)) << "\" class=\""
                << xmlEscape(element.className) << "\" package=\"" << xmlEscape(packageName)
                << "\" content-desc=\"" << xmlEscape(element.contentDescription)
                << "\" clickable=\"true\" enabled=\"true\" scrollable=\"false\" bounds=\""
                << boundsAttribute(element.bounds) << "\"/>";
        }
        xml << "</node></hierarchy>";
        return xml.str();
    }

    const SimulatedScreen *SimulatedApp::topScreen() const {
        if (this->_stack.empty())
            return nullptr;
        auto it = this->_screens.find(this->_stack.back());
        return it == this->_screens.end() ? nullptr : &it->second;
    }

    std::string SimulatedApp::currentName() const {
        std::lock_guard<std::mutex> guard(this->_deviceLock);
        switch (this->_foreground) {
            case Foreground::Launcher:
                return SimulatedTargets::LauncherPackage;
            case Foreground::External:
                return this->_externalPackage;
            case Foreground::CrashDialog:
                return SimulatedTargets::CrashActivity;
            case Foreground::Target:
                break;
        }
        return this->_stack.empty() ? "" : this->_stack.back();
    }

    CaptureStatus SimulatedApp::captureCurrentScreen(ScreenPtr &screen) {
        std::lock_guard<std::mutex> guard(this->_deviceLock);
        if (this->_unavailable)
            return CaptureStatus::Unavailable;
        if (this->_failCaptures > 0) {
            this->_failCaptures--;
            return CaptureStatus::TransientFailure;
        }
        switch (this->_foreground) {
            case Foreground::Launcher:
                screen = std::make_shared<Screen>("Launcher", SimulatedTargets::LauncherPackage, this->_width,
                                                  this->_height);
                return CaptureStatus::Ok;
            case Foreground::External:
                screen = std::make_shared<Screen>("ExternalActivity", this->_externalPackage, this->_width,
                                                  this->_height);
                return CaptureStatus::Ok;
            case Foreground::CrashDialog:
                screen = std::make_shared<Screen>(SimulatedTargets::CrashActivity, "android", this->_width,
                                                  this->_height);
                return CaptureStatus::Ok;
            case Foreground::Target:
                break;
        }
        const SimulatedScreen *top = this->topScreen();
        if (!top) {
            BLOGE("simulated app has no screen on its stack");
            return CaptureStatus::TransientFailure;
        }
        std::string xml = renderXml(*top, this->_packageName, this->_width, this->_height, this->_pages[top->name]);
        screen = ScreenFactory::createScreenFromXml(top->name, this->_packageName, xml, this->_width,
                                                    this->_height);
        return screen ? CaptureStatus::Ok : CaptureStatus::TransientFailure;
    }

    bool SimulatedApp::tap(int x, int y) {
        std::function<void(const std::string &)> hook;
        std::string hitKey;
        {
            std::lock_guard<std::mutex> guard(this->_deviceLock);
            if (this->_failTaps > 0) {
                this->_failTaps--;
                return false;
            }
            const SimulatedScreen *top = this->_foreground == Foreground::Target ? this->topScreen() : nullptr;
            if (!top)
                return true;
            Point point(x, y);
            stringVec targets;
            std::string key;
            if (!top->xml.empty()) {
                ScreenPtr parsed = ScreenFactory::createScreenFromXml(top->name, this->_packageName, top->xml,
                                                                      this->_width, this->_height);
                const ClickableElementPtrVec empty;
                const ClickableElementPtrVec &clickables = parsed ? parsed->getClickables() : empty;
                for (auto it = clickables.rbegin(); it != clickables.rend(); ++it) {
                    if (!(*it)->getBounds().contains(point))
                        continue;
                    const std::string &resourceId = (*it)->getResourceId();
                    key = resourceId.empty() ? (*it)->getText() : resourceId;
                    for (const auto &transition: top->transitions) {
                        if (transition.first == key || qualifiedId(this->_packageName, transition.first) == key) {
                            targets = transition.second;
                            key = transition.first;
                            break;
                        }
                    }
                    break;
                }
            } else {
                int page = this->_pages[top->name];
                for (auto it = top->elements.rbegin(); it != top->elements.rend(); ++it) {
                    if (it->page > page || !it->bounds.contains(point))
                        continue;
                    key = elementKey(*it);
                    targets = it->targets;
                    break;
                }
            }
            if (key.empty())
                return true;
            hitKey = top->name + "/" + key;
            int turn = this->_tapCounts[hitKey]++;
            if (!targets.empty())
                this->applyTarget(targets[static_cast<size_t>(turn) % targets.size()]);
            hook = this->_tapHook;
        }
        if (hook)
            hook(hitKey);
        return true;
    }

    void SimulatedApp::applyTarget(const std::string &target) {
        if (target.empty())
            return;
        if (target == SimulatedTargets::Close) {
            this->_foreground = Foreground::Launcher;
            this->_stack.clear();
        } else if (target == SimulatedTargets::Crash) {
            this->_foreground = Foreground::CrashDialog;
            this->_stack.clear();
        } else if (target == SimulatedTargets::Back) {
            if (this->_stack.size() > 1) {
                this->_stack.pop_back();
            } else {
                this->_foreground = Foreground::Launcher;
                this->_stack.clear();
            }
        } else if (target.compare(0, std::strlen(SimulatedTargets::ExternalPrefix),
                                  SimulatedTargets::ExternalPrefix) == 0) {
            this->_foreground = Foreground::External;
            this->_externalPackage = target.substr(std::strlen(SimulatedTargets::ExternalPrefix));
        } else if (this->_screens.count(target)) {
            this->_stack.push_back(target);
        } else {
            BLOGE("simulated transition to unknown screen %s", target.c_str());
        }
    }

    bool SimulatedApp::scroll(int x, int y, ScrollDirection /* direction */) {
        std::lock_guard<std::mutex> guard(this->_deviceLock);
        const SimulatedScreen *top = this->_foreground == Foreground::Target ? this->topScreen() : nullptr;
        if (!top)
            return true;
        Point point(x, y);
        for (const auto &scroll: top->scrollables) {
            if (scroll.bounds.contains(point)) {
                this->_pages[top->name]++;
                break;
            }
        }
        return true;
    }

    bool SimulatedApp::pressBack() {
        std::lock_guard<std::mutex> guard(this->_deviceLock);
        this->_backPresses++;
        switch (this->_foreground) {
            case Foreground::Target:
                this->applyTarget(SimulatedTargets::Back);
                break;
            case Foreground::External:
                this->_foreground = this->_stack.empty() ? Foreground::Launcher : Foreground::Target;
                break;
            case Foreground::CrashDialog:
                this->_foreground = Foreground::Launcher;
                break;
            case Foreground::Launcher:
                break;
        }
        return true;
    }

    bool SimulatedApp::launchApp(const std::string &packageName, bool forceRestart) {
        std::lock_guard<std::mutex> guard(this->_deviceLock);
        if (packageName != this->_packageName)
            return false;
        this->_launches++;
        if (this->_launchBroken) {
            this->_foreground = Foreground::Launcher;
            this->_stack.clear();
            return true;
        }
        if (forceRestart || this->_stack.empty()) {
            this->_stack.clear();
            this->_stack.push_back(this->_home);
            this->_pages.clear();
        }
        this->_foreground = Foreground::Target;
        return true;
    }

    int SimulatedApp::tapsOn(const std::string &screenName, const std::string &elementKey) const {
        std::lock_guard<std::mutex> guard(this->_deviceLock);
        auto it = this->_tapCounts.find(screenName + "/" + elementKey);
        return it == this->_tapCounts.end() ? 0 : it->second;
    }

}

#endif //SimulatedApp_CPP_
