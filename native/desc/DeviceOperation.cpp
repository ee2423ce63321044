/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef DeviceOperation_CPP_
#define DeviceOperation_CPP_

#include "DeviceOperation.h"
#include "../utils.hpp"
#include <nlohmann/json.hpp>

namespace scoutbot {

    DeviceOperation::DeviceOperation()
            : act(ActionType::NOP), direction(ScrollDirection::Down), waitTime(0) {
    }

    DeviceOperation DeviceOperation::tap(const std::string &screenId, const std::string &elementId,
                                         const Rect &bounds) {
        DeviceOperation operation;
        operation.act = ActionType::TAP;
        operation.sid = screenId;
        operation.aid = elementId;
        operation.pos = bounds;
        return operation;
    }

    DeviceOperation DeviceOperation::scroll(const std::string &screenId, const std::string &containerId,
                                            const Rect &bounds, ScrollDirection direction) {
        DeviceOperation operation;
        operation.act = ActionType::SCROLL;
        operation.sid = screenId;
        operation.aid = containerId;
        operation.pos = bounds;
        operation.direction = direction;
        return operation;
    }

    DeviceOperation DeviceOperation::back(const std::string &screenId) {
        DeviceOperation operation;
        operation.act = ActionType::BACK;
        operation.sid = screenId;
        return operation;
    }

    DeviceOperation DeviceOperation::launch(const std::string &packageName, bool forceRestart) {
        DeviceOperation operation;
        operation.act = forceRestart ? ActionType::RESTART : ActionType::LAUNCH;
        operation.packageName = packageName;
        return operation;
    }

    bool DeviceOperation::fromJson(const std::string &jsonContent, DeviceOperation &operation) {
        try {
            nlohmann::json j = nlohmann::json::parse(jsonContent);
            std::string act = j.at("act").get<std::string>();
            bool known = false;
            for (int type = ActionType::NOP; type < ActionType::ActTypeSize; type++) {
                if (act == actionTypeName(static_cast<ActionType>(type))) {
                    operation.act = static_cast<ActionType>(type);
                    known = true;
                    break;
                }
            }
            if (!known) {
                BLOGE("unknown operation type %s", act.c_str());
                return false;
            }
            const nlohmann::json &pos = j.at("pos");
            operation.pos = Rect(pos.at(0).get<int>(), pos.at(1).get<int>(), pos.at(2).get<int>(),
                                 pos.at(3).get<int>());
            operation.sid = j.value("sid", "");
            operation.aid = j.value("aid", "");
            operation.packageName = j.value("package", "");
            operation.waitTime = j.value("waitTime", 0L);
            std::string direction = j.value("direction", std::string(scrollDirectionName(ScrollDirection::Down)));
            for (ScrollDirection candidate: {ScrollDirection::Up, ScrollDirection::Down, ScrollDirection::Left,
                                             ScrollDirection::Right}) {
                if (direction == scrollDirectionName(candidate))
                    operation.direction = candidate;
            }
        } catch (nlohmann::json::exception &ex) {
            BLOGE("parse operation error happened: id,%d: %s", ex.id, ex.what());
            return false;
        }
        return true;
    }

    std::string DeviceOperation::toString() const {
        nlohmann::json j;
        j["act"] = actionTypeName(this->act);
        j["pos"] = {this->pos.left, this->pos.top, this->pos.right, this->pos.bottom};
        if (!this->sid.empty())
            j["sid"] = this->sid;
        if (!this->aid.empty())
            j["aid"] = this->aid;
        if (this->act == ActionType::SCROLL)
            j["direction"] = scrollDirectionName(this->direction);
        if (!this->packageName.empty())
            j["package"] = this->packageName;
        if (this->waitTime > 0)
            j["waitTime"] = this->waitTime;
        return j.dump();
    }

}

#endif //DeviceOperation_CPP_
