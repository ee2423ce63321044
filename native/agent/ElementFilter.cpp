/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef ElementFilter_CPP_
#define ElementFilter_CPP_

#include "ElementFilter.h"

namespace scoutbot {

    namespace {
        constexpr int MinTargetSize = 20;

        const char *const SystemUiIds[] = {
                "android:id/statusBarBackground",
                "android:id/navigationBarBackground",
        };

        const char *const SystemUiPrefix = "com.android.systemui:";
    }

    bool ElementFilterBounds::include(const ClickableElement &element, const FilterContext &context) const {
        const Rect &bounds = element.getBounds();
        if (bounds.isEmpty())
            return false;
        if (bounds.width() < MinTargetSize || bounds.height() < MinTargetSize)
            return false;
        Point center = bounds.center();
        return center.x >= 0 && center.y >= 0
               && center.x < context.screen.getWidth() && center.y < context.screen.getHeight();
    }

    bool ElementFilterSystemUi::include(const ClickableElement &element, const FilterContext & /* context */) const {
        const std::string &resourceId = element.getResourceId();
        if (resourceId.compare(0, std::string(SystemUiPrefix).size(), SystemUiPrefix) == 0)
            return false;
        for (const char *systemId: SystemUiIds) {
            if (resourceId == systemId)
                return false;
        }
        return true;
    }

    ElementFilterPtrVec defaultElementFilters() {
        ElementFilterPtrVec filters;
        filters.push_back(ElementFilterPtr(new ElementFilterBounds()));
        filters.push_back(ElementFilterPtr(new ElementFilterSystemUi()));
        filters.push_back(ElementFilterPtr(new ElementFilterSensitive()));
        filters.push_back(ElementFilterPtr(new ElementFilterDestructive()));
        filters.push_back(ElementFilterPtr(new ElementFilterBlockedId()));
        filters.push_back(ElementFilterPtr(new ElementFilterBackButton()));
        filters.push_back(ElementFilterPtr(new ElementFilterVisited()));
        filters.push_back(ElementFilterPtr(new ElementFilterDangerousPattern()));
        filters.push_back(ElementFilterPtr(new ElementFilterPolicySkip()));
        return filters;
    }

}

#endif //ElementFilter_CPP_
