/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef ScreenFactory_H_
#define ScreenFactory_H_

#include "Screen.h"
#include "Element.h"
#include "../Base.h"

namespace scoutbot {

    /**
     * @brief Builds Screen snapshots from UI hierarchy trees
     */
    class ScreenFactory {
    public:
        /**
         * @brief Interpret a hierarchy as a Screen
         *
         * Clickable nodes become ClickableElements; clickable descendants of a
         * clickable node are folded into their ancestor, whose label borrows the
         * first descendant text. Scrollable nodes become containers, EditText
         * nodes become input fields and every other text is kept as a
         * TextElement.
         *
         * @param activity activity or view identifier, used for the screen identity
         * @param packageName package of the target application
         * @param root root of the hierarchy
         * @param width screen width, 0 to take it from the root bounds
         * @param height screen height, 0 to take it from the root bounds
         * @return the screen, or nullptr when root is null
         */
        static ScreenPtr createScreen(const std::string &activity, const std::string &packageName,
                                      const ElementPtr &root, int width, int height);

        /// parse xml first; activity and package fall back to the <hierarchy> attributes
        static ScreenPtr createScreenFromXml(const std::string &activity, const std::string &packageName,
                                             const std::string &xmlContent, int width, int height);
    };
}

#endif /* ScreenFactory_H_ */
