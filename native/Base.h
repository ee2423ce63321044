/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef Base_H_
#define Base_H_

#include <string>
#include <vector>
#include <set>
#include <memory>
#include <cstdint>

namespace scoutbot {

    typedef std::vector<std::string> stringVec;

    /**
     * @brief Kinds of gestures the engine can ask the device to perform
     */
    enum ActionType {
        NOP = 0,
        TAP,
        SCROLL,
        BACK,
        LAUNCH,
        RESTART,
        ActTypeSize
    };

    const char *actionTypeName(ActionType type);

    enum class ScrollDirection {
        Up,
        Down,
        Left,
        Right
    };

    const char *scrollDirectionName(ScrollDirection direction);

    class Point {
    public:
        Point();

        Point(int x, int y);

        bool operator==(const Point &other) const;

        int x;
        int y;
    };

    /**
     * @brief Axis aligned rectangle in screen pixels, [left, top] to [right, bottom]
     */
    class Rect {
    public:
        Rect();

        Rect(int left, int top, int right, int bottom);

        static Rect fromXYWH(int x, int y, int width, int height);

        int width() const { return this->right - this->left; }

        int height() const { return this->bottom - this->top; }

        bool isEmpty() const;

        bool contains(const Point &point) const;

        Point center() const;

        bool operator==(const Rect &other) const;

        bool operator!=(const Rect &other) const { return !(*this == other); }

        std::string toString() const;

        int left;
        int top;
        int right;
        int bottom;

        static const Rect RectZero;
    };

    class HashNode {
    public:
        virtual uintptr_t hash() const = 0;

        virtual ~HashNode() = default;
    };

    class Serializable {
    public:
        virtual std::string toString() const = 0;

        virtual ~Serializable() = default;
    };

    /// xxHash64 of a string, seed 0
    uint64_t fastStringHash(const std::string &str);

    /// Lower case hex digest of fastStringHash, truncated to length characters
    std::string hashHex(const std::string &str, size_t length = 16);

    std::string getTimeFormatStr();

    std::string toLowerCase(const std::string &str);

    /// true when lowerText contains any of the (already lower case) words
    bool containsAnyWord(const std::string &lowerText, const stringVec &words);

}

#endif // Base_H_
