/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef Base_CPP_
#define Base_CPP_

#include "Base.h"
#include <xxhash.h>
#include <algorithm>
#include <sstream>
#include <iomanip>
#include <ctime>
#include <cstdio>
#include <chrono>
#include <cctype>

namespace scoutbot {

    const char *actionTypeName(ActionType type) {
        switch (type) {
            case TAP:
                return "tap";
            case SCROLL:
                return "scroll";
            case BACK:
                return "back";
            case LAUNCH:
                return "launch";
            case RESTART:
                return "restart";
            default:
                return "nop";
        }
    }

    const char *scrollDirectionName(ScrollDirection direction) {
        switch (direction) {
            case ScrollDirection::Up:
                return "up";
            case ScrollDirection::Down:
                return "down";
            case ScrollDirection::Left:
                return "left";
            case ScrollDirection::Right:
                return "right";
        }
        return "down";
    }

    Point::Point()
            : x(0), y(0) {}

    Point::Point(int x, int y)
            : x(x), y(y) {}

    bool Point::operator==(const Point &other) const {
        return this->x == other.x && this->y == other.y;
    }

    const Rect Rect::RectZero = Rect();

    Rect::Rect()
            : left(0), top(0), right(0), bottom(0) {}

    Rect::Rect(int left, int top, int right, int bottom)
            : left(left), top(top), right(right), bottom(bottom) {}

    Rect Rect::fromXYWH(int x, int y, int width, int height) {
        return Rect(x, y, x + width, y + height);
    }

    bool Rect::isEmpty() const {
        return this->right <= this->left || this->bottom <= this->top;
    }

    bool Rect::contains(const Point &point) const {
        return point.x >= this->left && point.x < this->right
               && point.y >= this->top && point.y < this->bottom;
    }

    Point Rect::center() const {
        return Point((this->left + this->right) / 2, (this->top + this->bottom) / 2);
    }

    bool Rect::operator==(const Rect &other) const {
        return this->left == other.left && this->top == other.top
               && this->right == other.right && this->bottom == other.bottom;
    }

    std::string Rect::toString() const {
        std::stringstream ss;
        ss << "[" << this->left << "," << this->top << "][" << this->right << "," << this->bottom << "]";
        return ss.str();
    }

    uint64_t fastStringHash(const std::string &str) {
        return static_cast<uint64_t>(XXH64(str.data(), str.size(), 0));
    }

    std::string hashHex(const std::string &str, size_t length) {
        std::stringstream ss;
        ss << std::hex << std::setw(16) << std::setfill('0') << fastStringHash(str);
        std::string digest = ss.str();
        if (length < digest.size()) {
            digest.resize(length);
        }
        return digest;
    }

    std::string getTimeFormatStr() {
        auto now = std::chrono::system_clock::now();
        std::time_t seconds = std::chrono::system_clock::to_time_t(now);
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()).count() % 1000;
        std::tm localTime{};
        localtime_r(&seconds, &localTime);
        char buffer[32];
        std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &localTime);
        char result[40];
        snprintf(result, sizeof(result), "%s.%03d", buffer, static_cast<int>(millis));
        return std::string(result);
    }

    std::string toLowerCase(const std::string &str) {
        std::string lower = str;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return lower;
    }

    bool containsAnyWord(const std::string &lowerText, const stringVec &words) {
        if (lowerText.empty())
            return false;
        for (const auto &word: words) {
            if (!word.empty() && lowerText.find(word) != std::string::npos)
                return true;
        }
        return false;
    }

}

#endif // Base_CPP_
