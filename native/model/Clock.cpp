/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef Clock_CPP_
#define Clock_CPP_

#include "Clock.h"
#include <chrono>
#include <thread>

namespace scoutbot {

    long SteadyClock::nowMs() const {
        return static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now().time_since_epoch()).count());
    }

    void SteadyClock::sleepMs(long ms) {
        if (ms > 0)
            std::this_thread::sleep_for(std::chrono::milliseconds(ms));
    }

    ManualClock::ManualClock(long startMs)
            : _now(startMs), _slept(0) {
    }

    long ManualClock::nowMs() const {
        std::lock_guard<std::mutex> guard(this->_lock);
        return this->_now;
    }

    void ManualClock::sleepMs(long ms) {
        if (ms <= 0)
            return;
        std::lock_guard<std::mutex> guard(this->_lock);
        this->_now += ms;
        this->_slept += ms;
    }

    void ManualClock::advance(long ms) {
        std::lock_guard<std::mutex> guard(this->_lock);
        this->_now += ms;
    }

    long ManualClock::sleptMs() const {
        std::lock_guard<std::mutex> guard(this->_lock);
        return this->_slept;
    }

}

#endif //Clock_CPP_
