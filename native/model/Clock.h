/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef Clock_H_
#define Clock_H_

#include <memory>
#include <mutex>

namespace scoutbot {

    /**
     * @brief Time source of a run; every wait of the engine goes through it
     */
    class Clock {
    public:
        /// monotonic milliseconds
        virtual long nowMs() const = 0;

        virtual void sleepMs(long ms) = 0;

        virtual ~Clock() = default;
    };

    typedef std::shared_ptr<Clock> ClockPtr;

    class SteadyClock : public Clock {
    public:
        long nowMs() const override;

        void sleepMs(long ms) override;
    };

    /**
     * @brief Clock that only moves when told to; sleeping advances it instantly
     */
    class ManualClock : public Clock {
    public:
        explicit ManualClock(long startMs = 0);

        long nowMs() const override;

        void sleepMs(long ms) override;

        void advance(long ms);

        /// total time requested through sleepMs()
        long sleptMs() const;

    private:
        mutable std::mutex _lock;
        long _now;
        long _slept;
    };

    typedef std::shared_ptr<ManualClock> ManualClockPtr;

}

#endif //Clock_H_
