#pragma once

// SDrivers Timer - PIT-driven system tick and sleeping
// Namespace: SDrv

#include "SCTypes.h"

namespace SDrv
{

    // Runs in interrupt context on every tick; must not block
    using TimerCallback = void (*)(SC::u64 ticks);

    class Timer
    {
    public:
        static constexpr SC::u32 DEFAULT_FREQUENCY = 100;

        static Timer &instance();

        // Programs PIT channel 0 and routes IRQ 0 to the scheduler tick
        void initialize(SC::u32 frequencyHz = DEFAULT_FREQUENCY);

        void setCallback(TimerCallback callback);

        SC::u64 ticks() const;
        SC::u64 elapsed(SC::u64 then) const { return ticks() - then; }
        SC::u64 milliseconds() const;
        SC::u32 frequency() const { return m_frequency; }

        // Blocks the calling thread for at least ticks timer ticks.
        // Returns immediately for ticks <= 0.
        void sleep(SC::i64 ticks);
        void sleepMilliseconds(SC::i64 ms);

        SC::usize sleeperCount() const;

        // Called from interrupt handler
        void handleInterrupt();

    private:
        Timer();
        ~Timer() = default;
        Timer(const Timer &) = delete;
        Timer &operator=(const Timer &) = delete;

        struct Sleeper;

        TimerCallback m_callback;
        volatile SC::u64 m_ticks;
        SC::u32 m_frequency;
        // Ordered by wake tick, FIFO among equal ticks
        Sleeper *m_sleepers;
    };

} // namespace SDrv
