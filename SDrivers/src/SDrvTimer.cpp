// SDrivers Timer - Implementation
// Namespace: SDrv

#include "SDrvTimer.h"
#include "SArchPIT.h"
#include "SKInterrupts.h"
#include "SKPanic.h"
#include "SKScheduler.h"
#include "SKSemaphore.h"
#include "SCLogger.h"

namespace SDrv
{

    struct Timer::Sleeper
    {
        SC::u64 wakeTick;
        SK::Semaphore wakeup{0};
        Sleeper *next = nullptr;

        explicit Sleeper(SC::u64 tick) : wakeTick(tick) {}
    };

    Timer &Timer::instance()
    {
        static Timer instance;
        return instance;
    }

    Timer::Timer()
        : m_callback(nullptr), m_ticks(0), m_frequency(DEFAULT_FREQUENCY), m_sleepers(nullptr)
    {
    }

    void Timer::initialize(SC::u32 frequencyHz)
    {
        if (frequencyHz < SArch::PIT::MIN_FREQUENCY || frequencyHz > 1000)
        {
            SK::panic("timer frequency %u Hz outside %u..1000", frequencyHz, SArch::PIT::MIN_FREQUENCY);
        }

        SC_LOG_INFO("SDrvTimer", "Initializing timer at %u Hz", frequencyHz);

        {
            SK::InterruptGuard guard;
            m_ticks = 0;
            m_frequency = frequencyHz;
            m_sleepers = nullptr;
            m_callback = nullptr;
        }

        SArch::PIT::instance().configure(SArch::PIT::Channel::Out0, SArch::PIT::Mode::RateGenerator, frequencyHz);

        SK::InterruptManager &interrupts = SK::InterruptManager::instance();
        interrupts.registerHandler(
            SK::IRQ_TIMER,
            [](SK::InterruptFrame *)
            {
                Timer::instance().handleInterrupt();
            },
            "8254 Timer");
        interrupts.enableInterrupt(SK::IRQ_TIMER - SK::IRQ_BASE);

        SC_LOG_INFO("SDrvTimer", "Timer initialized");
    }

    void Timer::setCallback(TimerCallback callback)
    {
        SK::InterruptGuard guard;
        m_callback = callback;
    }

    SC::u64 Timer::ticks() const
    {
        SK::InterruptGuard guard;
        return m_ticks;
    }

    SC::u64 Timer::milliseconds() const
    {
        return (ticks() * 1000) / m_frequency;
    }

    SC::usize Timer::sleeperCount() const
    {
        SK::InterruptGuard guard;
        SC::usize count = 0;
        for (const Sleeper *s = m_sleepers; s; s = s->next)
        {
            ++count;
        }
        return count;
    }

    void Timer::sleep(SC::i64 ticks)
    {
        if (ticks <= 0)
            return;

        Sleeper self(0);
        {
            SK::InterruptGuard guard;
            self.wakeTick = m_ticks + static_cast<SC::u64>(ticks);

            Sleeper **link = &m_sleepers;
            while (*link && (*link)->wakeTick <= self.wakeTick)
            {
                link = &(*link)->next;
            }
            self.next = *link;
            *link = &self;
        }

        // The interrupt handler unlinks us before the up()
        self.wakeup.down();
    }

    void Timer::sleepMilliseconds(SC::i64 ms)
    {
        if (ms <= 0)
            return;

        // Round up so a short sleep still waits at least one tick
        SC::i64 ticks = (ms * m_frequency + 999) / 1000;
        sleep(ticks);
    }

    void Timer::handleInterrupt()
    {
        SC::u64 now = ++m_ticks;

        while (m_sleepers && m_sleepers->wakeTick <= now)
        {
            Sleeper *due = m_sleepers;
            m_sleepers = due->next;
            due->next = nullptr;
            due->wakeup.up();
        }

        if (m_callback)
        {
            m_callback(now);
        }

        SK::Scheduler::instance().tick();
    }

} // namespace SDrv
