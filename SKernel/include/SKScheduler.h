#pragma once

// SKernel Scheduler - Priority scheduling of kernel threads
// Namespace: SK

#include "SCTypes.h"
#include "SKThread.h"

namespace SK
{

    struct SchedulerConfig
    {
        // Timer ticks a thread may run before yielding to its priority class
        SC::u32 timeSlice = 4;
        WakePolicy wakePolicy = WakePolicy::Fifo;
    };

    struct SchedulerStats
    {
        SC::u64 idleTicks = 0;
        SC::u64 kernelTicks = 0;
        SC::u64 contextSwitches = 0;
    };

    class Scheduler
    {
    public:
        static Scheduler &instance();

        // Adopts the boot code as the "main" thread. ThreadRegistry must be initialized.
        void initialize(const SchedulerConfig &config);

        // Creates the idle thread, enables interrupts and returns once idle has run
        void start();

        const SchedulerConfig &config() const { return m_config; }
        WakePolicy wakePolicy() const { return m_config.wakePolicy; }

        // Timer interrupt: account the tick, request preemption when the
        // slice is spent or a higher priority thread is ready
        void tick();

        // Running -> Ready at the tail of its class, then switch
        void yield();

        // Running -> Blocked on waitList, then switch. Interrupts must be off.
        void blockCurrentOn(ThreadQueue &waitList);

        // Blocked -> Ready. Requests preemption if thread outranks the caller.
        void unblock(Thread &thread);

        // Running -> Dying. Stack and slot are reclaimed after the next switch.
        [[noreturn]] void exitCurrent();

        // New thread from the registry: -> Ready
        void admit(Thread &thread);

        ThreadId current() const;
        Thread &currentThread() const;
        // Unchecked; nullptr before initialize()
        const Thread *runningThread() const { return m_running; }
        const Thread *idleThread() const { return m_idle; }
        bool started() const { return m_idle != nullptr; }

        // Base priority of the running thread. Effective priority never drops
        // below an active donation.
        void setPriority(SC::u8 priority);
        SC::u8 priority() const;

        // Moves a thread to the priority class matching newPriority
        void setEffectivePriority(Thread &thread, SC::u8 newPriority);

        // max(base, highest donor); called when donations change
        void refreshPriority(Thread &thread);

        bool yieldPending() const { return m_yieldPending; }

        SC::usize readyCount() const;
        const SchedulerStats &stats() const { return m_stats; }
        void logStats() const;

        // Entry trampoline target for new threads
        [[noreturn]] void runThread();

    private:
        Scheduler();
        ~Scheduler() = default;
        Scheduler(const Scheduler &) = delete;
        Scheduler &operator=(const Scheduler &) = delete;

        static void idleMain(void *arg);

        void readyPush(Thread &thread);
        void readyRemove(Thread &thread);
        int highestReadyPriority() const;
        Thread &selectNext();
        void checkThread(const Thread &thread) const;
        void schedule();
        void scheduleTail();
        void preemptIfOutranked(const Thread &thread);

        SchedulerConfig m_config;
        ThreadQueue m_ready[PRIORITY_COUNT];
        SC::u64 m_readyMask;

        Thread *m_running;
        Thread *m_previous;
        Thread *m_idle;

        SC::u32 m_sliceTicks;
        bool m_yieldPending;
        SchedulerStats m_stats;
    };

} // namespace SK
