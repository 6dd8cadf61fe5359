// SKernel Scheduler - Implementation
// Namespace: SK

#include "SKScheduler.h"
#include "SKInterrupts.h"
#include "SKPanic.h"
#include "SKSemaphore.h"
#include "SKThreadRegistry.h"
#include "SArchContext.h"
#include "SArchCPU.h"
#include "SCLogger.h"

namespace SK
{

    namespace
    {
        constexpr const char *LOG_MODULE = "SKSched";
    }

    Scheduler &Scheduler::instance()
    {
        static Scheduler instance;
        return instance;
    }

    Scheduler::Scheduler()
        : m_readyMask(0), m_running(nullptr), m_previous(nullptr), m_idle(nullptr),
          m_sliceTicks(0), m_yieldPending(false)
    {
    }

    void Scheduler::initialize(const SchedulerConfig &config)
    {
        InterruptGuard guard;

        m_config = config;
        if (m_config.timeSlice == 0)
        {
            m_config.timeSlice = 1;
        }

        for (SC::usize p = 0; p < PRIORITY_COUNT; ++p)
        {
            m_ready[p].clear();
        }
        m_readyMask = 0;
        m_previous = nullptr;
        m_idle = nullptr;
        m_sliceTicks = 0;
        m_yieldPending = false;
        m_stats = SchedulerStats();

        m_running = &ThreadRegistry::instance().adoptBootThread("main");

        SC_LOG_INFO(LOG_MODULE, "Scheduler initialized (time slice %u ticks, %s wakeups)",
                    m_config.timeSlice,
                    m_config.wakePolicy == WakePolicy::Fifo ? "FIFO" : "priority");
    }

    void Scheduler::start()
    {
        SK_ASSERT(m_running != nullptr && m_idle == nullptr);

        Semaphore idleStarted(0);
        SC::Result<ThreadId> idle = ThreadRegistry::instance().create("idle", PRIORITY_MIN, &Scheduler::idleMain, &idleStarted);
        if (!idle)
        {
            panic("cannot create the idle thread: %s", SC::statusName(idle.status));
        }

        SArch::CPU::instance().enableInterrupts();

        // idleMain publishes m_idle before it lets us continue
        idleStarted.down();

        SC_LOG_INFO(LOG_MODULE, "Scheduler started (idle tid %u)", m_idle->id);
    }

    void Scheduler::idleMain(void *arg)
    {
        Scheduler &self = instance();
        self.m_idle = &self.currentThread();
        static_cast<Semaphore *>(arg)->up();

        SArch::CPU &cpu = SArch::CPU::instance();
        for (;;)
        {
            // Let someone else run
            cpu.disableInterrupts();
            self.m_idle->state = ThreadState::Blocked;
            self.schedule();

            // Nothing is ready: sleep until the next interrupt
            cpu.waitForInterrupt();
        }
    }

    void Scheduler::readyPush(Thread &thread)
    {
        if (&thread == m_idle)
            return;

        m_ready[thread.priority].pushBack(thread);
        m_readyMask |= SC::u64(1) << thread.priority;
    }

    void Scheduler::readyRemove(Thread &thread)
    {
        ThreadQueue &queue = m_ready[thread.priority];
        queue.remove(thread);
        if (queue.empty())
        {
            m_readyMask &= ~(SC::u64(1) << thread.priority);
        }
    }

    int Scheduler::highestReadyPriority() const
    {
        if (m_readyMask == 0)
            return -1;
        return 63 - __builtin_clzll(m_readyMask);
    }

    SC::usize Scheduler::readyCount() const
    {
        SC::usize count = 0;
        for (SC::usize p = 0; p < PRIORITY_COUNT; ++p)
        {
            count += m_ready[p].size();
        }
        return count;
    }

    Thread &Scheduler::selectNext()
    {
        int top = highestReadyPriority();
        if (top < 0)
        {
            if (!m_idle)
            {
                panic("no runnable thread and no idle thread");
            }
            return *m_idle;
        }

        ThreadQueue &queue = m_ready[top];
        Thread *next = queue.popFront();
        if (queue.empty())
        {
            m_readyMask &= ~(SC::u64(1) << top);
        }

        if (!next || next->state != ThreadState::Ready || next->priority != top)
        {
            panic("ready set inconsistent at priority %d: thread '%s' (tid %u) is %s",
                  top, next ? next->name : "(none)", next ? next->id : 0,
                  next ? threadStateName(next->state) : "missing");
        }
        return *next;
    }

    void Scheduler::checkThread(const Thread &thread) const
    {
        if (thread.magic != THREAD_MAGIC)
        {
            panic("corrupted control block in slot %u", thread.slot);
        }
        if (!ThreadRegistry::instance().intact(thread))
        {
            panic("stack overflow detected in thread '%s' (tid %u)", thread.name, thread.id);
        }
    }

    void Scheduler::schedule()
    {
        SK_ASSERT(interruptLevel() == InterruptLevel::Off);

        Thread &current = *m_running;
        SK_ASSERT(current.state != ThreadState::Running);

        checkThread(current);
        Thread &next = selectNext();
        checkThread(next);

        m_yieldPending = false;
        m_previous = &current;

        if (&next != &current)
        {
            ++m_stats.contextSwitches;
            m_running = &next;
            SArch::switchContext(current.context, next.context);
        }

        scheduleTail();
    }

    void Scheduler::scheduleTail()
    {
        Thread &current = *m_running;
        current.state = ThreadState::Running;
        m_sliceTicks = 0;

        // The previous thread's stack is no longer in use
        Thread *previous = m_previous;
        m_previous = nullptr;
        if (previous && previous != &current && previous->state == ThreadState::Dying)
        {
            ThreadRegistry::instance().destroy(*previous);
        }
    }

    void Scheduler::runThread()
    {
        scheduleTail();

        Thread &self = *m_running;
        restoreInterrupts(InterruptLevel::On);

        self.entry(self.arg);
        exitCurrent();
    }

    void Scheduler::tick()
    {
        Thread &current = *m_running;
        if (&current == m_idle)
        {
            ++m_stats.idleTicks;
        }
        else
        {
            ++m_stats.kernelTicks;
            ++current.runTicks;
        }

        if (++m_sliceTicks >= m_config.timeSlice)
        {
            m_yieldPending = true;
        }

        int top = highestReadyPriority();
        if (top >= 0 && (&current == m_idle || top > current.priority))
        {
            m_yieldPending = true;
        }
    }

    void Scheduler::yield()
    {
        if (InterruptManager::instance().inExternalInterrupt())
        {
            panic("yield from inside an interrupt handler");
        }

        InterruptGuard guard;

        Thread &current = *m_running;
        current.state = ThreadState::Ready;
        readyPush(current);
        schedule();
    }

    void Scheduler::blockCurrentOn(ThreadQueue &waitList)
    {
        SK_ASSERT(interruptLevel() == InterruptLevel::Off);

        Thread &current = *m_running;
        if (InterruptManager::instance().inExternalInterrupt())
        {
            panic("thread '%s' (tid %u) tried to block inside an interrupt handler",
                  current.name, current.id);
        }
        if (&current == m_idle)
        {
            panic("idle thread tried to block on a wait list");
        }

        current.state = ThreadState::Blocked;
        waitList.pushBack(current);
        schedule();
    }

    void Scheduler::preemptIfOutranked(const Thread &thread)
    {
        if (m_running && &thread != m_running &&
            (m_running == m_idle || thread.priority > m_running->priority))
        {
            m_yieldPending = true;
        }
    }

    void Scheduler::unblock(Thread &thread)
    {
        InterruptGuard guard;

        if (thread.state != ThreadState::Blocked || thread.magic != THREAD_MAGIC)
        {
            panic("unblock of thread '%s' (tid %u) in state %s",
                  thread.name, thread.id, threadStateName(thread.state));
        }

        if (thread.waitLink.owner)
        {
            static_cast<ThreadQueue *>(thread.waitLink.owner)->remove(thread);
        }

        thread.state = ThreadState::Ready;
        readyPush(thread);
        preemptIfOutranked(thread);
    }

    void Scheduler::admit(Thread &thread)
    {
        InterruptGuard guard;

        thread.state = ThreadState::Ready;
        readyPush(thread);
        preemptIfOutranked(thread);
    }

    void Scheduler::exitCurrent()
    {
        if (InterruptManager::instance().inExternalInterrupt())
        {
            panic("thread exit from inside an interrupt handler");
        }

        // Never restored: this thread does not run again
        disableInterrupts();

        Thread &current = *m_running;
        if (current.locksHeld != 0)
        {
            panic("thread '%s' (tid %u) exiting while holding %u lock(s)",
                  current.name, current.id, current.locksHeld);
        }
        if (&current == m_idle)
        {
            panic("idle thread exited");
        }

        SC_LOG_DEBUG(LOG_MODULE, "Thread '%s' (tid %u) exiting after %lu ticks",
                     current.name, current.id, current.runTicks);

        current.state = ThreadState::Dying;
        schedule();

        panic("dying thread '%s' was scheduled again", current.name);
    }

    ThreadId Scheduler::current() const
    {
        return m_running ? m_running->id : INVALID_THREAD_ID;
    }

    Thread &Scheduler::currentThread() const
    {
        if (!m_running || m_running->magic != THREAD_MAGIC)
        {
            panic("current thread is missing or corrupted");
        }
        return *m_running;
    }

    void Scheduler::setPriority(SC::u8 priority)
    {
        if (priority > PRIORITY_MAX)
        {
            panic("priority %u out of range", priority);
        }

        InterruptGuard guard;
        Thread &current = currentThread();
        current.basePriority = priority;
        refreshPriority(current);
    }

    SC::u8 Scheduler::priority() const
    {
        InterruptGuard guard;
        return currentThread().priority;
    }

    void Scheduler::setEffectivePriority(Thread &thread, SC::u8 newPriority)
    {
        InterruptGuard guard;

        if (thread.priority == newPriority)
            return;

        if (thread.state == ThreadState::Ready && &thread != m_idle)
        {
            readyRemove(thread);
            thread.priority = newPriority;
            readyPush(thread);
            preemptIfOutranked(thread);
        }
        else
        {
            thread.priority = newPriority;
        }

        if (&thread == m_running && highestReadyPriority() > static_cast<int>(newPriority))
        {
            m_yieldPending = true;
        }
    }

    void Scheduler::refreshPriority(Thread &thread)
    {
        InterruptGuard guard;

        SC::u8 priority = thread.basePriority;
        for (Thread *donor = thread.donors.front(); donor; donor = thread.donors.next(*donor))
        {
            if (donor->priority > priority)
                priority = donor->priority;
        }
        setEffectivePriority(thread, priority);
    }

    void Scheduler::logStats() const
    {
        SC_LOG_INFO(LOG_MODULE, "Thread: %lu idle ticks, %lu kernel ticks, %lu context switches",
                    m_stats.idleTicks, m_stats.kernelTicks, m_stats.contextSwitches);
    }

} // namespace SK

extern "C" void sk_thread_start()
{
    SK::Scheduler::instance().runThread();
}
