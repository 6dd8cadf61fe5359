// SKernel Condition - Implementation
// Namespace: SK

#include "SKCondition.h"
#include "SKInterrupts.h"
#include "SKLock.h"
#include "SKPanic.h"
#include "SKScheduler.h"

namespace SK
{

    void Condition::requireHeld(const Lock &lock, const char *operation) const
    {
        if (!lock.heldByCurrent())
        {
            const Thread *current = Scheduler::instance().runningThread();
            panic("condition %p: %s without holding lock %p (thread '%s', holder tid %u)",
                  static_cast<const void *>(this), operation, static_cast<const void *>(&lock),
                  current ? current->name : "?", lock.holder());
        }
    }

    void Condition::wait(Lock &lock)
    {
        requireHeld(lock, "wait");

        {
            InterruptGuard guard;
            lock.release();
            Scheduler::instance().blockCurrentOn(m_waiters);
        }

        lock.acquire();
    }

    void Condition::signal(Lock &lock)
    {
        requireHeld(lock, "signal");

        InterruptGuard guard;
        Scheduler &scheduler = Scheduler::instance();
        if (Thread *waiter = m_waiters.select(scheduler.wakePolicy()))
        {
            scheduler.unblock(*waiter);
        }
    }

    void Condition::broadcast(Lock &lock)
    {
        requireHeld(lock, "broadcast");

        InterruptGuard guard;
        Scheduler &scheduler = Scheduler::instance();
        while (Thread *waiter = m_waiters.select(scheduler.wakePolicy()))
        {
            scheduler.unblock(*waiter);
        }
    }

} // namespace SK
