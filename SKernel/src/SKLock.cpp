// SKernel Lock - Implementation
// Namespace: SK

#include "SKLock.h"
#include "SKInterrupts.h"
#include "SKPanic.h"
#include "SKScheduler.h"
#include "SKThreadRegistry.h"
#include "SCLogger.h"

namespace SK
{

    namespace
    {
        constexpr const char *LOG_MODULE = "SKLock";
    }

    Lock::Lock() : m_holder(INVALID_THREAD_ID), m_semaphore(1)
    {
    }

    bool Lock::heldByCurrent() const
    {
        InterruptGuard guard;
        return m_holder != INVALID_THREAD_ID && m_holder == Scheduler::instance().current();
    }

    void Lock::acquire()
    {
        if (InterruptManager::instance().inExternalInterrupt())
        {
            panic("lock %p: acquire inside an interrupt handler", static_cast<void *>(this));
        }

        InterruptGuard guard;
        Thread &current = Scheduler::instance().currentThread();

        if (m_holder == current.id)
        {
            panic("lock %p: reentrant acquire by thread '%s' (tid %u)",
                  static_cast<void *>(this), current.name, current.id);
        }

        current.waitingOn = this;
        m_semaphore.down(&Lock::donateBeforeBlock, this);
        current.waitingOn = nullptr;

        // Left over from a pass through the loop where the lock was taken first by someone else
        if (current.donorLink.owner)
        {
            static_cast<DonorList *>(current.donorLink.owner)->remove(current);
        }

        takeOwnership(current);
    }

    bool Lock::tryAcquire()
    {
        InterruptGuard guard;
        Thread &current = Scheduler::instance().currentThread();

        if (m_holder == current.id)
        {
            panic("lock %p: reentrant tryAcquire by thread '%s' (tid %u)",
                  static_cast<void *>(this), current.name, current.id);
        }

        if (!m_semaphore.tryDown())
            return false;

        takeOwnership(current);
        return true;
    }

    void Lock::takeOwnership(Thread &owner)
    {
        m_holder = owner.id;
        ++owner.locksHeld;

        // Whoever is still queued now waits on us instead
        const ThreadQueue &waiters = m_semaphore.waiters();
        for (Thread *waiter = waiters.front(); waiter; waiter = waiters.next(*waiter))
        {
            if (waiter->waitingOn == this && !waiter->donorLink.owner)
            {
                owner.donors.pushBack(*waiter);
            }
        }
        Scheduler::instance().refreshPriority(owner);
    }

    void Lock::donateBeforeBlock(void *context)
    {
        Lock *lock = static_cast<Lock *>(context);
        lock->donate(Scheduler::instance().currentThread());
    }

    void Lock::donate(Thread &donor)
    {
        ThreadRegistry &registry = ThreadRegistry::instance();
        Scheduler &scheduler = Scheduler::instance();

        Thread *holder = registry.find(m_holder);
        if (!holder)
        {
            panic("lock %p: held by tid %u, which no longer exists",
                  static_cast<void *>(this), m_holder);
        }

        if (donor.donorLink.owner != &holder->donors)
        {
            if (donor.donorLink.owner)
            {
                static_cast<DonorList *>(donor.donorLink.owner)->remove(donor);
            }
            holder->donors.pushBack(donor);
        }

        // Walk waiter -> holder edges, raising each holder to the waiter's level
        Thread *waiter = &donor;
        for (SC::u32 depth = 0; depth < MAX_DONATION_DEPTH && waiter->waitingOn; ++depth)
        {
            Thread *owner = registry.find(waiter->waitingOn->m_holder);
            if (!owner)
                break;

            if (owner == &donor)
            {
                panic("lock ownership cycle: thread '%s' (tid %u) waits on itself through %u lock(s)",
                      donor.name, donor.id, depth + 1);
            }

            if (owner->priority < waiter->priority)
            {
                SC_LOG_TRACE(LOG_MODULE, "'%s' donates priority %u to '%s'",
                             waiter->name, waiter->priority, owner->name);
                scheduler.setEffectivePriority(*owner, waiter->priority);
            }
            waiter = owner;
        }
    }

    void Lock::release()
    {
        InterruptGuard guard;
        Scheduler &scheduler = Scheduler::instance();
        Thread &current = scheduler.currentThread();

        if (m_holder != current.id)
        {
            panic("lock %p: released by thread '%s' (tid %u) but held by tid %u",
                  static_cast<void *>(this), current.name, current.id, m_holder);
        }

        // Drop the donations that came in through this lock
        Thread *donor = current.donors.front();
        while (donor)
        {
            Thread *next = current.donors.next(*donor);
            if (donor->waitingOn == this)
            {
                current.donors.remove(*donor);
            }
            donor = next;
        }

        m_holder = INVALID_THREAD_ID;
        --current.locksHeld;
        scheduler.refreshPriority(current);

        m_semaphore.up();
    }

} // namespace SK
