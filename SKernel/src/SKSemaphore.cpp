// SKernel Semaphore - Implementation
// Namespace: SK

#include "SKSemaphore.h"
#include "SKInterrupts.h"
#include "SKPanic.h"
#include "SKScheduler.h"

namespace SK
{

    Semaphore::Semaphore(SC::u32 value) : m_value(value)
    {
    }

    void Semaphore::down()
    {
        down(nullptr, nullptr);
    }

    void Semaphore::down(BlockHook beforeBlock, void *context)
    {
        if (InterruptManager::instance().inExternalInterrupt())
        {
            panic("semaphore %p: down() inside an interrupt handler", static_cast<void *>(this));
        }

        InterruptGuard guard;
        Scheduler &scheduler = Scheduler::instance();

        // Another thread may take the count between our wakeup and our turn
        while (m_value == 0)
        {
            if (beforeBlock)
            {
                beforeBlock(context);
            }
            scheduler.blockCurrentOn(m_waiters);
        }
        --m_value;
    }

    bool Semaphore::tryDown()
    {
        InterruptGuard guard;

        if (m_value == 0)
            return false;

        --m_value;
        return true;
    }

    void Semaphore::up()
    {
        InterruptGuard guard;
        Scheduler &scheduler = Scheduler::instance();

        ++m_value;
        if (Thread *waiter = m_waiters.select(scheduler.wakePolicy()))
        {
            scheduler.unblock(*waiter);
        }
    }

} // namespace SK
