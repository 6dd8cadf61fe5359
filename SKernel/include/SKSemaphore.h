#pragma once

// SKernel Semaphore - Counting semaphore with a wait list
// Namespace: SK

#include "SCTypes.h"
#include "SKThread.h"

namespace SK
{

    class Semaphore
    {
    public:
        explicit Semaphore(SC::u32 value);

        // Blocks while the count is zero, then decrements it.
        // Not allowed from an interrupt handler.
        void down();

        // Decrements without blocking; false if the count was zero
        bool tryDown();

        // Increments the count and wakes one waiter. Safe in interrupt handlers.
        void up();

        SC::u32 value() const { return m_value; }
        SC::usize waiterCount() const { return m_waiters.size(); }

    private:
        friend class Lock;

        Semaphore(const Semaphore &) = delete;
        Semaphore &operator=(const Semaphore &) = delete;

        // Runs before every block, with interrupts off
        using BlockHook = void (*)(void *context);

        void down(BlockHook beforeBlock, void *context);

        const ThreadQueue &waiters() const { return m_waiters; }

        SC::u32 m_value;
        ThreadQueue m_waiters;
    };

} // namespace SK
