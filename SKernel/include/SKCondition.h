#pragma once

// SKernel Condition - Condition variable used together with a Lock
// Namespace: SK

#include "SCTypes.h"
#include "SKThread.h"

namespace SK
{

    class Lock;

    class Condition
    {
    public:
        Condition() = default;

        // Releases lock and blocks in one step, then re-acquires lock before
        // returning. The caller must hold lock and re-check its predicate.
        void wait(Lock &lock);

        // Wake one / every waiter. The caller must hold lock.
        void signal(Lock &lock);
        void broadcast(Lock &lock);

        SC::usize waiterCount() const { return m_waiters.size(); }

    private:
        Condition(const Condition &) = delete;
        Condition &operator=(const Condition &) = delete;

        void requireHeld(const Lock &lock, const char *operation) const;

        ThreadQueue m_waiters;
    };

} // namespace SK
