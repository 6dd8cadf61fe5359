#pragma once

// SKernel Lock - Non-recursive sleeping lock with priority donation
// Namespace: SK

#include "SCTypes.h"
#include "SKSemaphore.h"
#include "SKThread.h"

namespace SK
{

    // Longest owner chain walked when a donation propagates
    constexpr SC::u32 MAX_DONATION_DEPTH = 8;

    class Lock
    {
    public:
        Lock();

        // Blocks until the lock is free. While blocked, the caller donates its
        // priority to the holder and transitively along the holder's own waits.
        // Acquiring a lock the caller already holds is fatal.
        void acquire();

        // Takes the lock only if it is free; never donates or blocks
        bool tryAcquire();

        // Only the holder may release
        void release();

        bool heldByCurrent() const;
        ThreadId holder() const { return m_holder; }

    private:
        Lock(const Lock &) = delete;
        Lock &operator=(const Lock &) = delete;

        static void donateBeforeBlock(void *context);
        void donate(Thread &donor);
        void takeOwnership(Thread &owner);

        ThreadId m_holder;
        Semaphore m_semaphore;
    };

    // Scoped acquire/release
    class LockGuard
    {
    public:
        explicit LockGuard(Lock &lock) : m_lock(lock) { m_lock.acquire(); }
        ~LockGuard() { m_lock.release(); }

    private:
        LockGuard(const LockGuard &) = delete;
        LockGuard &operator=(const LockGuard &) = delete;

        Lock &m_lock;
    };

} // namespace SK
