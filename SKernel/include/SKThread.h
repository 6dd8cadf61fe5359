#pragma once

// SKernel Thread - Thread control block and intrusive thread lists
// Namespace: SK

#include "SCTypes.h"
#include "SArchContext.h"

namespace SK
{

    // Kernel-lifetime thread identity; never reused. 0 is never a valid id.
    using ThreadId = SC::u32;
    constexpr ThreadId INVALID_THREAD_ID = 0;

    // Index of a control block inside the ThreadRegistry slot table
    using ThreadSlot = SC::u16;
    constexpr ThreadSlot INVALID_SLOT = 0xFFFF;

    constexpr SC::u8 PRIORITY_MIN = 0;
    constexpr SC::u8 PRIORITY_DEFAULT = 31;
    constexpr SC::u8 PRIORITY_MAX = 63;
    constexpr SC::usize PRIORITY_COUNT = PRIORITY_MAX + 1;

    constexpr SC::usize MAX_THREADS = 64;
    constexpr SC::usize THREAD_NAME_LENGTH = 16;

    // Detects a clobbered control block
    constexpr SC::u32 THREAD_MAGIC = 0xcd6abf4b;

    // Stored in the lowest word of every registry-owned stack
    constexpr SC::u64 STACK_GUARD = 0x5354414b47415244ULL;

    using ThreadEntry = void (*)(void *arg);

    enum class ThreadState : SC::u8
    {
        Running,
        Ready,
        Blocked,
        Dying
    };

    const char *threadStateName(ThreadState state);

    class Lock;
    struct Thread;

    struct ThreadLink
    {
        ThreadSlot prev = INVALID_SLOT;
        ThreadSlot next = INVALID_SLOT;
        // List currently holding this link, or nullptr
        void *owner = nullptr;
    };

    enum class ThreadLinkKind : SC::u8
    {
        // Ready queue or exactly one primitive's wait list
        Wait,
        // Donor list of the lock holder this thread is waiting for
        Donor
    };

    enum class WakePolicy : SC::u8
    {
        Fifo,
        Priority
    };

    // Intrusive doubly-linked list of threads, threaded through one of the two
    // links in each control block. Stores slot handles, never owns a thread.
    // Callers must have interrupts disabled.
    template <ThreadLinkKind Kind>
    class ThreadList
    {
    public:
        ThreadList() = default;

        bool empty() const { return m_head == INVALID_SLOT; }
        SC::usize size() const { return m_size; }

        Thread *front() const;
        Thread *next(const Thread &thread) const;
        bool contains(const Thread &thread) const;

        void pushBack(Thread &thread);
        void remove(Thread &thread);
        Thread *popFront();

        // Highest effective priority; earliest inserted among equals
        Thread *highest() const;

        // Front for WakePolicy::Fifo, highest() for WakePolicy::Priority
        Thread *select(WakePolicy policy) const;

        // Forgets every member without touching their links
        void clear()
        {
            m_head = INVALID_SLOT;
            m_tail = INVALID_SLOT;
            m_size = 0;
        }

    private:
        ThreadList(const ThreadList &) = delete;
        ThreadList &operator=(const ThreadList &) = delete;

        static ThreadLink &link(Thread &thread);
        static const ThreadLink &link(const Thread &thread);

        ThreadSlot m_head = INVALID_SLOT;
        ThreadSlot m_tail = INVALID_SLOT;
        SC::usize m_size = 0;
    };

    using ThreadQueue = ThreadList<ThreadLinkKind::Wait>;
    using DonorList = ThreadList<ThreadLinkKind::Donor>;

    struct Thread
    {
        ThreadId id = INVALID_THREAD_ID;
        ThreadSlot slot = INVALID_SLOT;
        ThreadState state = ThreadState::Blocked;
        char name[THREAD_NAME_LENGTH] = {};

        SC::u8 basePriority = PRIORITY_DEFAULT;
        // basePriority, or higher while donors wait on a lock this thread holds
        SC::u8 priority = PRIORITY_DEFAULT;

        SArch::ThreadContext context = {};
        void *stackBase = nullptr;
        SC::usize stackPages = 0;

        ThreadEntry entry = nullptr;
        void *arg = nullptr;

        ThreadLink waitLink;
        ThreadLink donorLink;
        DonorList donors;

        // Lock this thread is blocked acquiring
        Lock *waitingOn = nullptr;
        SC::u32 locksHeld = 0;

        SC::u64 runTicks = 0;

        SC::u32 magic = 0;
    };

    // Slot -> control block lookup backing every ThreadList
    Thread &threadAt(ThreadSlot slot);

    [[noreturn]] void threadListCorrupted(const Thread &thread, const void *list, const char *what);

    template <ThreadLinkKind Kind>
    inline ThreadLink &ThreadList<Kind>::link(Thread &thread)
    {
        return Kind == ThreadLinkKind::Wait ? thread.waitLink : thread.donorLink;
    }

    template <ThreadLinkKind Kind>
    inline const ThreadLink &ThreadList<Kind>::link(const Thread &thread)
    {
        return Kind == ThreadLinkKind::Wait ? thread.waitLink : thread.donorLink;
    }

    template <ThreadLinkKind Kind>
    inline Thread *ThreadList<Kind>::front() const
    {
        return m_head == INVALID_SLOT ? nullptr : &threadAt(m_head);
    }

    template <ThreadLinkKind Kind>
    inline Thread *ThreadList<Kind>::next(const Thread &thread) const
    {
        ThreadSlot slot = link(thread).next;
        return slot == INVALID_SLOT ? nullptr : &threadAt(slot);
    }

    template <ThreadLinkKind Kind>
    inline bool ThreadList<Kind>::contains(const Thread &thread) const
    {
        return link(thread).owner == this;
    }

    template <ThreadLinkKind Kind>
    void ThreadList<Kind>::pushBack(Thread &thread)
    {
        ThreadLink &l = link(thread);
        if (l.owner)
        {
            threadListCorrupted(thread, this, "double enqueue");
        }

        l.owner = this;
        l.prev = m_tail;
        l.next = INVALID_SLOT;

        if (m_tail == INVALID_SLOT)
            m_head = thread.slot;
        else
            link(threadAt(m_tail)).next = thread.slot;

        m_tail = thread.slot;
        ++m_size;
    }

    template <ThreadLinkKind Kind>
    void ThreadList<Kind>::remove(Thread &thread)
    {
        ThreadLink &l = link(thread);
        if (l.owner != this)
        {
            threadListCorrupted(thread, this, "removal from a list it is not on");
        }

        if (l.prev == INVALID_SLOT)
            m_head = l.next;
        else
            link(threadAt(l.prev)).next = l.next;

        if (l.next == INVALID_SLOT)
            m_tail = l.prev;
        else
            link(threadAt(l.next)).prev = l.prev;

        l.prev = INVALID_SLOT;
        l.next = INVALID_SLOT;
        l.owner = nullptr;
        --m_size;
    }

    template <ThreadLinkKind Kind>
    Thread *ThreadList<Kind>::popFront()
    {
        Thread *thread = front();
        if (thread)
            remove(*thread);
        return thread;
    }

    template <ThreadLinkKind Kind>
    Thread *ThreadList<Kind>::highest() const
    {
        Thread *best = nullptr;
        for (Thread *t = front(); t; t = next(*t))
        {
            if (!best || t->priority > best->priority)
                best = t;
        }
        return best;
    }

    template <ThreadLinkKind Kind>
    Thread *ThreadList<Kind>::select(WakePolicy policy) const
    {
        return policy == WakePolicy::Priority ? highest() : front();
    }

} // namespace SK
