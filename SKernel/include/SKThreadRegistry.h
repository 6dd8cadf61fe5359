#pragma once

// SKernel Thread Registry - Owns every thread control block and kernel stack
// Namespace: SK

#include "SCTypes.h"
#include "SKThread.h"

namespace SK
{

    class ThreadRegistry
    {
    public:
        static constexpr SC::usize DEFAULT_STACK_PAGES = 4;

        static ThreadRegistry &instance();

        // Drops every slot. Must run before the scheduler adopts the boot thread.
        void initialize(SC::usize stackPages = DEFAULT_STACK_PAGES);

        // Wraps the code already running on the boot stack as a Running thread
        Thread &adoptBootThread(const char *name);

        // Allocates a slot and stack, prepares the first switch into entry(arg)
        // and hands the thread to the scheduler as Ready.
        // OutOfMemory when no slot or stack is left; InvalidParam for a bad
        // priority or null entry.
        SC::Result<ThreadId> create(const char *name, SC::u8 priority, ThreadEntry entry, void *arg);

        // Releases a Dying thread's stack and slot. Scheduler only, never on
        // the thread's own stack.
        void destroy(Thread &thread);

        // nullptr once the thread has been reclaimed
        Thread *find(ThreadId id);

        Thread &at(ThreadSlot slot) { return m_slots[slot]; }

        // False when the control block magic or the stack guard word is damaged
        bool intact(const Thread &thread) const;

        SC::usize threadCount() const { return m_count; }
        SC::usize stackPages() const { return m_stackPages; }
        SC::usize stackBytes() const;

    private:
        ThreadRegistry();
        ~ThreadRegistry() = default;
        ThreadRegistry(const ThreadRegistry &) = delete;
        ThreadRegistry &operator=(const ThreadRegistry &) = delete;

        Thread *claimSlot(const char *name, SC::u8 priority);
        void releaseSlot(Thread &thread);

        Thread m_slots[MAX_THREADS];
        bool m_used[MAX_THREADS];
        SC::usize m_count;
        SC::usize m_stackPages;
        ThreadId m_nextId;
    };

} // namespace SK
