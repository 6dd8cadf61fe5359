// SKernel Thread Registry - Implementation
// Namespace: SK

#include "SKThreadRegistry.h"
#include "SKInterrupts.h"
#include "SKPanic.h"
#include "SKScheduler.h"
#include "SKMemPageAllocator.h"
#include "SArchContext.h"
#include "SCLogger.h"
#include "SCString.h"

// First code run on every new thread (SKScheduler.cpp)
extern "C" void sk_thread_start();

namespace SK
{

    namespace
    {
        constexpr const char *LOG_MODULE = "SKThread";
    }

    const char *threadStateName(ThreadState state)
    {
        switch (state)
        {
        case ThreadState::Running:
            return "running";
        case ThreadState::Ready:
            return "ready";
        case ThreadState::Blocked:
            return "blocked";
        case ThreadState::Dying:
            return "dying";
        }
        return "?";
    }

    Thread &threadAt(ThreadSlot slot)
    {
        return ThreadRegistry::instance().at(slot);
    }

    void threadListCorrupted(const Thread &thread, const void *list, const char *what)
    {
        panic("thread list %p: %s of thread '%s' (tid %u, state %s)",
              list, what, thread.name, thread.id, threadStateName(thread.state));
    }

    ThreadRegistry &ThreadRegistry::instance()
    {
        static ThreadRegistry instance;
        return instance;
    }

    ThreadRegistry::ThreadRegistry()
        : m_count(0), m_stackPages(DEFAULT_STACK_PAGES), m_nextId(1)
    {
        for (SC::usize i = 0; i < MAX_THREADS; ++i)
        {
            m_used[i] = false;
        }
    }

    void ThreadRegistry::initialize(SC::usize stackPages)
    {
        for (SC::usize i = 0; i < MAX_THREADS; ++i)
        {
            m_used[i] = false;
            m_slots[i].magic = 0;
        }
        m_count = 0;
        m_stackPages = stackPages;
        m_nextId = 1;

        SC_LOG_DEBUG(LOG_MODULE, "Registry ready: %lu slots, %lu-page stacks", MAX_THREADS, stackPages);
    }

    SC::usize ThreadRegistry::stackBytes() const
    {
        return m_stackPages * Memory::PAGE_SIZE;
    }

    Thread *ThreadRegistry::claimSlot(const char *name, SC::u8 priority)
    {
        for (SC::usize i = 0; i < MAX_THREADS; ++i)
        {
            if (m_used[i])
                continue;

            Thread &t = m_slots[i];
            t.id = m_nextId++;
            t.slot = static_cast<ThreadSlot>(i);
            t.state = ThreadState::Blocked;
            SC::String::strncpy(t.name, name, THREAD_NAME_LENGTH);
            t.basePriority = priority;
            t.priority = priority;
            t.context = {};
            t.stackBase = nullptr;
            t.stackPages = 0;
            t.entry = nullptr;
            t.arg = nullptr;
            t.waitLink = ThreadLink();
            t.donorLink = ThreadLink();
            t.waitingOn = nullptr;
            t.locksHeld = 0;
            t.runTicks = 0;
            t.magic = THREAD_MAGIC;

            m_used[i] = true;
            ++m_count;
            return &t;
        }
        return nullptr;
    }

    void ThreadRegistry::releaseSlot(Thread &thread)
    {
        thread.magic = 0;
        thread.id = INVALID_THREAD_ID;
        m_used[thread.slot] = false;
        --m_count;
    }

    Thread &ThreadRegistry::adoptBootThread(const char *name)
    {
        InterruptGuard guard;

        SK_ASSERT(m_count == 0);
        Thread *t = claimSlot(name, PRIORITY_DEFAULT);
        SK_ASSERT(t != nullptr);

        // The boot stack belongs to the loader, so it carries no guard word
        t->state = ThreadState::Running;
        return *t;
    }

    SC::Result<ThreadId> ThreadRegistry::create(const char *name, SC::u8 priority, ThreadEntry entry, void *arg)
    {
        if (priority > PRIORITY_MAX || !entry)
        {
            return {INVALID_THREAD_ID, SC::Status::InvalidParam};
        }

        ThreadId id = INVALID_THREAD_ID;
        {
            InterruptGuard guard;

            Thread *t = claimSlot(name, priority);
            if (!t)
            {
                SC_LOG_WARN(LOG_MODULE, "Cannot create '%s': all %lu thread slots in use", name, MAX_THREADS);
                return {INVALID_THREAD_ID, SC::Status::OutOfMemory};
            }

            void *stack = Memory::PageAllocator::instance().allocatePages(m_stackPages, Memory::AllocFlags::Zero);
            if (!stack)
            {
                SC_LOG_WARN(LOG_MODULE, "Cannot create '%s': no memory for a %lu-page stack", name, m_stackPages);
                releaseSlot(*t);
                return {INVALID_THREAD_ID, SC::Status::OutOfMemory};
            }

            t->stackBase = stack;
            t->stackPages = m_stackPages;
            t->entry = entry;
            t->arg = arg;
            *static_cast<SC::u64 *>(stack) = STACK_GUARD;

            SArch::initContext(t->context, stack, stackBytes(), &sk_thread_start);

            SC_LOG_DEBUG(LOG_MODULE, "Created '%s' (tid %u, priority %u, stack %p)",
                         t->name, t->id, priority, stack);

            id = t->id;

            // May request preemption; the guard's restore carries it out
            Scheduler::instance().admit(*t);
        }

        return {id, SC::Status::Success};
    }

    void ThreadRegistry::destroy(Thread &thread)
    {
        SK_ASSERT(interruptLevel() == InterruptLevel::Off);
        SK_ASSERT(thread.state == ThreadState::Dying);
        SK_ASSERT(&thread != &Scheduler::instance().currentThread());
        SK_ASSERT(!thread.waitLink.owner && !thread.donorLink.owner);

        SC_LOG_DEBUG(LOG_MODULE, "Reclaiming '%s' (tid %u)", thread.name, thread.id);

        SArch::releaseContext(thread.context);
        if (thread.stackBase)
        {
            Memory::PageAllocator::instance().freePages(thread.stackBase, thread.stackPages);
            thread.stackBase = nullptr;
        }
        releaseSlot(thread);
    }

    Thread *ThreadRegistry::find(ThreadId id)
    {
        if (id == INVALID_THREAD_ID)
            return nullptr;

        for (SC::usize i = 0; i < MAX_THREADS; ++i)
        {
            if (m_used[i] && m_slots[i].id == id)
                return &m_slots[i];
        }
        return nullptr;
    }

    bool ThreadRegistry::intact(const Thread &thread) const
    {
        if (thread.magic != THREAD_MAGIC)
            return false;
        if (thread.stackBase && *static_cast<const SC::u64 *>(thread.stackBase) != STACK_GUARD)
            return false;
        return true;
    }

} // namespace SK
