// Mock SArch context switching on ucontext. Each ThreadContext is paired
// with a host context; the boot thread gets one on its first switch away.

#include "SArchContext.h"

#include "MockState.h"

#include <cstdio>
#include <cstdlib>
#include <memory>
#include <ucontext.h>
#include <unordered_map>

namespace SK::Mock
{
    namespace
    {
        using ContextMap = std::unordered_map<const SArch::ThreadContext *, std::unique_ptr<ucontext_t>>;

        ContextMap &contexts()
        {
            static ContextMap map;
            return map;
        }

        ucontext_t &hostContext(SArch::ThreadContext &context)
        {
            std::unique_ptr<ucontext_t> &slot = contexts()[&context];
            if (!slot)
                slot.reset(new ucontext_t());
            return *slot;
        }
    }

    void resetContexts()
    {
        contexts().clear();
    }

    SC::usize liveContexts()
    {
        return contexts().size();
    }
}

namespace SArch
{
    void initContext(ThreadContext &context, void *stackBase, SC::usize stackSize, ThreadStartFn start)
    {
        ucontext_t &host = SK::Mock::hostContext(context);
        if (getcontext(&host) != 0)
        {
            std::perror("MockArch: getcontext");
            std::abort();
        }

        host.uc_stack.ss_sp = stackBase;
        host.uc_stack.ss_size = stackSize;
        host.uc_link = nullptr;
        makecontext(&host, start, 0);

        context.rsp = reinterpret_cast<SC::uptr>(stackBase) + stackSize;
    }

    void switchContext(ThreadContext &from, ThreadContext &to)
    {
        ucontext_t &fromHost = SK::Mock::hostContext(from);
        ucontext_t &toHost = SK::Mock::hostContext(to);
        if (swapcontext(&fromHost, &toHost) != 0)
        {
            std::perror("MockArch: swapcontext");
            std::abort();
        }
    }

    void releaseContext(ThreadContext &context)
    {
        SK::Mock::contexts().erase(&context);
        context.rsp = 0;
    }
}
