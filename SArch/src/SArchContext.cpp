// SArch Context - Implementation
// Namespace: SArch

#include "SArchContext.h"

// SArchSwitch.asm
extern "C" void sarch_switch_context(SC::uptr *saveRsp, SC::uptr loadRsp);

namespace SArch
{

    namespace
    {
        // rbp, rbx, r12, r13, r14, r15 as pushed by sarch_switch_context
        constexpr SC::usize SAVED_REGISTERS = 6;
    }

    void initContext(ThreadContext &context, void *stackBase, SC::usize stackSize,
                     ThreadStartFn start)
    {
        SC::uptr top = SC::alignDown(reinterpret_cast<SC::uptr>(stackBase) + stackSize, 16);
        SC::u64 *sp = reinterpret_cast<SC::u64 *>(top);

        // Fake return address for start(); leaves rsp % 16 == 8 on entry as the ABI expects
        *--sp = 0;
        *--sp = reinterpret_cast<SC::u64>(start);

        for (SC::usize i = 0; i < SAVED_REGISTERS; ++i)
        {
            *--sp = 0;
        }

        context.rsp = reinterpret_cast<SC::uptr>(sp);
    }

    void switchContext(ThreadContext &from, ThreadContext &to)
    {
        sarch_switch_context(&from.rsp, to.rsp);
    }

    void releaseContext(ThreadContext &context)
    {
        context.rsp = 0;
    }

} // namespace SArch
