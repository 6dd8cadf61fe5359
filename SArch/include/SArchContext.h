#pragma once

// SArch Context - Kernel thread register state and stack switching
// Namespace: SArch

#include "SCTypes.h"

namespace SArch
{

    // Callee-saved registers live on the suspended thread's own stack;
    // only the stack pointer is kept out of line.
    struct ThreadContext
    {
        SC::uptr rsp;
    };

    // First code a new thread runs. Must never return.
    using ThreadStartFn = void (*)();

    // Builds the initial frame so that the first switchContext() into this
    // context "returns" into start() with a 16-byte aligned stack.
    void initContext(ThreadContext &context, void *stackBase, SC::usize stackSize,
                     ThreadStartFn start);

    // Saves the running register state into from and resumes to.
    // Interrupts must be disabled. Returns when something switches back to from.
    void switchContext(ThreadContext &from, ThreadContext &to);

    // Called once a context will never be resumed again
    void releaseContext(ThreadContext &context);

} // namespace SArch
