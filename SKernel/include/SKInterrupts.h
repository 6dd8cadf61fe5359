#pragma once

// SKernel Interrupts - Interrupt gate layer
// Namespace: SK

#include "SCTypes.h"

namespace SK
{

    // Interrupt vector numbers
    constexpr SC::u8 INT_DIVIDE_ERROR = 0;
    constexpr SC::u8 INT_DEBUG = 1;
    constexpr SC::u8 INT_NMI = 2;
    constexpr SC::u8 INT_BREAKPOINT = 3;
    constexpr SC::u8 INT_OVERFLOW = 4;
    constexpr SC::u8 INT_BOUND_RANGE = 5;
    constexpr SC::u8 INT_INVALID_OPCODE = 6;
    constexpr SC::u8 INT_DEVICE_NOT_AVAILABLE = 7;
    constexpr SC::u8 INT_DOUBLE_FAULT = 8;
    constexpr SC::u8 INT_INVALID_TSS = 10;
    constexpr SC::u8 INT_SEGMENT_NOT_PRESENT = 11;
    constexpr SC::u8 INT_STACK_FAULT = 12;
    constexpr SC::u8 INT_GENERAL_PROTECTION = 13;
    constexpr SC::u8 INT_PAGE_FAULT = 14;
    constexpr SC::u8 INT_X87_FPU_ERROR = 16;
    constexpr SC::u8 INT_ALIGNMENT_CHECK = 17;
    constexpr SC::u8 INT_MACHINE_CHECK = 18;
    constexpr SC::u8 INT_SIMD_FP_EXCEPTION = 19;
    constexpr SC::u8 EXCEPTION_COUNT = 32;

    // IRQ offsets (remapped)
    constexpr SC::u8 IRQ_BASE = 32;
    constexpr SC::u8 IRQ_COUNT = 16;
    constexpr SC::u8 IRQ_TIMER = IRQ_BASE + 0;
    constexpr SC::u8 IRQ_KEYBOARD = IRQ_BASE + 1;
    constexpr SC::u8 IRQ_COM1 = IRQ_BASE + 4;

    struct InterruptFrame
    {
        SC::u64 r15, r14, r13, r12, r11, r10, r9, r8;
        SC::u64 rdi, rsi, rbp, rbx, rdx, rcx, rax;
        SC::u64 vector, errorCode;
        SC::u64 rip, cs, rflags, rsp, ss;
    };

    using InterruptHandler = void (*)(InterruptFrame *frame);

    // Mnemonic and description of a CPU exception, e.g. "#PF Page-Fault Exception"
    const char *exceptionName(SC::u8 vector);

    class InterruptManager
    {
    public:
        static InterruptManager &instance();

        void initialize();

        // External (IRQ) handlers run with interrupts off and must not block
        void registerHandler(SC::u8 vector, InterruptHandler handler, const char *name);
        void unregisterHandler(SC::u8 vector);
        const char *handlerName(SC::u8 vector) const;

        void enableInterrupt(SC::u8 irq);
        void disableInterrupt(SC::u8 irq);

        // True while an external interrupt handler is executing
        bool inExternalInterrupt() const { return m_inExternal; }

        SC::u64 interruptCount(SC::u8 vector) const { return m_counts[vector]; }
        SC::u64 spuriousCount() const { return m_spurious; }

        // Called from assembly interrupt stubs
        static void dispatch(InterruptFrame *frame);

    private:
        InterruptManager();
        ~InterruptManager() = default;
        InterruptManager(const InterruptManager &) = delete;
        InterruptManager &operator=(const InterruptManager &) = delete;

        void dispatchException(InterruptFrame *frame);
        void dispatchExternal(InterruptFrame *frame);

        InterruptHandler m_handlers[256];
        const char *m_names[256];
        SC::u64 m_counts[256];
        SC::u64 m_spurious;
        bool m_inExternal;
    };

    // Interrupt flag state returned by disableInterrupts()
    enum class InterruptLevel : SC::u8
    {
        Off,
        On
    };

    InterruptLevel interruptLevel();

    // Turns maskable interrupts off and returns the previous level
    InterruptLevel disableInterrupts();

    // Restores a level returned by disableInterrupts(). Going back to On also
    // performs any yield the scheduler deferred while interrupts were off.
    void restoreInterrupts(InterruptLevel previous);

    // Scoped disableInterrupts()/restoreInterrupts() pair. Nests freely.
    class InterruptGuard
    {
    public:
        InterruptGuard() : m_previous(disableInterrupts()) {}
        ~InterruptGuard() { restoreInterrupts(m_previous); }

        InterruptLevel previous() const { return m_previous; }

    private:
        InterruptGuard(const InterruptGuard &) = delete;
        InterruptGuard &operator=(const InterruptGuard &) = delete;

        InterruptLevel m_previous;
    };

} // namespace SK
