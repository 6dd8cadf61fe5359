// SKernel Interrupts - Implementation
// Namespace: SK

#include "SKInterrupts.h"
#include "SKPanic.h"
#include "SKScheduler.h"
#include "SArchCPU.h"
#include "SArchPIC.h"
#include "SCLogger.h"

namespace SK
{

    namespace
    {
        const char *const EXCEPTION_NAMES[EXCEPTION_COUNT] = {
            "#DE Divide Error",
            "#DB Debug Exception",
            "NMI Interrupt",
            "#BP Breakpoint Exception",
            "#OF Overflow Exception",
            "#BR BOUND Range Exceeded Exception",
            "#UD Invalid Opcode Exception",
            "#NM Device Not Available Exception",
            "#DF Double Fault Exception",
            "Coprocessor Segment Overrun",
            "#TS Invalid TSS Exception",
            "#NP Segment Not Present",
            "#SS Stack Fault Exception",
            "#GP General Protection Exception",
            "#PF Page-Fault Exception",
            "Reserved",
            "#MF x87 FPU Floating-Point Error",
            "#AC Alignment Check Exception",
            "#MC Machine-Check Exception",
            "#XF SIMD Floating-Point Exception",
            "#VE Virtualization Exception",
            "#CP Control Protection Exception",
            "Reserved",
            "Reserved",
            "Reserved",
            "Reserved",
            "Reserved",
            "Reserved",
            "#HV Hypervisor Injection Exception",
            "#VC VMM Communication Exception",
            "#SX Security Exception",
            "Reserved",
        };
    }

    const char *exceptionName(SC::u8 vector)
    {
        if (vector < EXCEPTION_COUNT)
            return EXCEPTION_NAMES[vector];
        return "Unknown";
    }

    InterruptManager &InterruptManager::instance()
    {
        static InterruptManager instance;
        return instance;
    }

    InterruptManager::InterruptManager() : m_spurious(0), m_inExternal(false)
    {
        for (int i = 0; i < 256; ++i)
        {
            m_handlers[i] = nullptr;
            m_names[i] = nullptr;
            m_counts[i] = 0;
        }
    }

    void InterruptManager::initialize()
    {
        SC_LOG_INFO("SKInt", "Initializing interrupt manager");

        for (int i = 0; i < 256; ++i)
        {
            m_handlers[i] = nullptr;
            m_names[i] = nullptr;
            m_counts[i] = 0;
        }
        m_spurious = 0;
        m_inExternal = false;

        SArch::PIC::instance().initialize(IRQ_BASE);

        SC_LOG_INFO("SKInt", "Interrupt manager initialized");
    }

    void InterruptManager::registerHandler(SC::u8 vector, InterruptHandler handler, const char *name)
    {
        InterruptGuard guard;

        if (m_handlers[vector])
        {
            SC_LOG_WARN("SKInt", "Vector 0x%02x: replacing handler '%s' with '%s'",
                        vector, m_names[vector], name);
        }

        m_handlers[vector] = handler;
        m_names[vector] = name;
        SC_LOG_DEBUG("SKInt", "Registered '%s' for vector 0x%02x", name, vector);
    }

    void InterruptManager::unregisterHandler(SC::u8 vector)
    {
        InterruptGuard guard;
        m_handlers[vector] = nullptr;
        m_names[vector] = nullptr;
    }

    const char *InterruptManager::handlerName(SC::u8 vector) const
    {
        return m_names[vector] ? m_names[vector] : "unknown";
    }

    void InterruptManager::enableInterrupt(SC::u8 irq)
    {
        InterruptGuard guard;
        SArch::PIC::instance().unmask(irq);
    }

    void InterruptManager::disableInterrupt(SC::u8 irq)
    {
        InterruptGuard guard;
        SArch::PIC::instance().mask(irq);
    }

    void InterruptManager::dispatchException(InterruptFrame *frame)
    {
        SC::u8 vector = static_cast<SC::u8>(frame->vector);

        if (m_handlers[vector])
        {
            m_handlers[vector](frame);
            return;
        }

        if (vector == INT_PAGE_FAULT)
        {
            panic("unhandled %s (vector %u, error 0x%lx) at RIP=0x%lx accessing 0x%lx",
                  exceptionName(vector), vector, frame->errorCode, frame->rip,
                  SArch::CPU::instance().readCR2());
        }

        panic("unhandled %s (vector %u, error 0x%lx) at RIP=0x%lx",
              exceptionName(vector), vector, frame->errorCode, frame->rip);
    }

    void InterruptManager::dispatchExternal(InterruptFrame *frame)
    {
        SC::u8 vector = static_cast<SC::u8>(frame->vector);
        SC::u8 irq = static_cast<SC::u8>(vector - IRQ_BASE);

        SK_ASSERT(!SArch::CPU::instance().interruptsEnabled());
        SK_ASSERT(!m_inExternal);

        if (SArch::PIC::instance().isSpurious(irq))
        {
            ++m_spurious;
            return;
        }

        m_inExternal = true;
        if (m_handlers[vector])
        {
            m_handlers[vector](frame);
        }
        else
        {
            SC_LOG_WARN("SKInt", "Unexpected interrupt 0x%02x (IRQ %u)", vector, irq);
        }
        m_inExternal = false;

        SArch::PIC::instance().sendEOI(irq);

        // Preemption requested by the handler happens on the way out, with the
        // interrupted thread's frame parked on its own stack
        Scheduler &scheduler = Scheduler::instance();
        if (scheduler.yieldPending())
        {
            scheduler.yield();
        }
    }

    void InterruptManager::dispatch(InterruptFrame *frame)
    {
        InterruptManager &mgr = instance();
        SC::u8 vector = static_cast<SC::u8>(frame->vector);

        ++mgr.m_counts[vector];

        if (vector >= IRQ_BASE && vector < IRQ_BASE + IRQ_COUNT)
        {
            mgr.dispatchExternal(frame);
        }
        else
        {
            mgr.dispatchException(frame);
        }
    }

    InterruptLevel interruptLevel()
    {
        return SArch::CPU::instance().interruptsEnabled() ? InterruptLevel::On : InterruptLevel::Off;
    }

    InterruptLevel disableInterrupts()
    {
        SArch::CPU &cpu = SArch::CPU::instance();
        InterruptLevel previous = cpu.interruptsEnabled() ? InterruptLevel::On : InterruptLevel::Off;
        cpu.disableInterrupts();
        return previous;
    }

    void restoreInterrupts(InterruptLevel previous)
    {
        if (previous == InterruptLevel::Off)
        {
            SArch::CPU::instance().disableInterrupts();
            return;
        }

        // A wakeup of a higher-priority thread inside the critical section
        // takes effect here, before interrupts come back on
        Scheduler &scheduler = Scheduler::instance();
        if (scheduler.yieldPending() && !InterruptManager::instance().inExternalInterrupt())
        {
            scheduler.yield();
        }

        SArch::CPU::instance().enableInterrupts();
    }

} // namespace SK

// C-callable interrupt handlers for assembly stubs
extern "C"
{

    void isr_handler(SK::InterruptFrame *frame)
    {
        SK::InterruptManager::dispatch(frame);
    }

    void irq_handler(SK::InterruptFrame *frame)
    {
        SK::InterruptManager::dispatch(frame);
    }

} // extern "C"
