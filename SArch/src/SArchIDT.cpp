// SArch IDT - gate setup
// Namespace: SArch

#include "SArchIDT.h"
#include "SArchGDT.h"
#include "SCLogger.h"

// Entry stub addresses, indexed by vector (SArchStubs.asm)
extern "C" SC::u64 sarch_isr_stub_table[SArch::IDT::STUB_COUNT];

namespace SArch
{

    namespace
    {
        constexpr SC::usize VECTOR_DOUBLE_FAULT = 8;

        // Present, DPL 0, 64-bit interrupt gate: IF is cleared on entry
        constexpr SC::u8 GATE_INTERRUPT = 0x8E;
    }

    IDT &IDT::instance()
    {
        static IDT instance;
        return instance;
    }

    IDT::IDT() : m_gates{}, m_pointer{0, 0}
    {
    }

    void IDT::initialize()
    {
        for (SC::usize vector = 0; vector < STUB_COUNT; ++vector)
        {
            setGate(vector, sarch_isr_stub_table[vector],
                    vector == VECTOR_DOUBLE_FAULT ? GDT::DOUBLE_FAULT_IST : 0);
        }

        m_pointer.limit = sizeof(m_gates) - 1;
        m_pointer.base = reinterpret_cast<SC::u64>(m_gates);
        asm volatile("lidt %0" : : "m"(m_pointer));

        SC_LOG_INFO("SArchIDT", "IDT loaded, vectors 0-%lu wired", STUB_COUNT - 1);
    }

    void IDT::setGate(SC::usize vector, SC::u64 handler, SC::u8 ist)
    {
        Gate &gate = m_gates[vector];
        gate.offset0 = static_cast<SC::u16>(handler);
        gate.offset1 = static_cast<SC::u16>(handler >> 16);
        gate.offset2 = static_cast<SC::u32>(handler >> 32);
        gate.selector = GDT::KERNEL_CODE;
        gate.ist = ist;
        gate.attributes = GATE_INTERRUPT;
        gate.zero = 0;
    }

} // namespace SArch
