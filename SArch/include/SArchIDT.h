#pragma once

// SArch IDT - interrupt gates for the CPU exceptions and the 16 PIC lines
// Namespace: SArch

#include "SCTypes.h"

namespace SArch
{

    class IDT
    {
    public:
        // Vectors with an assembly entry stub: 32 exceptions + 16 PIC lines
        static constexpr SC::usize STUB_COUNT = 48;

        static IDT &instance();

        // Points every stubbed vector at its stub and loads IDTR. The
        // remaining vectors stay not-present and fault as #NP.
        void initialize();

    private:
        IDT();
        IDT(const IDT &) = delete;
        IDT &operator=(const IDT &) = delete;

        struct Gate
        {
            SC::u16 offset0;
            SC::u16 selector;
            SC::u8 ist;
            SC::u8 attributes;
            SC::u16 offset1;
            SC::u32 offset2;
            SC::u32 zero;
        } __attribute__((packed));

        struct Pointer
        {
            SC::u16 limit;
            SC::u64 base;
        } __attribute__((packed));

        void setGate(SC::usize vector, SC::u64 handler, SC::u8 ist);

        static constexpr SC::usize VECTOR_COUNT = 256;

        alignas(16) Gate m_gates[VECTOR_COUNT];
        Pointer m_pointer;
    };

} // namespace SArch
