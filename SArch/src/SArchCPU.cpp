// SArch CPU - x86_64 implementation
// Namespace: SArch

#include "SArchCPU.h"
#include "SCLogger.h"
#include "SCString.h"

namespace SArch
{

    namespace
    {
        constexpr SC::u64 RFLAGS_IF = 1ull << 9;
        constexpr SC::u32 LEAF_EXTENDED_MAX = 0x80000000;
        constexpr SC::u32 LEAF_BRAND_FIRST = 0x80000002;
        constexpr SC::u32 LEAF_BRAND_LAST = 0x80000004;

        void cpuid(SC::u32 leaf, SC::u32 regs[4])
        {
            asm volatile("cpuid"
                         : "=a"(regs[0]), "=b"(regs[1]), "=c"(regs[2]), "=d"(regs[3])
                         : "a"(leaf), "c"(0));
        }
    }

    CPU &CPU::instance()
    {
        static CPU instance;
        return instance;
    }

    CPU::CPU() : m_vendor{}, m_brand{}
    {
    }

    void CPU::initialize()
    {
        SC::u32 regs[4];

        // Leaf 0 spells the vendor out in EBX, EDX, ECX order
        cpuid(0, regs);
        SC::String::memcpy(m_vendor, &regs[1], 4);
        SC::String::memcpy(m_vendor + 4, &regs[3], 4);
        SC::String::memcpy(m_vendor + 8, &regs[2], 4);
        m_vendor[12] = '\0';

        cpuid(LEAF_EXTENDED_MAX, regs);
        if (regs[0] >= LEAF_BRAND_LAST)
        {
            for (SC::u32 leaf = LEAF_BRAND_FIRST; leaf <= LEAF_BRAND_LAST; ++leaf)
            {
                cpuid(leaf, regs);
                SC::String::memcpy(m_brand + (leaf - LEAF_BRAND_FIRST) * 16, regs, 16);
            }
            m_brand[48] = '\0';
        }

        SC_LOG_INFO("SArchCPU", "CPU: %s", brandString());
    }

    SC::u64 CPU::readCR2()
    {
        SC::u64 value;
        asm volatile("mov %%cr2, %0" : "=r"(value));
        return value;
    }

    void CPU::enableInterrupts()
    {
        asm volatile("sti" ::: "memory");
    }

    void CPU::disableInterrupts()
    {
        asm volatile("cli" ::: "memory");
    }

    bool CPU::interruptsEnabled()
    {
        SC::u64 rflags;
        asm volatile("pushfq; popq %0" : "=r"(rflags));
        return (rflags & RFLAGS_IF) != 0;
    }

    void CPU::waitForInterrupt()
    {
        // sti only takes effect after the following instruction
        asm volatile("sti; hlt" ::: "memory");
    }

    void CPU::haltForever()
    {
        for (;;)
        {
            asm volatile("cli; hlt");
        }
    }

} // namespace SArch
