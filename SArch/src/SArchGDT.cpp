// SArch GDT - descriptor encoding and segment reload
// Namespace: SArch

#include "SArchGDT.h"
#include "SCLogger.h"
#include "SCString.h"

namespace SArch
{

    namespace
    {
        constexpr const char *LOG_MODULE = "SArchGDT";

        // Access byte bits
        constexpr SC::u64 ACCESS_PRESENT = 1u << 7;
        constexpr SC::u64 ACCESS_CODE_OR_DATA = 1u << 4;
        constexpr SC::u64 ACCESS_EXECUTABLE = 1u << 3;
        constexpr SC::u64 ACCESS_READ_WRITE = 1u << 1;
        constexpr SC::u64 ACCESS_TSS_AVAILABLE = 0x9;

        // Flag nibble bits
        constexpr SC::u64 FLAG_GRANULARITY_4K = 1u << 3;
        constexpr SC::u64 FLAG_LONG_MODE = 1u << 1;

        // Base and limit are ignored in long mode for code and data, so the
        // flat descriptors only need access and flags
        constexpr SC::u64 segmentDescriptor(SC::u64 access, SC::u64 flags)
        {
            return 0xFFFFull | (access << 40) | (0xFull << 48) | (flags << 52);
        }

        constexpr SC::u64 KERNEL_CODE_DESCRIPTOR =
            segmentDescriptor(ACCESS_PRESENT | ACCESS_CODE_OR_DATA | ACCESS_EXECUTABLE | ACCESS_READ_WRITE,
                              FLAG_GRANULARITY_4K | FLAG_LONG_MODE);
        constexpr SC::u64 KERNEL_DATA_DESCRIPTOR =
            segmentDescriptor(ACCESS_PRESENT | ACCESS_CODE_OR_DATA | ACCESS_READ_WRITE, FLAG_GRANULARITY_4K);
    }

    GDT &GDT::instance()
    {
        static GDT instance;
        return instance;
    }

    GDT::GDT() : m_descriptors{}, m_pointer{0, 0}
    {
        SC::String::memset(&m_tss, 0, sizeof(m_tss));
    }

    void GDT::initialize()
    {
        m_descriptors[0] = 0;
        m_descriptors[KERNEL_CODE / 8] = KERNEL_CODE_DESCRIPTOR;
        m_descriptors[KERNEL_DATA / 8] = KERNEL_DATA_DESCRIPTOR;
        installTaskState();

        m_pointer.limit = sizeof(m_descriptors) - 1;
        m_pointer.base = reinterpret_cast<SC::u64>(m_descriptors);

        asm volatile("lgdt %0" : : "m"(m_pointer));
        reloadSegments();
        asm volatile("ltr %0" : : "r"(TSS_SELECTOR));

        SC_LOG_INFO(LOG_MODULE, "GDT loaded, #DF stack at %p",
                    static_cast<void *>(m_doubleFaultStack + DOUBLE_FAULT_STACK_SIZE));
    }

    void GDT::installTaskState()
    {
        m_tss.iopbOffset = sizeof(m_tss);
        m_tss.ist[DOUBLE_FAULT_IST - 1] = reinterpret_cast<SC::u64>(m_doubleFaultStack + DOUBLE_FAULT_STACK_SIZE);

        SC::u64 base = reinterpret_cast<SC::u64>(&m_tss);
        SC::u64 limit = sizeof(m_tss) - 1;

        // A system descriptor is 16 bytes: the usual layout, then base[63:32]
        SC::u64 low = (limit & 0xFFFF) | ((base & 0xFFFFFF) << 16) |
                      ((ACCESS_PRESENT | ACCESS_TSS_AVAILABLE) << 40) |
                      (((limit >> 16) & 0xF) << 48) | (((base >> 24) & 0xFF) << 56);
        m_descriptors[TSS_SELECTOR / 8] = low;
        m_descriptors[TSS_SELECTOR / 8 + 1] = base >> 32;
    }

    void GDT::reloadSegments()
    {
        // CS can only change through a far transfer
        asm volatile(
            "pushq %[code]\n"
            "leaq 1f(%%rip), %%rax\n"
            "pushq %%rax\n"
            "lretq\n"
            "1:\n"
            "mov %[data], %%ax\n"
            "mov %%ax, %%ds\n"
            "mov %%ax, %%es\n"
            "mov %%ax, %%fs\n"
            "mov %%ax, %%gs\n"
            "mov %%ax, %%ss\n"
            :
            : [code] "i"(KERNEL_CODE), [data] "i"(KERNEL_DATA)
            : "rax", "memory");
    }

} // namespace SArch
