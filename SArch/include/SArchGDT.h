#pragma once

// SArch GDT - flat long-mode segments plus the TSS that carries the
// double-fault stack
// Namespace: SArch

#include "SCTypes.h"

namespace SArch
{

    // 64-bit task state segment. Skiff never changes privilege level, so
    // only the IST slots matter.
    struct TaskStateSegment
    {
        SC::u32 reserved0;
        SC::u64 rsp[3];
        SC::u64 reserved1;
        SC::u64 ist[7];
        SC::u64 reserved2;
        SC::u16 reserved3;
        SC::u16 iopbOffset;
    } __attribute__((packed));

    class GDT
    {
    public:
        static GDT &instance();

        // Builds the table, loads it, reloads every segment register and
        // loads the task register
        void initialize();

        static constexpr SC::u16 KERNEL_CODE = 0x08;
        static constexpr SC::u16 KERNEL_DATA = 0x10;
        static constexpr SC::u16 TSS_SELECTOR = 0x18;

        // IST slot used for #DF so an overflowed thread stack still reaches
        // the panic path
        static constexpr SC::u8 DOUBLE_FAULT_IST = 1;

    private:
        GDT();
        GDT(const GDT &) = delete;
        GDT &operator=(const GDT &) = delete;

        void installTaskState();
        void reloadSegments();

        struct Pointer
        {
            SC::u16 limit;
            SC::u64 base;
        } __attribute__((packed));

        // null, code, data, then the TSS descriptor which takes two slots
        static constexpr SC::usize DESCRIPTOR_COUNT = 5;
        static constexpr SC::usize DOUBLE_FAULT_STACK_SIZE = 16 * 1024;

        alignas(8) SC::u64 m_descriptors[DESCRIPTOR_COUNT];
        Pointer m_pointer;
        TaskStateSegment m_tss;
        alignas(16) SC::u8 m_doubleFaultStack[DOUBLE_FAULT_STACK_SIZE];
    };

} // namespace SArch
