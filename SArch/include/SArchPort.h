#pragma once

// SArch Port - x86 port I/O and the fixed legacy port map
// Namespace: SArch

#include "SCTypes.h"

namespace SArch
{

    namespace Ports
    {
        constexpr SC::u16 PIC_MASTER_COMMAND = 0x20;
        constexpr SC::u16 PIC_MASTER_DATA = 0x21;
        constexpr SC::u16 PIT_CHANNEL0 = 0x40;
        constexpr SC::u16 PIT_COMMAND = 0x43;
        constexpr SC::u16 POST_CODE = 0x80;
        constexpr SC::u16 PIC_SLAVE_COMMAND = 0xA0;
        constexpr SC::u16 PIC_SLAVE_DATA = 0xA1;
        constexpr SC::u16 QEMU_DEBUG_EXIT = 0xF4;
        constexpr SC::u16 COM1 = 0x3F8;

        // ACPI PM1a control blocks of the emulators we boot under
        constexpr SC::u16 QEMU_PM1A_CONTROL = 0x604;
        constexpr SC::u16 BOCHS_PM1A_CONTROL = 0xB004;
    }

    inline void outb(SC::u16 port, SC::u8 value)
    {
        asm volatile("outb %0, %1" : : "a"(value), "Nd"(port));
    }

    inline void outw(SC::u16 port, SC::u16 value)
    {
        asm volatile("outw %0, %1" : : "a"(value), "Nd"(port));
    }

    inline SC::u8 inb(SC::u16 port)
    {
        SC::u8 value;
        asm volatile("inb %1, %0" : "=a"(value) : "Nd"(port));
        return value;
    }

    // A write to the POST port gives slow devices (the 8259) time to
    // latch the previous command
    inline void ioWait()
    {
        outb(Ports::POST_CODE, 0);
    }

} // namespace SArch
