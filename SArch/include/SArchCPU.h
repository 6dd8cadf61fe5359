#pragma once

// SArch CPU - interrupt flag, halting and processor identification
// Namespace: SArch

#include "SCTypes.h"

namespace SArch
{

    class CPU
    {
    public:
        static CPU &instance();

        // Reads the vendor and brand strings for the boot log
        void initialize();

        const char *vendorString() const { return m_vendor; }
        const char *brandString() const { return m_brand[0] ? m_brand : m_vendor; }

        // Faulting linear address of the most recent page fault
        SC::u64 readCR2();

        void enableInterrupts();
        void disableInterrupts();
        bool interruptsEnabled();

        // Enables interrupts and halts until the next one arrives, with no
        // window for an interrupt to be taken in between
        void waitForInterrupt();

        [[noreturn]] void haltForever();

    private:
        CPU();
        CPU(const CPU &) = delete;
        CPU &operator=(const CPU &) = delete;

        char m_vendor[13];
        char m_brand[49];
    };

} // namespace SArch
