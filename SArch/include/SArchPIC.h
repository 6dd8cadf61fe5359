#pragma once

// SArch PIC - 8259A programmable interrupt controller pair
// Namespace: SArch

#include "SCTypes.h"

namespace SArch
{

    class PIC
    {
    public:
        static constexpr SC::u8 LINE_COUNT = 16;

        static PIC &instance();

        // Remaps IRQ 0-15 to vectors base..base+15 and masks every line
        void initialize(SC::u8 vectorBase);

        void unmask(SC::u8 irq);
        void mask(SC::u8 irq);

        void sendEOI(SC::u8 irq);

        // Lines 7 and 15 fire spuriously when a request vanishes before INTA.
        // Handles the cascade EOI owed for a spurious slave interrupt.
        bool isSpurious(SC::u8 irq);

    private:
        PIC() = default;
        ~PIC() = default;
        PIC(const PIC &) = delete;
        PIC &operator=(const PIC &) = delete;

        SC::u16 readISR();
    };

} // namespace SArch
