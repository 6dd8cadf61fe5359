// SArch PIC - 8259 pair driver
// Namespace: SArch

#include "SArchPIC.h"
#include "SArchPort.h"

namespace SArch
{

    namespace
    {
        using Ports::PIC_MASTER_COMMAND;
        using Ports::PIC_MASTER_DATA;
        using Ports::PIC_SLAVE_COMMAND;
        using Ports::PIC_SLAVE_DATA;

        constexpr SC::u8 PIC_EOI = 0x20;
        constexpr SC::u8 PIC_READ_ISR = 0x0B;
        constexpr SC::u8 ICW1_INIT_WITH_ICW4 = 0x11;
        constexpr SC::u8 ICW4_8086 = 0x01;
        constexpr SC::u8 CASCADE_LINE = 2;

        // Each initialization word goes to master then slave
        void writeBoth(SC::u16 masterPort, SC::u8 masterValue, SC::u16 slavePort, SC::u8 slaveValue)
        {
            outb(masterPort, masterValue);
            ioWait();
            outb(slavePort, slaveValue);
            ioWait();
        }
    }

    PIC &PIC::instance()
    {
        static PIC instance;
        return instance;
    }

    void PIC::initialize(SC::u8 vectorBase)
    {
        writeBoth(PIC_MASTER_COMMAND, ICW1_INIT_WITH_ICW4, PIC_SLAVE_COMMAND, ICW1_INIT_WITH_ICW4);
        writeBoth(PIC_MASTER_DATA, vectorBase, PIC_SLAVE_DATA, static_cast<SC::u8>(vectorBase + 8));
        writeBoth(PIC_MASTER_DATA, 1 << CASCADE_LINE, PIC_SLAVE_DATA, CASCADE_LINE);
        writeBoth(PIC_MASTER_DATA, ICW4_8086, PIC_SLAVE_DATA, ICW4_8086);

        // Everything stays masked until a driver asks for its line
        outb(PIC_MASTER_DATA, 0xFF);
        outb(PIC_SLAVE_DATA, 0xFF);
    }

    void PIC::unmask(SC::u8 irq)
    {
        SC::u16 port = PIC_MASTER_DATA;
        if (irq >= 8)
        {
            // Slave lines only reach the CPU through the cascade line
            outb(PIC_MASTER_DATA, inb(PIC_MASTER_DATA) & ~(1 << CASCADE_LINE));
            port = PIC_SLAVE_DATA;
            irq -= 8;
        }
        outb(port, inb(port) & ~(1 << irq));
    }

    void PIC::mask(SC::u8 irq)
    {
        SC::u16 port = PIC_MASTER_DATA;
        if (irq >= 8)
        {
            port = PIC_SLAVE_DATA;
            irq -= 8;
        }
        outb(port, inb(port) | (1 << irq));
    }

    void PIC::sendEOI(SC::u8 irq)
    {
        if (irq >= 8)
        {
            outb(PIC_SLAVE_COMMAND, PIC_EOI);
        }
        outb(PIC_MASTER_COMMAND, PIC_EOI);
    }

    SC::u16 PIC::readISR()
    {
        outb(PIC_MASTER_COMMAND, PIC_READ_ISR);
        outb(PIC_SLAVE_COMMAND, PIC_READ_ISR);
        return static_cast<SC::u16>((inb(PIC_SLAVE_COMMAND) << 8) | inb(PIC_MASTER_COMMAND));
    }

    bool PIC::isSpurious(SC::u8 irq)
    {
        if (irq != 7 && irq != 15)
            return false;

        if (readISR() & (1 << irq))
            return false;

        // The master did see a real cascade request
        if (irq == 15)
        {
            outb(PIC_MASTER_COMMAND, PIC_EOI);
        }
        return true;
    }

} // namespace SArch
