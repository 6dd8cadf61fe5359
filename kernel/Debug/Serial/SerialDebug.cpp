#include "SerialDebug.h"

#include "SArchPort.h"
#include "SCLogger.h"
#include "SKInterrupts.h"
#include "SKShutdownController.h"

namespace
{
    // 16550 register offsets from the base port
    constexpr SC::u16 UART_DATA = 0;
    constexpr SC::u16 UART_INTERRUPT_ENABLE = 1;
    constexpr SC::u16 UART_FIFO_CONTROL = 2;
    constexpr SC::u16 UART_LINE_CONTROL = 3;
    constexpr SC::u16 UART_MODEM_CONTROL = 4;
    constexpr SC::u16 UART_LINE_STATUS = 5;

    constexpr SC::u8 LINE_STATUS_THR_EMPTY = 0x20;
    constexpr SC::u8 LINE_CONTROL_DLAB = 0x80;
    constexpr SC::u8 LINE_CONTROL_8N1 = 0x03;

    SC::u64 g_charactersWritten = 0;

    void writeRegister(SC::u16 reg, SC::u8 value)
    {
        SArch::outb(static_cast<SC::u16>(SArch::Ports::COM1 + reg), value);
    }

    void putChar(char ch)
    {
        while ((SArch::inb(SArch::Ports::COM1 + UART_LINE_STATUS) & LINE_STATUS_THR_EMPTY) == 0)
        {
        }
        writeRegister(UART_DATA, static_cast<SC::u8>(ch));
    }

    void reportCharacterCount(SK::Shutdown::Outcome, void *)
    {
        SC_LOG_INFO("Console", "%lu characters output", static_cast<unsigned long>(g_charactersWritten));
    }
}

namespace SK::Debug::Serial
{
    void initialize()
    {
        writeRegister(UART_INTERRUPT_ENABLE, 0x00);

        // 115200 / 3 = 38400 baud; the divisor latch overlays DATA and IER
        writeRegister(UART_LINE_CONTROL, LINE_CONTROL_DLAB);
        writeRegister(UART_DATA, 0x03);
        writeRegister(UART_INTERRUPT_ENABLE, 0x00);

        writeRegister(UART_LINE_CONTROL, LINE_CONTROL_8N1);
        writeRegister(UART_FIFO_CONTROL, 0xC7);
        writeRegister(UART_MODEM_CONTROL, 0x03);
    }

    void write(const char *message)
    {
        if (!message)
            return;

        SK::InterruptGuard guard;
        while (*message)
        {
            if (*message == '\n')
                putChar('\r');
            putChar(*message);
            ++g_charactersWritten;
            ++message;
        }
    }

    void attachToLogger()
    {
        SC::Logger::instance().setOutput(write);
        SK::Shutdown::Controller::instance().registerSubsystem(reportCharacterCount, nullptr, "Console");
    }

    SC::u64 charactersWritten()
    {
        SK::InterruptGuard guard;
        return g_charactersWritten;
    }
}
