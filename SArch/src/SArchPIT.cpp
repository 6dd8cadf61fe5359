// SArch PIT - Implementation
// Namespace: SArch

#include "SArchPIT.h"
#include "SArchPort.h"

namespace SArch
{

    namespace
    {
        // Access mode lobyte/hibyte
        constexpr SC::u8 PIT_ACCESS_LOHI = 0x30;
    }

    PIT &PIT::instance()
    {
        static PIT instance;
        return instance;
    }

    void PIT::configure(Channel channel, Mode mode, SC::u32 frequencyHz)
    {
        SC::u8 index = static_cast<SC::u8>(channel);
        SC::u16 count = divisorFor(frequencyHz);

        outb(Ports::PIT_COMMAND, static_cast<SC::u8>((index << 6) | PIT_ACCESS_LOHI |
                                                     (static_cast<SC::u8>(mode) << 1)));
        outb(Ports::PIT_CHANNEL0 + index, count & 0xFF);
        outb(Ports::PIT_CHANNEL0 + index, (count >> 8) & 0xFF);
    }

} // namespace SArch
