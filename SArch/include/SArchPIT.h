#pragma once

// SArch PIT - 8254 programmable interval timer
// Namespace: SArch

#include "SCTypes.h"

namespace SArch
{

    class PIT
    {
    public:
        static constexpr SC::u32 INPUT_FREQUENCY = 1193180;

        // Below this a 16-bit divisor no longer fits; 0 encodes 65536
        static constexpr SC::u32 MIN_FREQUENCY = 19;
        static constexpr SC::u32 MAX_FREQUENCY = INPUT_FREQUENCY / 2;

        enum class Channel : SC::u8
        {
            Out0 = 0,
            Out2 = 2
        };

        enum class Mode : SC::u8
        {
            InterruptOnTerminalCount = 0,
            RateGenerator = 2,
            SquareWave = 3
        };

        static PIT &instance();

        void configure(Channel channel, Mode mode, SC::u32 frequencyHz);

        // Counter value programmed for frequencyHz, clamped to the 16-bit range
        static constexpr SC::u16 divisorFor(SC::u32 frequencyHz)
        {
            return frequencyHz < MIN_FREQUENCY   ? 0
                   : frequencyHz > MAX_FREQUENCY ? 2
                                                 : static_cast<SC::u16>((INPUT_FREQUENCY + frequencyHz / 2) / frequencyHz);
        }

    private:
        PIT() = default;
        ~PIT() = default;
        PIT(const PIT &) = delete;
        PIT &operator=(const PIT &) = delete;
    };

} // namespace SArch
