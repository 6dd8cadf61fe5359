#pragma once

// SKernel Boot Config - Kernel command line options
// Namespace: SK::Boot::Config

#include "SCLogger.h"
#include "SCTypes.h"
#include "SKKernel.h"

namespace SK::Boot::Config
{
    enum class PanicAction : SC::u8
    {
        PowerOff,
        Halt
    };

    constexpr SC::usize TEST_NAME_LENGTH = 48;
    constexpr SC::u32 MIN_TIME_SLICE = 1;
    constexpr SC::u32 MAX_TIME_SLICE = 1000;
    constexpr SC::u32 MIN_TIMER_HZ = 19;
    constexpr SC::u32 MAX_TIMER_HZ = 1000;
    constexpr SC::usize UNLIMITED_USER_PAGES = static_cast<SC::usize>(-1);

    struct BootOptions
    {
        char testName[TEST_NAME_LENGTH] = {};
        SC::LogLevel logLevel = SC::LogLevel::Info;
        SC::u32 timeSlice = 4;
        WakePolicy wakePolicy = WakePolicy::Fifo;
        SC::u32 timerHz = 100;
        SC::usize userPageLimit = UNLIMITED_USER_PAGES;
        PanicAction panicAction = PanicAction::PowerOff;

        bool hasTest() const { return testName[0] != '\0'; }
    };

    // Parses space separated key=value pairs. Unknown keys and malformed
    // values are logged as warnings and leave the default in place.
    BootOptions parse(const char *cmdline);

    KernelConfig kernelConfig(const BootOptions &options);

    const char *panicActionName(PanicAction action);
}
