#pragma once

// SKernel Serial Debug - COM1 console used as the logger sink
// Namespace: SK::Debug::Serial

#include "SCTypes.h"

namespace SK::Debug::Serial
{
    void initialize();

    // Writes with interrupts disabled so lines from different threads never interleave
    void write(const char *message);

    // Installs write() as the SC::Logger output and reports the character
    // count when the machine powers off
    void attachToLogger();

    SC::u64 charactersWritten();
}
