#pragma once

// SKernel Panic tail for the kernel image.
// SK::panic() formats the report; the tail below decides what happens next.

#include "Boot/Config/BootConfig.h"

namespace SK::Debug
{
    void setPanicAction(SK::Boot::Config::PanicAction action);
    SK::Boot::Config::PanicAction panicAction();
}
