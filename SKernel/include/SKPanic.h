#pragma once

// SKernel Panic - Fatal error reporting
// Namespace: SK

#include "SCTypes.h"

namespace SK
{

    // Logs "Kernel PANIC in thread '<name>' (tid <n>): <message>" and stops
    [[noreturn]] void panic(const char *format, ...) __attribute__((format(printf, 1, 2)));

    // Platform tail invoked once the panic message is out. Never returns.
    [[noreturn]] void panicHalt();

    // Number of panics seen so far; a second one skips straight to the tail
    SC::u32 panicCount();

} // namespace SK

#define SK_ASSERT(cond)                                                             \
    do                                                                              \
    {                                                                               \
        if (!(cond))                                                                \
            SK::panic("assertion `%s' failed at %s:%d", #cond, __FILE__, __LINE__); \
    } while (0)
