// SKernel Panic - Implementation
// Namespace: SK

#include "SKPanic.h"
#include "SKScheduler.h"
#include "SArchCPU.h"
#include "SCLogger.h"
#include "SCString.h"
#include <cstdarg>

namespace SK
{

    namespace
    {
        SC::u32 g_panicCount = 0;
    }

    SC::u32 panicCount()
    {
        return g_panicCount;
    }

    void panic(const char *format, ...)
    {
        SArch::CPU::instance().disableInterrupts();

        if (++g_panicCount > 1)
        {
            // Panicked while reporting a panic
            panicHalt();
        }

        char message[SC::Logger::LINE_SIZE];
        va_list args;
        va_start(args, format);
        SC::Logger::vformat(message, sizeof(message), format, args);
        va_end(args);

        char name[THREAD_NAME_LENGTH] = "(none)";
        ThreadId id = INVALID_THREAD_ID;
        if (const Thread *current = Scheduler::instance().runningThread())
        {
            SC::String::strncpy(name, current->name, sizeof(name));
            id = current->id;
        }

        SC_LOG_FATAL("SKPanic", "Kernel PANIC in thread '%s' (tid %u): %s", name, id, message);

        panicHalt();
    }

} // namespace SK
