// SKernel Main - Limine entry point
// Namespace: SK

#include "Boot/SKBoot.h"

#include "SCLogger.h"

// C++ global constructors
using ConstructorFunc = void (*)();
extern "C" ConstructorFunc __init_array_start[];
extern "C" ConstructorFunc __init_array_end[];

static void callConstructors()
{
    for (ConstructorFunc *ctor = __init_array_start; ctor < __init_array_end; ++ctor)
    {
        (*ctor)();
    }
}

// Kernel main entry point. Limine enters in long mode with interrupts off,
// .bss cleared and a 64 KiB stack that becomes the "main" thread's stack.
extern "C" [[noreturn]] void kernel_main()
{
    callConstructors();

    SKBoot::initializeConsole();
    SC_LOG_INFO("SKMain", "Skiff kernel starting");

    SK::Boot::Config::BootOptions options = SKBoot::loadConfig();
    SKBoot::initializeArch();
    SKBoot::initializeMemory(options);
    SKBoot::initializeThreads(options);

    SKBoot::run(options);
}
