#pragma once

// SKernel Boot - Bring-up sequence driven by SKMain
// Namespace: SKBoot

#include "Boot/Config/BootConfig.h"

namespace SKBoot
{
    // --- Early Boot ---
    void initializeConsole();
    SK::Boot::Config::BootOptions loadConfig();
    void initializeArch();
    void initializeMemory(const SK::Boot::Config::BootOptions &options);

    // --- Threads ---
    // Scheduler, interrupt controller and timer, then interrupts on
    void initializeThreads(const SK::Boot::Config::BootOptions &options);

    // Runs the selected test (or nothing), then powers off
    [[noreturn]] void run(const SK::Boot::Config::BootOptions &options);
}
