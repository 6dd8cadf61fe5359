#include "Boot/SKBoot.h"

#include "Boot/Arch/ArchInit.h"
#include "Boot/Limine/LimineRequests.h"
#include "Boot/Memory/EarlyMemory.h"
#include "Debug/Panic.h"
#include "Debug/Serial/SerialDebug.h"
#include "Tests/SKTest.h"

#include "SCLogger.h"
#include "SDrvTimer.h"
#include "SKKernel.h"
#include "SKPanic.h"
#include "SKScheduler.h"
#include "SKShutdownController.h"

namespace
{
    void logSchedulerStats(SK::Shutdown::Outcome, void *)
    {
        SK::Scheduler::instance().logStats();
    }
}

namespace SKBoot
{
    void initializeConsole()
    {
        SK::Debug::Serial::initialize();
        SK::Debug::Serial::attachToLogger();
    }

    SK::Boot::Config::BootOptions loadConfig()
    {
        if (!SK::Boot::Limine::BaseRevisionSupported())
            SK::panic("Limine base revision not supported");

        const char *cmdline = SK::Boot::Limine::GetCommandLine();
        SC_LOG_INFO("SKBoot", "Command line: %s", cmdline);

        SK::Boot::Config::BootOptions options = SK::Boot::Config::parse(cmdline);
        SC::Logger::instance().setLevel(options.logLevel);
        SK::Debug::setPanicAction(options.panicAction);
        return options;
    }

    void initializeArch()
    {
        SK::Boot::Arch::InitCpuGdtIdt();
    }

    void initializeMemory(const SK::Boot::Config::BootOptions &options)
    {
        SK::Boot::Memory::initialize(options.userPageLimit);
    }

    void initializeThreads(const SK::Boot::Config::BootOptions &options)
    {
        SK::Kernel &kernel = SK::Kernel::instance();
        kernel.initialize(SK::Boot::Config::kernelConfig(options));
        SDrv::Timer::instance().initialize(options.timerHz);

        SK::Shutdown::Controller::instance().registerSubsystem(logSchedulerStats, nullptr, "Scheduler");

        kernel.start();
        SC_LOG_INFO("SKBoot", "Scheduler started (slice %u ticks, %s wake-up, %u Hz)", options.timeSlice,
                    options.wakePolicy == SK::WakePolicy::Fifo ? "FIFO" : "priority", options.timerHz);
    }

    void run(const SK::Boot::Config::BootOptions &options)
    {
        SK::Shutdown::Outcome outcome = SK::Shutdown::Outcome::Success;

        if (options.hasTest())
        {
            if (!SK::Test::run(options.testName))
                outcome = SK::Shutdown::Outcome::Failure;
        }
        else
        {
            SC_LOG_INFO("SKBoot", "Boot complete.");
        }

        SK::Shutdown::Controller::instance().powerOff(outcome);
    }
}
