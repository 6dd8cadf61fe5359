// SKernel - Implementation
// Namespace: SK

#include "SKKernel.h"
#include "SKInterrupts.h"
#include "SCLogger.h"

namespace SK
{

    Kernel &Kernel::instance()
    {
        static Kernel instance;
        return instance;
    }

    Kernel::Kernel() : m_initialized(false), m_running(false)
    {
    }

    void Kernel::initialize(const KernelConfig &config)
    {
        SC_LOG_INFO("SKernel", "Initializing thread subsystem");

        disableInterrupts();

        InterruptManager::instance().initialize();
        ThreadRegistry::instance().initialize(config.stackPages);
        Scheduler::instance().initialize(config.scheduler);

        m_initialized = true;
        m_running = false;
    }

    void Kernel::start()
    {
        if (!m_initialized)
        {
            SC_LOG_ERROR("SKernel", "start() before initialize()");
            return;
        }
        if (m_running)
        {
            SC_LOG_WARN("SKernel", "Kernel already running");
            return;
        }

        m_running = true;
        Scheduler::instance().start();

        SC_LOG_INFO("SKernel", "Kernel running; %lu thread(s)", ThreadRegistry::instance().threadCount());
    }

} // namespace SK
