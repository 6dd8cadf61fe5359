#pragma once

// SKernel - Thread subsystem bring-up
// Namespace: SK

#include "SCTypes.h"
#include "SKScheduler.h"
#include "SKThreadRegistry.h"

namespace SK
{

    struct KernelConfig
    {
        SchedulerConfig scheduler;
        SC::usize stackPages = ThreadRegistry::DEFAULT_STACK_PAGES;
    };

    class Kernel
    {
    public:
        static Kernel &instance();

        // Interrupt controller, thread registry and scheduler, in that order.
        // Afterwards the caller runs as thread "main"; interrupts stay off.
        // The page allocator must already be initialized.
        void initialize(const KernelConfig &config);

        // Creates the idle thread, then enables interrupts
        void start();

        bool isInitialized() const { return m_initialized; }
        bool isRunning() const { return m_running; }

    private:
        Kernel();
        ~Kernel() = default;
        Kernel(const Kernel &) = delete;
        Kernel &operator=(const Kernel &) = delete;

        bool m_initialized;
        bool m_running;
    };

} // namespace SK
