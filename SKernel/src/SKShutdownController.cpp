// SKernel Shutdown Controller - implementation
// Namespace: SK::Shutdown

#include "SKShutdownController.h"

#include "SArchCPU.h"
#include "SArchPort.h"
#include "SCLogger.h"

namespace SK
{
    namespace Shutdown
    {
        namespace
        {
            constexpr const char *LOG_MODULE = "SKShutdown";

            // QEMU isa-debug-exit: the emulator exits with (value << 1) | 1
            constexpr SC::u8 DEBUG_EXIT_SUCCESS = 0x31;
            constexpr SC::u8 DEBUG_EXIT_FAILURE = 0x42;

            // SLP_EN with SLP_TYP 0
            constexpr SC::u16 ACPI_SLEEP_S5 = 0x2000;
        }

        Controller &Controller::instance()
        {
            static Controller controller;
            return controller;
        }

        Controller::Controller()
            : m_subsystemCount(0),
              m_nextSubsystemHandle(1),
              m_inProgress(false)
        {
        }

        SubsystemHandle Controller::registerSubsystem(SubsystemCallback callback, void *userData, const char *name)
        {
            if (!callback)
                return InvalidSubsystemHandle;

            if (m_subsystemCount == MAX_SUBSYSTEMS)
            {
                SC_LOG_WARN(LOG_MODULE, "No room to register shutdown subsystem '%s'", name ? name : "anonymous");
                return InvalidSubsystemHandle;
            }

            SubsystemEntry &entry = m_subsystems[m_subsystemCount++];
            entry.handle = m_nextSubsystemHandle++;
            entry.callback = callback;
            entry.userData = userData;
            entry.name = name;

            SC_LOG_DEBUG(LOG_MODULE, "Registered shutdown subsystem '%s' (handle=%u)",
                         entry.name ? entry.name : "anonymous", entry.handle);
            return entry.handle;
        }

        void Controller::unregisterSubsystem(SubsystemHandle handle)
        {
            if (handle == InvalidSubsystemHandle)
                return;

            for (SC::usize i = 0; i < m_subsystemCount; ++i)
            {
                if (m_subsystems[i].handle == handle)
                {
                    // Move last entry into this slot to keep the table packed
                    m_subsystems[i] = m_subsystems[m_subsystemCount - 1];
                    --m_subsystemCount;
                    return;
                }
            }
        }

        void Controller::powerOff(Outcome outcome)
        {
            SArch::CPU::instance().disableInterrupts();

            if (m_inProgress)
            {
                powerOffHardware(outcome);
            }
            m_inProgress = true;

            notifySubsystems(outcome);

            SC_LOG_INFO(LOG_MODULE, "Powering off%s", outcome == Outcome::Success ? "..." : " (failure)");
            powerOffHardware(outcome);
        }

        void Controller::notifySubsystems(Outcome outcome)
        {
            for (SC::usize i = 0; i < m_subsystemCount; ++i)
            {
                SubsystemEntry &entry = m_subsystems[i];
                entry.callback(outcome, entry.userData);
            }
        }

        void Controller::powerOffHardware(Outcome outcome)
        {
            SArch::outb(SArch::Ports::QEMU_DEBUG_EXIT, outcome == Outcome::Success ? DEBUG_EXIT_SUCCESS : DEBUG_EXIT_FAILURE);

            // Without isa-debug-exit: QEMU (PIIX4 PM) and Bochs ACPI S5
            SArch::outw(SArch::Ports::QEMU_PM1A_CONTROL, ACPI_SLEEP_S5);
            SArch::outw(SArch::Ports::BOCHS_PM1A_CONTROL, ACPI_SLEEP_S5);

            SC_LOG_ERROR(LOG_MODULE, "Power-off failed; halting");
            SArch::CPU::instance().haltForever();
        }

    } // namespace Shutdown
} // namespace SK
