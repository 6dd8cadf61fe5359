#pragma once

// SKernel Shutdown Controller - orderly power-off with an exit status
// Namespace: SK::Shutdown

#include "SCTypes.h"

namespace SK
{
    namespace Shutdown
    {
        /// Exit status reported to the emulator
        enum class Outcome : SC::u8
        {
            Success = 0,
            Failure
        };

        /// Called once at power-off, interrupts disabled. Must not block.
        using SubsystemCallback = void (*)(Outcome outcome, void *userData);
        using SubsystemHandle = SC::u32;
        constexpr SubsystemHandle InvalidSubsystemHandle = 0;

        /// Runs the registered shutdown notifications, then powers the machine off.
        class Controller
        {
        public:
            static constexpr SC::usize MAX_SUBSYSTEMS = 8;

            static Controller &instance();

            SubsystemHandle registerSubsystem(SubsystemCallback callback, void *userData, const char *name);
            void unregisterSubsystem(SubsystemHandle handle);

            [[noreturn]] void powerOff(Outcome outcome);

            bool inProgress() const { return m_inProgress; }

        private:
            Controller();

            void notifySubsystems(Outcome outcome);
            [[noreturn]] void powerOffHardware(Outcome outcome);

            struct SubsystemEntry
            {
                SubsystemHandle handle;
                SubsystemCallback callback;
                void *userData;
                const char *name;
            };

            SubsystemEntry m_subsystems[MAX_SUBSYSTEMS];
            SC::usize m_subsystemCount;
            SubsystemHandle m_nextSubsystemHandle;
            bool m_inProgress;
        };

    } // namespace Shutdown
} // namespace SK
