#include "Debug/Panic.h"

#include "SArchCPU.h"
#include "SKPanic.h"
#include "SKShutdownController.h"

namespace
{
    SK::Boot::Config::PanicAction g_panicAction = SK::Boot::Config::PanicAction::PowerOff;
}

namespace SK::Debug
{
    void setPanicAction(SK::Boot::Config::PanicAction action)
    {
        g_panicAction = action;
    }

    SK::Boot::Config::PanicAction panicAction()
    {
        return g_panicAction;
    }
}

namespace SK
{
    void panicHalt()
    {
        SArch::CPU::instance().disableInterrupts();

        // A panic raised by a shutdown subsystem must not re-enter the controller
        if (g_panicAction == Boot::Config::PanicAction::PowerOff && panicCount() == 1 &&
            !Shutdown::Controller::instance().inProgress())
        {
            Shutdown::Controller::instance().powerOff(Shutdown::Outcome::Failure);
        }

        SArch::CPU::instance().haltForever();
    }
}
