// Mock SArch::CPU: the interrupt flag is a variable, interrupts are raised
// by the tests and the idle halt is a hook.

#include "SArchCPU.h"

#include "MockArch.h"
#include "MockState.h"
#include "SKInterrupts.h"

#include <cstdio>
#include <cstdlib>

namespace SK::Mock
{
    namespace
    {
        constexpr SC::u64 DEFAULT_DEADLOCK_BUDGET = 1000000;

        void defaultHaltHook()
        {
            tick();
        }

        void deliver(SC::u8 vector, SC::u64 errorCode)
        {
            CpuState &cpu = cpuState();

            SK::InterruptFrame frame{};
            frame.vector = vector;
            frame.errorCode = errorCode;
            frame.rflags = cpu.interruptFlag ? 0x202 : 0x002;

            // Hardware clears IF on entry and iretq restores it
            bool saved = cpu.interruptFlag;
            cpu.interruptFlag = false;
            SK::InterruptManager::dispatch(&frame);
            cpu.interruptFlag = saved;
        }

        void deliverPending()
        {
            CpuState &cpu = cpuState();
            while (cpu.interruptFlag && cpu.pendingCount > 0)
            {
                CpuState::Pending pending = cpu.pending[0];
                for (SC::usize i = 1; i < cpu.pendingCount; ++i)
                    cpu.pending[i - 1] = cpu.pending[i];
                --cpu.pendingCount;
                deliver(pending.vector, pending.errorCode);
            }
        }
    }

    CpuState &cpuState()
    {
        static CpuState state;
        return state;
    }

    void resetCpu()
    {
        CpuState &cpu = cpuState();
        cpu.interruptFlag = false;
        cpu.pendingCount = 0;
        cpu.haltHook = defaultHaltHook;
        cpu.halts = 0;
        cpu.deadlockBudget = DEFAULT_DEADLOCK_BUDGET;
        cpu.cr2 = 0;
    }

    bool interruptFlag()
    {
        return cpuState().interruptFlag;
    }

    void setHaltHook(HaltHook hook)
    {
        cpuState().haltHook = hook ? hook : defaultHaltHook;
    }

    SC::u64 haltCount()
    {
        return cpuState().halts;
    }

    void setDeadlockBudget(SC::u64 halts)
    {
        cpuState().deadlockBudget = halts;
    }

    void setCR2(SC::u64 address)
    {
        cpuState().cr2 = address;
    }

    void raiseInterrupt(SC::u8 vector, SC::u64 errorCode)
    {
        CpuState &cpu = cpuState();

        // CPU exceptions are synchronous and ignore IF
        if (vector < SK::EXCEPTION_COUNT || cpu.interruptFlag)
        {
            deliver(vector, errorCode);
            return;
        }

        // A level that is already pending is not queued twice
        for (SC::usize i = 0; i < cpu.pendingCount; ++i)
        {
            if (cpu.pending[i].vector == vector)
                return;
        }
        if (cpu.pendingCount < CpuState::MAX_PENDING)
            cpu.pending[cpu.pendingCount++] = {vector, errorCode};
    }

    void tick()
    {
        raiseInterrupt(SK::IRQ_TIMER);
    }

    bool maybeTick(std::mt19937 &rng, unsigned oneIn)
    {
        std::uniform_int_distribution<unsigned> dist(0, oneIn - 1);
        if (dist(rng) != 0)
            return false;
        tick();
        return true;
    }
}

namespace SArch
{
    CPU &CPU::instance()
    {
        static CPU cpu;
        return cpu;
    }

    CPU::CPU() : m_vendor{"MockCPU"}, m_brand{"Host mock CPU"}
    {
    }

    void CPU::initialize()
    {
    }

    SC::u64 CPU::readCR2()
    {
        return SK::Mock::cpuState().cr2;
    }

    void CPU::enableInterrupts()
    {
        SK::Mock::cpuState().interruptFlag = true;
        SK::Mock::deliverPending();
    }

    void CPU::disableInterrupts()
    {
        SK::Mock::cpuState().interruptFlag = false;
    }

    bool CPU::interruptsEnabled()
    {
        return SK::Mock::cpuState().interruptFlag;
    }

    void CPU::waitForInterrupt()
    {
        SK::Mock::CpuState &cpu = SK::Mock::cpuState();
        if (++cpu.halts > cpu.deadlockBudget)
        {
            std::fprintf(stderr, "MockArch: idle halted %llu times, assuming deadlock\n",
                         static_cast<unsigned long long>(cpu.halts));
            std::abort();
        }

        enableInterrupts();
        cpu.haltHook();
    }

    void CPU::haltForever()
    {
        std::fprintf(stderr, "MockArch: haltForever\n");
        std::abort();
    }
}
