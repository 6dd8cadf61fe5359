#include "KernelFixture.h"

namespace
{
    using StackGuardTest = SK::Test::KernelTest;

    TEST_F(StackGuardTest, NewThreadsCarryAnIntactGuardWord)
    {
        struct Probe
        {
            bool intact = false;
            SC::u64 guard = 0;
        } probe;

        spawn("probe", 40,
              [](void *arg)
              {
                  Probe *p = static_cast<Probe *>(arg);
                  SK::Thread &self = SK::Scheduler::instance().currentThread();
                  p->intact = SK::ThreadRegistry::instance().intact(self);
                  p->guard = *static_cast<SC::u64 *>(self.stackBase);
              },
              &probe);

        EXPECT_TRUE(probe.intact);
        EXPECT_EQ(probe.guard, SK::STACK_GUARD);
        // main runs on the boot stack, which has no guard word
        EXPECT_EQ(scheduler().currentThread().stackBase, nullptr);
        EXPECT_TRUE(SK::ThreadRegistry::instance().intact(scheduler().currentThread()));
    }

    using StackGuardDeathTest = StackGuardTest;

    TEST_F(StackGuardDeathTest, OverwrittenGuardIsCaughtAtTheNextSwitch)
    {
        EXPECT_DEATH(
            {
                spawn("smasher", 40,
                      [](void *)
                      {
                          SK::Thread &self = SK::Scheduler::instance().currentThread();
                          *static_cast<SC::u64 *>(self.stackBase) = 0;
                          SK::Scheduler::instance().yield();
                      },
                      nullptr);
            },
            "stack overflow detected in thread 'smasher' \\(tid 3\\)");
    }

    TEST_F(StackGuardDeathTest, ClobberedControlBlockIsCaughtAtTheNextSwitch)
    {
        EXPECT_DEATH(
            {
                scheduler().currentThread().magic = 0xdeadbeef;
                SDrv::Timer::instance().sleep(1);
            },
            "corrupted control block in slot 0");
    }
}
