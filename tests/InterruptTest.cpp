#include "KernelFixture.h"

namespace
{
    struct HandlerLog
    {
        int calls = 0;
        bool sawExternal = false;
        bool sawInterruptsOff = false;
        SC::u64 vector = 0;
    };

    HandlerLog g_handlerLog;

    void recordingHandler(SK::InterruptFrame *frame)
    {
        ++g_handlerLog.calls;
        g_handlerLog.sawExternal = SK::InterruptManager::instance().inExternalInterrupt();
        g_handlerLog.sawInterruptsOff = SK::interruptLevel() == SK::InterruptLevel::Off;
        g_handlerLog.vector = frame->vector;
    }

    class InterruptTest : public SK::Test::KernelTest
    {
    protected:
        void SetUp() override
        {
            KernelTest::SetUp();
            g_handlerLog = HandlerLog();
        }

        static SK::InterruptManager &interrupts() { return SK::InterruptManager::instance(); }
    };

    constexpr SC::u8 IRQ_TEST = SK::IRQ_BASE + 5;

    TEST_F(InterruptTest, PicIsRemappedAndTimerUnmasked)
    {
        EXPECT_EQ(SK::Mock::picVectorBase(), SK::IRQ_BASE);
        EXPECT_FALSE(SK::Mock::irqMasked(0));
        EXPECT_TRUE(SK::Mock::irqMasked(5));
        EXPECT_STREQ(interrupts().handlerName(SK::IRQ_TIMER), "8254 Timer");
    }

    TEST_F(InterruptTest, ExternalHandlerRunsWithInterruptsOffAndGetsAnEoi)
    {
        interrupts().registerHandler(IRQ_TEST, recordingHandler, "test device");
        interrupts().enableInterrupt(5);
        EXPECT_FALSE(SK::Mock::irqMasked(5));

        SK::Mock::raiseInterrupt(IRQ_TEST);

        EXPECT_EQ(g_handlerLog.calls, 1);
        EXPECT_EQ(g_handlerLog.vector, IRQ_TEST);
        EXPECT_TRUE(g_handlerLog.sawExternal);
        EXPECT_TRUE(g_handlerLog.sawInterruptsOff);
        EXPECT_FALSE(interrupts().inExternalInterrupt());
        EXPECT_EQ(SK::Mock::eoiCount(5), 1u);
        EXPECT_EQ(interrupts().interruptCount(IRQ_TEST), 1u);
        EXPECT_EQ(SK::interruptLevel(), SK::InterruptLevel::On);
    }

    TEST_F(InterruptTest, InterruptsRaisedWhileDisabledArriveOnRestore)
    {
        interrupts().registerHandler(IRQ_TEST, recordingHandler, "test device");

        {
            SK::InterruptGuard guard;
            SK::Mock::raiseInterrupt(IRQ_TEST);
            EXPECT_EQ(g_handlerLog.calls, 0);
        }

        EXPECT_EQ(g_handlerLog.calls, 1);
    }

    TEST_F(InterruptTest, GuardsNestAndRestoreThePreviousLevel)
    {
        EXPECT_EQ(SK::interruptLevel(), SK::InterruptLevel::On);
        {
            SK::InterruptGuard outer;
            EXPECT_EQ(outer.previous(), SK::InterruptLevel::On);
            {
                SK::InterruptGuard inner;
                EXPECT_EQ(inner.previous(), SK::InterruptLevel::Off);
            }
            EXPECT_EQ(SK::interruptLevel(), SK::InterruptLevel::Off);
        }
        EXPECT_EQ(SK::interruptLevel(), SK::InterruptLevel::On);
    }

    TEST_F(InterruptTest, SpuriousIrqsAreDroppedWithoutEoi)
    {
        interrupts().registerHandler(SK::IRQ_BASE + 7, recordingHandler, "lpt");
        SK::Mock::setSpurious(7, true);
        SK::Mock::setSpurious(15, true);

        SK::Mock::raiseInterrupt(SK::IRQ_BASE + 7);
        SK::Mock::raiseInterrupt(SK::IRQ_BASE + 15);

        EXPECT_EQ(g_handlerLog.calls, 0);
        EXPECT_EQ(interrupts().spuriousCount(), 2u);
        EXPECT_EQ(SK::Mock::eoiCount(7), 0u);
        EXPECT_EQ(SK::Mock::eoiCount(15), 0u);
        // The cascade line on the master still gets its EOI
        EXPECT_EQ(SK::Mock::eoiCount(2), 1u);
    }

    TEST_F(InterruptTest, SpuriousFlagOnlyAppliesToLines7And15)
    {
        interrupts().registerHandler(IRQ_TEST, recordingHandler, "test device");
        SK::Mock::setSpurious(5, true);

        SK::Mock::raiseInterrupt(IRQ_TEST);

        EXPECT_EQ(g_handlerLog.calls, 1);
        EXPECT_EQ(interrupts().spuriousCount(), 0u);
    }

    TEST_F(InterruptTest, UnregisteredIrqIsLoggedAndAcknowledged)
    {
        SK::Mock::raiseInterrupt(SK::IRQ_BASE + 9);

        EXPECT_TRUE(SK::Mock::logContains("Unexpected interrupt 0x29 (IRQ 9)"));
        EXPECT_EQ(SK::Mock::eoiCount(9), 1u);
    }

    TEST_F(InterruptTest, ExceptionHandlersCanBeInstalled)
    {
        interrupts().registerHandler(SK::INT_BREAKPOINT, recordingHandler, "breakpoint");

        SK::Mock::raiseInterrupt(SK::INT_BREAKPOINT);

        EXPECT_EQ(g_handlerLog.calls, 1);
        EXPECT_FALSE(g_handlerLog.sawExternal);
        EXPECT_STREQ(interrupts().handlerName(SK::INT_BREAKPOINT), "breakpoint");

        interrupts().unregisterHandler(SK::INT_BREAKPOINT);
        EXPECT_STREQ(interrupts().handlerName(SK::INT_BREAKPOINT), "unknown");
    }

    TEST_F(InterruptTest, ExceptionNamesFollowTheManual)
    {
        EXPECT_STREQ(SK::exceptionName(SK::INT_DIVIDE_ERROR), "#DE Divide Error");
        EXPECT_STREQ(SK::exceptionName(SK::INT_PAGE_FAULT), "#PF Page-Fault Exception");
        EXPECT_STREQ(SK::exceptionName(SK::INT_GENERAL_PROTECTION), "#GP General Protection Exception");
    }

    using InterruptDeathTest = InterruptTest;

    TEST_F(InterruptDeathTest, UnhandledPageFaultPanicsWithFaultAddress)
    {
        EXPECT_DEATH(
            {
                SK::Mock::setCR2(0xdeadb000);
                SK::Mock::raiseInterrupt(SK::INT_PAGE_FAULT, 2);
            },
            "Kernel PANIC in thread 'main' \\(tid 1\\): unhandled #PF Page-Fault Exception.*0xdeadb000");
    }

    TEST_F(InterruptDeathTest, BlockingInsideAHandlerPanics)
    {
        EXPECT_DEATH(
            {
                interrupts().registerHandler(
                    IRQ_TEST,
                    [](SK::InterruptFrame *)
                    {
                        SK::Semaphore never(0);
                        never.down();
                    },
                    "blocking");
                SK::Mock::raiseInterrupt(IRQ_TEST);
            },
            "down\\(\\) inside an interrupt handler");
    }
}
