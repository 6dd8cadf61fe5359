#include "KernelFixture.h"

#include "SArchPIT.h"

#include <vector>

namespace
{
    using SK::Test::KernelTest;

    class TimerTest : public KernelTest
    {
    protected:
        static SDrv::Timer &timer() { return SDrv::Timer::instance(); }
    };

    TEST_F(TimerTest, ProgramsChannelZeroAsRateGenerator)
    {
        const SK::Mock::PitProgram &pit = SK::Mock::pitProgram();
        EXPECT_EQ(pit.channel, static_cast<SC::u8>(SArch::PIT::Channel::Out0));
        EXPECT_EQ(pit.mode, static_cast<SC::u8>(SArch::PIT::Mode::RateGenerator));
        EXPECT_EQ(pit.frequency, 100u);
        EXPECT_EQ(pit.divisor, 11932u);
        EXPECT_EQ(timer().frequency(), 100u);
        EXPECT_FALSE(SK::Mock::irqMasked(0));
    }

    TEST_F(TimerTest, DivisorIsRoundedToNearest)
    {
        EXPECT_EQ(SArch::PIT::divisorFor(1000), 1193u);
        EXPECT_EQ(SArch::PIT::divisorFor(19), 62799u);
        EXPECT_EQ(SArch::PIT::divisorFor(18), 0u);
    }

    TEST_F(TimerTest, CountsTicksAndMilliseconds)
    {
        SC::u64 start = timer().ticks();
        for (int i = 0; i < 7; ++i)
            SK::Mock::tick();

        EXPECT_EQ(timer().elapsed(start), 7u);
        EXPECT_EQ(timer().milliseconds(), (start + 7) * 10);
    }

    TEST_F(TimerTest, NonPositiveSleepsReturnImmediately)
    {
        SC::u64 start = timer().ticks();
        SC::u64 halts = SK::Mock::haltCount();

        timer().sleep(0);
        timer().sleep(-100);
        timer().sleepMilliseconds(0);
        timer().sleepMilliseconds(-5);

        EXPECT_EQ(timer().ticks(), start);
        EXPECT_EQ(SK::Mock::haltCount(), halts);
        EXPECT_EQ(timer().sleeperCount(), 0u);
    }

    TEST_F(TimerTest, SleepBlocksForTheRequestedTicks)
    {
        SC::u64 start = timer().ticks();
        timer().sleep(5);
        EXPECT_EQ(timer().elapsed(start), 5u);
        EXPECT_EQ(timer().sleeperCount(), 0u);
    }

    TEST_F(TimerTest, SleepMillisecondsRoundsUpToWholeTicks)
    {
        SC::u64 start = timer().ticks();
        timer().sleepMilliseconds(1);
        EXPECT_EQ(timer().elapsed(start), 1u);

        start = timer().ticks();
        timer().sleepMilliseconds(25);
        EXPECT_EQ(timer().elapsed(start), 3u);

        start = timer().ticks();
        timer().sleepMilliseconds(30);
        EXPECT_EQ(timer().elapsed(start), 3u);
    }

    TEST_F(TimerTest, FasterTickRateShortensTheTick)
    {
        timer().initialize(1000);
        EXPECT_EQ(SK::Mock::pitProgram().divisor, 1193u);
        EXPECT_EQ(SK::Mock::pitProgram().writes, 2u);

        SC::u64 start = timer().ticks();
        timer().sleepMilliseconds(25);
        EXPECT_EQ(timer().elapsed(start), 25u);
    }

    struct Sleeper
    {
        SC::i64 ticks;
        std::vector<int> *woken;
        SK::Semaphore *done;
        int tag;
    };

    void sleepAndRecord(void *arg)
    {
        Sleeper *s = static_cast<Sleeper *>(arg);
        SDrv::Timer::instance().sleep(s->ticks);
        s->woken->push_back(s->tag);
        s->done->up();
    }

    TEST_F(TimerTest, SleepersWakeInDeadlineOrder)
    {
        std::vector<int> woken;
        SK::Semaphore done(0);
        Sleeper sleepers[] = {
            {30, &woken, &done, 30},
            {10, &woken, &done, 10},
            {20, &woken, &done, 20},
        };

        for (Sleeper &s : sleepers)
            spawn("sleeper", 40, sleepAndRecord, &s);
        EXPECT_EQ(timer().sleeperCount(), 3u);

        join(done, 3);

        EXPECT_EQ(woken, (std::vector<int>{10, 20, 30}));
    }

    TEST_F(TimerTest, EqualDeadlinesWakeInArrivalOrder)
    {
        std::vector<int> woken;
        SK::Semaphore done(0);
        Sleeper sleepers[] = {
            {5, &woken, &done, 1},
            {5, &woken, &done, 2},
            {5, &woken, &done, 3},
        };

        for (Sleeper &s : sleepers)
            spawn("sleeper", 40, sleepAndRecord, &s);

        join(done, 3);

        EXPECT_EQ(woken, (std::vector<int>{1, 2, 3}));
    }

    TEST_F(TimerTest, RepeatedSleepsWakeOnSchedule)
    {
        struct Repeater
        {
            SC::i64 period;
            int iterations;
            std::vector<SC::u64> *wakeTicks;
            SK::Semaphore *done;
        };

        std::vector<SC::u64> wakeTicks;
        SK::Semaphore done(0);
        Repeater repeater{3, 5, &wakeTicks, &done};

        SC::u64 start = timer().ticks();
        spawn("repeater", 40,
              [](void *arg)
              {
                  Repeater *r = static_cast<Repeater *>(arg);
                  for (int i = 0; i < r->iterations; ++i)
                  {
                      SDrv::Timer::instance().sleep(r->period);
                      r->wakeTicks->push_back(SDrv::Timer::instance().ticks());
                  }
                  r->done->up();
              },
              &repeater);

        join(done, 1);

        ASSERT_EQ(wakeTicks.size(), 5u);
        for (SC::usize i = 0; i < wakeTicks.size(); ++i)
            EXPECT_EQ(wakeTicks[i], start + 3 * (i + 1)) << "iteration " << i;
    }

    SC::u64 g_callbackTicks[8];
    SC::usize g_callbackCount = 0;

    TEST_F(TimerTest, CallbackRunsOnEveryTick)
    {
        g_callbackCount = 0;
        timer().setCallback(
            [](SC::u64 ticks)
            {
                if (g_callbackCount < 8)
                    g_callbackTicks[g_callbackCount] = ticks;
                ++g_callbackCount;
            });

        SC::u64 start = timer().ticks();
        SK::Mock::tick();
        SK::Mock::tick();
        SK::Mock::tick();
        timer().setCallback(nullptr);
        SK::Mock::tick();

        ASSERT_EQ(g_callbackCount, 3u);
        EXPECT_EQ(g_callbackTicks[0], start + 1);
        EXPECT_EQ(g_callbackTicks[2], start + 3);
    }

    using TimerDeathTest = TimerTest;

    TEST_F(TimerDeathTest, FrequencyOutOfRangePanics)
    {
        EXPECT_DEATH(timer().initialize(18), "timer frequency 18 Hz outside 19..1000");
        EXPECT_DEATH(timer().initialize(1001), "timer frequency 1001 Hz outside 19..1000");
    }
}
