#include "MockArch.h"
#include "SKThread.h"
#include "SKThreadRegistry.h"

#include <gtest/gtest.h>

namespace
{
    // Borrows registry slots from the top of the table; no scheduler involved
    class ThreadListTest : public ::testing::Test
    {
    protected:
        static constexpr SK::ThreadSlot FIRST_SLOT = 50;

        void SetUp() override
        {
            SK::Mock::reset();
            for (SK::ThreadSlot i = 0; i < 6; ++i)
            {
                SK::Thread &t = SK::ThreadRegistry::instance().at(FIRST_SLOT + i);
                t.slot = FIRST_SLOT + i;
                t.id = 100 + i;
                t.priority = SK::PRIORITY_DEFAULT;
                t.waitLink = SK::ThreadLink();
                t.donorLink = SK::ThreadLink();
                t.magic = SK::THREAD_MAGIC;
            }
        }

        SK::Thread &thread(int i) { return SK::ThreadRegistry::instance().at(FIRST_SLOT + i); }
    };

    TEST_F(ThreadListTest, PushBackKeepsInsertionOrder)
    {
        SK::ThreadQueue queue;
        EXPECT_TRUE(queue.empty());

        queue.pushBack(thread(0));
        queue.pushBack(thread(1));
        queue.pushBack(thread(2));

        EXPECT_EQ(queue.size(), 3u);
        EXPECT_EQ(queue.popFront(), &thread(0));
        EXPECT_EQ(queue.popFront(), &thread(1));
        EXPECT_EQ(queue.popFront(), &thread(2));
        EXPECT_EQ(queue.popFront(), nullptr);
        EXPECT_TRUE(queue.empty());
    }

    TEST_F(ThreadListTest, RemoveFromMiddleRelinksNeighbours)
    {
        SK::ThreadQueue queue;
        queue.pushBack(thread(0));
        queue.pushBack(thread(1));
        queue.pushBack(thread(2));

        queue.remove(thread(1));

        EXPECT_FALSE(queue.contains(thread(1)));
        EXPECT_EQ(thread(1).waitLink.owner, nullptr);
        EXPECT_EQ(queue.front(), &thread(0));
        EXPECT_EQ(queue.next(thread(0)), &thread(2));
        EXPECT_EQ(queue.next(thread(2)), nullptr);
    }

    TEST_F(ThreadListTest, HighestPrefersEarliestAmongEqualPriorities)
    {
        SK::ThreadQueue queue;
        thread(0).priority = 10;
        thread(1).priority = 40;
        thread(2).priority = 40;
        thread(3).priority = 20;
        for (int i = 0; i < 4; ++i)
            queue.pushBack(thread(i));

        EXPECT_EQ(queue.highest(), &thread(1));
        EXPECT_EQ(queue.select(SK::WakePolicy::Priority), &thread(1));
        EXPECT_EQ(queue.select(SK::WakePolicy::Fifo), &thread(0));
    }

    TEST_F(ThreadListTest, WaitAndDonorLinksAreIndependent)
    {
        SK::ThreadQueue waiters;
        SK::DonorList donors;

        waiters.pushBack(thread(0));
        donors.pushBack(thread(0));

        EXPECT_TRUE(waiters.contains(thread(0)));
        EXPECT_TRUE(donors.contains(thread(0)));

        waiters.remove(thread(0));
        EXPECT_TRUE(donors.contains(thread(0)));
        EXPECT_EQ(donors.size(), 1u);
    }

    TEST_F(ThreadListTest, ClearForgetsMembers)
    {
        SK::ThreadQueue queue;
        queue.pushBack(thread(0));
        queue.pushBack(thread(1));

        queue.clear();

        EXPECT_TRUE(queue.empty());
        EXPECT_EQ(queue.size(), 0u);
        EXPECT_EQ(queue.front(), nullptr);
    }

    using ThreadListDeathTest = ThreadListTest;

    TEST_F(ThreadListDeathTest, DoubleEnqueuePanics)
    {
        EXPECT_DEATH(
            {
                SK::ThreadQueue a;
                SK::ThreadQueue b;
                a.pushBack(thread(0));
                b.pushBack(thread(0));
            },
            "double enqueue");
    }

    TEST_F(ThreadListDeathTest, RemovingAStrangerPanics)
    {
        EXPECT_DEATH(
            {
                SK::ThreadQueue a;
                a.remove(thread(3));
            },
            "not on");
    }
}
