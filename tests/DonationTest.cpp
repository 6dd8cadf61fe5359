#include "KernelFixture.h"

#include "SKLock.h"

#include <vector>

namespace
{
    // Donation tests run with priority wakeups so the order in which lock
    // waiters get the lock follows their effective priority
    using DonationTest = SK::Test::PriorityWakeTest;

    struct Acquirer
    {
        SK::Lock *lock;
        std::vector<int> *order;
        int tag;
    };

    void acquireRecordRelease(void *arg)
    {
        Acquirer *a = static_cast<Acquirer *>(arg);
        a->lock->acquire();
        a->order->push_back(a->tag);
        a->lock->release();
    }

    TEST_F(DonationTest, SingleWaiterRaisesHolder)
    {
        SK::Lock lock;
        std::vector<int> order;
        Acquirer a{&lock, &order, 1};
        Acquirer b{&lock, &order, 2};

        lock.acquire();

        spawn("acquire1", SK::PRIORITY_DEFAULT + 1, acquireRecordRelease, &a);
        EXPECT_EQ(scheduler().priority(), SK::PRIORITY_DEFAULT + 1);

        spawn("acquire2", SK::PRIORITY_DEFAULT + 2, acquireRecordRelease, &b);
        EXPECT_EQ(scheduler().priority(), SK::PRIORITY_DEFAULT + 2);
        EXPECT_EQ(scheduler().currentThread().basePriority, SK::PRIORITY_DEFAULT);

        lock.release();

        EXPECT_EQ(order, (std::vector<int>{2, 1}));
        EXPECT_EQ(scheduler().priority(), SK::PRIORITY_DEFAULT);
    }

    TEST_F(DonationTest, DonationsThroughSeveralLocksDropOneAtATime)
    {
        SK::Lock first;
        SK::Lock second;
        std::vector<int> order;
        Acquirer a{&first, &order, 1};
        Acquirer b{&second, &order, 2};

        first.acquire();
        second.acquire();

        spawn("a", SK::PRIORITY_DEFAULT + 1, acquireRecordRelease, &a);
        EXPECT_EQ(scheduler().priority(), SK::PRIORITY_DEFAULT + 1);

        spawn("b", SK::PRIORITY_DEFAULT + 2, acquireRecordRelease, &b);
        EXPECT_EQ(scheduler().priority(), SK::PRIORITY_DEFAULT + 2);

        second.release();
        EXPECT_EQ(order, (std::vector<int>{2}));
        EXPECT_EQ(scheduler().priority(), SK::PRIORITY_DEFAULT + 1);

        first.release();
        EXPECT_EQ(order, (std::vector<int>{2, 1}));
        EXPECT_EQ(scheduler().priority(), SK::PRIORITY_DEFAULT);
    }

    TEST_F(DonationTest, DonatedHolderKeepsMediumPriorityThreadOut)
    {
        SK::Lock lock;
        std::vector<int> order;
        Acquirer high{&lock, &order, 3};

        lock.acquire();
        spawn("high", SK::PRIORITY_DEFAULT + 10, acquireRecordRelease, &high);

        struct Medium
        {
            std::vector<int> *order;
        } medium{&order};
        spawn("medium", SK::PRIORITY_DEFAULT + 5,
              [](void *arg)
              {
                  static_cast<Medium *>(arg)->order->push_back(2);
              },
              &medium);

        // main still runs at high's priority even with medium ready
        SK::Mock::tick();
        SK::Mock::tick();
        scheduler().yield();
        EXPECT_TRUE(order.empty());
        EXPECT_EQ(scheduler().priority(), SK::PRIORITY_DEFAULT + 10);

        lock.release();
        EXPECT_EQ(order, (std::vector<int>{3, 2}));
    }

    struct Nest
    {
        SK::Lock outer;
        SK::Lock inner;
        SC::u8 mediumPriorityWithOuter = 0;
        std::vector<int> order;
    };

    TEST_F(DonationTest, NestedDonationReachesTheFirstHolder)
    {
        Nest nest;
        nest.outer.acquire();

        // medium: holds inner, then waits for outer held by main
        spawn("medium", SK::PRIORITY_DEFAULT + 1,
              [](void *arg)
              {
                  Nest *n = static_cast<Nest *>(arg);
                  n->inner.acquire();
                  n->outer.acquire();
                  n->mediumPriorityWithOuter = SK::Scheduler::instance().priority();
                  n->order.push_back(1);
                  n->outer.release();
                  n->inner.release();
                  n->order.push_back(3);
              },
              &nest);
        EXPECT_EQ(scheduler().priority(), SK::PRIORITY_DEFAULT + 1);

        // high: waits for inner held by medium
        spawn("high", SK::PRIORITY_DEFAULT + 2,
              [](void *arg)
              {
                  Nest *n = static_cast<Nest *>(arg);
                  n->inner.acquire();
                  n->order.push_back(2);
                  n->inner.release();
              },
              &nest);
        EXPECT_EQ(scheduler().priority(), SK::PRIORITY_DEFAULT + 2);

        nest.outer.release();

        EXPECT_EQ(nest.mediumPriorityWithOuter, SK::PRIORITY_DEFAULT + 2);
        EXPECT_EQ(nest.order, (std::vector<int>{1, 2, 3}));
        EXPECT_EQ(scheduler().priority(), SK::PRIORITY_DEFAULT);
    }

    constexpr int CHAIN_LENGTH = 7;

    struct Chain
    {
        SK::Lock locks[CHAIN_LENGTH + 1];
        SC::u8 observed[CHAIN_LENGTH + 1] = {};
        std::vector<int> order;
    };

    struct ChainLink
    {
        Chain *chain;
        int index;
    };

    // Link i holds locks[i] and waits for locks[i - 1]
    void chainLink(void *arg)
    {
        ChainLink *link = static_cast<ChainLink *>(arg);
        Chain *c = link->chain;
        int i = link->index;

        c->locks[i].acquire();
        c->locks[i - 1].acquire();

        c->observed[i] = SK::Scheduler::instance().priority();
        c->order.push_back(i);

        c->locks[i - 1].release();
        c->locks[i].release();
    }

    TEST_F(DonationTest, ChainedDonationPropagatesToEveryHolder)
    {
        Chain chain;
        ChainLink links[CHAIN_LENGTH + 1];
        chain.locks[0].acquire();

        for (int i = 1; i <= CHAIN_LENGTH; ++i)
        {
            links[i] = ChainLink{&chain, i};
            SC::u8 priority = static_cast<SC::u8>(SK::PRIORITY_DEFAULT + 3 * i);
            spawn("link", priority, chainLink, &links[i]);
            EXPECT_EQ(scheduler().priority(), priority) << "after link " << i;
        }

        chain.locks[0].release();

        SC::u8 top = static_cast<SC::u8>(SK::PRIORITY_DEFAULT + 3 * CHAIN_LENGTH);
        for (int i = 1; i <= CHAIN_LENGTH; ++i)
            EXPECT_EQ(chain.observed[i], top) << "link " << i;
        EXPECT_EQ(chain.order, (std::vector<int>{1, 2, 3, 4, 5, 6, 7}));
        EXPECT_EQ(scheduler().priority(), SK::PRIORITY_DEFAULT);
    }

    TEST_F(DonationTest, LoweringBasePriorityKeepsDonation)
    {
        SK::Lock lock;
        std::vector<int> order;
        Acquirer a{&lock, &order, 1};

        lock.acquire();
        spawn("acquire", SK::PRIORITY_DEFAULT + 10, acquireRecordRelease, &a);
        EXPECT_EQ(scheduler().priority(), SK::PRIORITY_DEFAULT + 10);

        scheduler().setPriority(SK::PRIORITY_DEFAULT - 10);
        EXPECT_EQ(scheduler().priority(), SK::PRIORITY_DEFAULT + 10);
        EXPECT_EQ(scheduler().currentThread().basePriority, SK::PRIORITY_DEFAULT - 10);

        lock.release();

        EXPECT_EQ(order, (std::vector<int>{1}));
        EXPECT_EQ(scheduler().priority(), SK::PRIORITY_DEFAULT - 10);
    }

    TEST_F(DonationTest, RaisingBasePriorityAboveDonationWins)
    {
        SK::Lock lock;
        std::vector<int> order;
        Acquirer a{&lock, &order, 1};

        lock.acquire();
        spawn("acquire", SK::PRIORITY_DEFAULT + 1, acquireRecordRelease, &a);

        scheduler().setPriority(SK::PRIORITY_DEFAULT + 5);
        EXPECT_EQ(scheduler().priority(), SK::PRIORITY_DEFAULT + 5);

        lock.release();
        // The waiter is now below main and has not run yet
        EXPECT_TRUE(order.empty());
        EXPECT_EQ(scheduler().priority(), SK::PRIORITY_DEFAULT + 5);
    }

    using DonationDeathTest = DonationTest;

    struct Cycle
    {
        SK::Lock mine;
        SK::Lock theirs;
    };

    TEST_F(DonationDeathTest, OwnershipCyclePanics)
    {
        EXPECT_DEATH(
            {
                static Cycle cycle;
                cycle.mine.acquire();
                spawn("other", SK::PRIORITY_DEFAULT + 1,
                      [](void *arg)
                      {
                          Cycle *c = static_cast<Cycle *>(arg);
                          c->theirs.acquire();
                          c->mine.acquire();
                      },
                      &cycle);
                cycle.theirs.acquire();
            },
            "lock ownership cycle: thread 'main' \\(tid 1\\) waits on itself through 2 lock\\(s\\)");
    }
}
