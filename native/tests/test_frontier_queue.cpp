/*
 * Unit tests for FrontierQueue class
 */
#include <gtest/gtest.h>
#include "../model/FrontierQueue.h"

using namespace scoutbot;

class FrontierQueueTest : public ::testing::Test {
protected:
    ExplorationTarget target(const std::string &screen, const std::string &element, int priority) {
        ExplorationTarget t;
        t.screenId = screen;
        t.elementId = element;
        t.priority = priority;
        return t;
    }

    FrontierQueue queue;
};

TEST_F(FrontierQueueTest, AppendRejectsQueuedKey) {
    EXPECT_TRUE(queue.append(target("s1", "e1", 10)));
    EXPECT_FALSE(queue.append(target("s1", "e1", 99)));
    EXPECT_TRUE(queue.append(target("s1", "e2", 10)));
    EXPECT_EQ(queue.size(), 2u);
    EXPECT_TRUE(queue.contains("s1:e1"));
    EXPECT_FALSE(queue.contains("s2:e1"));
}

TEST_F(FrontierQueueTest, SequenceKeepsInsertionOrder) {
    queue.append(target("s1", "a", 1));
    queue.append(target("s1", "b", 1));
    EXPECT_LT(queue.entries()[0].sequence, queue.entries()[1].sequence);
}

TEST_F(FrontierQueueTest, TakeRemovesEntry) {
    queue.append(target("s1", "a", 1));
    queue.append(target("s1", "b", 2));
    ExplorationTarget taken;
    ASSERT_TRUE(queue.take(1, taken));
    EXPECT_EQ(taken.elementId, "b");
    EXPECT_EQ(queue.size(), 1u);
    EXPECT_FALSE(queue.take(5, taken));
    // a taken key can be appended again
    EXPECT_TRUE(queue.append(taken));
}

TEST_F(FrontierQueueTest, RequeueHalvesPriorityUntilRetryCap) {
    ExplorationTarget t = target("s1", "a", 40);
    ASSERT_TRUE(queue.requeue(t, 2));
    ExplorationTarget first;
    ASSERT_TRUE(queue.take(0, first));
    EXPECT_EQ(first.priority, 20);
    EXPECT_EQ(first.retries, 1);

    ASSERT_TRUE(queue.requeue(first, 2));
    ExplorationTarget second;
    ASSERT_TRUE(queue.take(0, second));
    EXPECT_EQ(second.priority, 10);

    EXPECT_FALSE(queue.requeue(second, 2));
    EXPECT_TRUE(queue.empty());
}

TEST_F(FrontierQueueTest, DecayRoundsDown) {
    EXPECT_EQ(FrontierQueue::decayedPriority(41), 20);
    EXPECT_EQ(FrontierQueue::decayedPriority(0), 0);
    EXPECT_EQ(FrontierQueue::decayedPriority(-5), -3);
    EXPECT_EQ(FrontierQueue::decayedPriority(-80), -40);

    ASSERT_TRUE(queue.requeue(target("s1", "low", -5), 2));
    ExplorationTarget taken;
    ASSERT_TRUE(queue.take(0, taken));
    EXPECT_EQ(taken.priority, -3);
}

TEST_F(FrontierQueueTest, RemoveScreen) {
    queue.append(target("s1", "a", 1));
    queue.append(target("s2", "b", 1));
    queue.append(target("s1", "c", 1));
    EXPECT_EQ(queue.removeScreen("s1"), 2u);
    ASSERT_EQ(queue.size(), 1u);
    EXPECT_EQ(queue.entries()[0].screenId, "s2");
}

TEST_F(FrontierQueueTest, IndexOfHighestPrefersEarliestOnTies) {
    EXPECT_EQ(queue.indexOfHighest(), -1);
    queue.append(target("s1", "a", 5));
    queue.append(target("s1", "b", 9));
    queue.append(target("s1", "c", 9));
    EXPECT_EQ(queue.indexOfHighest(), 1);
    EXPECT_EQ(queue.indexOfHighest([](const ExplorationTarget &t) { return t.elementId != "b"; }), 2);
    EXPECT_EQ(queue.indexOfHighest([](const ExplorationTarget &) { return false; }), -1);
}

TEST_F(FrontierQueueTest, Clear) {
    queue.append(target("s1", "a", 5));
    queue.clear();
    EXPECT_TRUE(queue.empty());
}
