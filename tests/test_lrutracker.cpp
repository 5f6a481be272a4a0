// test/test_lrutracker.cpp
#include "gtest/gtest.h"

#include "../src/cache/LruTracker.hpp"

TEST(LruTrackerTest, EmptyHasNoLeastRecent) {
    LruTracker tracker;
    EXPECT_TRUE(tracker.empty());
    EXPECT_FALSE(tracker.leastRecent().has_value());
}

TEST(LruTrackerTest, OrderFollowsTouches) {
    LruTracker tracker;
    tracker.touch("a");
    tracker.touch("b");
    tracker.touch("c");
    EXPECT_EQ(tracker.leastRecent(), "a");

    tracker.touch("a");
    EXPECT_EQ(tracker.leastRecent(), "b");
    EXPECT_EQ(tracker.size(), 3u);
}

TEST(LruTrackerTest, RemoveForgetsKey) {
    LruTracker tracker;
    tracker.touch("a");
    tracker.touch("b");
    EXPECT_TRUE(tracker.remove("a"));
    EXPECT_FALSE(tracker.remove("a"));
    EXPECT_FALSE(tracker.contains("a"));
    EXPECT_EQ(tracker.leastRecent(), "b");
}

TEST(LruTrackerTest, Clear) {
    LruTracker tracker;
    tracker.touch("a");
    tracker.clear();
    EXPECT_TRUE(tracker.empty());
    EXPECT_FALSE(tracker.contains("a"));
}
