// ============================================================================
// Cancelable Tests
// ============================================================================

#include "rivulet/core/cancelable.hpp"

#include <atomic>
#include <gtest/gtest.h>
#include <thread>
#include <vector>

using namespace rivulet;

TEST(CancelableTest, StartsActive) {
    Cancelable c;
    EXPECT_FALSE(c.IsCancelled());
}

TEST(CancelableTest, CancelRaisesFlag) {
    Cancelable c;
    c.Cancel();
    EXPECT_TRUE(c.IsCancelled());
}

TEST(CancelableTest, ActionRunsOnce) {
    int calls = 0;
    Cancelable c([&] { ++calls; });

    c.Cancel();
    c.Cancel();
    c.Cancel();

    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(c.IsCancelled());
}

TEST(CancelableTest, CopiesShareState) {
    int calls = 0;
    Cancelable original([&] { ++calls; });
    Cancelable copy = original;

    copy.Cancel();
    EXPECT_TRUE(original.IsCancelled());

    original.Cancel();
    EXPECT_EQ(calls, 1);
}

TEST(CancelableTest, ForwardsToUpstream) {
    Cancelable upstream;
    Cancelable downstream([upstream]() mutable { upstream.Cancel(); });

    downstream.Cancel();
    EXPECT_TRUE(upstream.IsCancelled());
}

TEST(CancelableTest, EmptyIsIndependent) {
    Cancelable a = Cancelable::Empty();
    Cancelable b = Cancelable::Empty();

    a.Cancel();
    EXPECT_TRUE(a.IsCancelled());
    EXPECT_FALSE(b.IsCancelled());
}

TEST(CancelableTest, ConcurrentCancelRunsActionOnce) {
    std::atomic<int> calls{0};
    Cancelable c([&] { calls.fetch_add(1); });

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([c]() mutable { c.Cancel(); });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(calls.load(), 1);
}
