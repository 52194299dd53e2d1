// SPDX-License-Identifier: MIT

// tests/subscription_test.cpp
#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

#include "lib/stream/subscription.hpp"

using namespace rx_pipe;

TEST(SubscriptionTest, NewHandleIsLive) {
    Subscription sub;
    EXPECT_FALSE(sub.IsDisposed());
}

TEST(SubscriptionTest, UnsubscribeRunsTeardownsInOrder) {
    std::vector<int> order;
    Subscription sub;
    sub.Add([&] { order.push_back(1); });
    sub.Add([&] { order.push_back(2); });
    sub.Add([&] { order.push_back(3); });

    sub.Unsubscribe();

    EXPECT_TRUE(sub.IsDisposed());
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
}

TEST(SubscriptionTest, UnsubscribeIsIdempotent) {
    int calls = 0;
    auto sub = Subscription::Create([&] { ++calls; });

    sub.Unsubscribe();
    sub.Unsubscribe();
    sub.Unsubscribe();

    EXPECT_EQ(calls, 1);
}

TEST(SubscriptionTest, CopiesShareDisposal) {
    int calls = 0;
    auto sub = Subscription::Create([&] { ++calls; });
    Subscription copy = sub;

    copy.Unsubscribe();

    EXPECT_TRUE(sub.IsDisposed());
    sub.Unsubscribe();
    EXPECT_EQ(calls, 1);
}

TEST(SubscriptionTest, AddAfterDisposalRunsImmediately) {
    Subscription sub;
    sub.Unsubscribe();

    bool ran = false;
    sub.Add([&] { ran = true; });
    EXPECT_TRUE(ran);
}

TEST(SubscriptionTest, VoidReportsDisposedAndDoesNothing) {
    auto sub = Subscription::Void();
    EXPECT_TRUE(sub.IsDisposed());
    sub.Unsubscribe();  // no-op

    bool ran = false;
    sub.Add([&] { ran = true; });
    EXPECT_TRUE(ran);
}

TEST(SubscriptionTest, ChildDisposedWithParent) {
    Subscription parent;
    Subscription child;
    parent.Add(child);

    parent.Unsubscribe();
    EXPECT_TRUE(child.IsDisposed());
}

TEST(SubscriptionTest, ChildAddedToDisposedParentIsDisposed) {
    Subscription parent;
    parent.Unsubscribe();

    Subscription child;
    parent.Add(child);
    EXPECT_TRUE(child.IsDisposed());
}

TEST(SubscriptionTest, SelfAddIsIgnored) {
    Subscription sub;
    sub.Add(sub);
    sub.Unsubscribe();  // must not recurse
    EXPECT_TRUE(sub.IsDisposed());
}

TEST(SubscriptionTest, TeardownMayUnsubscribeItsOwner) {
    Subscription sub;
    int calls = 0;
    sub.Add([&] {
        ++calls;
        sub.Unsubscribe();
    });
    sub.Unsubscribe();
    EXPECT_EQ(calls, 1);
}

TEST(ComposeTest, DisposesChildrenInOrder) {
    std::vector<char> order;
    auto a = Subscription::Create([&] { order.push_back('a'); });
    auto b = Subscription::Create([&] { order.push_back('b'); });
    auto c = Subscription::Create([&] { order.push_back('c'); });

    auto composed = Compose(a, b, c);
    composed.Unsubscribe();
    composed.Unsubscribe();

    EXPECT_EQ(order, (std::vector<char>{'a', 'b', 'c'}));
    EXPECT_TRUE(a.IsDisposed());
    EXPECT_TRUE(b.IsDisposed());
    EXPECT_TRUE(c.IsDisposed());
}

TEST(ComposeTest, VectorOverload) {
    std::vector<Subscription> children(4);
    auto composed = Compose(children);
    composed.Unsubscribe();
    for (const auto& child : children) {
        EXPECT_TRUE(child.IsDisposed());
    }
}

TEST(SubscriptionTest, ConcurrentUnsubscribeRunsOnce) {
    std::atomic<int> calls{0};
    auto sub = Subscription::Create([&] { calls.fetch_add(1); });

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([sub]() mutable { sub.Unsubscribe(); });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(calls.load(), 1);
}
