// SPDX-License-Identifier: MIT

// tests/inner_subscription_set_test.cpp
#include <gtest/gtest.h>

#include "lib/stream/inner_subscription_set.hpp"
#include "lib/stream/owner_lock.hpp"
#include "lib/stream/subscription.hpp"

using namespace rx_pipe;

TEST(InnerSubscriptionSetTest, AcquireAttachRelease) {
    InnerSubscriptionSet set;
    auto key = set.Acquire();
    EXPECT_TRUE(set.IsActive(key));
    EXPECT_EQ(set.ActiveCount(), 1u);

    Subscription inner;
    EXPECT_TRUE(set.Attach(key, inner));

    auto released = set.Release(key);
    EXPECT_FALSE(set.IsActive(key));
    EXPECT_EQ(set.ActiveCount(), 0u);

    // Release hands the subscription back without disposing it
    EXPECT_FALSE(inner.IsDisposed());
    released.Unsubscribe();
    EXPECT_TRUE(inner.IsDisposed());
}

TEST(InnerSubscriptionSetTest, ReleasedSlotIsReusedWithNewGeneration) {
    InnerSubscriptionSet set;
    auto first = set.Acquire();
    set.Release(first);

    auto second = set.Acquire();
    EXPECT_EQ(second.index, first.index);
    EXPECT_NE(second.generation, first.generation);
    EXPECT_FALSE(set.IsActive(first));
    EXPECT_TRUE(set.IsActive(second));
    EXPECT_EQ(set.SlotCount(), 1u);
}

TEST(InnerSubscriptionSetTest, SlotIsReusedOnlyAfterDisposal) {
    InnerSubscriptionSet set;
    auto first = set.Acquire();
    Subscription inner;
    ASSERT_TRUE(set.Attach(first, inner));
    auto released = set.Release(first);

    // Still pending disposal: a new inner gets a fresh slot
    auto second = set.Acquire();
    EXPECT_NE(second.index, first.index);
    EXPECT_EQ(set.SlotCount(), 2u);

    released.Unsubscribe();
    set.Release(second);
    auto third = set.Acquire();
    EXPECT_EQ(third.index, first.index);
    EXPECT_NE(third.generation, first.generation);
    EXPECT_EQ(set.SlotCount(), 2u);
}

TEST(InnerSubscriptionSetTest, AttachToReleasedSlotFails) {
    InnerSubscriptionSet set;
    auto key = set.Acquire();
    set.Release(key);

    Subscription late;
    EXPECT_FALSE(set.Attach(key, late));
    EXPECT_FALSE(late.IsDisposed());  // caller decides
}

TEST(InnerSubscriptionSetTest, ReleaseAllDisposesSet) {
    InnerSubscriptionSet set;
    auto a = set.Acquire();
    auto b = set.Acquire();
    auto c = set.Acquire();
    ASSERT_TRUE(set.Attach(a, Subscription{}));
    ASSERT_TRUE(set.Attach(b, Subscription{}));
    set.Release(c);

    auto released = set.ReleaseAll();
    EXPECT_EQ(released.size(), 2u);
    EXPECT_TRUE(set.IsDisposed());
    EXPECT_EQ(set.ActiveCount(), 0u);

    auto d = set.Acquire();
    EXPECT_FALSE(set.Attach(d, Subscription{}));
}

TEST(InnerSubscriptionSetTest, ReleaseOfUnknownKeyIsVoid) {
    InnerSubscriptionSet set;
    auto released = set.Release(InnerSubscriptionSet::Key{5, 1});
    EXPECT_TRUE(released.IsDisposed());
}

TEST(OwnerLockTest, DisposesAfterOutermostSection) {
    OwnerLock lock;
    Subscription inner;
    {
        OwnerLock::Section outer(lock);
        {
            OwnerLock::Section nested(lock);
            lock.DisposeLater(inner);
        }
        EXPECT_FALSE(inner.IsDisposed());
    }
    EXPECT_TRUE(inner.IsDisposed());
}
