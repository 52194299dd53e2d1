// SPDX-License-Identifier: MIT

// tests/latest_test.cpp
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "lib/stream/latest.hpp"
#include "lib/stream/observable.hpp"
#include "lib/stream/subject.hpp"
#include "src/sources.hpp"
#include "tests/recording_actor.hpp"

using namespace rx_pipe;
using ::testing::ElementsAre;
using ::testing::IsEmpty;
using test::RecordingActor;

using IntVector = std::vector<int>;

TEST(CollectLatestTest, SynchronousSources) {
    RecordingActor<IntVector> actor;
    Subscribe(CollectLatest<int>({Of(1), From({1, 2})}), actor);

    EXPECT_THAT(actor.Values(), ElementsAre(IntVector{1, 1}, IntVector{1, 2}));
    EXPECT_EQ(actor.CompleteCount(), 1u);
}

TEST(CollectLatestTest, WaitsForFreshValueFromEverySource) {
    Subject<int> a;
    Subject<int> b;
    RecordingActor<IntVector> actor;
    auto sub = Subscribe(CollectLatest<int>({a, b}), actor);

    a.OnNext(1);
    EXPECT_THAT(actor.Values(), IsEmpty());
    b.OnNext(10);
    a.OnNext(2);  // b has not updated since the last emission
    a.OnNext(3);
    b.OnNext(20);

    EXPECT_THAT(actor.Values(), ElementsAre(IntVector{1, 10}, IntVector{3, 20}));
    sub.Unsubscribe();
    EXPECT_EQ(a.SubscriberCount(), 0u);
    EXPECT_EQ(b.SubscriberCount(), 0u);
}

TEST(CollectLatestTest, CompletedSourceKeepsContributing) {
    Subject<int> a;
    Subject<int> b;
    RecordingActor<IntVector> actor;
    Subscribe(CollectLatest<int>({a, b}), actor);

    a.OnNext(1);
    a.OnComplete();
    b.OnNext(5);
    b.OnNext(6);
    EXPECT_FALSE(actor.IsCompleted());

    b.OnComplete();
    EXPECT_THAT(actor.Values(), ElementsAre(IntVector{1, 5}, IntVector{1, 6}));
    EXPECT_EQ(actor.CompleteCount(), 1u);
}

TEST(CollectLatestTest, SourceCompletingWithoutValueCompletesAll) {
    Subject<int> other;
    RecordingActor<IntVector> actor;
    Subscribe(CollectLatest<int>({Completed<int>(), other}), actor);

    EXPECT_EQ(actor.CompleteCount(), 1u);
    EXPECT_THAT(actor.Values(), IsEmpty());
    // Subscription stopped before reaching the second source
    EXPECT_EQ(other.SubscriberCount(), 0u);
}

TEST(CollectLatestTest, ErrorDisposesSiblings) {
    Subject<int> a;
    Subject<int> b;
    RecordingActor<IntVector> actor;
    Subscribe(CollectLatest<int>({a, b}), actor);

    a.OnNext(1);
    b.OnError(Error{ErrorCode::SourceFailed, "b failed"});
    a.OnNext(2);
    a.OnComplete();

    EXPECT_THAT(actor.Values(), IsEmpty());
    EXPECT_EQ(actor.ErrorCount(), 1u);
    EXPECT_EQ(actor.CompleteCount(), 0u);
    EXPECT_EQ(a.SubscriberCount(), 0u);
}

TEST(CollectLatestTest, MappingFunction) {
    Subject<int> a;
    Subject<int> b;
    RecordingActor<int> actor;
    auto sub = Subscribe(CollectLatest<int>({a, b}, [](const IntVector& v) { return v[0] + v[1]; }), actor);

    a.OnNext(1);
    b.OnNext(2);
    a.OnNext(10);
    b.OnNext(20);

    EXPECT_THAT(actor.Values(), ElementsAre(3, 30));
    sub.Unsubscribe();
}

TEST(CollectLatestTest, NoSourcesCompletesImmediately) {
    RecordingActor<IntVector> actor;
    Subscribe(CollectLatest<int>({}), actor);
    EXPECT_EQ(actor.EventCount(), 1u);
    EXPECT_TRUE(actor.IsCompleted());
}

TEST(CollectLatestTest, InvalidSourceIsContractViolation) {
    RecordingActor<IntVector> actor;
    EXPECT_THROW(Subscribe(CollectLatest<int>({Of(1), Observable<int>{}}), actor), ContractViolation);
    EXPECT_EQ(actor.EventCount(), 0u);
}

TEST(CombineLatestTest, EmitsOnAnyUpdateOnceAllHaveValues) {
    Subject<int> a;
    Subject<int> b;
    RecordingActor<IntVector> actor;
    auto sub = Subscribe(CombineLatest<int>({a, b}), actor);

    a.OnNext(1);
    a.OnNext(2);
    EXPECT_THAT(actor.Values(), IsEmpty());

    b.OnNext(10);
    a.OnNext(3);
    b.OnNext(20);

    EXPECT_THAT(actor.Values(), ElementsAre(IntVector{2, 10}, IntVector{3, 10}, IntVector{3, 20}));
    sub.Unsubscribe();
}

TEST(CombineLatestTest, CompletesWhenAllSourcesComplete) {
    Subject<std::string> a;
    Subject<std::string> b;
    RecordingActor<std::string> actor;
    Subscribe(CombineLatest<std::string>({a, b}, [](const std::vector<std::string>& v) { return v[0] + v[1]; }),
              actor);

    a.OnNext("x");
    b.OnNext("y");
    a.OnComplete();
    b.OnNext("z");
    b.OnComplete();

    EXPECT_THAT(actor.Values(), ElementsAre("xy", "xz"));
    EXPECT_EQ(actor.CompleteCount(), 1u);
}
