// SPDX-License-Identifier: MIT

// tests/operators_test.cpp
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

#include "lib/stream/observable.hpp"
#include "lib/stream/subject.hpp"
#include "src/operators/enumerate.hpp"
#include "src/operators/error_if_empty.hpp"
#include "src/operators/filter.hpp"
#include "src/operators/map.hpp"
#include "src/operators/scan.hpp"
#include "src/operators/take.hpp"
#include "src/operators/tap.hpp"
#include "src/sources.hpp"
#include "tests/recording_actor.hpp"

using namespace rx_pipe;
using ::testing::ElementsAre;
using ::testing::IsEmpty;
using test::RecordingActor;

TEST(EnumerateTest, PairsValuesWithOneBasedIndex) {
    RecordingActor<Enumerated<int>> actor;
    Subscribe(From({3, 2, 1}) | Enumerate(), actor);

    EXPECT_THAT(actor.Values(), ElementsAre(
        std::make_pair(3, std::size_t{1}),
        std::make_pair(2, std::size_t{2}),
        std::make_pair(1, std::size_t{3})));
    EXPECT_EQ(actor.CompleteCount(), 1u);
}

TEST(EnumerateTest, EmptyAndFailedSources) {
    RecordingActor<Enumerated<int>> completed;
    Subscribe(Completed<int>() | Enumerate(), completed);
    EXPECT_EQ(completed.EventCount(), 1u);
    EXPECT_TRUE(completed.IsCompleted());

    RecordingActor<Enumerated<double>> failed;
    Subscribe(Faulted<double>(Error{ErrorCode::UserError, "e"}) | Enumerate(), failed);
    EXPECT_EQ(failed.EventCount(), 1u);
    EXPECT_TRUE(failed.IsErrored());

    RecordingActor<Enumerated<std::string>> never;
    auto sub = Subscribe(Never<std::string>() | Enumerate(), never);
    EXPECT_EQ(never.EventCount(), 0u);
    sub.Unsubscribe();
}

TEST(EnumerateTest, IndexRestartsPerSubscription) {
    auto source = From({7, 8}) | Enumerate();

    RecordingActor<Enumerated<int>> first;
    RecordingActor<Enumerated<int>> second;
    Subscribe(source, first);
    Subscribe(source, second);

    EXPECT_EQ(second.Values().front().second, 1u);
    EXPECT_EQ(second.Values().back().second, 2u);
}

TEST(FilterTest, DropsRejectedValues) {
    RecordingActor<int> actor;
    Subscribe(From({1, 2, 3, 4, 5}) | Filter([](const int& v) { return v % 2 == 1; }), actor);
    EXPECT_THAT(actor.Values(), ElementsAre(1, 3, 5));
    EXPECT_TRUE(actor.IsCompleted());
}

TEST(ScanTest, EmitsRunningFold) {
    RecordingActor<int> actor;
    Subscribe(From({1, 2, 3, 4}) | Scan(0, [](int acc, const int& v) { return acc + v; }), actor);
    EXPECT_THAT(actor.Values(), ElementsAre(1, 3, 6, 10));
}

TEST(ScanTest, AccumulatorIsPerSubscription) {
    auto running = From({1, 1}) | Scan(std::string(), [](std::string acc, const int& v) {
        return acc + std::to_string(v);
    });

    RecordingActor<std::string> first;
    RecordingActor<std::string> second;
    Subscribe(running, first);
    Subscribe(running, second);

    EXPECT_THAT(first.Values(), ElementsAre("1", "11"));
    EXPECT_THAT(second.Values(), ElementsAre("1", "11"));
}

TEST(TapTest, RunsSideEffectAndForwards) {
    std::vector<int> tapped;
    RecordingActor<int> actor;
    Subscribe(From({1, 2}) | Tap([&](const int& v) { tapped.push_back(v); }), actor);

    EXPECT_THAT(tapped, ElementsAre(1, 2));
    EXPECT_THAT(actor.Values(), ElementsAre(1, 2));
    EXPECT_TRUE(actor.IsCompleted());
}

TEST(TakeTest, CompletesAfterLimit) {
    RecordingActor<int> actor;
    Subscribe(From({1, 2, 3, 4}) | Take(2), actor);
    EXPECT_THAT(actor.Values(), ElementsAre(1, 2));
    EXPECT_EQ(actor.CompleteCount(), 1u);
}

TEST(TakeTest, ShortSourceCompletesNormally) {
    RecordingActor<int> actor;
    Subscribe(From({1}) | Take(5), actor);
    EXPECT_THAT(actor.Values(), ElementsAre(1));
    EXPECT_EQ(actor.CompleteCount(), 1u);
}

TEST(TakeTest, ReleasesHotSource) {
    Subject<int> subject;
    RecordingActor<int> actor;
    Subscribe(subject | Take(1), actor);

    EXPECT_EQ(subject.SubscriberCount(), 1u);
    subject.OnNext(9);
    EXPECT_EQ(subject.SubscriberCount(), 0u);
    EXPECT_THAT(actor.Values(), ElementsAre(9));
    EXPECT_TRUE(actor.IsCompleted());
}

TEST(TakeTest, ZeroLimitCompletesAtSubscribe) {
    RecordingActor<int> never;
    Subscribe(Never<int>() | Take(0), never);
    EXPECT_EQ(never.EventCount(), 1u);
    EXPECT_EQ(never.CompleteCount(), 1u);

    Subject<int> subject;
    RecordingActor<int> hot;
    Subscribe(subject | Take(0), hot);
    EXPECT_EQ(subject.SubscriberCount(), 0u);
    subject.OnNext(1);
    EXPECT_THAT(hot.Values(), IsEmpty());
    EXPECT_EQ(hot.CompleteCount(), 1u);
}

TEST(ErrorIfEmptyTest, PassesNonEmptySource) {
    RecordingActor<int> actor;
    Subscribe(From({1, 2, 3, 4, 5}) | ErrorIfEmpty("Empty"), actor);
    EXPECT_THAT(actor.Values(), ElementsAre(1, 2, 3, 4, 5));
    EXPECT_TRUE(actor.IsCompleted());
}

TEST(ErrorIfEmptyTest, EmptySourceErrors) {
    RecordingActor<int> actor;
    Subscribe(Completed<int>() | ErrorIfEmpty("Empty"), actor);

    ASSERT_TRUE(actor.LastError().has_value());
    EXPECT_EQ(actor.LastError()->code, ErrorCode::EmptySequence);
    EXPECT_EQ(actor.LastError()->message, "Empty");
    EXPECT_FALSE(actor.IsCompleted());
}

TEST(ErrorIfEmptyTest, UpstreamErrorWins) {
    RecordingActor<int> actor;
    Subscribe(Faulted<int>(Error{ErrorCode::SourceFailed, "down"}) | ErrorIfEmpty("Empty"), actor);

    ASSERT_TRUE(actor.LastError().has_value());
    EXPECT_EQ(actor.LastError()->message, "down");
}
