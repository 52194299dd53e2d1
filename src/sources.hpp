// SPDX-License-Identifier: MIT

// src/sources.hpp
#pragma once

#include <initializer_list>
#include <memory>
#include <type_traits>
#include <utility>
#include <vector>

#include "lib/stream/actor.hpp"
#include "lib/stream/contract.hpp"
#include "lib/stream/error.hpp"
#include "lib/stream/observable.hpp"
#include "lib/stream/subscription.hpp"

namespace rx_pipe {

/// Cold source emitting a fixed sequence, then completing.
///
/// The sequence is shared between copies; every subscription replays it
/// from the start.
template<typename T>
class FromObservable {
public:
    using ValueType = T;

    explicit FromObservable(std::vector<T> values)
        : values_(std::make_shared<const std::vector<T>>(std::move(values))) {}

    template<ActorOf<T> A>
    Subscription OnSubscribe(A actor) const {
        for (const auto& value : *values_) {
            EmitNext(actor, value);
        }
        EmitComplete(actor);
        return Subscription::Void();
    }

    std::size_t size() const { return values_->size(); }

private:
    std::shared_ptr<const std::vector<T>> values_;
};

/// Source completing immediately without a value.
template<typename T>
class CompletedObservable {
public:
    using ValueType = T;

    template<ActorOf<T> A>
    Subscription OnSubscribe(A actor) const {
        EmitComplete(actor);
        return Subscription::Void();
    }
};

/// Source failing immediately with a fixed error.
template<typename T>
class FaultedObservable {
public:
    using ValueType = T;

    explicit FaultedObservable(Error error) : error_(std::move(error)) {}

    template<ActorOf<T> A>
    Subscription OnSubscribe(A actor) const {
        EmitError(actor, error_);
        return Subscription::Void();
    }

private:
    Error error_;
};

/// Source that never emits and never terminates.
template<typename T>
class NeverObservable {
public:
    using ValueType = T;

    template<ActorOf<T> A>
    Subscription OnSubscribe(A) const {
        return Subscription::Void();
    }
};

/// Source driven by a user function receiving the subscribed actor.
///
/// The function may keep the Actor<T> handle to emit later. If it returns a
/// Subscription, that becomes the teardown of the subscription.
template<typename T, typename F>
class CreateObservable {
public:
    using ValueType = T;

    explicit CreateObservable(F producer) : producer_(std::move(producer)) {}

    template<ActorOf<T> A>
    Subscription OnSubscribe(A actor) const {
        Actor<T> handle(std::move(actor));
        if constexpr (std::is_same_v<std::invoke_result_t<const F&, Actor<T>>, Subscription>) {
            return producer_(std::move(handle));
        } else {
            producer_(std::move(handle));
            return Subscription::Void();
        }
    }

private:
    F producer_;
};

template<typename T>
FromObservable<T> From(std::vector<T> values) {
    return FromObservable<T>(std::move(values));
}

template<typename T>
FromObservable<T> From(std::initializer_list<T> values) {
    return FromObservable<T>(std::vector<T>(values));
}

template<typename T>
FromObservable<std::decay_t<T>> Of(T&& value) {
    std::vector<std::decay_t<T>> values;
    values.push_back(std::forward<T>(value));
    return FromObservable<std::decay_t<T>>(std::move(values));
}

template<typename T>
CompletedObservable<T> Completed() {
    return {};
}

template<typename T>
FaultedObservable<T> Faulted(Error error) {
    return FaultedObservable<T>(std::move(error));
}

template<typename T>
NeverObservable<T> Never() {
    return {};
}

template<typename T, typename F>
CreateObservable<T, F> Create(F producer) {
    return CreateObservable<T, F>(std::move(producer));
}

}  // namespace rx_pipe
