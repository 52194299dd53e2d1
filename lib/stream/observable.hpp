// SPDX-License-Identifier: MIT

// lib/stream/observable.hpp
#pragma once

#include <atomic>
#include <concepts>
#include <memory>
#include <type_traits>
#include <utility>

#include "lib/stream/actor.hpp"
#include "lib/stream/contract.hpp"
#include "lib/stream/error.hpp"
#include "lib/stream/subscription.hpp"

namespace rx_pipe {

namespace detail {

// Stand-in sink used to check the Observable contract without a real actor.
template<typename T>
struct ProbeActor {
    using ValueType = T;
    void OnNext(const T&);
    void OnError(const Error&);
    void OnComplete();
};

}  // namespace detail

/// Observable contract: declares its element type and subscribes any base
/// actor of that type, returning the Subscription that tears delivery down.
template<typename O>
concept ObservableSource = requires { typename O::ValueType; } &&
    requires(const O& o, detail::ProbeActor<typename O::ValueType> actor) {
        { o.OnSubscribe(std::move(actor)) } -> std::same_as<Subscription>;
    };

template<typename O, typename T>
concept ObservableOf = ObservableSource<O> && std::same_as<typename O::ValueType, T>;

template<ObservableSource O>
using observable_value_t = typename O::ValueType;

namespace detail {

// GuardedActor - enforces the event grammar for one Subscribe() call.
//
// Shares the Subscription returned to the caller:
// - Once it is disposed, every event is dropped.
// - The first terminal event is forwarded, then the Subscription is
//   disposed so upstream resources are released.
template<typename A>
class GuardedActor {
public:
    using ValueType = actor_value_t<A>;

    GuardedActor(A actor, Subscription subscription)
        : actor_(std::move(actor)),
          subscription_(std::move(subscription)),
          finished_(std::make_shared<std::atomic<bool>>(false)) {}

    void OnNext(const ValueType& data) {
        if (finished_->load(std::memory_order_acquire)) return;
        if (subscription_.IsDisposed()) return;
        EmitNext(actor_, data);
    }

    void OnError(const Error& e) {
        if (subscription_.IsDisposed()) return;
        if (finished_->exchange(true, std::memory_order_acq_rel)) return;
        EmitError(actor_, e);
        subscription_.Unsubscribe();
    }

    void OnComplete() {
        if (subscription_.IsDisposed()) return;
        if (finished_->exchange(true, std::memory_order_acq_rel)) return;
        EmitComplete(actor_);
        subscription_.Unsubscribe();
    }

private:
    A actor_;
    Subscription subscription_;
    std::shared_ptr<std::atomic<bool>> finished_;
};

}  // namespace detail

/// Subscribe `actor` to `source`.
///
/// The actor is validated before the source is touched: an invalid actor
/// throws ContractViolation and OnSubscribe is never invoked. The returned
/// Subscription is disposed by Unsubscribe() or by the terminal event.
template<ObservableSource O, typename A>
    requires ActorOf<std::remove_cvref_t<A>, observable_value_t<O>>
Subscription Subscribe(const O& source, A&& actor) {
    ValidateActor(actor, "Subscribe: actor");

    Subscription subscription;
    detail::GuardedActor<std::remove_cvref_t<A>> guarded(
        std::forward<A>(actor), subscription);
    subscription.Add(source.OnSubscribe(std::move(guarded)));
    return subscription;
}

/// Shared, type-erased handle to an observable of element type T.
///
/// Lets sources of different concrete types flow through one stream (e.g.
/// the inner observables of MergeMap). A default-constructed handle is not
/// an observable: subscribing to it throws ContractViolation.
template<typename T>
class Observable {
public:
    using ValueType = T;

    Observable() = default;

    template<typename S>
        requires (!std::same_as<std::remove_cvref_t<S>, Observable> && ObservableOf<S, T>)
    Observable(S source)  // NOLINT(google-explicit-constructor)
        : impl_(std::make_shared<Model<std::remove_cvref_t<S>>>(std::move(source))) {}

    template<ActorOf<T> A>
    Subscription OnSubscribe(A actor) const {
        if (!impl_) throw ContractViolation::InvalidObservable("Observable<T> (empty handle)");
        return impl_->Subscribe(Actor<T>(std::move(actor)));
    }

    bool IsValid() const { return impl_ != nullptr; }

private:
    struct Concept {
        virtual ~Concept() = default;
        virtual Subscription Subscribe(Actor<T> actor) const = 0;
    };

    template<typename S>
    struct Model final : Concept {
        explicit Model(S s) : source(std::move(s)) {}
        Subscription Subscribe(Actor<T> actor) const override {
            return source.OnSubscribe(std::move(actor));
        }
        S source;
    };

    std::shared_ptr<const Concept> impl_;
};

}  // namespace rx_pipe
