// SPDX-License-Identifier: MIT

// lib/stream/proxy.hpp
#pragma once

#include <concepts>
#include <type_traits>
#include <utility>

#include "lib/stream/contract.hpp"
#include "lib/stream/observable.hpp"
#include "lib/stream/subscription.hpp"

namespace rx_pipe {

// Proxy descriptor - the recipe an operator builds once per application.
//
// A descriptor declares InputType / OutputType and at least one of:
// - WrapActor(downstream): returns an upstream-facing actor of InputType
//   that transforms and forwards to the downstream actor of OutputType.
// - WrapSource(upstream): returns a source that manages extra machinery
//   (workers, inner subscriptions) and subscribes the upstream itself.
//
// Both are stateless templates instantiated per subscription.
template<typename P>
concept ProxyDescriptor = requires {
    typename P::InputType;
    typename P::OutputType;
};

template<typename P, typename A>
concept ActorWrapping = ProxyDescriptor<P> && requires(const P& p, A actor) {
    p.WrapActor(std::move(actor));
};

template<typename P, typename S>
concept SourceWrapping = ProxyDescriptor<P> && requires(const P& p, const S& source) {
    p.WrapSource(source);
};

/// Observable produced by applying a proxy descriptor to a source.
///
/// Subscribing runs two steps in this order: wrap the actor (if the proxy
/// wraps actors), then subscribe the (possibly wrapped) source with the
/// (possibly wrapped) actor. State that needs both the final actor and the
/// final source is therefore built exactly once per subscription.
template<ObservableSource S, ProxyDescriptor P>
class ProxyObservable {
    static_assert(std::same_as<observable_value_t<S>, typename P::InputType>,
                  "proxy input type must match the upstream element type");

public:
    using ValueType = typename P::OutputType;
    using SourceType = S;
    using ProxyType = P;

    ProxyObservable(S source, P proxy)
        : source_(std::move(source)), proxy_(std::move(proxy)) {}

    template<ActorOf<ValueType> A>
    Subscription OnSubscribe(A actor) const {
        if constexpr (ActorWrapping<P, A>) {
            auto wrapped = proxy_.WrapActor(std::move(actor));
            static_assert(ActorOf<decltype(wrapped), typename P::InputType>,
                          "wrapped actor must accept the upstream element type");
            return SubscribeSource(std::move(wrapped));
        } else {
            return SubscribeSource(std::move(actor));
        }
    }

    const S& source() const { return source_; }
    const P& proxy() const { return proxy_; }

private:
    template<typename W>
    Subscription SubscribeSource(W actor) const {
        if constexpr (SourceWrapping<P, S>) {
            return proxy_.WrapSource(source_).OnSubscribe(std::move(actor));
        } else {
            static_assert(ActorOf<W, observable_value_t<S>>,
                          "actor type must match the upstream element type");
            return source_.OnSubscribe(std::move(actor));
        }
    }

    S source_;
    P proxy_;
};

template<ObservableSource S, ProxyDescriptor P>
ProxyObservable<S, P> MakeProxy(S source, P proxy) {
    return ProxyObservable<S, P>(std::move(source), std::move(proxy));
}

// =========================================================================
// Operators
// =========================================================================

/// Base for operator values. An operator is independent of any source:
/// Apply(source) builds the proxied observable for that source's type.
struct OperatorBase {
    using OperatorTag = void;
};

template<typename Op>
concept Operator = requires { typename Op::OperatorTag; };

template<typename Op, typename S>
concept OperatorFor = Operator<Op> && ObservableSource<S> &&
    requires(const Op& op, S source) {
        { op.Apply(std::move(source)) } -> ObservableSource;
    };

/// Left-to-right composition of two operators.
template<Operator First, Operator Second>
class ComposedOperator : public OperatorBase {
public:
    ComposedOperator(First first, Second second)
        : first_(std::move(first)), second_(std::move(second)) {}

    template<ObservableSource S>
    auto Apply(S source) const {
        return second_.Apply(first_.Apply(std::move(source)));
    }

private:
    First first_;
    Second second_;
};

/// `source | op` - apply an operator to a source.
template<ObservableSource S, typename Op>
    requires OperatorFor<std::remove_cvref_t<Op>, S>
auto operator|(S source, Op&& op) {
    return op.Apply(std::move(source));
}

/// `op1 | op2` - compose operators without a source.
template<Operator First, Operator Second>
ComposedOperator<First, Second> operator|(First first, Second second) {
    return ComposedOperator<First, Second>(std::move(first), std::move(second));
}

}  // namespace rx_pipe
