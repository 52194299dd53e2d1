// SPDX-License-Identifier: MIT

// src/operators/filter.hpp
#pragma once

#include <functional>
#include <utility>

#include "lib/stream/actor.hpp"
#include "lib/stream/contract.hpp"
#include "lib/stream/error.hpp"
#include "lib/stream/proxy.hpp"

namespace rx_pipe {

template<typename U, typename P, typename A>
class FilterActor {
public:
    using ValueType = U;

    FilterActor(P predicate, A downstream)
        : predicate_(std::move(predicate)), downstream_(std::move(downstream)) {}

    void OnNext(const U& data) {
        if (std::invoke(predicate_, data)) EmitNext(downstream_, data);
    }

    void OnError(const Error& e) { EmitError(downstream_, e); }
    void OnComplete() { EmitComplete(downstream_); }

private:
    P predicate_;
    A downstream_;
};

template<typename U, typename P>
struct FilterProxy {
    using InputType = U;
    using OutputType = U;

    P predicate;

    template<ActorOf<U> A>
    FilterActor<U, P, A> WrapActor(A downstream) const {
        return FilterActor<U, P, A>(predicate, std::move(downstream));
    }
};

template<typename P>
class FilterOperator : public OperatorBase {
public:
    explicit FilterOperator(P predicate) : predicate_(std::move(predicate)) {}

    template<ObservableSource S>
    auto Apply(S source) const {
        using U = observable_value_t<S>;
        return MakeProxy(std::move(source), FilterProxy<U, P>{predicate_});
    }

private:
    P predicate_;
};

/// Forward only values satisfying `predicate`.
template<typename P>
FilterOperator<P> Filter(P predicate) {
    return FilterOperator<P>(std::move(predicate));
}

}  // namespace rx_pipe
