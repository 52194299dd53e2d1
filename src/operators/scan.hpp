// SPDX-License-Identifier: MIT

// src/operators/scan.hpp
#pragma once

#include <functional>
#include <utility>

#include "lib/stream/actor.hpp"
#include "lib/stream/contract.hpp"
#include "lib/stream/error.hpp"
#include "lib/stream/proxy.hpp"

namespace rx_pipe {

// Accumulator lives in the actor, so each subscription folds from the seed.
template<typename U, typename R, typename F, typename A>
class ScanActor {
public:
    using ValueType = U;

    ScanActor(R seed, F reducer, A downstream)
        : accumulator_(std::move(seed)),
          reducer_(std::move(reducer)),
          downstream_(std::move(downstream)) {}

    void OnNext(const U& data) {
        accumulator_ = std::invoke(reducer_, accumulator_, data);
        EmitNext(downstream_, accumulator_);
    }

    void OnError(const Error& e) { EmitError(downstream_, e); }
    void OnComplete() { EmitComplete(downstream_); }

private:
    R accumulator_;
    F reducer_;
    A downstream_;
};

template<typename U, typename R, typename F>
struct ScanProxy {
    using InputType = U;
    using OutputType = R;

    R seed;
    F reducer;

    template<ActorOf<R> A>
    ScanActor<U, R, F, A> WrapActor(A downstream) const {
        return ScanActor<U, R, F, A>(seed, reducer, std::move(downstream));
    }
};

template<typename R, typename F>
class ScanOperator : public OperatorBase {
public:
    ScanOperator(R seed, F reducer) : seed_(std::move(seed)), reducer_(std::move(reducer)) {}

    template<ObservableSource S>
    auto Apply(S source) const {
        using U = observable_value_t<S>;
        return MakeProxy(std::move(source), ScanProxy<U, R, F>{seed_, reducer_});
    }

private:
    R seed_;
    F reducer_;
};

/// Emit the running fold `acc = reducer(acc, value)` starting from `seed`.
template<typename R, typename F>
ScanOperator<R, F> Scan(R seed, F reducer) {
    return ScanOperator<R, F>(std::move(seed), std::move(reducer));
}

}  // namespace rx_pipe
