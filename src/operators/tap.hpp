// SPDX-License-Identifier: MIT

// src/operators/tap.hpp
#pragma once

#include <functional>
#include <utility>

#include "lib/stream/actor.hpp"
#include "lib/stream/contract.hpp"
#include "lib/stream/error.hpp"
#include "lib/stream/proxy.hpp"

namespace rx_pipe {

template<typename U, typename F, typename A>
class TapActor {
public:
    using ValueType = U;

    TapActor(F effect, A downstream)
        : effect_(std::move(effect)), downstream_(std::move(downstream)) {}

    void OnNext(const U& data) {
        std::invoke(effect_, data);
        EmitNext(downstream_, data);
    }

    void OnError(const Error& e) { EmitError(downstream_, e); }
    void OnComplete() { EmitComplete(downstream_); }

private:
    F effect_;
    A downstream_;
};

template<typename U, typename F>
struct TapProxy {
    using InputType = U;
    using OutputType = U;

    F effect;

    template<ActorOf<U> A>
    TapActor<U, F, A> WrapActor(A downstream) const {
        return TapActor<U, F, A>(effect, std::move(downstream));
    }
};

template<typename F>
class TapOperator : public OperatorBase {
public:
    explicit TapOperator(F effect) : effect_(std::move(effect)) {}

    template<ObservableSource S>
    auto Apply(S source) const {
        using U = observable_value_t<S>;
        return MakeProxy(std::move(source), TapProxy<U, F>{effect_});
    }

private:
    F effect_;
};

/// Run `effect` on every value before forwarding it unchanged.
template<typename F>
TapOperator<F> Tap(F effect) {
    return TapOperator<F>(std::move(effect));
}

}  // namespace rx_pipe
