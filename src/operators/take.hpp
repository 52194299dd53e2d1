// SPDX-License-Identifier: MIT

// src/operators/take.hpp
#pragma once

#include <cstddef>
#include <utility>

#include "lib/stream/actor.hpp"
#include "lib/stream/contract.hpp"
#include "lib/stream/error.hpp"
#include "lib/stream/observable.hpp"
#include "lib/stream/proxy.hpp"
#include "lib/stream/subscription.hpp"

namespace rx_pipe {

// Completes downstream after `limit` values. Later upstream events are
// dropped; the guard installed by Subscribe() releases the upstream once
// the completion is delivered.
template<typename U, typename A>
class TakeActor {
public:
    using ValueType = U;

    TakeActor(std::size_t limit, A downstream)
        : remaining_(limit), downstream_(std::move(downstream)) {}

    void OnNext(const U& data) {
        if (done_) return;
        --remaining_;
        EmitNext(downstream_, data);
        if (remaining_ == 0) Finish();
    }

    void OnError(const Error& e) {
        if (done_) return;
        done_ = true;
        EmitError(downstream_, e);
    }

    void OnComplete() { Finish(); }

private:
    void Finish() {
        if (done_) return;
        done_ = true;
        EmitComplete(downstream_);
    }

    std::size_t remaining_;
    A downstream_;
    bool done_ = false;
};

// A zero limit completes at subscribe time without touching the upstream.
template<ObservableSource S>
class TakeObservable {
public:
    using ValueType = observable_value_t<S>;

    TakeObservable(S source, std::size_t limit)
        : source_(std::move(source)), limit_(limit) {}

    template<ActorOf<ValueType> A>
    Subscription OnSubscribe(A actor) const {
        if (limit_ == 0) {
            EmitComplete(actor);
            return Subscription::Void();
        }
        return source_.OnSubscribe(TakeActor<ValueType, A>(limit_, std::move(actor)));
    }

private:
    S source_;
    std::size_t limit_;
};

template<typename U>
struct TakeProxy {
    using InputType = U;
    using OutputType = U;

    std::size_t limit;

    template<ObservableOf<U> S>
    TakeObservable<S> WrapSource(const S& source) const {
        return TakeObservable<S>(source, limit);
    }
};

class TakeOperator : public OperatorBase {
public:
    explicit TakeOperator(std::size_t limit) : limit_(limit) {}

    template<ObservableSource S>
    auto Apply(S source) const {
        using U = observable_value_t<S>;
        return MakeProxy(std::move(source), TakeProxy<U>{limit_});
    }

private:
    std::size_t limit_;
};

/// Forward at most `limit` values, then complete.
inline TakeOperator Take(std::size_t limit) {
    return TakeOperator(limit);
}

}  // namespace rx_pipe
