// SPDX-License-Identifier: MIT

// src/lazy.hpp
#pragma once

#include <atomic>
#include <memory>
#include <utility>

#include "lib/stream/contract.hpp"
#include "lib/stream/flatten.hpp"
#include "lib/stream/observable.hpp"
#include "lib/stream/subject.hpp"
#include "lib/stream/subscription.hpp"

namespace rx_pipe {

/// Observable whose real source is supplied after subscribers attach.
///
/// Subscribers may attach before or after Set(); either way they receive
/// the full output of the source passed to Set(). Only the first Set()
/// takes effect. Copies share the same pending source.
template<typename T>
class Lazy {
public:
    using ValueType = T;

    Lazy() : state_(std::make_shared<State>()) {}

    /// Supply the source. Returns false if a source was already set.
    bool Set(Observable<T> source) {
        if (!source.IsValid()) {
            throw ContractViolation::InvalidObservable("Lazy::Set: source");
        }
        if (state_->is_set.exchange(true, std::memory_order_acq_rel)) return false;
        state_->inner.OnNext(source);
        state_->inner.OnComplete();
        return true;
    }

    bool IsSet() const { return state_->is_set.load(std::memory_order_acquire); }

    template<ActorOf<T> A>
    Subscription OnSubscribe(A actor) const {
        auto flattened = SwitchAll().Apply(state_->inner);
        return flattened.OnSubscribe(std::move(actor));
    }

private:
    struct State {
        ReplaySubject<Observable<T>> inner{1};
        std::atomic<bool> is_set{false};
    };

    std::shared_ptr<State> state_;
};

}  // namespace rx_pipe
