// SPDX-License-Identifier: MIT

// lib/stream/flatten.hpp
#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

#include "lib/stream/actor.hpp"
#include "lib/stream/contract.hpp"
#include "lib/stream/error.hpp"
#include "lib/stream/inner_subscription_set.hpp"
#include "lib/stream/observable.hpp"
#include "lib/stream/owner_lock.hpp"
#include "lib/stream/proxy.hpp"
#include "lib/stream/subscription.hpp"

namespace rx_pipe {

/// How a flattening combinator treats a new inner source.
enum class FlattenMode {
    Merge,   ///< Every inner stays subscribed until it finishes
    Switch,  ///< A new inner replaces the active one
};

/// Observable produced by projecting a value with F.
template<typename F, typename U>
using projected_t = std::remove_cvref_t<std::invoke_result_t<const F&, const U&>>;

/// Projection returning its argument; turns a stream of observables into a
/// flattening input.
struct IdentityProjection {
    template<typename U>
    U operator()(const U& value) const { return value; }
};

// FlattenState - shared state of one MergeMap / SwitchMap subscription.
//
// Slot bookkeeping and downstream forwarding run inside an OwnerLock
// section; released inner subscriptions are disposed after it closes.
template<typename U, typename F, typename A, FlattenMode Mode>
class FlattenState : public std::enable_shared_from_this<FlattenState<U, F, A, Mode>> {
public:
    using Inner = projected_t<F, U>;
    using OutputType = observable_value_t<Inner>;
    using Key = InnerSubscriptionSet::Key;

    FlattenState(A downstream, F project)
        : downstream_(std::move(downstream)), project_(std::move(project)) {}

    // Outer events -------------------------------------------------------

    void OnOuterNext(const U& value) {
        {
            OwnerLock::Section section(lock_);
            if (terminated_) return;
        }

        Inner inner = std::invoke(project_, value);

        Key key;
        {
            OwnerLock::Section section(lock_);
            if (terminated_) return;
            if constexpr (Mode == FlattenMode::Switch) {
                if (current_) {
                    DisposeLater(inners_.Release(*current_));
                    current_.reset();
                }
            }
            key = inners_.Acquire();
            if constexpr (Mode == FlattenMode::Switch) {
                current_ = key;
            }
        }

        // Subscribed outside the lock: a bridged inner may block until its
        // worker has forwarded through this state
        Subscription subscription;
        try {
            subscription = inner.OnSubscribe(InnerActor(this->shared_from_this(), key));
        } catch (...) {
            AbandonInner(key);
            throw;
        }

        OwnerLock::Section section(lock_);
        if (!inners_.Attach(key, subscription)) {
            DisposeLater(std::move(subscription));
        }
    }

    // The inner never started: free its slot so completion can still fire.
    void AbandonInner(Key key) {
        OwnerLock::Section section(lock_);
        if (!inners_.IsActive(key)) return;
        DisposeLater(inners_.Release(key));
        if constexpr (Mode == FlattenMode::Switch) {
            if (current_ && *current_ == key) current_.reset();
        }
        if (!terminated_ && outer_done_ && inners_.ActiveCount() == 0) {
            Terminate();
            EmitComplete(downstream_);
        }
    }

    void OnOuterError(const Error& e) {
        OwnerLock::Section section(lock_);
        if (terminated_) return;
        Terminate();
        EmitError(downstream_, e);
    }

    void OnOuterComplete() {
        OwnerLock::Section section(lock_);
        if (terminated_) return;
        outer_done_ = true;
        if (inners_.ActiveCount() == 0) {
            Terminate();
            EmitComplete(downstream_);
        }
    }

    // Inner events -------------------------------------------------------

    void OnInnerNext(Key key, const OutputType& data) {
        OwnerLock::Section section(lock_);
        if (terminated_ || !inners_.IsActive(key)) return;
        EmitNext(downstream_, data);
    }

    void OnInnerError(Key key, const Error& e) {
        OwnerLock::Section section(lock_);
        if (terminated_ || !inners_.IsActive(key)) return;
        Terminate();
        EmitError(downstream_, e);
    }

    void OnInnerComplete(Key key) {
        OwnerLock::Section section(lock_);
        if (terminated_ || !inners_.IsActive(key)) return;
        DisposeLater(inners_.Release(key));
        if constexpr (Mode == FlattenMode::Switch) {
            if (current_ && *current_ == key) current_.reset();
        }
        if (outer_done_ && inners_.ActiveCount() == 0) {
            Terminate();
            EmitComplete(downstream_);
        }
    }

    // Lifecycle ----------------------------------------------------------

    /// Keep the outer subscription for disposal. Disposed right away if the
    /// state already terminated while the outer source was subscribing.
    void SetOuter(Subscription outer) {
        OwnerLock::Section section(lock_);
        if (terminated_) {
            DisposeLater(std::move(outer));
        } else {
            outer_ = std::move(outer);
        }
    }

    /// Downstream unsubscribed: release the outer and every inner source.
    void Dispose() {
        OwnerLock::Section section(lock_);
        if (!terminated_) Terminate();
    }

private:
    class InnerActor {
    public:
        using ValueType = OutputType;

        InnerActor(std::shared_ptr<FlattenState> state, Key key)
            : state_(std::move(state)), key_(key) {}

        void OnNext(const OutputType& data) { state_->OnInnerNext(key_, data); }
        void OnError(const Error& e) { state_->OnInnerError(key_, e); }
        void OnComplete() { state_->OnInnerComplete(key_); }

    private:
        std::shared_ptr<FlattenState> state_;
        Key key_;
    };

    // Requires an open Section.
    void Terminate() {
        terminated_ = true;
        current_.reset();
        for (auto& subscription : inners_.ReleaseAll()) {
            DisposeLater(std::move(subscription));
        }
        DisposeLater(std::exchange(outer_, Subscription::Void()));
    }

    void DisposeLater(Subscription subscription) {
        lock_.DisposeLater(std::move(subscription));
    }

    A downstream_;
    F project_;

    OwnerLock lock_;

    InnerSubscriptionSet inners_;
    std::optional<Key> current_;
    Subscription outer_ = Subscription::Void();
    bool outer_done_ = false;
    bool terminated_ = false;
};

/// Outer-facing actor: hands outer events to the shared state.
template<typename State, typename U>
class FlattenOuterActor {
public:
    using ValueType = U;

    explicit FlattenOuterActor(std::shared_ptr<State> state) : state_(std::move(state)) {}

    void OnNext(const U& value) { state_->OnOuterNext(value); }
    void OnError(const Error& e) { state_->OnOuterError(e); }
    void OnComplete() { state_->OnOuterComplete(); }

private:
    std::shared_ptr<State> state_;
};

/// Source flattening the observables projected from `S` into one stream.
template<ObservableSource S, typename F, FlattenMode Mode>
class FlattenObservable {
public:
    using InputType = observable_value_t<S>;
    using Inner = projected_t<F, InputType>;
    using ValueType = observable_value_t<Inner>;

    FlattenObservable(S source, F project)
        : source_(std::move(source)), project_(std::move(project)) {}

    template<ActorOf<ValueType> A>
    Subscription OnSubscribe(A actor) const {
        using State = FlattenState<InputType, F, A, Mode>;

        auto state = std::make_shared<State>(std::move(actor), project_);
        Subscription outer = source_.OnSubscribe(FlattenOuterActor<State, InputType>(state));
        state->SetOuter(std::move(outer));

        // The sources own the state while they can still emit
        std::weak_ptr<State> weak_state = state;
        return Subscription::Create([weak_state]() {
            if (auto s = weak_state.lock()) s->Dispose();
        });
    }

private:
    S source_;
    F project_;
};

template<typename U, typename F, FlattenMode Mode>
struct FlattenProxy {
    static_assert(ObservableSource<projected_t<F, U>>,
                  "projection must return an observable");

    using InputType = U;
    using OutputType = observable_value_t<projected_t<F, U>>;

    F project;

    template<ObservableOf<U> S>
    FlattenObservable<S, F, Mode> WrapSource(const S& source) const {
        return FlattenObservable<S, F, Mode>(source, project);
    }
};

template<typename F, FlattenMode Mode>
class FlattenOperator : public OperatorBase {
public:
    explicit FlattenOperator(F project) : project_(std::move(project)) {}

    template<ObservableSource S>
    auto Apply(S source) const {
        using U = observable_value_t<S>;
        return MakeProxy(std::move(source), FlattenProxy<U, F, Mode>{project_});
    }

private:
    F project_;
};

/// Subscribe every projected inner observable as it arrives and forward all
/// inner values. Completes once the outer and every inner have completed.
template<typename F>
FlattenOperator<F, FlattenMode::Merge> MergeMap(F project) {
    return FlattenOperator<F, FlattenMode::Merge>(std::move(project));
}

/// MergeMap over a stream whose elements already are observables.
inline FlattenOperator<IdentityProjection, FlattenMode::Merge> MergeAll() {
    return FlattenOperator<IdentityProjection, FlattenMode::Merge>(IdentityProjection{});
}

/// Keep only the most recent projected inner observable subscribed. Outer
/// completion is deferred until the active inner completes.
template<typename F>
FlattenOperator<F, FlattenMode::Switch> SwitchMap(F project) {
    return FlattenOperator<F, FlattenMode::Switch>(std::move(project));
}

/// SwitchMap over a stream whose elements already are observables.
inline FlattenOperator<IdentityProjection, FlattenMode::Switch> SwitchAll() {
    return FlattenOperator<IdentityProjection, FlattenMode::Switch>(IdentityProjection{});
}

}  // namespace rx_pipe
