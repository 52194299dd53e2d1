// SPDX-License-Identifier: MIT

// lib/stream/latest.hpp
#pragma once

#include <algorithm>
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
#include "lib/stream/subscription.hpp"

namespace rx_pipe {

/// When a latest-value combinator emits its slot array.
enum class LatestPolicy {
    /// Every slot produced a fresh value (or completed) since the last
    /// emission.
    Collect,
    /// Any slot updated, once every slot has produced at least one value.
    Combine,
};

/// Default mapping: the slot values themselves.
struct CopyMapping {
    template<typename T>
    std::vector<T> operator()(const std::vector<T>& values) const { return values; }
};

template<typename F, typename T>
using latest_result_t = std::remove_cvref_t<std::invoke_result_t<const F&, const std::vector<T>&>>;

// LatestState - shared state of one CollectLatest / CombineLatest
// subscription. One slot per source, in source order.
//
// Per slot: last value, completed, has produced a value, updated since the
// last emission. Emission clears the updated flags. A source completing
// without ever producing a value completes the whole combinator, as does
// the completion of every source. The first error from a source that has
// not completed disposes every source and is forwarded once.
template<typename T, typename F, typename A, LatestPolicy Policy>
class LatestState : public std::enable_shared_from_this<LatestState<T, F, A, Policy>> {
public:
    using OutputType = latest_result_t<F, T>;
    using Key = InnerSubscriptionSet::Key;

    LatestState(A downstream, F mapping, std::size_t size)
        : downstream_(std::move(downstream)),
          mapping_(std::move(mapping)),
          values_(size),
          completed_(size, false),
          has_value_(size, false),
          updated_(size, false) {
        keys_.reserve(size);
        for (std::size_t i = 0; i < size; ++i) {
            keys_.push_back(slots_.Acquire());
        }
    }

    /// Subscribe the sources in order. Stops early once the combinator has
    /// terminated (e.g. a source completed without a value).
    void Start(const std::vector<Observable<T>>& sources) {
        if (sources.empty()) {
            OwnerLock::Section section(lock_);
            Terminate();
            EmitComplete(downstream_);
            return;
        }

        for (std::size_t i = 0; i < sources.size(); ++i) {
            {
                OwnerLock::Section section(lock_);
                if (terminated_) return;
            }

            Subscription subscription =
                sources[i].OnSubscribe(SlotActor(this->shared_from_this(), i));

            OwnerLock::Section section(lock_);
            if (!slots_.Attach(keys_[i], subscription)) {
                lock_.DisposeLater(std::move(subscription));
            }
        }
    }

    void OnSlotNext(std::size_t index, const T& data) {
        OwnerLock::Section section(lock_);
        if (terminated_) return;

        values_[index] = data;
        has_value_[index] = true;
        updated_[index] = true;
        if (!ShouldEmit()) return;

        std::fill(updated_.begin(), updated_.end(), false);
        std::vector<T> snapshot;
        snapshot.reserve(values_.size());
        for (const auto& value : values_) snapshot.push_back(*value);

        OutputType result = std::invoke(mapping_, snapshot);
        EmitNext(downstream_, result);
    }

    void OnSlotError(std::size_t index, const Error& e) {
        OwnerLock::Section section(lock_);
        if (terminated_ || completed_[index]) return;
        Terminate();
        EmitError(downstream_, e);
    }

    void OnSlotComplete(std::size_t index) {
        OwnerLock::Section section(lock_);
        if (terminated_ || completed_[index]) return;

        completed_[index] = true;
        lock_.DisposeLater(slots_.Release(keys_[index]));
        if (AllOf(completed_) || !has_value_[index]) {
            Terminate();
            EmitComplete(downstream_);
        }
    }

    /// Downstream unsubscribed: release every source.
    void Dispose() {
        OwnerLock::Section section(lock_);
        if (!terminated_) Terminate();
    }

private:
    class SlotActor {
    public:
        using ValueType = T;

        SlotActor(std::shared_ptr<LatestState> state, std::size_t index)
            : state_(std::move(state)), index_(index) {}

        void OnNext(const T& data) { state_->OnSlotNext(index_, data); }
        void OnError(const Error& e) { state_->OnSlotError(index_, e); }
        void OnComplete() { state_->OnSlotComplete(index_); }

    private:
        std::shared_ptr<LatestState> state_;
        std::size_t index_;
    };

    static bool AllOf(const std::vector<bool>& flags) {
        return std::all_of(flags.begin(), flags.end(), [](bool f) { return f; });
    }

    bool ShouldEmit() const {
        if (AllOf(completed_)) return false;
        if (!AllOf(has_value_)) return false;
        if constexpr (Policy == LatestPolicy::Collect) {
            for (std::size_t i = 0; i < updated_.size(); ++i) {
                if (!updated_[i] && !completed_[i]) return false;
            }
        }
        return true;
    }

    // Requires an open Section.
    void Terminate() {
        terminated_ = true;
        for (auto& subscription : slots_.ReleaseAll()) {
            lock_.DisposeLater(std::move(subscription));
        }
    }

    A downstream_;
    F mapping_;
    OwnerLock lock_;

    InnerSubscriptionSet slots_;
    std::vector<Key> keys_;
    std::vector<std::optional<T>> values_;
    std::vector<bool> completed_;
    std::vector<bool> has_value_;
    std::vector<bool> updated_;
    bool terminated_ = false;
};

/// Observable combining the latest values of a fixed set of sources.
template<typename T, typename F, LatestPolicy Policy>
class LatestObservable {
public:
    using ValueType = latest_result_t<F, T>;

    LatestObservable(std::vector<Observable<T>> sources, F mapping)
        : sources_(std::make_shared<const std::vector<Observable<T>>>(std::move(sources))),
          mapping_(std::move(mapping)) {}

    template<ActorOf<ValueType> A>
    Subscription OnSubscribe(A actor) const {
        using State = LatestState<T, F, A, Policy>;

        for (const auto& source : *sources_) {
            if (!source.IsValid()) {
                throw ContractViolation::InvalidObservable("LatestObservable: source");
            }
        }

        auto state = std::make_shared<State>(std::move(actor), mapping_, sources_->size());
        state->Start(*sources_);

        std::weak_ptr<State> weak_state = state;
        return Subscription::Create([weak_state]() {
            if (auto s = weak_state.lock()) s->Dispose();
        });
    }

    std::size_t size() const { return sources_->size(); }

private:
    std::shared_ptr<const std::vector<Observable<T>>> sources_;
    F mapping_;
};

/// Emit `mapping(values)` each time every source has produced a fresh value
/// since the previous emission. A completed source keeps contributing its
/// last value. Completes when every source completed, or as soon as one
/// completes without having produced a value.
template<typename T, typename F = CopyMapping>
LatestObservable<T, F, LatestPolicy::Collect>
CollectLatest(std::vector<Observable<T>> sources, F mapping = {}) {
    return LatestObservable<T, F, LatestPolicy::Collect>(std::move(sources), std::move(mapping));
}

/// Emit `mapping(values)` on every update once each source has produced at
/// least one value. Termination follows CollectLatest.
template<typename T, typename F = CopyMapping>
LatestObservable<T, F, LatestPolicy::Combine>
CombineLatest(std::vector<Observable<T>> sources, F mapping = {}) {
    return LatestObservable<T, F, LatestPolicy::Combine>(std::move(sources), std::move(mapping));
}

}  // namespace rx_pipe
