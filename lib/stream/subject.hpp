// SPDX-License-Identifier: MIT

// lib/stream/subject.hpp
#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "lib/stream/actor.hpp"
#include "lib/stream/contract.hpp"
#include "lib/stream/error.hpp"
#include "lib/stream/subscription.hpp"

namespace rx_pipe {

// Replay policies decide what a joining actor sees before it enters the
// live registry. Each policy provides:
// - Record(value): called for every accepted next event
// - Window(): values replayed to a joiner, oldest first
// - kReplayAfterTerminal: whether a joiner of a terminated subject gets the
//   window before the stored terminal event

/// No replay: joiners only see future events.
template<typename T>
class NoReplay {
public:
    static constexpr bool kReplayAfterTerminal = false;

    void Record(const T&) {}
    std::vector<T> Window() const { return {}; }
};

/// Latest-value replay (behavior subject).
template<typename T>
class RecentReplay {
public:
    static constexpr bool kReplayAfterTerminal = false;

    void Record(const T& value) { recent_ = value; }

    std::vector<T> Window() const {
        if (!recent_) return {};
        return {*recent_};
    }

private:
    std::optional<T> recent_;
};

/// Bounded-history replay of the last `capacity` values.
template<typename T>
class BoundedReplay {
public:
    static constexpr bool kReplayAfterTerminal = true;

    explicit BoundedReplay(std::size_t capacity) : capacity_(capacity) {}

    void Record(const T& value) {
        if (capacity_ == 0) return;
        if (history_.size() == capacity_) history_.pop_front();
        history_.push_back(value);
    }

    std::vector<T> Window() const {
        return std::vector<T>(history_.begin(), history_.end());
    }

    std::size_t capacity() const { return capacity_; }

private:
    std::size_t capacity_;
    std::deque<T> history_;
};

/// Multicast hub: an Observable and an Actor at the same time.
///
/// Copies are handles to one shared hub. Emissions reach exactly the actors
/// registered when the emission started: the registry is snapshotted under
/// the lock and callbacks run outside it, so an actor may (un)subscribe or
/// emit into the subject from inside a callback.
///
/// After error/complete the hub is inert: further events are ignored and
/// joiners immediately receive the stored terminal event (after the replay
/// window when the policy asks for it). An error is re-delivered to every
/// late joiner.
template<typename T, typename Policy>
class BasicSubject {
public:
    using ValueType = T;

    enum class State { Active, Errored, Completed };

    template<typename... Args>
        requires std::constructible_from<Policy, Args...>
    explicit BasicSubject(Args&&... policy_args)
        : hub_(std::make_shared<Hub>(std::forward<Args>(policy_args)...)) {}

    // ---------------------------------------------------------------------
    // Actor side
    // ---------------------------------------------------------------------

    void OnNext(const T& data) {
        std::vector<Actor<T>> snapshot;
        {
            std::lock_guard<std::mutex> lock(hub_->mutex);
            if (hub_->state != State::Active) return;
            hub_->policy.Record(data);
            ++hub_->recorded;
            snapshot = hub_->SnapshotLocked();
        }
        for (auto& actor : snapshot) {
            EmitNext(actor, data);
        }
    }

    void OnError(const Error& e) {
        std::vector<Actor<T>> snapshot;
        {
            std::lock_guard<std::mutex> lock(hub_->mutex);
            if (hub_->state != State::Active) return;
            hub_->state = State::Errored;
            hub_->error = e;
            snapshot = hub_->SnapshotLocked();
            hub_->registry.clear();
        }
        for (auto& actor : snapshot) {
            EmitError(actor, e);
        }
    }

    void OnComplete() {
        std::vector<Actor<T>> snapshot;
        {
            std::lock_guard<std::mutex> lock(hub_->mutex);
            if (hub_->state != State::Active) return;
            hub_->state = State::Completed;
            snapshot = hub_->SnapshotLocked();
            hub_->registry.clear();
        }
        for (auto& actor : snapshot) {
            EmitComplete(actor);
        }
    }

    // ---------------------------------------------------------------------
    // Observable side
    // ---------------------------------------------------------------------

    /// Register an actor. The replay window is delivered synchronously
    /// before the actor joins the live registry. Values recorded while the
    /// window is being delivered (from another thread, or from the joiner's
    /// own callback) are delivered too before the actor is registered.
    template<ActorOf<T> A>
    Subscription OnSubscribe(A actor) const {
        Actor<T> joiner(std::move(actor));

        State state;
        std::optional<Error> error;
        std::vector<T> pending;
        uint64_t seen = 0;
        uint64_t id = 0;
        bool registered = false;
        {
            std::lock_guard<std::mutex> lock(hub_->mutex);
            state = hub_->state;
            error = hub_->error;
            seen = hub_->recorded;
            if (state == State::Active || Policy::kReplayAfterTerminal) {
                pending = hub_->policy.Window();
            }
            if (state == State::Active && pending.empty()) {
                id = hub_->RegisterLocked(joiner);
                registered = true;
            }
        }

        while (!registered) {
            for (const auto& value : pending) {
                EmitNext(joiner, value);
            }
            if (state != State::Active) break;

            std::lock_guard<std::mutex> lock(hub_->mutex);
            pending = hub_->RecordedSinceLocked(seen);
            seen = hub_->recorded;
            state = hub_->state;
            error = hub_->error;
            if (state == State::Active && pending.empty()) {
                id = hub_->RegisterLocked(joiner);
                registered = true;
            }
        }

        if (state == State::Errored) {
            EmitError(joiner, *error);
            return Subscription::Void();
        }
        if (state == State::Completed) {
            EmitComplete(joiner);
            return Subscription::Void();
        }

        std::weak_ptr<Hub> weak_hub = hub_;
        return Subscription::Create([weak_hub, id]() {
            if (auto hub = weak_hub.lock()) hub->Unregister(id);
        });
    }

    /// Number of actors currently in the live registry.
    std::size_t SubscriberCount() const {
        std::lock_guard<std::mutex> lock(hub_->mutex);
        return hub_->registry.size();
    }

    State state() const {
        std::lock_guard<std::mutex> lock(hub_->mutex);
        return hub_->state;
    }

    bool IsTerminated() const { return state() != State::Active; }

    /// A fresh, independent hub of the same variant and configuration.
    BasicSubject Similar() const
        requires std::copy_constructible<Policy>
    {
        return BasicSubject(FreshTag{}, hub_->initial_policy);
    }

private:
    struct FreshTag {};

    BasicSubject(FreshTag, const Policy& policy)
        : hub_(std::make_shared<Hub>(policy)) {}

    struct Entry {
        uint64_t id;
        Actor<T> actor;
    };

    struct Hub {
        template<typename... Args>
        explicit Hub(Args&&... policy_args)
            : policy(std::forward<Args>(policy_args)...), initial_policy(policy) {}

        std::vector<Actor<T>> SnapshotLocked() const {
            std::vector<Actor<T>> snapshot;
            snapshot.reserve(registry.size());
            for (const auto& entry : registry) snapshot.push_back(entry.actor);
            return snapshot;
        }

        uint64_t RegisterLocked(const Actor<T>& actor) {
            uint64_t id = next_id++;
            registry.push_back(Entry{id, actor});
            return id;
        }

        // Tail of the window holding the values recorded after `seen`. Values
        // already evicted from a bounded window cannot be recovered.
        std::vector<T> RecordedSinceLocked(uint64_t seen) const {
            std::vector<T> window = policy.Window();
            std::size_t missed = static_cast<std::size_t>(recorded - seen);
            if (missed >= window.size()) return window;
            return std::vector<T>(window.end() - static_cast<std::ptrdiff_t>(missed), window.end());
        }

        void Unregister(uint64_t id) {
            std::lock_guard<std::mutex> lock(mutex);
            for (auto it = registry.begin(); it != registry.end(); ++it) {
                if (it->id == id) {
                    registry.erase(it);
                    return;
                }
            }
        }

        mutable std::mutex mutex;
        std::vector<Entry> registry;
        uint64_t next_id = 0;
        uint64_t recorded = 0;
        State state = State::Active;
        std::optional<Error> error;
        Policy policy;
        Policy initial_policy;
    };

    std::shared_ptr<Hub> hub_;
};

/// Plain multicast subject.
template<typename T>
using Subject = BasicSubject<T, NoReplay<T>>;

/// Behavior subject: joiners receive the latest value first.
template<typename T>
using RecentSubject = BasicSubject<T, RecentReplay<T>>;

/// Replay subject: joiners receive the last `capacity` values first.
template<typename T>
using ReplaySubject = BasicSubject<T, BoundedReplay<T>>;

// Subject factories: a variant and its configuration, without an element
// type. CreateSubject<T>(factory) builds a fresh subject of that variant.

struct SubjectFactory {
    template<typename T>
    Subject<T> Create() const { return Subject<T>(); }
};

struct RecentSubjectFactory {
    template<typename T>
    RecentSubject<T> Create() const { return RecentSubject<T>(); }
};

struct ReplaySubjectFactory {
    std::size_t capacity;

    template<typename T>
    ReplaySubject<T> Create() const { return ReplaySubject<T>(capacity); }
};

template<typename T, typename Factory>
auto CreateSubject(const Factory& factory) {
    return factory.template Create<T>();
}

}  // namespace rx_pipe
