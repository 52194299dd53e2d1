// SPDX-License-Identifier: MIT

// lib/stream/subscription.hpp
#pragma once

#include <atomic>
#include <concepts>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace rx_pipe {

/// Handle to an active delivery relationship.
///
/// Copies share one disposal state. Unsubscribe() runs the attached
/// teardowns once, in the order they were added; later calls are no-ops.
/// Teardowns added after disposal run immediately, so a source that
/// finishes synchronously inside OnSubscribe still releases what it owns.
///
/// Thread safety: all methods may be called from any thread. Teardowns run
/// on the thread that triggered disposal, outside the internal lock.
class Subscription {
public:
    using Teardown = std::function<void()>;

    /// Create a live handle with no teardowns attached.
    Subscription();

    /// Teardown that does nothing and reports disposed.
    static Subscription Void();

    /// Create a live handle that runs `teardown` on disposal.
    static Subscription Create(Teardown teardown);

    /// Attach a teardown. Runs it immediately if already disposed.
    void Add(Teardown teardown);

    /// Attach a child subscription, disposed together with this one.
    void Add(Subscription child);

    /// Dispose the handle. Idempotent.
    void Unsubscribe();

    /// Return true once disposal has been triggered.
    bool IsDisposed() const;

private:
    struct State {
        std::atomic<bool> disposed{false};
        std::mutex mutex;
        std::vector<Teardown> teardowns;
    };

    explicit Subscription(std::shared_ptr<State> state) : state_(std::move(state)) {}

    std::shared_ptr<State> state_;
};

/// Build a handle that disposes every child, in the order supplied.
Subscription Compose(std::vector<Subscription> children);

template<typename... Subs>
    requires (std::same_as<Subs, Subscription> && ...)
Subscription Compose(Subs... children) {
    return Compose(std::vector<Subscription>{std::move(children)...});
}

}  // namespace rx_pipe
