// SPDX-License-Identifier: MIT

// lib/stream/owner_lock.hpp
#pragma once

#include <mutex>
#include <vector>

#include "lib/stream/subscription.hpp"

namespace rx_pipe {

/// Owner lock of a multi-source combinator.
///
/// Serializes slot bookkeeping and downstream forwarding. The lock is
/// recursive so a downstream actor may re-enter the combinator from inside
/// a callback. Subscriptions handed to DisposeLater() are unsubscribed by
/// the outermost Section after the lock is released: an inner source is
/// never disposed while the lock is held, so a bridged inner whose worker
/// is waiting for the lock can still be joined.
class OwnerLock {
public:
    /// Scoped hold of the owner lock.
    class Section {
    public:
        explicit Section(OwnerLock& owner);
        ~Section();

        Section(const Section&) = delete;
        Section& operator=(const Section&) = delete;

    private:
        OwnerLock& owner_;
    };

    OwnerLock() = default;
    OwnerLock(const OwnerLock&) = delete;
    OwnerLock& operator=(const OwnerLock&) = delete;

    /// Queue a subscription for disposal. Requires an open Section.
    void DisposeLater(Subscription subscription);

private:
    std::recursive_mutex mutex_;
    int depth_ = 0;
    std::vector<Subscription> pending_;
};

}  // namespace rx_pipe
