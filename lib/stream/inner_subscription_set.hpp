// SPDX-License-Identifier: MIT

// lib/stream/inner_subscription_set.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "lib/stream/subscription.hpp"

namespace rx_pipe {

/// Arena of inner subscriptions owned by one multi-source combinator.
///
/// Each inner source gets a slot addressed by a Key. Released slots go on a
/// free list and are reused once the subscription they handed back has been
/// disposed. The generation in the Key tells a recycled slot apart from its
/// previous occupant, so events from a stale inner are recognised and
/// dropped. A slot released before its subscription was attached holds
/// nothing to wait for and may be reused at once; the late Attach then
/// fails on the generation.
///
/// Not synchronized: the owning combinator serializes access with its own
/// lock. Methods that hand back Subscriptions never dispose them; callers
/// unsubscribe after releasing their lock.
class InnerSubscriptionSet {
public:
    struct Key {
        std::size_t index = 0;
        uint64_t generation = 0;

        bool operator==(const Key&) const = default;
    };

    InnerSubscriptionSet() = default;

    /// Reserve a slot for an inner source about to be subscribed.
    Key Acquire();

    /// Store the subscription of an acquired slot. Returns false if the slot
    /// was released meanwhile (or the set disposed); the caller must then
    /// unsubscribe `subscription` itself.
    [[nodiscard]] bool Attach(Key key, Subscription subscription);

    /// Release a slot and return its subscription for disposal. Returns a
    /// void subscription if the slot is not active.
    Subscription Release(Key key);

    /// Mark every slot released and the set disposed. Returns all attached
    /// subscriptions for disposal.
    std::vector<Subscription> ReleaseAll();

    bool IsActive(Key key) const;
    bool IsDisposed() const { return disposed_; }
    std::size_t ActiveCount() const { return active_count_; }
    std::size_t SlotCount() const { return slots_.size(); }

private:
    struct Slot {
        Subscription subscription = Subscription::Void();
        uint64_t generation = 0;
        bool active = false;
    };

    std::vector<Slot> slots_;
    std::vector<std::size_t> free_list_;
    std::size_t active_count_ = 0;
    bool disposed_ = false;
};

}  // namespace rx_pipe
