// SPDX-License-Identifier: MIT

// lib/stream/inner_subscription_set.cpp
#include "lib/stream/inner_subscription_set.hpp"

#include <utility>

namespace rx_pipe {

InnerSubscriptionSet::Key InnerSubscriptionSet::Acquire() {
    std::size_t index = slots_.size();
    for (auto it = free_list_.begin(); it != free_list_.end(); ++it) {
        // Reuse only slots whose previous subscription has been disposed
        if (slots_[*it].subscription.IsDisposed()) {
            index = *it;
            free_list_.erase(it);
            break;
        }
    }
    if (index == slots_.size()) {
        slots_.emplace_back();
    }

    Slot& slot = slots_[index];
    ++slot.generation;
    slot.active = true;
    slot.subscription = Subscription::Void();
    ++active_count_;
    return Key{index, slot.generation};
}

bool InnerSubscriptionSet::Attach(Key key, Subscription subscription) {
    if (disposed_ || !IsActive(key)) return false;
    slots_[key.index].subscription = std::move(subscription);
    return true;
}

Subscription InnerSubscriptionSet::Release(Key key) {
    if (!IsActive(key)) return Subscription::Void();

    Slot& slot = slots_[key.index];
    slot.active = false;
    --active_count_;
    free_list_.push_back(key.index);
    return slot.subscription;
}

std::vector<Subscription> InnerSubscriptionSet::ReleaseAll() {
    disposed_ = true;

    std::vector<Subscription> released;
    for (std::size_t i = 0; i < slots_.size(); ++i) {
        Slot& slot = slots_[i];
        if (!slot.active) continue;
        slot.active = false;
        free_list_.push_back(i);
        released.push_back(slot.subscription);
    }
    active_count_ = 0;
    return released;
}

bool InnerSubscriptionSet::IsActive(Key key) const {
    if (key.index >= slots_.size()) return false;
    const Slot& slot = slots_[key.index];
    return slot.active && slot.generation == key.generation;
}

}  // namespace rx_pipe
