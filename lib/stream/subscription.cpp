// SPDX-License-Identifier: MIT

// lib/stream/subscription.cpp
#include "lib/stream/subscription.hpp"

namespace rx_pipe {

Subscription::Subscription() : state_(std::make_shared<State>()) {}

Subscription Subscription::Void() {
    return Subscription(std::shared_ptr<State>{});
}

Subscription Subscription::Create(Teardown teardown) {
    Subscription subscription;
    subscription.Add(std::move(teardown));
    return subscription;
}

void Subscription::Add(Teardown teardown) {
    if (!teardown) return;
    if (state_) {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->disposed.load(std::memory_order_acquire)) {
            state_->teardowns.push_back(std::move(teardown));
            return;
        }
    }
    // Already disposed (or void): release right away
    teardown();
}

void Subscription::Add(Subscription child) {
    if (!child.state_) return;
    if (child.state_ == state_) return;
    Add([child]() mutable { child.Unsubscribe(); });
}

void Subscription::Unsubscribe() {
    if (!state_) return;
    if (state_->disposed.exchange(true, std::memory_order_acq_rel)) return;

    std::vector<Teardown> teardowns;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        teardowns.swap(state_->teardowns);
    }
    for (auto& teardown : teardowns) {
        teardown();
    }
}

bool Subscription::IsDisposed() const {
    return !state_ || state_->disposed.load(std::memory_order_acquire);
}

Subscription Compose(std::vector<Subscription> children) {
    return Subscription::Create([children = std::move(children)]() mutable {
        for (auto& child : children) {
            child.Unsubscribe();
        }
    });
}

}  // namespace rx_pipe
