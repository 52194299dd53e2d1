// SPDX-License-Identifier: MIT

// lib/stream/owner_lock.cpp
#include "lib/stream/owner_lock.hpp"

#include <utility>

namespace rx_pipe {

OwnerLock::Section::Section(OwnerLock& owner) : owner_(owner) {
    owner_.mutex_.lock();
    ++owner_.depth_;
}

OwnerLock::Section::~Section() {
    std::vector<Subscription> pending;
    if (--owner_.depth_ == 0) pending.swap(owner_.pending_);
    owner_.mutex_.unlock();

    for (auto& subscription : pending) {
        subscription.Unsubscribe();
    }
}

void OwnerLock::DisposeLater(Subscription subscription) {
    if (subscription.IsDisposed()) return;
    pending_.push_back(std::move(subscription));
}

}  // namespace rx_pipe
