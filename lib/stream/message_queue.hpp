// SPDX-License-Identifier: MIT

// lib/stream/message_queue.hpp
#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace rx_pipe {

/// Blocking FIFO handing messages from a producer to one worker thread.
///
/// capacity == 0 means unbounded: Push() never blocks. With capacity == 1
/// the queue is a hand-off slot: Push() blocks until the worker has taken
/// the previous message.
///
/// Close() wakes every blocked caller. After Close(), Push() returns false
/// and Pop() returns std::nullopt even if messages remain; a closed queue
/// is a normal way to stop the worker, not an error.
template<typename T>
class MessageQueue {
public:
    explicit MessageQueue(std::size_t capacity = 0) : capacity_(capacity) {}

    MessageQueue(const MessageQueue&) = delete;
    MessageQueue& operator=(const MessageQueue&) = delete;

    /// Enqueue, blocking while the queue is full. Returns false if closed.
    bool Push(T item) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this] { return closed_ || HasRoomLocked(); });
        if (closed_) return false;
        items_.push_back(std::move(item));
        lock.unlock();
        not_empty_.notify_one();
        return true;
    }

    /// Dequeue, blocking while empty. Returns std::nullopt once closed.
    std::optional<T> Pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this] { return closed_ || !items_.empty(); });
        if (closed_) return std::nullopt;
        T item = std::move(items_.front());
        items_.pop_front();
        lock.unlock();
        not_full_.notify_one();
        return item;
    }

    void Close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    bool IsClosed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    std::size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    std::size_t capacity() const { return capacity_; }

private:
    bool HasRoomLocked() const {
        return capacity_ == 0 || items_.size() < capacity_;
    }

    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<T> items_;
    bool closed_ = false;
};

}  // namespace rx_pipe
