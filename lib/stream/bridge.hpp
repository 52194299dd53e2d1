// SPDX-License-Identifier: MIT

// lib/stream/bridge.hpp
#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdio>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>

#include "lib/stream/actor.hpp"
#include "lib/stream/contract.hpp"
#include "lib/stream/error.hpp"
#include "lib/stream/message_queue.hpp"
#include "lib/stream/observable.hpp"
#include "lib/stream/proxy.hpp"
#include "lib/stream/subscription.hpp"

namespace rx_pipe {

/// Configuration for the worker-thread bridges.
struct BridgeConfig {
    std::size_t queue_depth = 1;               ///< Queue capacity (0 = unbounded)
    std::chrono::milliseconds delay{0};        ///< Presentation delay per message

    /// Preset for Async(): hand-off slot, producer waits for the worker.
    static BridgeConfig AsyncDefaults() {
        return BridgeConfig{
            .queue_depth = 1,
            .delay = std::chrono::milliseconds{0},
        };
    }

    /// Preset for Delay(ms): unbounded queue, each message shifted by `delay`.
    static BridgeConfig DelayDefaults(std::chrono::milliseconds delay) {
        return BridgeConfig{
            .queue_depth = 0,
            .delay = delay,
        };
    }
};

/// Tagged event travelling from the producer to the worker thread.
template<typename T>
struct BridgeMessage {
    enum class Kind { Data, Error, Complete };

    Kind kind;
    std::optional<T> data;
    std::optional<rx_pipe::Error> error;
    std::chrono::steady_clock::time_point enqueued_at;
};

// BridgeWorker - one thread draining one queue into one downstream actor.
//
// The thread keeps the worker alive until it exits, which happens after a
// terminal event was delivered or after Cancel(). Cancel() joins the thread
// when called from any other thread, so the downstream actor sees nothing
// once it returns. Called from the worker thread itself (a downstream
// actor unsubscribing from inside a callback) it detaches instead.
template<typename T, typename A>
class BridgeWorker : public std::enable_shared_from_this<BridgeWorker<T, A>> {
public:
    using Message = BridgeMessage<T>;

    BridgeWorker(A downstream, BridgeConfig config)
        : downstream_(std::move(downstream)),
          config_(config),
          queue_(config.queue_depth) {}

    ~BridgeWorker() {
        if (thread_.joinable()) {
            if (thread_.get_id() == std::this_thread::get_id()) {
                thread_.detach();
            } else {
                thread_.join();
            }
        }
    }

    BridgeWorker(const BridgeWorker&) = delete;
    BridgeWorker& operator=(const BridgeWorker&) = delete;

    void Start() {
        auto self = this->shared_from_this();
        thread_ = std::thread([self]() { self->Run(); });
    }

    /// Enqueue a message. Blocks while the queue is full; returns false once
    /// the worker was cancelled.
    bool Post(Message message) {
        if (cancelled_.load(std::memory_order_acquire)) return false;
        message.enqueued_at = std::chrono::steady_clock::now();
        return queue_.Push(std::move(message));
    }

    /// Stop the worker. Idempotent.
    void Cancel() {
        if (cancelled_.exchange(true, std::memory_order_acq_rel)) return;
        {
            // Pairs with the predicate check in WaitUntilDue
            std::lock_guard<std::mutex> lock(cancel_mutex_);
        }
        cancel_cv_.notify_all();
        queue_.Close();

        if (!thread_.joinable()) return;
        if (thread_.get_id() == std::this_thread::get_id()) {
            thread_.detach();
        } else {
            thread_.join();
        }
    }

    bool IsCancelled() const { return cancelled_.load(std::memory_order_acquire); }

private:
    void Run() {
        while (auto message = queue_.Pop()) {
            if (config_.delay.count() > 0) {
                WaitUntilDue(message->enqueued_at + config_.delay);
            }
            if (cancelled_.load(std::memory_order_acquire)) break;
            if (Deliver(*message)) break;
        }
        // Nobody drains the queue any more; release a blocked producer
        queue_.Close();
    }

    void WaitUntilDue(std::chrono::steady_clock::time_point due) {
        std::unique_lock<std::mutex> lock(cancel_mutex_);
        cancel_cv_.wait_until(lock, due, [this] {
            return cancelled_.load(std::memory_order_acquire);
        });
    }

    // Returns true once a terminal event has been delivered.
    bool Deliver(Message& message) {
        try {
            switch (message.kind) {
                case Message::Kind::Data:
                    EmitNext(downstream_, *message.data);
                    return false;
                case Message::Kind::Error:
                    EmitError(downstream_, *message.error);
                    return true;
                case Message::Kind::Complete:
                    EmitComplete(downstream_);
                    return true;
            }
        } catch (const ContractViolation& e) {
            std::fprintf(stderr, "BridgeWorker::Deliver: contract violation: %s\n", e.what());
            std::terminate();
        } catch (const std::exception& e) {
            std::fprintf(stderr, "BridgeWorker::Deliver: actor threw: %s\n", e.what());
            if (message.kind == Message::Kind::Data) {
                FailDownstream(Error{ErrorCode::DeliveryFailed, e.what()});
            }
        }
        return true;
    }

    void FailDownstream(const Error& error) {
        try {
            EmitError(downstream_, error);
        } catch (const std::exception& e) {
            std::fprintf(stderr, "BridgeWorker::FailDownstream: actor threw: %s\n", e.what());
        }
    }

    A downstream_;
    BridgeConfig config_;
    MessageQueue<Message> queue_;
    std::atomic<bool> cancelled_{false};
    std::mutex cancel_mutex_;
    std::condition_variable cancel_cv_;
    std::thread thread_;
};

/// Upstream-facing actor: turns events into queue messages.
template<typename T, typename A>
class BridgeActor {
public:
    using ValueType = T;
    using Worker = BridgeWorker<T, A>;
    using Message = BridgeMessage<T>;

    explicit BridgeActor(std::shared_ptr<Worker> worker) : worker_(std::move(worker)) {}

    void OnNext(const T& data) {
        worker_->Post(Message{.kind = Message::Kind::Data, .data = data, .error = {}, .enqueued_at = {}});
    }

    void OnError(const Error& e) {
        worker_->Post(Message{.kind = Message::Kind::Error, .data = {}, .error = e, .enqueued_at = {}});
    }

    void OnComplete() {
        worker_->Post(Message{.kind = Message::Kind::Complete, .data = {}, .error = {}, .enqueued_at = {}});
    }

private:
    std::shared_ptr<Worker> worker_;
};

/// Source that moves delivery of `S` onto a per-subscription worker thread.
///
/// Unsubscribe order: cancel the worker (flag, close queue, join), then
/// unsubscribe upstream. A producer blocked on a full queue is released by
/// the close.
template<ObservableSource S>
class BridgeObservable {
public:
    using ValueType = observable_value_t<S>;

    BridgeObservable(S source, BridgeConfig config)
        : source_(std::move(source)), config_(config) {}

    template<ActorOf<ValueType> A>
    Subscription OnSubscribe(A actor) const {
        using Worker = BridgeWorker<ValueType, A>;

        auto worker = std::make_shared<Worker>(std::move(actor), config_);
        worker->Start();

        Subscription upstream;
        try {
            upstream = source_.OnSubscribe(BridgeActor<ValueType, A>(worker));
        } catch (...) {
            // The thread holds the worker alive; stop it before rethrowing
            worker->Cancel();
            throw;
        }

        std::weak_ptr<Worker> weak_worker = worker;
        return Subscription::Create([weak_worker, upstream]() mutable {
            if (auto w = weak_worker.lock()) w->Cancel();
            upstream.Unsubscribe();
        });
    }

    const BridgeConfig& config() const { return config_; }

private:
    S source_;
    BridgeConfig config_;
};

template<typename T>
struct BridgeProxy {
    using InputType = T;
    using OutputType = T;

    BridgeConfig config;

    template<ObservableOf<T> S>
    BridgeObservable<S> WrapSource(const S& source) const {
        return BridgeObservable<S>(source, config);
    }
};

/// Operator moving downstream delivery onto a worker thread.
class BridgeOperator : public OperatorBase {
public:
    explicit BridgeOperator(BridgeConfig config) : config_(config) {}

    template<ObservableSource S>
    auto Apply(S source) const {
        using T = observable_value_t<S>;
        return MakeProxy(std::move(source), BridgeProxy<T>{config_});
    }

    const BridgeConfig& config() const { return config_; }

private:
    BridgeConfig config_;
};

/// Deliver downstream on a worker thread. The producer waits until the
/// worker has taken the previous event.
inline BridgeOperator Async() {
    return BridgeOperator(BridgeConfig::AsyncDefaults());
}

/// Deliver every event `delay` after it was produced, on a worker thread.
/// Order is preserved and the producer never blocks.
inline BridgeOperator Delay(std::chrono::milliseconds delay) {
    return BridgeOperator(BridgeConfig::DelayDefaults(delay));
}

/// Worker-thread bridge with an explicit configuration.
inline BridgeOperator Bridge(BridgeConfig config) {
    return BridgeOperator(config);
}

}  // namespace rx_pipe
