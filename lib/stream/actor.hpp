// SPDX-License-Identifier: MIT

// lib/stream/actor.hpp
#pragma once

#include <atomic>
#include <expected>
#include <functional>
#include <memory>
#include <string_view>
#include <utility>

#include "lib/stream/contract.hpp"
#include "lib/stream/error.hpp"

namespace rx_pipe {

// =========================================================================
// Delivery primitives
// =========================================================================
//
// The only three ways an event reaches a sink. Events a sink does not accept
// (per its ActorKind) are dropped here; a data type that differs from the
// sink's ValueType does not compile.

template<typename A, typename D>
    requires AcceptsNext<A, D>
void EmitNext(A& actor, const D& data) {
    constexpr ActorKind kind = Classify<A>();
    if constexpr (kind == ActorKind::Base || kind == ActorKind::NextOnly) {
        actor.OnNext(data);
    }
}

template<ValidActor A>
void EmitError(A& actor, const Error& e) {
    constexpr ActorKind kind = Classify<A>();
    if constexpr (kind == ActorKind::Base || kind == ActorKind::ErrorOnly) {
        actor.OnError(e);
    }
}

template<ValidActor A>
void EmitComplete(A& actor) {
    constexpr ActorKind kind = Classify<A>();
    if constexpr (kind == ActorKind::Base || kind == ActorKind::CompletionOnly) {
        actor.OnComplete();
    }
}

// =========================================================================
// Actor<T> - type-erased sink handle
// =========================================================================

/// Shared, type-erased handle to a sink of element type T.
///
/// Copies refer to the same underlying sink. A default-constructed handle
/// classifies as ActorKind::Invalid: subscribing it, or delivering any event
/// to it, throws ContractViolation before anything else happens.
template<typename T>
class Actor {
public:
    using ValueType = T;

    Actor() = default;

    template<typename A>
        requires (!std::same_as<std::remove_cvref_t<A>, Actor> && ActorOf<A, T>)
    Actor(A actor)  // NOLINT(google-explicit-constructor)
        : impl_(std::make_shared<Model<std::remove_cvref_t<A>>>(std::move(actor))),
          kind_(Classify<A>()) {}

    void OnNext(const T& data) {
        Require();
        impl_->Next(data);
    }

    void OnError(const Error& e) {
        Require();
        impl_->Fail(e);
    }

    void OnComplete() {
        Require();
        impl_->Complete();
    }

    /// Runtime capability of the wrapped sink.
    ActorKind kind() const { return impl_ ? kind_ : ActorKind::Invalid; }

    bool IsValid() const { return impl_ != nullptr; }

private:
    struct Concept {
        virtual ~Concept() = default;
        virtual void Next(const T& data) = 0;
        virtual void Fail(const Error& e) = 0;
        virtual void Complete() = 0;
    };

    template<typename A>
    struct Model final : Concept {
        explicit Model(A a) : actor(std::move(a)) {}
        void Next(const T& data) override { EmitNext(actor, data); }
        void Fail(const Error& e) override { EmitError(actor, e); }
        void Complete() override { EmitComplete(actor); }
        A actor;
    };

    void Require() const {
        if (!impl_) throw ContractViolation::InvalidActor("Actor<T> (empty handle)");
    }

    std::shared_ptr<Concept> impl_;
    ActorKind kind_ = ActorKind::Invalid;
};

/// Runtime validation hook used by Subscribe(). Statically valid sinks
/// always pass; type-erased handles are checked for emptiness.
template<ValidActor A>
void ValidateActor(const A& actor, std::string_view context) {
    if constexpr (requires { actor.IsValid(); }) {
        if (!actor.IsValid()) throw ContractViolation::InvalidActor(context);
    }
}

// =========================================================================
// Convenience actors
// =========================================================================

/// Base actor dispatching events to user callbacks. Missing callbacks are
/// treated as no-ops.
template<typename T>
class LambdaActor {
public:
    using ValueType = T;

    explicit LambdaActor(
        std::function<void(const T&)> on_next,
        std::function<void(const Error&)> on_error = {},
        std::function<void()> on_complete = {}
    ) : on_next_(std::move(on_next)),
        on_error_(std::move(on_error)),
        on_complete_(std::move(on_complete)) {}

    void OnNext(const T& data) {
        if (on_next_) on_next_(data);
    }

    void OnError(const Error& e) {
        if (on_error_) on_error_(e);
    }

    void OnComplete() {
        if (on_complete_) on_complete_();
    }

private:
    std::function<void(const T&)> on_next_;
    std::function<void(const Error&)> on_error_;
    std::function<void()> on_complete_;
};

/// Single-result actor: the first value, or the terminal error, is handed
/// to the callback as std::expected exactly once. Completion without a
/// value yields ErrorCode::EmptySequence.
template<typename T>
class ResultActor {
public:
    using ValueType = T;
    using ResultCallback = std::function<void(std::expected<T, Error>)>;

    explicit ResultActor(ResultCallback on_result)
        : state_(std::make_shared<State>(std::move(on_result))) {}

    void OnNext(const T& data) {
        if (state_->delivered.exchange(true, std::memory_order_acq_rel)) return;
        state_->on_result(data);
    }

    void OnError(const Error& e) {
        if (state_->delivered.exchange(true, std::memory_order_acq_rel)) return;
        state_->on_result(std::unexpected(e));
    }

    void OnComplete() {
        if (state_->delivered.exchange(true, std::memory_order_acq_rel)) return;
        state_->on_result(std::unexpected(
            Error{ErrorCode::EmptySequence, "completed without a value"}));
    }

    bool IsDelivered() const {
        return state_->delivered.load(std::memory_order_acquire);
    }

private:
    struct State {
        explicit State(ResultCallback cb) : on_result(std::move(cb)) {}
        ResultCallback on_result;
        std::atomic<bool> delivered{false};
    };

    std::shared_ptr<State> state_;
};

static_assert(Classify<LambdaActor<int>>() == ActorKind::Base, "LambdaActor must be a base actor");
static_assert(Classify<ResultActor<int>>() == ActorKind::Base, "ResultActor must be a base actor");
static_assert(Classify<Actor<int>>() == ActorKind::Base, "Actor<T> must be a base actor");

}  // namespace rx_pipe
