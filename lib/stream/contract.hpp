// SPDX-License-Identifier: MIT

// lib/stream/contract.hpp
#pragma once

#include <concepts>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>

#include "lib/stream/error.hpp"

namespace rx_pipe {

/// Which of the three event kinds a sink accepts.
enum class ActorKind {
    Invalid,         ///< Not usable as an actor; delivery is a contract violation
    Base,            ///< Accepts next, error and complete
    NextOnly,        ///< Accepts next only
    ErrorOnly,       ///< Accepts error only
    CompletionOnly,  ///< Accepts complete only
};

constexpr std::string_view actor_kind_name(ActorKind kind) {
    switch (kind) {
        case ActorKind::Invalid: return "invalid";
        case ActorKind::Base: return "base";
        case ActorKind::NextOnly: return "next-only";
        case ActorKind::ErrorOnly: return "error-only";
        case ActorKind::CompletionOnly: return "completion-only";
    }
    return "unknown";
}

// Handler concepts. A sink declares its element type as ValueType and
// implements the subset of OnNext / OnError / OnComplete it accepts.
template<typename A>
concept HasValueType = requires { typename A::ValueType; };

template<typename A>
concept HandlesNext = HasValueType<A> &&
    requires(A& a, const typename A::ValueType& v) {
        { a.OnNext(v) } -> std::same_as<void>;
    };

template<typename A>
concept HandlesError = requires(A& a, const Error& e) {
    { a.OnError(e) } -> std::same_as<void>;
};

template<typename A>
concept HandlesComplete = requires(A& a) {
    { a.OnComplete() } -> std::same_as<void>;
};

/// Classify a sink type. Resolved once per wiring at compile time.
template<typename A>
consteval ActorKind Classify() {
    using T = std::remove_cvref_t<A>;
    if constexpr (!HasValueType<T>) {
        return ActorKind::Invalid;
    } else {
        constexpr bool next = HandlesNext<T>;
        constexpr bool error = HandlesError<T>;
        constexpr bool complete = HandlesComplete<T>;
        if constexpr (next && error && complete) return ActorKind::Base;
        else if constexpr (next && !error && !complete) return ActorKind::NextOnly;
        else if constexpr (!next && error && !complete) return ActorKind::ErrorOnly;
        else if constexpr (!next && !error && complete) return ActorKind::CompletionOnly;
        else return ActorKind::Invalid;
    }
}

template<typename A>
concept ValidActor = Classify<A>() != ActorKind::Invalid;

/// Sink usable for a stream whose element type is exactly T.
template<typename A, typename T>
concept ActorOf = ValidActor<A> &&
    std::same_as<typename std::remove_cvref_t<A>::ValueType, T>;

/// Sink that may be handed `data` through a next event.
template<typename A, typename D>
concept AcceptsNext = ValidActor<A> &&
    std::same_as<std::remove_cvref_t<D>, typename std::remove_cvref_t<A>::ValueType>;

/// Element type of a valid sink.
template<ValidActor A>
using actor_value_t = typename std::remove_cvref_t<A>::ValueType;

/// Wiring defect: an object that does not satisfy the Actor/Observable
/// contract. Element type mismatches are rejected at compile time through
/// ActorOf / AcceptsNext; this exception covers type-erased handles whose
/// validity is only known at run time. Never delivered as a stream error.
class ContractViolation : public std::logic_error {
public:
    enum class Kind {
        InvalidActor,          ///< Sink does not satisfy the actor contract
        InvalidObservable,     ///< Source handle does not refer to an observable
    };

    ContractViolation(Kind kind, const std::string& message)
        : std::logic_error(message), kind_(kind) {}

    Kind kind() const { return kind_; }

    static ContractViolation InvalidActor(std::string_view actor_name);
    static ContractViolation InvalidObservable(std::string_view observable_name);

private:
    Kind kind_;
};

}  // namespace rx_pipe
