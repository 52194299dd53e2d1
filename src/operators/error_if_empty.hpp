// SPDX-License-Identifier: MIT

// src/operators/error_if_empty.hpp
#pragma once

#include <string>
#include <utility>

#include "lib/stream/actor.hpp"
#include "lib/stream/contract.hpp"
#include "lib/stream/error.hpp"
#include "lib/stream/proxy.hpp"

namespace rx_pipe {

template<typename U, typename A>
class ErrorIfEmptyActor {
public:
    using ValueType = U;

    ErrorIfEmptyActor(std::string message, A downstream)
        : message_(std::move(message)), downstream_(std::move(downstream)) {}

    void OnNext(const U& data) {
        seen_value_ = true;
        EmitNext(downstream_, data);
    }

    void OnError(const Error& e) { EmitError(downstream_, e); }

    void OnComplete() {
        if (seen_value_) {
            EmitComplete(downstream_);
        } else {
            EmitError(downstream_, Error{ErrorCode::EmptySequence, message_});
        }
    }

private:
    std::string message_;
    A downstream_;
    bool seen_value_ = false;
};

template<typename U>
struct ErrorIfEmptyProxy {
    using InputType = U;
    using OutputType = U;

    std::string message;

    template<ActorOf<U> A>
    ErrorIfEmptyActor<U, A> WrapActor(A downstream) const {
        return ErrorIfEmptyActor<U, A>(message, std::move(downstream));
    }
};

class ErrorIfEmptyOperator : public OperatorBase {
public:
    explicit ErrorIfEmptyOperator(std::string message) : message_(std::move(message)) {}

    template<ObservableSource S>
    auto Apply(S source) const {
        using U = observable_value_t<S>;
        return MakeProxy(std::move(source), ErrorIfEmptyProxy<U>{message_});
    }

private:
    std::string message_;
};

/// Replace an empty completion with Error{EmptySequence, message}.
inline ErrorIfEmptyOperator ErrorIfEmpty(std::string message) {
    return ErrorIfEmptyOperator(std::move(message));
}

}  // namespace rx_pipe
