// SPDX-License-Identifier: MIT

// src/operators/enumerate.hpp
#pragma once

#include <cstddef>
#include <utility>

#include "lib/stream/actor.hpp"
#include "lib/stream/contract.hpp"
#include "lib/stream/error.hpp"
#include "lib/stream/proxy.hpp"

namespace rx_pipe {

/// Value paired with its 1-based position in the stream.
template<typename U>
using Enumerated = std::pair<U, std::size_t>;

template<typename U, typename A>
class EnumerateActor {
public:
    using ValueType = U;

    explicit EnumerateActor(A downstream) : downstream_(std::move(downstream)) {}

    void OnNext(const U& data) {
        EmitNext(downstream_, Enumerated<U>(data, ++count_));
    }

    void OnError(const Error& e) { EmitError(downstream_, e); }
    void OnComplete() { EmitComplete(downstream_); }

private:
    A downstream_;
    std::size_t count_ = 0;
};

template<typename U>
struct EnumerateProxy {
    using InputType = U;
    using OutputType = Enumerated<U>;

    template<ActorOf<Enumerated<U>> A>
    EnumerateActor<U, A> WrapActor(A downstream) const {
        return EnumerateActor<U, A>(std::move(downstream));
    }
};

class EnumerateOperator : public OperatorBase {
public:
    template<ObservableSource S>
    auto Apply(S source) const {
        using U = observable_value_t<S>;
        return MakeProxy(std::move(source), EnumerateProxy<U>{});
    }
};

/// Pair every value with its 1-based index: (value, index).
inline EnumerateOperator Enumerate() {
    return EnumerateOperator{};
}

}  // namespace rx_pipe
