// SPDX-License-Identifier: MIT

// src/operators/map.hpp
#pragma once

#include <functional>
#include <type_traits>
#include <utility>

#include "lib/stream/actor.hpp"
#include "lib/stream/contract.hpp"
#include "lib/stream/error.hpp"
#include "lib/stream/proxy.hpp"

namespace rx_pipe {

template<typename F, typename U>
using map_result_t = std::remove_cvref_t<std::invoke_result_t<const F&, const U&>>;

template<typename U, typename F, typename A>
class MapActor {
public:
    using ValueType = U;

    MapActor(F project, A downstream)
        : project_(std::move(project)), downstream_(std::move(downstream)) {}

    void OnNext(const U& data) {
        EmitNext(downstream_, std::invoke(project_, data));
    }

    void OnError(const Error& e) { EmitError(downstream_, e); }
    void OnComplete() { EmitComplete(downstream_); }

private:
    F project_;
    A downstream_;
};

template<typename U, typename F>
struct MapProxy {
    using InputType = U;
    using OutputType = map_result_t<F, U>;

    F project;

    template<ActorOf<OutputType> A>
    MapActor<U, F, A> WrapActor(A downstream) const {
        return MapActor<U, F, A>(project, std::move(downstream));
    }
};

template<typename F>
class MapOperator : public OperatorBase {
public:
    explicit MapOperator(F project) : project_(std::move(project)) {}

    template<ObservableSource S>
    auto Apply(S source) const {
        using U = observable_value_t<S>;
        return MakeProxy(std::move(source), MapProxy<U, F>{project_});
    }

private:
    F project_;
};

/// Transform every value with `project`.
template<typename F>
MapOperator<F> Map(F project) {
    return MapOperator<F>(std::move(project));
}

}  // namespace rx_pipe
