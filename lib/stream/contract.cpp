// SPDX-License-Identifier: MIT

// lib/stream/contract.cpp
#include "lib/stream/contract.hpp"

#include <fmt/format.h>

namespace rx_pipe {

ContractViolation ContractViolation::InvalidActor(std::string_view actor_name) {
    return ContractViolation(Kind::InvalidActor, fmt::format(
        "{} is not a valid actor: it must declare ValueType and implement "
        "OnNext, OnError and OnComplete, or exactly one of them",
        actor_name));
}

ContractViolation ContractViolation::InvalidObservable(std::string_view observable_name) {
    return ContractViolation(Kind::InvalidObservable, fmt::format(
        "{} does not refer to an observable source", observable_name));
}

}  // namespace rx_pipe
