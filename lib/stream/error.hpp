// SPDX-License-Identifier: MIT

// lib/stream/error.hpp
#pragma once

#include <string>
#include <string_view>

namespace rx_pipe {

/// Error codes carried by stream-level error events.
enum class ErrorCode {
    // Source
    SourceFailed,     ///< Source observable reported a failure
    Cancelled,        ///< Source was torn down before it could finish

    // Operator
    EmptySequence,    ///< Source completed without emitting a value

    // Delivery
    DeliveryFailed,   ///< Actor threw while a bridge worker delivered an event

    // Application
    UserError,        ///< Application-defined failure
};

/// Error payload delivered to OnError handlers.
struct Error {
    ErrorCode code;          ///< Classified error code
    std::string message;     ///< Human-readable description

    bool operator==(const Error&) const = default;
};

/// Return a short category string for an error code (e.g. "source", "delivery").
constexpr std::string_view error_category(ErrorCode code) {
    switch (code) {
        case ErrorCode::SourceFailed:
        case ErrorCode::Cancelled:
            return "source";
        case ErrorCode::EmptySequence:
            return "operator";
        case ErrorCode::DeliveryFailed:
            return "delivery";
        case ErrorCode::UserError:
            return "user";
    }
    return "unknown";
}

}  // namespace rx_pipe
