/// @file error.hpp
/// @brief Error types for the whiteboard-ot library.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace whiteboard_ot {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    invalid_operation,     ///< An operation failed validation.
    missing_vector_clock,  ///< An operation arrived without a (non-empty) vector clock.
    empty_conflict,        ///< A resolution strategy received no operations.
    unknown_conflict,      ///< A conflict id does not refer to an open conflict.
    invalid_config,        ///< An EngineConfig value is out of range.
    decoding_error,        ///< JSON input could not be converted.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::invalid_operation:    return "invalid_operation";
        case ErrorKind::missing_vector_clock: return "missing_vector_clock";
        case ErrorKind::empty_conflict:       return "empty_conflict";
        case ErrorKind::unknown_conflict:     return "unknown_conflict";
        case ErrorKind::invalid_config:       return "invalid_config";
        case ErrorKind::decoding_error:       return "decoding_error";
    }
    return "unknown";
}

/// A structured error with a category and a human-readable message.
///
/// Thrown for inputs the caller must not retry unchanged (a rejected
/// operation, an empty resolution set). Recoverable situations are
/// logged instead.
struct Error : std::runtime_error {
    ErrorKind kind;      ///< The category of this error.
    std::string message; ///< A human-readable description.

    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg)
        : std::runtime_error{msg}, kind{k}, message{std::move(msg)} {}

    auto operator==(const Error& other) const -> bool {
        return kind == other.kind && message == other.message;
    }
};

}  // namespace whiteboard_ot
