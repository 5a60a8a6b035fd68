/// @file error.hpp
/// @brief Error types for the auditdiff-cpp library.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace auditdiff_cpp {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    invalid_argument,   ///< An argument is outside the accepted domain.
    invalid_config,     ///< A configuration value failed validation.
    capacity_exceeded,  ///< A bucket outgrew the configured element limit.
    cancelled,          ///< The caller requested cancellation of a diff.
    parse_error,        ///< Serialized input could not be decoded.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::invalid_argument:  return "invalid_argument";
        case ErrorKind::invalid_config:    return "invalid_config";
        case ErrorKind::capacity_exceeded: return "capacity_exceeded";
        case ErrorKind::cancelled:         return "cancelled";
        case ErrorKind::parse_error:       return "parse_error";
    }
    return "unknown";
}

/// A structured error with a category and a human-readable message.
struct Error {
    ErrorKind kind;      ///< The category of this error.
    std::string message; ///< A human-readable description.

    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg)
        : kind{k}, message{std::move(msg)} {}

    auto operator==(const Error& other) const -> bool = default;
};

/// Exception thrown by the public API. Carries the structured Error.
class DiffError : public std::runtime_error {
public:
    explicit DiffError(Error error)
        : std::runtime_error{std::string{to_string_view(error.kind)} + ": " + error.message},
          error_{std::move(error)} {}

    DiffError(ErrorKind kind, std::string message)
        : DiffError{Error{kind, std::move(message)}} {}

    auto error() const noexcept -> const Error& { return error_; }
    auto kind() const noexcept -> ErrorKind { return error_.kind; }

private:
    Error error_;
};

}  // namespace auditdiff_cpp
