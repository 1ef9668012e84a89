/// @file error.hpp
/// @brief Error types for the fracindex-cpp library.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace fracindex_cpp {

/// Categories of errors raised while validating or generating order keys.
///
/// Every kind is a deterministic validation failure; none are transient.
enum class ErrorKind : std::uint8_t {
    invalid_head,          ///< A key starts with a character outside A-Z / a-z.
    invalid_integer_part,  ///< An integer part's length does not match its head.
    invalid_key,           ///< Malformed key (too short, trailing zero, sentinel).
    ordering_violation,    ///< Lower bound is not strictly below the upper bound.
    trailing_zero,         ///< A midpoint argument ends in the zero digit.
    exhausted,             ///< The integer range cannot grow or shrink further.
    invalid_digits,        ///< A digit alphabet is too small or not ascending.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::invalid_head:         return "invalid_head";
        case ErrorKind::invalid_integer_part: return "invalid_integer_part";
        case ErrorKind::invalid_key:          return "invalid_key";
        case ErrorKind::ordering_violation:   return "ordering_violation";
        case ErrorKind::trailing_zero:        return "trailing_zero";
        case ErrorKind::exhausted:            return "exhausted";
        case ErrorKind::invalid_digits:       return "invalid_digits";
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

/// Exception thrown by every fallible operation in the library.
///
/// what() reads "<kind>: <message>". The structured Error is available
/// through error() for callers that dispatch on the kind.
class OrderKeyError : public std::runtime_error {
public:
    explicit OrderKeyError(Error err)
        : std::runtime_error{std::string{to_string_view(err.kind)} + ": " + err.message},
          error_{std::move(err)} {}

    OrderKeyError(ErrorKind kind, std::string message)
        : OrderKeyError{Error{kind, std::move(message)}} {}

    auto error() const noexcept -> const Error& { return error_; }
    auto kind() const noexcept -> ErrorKind { return error_.kind; }

private:
    Error error_;
};

}  // namespace fracindex_cpp
