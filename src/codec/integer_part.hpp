#pragma once

// Integer part of an order key: a self-delimiting, sign-and-magnitude numeral
// whose total length is implied by its head character.
//
//   head a..z  ->  length = head - 'a' + 2   (zero and positive magnitudes)
//   head A..Z  ->  length = 'Z' - head + 2   (negative magnitudes)
//
// Lowercase heads grow longer as the head increases, uppercase heads grow
// longer as the head decreases, so plain string comparison of two integer
// parts matches the order of the values they encode.
// Internal header — not installed.

#include "../raise.hpp"

#include <fracindex-cpp/digits.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace fracindex_cpp::codec {

inline auto is_lower_head(char c) noexcept -> bool { return c >= 'a' && c <= 'z'; }
inline auto is_upper_head(char c) noexcept -> bool { return c >= 'A' && c <= 'Z'; }

// -- Parsing ------------------------------------------------------------------

// Total length of an integer part starting with head.
inline auto head_length(char head) -> std::size_t {
    if (is_lower_head(head)) return static_cast<std::size_t>(head - 'a') + 2;
    if (is_upper_head(head)) return static_cast<std::size_t>('Z' - head) + 2;
    detail::raise(ErrorKind::invalid_head,
                  "invalid order key head: '" + std::string(1, head) + "'");
}

// The integer-part prefix of key.
inline auto integer_part(std::string_view key) -> std::string_view {
    if (key.empty()) {
        detail::raise(ErrorKind::invalid_key, "invalid order key: empty");
    }
    const auto length = head_length(key.front());
    if (length > key.size()) {
        detail::raise(ErrorKind::invalid_key,
                      "invalid order key: " + std::string{key});
    }
    return key.substr(0, length);
}

inline void validate_integer(std::string_view value) {
    if (value.empty() || value.size() != head_length(value.front())) {
        detail::raise(ErrorKind::invalid_integer_part,
                      "invalid integer part of order key: " + std::string{value});
    }
}

// Alphabet position of a magnitude or fraction digit.
inline auto digit_index(char c, const Digits& digits) -> std::size_t {
    auto index = digits.index_of(c);
    if (!index) {
        detail::raise(ErrorKind::invalid_key,
                      "character '" + std::string(1, c) + "' is not in the digit alphabet");
    }
    return *index;
}

// -- Arithmetic ---------------------------------------------------------------

// Add one unit to an integer part.
// Returns nullopt when the value is already the largest representable one
// (head 'z' with every digit at the last digit).
inline auto increment_integer(std::string_view value, const Digits& digits)
    -> std::optional<std::string> {
    validate_integer(value);

    auto head = value.front();
    auto magnitude = std::string{value.substr(1)};

    auto carry = true;
    for (auto i = magnitude.size(); i-- > 0;) {
        const auto next = digit_index(magnitude[i], digits) + 1;
        if (next == digits.size()) {
            magnitude[i] = digits.zero();
        } else {
            magnitude[i] = digits.at(next);
            carry = false;
            break;
        }
    }

    if (!carry) return std::string(1, head) + magnitude;

    if (head == 'Z') return integer_zero(digits);
    if (head == 'z') return std::nullopt;

    head = static_cast<char>(head + 1);
    if (is_lower_head(head)) {
        magnitude.push_back(digits.zero());
    } else {
        magnitude.pop_back();
    }
    return std::string(1, head) + magnitude;
}

// Subtract one unit from an integer part.
// Returns nullopt when the value is already the smallest representable one
// (head 'A' with every digit at the zero digit).
inline auto decrement_integer(std::string_view value, const Digits& digits)
    -> std::optional<std::string> {
    validate_integer(value);

    auto head = value.front();
    auto magnitude = std::string{value.substr(1)};

    auto borrow = true;
    for (auto i = magnitude.size(); i-- > 0;) {
        const auto index = digit_index(magnitude[i], digits);
        if (index == 0) {
            magnitude[i] = digits.last();
        } else {
            magnitude[i] = digits.at(index - 1);
            borrow = false;
            break;
        }
    }

    if (!borrow) return std::string(1, head) + magnitude;

    if (head == 'a') return std::string{'Z', digits.last()};
    if (head == 'A') return std::nullopt;

    head = static_cast<char>(head - 1);
    if (is_upper_head(head)) {
        magnitude.push_back(digits.last());
    } else {
        magnitude.pop_back();
    }
    return std::string(1, head) + magnitude;
}

}  // namespace fracindex_cpp::codec
