/// @file key.hpp
/// @brief Order key validation and generation.
///
/// An order key is an integer part (whose length is implied by its first
/// character, the head) followed by an optional fractional part that never
/// ends in the zero digit. Keys compare with plain lexicographic string
/// ordering, so a new key can always be placed between two existing ones
/// without touching any other key.

#pragma once

#include <fracindex-cpp/digits.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fracindex_cpp {

/// The two halves of an order key. Views into the key they were split from.
struct KeyParts {
    std::string_view integer;   ///< Head plus magnitude digits.
    std::string_view fraction;  ///< Remainder, possibly empty.

    auto operator==(const KeyParts&) const -> bool = default;
};

/// Check that key is a well-formed order key.
/// @throws OrderKeyError invalid_key or invalid_head.
void validate_order_key(std::string_view key, const Digits& digits = default_digits());

/// Non-throwing form of validate_order_key().
auto is_valid_order_key(std::string_view key,
                        const Digits& digits = default_digits()) noexcept -> bool;

/// Validate key and split it into integer and fractional parts.
auto split_order_key(std::string_view key,
                     const Digits& digits = default_digits()) -> KeyParts;

/// Generate a key strictly between a and b.
///
/// A missing bound is open: generate_key_between(a, nullopt) appends after a,
/// generate_key_between(nullopt, b) prepends before b, and with neither bound
/// the result is "a0".
///
/// @code
/// auto first  = generate_key_between(std::nullopt, std::nullopt);  // "a0"
/// auto second = generate_key_between(first, std::nullopt);         // "a1"
/// auto middle = generate_key_between(first, second);               // "a0V"
/// @endcode
///
/// @throws OrderKeyError ordering_violation if a >= b, invalid_key or
///   invalid_head for malformed bounds, exhausted if the integer range
///   cannot move past a bound.
auto generate_key_between(std::optional<std::string_view> a,
                          std::optional<std::string_view> b,
                          const Digits& digits = default_digits()) -> std::string;

/// Generate n strictly increasing keys between a and b.
///
/// With an open upper bound the keys are consecutive appends after a, with an
/// open lower bound consecutive prepends before b. With both bounds the range
/// is split around its midpoint recursively, which keeps keys short for any n.
auto generate_n_keys_between(std::optional<std::string_view> a,
                             std::optional<std::string_view> b,
                             std::size_t n,
                             const Digits& digits = default_digits())
    -> std::vector<std::string>;

}  // namespace fracindex_cpp
