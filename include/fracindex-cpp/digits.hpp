/// @file digits.hpp
/// @brief The digit alphabet every key operation is parameterized on.

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace fracindex_cpp {

/// The 62 characters 0-9, A-Z, a-z in ascending code-point order.
inline constexpr std::string_view base_62_digits =
    "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";

/// Decimal alphabet, mostly useful for readable tests and examples.
inline constexpr std::string_view base_10_digits = "0123456789";

/// An ordered digit alphabet.
///
/// Index 0 is the zero digit and index size()-1 the last digit. Characters
/// must be distinct and strictly ascending by code point; generated keys only
/// sort correctly under that condition. The constructor rejects alphabets
/// shorter than two characters but does not check the ordering, use
/// is_strictly_ascending() (or the JSON loader) to check untrusted input.
///
/// @code
/// auto decimal = Digits{base_10_digits};
/// auto key = generate_key_between("a4", std::nullopt, decimal);  // "a5"
/// @endcode
class Digits {
public:
    /// Construct the default base-62 alphabet.
    Digits();

    /// Construct from an explicit character sequence.
    /// @throws OrderKeyError (invalid_digits) if fewer than two characters.
    explicit Digits(std::string_view chars);

    auto size() const noexcept -> std::size_t { return chars_.size(); }

    /// The digit at position i (no bounds check).
    auto at(std::size_t i) const noexcept -> char { return chars_[i]; }

    auto zero() const noexcept -> char { return chars_.front(); }
    auto last() const noexcept -> char { return chars_.back(); }

    /// Position of c in the alphabet, or nullopt if c is not a digit.
    auto index_of(char c) const noexcept -> std::optional<std::size_t> {
        const auto slot = index_[static_cast<unsigned char>(c)];
        if (slot == not_a_digit) return std::nullopt;
        return static_cast<std::size_t>(slot);
    }

    auto contains(char c) const noexcept -> bool { return index_of(c).has_value(); }

    auto chars() const noexcept -> std::string_view { return chars_; }

    /// True when every character is strictly greater than its predecessor.
    auto is_strictly_ascending() const noexcept -> bool;

    auto operator==(const Digits& other) const -> bool { return chars_ == other.chars_; }

private:
    static constexpr std::int16_t not_a_digit = -1;

    std::string chars_;
    std::array<std::int16_t, 256> index_{};
};

/// The shared base-62 alphabet used when callers do not pass one.
auto default_digits() -> const Digits&;

/// The reserved smallest integer part: 'A' followed by 26 zero digits.
/// It is never a valid order key on its own.
auto smallest_integer(const Digits& digits) -> std::string;

/// The key handed out when no neighbours exist: 'a' followed by the zero digit.
auto integer_zero(const Digits& digits) -> std::string;

}  // namespace fracindex_cpp
