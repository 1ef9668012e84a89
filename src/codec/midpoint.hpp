#pragma once

// Midpoint of two fractional tails.
//
// Treats a and b as base-N fractions written in the digit alphabet and
// returns the shortest string strictly between them that does not end in the
// zero digit. A missing b stands for an upper bound of 1.0, i.e. one past the
// last digit in the first position.
//
// Example (decimal): midpoint("49", "5") == "495", midpoint("", nullopt) == "5".
// Internal header — not installed.

#include "integer_part.hpp"

#include <fracindex-cpp/digits.hpp>

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace fracindex_cpp::codec {

inline auto midpoint(std::string_view a, std::optional<std::string_view> b,
                     const Digits& digits) -> std::string {
    if (b && a >= *b) {
        detail::raise(ErrorKind::ordering_violation,
                      "midpoint bounds out of order: '" + std::string{a} +
                      "' >= '" + std::string{*b} + "'");
    }
    if ((!a.empty() && a.back() == digits.zero()) ||
        (b && !b->empty() && b->back() == digits.zero())) {
        detail::raise(ErrorKind::trailing_zero, "midpoint argument ends in the zero digit");
    }

    auto result = std::string{};
    while (true) {
        if (b) {
            // Strip the longest common prefix, padding a with zero digits.
            // b needs no padding: it cannot end inside the prefix while a < b.
            auto n = std::size_t{0};
            while (n < b->size() && (n < a.size() ? a[n] : digits.zero()) == (*b)[n]) {
                ++n;
            }
            result.append(b->substr(0, n));
            a.remove_prefix(std::min(n, a.size()));
            b->remove_prefix(n);
        }

        const auto digit_a = a.empty() ? std::size_t{0} : digit_index(a.front(), digits);
        const auto digit_b = b ? digit_index(b->front(), digits) : digits.size();

        if (digit_b - digit_a > 1) {
            // Round half up.
            result.push_back(digits.at((digit_a + digit_b + 1) / 2));
            return result;
        }

        // The first digits are consecutive.
        if (b && b->size() > 1) {
            result.push_back(b->front());
            return result;
        }

        // b is missing or a single digit: keep a's first digit and look for a
        // midpoint between the rest of a and an open upper bound.
        result.push_back(digits.at(digit_a));
        if (!a.empty()) a.remove_prefix(1);
        b.reset();
    }
}

}  // namespace fracindex_cpp::codec
