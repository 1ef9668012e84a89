#include <fracindex-cpp/key.hpp>

#include "codec/integer_part.hpp"
#include "codec/midpoint.hpp"
#include "logger.hpp"
#include "raise.hpp"

#include <algorithm>
#include <iterator>
#include <string>
#include <utility>

namespace fracindex_cpp {

// -- Validation ---------------------------------------------------------------

void validate_order_key(std::string_view key, const Digits& digits) {
    if (key == smallest_integer(digits)) {
        detail::raise(ErrorKind::invalid_key,
                      "invalid order key: " + std::string{key} + " is reserved");
    }

    // integer_part() rejects a bad head or a key shorter than its head implies.
    const auto integer = codec::integer_part(key);
    const auto fraction = key.substr(integer.size());

    const auto body = key.substr(1);
    const auto stray = std::ranges::find_if(body, [&](char c) { return !digits.contains(c); });
    if (stray != body.end()) {
        detail::raise(ErrorKind::invalid_key,
                      "invalid order key: " + std::string{key} + " contains '" +
                      std::string(1, *stray) + "' outside the digit alphabet");
    }

    if (!fraction.empty() && fraction.back() == digits.zero()) {
        detail::raise(ErrorKind::invalid_key,
                      "invalid order key: " + std::string{key} + " ends in the zero digit");
    }
}

auto is_valid_order_key(std::string_view key, const Digits& digits) noexcept -> bool {
    try {
        validate_order_key(key, digits);
        return true;
    } catch (const OrderKeyError&) {
        return false;
    }
}

auto split_order_key(std::string_view key, const Digits& digits) -> KeyParts {
    validate_order_key(key, digits);
    const auto integer = codec::integer_part(key);
    return KeyParts{.integer = integer, .fraction = key.substr(integer.size())};
}

// -- Single key ---------------------------------------------------------------

namespace {

auto before(KeyParts upper, std::string_view key, const Digits& digits) -> std::string {
    if (upper.integer == smallest_integer(digits)) {
        return std::string{upper.integer} + codec::midpoint("", upper.fraction, digits);
    }
    if (upper.integer < key) {
        // The fraction is non-empty, so the bare integer part already sorts first.
        return std::string{upper.integer};
    }
    auto lower = codec::decrement_integer(upper.integer, digits);
    if (!lower) {
        detail::raise(ErrorKind::exhausted, "cannot decrement " + std::string{key} + " any further");
    }
    if (*lower == smallest_integer(digits)) {
        // The sentinel itself is reserved, so step into its fractional space.
        return *lower + codec::midpoint("", std::nullopt, digits);
    }
    return std::move(*lower);
}

auto after(KeyParts lower, const Digits& digits) -> std::string {
    if (auto next = codec::increment_integer(lower.integer, digits)) {
        return std::move(*next);
    }
    SPDLOG_DEBUG("fracindex: integer range exhausted at {}, widening the fraction",
                 lower.integer);
    return std::string{lower.integer} + codec::midpoint(lower.fraction, std::nullopt, digits);
}

auto between(KeyParts lower, KeyParts upper, std::string_view upper_key,
             const Digits& digits) -> std::string {
    if (lower.integer == upper.integer) {
        return std::string{lower.integer} +
               codec::midpoint(lower.fraction, upper.fraction, digits);
    }
    auto next = codec::increment_integer(lower.integer, digits);
    if (!next) {
        detail::raise(ErrorKind::exhausted,
                      "cannot increment " + std::string{lower.integer} + " any further");
    }
    if (*next < upper_key) return std::move(*next);
    return std::string{lower.integer} + codec::midpoint(lower.fraction, std::nullopt, digits);
}

}  // anonymous namespace

auto generate_key_between(std::optional<std::string_view> a,
                          std::optional<std::string_view> b,
                          const Digits& digits) -> std::string {
    if (a && b && *a >= *b) {
        detail::raise(ErrorKind::ordering_violation,
                      "'" + std::string{*a} + "' >= '" + std::string{*b} + "'");
    }

    if (!a && !b) return integer_zero(digits);
    if (!a) return before(split_order_key(*b, digits), *b, digits);
    if (!b) return after(split_order_key(*a, digits), digits);

    const auto lower = split_order_key(*a, digits);
    const auto upper = split_order_key(*b, digits);
    return between(lower, upper, *b, digits);
}

// -- Batches ------------------------------------------------------------------

auto generate_n_keys_between(std::optional<std::string_view> a,
                             std::optional<std::string_view> b,
                             std::size_t n,
                             const Digits& digits) -> std::vector<std::string> {
    auto keys = std::vector<std::string>{};
    if (n == 0) return keys;
    if (n == 1) {
        keys.push_back(generate_key_between(a, b, digits));
        return keys;
    }

    keys.reserve(n);

    if (!b) {
        // Consecutive appends, each after the previous one.
        auto lower = a ? std::optional<std::string>{std::string{*a}} : std::nullopt;
        for (std::size_t i = 0; i < n; ++i) {
            lower = generate_key_between(lower, std::nullopt, digits);
            keys.push_back(*lower);
        }
        return keys;
    }

    if (!a) {
        // Consecutive prepends, generated top-down and then reversed.
        auto upper = std::string{*b};
        for (std::size_t i = 0; i < n; ++i) {
            upper = generate_key_between(std::nullopt, upper, digits);
            keys.push_back(upper);
        }
        std::ranges::reverse(keys);
        return keys;
    }

    const auto left_count = n / 2;
    const auto mid = generate_key_between(a, b, digits);
    auto left = generate_n_keys_between(a, mid, left_count, digits);
    auto right = generate_n_keys_between(mid, b, n - left_count - 1, digits);

    keys.insert(keys.end(), std::make_move_iterator(left.begin()),
                std::make_move_iterator(left.end()));
    keys.push_back(mid);
    keys.insert(keys.end(), std::make_move_iterator(right.begin()),
                std::make_move_iterator(right.end()));
    return keys;
}

}  // namespace fracindex_cpp
