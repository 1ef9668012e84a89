#include <fracindex-cpp/digits.hpp>

#include "raise.hpp"

#include <algorithm>
#include <cstddef>
#include <string>

namespace fracindex_cpp {

namespace {

// Heads span 'A'..'Z', so the smallest integer part has 26 magnitude digits.
constexpr std::size_t smallest_integer_digits = 'Z' - 'A' + 1;

}  // anonymous namespace

Digits::Digits() : Digits{base_62_digits} {}

Digits::Digits(std::string_view chars) : chars_{chars} {
    if (chars_.size() < 2) {
        detail::raise(ErrorKind::invalid_digits,
                      "digit alphabet needs at least two characters, got '" + chars_ + "'");
    }
    index_.fill(not_a_digit);
    // First occurrence wins for duplicates; is_strictly_ascending() reports them.
    for (auto i = chars_.size(); i-- > 0;) {
        index_[static_cast<unsigned char>(chars_[i])] = static_cast<std::int16_t>(i);
    }
}

auto Digits::is_strictly_ascending() const noexcept -> bool {
    return std::ranges::adjacent_find(chars_, [](char lhs, char rhs) {
        return static_cast<unsigned char>(lhs) >= static_cast<unsigned char>(rhs);
    }) == chars_.end();
}

auto default_digits() -> const Digits& {
    static const auto digits = Digits{};
    return digits;
}

auto smallest_integer(const Digits& digits) -> std::string {
    return 'A' + std::string(smallest_integer_digits, digits.zero());
}

auto integer_zero(const Digits& digits) -> std::string {
    return std::string{'a', digits.zero()};
}

}  // namespace fracindex_cpp
