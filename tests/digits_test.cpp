#include <fracindex-cpp/digits.hpp>
#include <fracindex-cpp/error.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace fracindex_cpp;

// -- Construction -------------------------------------------------------------

TEST(Digits, default_is_base_62) {
    const auto digits = Digits{};
    EXPECT_EQ(digits.chars(), base_62_digits);
    EXPECT_EQ(digits.size(), 62u);
    EXPECT_EQ(digits.zero(), '0');
    EXPECT_EQ(digits.last(), 'z');
}

TEST(Digits, default_digits_is_shared_base_62) {
    EXPECT_EQ(&default_digits(), &default_digits());
    EXPECT_EQ(default_digits(), Digits{base_62_digits});
}

TEST(Digits, decimal_alphabet) {
    const auto digits = Digits{base_10_digits};
    EXPECT_EQ(digits.size(), 10u);
    EXPECT_EQ(digits.zero(), '0');
    EXPECT_EQ(digits.last(), '9');
    EXPECT_NE(digits, Digits{});
}

TEST(Digits, rejects_alphabets_shorter_than_two) {
    try {
        (void)Digits{"0"};
        FAIL() << "expected OrderKeyError";
    } catch (const OrderKeyError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::invalid_digits);
    }
    EXPECT_THROW((void)Digits{""}, OrderKeyError);
}

// -- Lookup -------------------------------------------------------------------

TEST(Digits, index_of_follows_alphabet_order) {
    const auto digits = Digits{};
    EXPECT_EQ(digits.index_of('0'), 0u);
    EXPECT_EQ(digits.index_of('9'), 9u);
    EXPECT_EQ(digits.index_of('A'), 10u);
    EXPECT_EQ(digits.index_of('V'), 31u);
    EXPECT_EQ(digits.index_of('a'), 36u);
    EXPECT_EQ(digits.index_of('z'), 61u);
}

TEST(Digits, index_of_unknown_character_is_nullopt) {
    const auto digits = Digits{base_10_digits};
    EXPECT_FALSE(digits.index_of('a').has_value());
    EXPECT_FALSE(digits.index_of('-').has_value());
    EXPECT_FALSE(digits.index_of('\xff').has_value());
    EXPECT_FALSE(digits.contains('A'));
    EXPECT_TRUE(digits.contains('7'));
}

TEST(Digits, at_returns_character) {
    const auto digits = Digits{};
    EXPECT_EQ(digits.at(10), 'A');
    EXPECT_EQ(digits.at(61), 'z');
}

// -- Ordering -----------------------------------------------------------------

TEST(Digits, builtin_alphabets_are_strictly_ascending) {
    EXPECT_TRUE(Digits{base_62_digits}.is_strictly_ascending());
    EXPECT_TRUE(Digits{base_10_digits}.is_strictly_ascending());
    EXPECT_TRUE(Digits{"!#%"}.is_strictly_ascending());
}

TEST(Digits, descending_or_duplicate_alphabets_are_not_ascending) {
    EXPECT_FALSE(Digits{"10"}.is_strictly_ascending());
    EXPECT_FALSE(Digits{"0012"}.is_strictly_ascending());
    EXPECT_FALSE(Digits{"0123456789a9"}.is_strictly_ascending());
}

// -- Sentinels ----------------------------------------------------------------

TEST(Digits, smallest_integer_is_A_followed_by_26_zeros) {
    EXPECT_EQ(smallest_integer(Digits{}), "A00000000000000000000000000");
    EXPECT_EQ(smallest_integer(Digits{}).size(), 27u);
}

TEST(Digits, integer_zero_is_a_followed_by_zero_digit) {
    EXPECT_EQ(integer_zero(Digits{}), "a0");
    EXPECT_EQ(integer_zero(Digits{base_10_digits}), "a0");
}

TEST(Digits, sentinels_follow_a_custom_zero_digit) {
    const auto digits = Digits{"xyz"};
    EXPECT_EQ(integer_zero(digits), "ax");
    EXPECT_EQ(smallest_integer(digits), "A" + std::string(26, 'x'));
}
