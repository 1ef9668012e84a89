#include <fracindex-cpp/fracindex.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <optional>
#include <string>
#include <vector>

using namespace fracindex_cpp;

namespace {

const auto decimal = Digits{base_10_digits};

using Keys = std::vector<std::string>;

// Every key is valid, strictly above a, strictly below b and above its
// predecessor.
void expect_ordered_between(const Keys& keys, std::optional<std::string> a,
                            std::optional<std::string> b, const Digits& digits) {
    for (std::size_t i = 0; i < keys.size(); ++i) {
        EXPECT_TRUE(is_valid_order_key(keys[i], digits)) << keys[i];
        if (a) {
            EXPECT_LT(*a, keys[i]);
        }
        if (b) {
            EXPECT_LT(keys[i], *b);
        }
        if (i > 0) {
            EXPECT_LT(keys[i - 1], keys[i]);
        }
    }
}

}  // namespace

// -- Trivial counts -----------------------------------------------------------

TEST(GenerateNKeysBetween, zero_keys_is_empty) {
    EXPECT_TRUE(generate_n_keys_between(std::nullopt, std::nullopt, 0).empty());
    EXPECT_TRUE(generate_n_keys_between("a0", "a1", 0).empty());
}

TEST(GenerateNKeysBetween, one_key_matches_single_generation) {
    EXPECT_EQ(generate_n_keys_between("a1", "a2", 1), Keys{"a1V"});
    EXPECT_EQ(generate_n_keys_between(std::nullopt, std::nullopt, 1), Keys{"a0"});
}

// -- Open bounds --------------------------------------------------------------

TEST(GenerateNKeysBetween, no_bounds_counts_up_from_zero) {
    EXPECT_EQ(generate_n_keys_between(std::nullopt, std::nullopt, 5, decimal),
              (Keys{"a0", "a1", "a2", "a3", "a4"}));
}

TEST(GenerateNKeysBetween, append_crosses_into_longer_integers) {
    EXPECT_EQ(generate_n_keys_between("a4", std::nullopt, 10, decimal),
              (Keys{"a5", "a6", "a7", "a8", "a9", "b00", "b01", "b02", "b03", "b04"}));
}

TEST(GenerateNKeysBetween, prepend_is_returned_in_ascending_order) {
    EXPECT_EQ(generate_n_keys_between(std::nullopt, "a0", 5, decimal),
              (Keys{"Z5", "Z6", "Z7", "Z8", "Z9"}));
    EXPECT_EQ(generate_n_keys_between(std::nullopt, "a0", 3),
              (Keys{"Zx", "Zy", "Zz"}));
}

// -- Both bounds --------------------------------------------------------------

TEST(GenerateNKeysBetween, decimal_range_between_two_integers) {
    EXPECT_EQ(generate_n_keys_between("a0", "a2", 20, decimal),
              (Keys{"a01", "a02", "a03", "a035", "a04", "a05", "a06", "a07", "a08", "a09",
                    "a1", "a11", "a12", "a13", "a14", "a15", "a16", "a17", "a18", "a19"}));
}

TEST(GenerateNKeysBetween, base_62_range_is_evenly_spread) {
    EXPECT_EQ(generate_n_keys_between("a0", "a1", 10),
              (Keys{"a04", "a08", "a0G", "a0K", "a0O", "a0V", "a0Z", "a0d", "a0l", "a0t"}));
}

TEST(GenerateNKeysBetween, fractional_bounds) {
    EXPECT_EQ(generate_n_keys_between("a0V", "a1", 4),
              (Keys{"a0Z", "a0d", "a0l", "a0t"}));
    EXPECT_EQ(generate_n_keys_between("a1", "a2", 7, decimal),
              (Keys{"a12", "a13", "a14", "a15", "a17", "a18", "a19"}));
}

TEST(GenerateNKeysBetween, large_batch_stays_ordered_and_short) {
    const auto keys = generate_n_keys_between("a0", "a1", 1000);
    ASSERT_EQ(keys.size(), 1000u);
    expect_ordered_between(keys, "a0", "a1", default_digits());

    const auto longest = std::ranges::max(keys, {}, [](const std::string& k) { return k.size(); });
    EXPECT_LE(longest.size(), 5u);
}

TEST(GenerateNKeysBetween, batches_respect_bounds) {
    expect_ordered_between(generate_n_keys_between("Zz", "a0V", 50), "Zz", "a0V",
                           default_digits());
    expect_ordered_between(generate_n_keys_between(std::nullopt, "b00", 30), std::nullopt,
                           "b00", default_digits());
    expect_ordered_between(generate_n_keys_between("a95", std::nullopt, 30, decimal), "a95",
                           std::nullopt, decimal);
}

// -- Errors -------------------------------------------------------------------

TEST(GenerateNKeysBetween, propagates_errors) {
    EXPECT_THROW((void)generate_n_keys_between("a2", "a1", 3), OrderKeyError);
    EXPECT_THROW((void)generate_n_keys_between("a00", std::nullopt, 3), OrderKeyError);
    EXPECT_THROW((void)generate_n_keys_between(std::nullopt, "b", 3), OrderKeyError);
}
