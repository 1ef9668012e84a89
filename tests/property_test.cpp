#include <fracindex-cpp/fracindex.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <cstddef>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

using namespace fracindex_cpp;

namespace {

// Insert count keys at random positions of an ordered list, always between
// the current neighbours, and return the resulting list.
auto random_inserts(std::size_t count, const Digits& digits, unsigned seed)
    -> std::vector<std::string> {
    auto rng = std::mt19937{seed};
    auto keys = std::vector<std::string>{};
    for (std::size_t i = 0; i < count; ++i) {
        auto pick = std::uniform_int_distribution<std::size_t>{0, keys.size()};
        const auto pos = pick(rng);
        auto lower = pos > 0 ? std::optional<std::string_view>{keys[pos - 1]} : std::nullopt;
        auto upper = pos < keys.size() ? std::optional<std::string_view>{keys[pos]}
                                       : std::nullopt;
        auto key = generate_key_between(lower, upper, digits);
        keys.insert(keys.begin() + static_cast<std::ptrdiff_t>(pos), std::move(key));
    }
    return keys;
}

}  // namespace

TEST(Properties, random_inserts_keep_list_sorted_and_unique) {
    for (auto alphabet : {base_62_digits, base_10_digits}) {
        const auto digits = Digits{alphabet};
        const auto keys = random_inserts(2000, digits, 42);

        EXPECT_TRUE(std::ranges::is_sorted(keys));
        EXPECT_EQ(std::ranges::adjacent_find(keys), keys.end());
        for (const auto& key : keys) {
            EXPECT_TRUE(is_valid_order_key(key, digits)) << key;
        }
    }
}

TEST(Properties, repeated_front_inserts_stay_ordered) {
    auto keys = std::vector<std::string>{generate_key_between(std::nullopt, std::nullopt)};
    for (int i = 0; i < 500; ++i) {
        keys.insert(keys.begin(), generate_key_between(std::nullopt, keys.front()));
    }
    EXPECT_TRUE(std::ranges::is_sorted(keys));
    EXPECT_EQ(std::ranges::adjacent_find(keys), keys.end());
}

TEST(Properties, repeated_inserts_after_first_key_grow_slowly) {
    auto lower = generate_key_between(std::nullopt, std::nullopt);
    auto upper = generate_key_between(lower, std::nullopt);
    for (int i = 0; i < 100; ++i) {
        auto key = generate_key_between(lower, upper);
        ASSERT_LT(lower, key);
        ASSERT_LT(key, upper);
        upper = std::move(key);
    }
    // Each halving of the gap costs about one bit; 100 halvings fit well
    // within 2 + 100 / 5 base-62 digits.
    EXPECT_LE(upper.size(), 22u);
}

TEST(Properties, deterministic_across_runs) {
    EXPECT_EQ(random_inserts(300, default_digits(), 7),
              random_inserts(300, default_digits(), 7));
}

TEST(Properties, concurrent_generation_matches_sequential) {
    const auto expected = generate_n_keys_between("a0", "b00", 200);

    auto results = std::vector<std::vector<std::string>>(8);
    auto threads = std::vector<std::thread>{};
    for (auto& result : results) {
        threads.emplace_back([&result] {
            result = generate_n_keys_between("a0", "b00", 200);
        });
    }
    for (auto& t : threads) t.join();

    for (const auto& result : results) {
        EXPECT_EQ(result, expected);
    }
}
