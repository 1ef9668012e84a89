// basic_usage — generate order keys for a list that only ever grows
//
// Demonstrates: first key, append, prepend, insert between, batch
//               generation, custom alphabets, error handling

#include <fracindex-cpp/fracindex.hpp>

#include <cstdio>
#include <optional>
#include <string>

namespace fi = fracindex_cpp;

int main() {
    fi::set_up_logging();

    // The first item of an empty list
    const auto first = fi::generate_key_between(std::nullopt, std::nullopt);
    std::printf("first:          %s\n", first.c_str());

    // Append two items at the end
    const auto second = fi::generate_key_between(first, std::nullopt);
    const auto third = fi::generate_key_between(second, std::nullopt);
    std::printf("second:         %s\n", second.c_str());
    std::printf("third:          %s\n", third.c_str());

    // Put an item in front of everything
    const auto zeroth = fi::generate_key_between(std::nullopt, first);
    std::printf("zeroth:         %s\n", zeroth.c_str());

    // Squeeze an item between the second and third
    const auto between = fi::generate_key_between(second, third);
    std::printf("second-and-a-half: %s\n", between.c_str());

    // Five keys at once, spread evenly between the first and second
    std::printf("batch:         ");
    for (const auto& key : fi::generate_n_keys_between(first, second, 5)) {
        std::printf(" %s", key.c_str());
    }
    std::printf("\n");

    // A decimal alphabet keeps keys human readable
    const auto decimal = fi::Digits{fi::base_10_digits};
    std::printf("decimal:       ");
    for (const auto& key : fi::generate_n_keys_between("a4", std::nullopt, 8, decimal)) {
        std::printf(" %s", key.c_str());
    }
    std::printf("\n");

    // Out-of-order bounds are reported, never silently fixed up
    try {
        (void)fi::generate_key_between(third, first);
    } catch (const fi::OrderKeyError& e) {
        std::printf("error:          %s\n", e.what());
    }

    return 0;
}
