// Fuzz target for the midpoint algorithm over the decimal alphabet —
// exercises prefix stripping and the consecutive-digit extension paths.

#include "src/codec/midpoint.hpp"

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    namespace fi = fracindex_cpp;
    static const auto digits = fi::Digits{fi::base_10_digits};

    // Map every byte onto a decimal digit; 0xFF separates a from b.
    auto a = std::string{};
    auto b = std::string{};
    auto* target = &a;
    for (size_t i = 0; i < size; ++i) {
        if (data[i] == 0xFF && target == &a) {
            target = &b;
            continue;
        }
        target->push_back(static_cast<char>('0' + data[i] % 10));
    }
    const auto upper = (target == &b && !b.empty()) ? std::optional<std::string_view>{b}
                                                     : std::nullopt;

    try {
        const auto m = fi::codec::midpoint(a, upper, digits);
        if (!(a < m) || (upper && !(m < *upper)) || m.empty() || m.back() == '0') {
            std::abort();
        }
    } catch (const fi::OrderKeyError&) {
        // Out-of-order or trailing-zero inputs are rejected by design.
    }
    return 0;
}
