// Fuzz target for key generation — splits the input into two candidate
// bounds and checks that any key produced lies strictly between them.

#include <fracindex-cpp/fracindex.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    namespace fi = fracindex_cpp;

    const auto input = std::string_view(reinterpret_cast<const char*>(data), size);
    const auto split = input.find('\n');

    // "<a>\n<b>": an empty side is an open bound.
    auto a = std::optional<std::string_view>{};
    auto b = std::optional<std::string_view>{};
    if (split == std::string_view::npos) {
        if (!input.empty()) a = input;
    } else {
        if (split > 0) a = input.substr(0, split);
        if (split + 1 < input.size()) b = input.substr(split + 1);
    }

    try {
        const auto key = fi::generate_key_between(a, b);
        if ((a && !(*a < key)) || (b && !(key < *b)) || !fi::is_valid_order_key(key)) {
            std::abort();
        }
    } catch (const fi::OrderKeyError&) {
        // Rejected input is fine; only wrong output is a bug.
    }
    return 0;
}
