// reorderable_list — a drag-and-drop todo list ordered by fractional keys
//
// Demonstrates: storing items in an ordered container keyed by order key,
//               moving an item without touching its neighbours, loading the
//               alphabet from a JSON config, exporting the list as JSON

#include <fracindex-cpp/fracindex.hpp>
#include <fracindex-cpp/json.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdio>
#include <iterator>
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace fi = fracindex_cpp;

namespace {

// The list's storage: key -> item. std::map keeps it sorted by key, which is
// the display order.
using TodoList = std::map<std::string, std::string>;

// Neighbouring keys around display position index (0 = front, size = back).
auto bounds_at(const TodoList& list, std::size_t index)
    -> std::pair<std::optional<std::string>, std::optional<std::string>> {
    auto lower = std::optional<std::string>{};
    auto upper = std::optional<std::string>{};
    auto it = list.begin();
    std::advance(it, static_cast<std::ptrdiff_t>(index));
    if (it != list.begin()) lower = std::prev(it)->first;
    if (it != list.end()) upper = it->first;
    return {lower, upper};
}

void insert_at(TodoList& list, std::size_t index, std::string item, const fi::Digits& digits) {
    const auto [lower, upper] = bounds_at(list, index);
    list.emplace(fi::generate_key_between(lower, upper, digits), std::move(item));
}

// Move the item at position from so that it ends up at position to.
void move_item(TodoList& list, std::size_t from, std::size_t to, const fi::Digits& digits) {
    auto it = list.begin();
    std::advance(it, static_cast<std::ptrdiff_t>(from));
    auto item = std::move(it->second);
    list.erase(it);
    insert_at(list, to, std::move(item), digits);
}

void print_list(const TodoList& list, const char* label) {
    std::printf("\n=== %s ===\n", label);
    auto position = std::size_t{1};
    for (const auto& [key, item] : list) {
        std::printf("  %zu. %-22s (%s)\n", position++, item.c_str(), key.c_str());
    }
}

}  // namespace

int main() {
    fi::set_up_logging();

    const auto config = nlohmann::json::parse(R"({"digits": "0123456789"})");
    const auto digits = fi::load_digits(config);

    auto list = TodoList{};
    const auto keys = fi::generate_n_keys_between(std::nullopt, std::nullopt, 4, digits);
    list.emplace(keys[0], "Set up CI pipeline");
    list.emplace(keys[1], "Write unit tests");
    list.emplace(keys[2], "Review PRs");
    list.emplace(keys[3], "Update docs");
    print_list(list, "Initial");

    // Drag "Update docs" to the top: one new key, every other key untouched
    move_item(list, 3, 0, digits);
    print_list(list, "Docs moved to the top");

    // Drop a new item between the first two
    insert_at(list, 1, "Triage bug reports", digits);
    print_list(list, "Bug triage inserted second");

    // Drag the last item between the second and third
    move_item(list, 4, 2, digits);
    print_list(list, "Last item moved to third");

    auto exported = nlohmann::json::array();
    for (const auto& [key, item] : list) {
        exported.push_back({{"key", key}, {"parts", fi::split_order_key(key, digits)},
                            {"item", item}});
    }
    std::printf("\n%s\n", exported.dump(2).c_str());
    return 0;
}
