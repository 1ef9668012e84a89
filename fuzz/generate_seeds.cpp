// Helper to generate valid seed corpus files for fuzz testing.
// Build and run once: ./generate_seeds
// Not a fuzz target itself — just a corpus generator.

#include <fracindex-cpp/fracindex.hpp>

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>

static void write_seed(const std::string& path, const std::string& data) {
    auto ofs = std::ofstream{path, std::ios::binary};
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
}

int main() {
    namespace fs = std::filesystem;
    namespace fi = fracindex_cpp;
    const auto dir = std::string{"fuzz/corpus"};
    fs::create_directories(dir);

    // Seed 1: both bounds open
    write_seed(dir + "/seed_open.txt", "\n");

    // Seed 2: append after the first key
    write_seed(dir + "/seed_append.txt", "a0\n");

    // Seed 3: prepend before the first key
    write_seed(dir + "/seed_prepend.txt", "\na0");

    // Seed 4: adjacent integers
    write_seed(dir + "/seed_adjacent.txt", "a1\na2");

    // Seed 5: neighbours from an evenly spread batch
    {
        const auto keys = fi::generate_n_keys_between("a0", "a1", 16);
        write_seed(dir + "/seed_batch.txt", keys[6] + "\n" + keys[7]);
    }

    // Seed 6: just above the reserved smallest integer
    write_seed(dir + "/seed_smallest.txt", "\nA" + std::string(25, '0') + "1");

    return 0;
}
