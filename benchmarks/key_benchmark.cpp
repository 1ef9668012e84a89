// fracindex-cpp benchmarks — measures throughput of key generation.

#include <fracindex-cpp/fracindex.hpp>

#include <benchmark/benchmark.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

using namespace fracindex_cpp;

// =============================================================================
// Single keys
// =============================================================================

static void bm_first_key(benchmark::State& state) {
    for (auto _ : state) {
        auto key = generate_key_between(std::nullopt, std::nullopt);
        benchmark::DoNotOptimize(key);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_first_key);

static void bm_append(benchmark::State& state) {
    auto last = generate_key_between(std::nullopt, std::nullopt);
    for (auto _ : state) {
        last = generate_key_between(last, std::nullopt);
        benchmark::DoNotOptimize(last);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_append);

static void bm_prepend(benchmark::State& state) {
    auto first = generate_key_between(std::nullopt, std::nullopt);
    for (auto _ : state) {
        first = generate_key_between(std::nullopt, first);
        benchmark::DoNotOptimize(first);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_prepend);

static void bm_between_integers(benchmark::State& state) {
    for (auto _ : state) {
        auto key = generate_key_between("a1", "a2");
        benchmark::DoNotOptimize(key);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_between_integers);

// Worst case for key length: always insert right after the same key, so the
// gap halves every iteration. Reset periodically to keep keys bounded.
static void bm_insert_after_same_key(benchmark::State& state) {
    const auto depth = static_cast<std::size_t>(state.range(0));
    const auto lower = std::string{"a0"};
    auto upper = std::string{"a1"};
    std::size_t step = 0;
    for (auto _ : state) {
        if (step++ == depth) {
            upper = "a1";
            step = 0;
        }
        upper = generate_key_between(lower, upper);
        benchmark::DoNotOptimize(upper);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_insert_after_same_key)->Range(8, 512);

static void bm_validate(benchmark::State& state) {
    const auto key = std::string{"b12Vk3"};
    for (auto _ : state) {
        auto ok = is_valid_order_key(key);
        benchmark::DoNotOptimize(ok);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_validate);

// =============================================================================
// Batches
// =============================================================================

static void bm_n_keys_between(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    for (auto _ : state) {
        auto keys = generate_n_keys_between("a0", "a1", n);
        benchmark::DoNotOptimize(keys);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_n_keys_between)->Range(8, 8192);

static void bm_n_keys_append(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    for (auto _ : state) {
        auto keys = generate_n_keys_between("a0", std::nullopt, n);
        benchmark::DoNotOptimize(keys);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_n_keys_append)->Range(8, 8192);

// =============================================================================
// Alphabets
// =============================================================================

static void bm_decimal_alphabet_batch(benchmark::State& state) {
    const auto digits = Digits{base_10_digits};
    for (auto _ : state) {
        auto keys = generate_n_keys_between("a0", "a2", 256, digits);
        benchmark::DoNotOptimize(keys);
    }
    state.SetItemsProcessed(state.iterations() * 256);
}
BENCHMARK(bm_decimal_alphabet_batch);

static void bm_digits_construction(benchmark::State& state) {
    for (auto _ : state) {
        auto digits = Digits{base_62_digits};
        benchmark::DoNotOptimize(digits);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_digits_construction);
