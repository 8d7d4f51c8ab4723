// bench/bench_image.cpp — Benchmarks for image encoding and decoding.

#include <cstdint>
#include <vector>

#include <benchmark/benchmark.h>

#include <curdata/curdata.hpp>

#include "bench_fixtures.hpp"

namespace {

curdata::currency_data bench_data() {
    curdata::generator_options options;
    options.now_ms = 1767225600000LL;
    return curdata::generate_from_text(curdata_bench::synthetic_properties(), options).value();
}

} // namespace

static void bench_encode_image(benchmark::State &state) {
    const auto data = bench_data();
    for (auto _ : state) {
        auto bytes = curdata::io::encode_image(data);
        benchmark::DoNotOptimize(bytes);
    }
}

static void bench_decode_image(benchmark::State &state) {
    const std::vector<std::uint8_t> bytes = curdata::io::encode_image(bench_data()).value();
    for (auto _ : state) {
        auto decoded = curdata::io::decode_image(bytes);
        benchmark::DoNotOptimize(decoded);
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations()) * static_cast<std::int64_t>(bytes.size()));
}

static void bench_pack_entries(benchmark::State &state) {
    const auto data = bench_data();
    for (auto _ : state) {
        auto packed = data.main.packed();
        benchmark::DoNotOptimize(packed);
    }
}

BENCHMARK(bench_encode_image);
BENCHMARK(bench_decode_image);
BENCHMARK(bench_pack_entries);

BENCHMARK_MAIN();
