// bench/bench_generate.cpp — Benchmarks for parsing and table construction.

#include <cstdint>
#include <string>

#include <benchmark/benchmark.h>

#include <curdata/curdata.hpp>

#include "bench_fixtures.hpp"

namespace {

curdata::generator_options bench_options() {
    curdata::generator_options options;
    options.now_ms = 1767225600000LL;
    return options;
}

} // namespace

static void bench_parse_properties(benchmark::State &state) {
    const std::string text = curdata_bench::synthetic_properties();
    for (auto _ : state) {
        auto values = curdata::io::parse_properties(text);
        benchmark::DoNotOptimize(values);
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations()) * static_cast<std::int64_t>(text.size()));
}

static void bench_build_main_table(benchmark::State &state) {
    const auto values = curdata::io::parse_properties(curdata_bench::synthetic_properties());
    const auto input = curdata::extract_input(values.value());
    const auto &registry = input.value().registry;
    for (auto _ : state) {
        curdata::core::special_case_registry cases(registry, *bench_options().now_ms);
        auto table = curdata::core::build_main_table(values.value(), registry, cases);
        benchmark::DoNotOptimize(table);
    }
}

static void bench_generate(benchmark::State &state) {
    const auto values = curdata::io::parse_properties(curdata_bench::synthetic_properties());
    const auto options = bench_options();
    for (auto _ : state) {
        auto data = curdata::generate(values.value(), options);
        if (!data) {
            state.SkipWithError(data.failure().message.c_str());
            break;
        }
        benchmark::DoNotOptimize(data);
    }
}

BENCHMARK(bench_parse_properties);
BENCHMARK(bench_build_main_table);
BENCHMARK(bench_generate);

BENCHMARK_MAIN();
