// bench/bench_converter.cpp - Benchmarks for BaseConverter across precisions and base pairs.

#include <random>
#include <string>

#include <benchmark/benchmark.h>

#include <basecvt/basecvt.hpp>
#include <basecvt/util/random.hpp>

namespace {

const std::string kPi100 =
    "3.1415926535897932384626433832795028841971693993751058209749445923078164062862089986280348253421170679";

} // namespace

static void bench_precision_scaling(benchmark::State &state) {
    const basecvt::BaseConverter converter;
    const int precision = static_cast<int>(state.range(0));
    for (auto _ : state) {
        auto result = converter.decimal_to_hex(kPi100, precision);
        benchmark::DoNotOptimize(result);
    }
    state.SetComplexityN(state.range(0));
}

static void bench_repeating_fraction(benchmark::State &state) {
    const basecvt::BaseConverter converter;
    const int precision = static_cast<int>(state.range(0));
    for (auto _ : state) {
        auto result = converter.decimal_to_binary("0.1", precision);
        benchmark::DoNotOptimize(result);
    }
}

static void bench_cross_base(benchmark::State &state) {
    const int from = basecvt::core::SUPPORTED_BASES[static_cast<std::size_t>(state.range(0))];
    const int to = basecvt::core::SUPPORTED_BASES[static_cast<std::size_t>(state.range(1))];
    std::mt19937_64 rng(0x5eedc0de + static_cast<int>(state.thread_index()));
    const basecvt::BaseConverter converter(50);
    const auto input = basecvt::util::random_numeral(rng, from, 24, 24);
    for (auto _ : state) {
        auto result = converter.convert(input, from, to);
        benchmark::DoNotOptimize(result);
    }
}

static void bench_large_integer(benchmark::State &state) {
    std::mt19937_64 rng(0x5eedc0de + 0x20);
    const basecvt::BaseConverter converter;
    const auto digits = basecvt::util::random_digits(rng, 10, static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto result = converter.decimal_to_hex(digits);
        benchmark::DoNotOptimize(result);
    }
    state.SetComplexityN(state.range(0));
}

static void bench_scientific_overhead(benchmark::State &state) {
    const basecvt::BaseConverter converter;
    const bool scientific = state.range(0) != 0;
    const std::string input = scientific ? "1.2345678901234e-5" : "0.000012345678901234";
    for (auto _ : state) {
        auto result = converter.decimal_to_binary(input, 64);
        benchmark::DoNotOptimize(result);
    }
}

BENCHMARK(bench_precision_scaling)->RangeMultiplier(2)->Range(8, 64)->Arg(100)->Complexity();
BENCHMARK(bench_repeating_fraction)->Arg(10)->Arg(50)->Arg(100);
BENCHMARK(bench_cross_base)->ArgsProduct({{0, 1, 2, 3}, {0, 1, 2, 3}});
BENCHMARK(bench_large_integer)->RangeMultiplier(4)->Range(16, 1024)->Complexity();
BENCHMARK(bench_scientific_overhead)->Arg(0)->Arg(1);

BENCHMARK_MAIN();
