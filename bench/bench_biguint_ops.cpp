// bench/bench_biguint_ops.cpp - Benchmarks for the biguint operations behind digit expansion.

#include <random>

#include <benchmark/benchmark.h>

#include <basecvt/core/biguint.hpp>
#include <basecvt/core/integer.hpp>
#include <basecvt/util/random.hpp>

namespace {

using basecvt::core::biguint;

biguint nonzero_biguint(std::mt19937_64 &rng, std::size_t limbs) {
    auto value = basecvt::util::random_biguint(rng, limbs);
    return value.is_zero() ? biguint::one() : value;
}

} // namespace

static void bench_multiply_add_small(benchmark::State &state) {
    std::mt19937_64 rng(0x5eedc0de + static_cast<int>(state.thread_index()));
    const auto base = basecvt::util::random_biguint(rng, static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto value = base;
        value.multiply_add_small(16, 7);
        benchmark::DoNotOptimize(value);
    }
}

static void bench_div_mod(benchmark::State &state) {
    std::mt19937_64 rng(0x5eedc0de + 0x10);
    const auto limbs = static_cast<std::size_t>(state.range(0));
    const auto dividend = basecvt::util::random_biguint(rng, limbs + 1);
    const auto divisor = nonzero_biguint(rng, limbs);
    for (auto _ : state) {
        auto result = biguint::div_mod(dividend, divisor);
        benchmark::DoNotOptimize(result.first);
    }
}

static void bench_multiply(benchmark::State &state) {
    std::mt19937_64 rng(0x5eedc0de + 0x30);
    const auto limbs = static_cast<std::size_t>(state.range(0));
    const auto lhs = basecvt::util::random_biguint(rng, limbs);
    const auto rhs = basecvt::util::random_biguint(rng, limbs);
    for (auto _ : state) {
        auto product = lhs * rhs;
        benchmark::DoNotOptimize(product);
    }
}

static void bench_to_digits(benchmark::State &state) {
    std::mt19937_64 rng(0x5eedc0de + 0x40);
    const auto value = basecvt::util::random_biguint(rng, static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto text = basecvt::core::to_digits(value, 10);
        benchmark::DoNotOptimize(text);
    }
}

static void bench_power(benchmark::State &state) {
    const auto exponent = static_cast<std::size_t>(state.range(0));
    for (auto _ : state) {
        auto value = biguint::power(10, exponent);
        benchmark::DoNotOptimize(value);
    }
}

BENCHMARK(bench_multiply_add_small)->Arg(1)->Arg(4)->Arg(16);
BENCHMARK(bench_div_mod)->Arg(1)->Arg(2)->Arg(4)->Arg(8);
BENCHMARK(bench_multiply)->Arg(2)->Arg(8)->Arg(32);
BENCHMARK(bench_to_digits)->Arg(2)->Arg(8)->Arg(32);
BENCHMARK(bench_power)->Arg(10)->Arg(60)->Arg(100);

BENCHMARK_MAIN();
