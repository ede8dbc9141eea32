// tests/unit/test_biguint_ops.cpp - Arithmetic properties of the biguint magnitude type.

#include <basecvt/basecvt.hpp>
#include <basecvt/util/random.hpp>

#include <cstdint>
#include <iostream>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

using basecvt::core::biguint;

biguint random_small_biguint(std::mt19937_64& rng) {
    static std::uniform_int_distribution<std::uint64_t> dist(0, 1'000'000'000'000ULL);
    return biguint(dist(rng));
}

bool check_equal(const biguint& lhs, const biguint& rhs, std::string_view label) {
    if (lhs == rhs) {
        return true;
    }
    std::cerr << label << " mismatch: ";
    basecvt::util::dump(std::cerr, lhs) << " != ";
    basecvt::util::dump(std::cerr, rhs) << "\n";
    return false;
}

bool test_string_roundtrip(std::mt19937_64& rng) {
    for (int base : {2, 8, 10, 16}) {
        for (int iteration = 0; iteration < 16; ++iteration) {
            const auto original = basecvt::util::random_biguint(rng, 1 + iteration % 5);
            const std::string text = basecvt::core::to_digits(original, base);
            const auto parsed = basecvt::core::parse_magnitude(text, base);
            if (!check_equal(original, parsed, "string roundtrip")) {
                return false;
            }
        }
    }
    const std::vector<std::pair<std::uint64_t, std::string>> cases = {
        {0, "0"}, {255, "FF"}, {4095, "FFF"}, {10'000'000'000ULL, "2540BE400"},
        {0xFFFFFFFFFFFFFFFFULL, "FFFFFFFFFFFFFFFF"}};
    for (const auto& [value, hex] : cases) {
        if (basecvt::core::to_digits(biguint(value), 16) != hex) {
            std::cerr << "hex rendering mismatch for " << hex << "\n";
            return false;
        }
    }
    if (basecvt::core::to_digits(biguint(1'000'000'000ULL), 10) != "1000000000") {
        std::cerr << "decimal chunk boundary rendering\n";
        return false;
    }
    return true;
}

bool test_add_sub_properties(std::mt19937_64& rng) {
    for (int iteration = 0; iteration < 32; ++iteration) {
        const auto a = basecvt::util::random_biguint(rng, 1 + iteration % 4);
        const auto b = basecvt::util::random_biguint(rng, 1 + (iteration + 1) % 4);
        const auto sum = a + b;
        if (!check_equal(sum - b, a, "addition identity")) {
            return false;
        }
        if (!check_equal(sum - a, b, "addition identity 2")) {
            return false;
        }
        if (!(sum >= a) || !(sum >= b)) {
            std::cerr << "sum ordering\n";
            return false;
        }
    }
    try {
        (void)(biguint(1) - biguint(2));
        std::cerr << "negative subtraction did not throw\n";
        return false;
    } catch (const std::domain_error&) {
    }
    return true;
}

bool test_multiply(std::mt19937_64& rng) {
    for (int iteration = 0; iteration < 32; ++iteration) {
        const auto a = random_small_biguint(rng);
        const auto b = random_small_biguint(rng);
        const auto c = random_small_biguint(rng);
        if (!check_equal(a * (b + c), a * b + a * c, "distributivity")) {
            return false;
        }
        auto scaled = a;
        scaled.multiply_add_small(16, 7);
        if (!check_equal(scaled, a * biguint(16) + biguint(7), "multiply_add_small")) {
            return false;
        }
    }
    if (!check_equal(biguint(0xFFFFFFFFULL) * biguint(0xFFFFFFFFULL),
                     biguint(0xFFFFFFFE00000001ULL), "limb carry")) {
        return false;
    }
    return true;
}

bool test_div_mod(std::mt19937_64& rng) {
    for (int iteration = 0; iteration < 32; ++iteration) {
        const auto dividend = basecvt::util::random_biguint(rng, 2 + iteration % 4);
        auto divisor = basecvt::util::random_biguint(rng, 1 + iteration % 3);
        if (divisor.is_zero()) {
            divisor = biguint::one();
        }
        const auto [quotient, remainder] = biguint::div_mod(dividend, divisor);
        if (!(remainder < divisor)) {
            std::cerr << "div_mod remainder not reduced\n";
            return false;
        }
        if (!check_equal(quotient * divisor + remainder, dividend, "div_mod identity")) {
            return false;
        }
    }
    for (int iteration = 0; iteration < 32; ++iteration) {
        const auto dividend = basecvt::util::random_biguint(rng, 3);
        const auto [quotient, remainder] = dividend.div_mod_small(10);
        if (remainder >= 10 ||
            !check_equal(quotient * biguint(10) + biguint(remainder), dividend, "div_mod_small")) {
            return false;
        }
    }
    try {
        (void)biguint::div_mod(biguint(5), biguint::zero());
        std::cerr << "division by zero did not throw\n";
        return false;
    } catch (const std::domain_error&) {
    }
    return true;
}

bool test_power() {
    if (!check_equal(biguint::power(10, 0), biguint::one(), "power zero")) {
        return false;
    }
    if (!check_equal(biguint::power(16, 15), biguint(0x1000000000000000ULL), "power of sixteen")) {
        return false;
    }
    const auto big = biguint::power(10, 50);
    if (basecvt::core::to_digits(big, 10) != "1" + std::string(50, '0')) {
        std::cerr << "10^50 rendering\n";
        return false;
    }
    if (basecvt::core::to_digits(biguint::power(2, 100), 16) != "1" + std::string(25, '0')) {
        std::cerr << "2^100 rendering\n";
        return false;
    }
    return true;
}

bool test_integral_conversions() {
    if (static_cast<int>(biguint(42)) != 42) {
        std::cerr << "int conversion\n";
        return false;
    }
    if (static_cast<std::uint64_t>(biguint(0xFFFFFFFFFFFFFFFFULL)) != 0xFFFFFFFFFFFFFFFFULL) {
        std::cerr << "uint64 conversion\n";
        return false;
    }
    try {
        (void)static_cast<int>(biguint(1ULL << 40));
        std::cerr << "narrowing conversion did not throw\n";
        return false;
    } catch (const std::overflow_error&) {
    }
    try {
        (void)biguint(-1);
        std::cerr << "negative construction did not throw\n";
        return false;
    } catch (const std::domain_error&) {
    }
    return true;
}

} // namespace

int main() {
    std::mt19937_64 rng(0xc0ffee123);
    if (!test_string_roundtrip(rng)) {
        return 1;
    }
    if (!test_add_sub_properties(rng)) {
        return 1;
    }
    if (!test_multiply(rng)) {
        return 1;
    }
    if (!test_div_mod(rng)) {
        return 1;
    }
    if (!test_power()) {
        return 1;
    }
    if (!test_integral_conversions()) {
        return 1;
    }
    std::cout << "biguint_ops passed\n";
    return 0;
}
