// tests/unit/test_fraction.cpp - Exact fraction engine and integer engine.

#include <basecvt/basecvt.hpp>

#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace {

using basecvt::ExactFraction;
using basecvt::core::biguint;

bool check_expand(std::string_view digits, int from, int to, int precision, std::string_view expected) {
    const auto fraction = ExactFraction::from_digits(digits, from);
    const auto actual = fraction.expand(to, precision);
    if (actual != expected) {
        std::cerr << "expand(" << digits << ", " << from << " -> " << to << ", p=" << precision
                  << ") = " << actual << ", expected " << expected << "\n";
        basecvt::util::dump(std::cerr, fraction) << "\n";
        return false;
    }
    return true;
}

bool test_exact_value() {
    const auto half = ExactFraction::from_digits("8", 16);
    if (!(half == ExactFraction(biguint(1), biguint(2)))) {
        std::cerr << "0x0.8 must equal 1/2\n";
        return false;
    }
    const auto quarter = ExactFraction::from_digits("25", 10);
    if (quarter.numerator() != biguint(25) || quarter.denominator() != biguint(100)) {
        std::cerr << "0.25 must be held as 25/100\n";
        return false;
    }
    if (!(ExactFraction::from_digits("01", 2) == quarter)) {
        std::cerr << "0b0.01 must equal 0.25\n";
        return false;
    }
    if (!ExactFraction::from_digits("", 10).is_zero() || !ExactFraction::from_digits("000", 8).is_zero()) {
        std::cerr << "empty and zero fractions\n";
        return false;
    }
    try {
        (void)ExactFraction(biguint(3), biguint(2));
        std::cerr << "fraction above one accepted\n";
        return false;
    } catch (const std::domain_error&) {
    }
    return true;
}

bool test_terminating_expansions() {
    return check_expand("5", 10, 2, 10, "1000000000") &&
           check_expand("8", 16, 10, 10, "5000000000") &&
           check_expand("0625", 10, 2, 4, "0001") &&
           check_expand("6", 8, 10, 4, "7500") &&
           check_expand("FF", 16, 8, 10, "7760000000") &&
           check_expand("777", 8, 16, 10, "FF80000000") &&
           check_expand("0001", 16, 10, 20, "00001525878906250000") &&
           check_expand("125", 10, 8, 100, "1" + std::string(99, '0'));
}

bool test_repeating_expansions() {
    return check_expand("1", 10, 2, 20, "00011001100110011001") &&
           check_expand("1", 10, 8, 10, "0631463146") &&
           check_expand("1", 10, 16, 10, "1999999999") &&
           check_expand("3", 10, 2, 30, "010011001100110011001100110011") &&
           check_expand("2", 10, 16, 15, "333333333333333");
}

bool test_truncation_not_rounding() {
    // 0.1 in binary continues ...1001 1001; the digit after position 5 is a 1,
    // so rounding would change the last digit while truncation must not.
    if (!check_expand("1", 10, 2, 5, "00011")) {
        return false;
    }
    // 0.99999 would round up to 1.0 at two digits.
    if (!check_expand("99999", 10, 10, 2, "99")) {
        return false;
    }
    if (!check_expand("FFFF", 16, 16, 2, "FF")) {
        return false;
    }
    return true;
}

bool test_long_source_fraction() {
    // 60 decimal digits of the fraction of pi; a double would lose everything
    // after the 17th significant digit.
    const std::string pi_fraction = "141592653589793238462643383279502884197169399375105820974944";
    return check_expand(pi_fraction, 10, 16, 48, "243F6A8885A308D313198A2E03707344A4093822299F31D0");
}

bool test_integer_engine() {
    const std::vector<std::tuple<std::string_view, int, int, std::string_view>> cases = {
        {"", 10, 2, "0"},
        {"000", 16, 10, "0"},
        {"5", 10, 2, "101"},
        {"255", 10, 16, "FF"},
        {"FF", 16, 2, "11111111"},
        {"ff", 16, 8, "377"},
        {"377", 8, 16, "FF"},
        {"1010", 2, 8, "12"},
        {"17", 8, 16, "F"},
        {"0042", 10, 10, "42"},
        {"00ab", 16, 16, "AB"},
        {"18446744073709551616", 10, 16, "10000000000000000"},
        {"123456789012345678901234567890", 10, 8, "143564417755415637016711617605322"},
        {"DEADBEEFCAFEBABE1234", 16, 10, "1051570404360395033547316"},
    };
    for (const auto& [digits, from, to, expected] : cases) {
        const auto actual = basecvt::core::convert_integer_digits(digits, from, to);
        if (actual != expected) {
            std::cerr << "convert_integer_digits(" << digits << ", " << from << " -> " << to
                      << ") = " << actual << ", expected " << expected << "\n";
            return false;
        }
    }
    const std::string googol = "1" + std::string(100, '0');
    const auto back = basecvt::core::convert_integer_digits(
        basecvt::core::convert_integer_digits(googol, 10, 2), 2, 10);
    if (back != googol) {
        std::cerr << "googol round trip through binary\n";
        return false;
    }
    try {
        (void)basecvt::core::convert_integer_digits("12", 2, 10);
        std::cerr << "integer engine accepted '2' in binary\n";
        return false;
    } catch (const basecvt::InvalidDigitError&) {
    }
    return true;
}

} // namespace

int main() {
    if (!test_exact_value()) {
        return 1;
    }
    if (!test_terminating_expansions()) {
        return 1;
    }
    if (!test_repeating_expansions()) {
        return 1;
    }
    if (!test_truncation_not_rounding()) {
        return 1;
    }
    if (!test_long_source_fraction()) {
        return 1;
    }
    if (!test_integer_engine()) {
        return 1;
    }
    std::cout << "fraction passed\n";
    return 0;
}
