// tests/unit/test_digits.cpp - Unit tests for the digit codec and base lookup data.

#include <basecvt/basecvt.hpp>

#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace {

using basecvt::core::digit_value;
using basecvt::core::value_digit;

bool test_digit_values() {
    const std::string_view decimal = "0123456789";
    for (std::size_t index = 0; index < decimal.size(); ++index) {
        if (digit_value(decimal[index], 10) != static_cast<int>(index)) {
            std::cerr << "decimal digit value mismatch for " << decimal[index] << "\n";
            return false;
        }
    }
    if (digit_value('A', 16) != 10 || digit_value('F', 16) != 15) {
        std::cerr << "upper-case hex digit values\n";
        return false;
    }
    if (digit_value('b', 16) != 11 || digit_value('f', 16) != 15) {
        std::cerr << "lower-case hex digit values\n";
        return false;
    }
    if (digit_value('1', 2) != 1 || digit_value('7', 8) != 7) {
        std::cerr << "binary/octal digit values\n";
        return false;
    }
    return true;
}

bool expect_invalid_digit(char ch, int base) {
    try {
        (void)digit_value(ch, base);
    } catch (const basecvt::InvalidDigitError& err) {
        if (err.digit() != ch || err.base() != base) {
            std::cerr << "InvalidDigitError context mismatch for '" << ch << "'\n";
            return false;
        }
        return true;
    }
    std::cerr << "expected InvalidDigitError for '" << ch << "' in base " << base << "\n";
    return false;
}

bool test_digit_rejection() {
    return expect_invalid_digit('2', 2) && expect_invalid_digit('8', 8) &&
           expect_invalid_digit('A', 10) && expect_invalid_digit('G', 16) &&
           expect_invalid_digit('g', 16) && expect_invalid_digit('.', 10) &&
           expect_invalid_digit('-', 16) && expect_invalid_digit(' ', 2);
}

bool test_value_digits() {
    for (int value = 0; value < 16; ++value) {
        const char ch = value_digit(value, 16);
        if (digit_value(ch, 16) != value) {
            std::cerr << "value_digit/digit_value disagree at " << value << "\n";
            return false;
        }
    }
    if (value_digit(10, 16) != 'A' || value_digit(15, 16) != 'F') {
        std::cerr << "hex digits must be upper-case\n";
        return false;
    }
    try {
        (void)value_digit(2, 2);
        std::cerr << "value_digit accepted a value outside the base\n";
        return false;
    } catch (const std::out_of_range&) {
    }
    try {
        (void)value_digit(-1, 10);
        std::cerr << "value_digit accepted a negative value\n";
        return false;
    } catch (const std::out_of_range&) {
    }
    return true;
}

bool test_base_lookup() {
    for (int base : {2, 8, 10, 16}) {
        if (!basecvt::core::is_supported_base(base)) {
            std::cerr << "base " << base << " should be supported\n";
            return false;
        }
    }
    for (int base : {0, 1, 3, 7, 9, 12, 15, 17, 36, -2}) {
        if (basecvt::core::is_supported_base(base)) {
            std::cerr << "base " << base << " should not be supported\n";
            return false;
        }
    }
    if (basecvt::core::base_prefix(2) != "0b" || basecvt::core::base_prefix(8) != "0o" ||
        basecvt::core::base_prefix(16) != "0x" || !basecvt::core::base_prefix(10).empty()) {
        std::cerr << "base prefixes\n";
        return false;
    }
    if (basecvt::core::base_name(2) != "binary" || basecvt::core::base_name(8) != "octal" ||
        basecvt::core::base_name(10) != "decimal" ||
        basecvt::core::base_name(16) != "hexadecimal") {
        std::cerr << "base names\n";
        return false;
    }
    try {
        (void)basecvt::core::base_name(3);
        std::cerr << "base_name accepted base 3\n";
        return false;
    } catch (const basecvt::UnsupportedBaseError& err) {
        if (err.base() != 3) {
            std::cerr << "UnsupportedBaseError base mismatch\n";
            return false;
        }
    }
    return true;
}

bool test_error_hierarchy() {
    try {
        throw basecvt::PrecisionRangeError(101);
    } catch (const basecvt::ConversionError& err) {
        if (std::string(err.what()).find("101") == std::string::npos) {
            std::cerr << "PrecisionRangeError message lacks the precision\n";
            return false;
        }
    }
    try {
        throw basecvt::ScientificNotationError("bad exponent");
    } catch (const std::invalid_argument&) {
    }
    const basecvt::InvalidDigitError positioned('2', 2, 4);
    if (positioned.position() != 4 ||
        std::string(positioned.what()).find("position 4") == std::string::npos) {
        std::cerr << "InvalidDigitError position\n";
        return false;
    }
    return true;
}

} // namespace

int main() {
    if (!test_digit_values()) {
        return 1;
    }
    if (!test_digit_rejection()) {
        return 1;
    }
    if (!test_value_digits()) {
        return 1;
    }
    if (!test_base_lookup()) {
        return 1;
    }
    if (!test_error_hierarchy()) {
        return 1;
    }
    std::cout << "digits passed\n";
    return 0;
}
