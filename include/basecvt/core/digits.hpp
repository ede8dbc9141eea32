// include/basecvt/core/digits.hpp - Digit alphabet and per-base lookup data.

#pragma once

#include <array>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

#include <basecvt/errors.hpp>

namespace basecvt::core {

inline constexpr std::array<int, 4> SUPPORTED_BASES = {2, 8, 10, 16};

inline constexpr std::array<char, 16> DIGITS = {'0', '1', '2', '3', '4', '5', '6', '7',
                                                '8', '9', 'A', 'B', 'C', 'D', 'E', 'F'};

constexpr bool is_supported_base(int base) noexcept {
    for (int supported : SUPPORTED_BASES) {
        if (supported == base) {
            return true;
        }
    }
    return false;
}

// Raw value of an alphanumeric character, independent of any base: '0'..'9' map
// to 0..9 and letters map to 10 upwards ('G' is 16, 'Z' is 35). Returns -1 for
// anything that is not a digit or an ASCII letter.
constexpr int alphanumeric_value(char ch) noexcept {
    if (ch >= '0' && ch <= '9') {
        return ch - '0';
    }
    if (ch >= 'a' && ch <= 'z') {
        return 10 + (ch - 'a');
    }
    if (ch >= 'A' && ch <= 'Z') {
        return 10 + (ch - 'A');
    }
    return -1;
}

inline int digit_value(char ch, int base, std::size_t position = InvalidDigitError::npos) {
    const int value = alphanumeric_value(ch);
    if (value < 0 || value >= base) {
        throw InvalidDigitError(ch, base, position);
    }
    return value;
}

inline char value_digit(int value, int base) {
    if (value < 0 || value >= base || value >= static_cast<int>(DIGITS.size())) {
        throw std::out_of_range("digit value " + std::to_string(value) +
                                " out of range for base " + std::to_string(base));
    }
    return DIGITS[static_cast<std::size_t>(value)];
}

// Lower-case letter that follows '0' in the optional prefix, or '\0' when the
// base has none.
constexpr char prefix_letter(int base) noexcept {
    switch (base) {
    case 2:
        return 'b';
    case 8:
        return 'o';
    case 16:
        return 'x';
    default:
        return '\0';
    }
}

inline std::string_view base_prefix(int base) noexcept {
    switch (base) {
    case 2:
        return "0b";
    case 8:
        return "0o";
    case 16:
        return "0x";
    default:
        return {};
    }
}

inline std::string_view base_name(int base) {
    switch (base) {
    case 2:
        return "binary";
    case 8:
        return "octal";
    case 10:
        return "decimal";
    case 16:
        return "hexadecimal";
    default:
        throw UnsupportedBaseError(base);
    }
}

} // namespace basecvt::core
