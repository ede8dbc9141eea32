// include/basecvt/validate.hpp - Range and digit checks shared by the parser and the facade.

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include <basecvt/core/digits.hpp>
#include <basecvt/errors.hpp>

namespace basecvt {

inline constexpr int MIN_PRECISION = 1;
inline constexpr int MAX_PRECISION = 100;

inline void validate_base(int base) {
    if (!core::is_supported_base(base)) {
        throw UnsupportedBaseError(base);
    }
}

inline void validate_precision(long long precision) {
    if (precision < MIN_PRECISION || precision > MAX_PRECISION) {
        throw PrecisionRangeError(precision);
    }
}

// Every character must be a digit of `base`. Letters and digits that fall
// outside the base are digit errors; anything else is a format error.
// `offset` is added to reported positions so they index the caller's text.
inline void validate_digits(std::string_view digits, int base, std::size_t offset = 0) {
    for (std::size_t index = 0; index < digits.size(); ++index) {
        const char ch = digits[index];
        const int value = core::alphanumeric_value(ch);
        if (value < 0) {
            throw InvalidFormatError("illegal character '" + std::string(1, ch) +
                                     "' at position " + std::to_string(offset + index));
        }
        if (value >= base) {
            throw InvalidDigitError(ch, base, offset + index);
        }
    }
}

} // namespace basecvt
