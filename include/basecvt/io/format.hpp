// include/basecvt/io/format.hpp - Rendering of converted parts into the result string.

#pragma once

#include <string>

#include <basecvt/core/biguint.hpp>
#include <basecvt/core/integer.hpp>

namespace basecvt::io {

enum class FractionFormat {
    // The fraction always carries exactly the requested number of digits.
    fixed,
    // Trailing zero digits are dropped and an all-zero fraction is omitted.
    trimmed,
};

// Joins the converted integer and fraction digits. A result whose digits are
// all zero never carries a sign.
inline std::string format_result(bool negative,
                                 const std::string& integer_part,
                                 std::string fraction_part,
                                 FractionFormat format) {
    if (format == FractionFormat::trimmed) {
        const auto last_nonzero = fraction_part.find_last_not_of('0');
        fraction_part.resize(last_nonzero == std::string::npos ? 0 : last_nonzero + 1);
    }
    const bool zero = integer_part.find_first_not_of('0') == std::string::npos &&
                      fraction_part.find_first_not_of('0') == std::string::npos;
    std::string result;
    result.reserve(integer_part.size() + fraction_part.size() + 2);
    if (negative && !zero) {
        result.push_back('-');
    }
    result += integer_part.empty() ? std::string("0") : integer_part;
    if (!fraction_part.empty()) {
        result.push_back('.');
        result += fraction_part;
    }
    return result;
}

inline std::string to_string(const core::biguint& value, int base = 10) {
    return core::to_digits(value, base);
}

} // namespace basecvt::io
