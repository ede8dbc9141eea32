// include/basecvt/core/integer.hpp - Exact conversion of the integer part between bases.

#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include <basecvt/core/biguint.hpp>
#include <basecvt/core/digits.hpp>

namespace basecvt::core {

namespace detail {

    // Largest digit count whose base power still fits in a single limb.
    constexpr int chunk_digits(int base) noexcept {
        std::uint64_t power = 1;
        int count = 0;
        while (power * static_cast<std::uint64_t>(base) <= 0xFFFFFFFFull) {
            power *= static_cast<std::uint64_t>(base);
            ++count;
        }
        return count;
    }

    constexpr biguint::limb_type chunk_power(int base, int digits) noexcept {
        std::uint64_t power = 1;
        for (int index = 0; index < digits; ++index) {
            power *= static_cast<std::uint64_t>(base);
        }
        return static_cast<biguint::limb_type>(power);
    }

} // namespace detail

// Parses most-significant-first digits in `base`. Digits are consumed in
// limb-sized chunks so each chunk costs one multiply-add over the magnitude.
inline biguint parse_magnitude(std::string_view digits, int base) {
    const int chunk = detail::chunk_digits(base);
    biguint accumulator;
    std::size_t pos = 0;
    const std::size_t total = digits.size();
    while (pos < total) {
        const std::size_t remaining = total - pos;
        const int chunk_len = static_cast<int>(std::min<std::size_t>(remaining, chunk));
        biguint::limb_type chunk_value = 0;
        for (int offset = 0; offset < chunk_len; ++offset) {
            const std::size_t position = pos + static_cast<std::size_t>(offset);
            chunk_value = chunk_value * static_cast<biguint::limb_type>(base) +
                          static_cast<biguint::limb_type>(digit_value(digits[position], base, position));
        }
        accumulator.multiply_add_small(detail::chunk_power(base, chunk_len), chunk_value);
        pos += static_cast<std::size_t>(chunk_len);
    }
    return accumulator;
}

// Most-significant-first digits of `value` in `base`; zero renders as "0".
inline std::string to_digits(const biguint& value, int base) {
    if (value.is_zero()) {
        return "0";
    }
    const int chunk = detail::chunk_digits(base);
    const biguint::limb_type divisor = detail::chunk_power(base, chunk);
    biguint cursor = value;
    std::string digits;
    while (!cursor.is_zero()) {
        auto [quotient, remainder] = cursor.div_mod_small(divisor);
        cursor = std::move(quotient);
        for (int emitted = 0; emitted < chunk; ++emitted) {
            if (cursor.is_zero() && remainder == 0) {
                break;
            }
            const auto radix = static_cast<biguint::limb_type>(base);
            digits.push_back(value_digit(static_cast<int>(remainder % radix), base));
            remainder /= radix;
        }
    }
    std::reverse(digits.begin(), digits.end());
    return digits;
}

// Integer engine: an empty or all-zero digit string converts to "0".
inline std::string convert_integer_digits(std::string_view digits, int from_base, int to_base) {
    const auto first_nonzero = digits.find_first_not_of('0');
    if (first_nonzero == std::string_view::npos) {
        return "0";
    }
    if (from_base == to_base) {
        std::string same;
        same.reserve(digits.size() - first_nonzero);
        for (std::size_t position = first_nonzero; position < digits.size(); ++position) {
            same.push_back(value_digit(digit_value(digits[position], from_base, position), to_base));
        }
        return same;
    }
    return to_digits(parse_magnitude(digits, from_base), to_base);
}

} // namespace basecvt::core
