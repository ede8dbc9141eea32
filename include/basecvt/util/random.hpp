#pragma once

#include <cstddef>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include <basecvt/core/biguint.hpp>
#include <basecvt/core/digits.hpp>

namespace basecvt::util {

inline std::string random_digits(std::mt19937_64& generator, int base, std::size_t count) {
    std::uniform_int_distribution<int> digit_dist(0, base - 1);
    std::string digits;
    digits.reserve(count);
    for (std::size_t index = 0; index < count; ++index) {
        digits.push_back(basecvt::core::value_digit(digit_dist(generator), base));
    }
    return digits;
}

// Numeral text such as "-1A.0F3" with the requested digit counts. The integer
// part is at least "0" so the text is always well formed.
inline std::string random_numeral(std::mt19937_64& generator,
                                  int base,
                                  std::size_t integer_digits,
                                  std::size_t fraction_digits,
                                  bool allow_negative = true) {
    std::string text;
    if (allow_negative) {
        std::bernoulli_distribution sign_dist(0.5);
        if (sign_dist(generator)) {
            text.push_back('-');
        }
    }
    text += integer_digits == 0 ? std::string("0") : random_digits(generator, base, integer_digits);
    if (fraction_digits > 0) {
        text.push_back('.');
        text += random_digits(generator, base, fraction_digits);
    }
    return text;
}

inline basecvt::core::biguint random_biguint(std::mt19937_64& generator, std::size_t limb_count) {
    std::uniform_int_distribution<basecvt::core::biguint::limb_type> limb_dist;
    std::vector<basecvt::core::biguint::limb_type> limbs;
    limbs.reserve(limb_count);
    for (std::size_t index = 0; index < limb_count; ++index) {
        limbs.push_back(limb_dist(generator));
    }
    return basecvt::core::biguint::from_limbs(std::move(limbs));
}

} // namespace basecvt::util
