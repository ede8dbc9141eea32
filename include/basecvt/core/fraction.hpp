// include/basecvt/core/fraction.hpp - Exact fractional value carried between bases.

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <basecvt/core/biguint.hpp>
#include <basecvt/core/digits.hpp>
#include <basecvt/core/integer.hpp>

namespace basecvt {

// A value in [0, 1) held as numerator / source_base^n, both exact integers.
class ExactFraction {
public:
    ExactFraction() : denominator_(core::biguint::one()) {}

    ExactFraction(core::biguint numerator, core::biguint denominator)
        : numerator_(std::move(numerator)), denominator_(std::move(denominator)) {
        if (denominator_.is_zero()) {
            throw std::domain_error("fraction denominator must be non-zero");
        }
        if (!(numerator_ < denominator_)) {
            throw std::domain_error("fraction must lie in [0, 1)");
        }
    }

    static ExactFraction zero() { return {}; }

    // Sum of digit_i * base^-(i+1). Horner's rule over the digit string gives
    // the numerator of that sum over base^n directly.
    static ExactFraction from_digits(std::string_view digits, int base) {
        if (digits.empty()) {
            return zero();
        }
        core::biguint numerator = core::parse_magnitude(digits, base);
        core::biguint denominator =
            core::biguint::power(static_cast<core::biguint::limb_type>(base), digits.size());
        return ExactFraction(std::move(numerator), std::move(denominator));
    }

    const core::biguint& numerator() const noexcept { return numerator_; }
    const core::biguint& denominator() const noexcept { return denominator_; }
    bool is_zero() const noexcept { return numerator_.is_zero(); }

    // Exactly `precision` digits in `base`, truncated rather than rounded. The
    // loop stops as soon as the remainder is exactly zero; the digits it did not
    // produce are zeros and are filled in afterwards.
    std::string expand(int base, int precision) const {
        std::string digits;
        if (precision <= 0) {
            return digits;
        }
        digits.reserve(static_cast<std::size_t>(precision));
        core::biguint current = numerator_;
        for (int position = 0; position < precision && !current.is_zero(); ++position) {
            current.multiply_add_small(static_cast<core::biguint::limb_type>(base));
            auto [digit, remainder] = core::biguint::div_mod(current, denominator_);
            digits.push_back(core::value_digit(static_cast<int>(digit), base));
            current = std::move(remainder);
        }
        digits.resize(static_cast<std::size_t>(precision), '0');
        return digits;
    }

    friend bool operator==(const ExactFraction& lhs, const ExactFraction& rhs) {
        return lhs.numerator_ * rhs.denominator_ == rhs.numerator_ * lhs.denominator_;
    }

private:
    core::biguint numerator_;
    core::biguint denominator_;
};

} // namespace basecvt
