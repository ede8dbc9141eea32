// include/basecvt/core/biguint.hpp - Arbitrary precision unsigned integer used by both engines.

#pragma once

#include <algorithm>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

namespace basecvt::core {

// Non-negative magnitude stored as little-endian 32-bit limbs. The sign of a
// converted number never reaches this type; it is applied once to the finished
// string.
class biguint {
public:
    using limb_type = std::uint32_t;
    using wide_type = std::uint64_t;
    static constexpr int LIMB_BITS = 32;

    biguint() noexcept = default;
    biguint(const biguint&) = default;
    biguint(biguint&&) noexcept = default;
    biguint& operator=(const biguint&) = default;
    biguint& operator=(biguint&&) noexcept = default;

    template <typename Int, typename = std::enable_if_t<std::is_integral_v<Int>>>
    explicit biguint(Int value) {
        if constexpr (std::is_signed_v<Int>) {
            if (value < 0) {
                throw std::domain_error("biguint cannot hold a negative value");
            }
        }
        auto cursor = static_cast<std::uint64_t>(value);
        while (cursor != 0) {
            limbs_.push_back(static_cast<limb_type>(cursor));
            cursor >>= LIMB_BITS;
        }
    }

    static biguint zero() noexcept { return {}; }
    static biguint one() { return biguint(1); }

    static biguint from_limbs(std::vector<limb_type> limbs) {
        biguint result;
        result.limbs_ = std::move(limbs);
        result.normalize();
        return result;
    }

    // base^exponent by square-and-multiply.
    static biguint power(limb_type base, std::size_t exponent) {
        biguint result = biguint::one();
        biguint square(base);
        while (exponent != 0) {
            if ((exponent & 1U) != 0) {
                result *= square;
            }
            exponent >>= 1U;
            if (exponent != 0) {
                square *= square;
            }
        }
        return result;
    }

    bool is_zero() const noexcept { return limbs_.empty(); }
    std::size_t limb_count() const noexcept { return limbs_.size(); }

    template <typename Int, typename = std::enable_if_t<std::is_integral_v<Int>>>
    explicit operator Int() const {
        constexpr auto max_value = static_cast<std::uint64_t>(std::numeric_limits<Int>::max());
        if (limbs_.size() > 2) {
            throw std::overflow_error("biguint does not fit in target type");
        }
        std::uint64_t value = 0;
        for (std::size_t index = limbs_.size(); index-- > 0;) {
            value = (value << LIMB_BITS) | limbs_[index];
        }
        if (value > max_value) {
            throw std::overflow_error("biguint does not fit in target type");
        }
        return static_cast<Int>(value);
    }

    // this = this * multiplier + addend, the Horner step used when parsing digits.
    biguint& multiply_add_small(limb_type multiplier, limb_type addend = 0) {
        wide_type carry = addend;
        for (auto& limb : limbs_) {
            const wide_type product = static_cast<wide_type>(limb) * multiplier + carry;
            limb = static_cast<limb_type>(product);
            carry = product >> LIMB_BITS;
        }
        if (carry != 0) {
            limbs_.push_back(static_cast<limb_type>(carry));
        }
        normalize();
        return *this;
    }

    std::pair<biguint, limb_type> div_mod_small(limb_type divisor) const {
        if (divisor == 0) {
            throw std::domain_error("division by zero");
        }
        biguint quotient;
        quotient.limbs_.resize(limbs_.size());
        wide_type remainder = 0;
        for (std::size_t index = limbs_.size(); index-- > 0;) {
            const wide_type current = (remainder << LIMB_BITS) | limbs_[index];
            quotient.limbs_[index] = static_cast<limb_type>(current / divisor);
            remainder = current % divisor;
        }
        quotient.normalize();
        return {std::move(quotient), static_cast<limb_type>(remainder)};
    }

    friend std::strong_ordering operator<=>(const biguint& lhs, const biguint& rhs) noexcept {
        return compare_magnitude_vectors(lhs.limbs_, rhs.limbs_);
    }

    friend bool operator==(const biguint& lhs, const biguint& rhs) noexcept {
        return lhs.limbs_ == rhs.limbs_;
    }

    biguint& operator+=(const biguint& other) {
        limbs_ = add_magnitude(limbs_, other.limbs_);
        normalize();
        return *this;
    }

    biguint& operator-=(const biguint& other) {
        if (compare_magnitude_vectors(limbs_, other.limbs_) == std::strong_ordering::less) {
            throw std::domain_error("biguint subtraction would underflow");
        }
        limbs_ = subtract_magnitude(limbs_, other.limbs_);
        normalize();
        return *this;
    }

    biguint& operator*=(const biguint& other) {
        limbs_ = multiply_schoolbook(limbs_, other.limbs_);
        normalize();
        return *this;
    }

    friend biguint operator+(biguint lhs, const biguint& rhs) {
        lhs += rhs;
        return lhs;
    }
    friend biguint operator-(biguint lhs, const biguint& rhs) {
        lhs -= rhs;
        return lhs;
    }
    friend biguint operator*(biguint lhs, const biguint& rhs) {
        lhs *= rhs;
        return lhs;
    }

    static std::pair<biguint, biguint> div_mod(const biguint& dividend, const biguint& divisor) {
        if (divisor.is_zero()) {
            throw std::domain_error("division by zero");
        }
        if (divisor.limbs_.size() == 1) {
            auto [quotient, remainder] = dividend.div_mod_small(divisor.limbs_[0]);
            return {std::move(quotient), biguint(remainder)};
        }
        if (dividend < divisor) {
            return {biguint::zero(), dividend};
        }
        auto [quotient_limbs, remainder_limbs] = divide_magnitude(dividend.limbs_, divisor.limbs_);
        return {from_limbs(std::move(quotient_limbs)), from_limbs(std::move(remainder_limbs))};
    }

private:
    static void normalize_magnitude(std::vector<limb_type>& limbs) {
        while (!limbs.empty() && limbs.back() == 0) {
            limbs.pop_back();
        }
    }

    static std::strong_ordering compare_magnitude_vectors(const std::vector<limb_type>& lhs,
                                                          const std::vector<limb_type>& rhs) noexcept {
        if (lhs.size() != rhs.size()) {
            return lhs.size() < rhs.size() ? std::strong_ordering::less
                                           : std::strong_ordering::greater;
        }
        for (std::size_t index = lhs.size(); index-- > 0;) {
            const auto cmp = lhs[index] <=> rhs[index];
            if (cmp != std::strong_ordering::equal) {
                return cmp;
            }
        }
        return std::strong_ordering::equal;
    }

    static std::vector<limb_type> add_magnitude(const std::vector<limb_type>& lhs,
                                                const std::vector<limb_type>& rhs) {
        const std::size_t max_len = std::max(lhs.size(), rhs.size());
        std::vector<limb_type> result;
        result.reserve(max_len + 1);
        wide_type carry = 0;
        for (std::size_t index = 0; index < max_len; ++index) {
            wide_type sum = carry;
            if (index < lhs.size()) {
                sum += lhs[index];
            }
            if (index < rhs.size()) {
                sum += rhs[index];
            }
            result.push_back(static_cast<limb_type>(sum));
            carry = sum >> LIMB_BITS;
        }
        if (carry != 0) {
            result.push_back(static_cast<limb_type>(carry));
        }
        return result;
    }

    // Requires lhs >= rhs.
    static std::vector<limb_type> subtract_magnitude(const std::vector<limb_type>& lhs,
                                                     const std::vector<limb_type>& rhs) {
        std::vector<limb_type> result;
        result.reserve(lhs.size());
        wide_type borrow = 0;
        for (std::size_t index = 0; index < lhs.size(); ++index) {
            wide_type subtrahend = borrow;
            if (index < rhs.size()) {
                subtrahend += rhs[index];
            }
            const wide_type minuend = lhs[index];
            if (minuend >= subtrahend) {
                result.push_back(static_cast<limb_type>(minuend - subtrahend));
                borrow = 0;
            } else {
                result.push_back(
                    static_cast<limb_type>((minuend + (wide_type{1} << LIMB_BITS)) - subtrahend));
                borrow = 1;
            }
        }
        normalize_magnitude(result);
        return result;
    }

    static std::vector<limb_type> multiply_schoolbook(const std::vector<limb_type>& lhs,
                                                      const std::vector<limb_type>& rhs) {
        if (lhs.empty() || rhs.empty()) {
            return {};
        }
        std::vector<limb_type> result(lhs.size() + rhs.size(), 0);
        for (std::size_t i = 0; i < lhs.size(); ++i) {
            wide_type carry = 0;
            const wide_type lhs_limb = lhs[i];
            for (std::size_t j = 0; j < rhs.size(); ++j) {
                const wide_type product = lhs_limb * rhs[j] + result[i + j] + carry;
                result[i + j] = static_cast<limb_type>(product);
                carry = product >> LIMB_BITS;
            }
            std::size_t position = i + rhs.size();
            while (carry != 0) {
                const wide_type sum = static_cast<wide_type>(result[position]) + carry;
                result[position] = static_cast<limb_type>(sum);
                carry = sum >> LIMB_BITS;
                ++position;
            }
        }
        normalize_magnitude(result);
        return result;
    }

    // Binary long division over doubled multiples of the divisor. Quotients in
    // this library are small (a single target digit), so the table stays short.
    static std::pair<std::vector<limb_type>, std::vector<limb_type>>
    divide_magnitude(std::vector<limb_type> dividend, const std::vector<limb_type>& divisor) {
        normalize_magnitude(dividend);
        std::vector<limb_type> divisor_limbs = divisor;
        normalize_magnitude(divisor_limbs);
        if (divisor_limbs.empty()) {
            throw std::domain_error("division by zero");
        }
        if (dividend.empty()) {
            return {{}, {}};
        }
        std::vector<std::vector<limb_type>> scaled;
        std::vector<std::vector<limb_type>> multiples;
        scaled.push_back(divisor_limbs);
        multiples.push_back(std::vector<limb_type>{1});
        while (true) {
            auto next_scaled = add_magnitude(scaled.back(), scaled.back());
            if (compare_magnitude_vectors(next_scaled, dividend) == std::strong_ordering::greater) {
                break;
            }
            scaled.push_back(std::move(next_scaled));
            multiples.push_back(add_magnitude(multiples.back(), multiples.back()));
        }
        std::vector<limb_type> quotient;
        std::vector<limb_type> remainder = std::move(dividend);
        for (std::size_t index = scaled.size(); index-- > 0;) {
            if (compare_magnitude_vectors(remainder, scaled[index]) != std::strong_ordering::less) {
                remainder = subtract_magnitude(remainder, scaled[index]);
                quotient = add_magnitude(quotient, multiples[index]);
            }
        }
        normalize_magnitude(quotient);
        normalize_magnitude(remainder);
        return {quotient, remainder};
    }

    void normalize() { normalize_magnitude(limbs_); }

    std::vector<limb_type> limbs_;
};

} // namespace basecvt::core
