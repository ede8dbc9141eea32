// include/basecvt/numeral.hpp - Canonical sign/integer/fraction decomposition of a numeral.

#pragma once

#include <string>
#include <utility>

namespace basecvt {

class ParsedNumber {
public:
    ParsedNumber() = default;
    ParsedNumber(bool negative, std::string integer_digits, std::string fraction_digits, int base)
        : negative_(negative),
          integer_digits_(std::move(integer_digits)),
          fraction_digits_(std::move(fraction_digits)),
          base_(base) {}

    int sign() const noexcept { return negative_ ? -1 : 1; }
    bool is_negative() const noexcept { return negative_; }
    // Most-significant first; empty means zero.
    const std::string& integer_digits() const noexcept { return integer_digits_; }
    // Most-significant first; empty when the numeral has no fraction.
    const std::string& fraction_digits() const noexcept { return fraction_digits_; }
    int base() const noexcept { return base_; }

    // Plain text form: sign, integer digits ("0" when empty), then the fraction
    // when present. No prefix, no exponent.
    std::string to_string() const {
        std::string text;
        if (negative_) {
            text.push_back('-');
        }
        text += integer_digits_.empty() ? std::string("0") : integer_digits_;
        if (!fraction_digits_.empty()) {
            text.push_back('.');
            text += fraction_digits_;
        }
        return text;
    }

    friend bool operator==(const ParsedNumber&, const ParsedNumber&) = default;

private:
    bool negative_ = false;
    std::string integer_digits_;
    std::string fraction_digits_;
    int base_ = 10;
};

} // namespace basecvt
