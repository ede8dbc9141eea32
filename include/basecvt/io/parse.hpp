// include/basecvt/io/parse.hpp - Input normalizer: numeral text to ParsedNumber.

#pragma once

#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

#include <basecvt/core/digits.hpp>
#include <basecvt/errors.hpp>
#include <basecvt/numeral.hpp>
#include <basecvt/validate.hpp>

namespace basecvt::io {

inline constexpr std::size_t DEFAULT_MAX_INPUT_LENGTH = 4096;
inline constexpr long long DEFAULT_MAX_EXPONENT = 10000;
inline constexpr long long MAX_EXPONENT_LIMIT = 1000000;

template <typename T>
inline constexpr bool is_character_v =
    std::is_same_v<std::remove_cv_t<T>, char> || std::is_same_v<std::remove_cv_t<T>, wchar_t> ||
    std::is_same_v<std::remove_cv_t<T>, char8_t> || std::is_same_v<std::remove_cv_t<T>, char16_t> ||
    std::is_same_v<std::remove_cv_t<T>, char32_t>;

// Native values read as numbers. Booleans and character types are not numbers.
template <typename T>
inline constexpr bool is_numeric_input_v = std::is_arithmetic_v<T> &&
                                           !std::is_same_v<std::remove_cv_t<T>, bool> &&
                                           !is_character_v<T>;

struct ParseLimits {
    std::size_t max_input_length = DEFAULT_MAX_INPUT_LENGTH;
    long long max_exponent = DEFAULT_MAX_EXPONENT;
};

inline std::string_view trim(std::string_view text) noexcept {
    const auto is_whitespace = [](char ch) {
        return std::isspace(static_cast<unsigned char>(ch));
    };
    std::size_t start = 0;
    while (start < text.size() && is_whitespace(text[start])) {
        ++start;
    }
    std::size_t end = text.size();
    while (end > start && is_whitespace(text[end - 1])) {
        --end;
    }
    return text.substr(start, end - start);
}

namespace detail {

    inline bool is_sign(char ch) noexcept { return ch == '+' || ch == '-'; }

    inline bool all_decimal_digits(std::string_view text) noexcept {
        for (char ch : text) {
            if (ch < '0' || ch > '9') {
                return false;
            }
        }
        return true;
    }

    // In hex text 'E' is a digit, so only an 'e'/'E' directly followed by an
    // exponent sign is read as an attempt at scientific notation.
    inline bool has_signed_exponent(std::string_view text) noexcept {
        for (std::size_t index = 0; index + 1 < text.size(); ++index) {
            if ((text[index] == 'e' || text[index] == 'E') && is_sign(text[index + 1])) {
                return true;
            }
        }
        return false;
    }

} // namespace detail

// Rewrites decimal scientific notation as plain fixed-point text by moving the
// radix point over the mantissa digits; no floating point is involved, so
// "1e50" becomes a 51-digit integer exactly. Text without an exponent marker is
// returned unchanged.
inline std::string expand_scientific(std::string_view text,
                                     long long max_exponent = DEFAULT_MAX_EXPONENT) {
    if (max_exponent < 0 || max_exponent > MAX_EXPONENT_LIMIT) {
        throw std::invalid_argument("max_exponent must be between 0 and " +
                                    std::to_string(MAX_EXPONENT_LIMIT));
    }
    const auto marker = text.find_first_of("eE");
    if (marker == std::string_view::npos) {
        return std::string(text);
    }
    std::string_view mantissa = text.substr(0, marker);
    std::string_view exponent_text = text.substr(marker + 1);

    bool negative = false;
    if (!mantissa.empty() && detail::is_sign(mantissa.front())) {
        negative = (mantissa.front() == '-');
        mantissa.remove_prefix(1);
    }
    const auto point = mantissa.find('.');
    const std::string_view integer_part = mantissa.substr(0, point);
    const std::string_view fraction_part =
        point == std::string_view::npos ? std::string_view{} : mantissa.substr(point + 1);
    if (integer_part.empty() && fraction_part.empty()) {
        throw ScientificNotationError("scientific notation mantissa has no digits in '" +
                                      std::string(text) + "'");
    }
    if (!detail::all_decimal_digits(integer_part) || !detail::all_decimal_digits(fraction_part)) {
        throw ScientificNotationError("malformed scientific notation mantissa in '" +
                                      std::string(text) + "'");
    }

    bool exponent_negative = false;
    if (!exponent_text.empty() && detail::is_sign(exponent_text.front())) {
        exponent_negative = (exponent_text.front() == '-');
        exponent_text.remove_prefix(1);
    }
    if (exponent_text.empty()) {
        throw ScientificNotationError("scientific notation exponent has no digits in '" +
                                      std::string(text) + "'");
    }
    long long exponent = 0;
    for (char ch : exponent_text) {
        if (ch < '0' || ch > '9') {
            throw ScientificNotationError("scientific notation exponent must be an integer in '" +
                                          std::string(text) + "'");
        }
        const int digit = ch - '0';
        // exponent * 10 + digit > max_exponent, tested without overflow
        if (exponent > max_exponent / 10 ||
            (exponent == max_exponent / 10 && digit > max_exponent % 10)) {
            throw ScientificNotationError("scientific notation exponent exceeds " +
                                          std::to_string(max_exponent));
        }
        exponent = exponent * 10 + digit;
    }
    if (exponent_negative) {
        exponent = -exponent;
    }

    std::string digits(integer_part);
    digits.append(fraction_part);
    const long long total = static_cast<long long>(digits.size());
    const long long point_position = static_cast<long long>(integer_part.size()) + exponent;

    std::string whole;
    std::string fraction;
    if (point_position <= 0) {
        whole = "0";
        fraction.assign(static_cast<std::size_t>(-point_position), '0');
        fraction += digits;
    } else if (point_position >= total) {
        whole = digits;
        whole.append(static_cast<std::size_t>(point_position - total), '0');
    } else {
        whole = digits.substr(0, static_cast<std::size_t>(point_position));
        fraction = digits.substr(static_cast<std::size_t>(point_position));
    }

    const auto first_nonzero = whole.find_first_not_of('0');
    whole = first_nonzero == std::string::npos ? std::string("0") : whole.substr(first_nonzero);
    const auto last_nonzero = fraction.find_last_not_of('0');
    fraction.resize(last_nonzero == std::string::npos ? 0 : last_nonzero + 1);

    std::string result;
    if (negative) {
        result.push_back('-');
    }
    result += whole;
    if (!fraction.empty()) {
        result.push_back('.');
        result += fraction;
    }
    return result;
}

// Splits numeral text into sign, integer digits and fraction digits, checking
// every character against `base`. Hex letters are stored upper-case.
inline ParsedNumber parse_numeral(std::string_view text, int base, const ParseLimits& limits = {}) {
    validate_base(base);
    if (text.size() > limits.max_input_length) {
        throw InvalidFormatError("input exceeds " + std::to_string(limits.max_input_length) +
                                 " characters");
    }
    const std::string_view trimmed = trim(text);
    if (trimmed.empty()) {
        throw InvalidFormatError("empty input");
    }

    std::string_view body = trimmed;
    std::size_t offset = 0;
    bool negative = false;
    bool has_sign = false;
    if (detail::is_sign(body.front())) {
        negative = (body.front() == '-');
        has_sign = true;
        body.remove_prefix(1);
        ++offset;
    }

    std::string expanded;
    if (body.find_first_of("eE") != std::string_view::npos) {
        if (base == 10) {
            expanded = expand_scientific(body, limits.max_exponent);
            body = expanded;
        } else if (base != 16 || detail::has_signed_exponent(body)) {
            throw ScientificNotationError("scientific notation is only supported for decimal input, "
                                          "got base " + std::to_string(base));
        }
    }

    const char letter = core::prefix_letter(base);
    if (letter != '\0' && body.size() >= 2 && body[0] == '0' &&
        std::tolower(static_cast<unsigned char>(body[1])) == letter) {
        body.remove_prefix(2);
        offset += 2;
    }
    if (!body.empty() && detail::is_sign(body.front())) {
        if (has_sign) {
            throw InvalidFormatError("repeated sign in '" + std::string(trimmed) + "'");
        }
        negative = (body.front() == '-');
        body.remove_prefix(1);
        ++offset;
    }

    const auto point = body.find('.');
    if (point != std::string_view::npos && body.find('.', point + 1) != std::string_view::npos) {
        throw InvalidFormatError("multiple radix points in '" + std::string(trimmed) + "'");
    }
    const std::string_view integer_text = body.substr(0, point);
    const std::string_view fraction_text =
        point == std::string_view::npos ? std::string_view{} : body.substr(point + 1);
    if (integer_text.empty() && fraction_text.empty()) {
        throw InvalidFormatError("no digits in '" + std::string(trimmed) + "'");
    }
    validate_digits(integer_text, base, offset);
    validate_digits(fraction_text, base, offset + integer_text.size() + 1);

    const auto canonical = [](std::string_view digits) {
        std::string result(digits);
        for (char& ch : result) {
            ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
        }
        return result;
    };
    return ParsedNumber(negative, canonical(integer_text), canonical(fraction_text), base);
}

inline void validate_input(std::string_view text, int base, const ParseLimits& limits = {}) {
    parse_numeral(text, base, limits);
}

// Decimal text for a native number: integers exactly, floating values as the
// shortest text that reads back to the same value.
template <typename Number,
          typename = std::enable_if_t<is_numeric_input_v<Number>>>
std::string number_to_text(Number value) {
    if constexpr (std::is_floating_point_v<Number>) {
        if (!std::isfinite(value)) {
            throw InvalidFormatError("numeric input must be finite");
        }
    }
    std::array<char, 64> buffer{};
    const auto [end, error] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
    if (error != std::errc{}) {
        throw InvalidFormatError("numeric input could not be rendered as text");
    }
    return std::string(buffer.data(), end);
}

inline std::string normalize_input(std::string_view text, int base, const ParseLimits& limits = {}) {
    return parse_numeral(text, base, limits).to_string();
}

template <typename Number,
          typename = std::enable_if_t<is_numeric_input_v<Number>>>
std::string normalize_input(Number value, int base) {
    validate_base(base);
    if (base != 10) {
        throw InvalidFormatError("numeric input is only supported for decimal (base 10), got base " +
                                 std::to_string(base));
    }
    return normalize_input(number_to_text(value), base);
}

} // namespace basecvt::io
