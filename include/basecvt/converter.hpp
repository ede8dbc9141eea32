// include/basecvt/converter.hpp - BaseConverter facade over the parsing and conversion engines.

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

#include <basecvt/errors.hpp>
#include <basecvt/io/format.hpp>
#include <basecvt/io/parse.hpp>
#include <basecvt/numeral.hpp>
#include <basecvt/validate.hpp>

namespace basecvt {

inline constexpr int DEFAULT_PRECISION = 10;

struct ConverterOptions {
    int default_precision = DEFAULT_PRECISION;
    io::FractionFormat fraction_format = io::FractionFormat::fixed;
    std::size_t max_input_length = io::DEFAULT_MAX_INPUT_LENGTH;
    long long max_exponent = io::DEFAULT_MAX_EXPONENT;
};

// Text, or a native number read as decimal. A lone character is neither.
template <typename Value>
inline constexpr bool is_conversion_input_v =
    io::is_numeric_input_v<Value> || std::is_convertible_v<const Value&, std::string_view>;

// Converts numerals between bases 2, 8, 10 and 16. Instances hold only the
// options they were built with and never change afterwards, so one converter
// can serve any number of threads.
//
// The fraction is carried between bases as an exact rational, so a conversion
// between two non-decimal bases never passes through a rounded decimal string.
// Digits beyond the requested precision are truncated, not rounded.
class BaseConverter {
public:
    explicit BaseConverter(int default_precision = DEFAULT_PRECISION);
    explicit BaseConverter(const ConverterOptions& options);

    int default_precision() const noexcept { return options_.default_precision; }
    const ConverterOptions& options() const noexcept { return options_; }

    std::string convert(std::string_view value,
                        int from_base,
                        int to_base,
                        std::optional<int> precision = std::nullopt) const;

    // Native numbers are only accepted as decimal input: a numeric literal
    // carries no information about the base its digits were meant in.
    template <typename Number, typename = std::enable_if_t<io::is_numeric_input_v<Number>>>
    std::string convert(Number value,
                        int from_base,
                        int to_base,
                        std::optional<int> precision = std::nullopt) const {
        validate_base(from_base);
        validate_base(to_base);
        if (from_base != 10) {
            throw InvalidFormatError("numeric input is only supported for decimal (base 10), got base " +
                                     std::to_string(from_base));
        }
        return convert(std::string_view(io::number_to_text(value)), from_base, to_base, precision);
    }

    // Converts an already parsed numeral; the source base is the one it was
    // parsed in.
    std::string convert(const ParsedNumber& number,
                        int to_base,
                        std::optional<int> precision = std::nullopt) const;

    ParsedNumber parse(std::string_view value, int base) const;

    template <typename Value, typename = std::enable_if_t<is_conversion_input_v<Value>>>
    std::string decimal_to_binary(const Value& value, std::optional<int> precision = std::nullopt) const {
        return convert(value, 10, 2, precision);
    }
    template <typename Value, typename = std::enable_if_t<is_conversion_input_v<Value>>>
    std::string decimal_to_octal(const Value& value, std::optional<int> precision = std::nullopt) const {
        return convert(value, 10, 8, precision);
    }
    template <typename Value, typename = std::enable_if_t<is_conversion_input_v<Value>>>
    std::string decimal_to_hex(const Value& value, std::optional<int> precision = std::nullopt) const {
        return convert(value, 10, 16, precision);
    }

    template <typename Value, typename = std::enable_if_t<is_conversion_input_v<Value>>>
    std::string binary_to_decimal(const Value& value, std::optional<int> precision = std::nullopt) const {
        return convert(value, 2, 10, precision);
    }
    template <typename Value, typename = std::enable_if_t<is_conversion_input_v<Value>>>
    std::string binary_to_octal(const Value& value, std::optional<int> precision = std::nullopt) const {
        return convert(value, 2, 8, precision);
    }
    template <typename Value, typename = std::enable_if_t<is_conversion_input_v<Value>>>
    std::string binary_to_hex(const Value& value, std::optional<int> precision = std::nullopt) const {
        return convert(value, 2, 16, precision);
    }

    template <typename Value, typename = std::enable_if_t<is_conversion_input_v<Value>>>
    std::string octal_to_decimal(const Value& value, std::optional<int> precision = std::nullopt) const {
        return convert(value, 8, 10, precision);
    }
    template <typename Value, typename = std::enable_if_t<is_conversion_input_v<Value>>>
    std::string octal_to_binary(const Value& value, std::optional<int> precision = std::nullopt) const {
        return convert(value, 8, 2, precision);
    }
    template <typename Value, typename = std::enable_if_t<is_conversion_input_v<Value>>>
    std::string octal_to_hex(const Value& value, std::optional<int> precision = std::nullopt) const {
        return convert(value, 8, 16, precision);
    }

    template <typename Value, typename = std::enable_if_t<is_conversion_input_v<Value>>>
    std::string hex_to_decimal(const Value& value, std::optional<int> precision = std::nullopt) const {
        return convert(value, 16, 10, precision);
    }
    template <typename Value, typename = std::enable_if_t<is_conversion_input_v<Value>>>
    std::string hex_to_binary(const Value& value, std::optional<int> precision = std::nullopt) const {
        return convert(value, 16, 2, precision);
    }
    template <typename Value, typename = std::enable_if_t<is_conversion_input_v<Value>>>
    std::string hex_to_octal(const Value& value, std::optional<int> precision = std::nullopt) const {
        return convert(value, 16, 8, precision);
    }

private:
    int resolve_precision(std::optional<int> precision) const;
    io::ParseLimits limits() const noexcept;

    ConverterOptions options_;
};

} // namespace basecvt
