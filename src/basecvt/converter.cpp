// src/basecvt/converter.cpp - BaseConverter conversion pipeline.

#include <basecvt/converter.hpp>

#include <stdexcept>
#include <string>
#include <utility>

#include <basecvt/core/fraction.hpp>
#include <basecvt/core/integer.hpp>

namespace basecvt {

BaseConverter::BaseConverter(int default_precision)
    : BaseConverter(ConverterOptions{default_precision}) {}

BaseConverter::BaseConverter(const ConverterOptions& options) : options_(options) {
    validate_precision(options_.default_precision);
    if (options_.max_input_length == 0) {
        throw std::invalid_argument("max_input_length must be positive");
    }
    if (options_.max_exponent < 0 || options_.max_exponent > io::MAX_EXPONENT_LIMIT) {
        throw std::invalid_argument("max_exponent must be between 0 and " +
                                    std::to_string(io::MAX_EXPONENT_LIMIT));
    }
}

int BaseConverter::resolve_precision(std::optional<int> precision) const {
    if (!precision) {
        return options_.default_precision;
    }
    validate_precision(*precision);
    return *precision;
}

io::ParseLimits BaseConverter::limits() const noexcept {
    return io::ParseLimits{options_.max_input_length, options_.max_exponent};
}

ParsedNumber BaseConverter::parse(std::string_view value, int base) const {
    return io::parse_numeral(value, base, limits());
}

std::string BaseConverter::convert(std::string_view value,
                                   int from_base,
                                   int to_base,
                                   std::optional<int> precision) const {
    validate_base(from_base);
    validate_base(to_base);
    const int digits = resolve_precision(precision);
    return convert(parse(value, from_base), to_base, digits);
}

std::string BaseConverter::convert(const ParsedNumber& number,
                                   int to_base,
                                   std::optional<int> precision) const {
    validate_base(number.base());
    validate_base(to_base);
    const int digits = resolve_precision(precision);

    std::string integer_part =
        core::convert_integer_digits(number.integer_digits(), number.base(), to_base);
    const ExactFraction fraction = ExactFraction::from_digits(number.fraction_digits(), number.base());
    std::string fraction_part = fraction.expand(to_base, digits);

    return io::format_result(number.is_negative(), integer_part, std::move(fraction_part),
                             options_.fraction_format);
}

} // namespace basecvt
