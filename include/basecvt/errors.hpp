// include/basecvt/errors.hpp - Exception hierarchy raised by the conversion API.

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace basecvt {

// Root of every failure the conversion API reports. Callers may catch this
// broadly or one of the subtypes below.
class ConversionError : public std::invalid_argument {
public:
    explicit ConversionError(const std::string& message) : std::invalid_argument(message) {}
};

class InvalidFormatError : public ConversionError {
public:
    explicit InvalidFormatError(const std::string& message) : ConversionError(message) {}
};

class InvalidDigitError : public ConversionError {
public:
    static constexpr std::size_t npos = static_cast<std::size_t>(-1);

    InvalidDigitError(char digit, int base, std::size_t position = npos)
        : ConversionError(describe(digit, base, position)),
          digit_(digit),
          base_(base),
          position_(position) {}

    char digit() const noexcept { return digit_; }
    int base() const noexcept { return base_; }
    std::size_t position() const noexcept { return position_; }

private:
    static std::string describe(char digit, int base, std::size_t position) {
        std::string message = "invalid digit '";
        message.push_back(digit);
        message += "' for base " + std::to_string(base);
        if (position != npos) {
            message += " at position " + std::to_string(position);
        }
        return message;
    }

    char digit_;
    int base_;
    std::size_t position_;
};

class PrecisionRangeError : public ConversionError {
public:
    explicit PrecisionRangeError(long long precision)
        : ConversionError("precision must be an integer between 1 and 100, got " +
                          std::to_string(precision)),
          precision_(precision) {}

    long long precision() const noexcept { return precision_; }

private:
    long long precision_;
};

class UnsupportedBaseError : public ConversionError {
public:
    explicit UnsupportedBaseError(int base)
        : ConversionError("unsupported base " + std::to_string(base) +
                          "; supported bases are 2, 8, 10, 16"),
          base_(base) {}

    int base() const noexcept { return base_; }

private:
    int base_;
};

class ScientificNotationError : public ConversionError {
public:
    explicit ScientificNotationError(const std::string& message) : ConversionError(message) {}
};

} // namespace basecvt
