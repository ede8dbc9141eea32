#pragma once

#include <ostream>

#include <basecvt/core/biguint.hpp>
#include <basecvt/core/fraction.hpp>
#include <basecvt/io/format.hpp>
#include <basecvt/numeral.hpp>

namespace basecvt::util {

inline std::ostream& dump(std::ostream& os, const basecvt::core::biguint& value) {
    return os << "biguint(" << basecvt::io::to_string(value) << ", limbs=" << value.limb_count()
              << ')';
}

inline std::ostream& dump(std::ostream& os, const basecvt::ExactFraction& value) {
    return os << "fraction(" << basecvt::io::to_string(value.numerator()) << " / "
              << basecvt::io::to_string(value.denominator()) << ')';
}

inline std::ostream& dump(std::ostream& os, const basecvt::ParsedNumber& value) {
    return os << "numeral(base=" << value.base() << ", sign=" << value.sign() << ", integer=\""
              << value.integer_digits() << "\", fraction=\"" << value.fraction_digits() << "\")";
}

} // namespace basecvt::util
