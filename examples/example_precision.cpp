#include <iostream>
#include <string_view>

#include <basecvt/basecvt.hpp>

int main() {
    const std::string_view pi_literal(
        " 3.1415926535897932384626433832795028841971693993751058209749445923078164062862089986280348253421170679 ");
    basecvt::ConverterOptions options;
    options.default_precision = 100;
    options.fraction_format = basecvt::io::FractionFormat::trimmed;
    const basecvt::BaseConverter converter(options);

    std::cout << "pi (hex, 60 digits)  = " << converter.decimal_to_hex(pi_literal, 60) << '\n';
    std::cout << "pi (hex, 100 digits) = " << converter.decimal_to_hex(pi_literal) << '\n';
    std::cout << "0.1 (binary, 40 digits) = " << converter.decimal_to_binary("0.1", 40) << '\n';
    std::cout << "0x0.0001 (decimal) = " << converter.hex_to_decimal("0x0.0001") << '\n';
    std::cout << "1e50 (hex) = " << converter.decimal_to_hex("1e50") << '\n';
    std::cout << "Every digit above comes from exact rational arithmetic; none is rounded\n";
    return 0;
}
