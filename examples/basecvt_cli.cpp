// examples/basecvt_cli.cpp - Command-line front end for BaseConverter.

#include <iostream>
#include <string>
#include <vector>

#include <basecvt/basecvt.hpp>

#include "cli_options.hpp"

namespace po = boost::program_options;

namespace {

void write_usage(const std::string& binary, const po::options_description& visible, std::ostream* out) {
    (*out) << "Usage: " << binary << " <number> [options]\n"
           << "Convert numbers between bases 2, 8, 10 and 16\n\n"
           << visible << "\n"
           << "Example: " << binary << " 3.14159 -f 10 -t 16 -p 6\n";
}

} // namespace

int main(int argc, char* argv[]) {
    const std::string binary = "basecvt";
    const auto visible = basecvt::cli::visible_options();

    po::variables_map var_map;
    try {
        var_map = basecvt::cli::parse_arguments(std::vector<std::string>(argv + 1, argv + argc), visible);
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        write_usage(binary, visible, &std::cerr);
        return 1;
    }

    if (var_map.count("help")) {
        write_usage(binary, visible, &std::cout);
        return 0;
    }
    if (var_map.count("version")) {
        std::cout << binary << " " << basecvt::version << "\n";
        return 0;
    }
    if (!var_map.count("number")) {
        std::cerr << "Error: missing number to convert\n";
        write_usage(binary, visible, &std::cerr);
        return 1;
    }

    const auto number = var_map["number"].as<std::string>();
    const int from_base = var_map["from-base"].as<int>();
    const int to_base = var_map["to-base"].as<int>();
    const int precision = var_map["precision"].as<int>();

    try {
        basecvt::ConverterOptions options;
        options.default_precision = precision;
        if (var_map.count("trim")) {
            options.fraction_format = basecvt::io::FractionFormat::trimmed;
        }
        const basecvt::BaseConverter converter(options);
        const auto result = converter.convert(number, from_base, to_base, precision);
        std::cout << number << " (" << basecvt::core::base_name(from_base) << ") = " << result << " ("
                  << basecvt::core::base_name(to_base) << ")\n";
    } catch (const basecvt::ConversionError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
