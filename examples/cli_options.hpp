// examples/cli_options.hpp - Command-line option model of the basecvt tool.

#pragma once

#include <cctype>
#include <string>
#include <vector>

#include <boost/program_options/options_description.hpp>
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/positional_options.hpp>
#include <boost/program_options/value_semantic.hpp>
#include <boost/program_options/variables_map.hpp>

#include <basecvt/converter.hpp>

namespace basecvt::cli {

namespace po = boost::program_options;

// "-5" and "-.5" are numbers, not short options. Anything else starting with
// '-' can still be passed after a "--" separator.
inline std::vector<po::option> negative_number_parser(std::vector<std::string>& args) {
    std::vector<po::option> result;
    const std::string& token = args.front();
    if (token.size() > 1 && token[0] == '-' &&
        (std::isdigit(static_cast<unsigned char>(token[1])) || token[1] == '.')) {
        po::option number;
        number.string_key = "number";
        number.value.push_back(token);
        number.original_tokens.push_back(token);
        result.push_back(number);
        args.erase(args.begin());
    }
    return result;
}

inline po::options_description visible_options() {
    po::options_description visible("Options");
    visible.add_options()
        ("help,h", "Print this help and exit")
        ("version", "Print the version and exit")
        ("from-base,f", po::value<int>()->default_value(10), "Source base: 2, 8, 10 or 16")
        ("to-base,t", po::value<int>()->default_value(2), "Target base: 2, 8, 10 or 16")
        ("precision,p", po::value<int>()->default_value(DEFAULT_PRECISION),
         "Digits after the radix point, 1 to 100")
        ("trim", "Drop trailing zero digits from the fraction");
    return visible;
}

// Parses the arguments after the program name. Throws po::error on unknown
// options, bad values or more than one number.
inline po::variables_map parse_arguments(const std::vector<std::string>& args,
                                         const po::options_description& visible) {
    po::options_description hidden;
    hidden.add_options()("number", po::value<std::string>(), "Number to convert");

    po::options_description all;
    all.add(visible).add(hidden);

    po::positional_options_description positional;
    positional.add("number", 1);

    po::variables_map var_map;
    po::store(po::command_line_parser(args)
                  .options(all)
                  .positional(positional)
                  .extra_style_parser(&negative_number_parser)
                  .run(),
              var_map);
    po::notify(var_map);
    return var_map;
}

} // namespace basecvt::cli
