// python/bindings.cpp - Pybind11 bindings for the basecvt module.

#include <optional>
#include <string>

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <basecvt/basecvt.hpp>

namespace py = pybind11;

namespace {

using Precision = std::optional<int>;

// Python callers pass str, int or float. Integers are forwarded as their exact
// decimal text so values beyond the range of a double keep every digit.
std::string convert_value(const basecvt::BaseConverter& self,
                          const py::object& value,
                          int from_base,
                          int to_base,
                          Precision precision) {
    if (py::isinstance<py::str>(value)) {
        return self.convert(value.cast<std::string>(), from_base, to_base, precision);
    }
    if (py::isinstance<py::bool_>(value)) {
        throw basecvt::InvalidFormatError("boolean input is not a number");
    }
    if (py::isinstance<py::int_>(value)) {
        basecvt::validate_base(from_base);
        basecvt::validate_base(to_base);
        if (from_base != 10) {
            throw basecvt::InvalidFormatError(
                "numeric input is only supported for decimal (base 10), got base " +
                std::to_string(from_base));
        }
        return self.convert(py::str(value).cast<std::string>(), from_base, to_base, precision);
    }
    if (py::isinstance<py::float_>(value)) {
        return self.convert(value.cast<double>(), from_base, to_base, precision);
    }
    throw py::type_error("expected a str, int or float value");
}

template <int From, int To>
void bind_pair(py::class_<basecvt::BaseConverter>& cls, const char* name, const char* doc) {
    cls.def(name,
            [](const basecvt::BaseConverter& self, const py::object& value, Precision precision) {
                return convert_value(self, value, From, To, precision);
            },
            py::arg("value"),
            py::arg("precision") = py::none(),
            doc);
}

} // namespace

PYBIND11_MODULE(basecvt, module) {
    module.doc() = "Exact conversion of numerals between bases 2, 8, 10 and 16";
    module.attr("__version__") = std::string(basecvt::version);
    module.attr("DEFAULT_PRECISION") = basecvt::DEFAULT_PRECISION;
    module.attr("MIN_PRECISION") = basecvt::MIN_PRECISION;
    module.attr("MAX_PRECISION") = basecvt::MAX_PRECISION;

    // Subclasses are registered after their base so the most specific
    // translator is tried first.
    auto& conversion_error = py::register_exception<basecvt::ConversionError>(
        module, "ConversionError", PyExc_ValueError);
    py::register_exception<basecvt::InvalidFormatError>(module, "InvalidFormatError",
                                                         conversion_error.ptr());
    py::register_exception<basecvt::InvalidDigitError>(module, "InvalidDigitError",
                                                        conversion_error.ptr());
    py::register_exception<basecvt::PrecisionRangeError>(module, "PrecisionRangeError",
                                                          conversion_error.ptr());
    py::register_exception<basecvt::UnsupportedBaseError>(module, "UnsupportedBaseError",
                                                           conversion_error.ptr());
    py::register_exception<basecvt::ScientificNotationError>(module, "ScientificNotationError",
                                                              conversion_error.ptr());

    module.def("base_name", &basecvt::core::base_name, py::arg("base"),
               "Human readable name of a supported base");
    module.def("normalize_input",
               [](const std::string& value, int base) { return basecvt::io::normalize_input(value, base); },
               py::arg("value"),
               py::arg("base"),
               "Strip whitespace and base prefixes and expand scientific notation");
    module.def("expand_scientific",
               [](const std::string& value) { return basecvt::io::expand_scientific(value); },
               py::arg("value"),
               "Rewrite a decimal numeral in scientific notation as plain positional digits");
    module.def("validate_input",
               [](const std::string& value, int base) { basecvt::io::validate_input(value, base); },
               py::arg("value"),
               py::arg("base"),
               "Raise if the text is not a numeral in the given base");

    py::class_<basecvt::BaseConverter> py_converter(
        module, "BaseConverter", "Converts numerals between bases with exact fractional digits");
    py_converter
        .def(py::init([](int default_precision, bool trim) {
                 basecvt::ConverterOptions options;
                 options.default_precision = default_precision;
                 options.fraction_format =
                     trim ? basecvt::io::FractionFormat::trimmed : basecvt::io::FractionFormat::fixed;
                 return basecvt::BaseConverter(options);
             }),
             py::arg("default_precision") = basecvt::DEFAULT_PRECISION,
             py::arg("trim") = false)
        .def_property_readonly("default_precision", &basecvt::BaseConverter::default_precision)
        .def("convert",
             [](const basecvt::BaseConverter& self, const py::object& value, int from_base, int to_base,
                Precision precision) { return convert_value(self, value, from_base, to_base, precision); },
             py::arg("value"),
             py::arg("from_base"),
             py::arg("to_base"),
             py::arg("precision") = py::none(),
             "Convert a numeral between any two supported bases")
        .def("__repr__", [](const basecvt::BaseConverter& self) {
            return "<basecvt.BaseConverter precision=" + std::to_string(self.default_precision()) + ">";
        });

    bind_pair<10, 2>(py_converter, "decimal_to_binary", "Convert decimal to binary");
    bind_pair<10, 8>(py_converter, "decimal_to_octal", "Convert decimal to octal");
    bind_pair<10, 16>(py_converter, "decimal_to_hex", "Convert decimal to hexadecimal");
    bind_pair<2, 10>(py_converter, "binary_to_decimal", "Convert binary to decimal");
    bind_pair<2, 8>(py_converter, "binary_to_octal", "Convert binary to octal");
    bind_pair<2, 16>(py_converter, "binary_to_hex", "Convert binary to hexadecimal");
    bind_pair<8, 10>(py_converter, "octal_to_decimal", "Convert octal to decimal");
    bind_pair<8, 2>(py_converter, "octal_to_binary", "Convert octal to binary");
    bind_pair<8, 16>(py_converter, "octal_to_hex", "Convert octal to hexadecimal");
    bind_pair<16, 10>(py_converter, "hex_to_decimal", "Convert hexadecimal to decimal");
    bind_pair<16, 2>(py_converter, "hex_to_binary", "Convert hexadecimal to binary");
    bind_pair<16, 8>(py_converter, "hex_to_octal", "Convert hexadecimal to octal");
}
