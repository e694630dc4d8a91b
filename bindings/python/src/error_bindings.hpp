#pragma once
// Error bindings: ErrorKind and the exceptions raised by Instant construction

#include <nanobind/nanobind.h>

#include <tempora/instant_error.hpp>

#include "py_types.hpp"

#include <stdexcept>
#include <string>

namespace nb = nanobind;
using namespace nb::literals;

namespace tempora_python {

inline void bind_errors(nb::module_& m) {
    // =========================================================================
    // ErrorKind enum
    // =========================================================================

    nb::enum_<tempora::ErrorKind>(m, "ErrorKind", "Classification of Instant construction errors")
        .value("invalid_descriptor", tempora::ErrorKind::invalid_descriptor,
               "A field other than 'second' is not a whole number")
        .value("range", tempora::ErrorKind::range, "A field is outside its calendar bounds")
        .value("parse", tempora::ErrorKind::parse, "The date string was not understood")
        .def("__str__", [](tempora::ErrorKind k) {
            return std::string(tempora::error_kind_string(k));
        });

    // =========================================================================
    // Custom Exceptions
    // =========================================================================

    auto invalid_descriptor =
        nb::exception<std::runtime_error>(m, "InvalidDescriptorError", PyExc_ValueError);
    invalid_descriptor_error_type = invalid_descriptor.ptr();

    auto range_error = nb::exception<std::runtime_error>(m, "RangeError", PyExc_ValueError);
    range_error_type = range_error.ptr();

    auto date_parse_error =
        nb::exception<std::runtime_error>(m, "DateParseError", PyExc_ValueError);
    date_parse_error_type = date_parse_error.ptr();
}

} // namespace tempora_python
