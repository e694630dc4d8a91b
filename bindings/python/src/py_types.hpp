#pragma once
// Conversion helpers shared by the tempora bindings

#include <nanobind/nanobind.h>

#include <tempora.hpp>

#include <string>

namespace nb = nanobind;

namespace tempora_python {

// Exception type pointers (set during module init)
extern PyObject* invalid_descriptor_error_type;
extern PyObject* range_error_type;
extern PyObject* date_parse_error_type;

/**
 * @brief Raise the Python exception matching an InstantError's kind
 */
[[noreturn]] inline void raise_instant_error(const tempora::InstantError& err) {
    PyObject* type = nullptr;
    switch (err.kind()) {
        case tempora::ErrorKind::invalid_descriptor:
            type = invalid_descriptor_error_type;
            break;
        case tempora::ErrorKind::range:
            type = range_error_type;
            break;
        case tempora::ErrorKind::parse:
            type = date_parse_error_type;
            break;
    }
    PyErr_SetString(type, err.message());
    throw nb::python_error();
}

inline tempora::Instant unwrap(const tempora::InstantResult<tempora::Instant>& result) {
    if (!result.has_value()) {
        raise_instant_error(result.error());
    }
    return *result;
}

/**
 * @brief {"hours": 1, "minutes": 30} -> Breakdown
 *
 * Raises ValueError for a key that is not a unit name.
 */
inline tempora::Breakdown breakdown_from_dict(const nb::dict& d) {
    tempora::Breakdown out;
    for (auto [key, value] : d) {
        const std::string name = nb::cast<std::string>(key);
        auto unit = tempora::parse_unit(name);
        if (!unit) {
            PyErr_Format(PyExc_ValueError, "Unknown time unit '%s'", name.c_str());
            throw nb::python_error();
        }
        out.set(*unit, nb::cast<double>(value));
    }
    return out;
}

inline nb::dict breakdown_to_dict(const tempora::Breakdown& b) {
    nb::dict out;
    for (const auto& [unit, amount] : b) {
        out[nb::str(tempora::unit_name(unit).data(), tempora::unit_name(unit).size())] = amount;
    }
    return out;
}

/**
 * @brief Duration, dict breakdown, or number of milliseconds -> Duration
 */
inline tempora::Duration to_duration(nb::handle h) {
    if (nb::isinstance<tempora::Duration>(h)) {
        return nb::cast<tempora::Duration>(h);
    }
    if (nb::isinstance<nb::dict>(h)) {
        return tempora::Duration(breakdown_from_dict(nb::borrow<nb::dict>(h)));
    }
    if (nb::isinstance<nb::float_>(h) || nb::isinstance<nb::int_>(h)) {
        return tempora::Duration(nb::cast<double>(h));
    }
    PyErr_SetString(PyExc_TypeError, "expected Duration, dict of units, or milliseconds");
    throw nb::python_error();
}

} // namespace tempora_python
