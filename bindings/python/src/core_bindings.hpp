#pragma once
// Core bindings: TimeUnit, Duration, constants

#include <nanobind/nanobind.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/vector.h>

#include <tempora.hpp>

#include "py_types.hpp"

#include <optional>
#include <sstream>
#include <vector>

namespace nb = nanobind;
using namespace nb::literals;

namespace tempora_python {

inline void bind_core(nb::module_& m) {
    using tempora::Duration;
    using tempora::TimeUnit;

    // =========================================================================
    // TimeUnit
    // =========================================================================

    nb::enum_<TimeUnit>(m, "TimeUnit", "Units a Duration can be expressed in")
        .value("milliseconds", TimeUnit::milliseconds)
        .value("seconds", TimeUnit::seconds)
        .value("minutes", TimeUnit::minutes)
        .value("hours", TimeUnit::hours)
        .value("days", TimeUnit::days)
        .value("weeks", TimeUnit::weeks)
        .value("microfortnights", TimeUnit::microfortnights, "One millionth of two weeks")
        .def_prop_ro("divisor", [](TimeUnit u) { return tempora::divisor(u); },
                     "Milliseconds per unit")
        .def("__str__", [](TimeUnit u) { return std::string(tempora::unit_name(u)); })
        .def("__repr__", [](TimeUnit u) {
            return std::string("TimeUnit.") + std::string(tempora::unit_name(u));
        });

    // Constants
    m.attr("REANCHOR_INTERVAL_MS") = tempora::REANCHOR_INTERVAL_MS;

    // =========================================================================
    // Duration
    // =========================================================================

    nb::class_<Duration>(m, "Duration", "Signed time interval held as milliseconds")
        .def(nb::init<>())
        .def(nb::init<double>(), "Create from a number of milliseconds", "milliseconds"_a)
        .def(
            "__init__",
            [](Duration* self, const nb::dict& units) {
                new (self) Duration(breakdown_from_dict(units));
            },
            "Create from a unit breakdown, e.g. {'hours': 1, 'minutes': 30}", "units"_a)
        .def_static("from_weeks", &Duration::from_weeks, "n"_a)
        .def_static("from_days", &Duration::from_days, "n"_a)
        .def_static("from_hours", &Duration::from_hours, "n"_a)
        .def_static("from_minutes", &Duration::from_minutes, "n"_a)
        .def_static("from_seconds", &Duration::from_seconds, "n"_a)
        .def_static("from_milliseconds", &Duration::from_milliseconds, "n"_a)
        .def_prop_ro("milliseconds", &Duration::as_milliseconds)
        .def_prop_ro("seconds", &Duration::as_seconds)
        .def_prop_ro("minutes", &Duration::as_minutes)
        .def_prop_ro("hours", &Duration::as_hours)
        .def_prop_ro("days", &Duration::as_days)
        .def_prop_ro("weeks", &Duration::as_weeks)
        .def("as_unit", &Duration::as, "Value expressed in any unit", "unit"_a)
        .def(
            "add",
            [](const Duration& d, const nb::args& others) {
                Duration sum = d;
                for (nb::handle h : others) {
                    sum = sum.add(to_duration(h));
                }
                return sum;
            },
            "Sum of this and every argument (Duration, dict or milliseconds)")
        .def(
            "subtract", [](const Duration& d, nb::handle other) {
                return d.subtract(to_duration(other));
            },
            "other"_a)
        .def("multiply", &Duration::multiply, "factor"_a)
        .def("divide", &Duration::divide, "IEEE-754 division; zero gives inf or nan",
             "divisor"_a)
        .def("abs", &Duration::abs)
        .def("equals", &Duration::equals, "other"_a)
        .def(
            "breakdown",
            [](const Duration& d, std::optional<std::vector<TimeUnit>> units,
               std::optional<bool> float_last, std::optional<bool> include_zero) {
                const tempora::BreakdownOptions options{float_last, include_zero};
                if (units) {
                    return breakdown_to_dict(d.breakdown(*units, options));
                }
                return breakdown_to_dict(d.breakdown(options));
            },
            "Split into units, largest first", "units"_a = nb::none(),
            "float_last"_a = nb::none(), "include_zero"_a = nb::none())
        .def("serialize", [](const Duration& d) { return breakdown_to_dict(d.serialize()); })
        .def("__neg__", [](const Duration& d) { return -d; })
        .def("__add__", [](const Duration& a, const Duration& b) { return a + b; })
        .def("__sub__", [](const Duration& a, const Duration& b) { return a - b; })
        .def("__mul__", [](const Duration& d, double f) { return d * f; })
        .def("__rmul__", [](const Duration& d, double f) { return f * d; })
        .def("__truediv__", [](const Duration& d, double f) { return d / f; })
        .def("__truediv__", [](const Duration& a, const Duration& b) { return a / b; })
        .def("__abs__", &Duration::abs)
        .def("__eq__", [](const Duration& a, const Duration& b) { return a == b; })
        .def("__lt__", [](const Duration& a, const Duration& b) { return a < b; })
        .def("__le__", [](const Duration& a, const Duration& b) { return a <= b; })
        .def("__gt__", [](const Duration& a, const Duration& b) { return a > b; })
        .def("__ge__", [](const Duration& a, const Duration& b) { return a >= b; })
        .def("__repr__", [](const Duration& d) {
            std::ostringstream oss;
            oss << d;
            return oss.str();
        });
}

} // namespace tempora_python
