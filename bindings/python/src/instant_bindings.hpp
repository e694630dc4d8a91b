#pragma once
// Instant bindings: Instant, fire_at, delayed_completion

#include <nanobind/nanobind.h>
#include <nanobind/stl/chrono.h>
#include <nanobind/stl/string.h>

#include <tempora.hpp>

#include "py_types.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <utility>

namespace nb = nanobind;
using namespace nb::literals;

namespace tempora_python {

inline void bind_instant(nb::module_& m) {
    using tempora::Duration;
    using tempora::Instant;

    // =========================================================================
    // Instant
    // =========================================================================

    nb::class_<Instant>(m, "Instant", "Point in time as an offset from the Unix epoch")
        .def(nb::init<>(), "The epoch, 1970-01-01T00:00:00Z")
        .def(nb::init<double>(), "Milliseconds since the epoch", "unix_milliseconds"_a)
        .def(nb::init<Duration>(), "Offset from the epoch", "unix_epoch"_a)
        .def(nb::init<Instant::time_point>(), "From a datetime", "date"_a)
        .def(
            "__init__",
            [](Instant* self, const std::string& text) {
                new (self) Instant(unwrap(Instant::parse(text)));
            },
            "Parse a date string. Raises DateParseError.", "text"_a)
        .def_static(
            "from_calendar",
            [](double year, double month, double day, double hour, double minute, double second,
               const std::string& timezone) {
                return unwrap(Instant::from_calendar(
                    tempora::CalendarDescriptor{year, month, day, hour, minute, second, timezone}));
            },
            "Build from calendar fields. Raises InvalidDescriptorError, RangeError or "
            "DateParseError.",
            "year"_a = 1970, "month"_a = 1, "day"_a = 1, "hour"_a = 0, "minute"_a = 0,
            "second"_a = 0, "timezone"_a = "")
        .def_static(
            "deserialize",
            [](const nb::dict& d) {
                if (!d.contains("unixEpoch")) {
                    PyErr_SetString(PyExc_KeyError, "unixEpoch");
                    throw nb::python_error();
                }
                return Instant(tempora::EpochBreakdown{
                    breakdown_from_dict(nb::cast<nb::dict>(d["unixEpoch"]))});
            },
            "Inverse of serialize()", "data"_a)
        .def_static("now", &Instant::now)
        .def_static("epoch_start", &Instant::epoch_start)
        .def_prop_ro("unix_epoch", &Instant::unix_epoch)
        .def("as_date", &Instant::as_date, "As a datetime")
        .def("is_before", nb::overload_cast<const Instant&>(&Instant::is_before, nb::const_),
             "other"_a)
        .def("is_after", nb::overload_cast<const Instant&>(&Instant::is_after, nb::const_),
             "other"_a)
        .def("equals", nb::overload_cast<const Instant&>(&Instant::equals, nb::const_),
             "other"_a)
        .def("compare", nb::overload_cast<const Instant&>(&Instant::compare, nb::const_),
             "other"_a)
        .def(
            "add",
            [](const Instant& t, const nb::args& periods) {
                Duration sum;
                for (nb::handle h : periods) {
                    sum = sum.add(to_duration(h));
                }
                return t.add(sum);
            },
            "Later instant; arguments are Durations, dicts or milliseconds")
        .def(
            "subtract", [](const Instant& t, nb::handle period) {
                return t.subtract(to_duration(period));
            },
            "period"_a)
        .def("difference",
             nb::overload_cast<const Instant&>(&Instant::difference, nb::const_),
             "other - self", "other"_a)
        .def("serialize",
             [](const Instant& t) {
                 nb::dict out;
                 out["unixEpoch"] = breakdown_to_dict(t.serialize().unix_epoch);
                 return out;
             })
        .def("__add__", [](const Instant& t, const Duration& d) { return t + d; })
        .def("__sub__", [](const Instant& t, const Duration& d) { return t - d; })
        .def("__sub__", [](const Instant& a, const Instant& b) { return a - b; })
        .def("__eq__", [](const Instant& a, const Instant& b) { return a == b; })
        .def("__lt__", [](const Instant& a, const Instant& b) { return a < b; })
        .def("__le__", [](const Instant& a, const Instant& b) { return a <= b; })
        .def("__gt__", [](const Instant& a, const Instant& b) { return a > b; })
        .def("__ge__", [](const Instant& a, const Instant& b) { return a >= b; })
        .def("__str__", &Instant::to_string)
        .def("__repr__",
             [](const Instant& t) { return "Instant(" + t.to_string() + ")"; });

    // =========================================================================
    // Scheduling on the default timer thread
    // =========================================================================

    m.def(
        "fire_at",
        [](const Instant& target, nb::callable callback) {
            // The timer thread holds no GIL; take it around the Python call
            auto shared = std::make_shared<nb::object>(std::move(callback));
            tempora::fire_at(target, [shared]() {
                nb::gil_scoped_acquire acquire;
                try {
                    (*shared)();
                } catch (nb::python_error& e) {
                    e.discard_as_unraisable("tempora.fire_at callback");
                }
                *shared = nb::object();
            });
        },
        "Call `callback` once `target` is reached, from the timer thread", "target"_a,
        "callback"_a);

    m.def(
        "delayed_completion",
        [](nb::handle target) {
            Instant resolved;
            if (nb::isinstance<Instant>(target)) {
                resolved = nb::cast<Instant>(target);
            } else {
                resolved = Instant::now().add(to_duration(target));
            }
            nb::gil_scoped_release release;
            tempora::delayed_completion(resolved).wait();
        },
        "Block until `target` (Instant, Duration, dict of units or milliseconds) is reached",
        "target"_a);
}

} // namespace tempora_python
