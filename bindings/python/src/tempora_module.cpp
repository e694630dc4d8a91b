// tempora Python bindings
// Main module entry point - includes component bindings

#include <nanobind/nanobind.h>

// Binding components
#include "core_bindings.hpp"
#include "error_bindings.hpp"
#include "instant_bindings.hpp"

namespace nb = nanobind;

// Define the exception type pointers (declared extern in py_types.hpp)
namespace tempora_python {
PyObject* invalid_descriptor_error_type = nullptr;
PyObject* range_error_type = nullptr;
PyObject* date_parse_error_type = nullptr;
} // namespace tempora_python

NB_MODULE(tempora, m) {
    m.doc() = "tempora - durations, instants and long-range timers";

    // 1. TimeUnit, Duration - no dependencies
    tempora_python::bind_core(m);

    // 2. Error types (sets the exception type pointers)
    tempora_python::bind_errors(m);

    // 3. Instant and scheduling - needs Duration and the exception types
    tempora_python::bind_instant(m);
}
