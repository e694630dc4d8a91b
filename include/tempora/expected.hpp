#pragma once

// TEMPORA Expected Type
//
// Exposes tl::expected in the tempora namespace for fallible construction.
// Calendar descriptors, date strings and JSON documents are validated on the
// way in; failures come back as an error value instead of an exception.
//
// Usage:
//   tempora::expected<Instant, InstantError> result = Instant::parse(text);
//   if (result.has_value()) {
//       use(*result);
//   } else {
//       report(result.error().message());
//   }
//
// Monadic operations:
//   result.and_then(f)  - chain on success
//   result.map(f)       - transform value
//   result.or_else(f)   - chain on error
//   result.map_error(f) - transform error

#include <tl/expected.hpp>

namespace tempora {

using tl::expected;
using tl::make_unexpected;
using tl::unexpect;
using tl::unexpect_t;
using tl::unexpected;

} // namespace tempora
