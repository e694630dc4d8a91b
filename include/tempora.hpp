#pragma once

// TEMPORA - millisecond durations, instants and long-horizon timers
//
// Core value types and scheduling. JSON support lives in
// <tempora/json.hpp> and requires RapidJSON.

#include "tempora/breakdown.hpp"
#include "tempora/calendar.hpp"
#include "tempora/duration.hpp"
#include "tempora/expected.hpp"
#include "tempora/instant.hpp"
#include "tempora/instant_error.hpp"
#include "tempora/scheduler.hpp"
#include "tempora/time_unit.hpp"
