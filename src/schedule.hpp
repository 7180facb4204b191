#pragma once

#include <string_view>

#include <mw/utils.hpp>

#include "error.hpp"

// When to publish a scheduled post. Accepts, case insensitive:
//
//   - Relative to “now”: “in 5m”, “in 2h”, “in 1d”, “in 30 minutes”.
//   - A time of day in local time: “15:00”, “3pm”, “3:30 pm”. That is
//     tomorrow if the time has already passed today.
//   - A local date and time: “2030-01-15 15:00”, “2030-01-15T15:00:00”.
//   - RFC 3339 with a zone: “2030-01-15T15:00:00Z”,
//     “2030-01-15T15:00:00+01:00”.
//
// Anything else is a precondition error.
E<mw::Time> parseScheduleTime(std::string_view input, mw::Time now);
