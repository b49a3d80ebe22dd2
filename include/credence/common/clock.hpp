#pragma once

#include <credence/schema/primitives.hpp>

#include <functional>

namespace credence::common {

/// Source of wall-clock time in milliseconds since the Unix epoch.
using clock_fn_t = std::function<credence::schema::timestamp_milliseconds_t()>;

credence::schema::timestamp_milliseconds_t system_now();

inline clock_fn_t system_clock() { return &system_now; }

}  // namespace credence::common
