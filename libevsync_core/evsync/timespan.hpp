// This file is part of evsync, the event-loop synchronization library. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#pragma once

#include <chrono>
#include <cstdint>
#include <limits>

namespace evsync {

/// A portable timespan type with nanosecond resolution.
using timespan = std::chrono::duration<int64_t, std::nano>;

/// Constant representing an infinite amount of time.
static constexpr timespan infinite
  = timespan{std::numeric_limits<int64_t>::max()};

/// Checks whether `value` represents an infinite amount of time.
constexpr bool is_infinite(timespan value) {
  return value == infinite;
}

} // namespace evsync
