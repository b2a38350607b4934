// This file is part of evsync, the event-loop synchronization library. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#pragma once

#include "evsync/detail/build_config.hpp"

#include <string_view>

namespace evsync::log::level {

/// Integer value for the QUIET log level.
constexpr unsigned quiet = EVSYNC_LOG_LEVEL_QUIET;

/// Integer value for the ERROR log level.
constexpr unsigned error = EVSYNC_LOG_LEVEL_ERROR;

/// Integer value for the WARNING log level.
constexpr unsigned warning = EVSYNC_LOG_LEVEL_WARNING;

/// Integer value for the INFO log level.
constexpr unsigned info = EVSYNC_LOG_LEVEL_INFO;

/// Integer value for the DEBUG log level.
constexpr unsigned debug = EVSYNC_LOG_LEVEL_DEBUG;

/// Integer value for the TRACE log level.
constexpr unsigned trace = EVSYNC_LOG_LEVEL_TRACE;

/// Returns the upper-case name of the level that `value` falls into, e.g.,
/// "DEBUG" for all values between `info` (exclusive) and `debug`.
constexpr std::string_view name(unsigned value) noexcept {
  if (value == quiet)
    return "QUIET";
  if (value <= error)
    return "ERROR";
  if (value <= warning)
    return "WARN";
  if (value <= info)
    return "INFO";
  if (value <= debug)
    return "DEBUG";
  return "TRACE";
}

} // namespace evsync::log::level
