// This file is part of evsync, the event-loop synchronization library. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#pragma once

#include "evsync/detail/build_config.hpp"

#include <string_view>

// -- hard-coded default values for various evsync options --------------------

namespace evsync::defaults::logger {

/// Maximum severity level the default logger accepts at runtime. Levels above
/// the compile-time ceiling `EVSYNC_LOG_LEVEL` never reach the logger.
constexpr auto verbosity = unsigned{EVSYNC_LOG_LEVEL};

/// Configures whether the default logger writes to `std::clog`.
constexpr auto console = true;

/// Configures the output file of the default logger. An empty name disables
/// file output.
constexpr auto file_name = std::string_view{""};

} // namespace evsync::defaults::logger

namespace evsync::defaults::event_loop {

/// Name of event loops that users create without passing a name.
constexpr auto name = std::string_view{"evsync.event-loop"};

} // namespace evsync::defaults::event_loop

namespace evsync::defaults::semaphore {

/// Configures whether semaphores serve waiters in strict arrival order unless
/// users pass the fairness flag explicitly.
constexpr auto fair = false;

} // namespace evsync::defaults::semaphore
