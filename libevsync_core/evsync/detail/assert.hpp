// This file is part of evsync, the event-loop synchronization library. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#pragma once

#include "evsync/detail/build_config.hpp"
#include "evsync/detail/core_export.hpp"

namespace evsync::detail {

[[noreturn]] EVSYNC_CORE_EXPORT void assertion_failed(const char* file,
                                                      int line,
                                                      const char* stmt);

/// Prints `msg` to `stderr` and aborts the process.
[[noreturn]] EVSYNC_CORE_EXPORT void critical(const char* file, int line,
                                              const char* msg);

} // namespace evsync::detail

#ifdef EVSYNC_ENABLE_RUNTIME_CHECKS
#  define EVSYNC_ASSERT(stmt)                                                  \
    if (static_cast<bool>(stmt) == false) {                                    \
      evsync::detail::assertion_failed(__FILE__, __LINE__, #stmt);             \
    }                                                                          \
    static_cast<void>(0)
#else
#  define EVSYNC_ASSERT(unused) static_cast<void>(0)
#endif

#define EVSYNC_CRITICAL(msg) evsync::detail::critical(__FILE__, __LINE__, msg)
