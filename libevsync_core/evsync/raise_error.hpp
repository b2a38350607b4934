// This file is part of evsync, the event-loop synchronization library. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#pragma once

#include "evsync/config.hpp"

#ifdef EVSYNC_ENABLE_EXCEPTIONS
#  include <stdexcept>
#endif

#include "evsync/detail/assert.hpp"
#include "evsync/detail/core_export.hpp"

#include <type_traits>

namespace evsync::detail {

/// Writes `cstring` to the current logger (if any) with ERROR severity.
EVSYNC_CORE_EXPORT void log_cstring_error(const char* cstring);

#ifdef EVSYNC_ENABLE_EXCEPTIONS

template <class T>
[[noreturn]] std::enable_if_t<std::is_constructible_v<T, const char*>>
throw_impl(const char* msg) {
  throw T{msg};
}

#endif // EVSYNC_ENABLE_EXCEPTIONS

} // namespace evsync::detail

#ifdef EVSYNC_ENABLE_EXCEPTIONS

/// Throws an exception of type `exception_type` with message `msg`.
#  define EVSYNC_RAISE_ERROR(exception_type, msg)                              \
    do {                                                                       \
      ::evsync::detail::log_cstring_error(msg);                                \
      ::evsync::detail::throw_impl<exception_type>(msg);                       \
    } while (false)

#else // EVSYNC_ENABLE_EXCEPTIONS

/// Calls abort() after printing `msg`, since exceptions are disabled.
#  define EVSYNC_RAISE_ERROR(unused, msg)                                      \
    do {                                                                       \
      ::evsync::detail::log_cstring_error(msg);                                \
      EVSYNC_CRITICAL(msg);                                                    \
    } while (false)

#endif // EVSYNC_ENABLE_EXCEPTIONS
