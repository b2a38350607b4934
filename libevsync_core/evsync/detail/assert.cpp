// This file is part of evsync, the event-loop synchronization library. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#include "evsync/detail/assert.hpp"

#include "evsync/config.hpp"

#include <cstdio>
#include <cstdlib>

#if defined(EVSYNC_WINDOWS) || defined(EVSYNC_BSD)                            \
  || !__has_include(<execinfo.h>)

namespace evsync::detail {

namespace {

void print_backtrace() {
  // nop
}

} // namespace

} // namespace evsync::detail

#else // defined(EVSYNC_LINUX) || defined(EVSYNC_MACOS)

#  include <execinfo.h>

namespace evsync::detail {

namespace {

void print_backtrace() {
  void* array[20];
  auto bt_size = ::backtrace(array, 20);
  ::backtrace_symbols_fd(array + 1, bt_size - 1, 2);
}

} // namespace

} // namespace evsync::detail

#endif

namespace evsync::detail {

[[noreturn]] void assertion_failed(const char* file, int line,
                                   const char* stmt) {
  fprintf(stderr, "%s:%d: assertion '%s' failed\n", file, line, stmt);
  print_backtrace();
  ::abort();
}

[[noreturn]] void critical(const char* file, int line, const char* msg) {
  fprintf(stderr, "[FATAL] critical error (%s:%d): %s\n", file, line, msg);
  ::abort();
}

} // namespace evsync::detail
