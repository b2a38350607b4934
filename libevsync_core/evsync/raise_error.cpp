// This file is part of evsync, the event-loop synchronization library. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#include "evsync/raise_error.hpp"

#include "evsync/logger.hpp"

namespace evsync::detail {

void log_cstring_error(const char* cstring) {
  EVSYNC_LOG_ERROR(cstring);
}

} // namespace evsync::detail
