// This file is part of evsync, the event-loop synchronization library. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#pragma once

#include "evsync/detail/core_export.hpp"

namespace evsync::detail {

/// Sets the name of the calling thread as shown by debuggers and `top`. The
/// operating system may truncate the name.
EVSYNC_CORE_EXPORT void set_thread_name(const char* name);

} // namespace evsync::detail
