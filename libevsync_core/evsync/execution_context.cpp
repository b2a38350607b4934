// This file is part of evsync, the event-loop synchronization library. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#include "evsync/execution_context.hpp"

namespace evsync {

execution_context::~execution_context() {
  // nop
}

} // namespace evsync
