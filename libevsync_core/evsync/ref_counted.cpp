// This file is part of evsync, the event-loop synchronization library. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#include "evsync/ref_counted.hpp"

namespace evsync {

ref_counted::~ref_counted() {
  // nop
}

} // namespace evsync
