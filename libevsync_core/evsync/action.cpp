// This file is part of evsync, the event-loop synchronization library. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#include "evsync/action.hpp"

namespace evsync {

action::action(impl_ptr ptr) noexcept : pimpl_(std::move(ptr)) {
  // nop
}

} // namespace evsync
