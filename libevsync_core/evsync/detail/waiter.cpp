// This file is part of evsync, the event-loop synchronization library. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#include "evsync/detail/waiter.hpp"

#include "evsync/detail/assert.hpp"

namespace evsync::detail {

waiter::waiter(int permits, execution_context_ptr ctx, action on_success)
  : permits_(permits), ctx_(std::move(ctx)), on_success_(std::move(on_success)) {
  EVSYNC_ASSERT(ctx_ != nullptr);
  EVSYNC_ASSERT(on_success_);
}

waiter::waiter(execution_context_ptr ctx, action on_success)
  : waiter(0, std::move(ctx), std::move(on_success)) {
  // nop
}

waiter::~waiter() {
  // nop
}

void waiter::fire() {
  timeout_.dispose();
  if (on_success_) {
    ctx_->schedule(std::move(on_success_));
    on_success_ = nullptr;
  }
}

void waiter::fire(action alternative) {
  timeout_ = nullptr;
  on_success_ = nullptr;
  ctx_->schedule(std::move(alternative));
}

} // namespace evsync::detail
