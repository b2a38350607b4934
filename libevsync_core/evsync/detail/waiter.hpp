// This file is part of evsync, the event-loop synchronization library. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#pragma once

#include "evsync/action.hpp"
#include "evsync/detail/core_export.hpp"
#include "evsync/disposable.hpp"
#include "evsync/execution_context.hpp"
#include "evsync/ref_counted.hpp"

#include <algorithm>

namespace evsync::detail {

/// A deferred request that waits for permits (semaphore) or for a count to
/// reach zero (latch). Once its owner removes it from the waiting list, the
/// waiter resumes on the execution context that created it.
class EVSYNC_CORE_EXPORT waiter : public ref_counted {
public:
  // -- constructors, destructors, and assignment operators --------------------

  waiter(int permits, execution_context_ptr ctx, action on_success);

  waiter(execution_context_ptr ctx, action on_success);

  ~waiter() override;

  // -- properties -------------------------------------------------------------

  /// Returns the number of permits this waiter asks for.
  int permits() const noexcept {
    return permits_;
  }

  /// Returns the context that runs the continuation of this waiter.
  const execution_context_ptr& context() const noexcept {
    return ctx_;
  }

  /// Returns whether a timeout is pending for this waiter.
  bool has_timeout() const noexcept {
    return !timeout_.disposed();
  }

  // -- mutators ---------------------------------------------------------------

  /// Stores the handle of the timeout that races against this waiter.
  /// @pre the owner of this waiter holds its lock
  void timeout(disposable hdl) {
    timeout_ = std::move(hdl);
  }

  /// Cancels any pending timeout and schedules the success action to the
  /// captured context. Calling this member function a second time is a no-op.
  /// @pre the calling thread removed this waiter from its waiting list
  void fire();

  /// Schedules `alternative` instead of the success action to the captured
  /// context. Called by the timeout handler after it won the race for removing
  /// this waiter.
  /// @pre the calling thread removed this waiter from its waiting list
  void fire(action alternative);

private:
  int permits_;
  execution_context_ptr ctx_;
  action on_success_;
  disposable timeout_;
};

/// @relates waiter
using waiter_ptr = intrusive_ptr<waiter>;

/// Removes `what` from `xs`. Returns `true` if this call removed the element
/// and `false` if another party removed it before.
/// @relates waiter
template <class Container>
bool remove_waiter(Container& xs, const waiter_ptr& what) {
  auto i = std::find(xs.begin(), xs.end(), what);
  if (i == xs.end())
    return false;
  xs.erase(i);
  return true;
}

} // namespace evsync::detail
