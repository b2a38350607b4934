// This file is part of evsync, the event-loop synchronization library. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#pragma once

#include "evsync/detail/core_export.hpp"
#include "evsync/disposable.hpp"
#include "evsync/execution_context.hpp"
#include "evsync/fwd.hpp"
#include "evsync/timespan.hpp"

#include <chrono>

namespace evsync {

/// Connects the synchronization primitives to the host environment. A
/// scheduler knows on which @ref execution_context a caller currently runs and
/// provides a monotonic clock for one-shot timeouts.
class EVSYNC_CORE_EXPORT scheduler {
public:
  // -- member types -----------------------------------------------------------

  /// Underlying clock type.
  using clock_type = std::chrono::steady_clock;

  /// Discrete point in time.
  using time_point = typename clock_type::time_point;

  /// Time interval.
  using duration_type = typename clock_type::duration;

  // -- constructors, destructors, and assignment operators --------------------

  virtual ~scheduler();

  // -- context capture --------------------------------------------------------

  /// Returns the execution context of the caller. Actions scheduled to the
  /// returned context run on the same logical thread as the caller.
  /// @thread-safe
  virtual execution_context_ptr current_context() = 0;

  // -- timeouts ---------------------------------------------------------------

  /// Returns the current time.
  virtual time_point now() const noexcept;

  /// Schedules an action for execution at a later time.
  /// @param t The local time at which the action should run.
  /// @param f The action to schedule.
  /// @returns A handle for cancelling the timeout. Disposing the handle after
  ///          the action ran is a no-op.
  /// @note The action runs on the thread of the timer facility and thus must
  ///       complete within a very short time in order to not delay other work.
  /// @warning Implementations must never run `f` inline, even if `t` already
  ///          passed. Semaphores and latches call this function while holding
  ///          their lock and the action acquires that lock again.
  virtual disposable schedule(time_point t, action f) = 0;

  /// Schedules an action for execution after `rel_timeout`. An infinite
  /// timeout, or one that reaches past `time_point::max()`, never fires.
  disposable delay_for(timespan rel_timeout, action f);
};

} // namespace evsync
