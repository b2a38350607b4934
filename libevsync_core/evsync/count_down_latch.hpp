// This file is part of evsync, the event-loop synchronization library. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#pragma once

#include "evsync/action.hpp"
#include "evsync/callback.hpp"
#include "evsync/detail/core_export.hpp"
#include "evsync/fwd.hpp"
#include "evsync/intrusive_ptr.hpp"
#include "evsync/timespan.hpp"

#include <type_traits>
#include <utility>

namespace evsync {

/// A one-shot barrier for event-loop programs. Continuations registered via
/// `await` run on the execution context of their caller once `count_down` has
/// been called `count` times. Reaching zero is permanent: later calls to
/// `count_down` have no effect and later calls to `await` complete
/// immediately.
///
/// Instances of this class are handles: copies refer to the same latch.
/// @thread-safe
class EVSYNC_CORE_EXPORT count_down_latch {
public:
  // -- constructors, destructors, and assignment operators --------------------

  /// @throws std::invalid_argument if `count` is negative.
  count_down_latch(scheduler& sched, int count);

  count_down_latch(count_down_latch&&) noexcept;

  count_down_latch(const count_down_latch&) noexcept;

  count_down_latch& operator=(count_down_latch&&) noexcept;

  count_down_latch& operator=(const count_down_latch&) noexcept;

  ~count_down_latch();

  // -- mutators ---------------------------------------------------------------

  /// Decrements the count unless it already reached zero. Releases all
  /// registered continuations when the count drops from one to zero.
  void count_down();

  /// Schedules `on_zero` to the execution context of the caller once the
  /// count reaches zero.
  void await(action on_zero);

  /// Calls `on_result` on the execution context of the caller with `true` once
  /// the count reaches zero or with `false` if `timeout` expires first.
  /// @throws std::invalid_argument if `timeout` is negative.
  template <class F>
  void await(timespan timeout, F on_result) {
    static_assert(std::is_invocable_v<F, bool>,
                  "on_result must be callable with a bool argument");
    await_impl(timeout, make_shared_type_erased_callback<void(bool)>(
                          std::move(on_result)));
  }

  // -- properties -------------------------------------------------------------

  /// Returns the current count.
  [[nodiscard]] int count() const;

private:
  void await_impl(timespan timeout, shared_callback_ptr<void(bool)> on_result);

  class impl;

  intrusive_ptr<impl> pimpl_;
};

} // namespace evsync
