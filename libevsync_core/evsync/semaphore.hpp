// This file is part of evsync, the event-loop synchronization library. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#pragma once

#include "evsync/action.hpp"
#include "evsync/callback.hpp"
#include "evsync/defaults.hpp"
#include "evsync/detail/core_export.hpp"
#include "evsync/fwd.hpp"
#include "evsync/intrusive_ptr.hpp"
#include "evsync/timespan.hpp"

#include <cstddef>
#include <type_traits>
#include <utility>

namespace evsync {

/// A counting semaphore for event-loop programs. Instead of blocking the
/// calling thread, a request that cannot acquire its permits right away parks
/// a continuation that runs on the execution context of the caller once a
/// `release` makes enough permits available.
///
/// In fair mode, the semaphore grants parked requests in strict arrival order.
/// Otherwise, the semaphore always grants the smallest parked request first
/// (requests of equal size in arrival order).
///
/// Instances of this class are handles: copies refer to the same semaphore.
/// @thread-safe
class EVSYNC_CORE_EXPORT semaphore {
public:
  // -- constructors, destructors, and assignment operators --------------------

  /// Creates a new semaphore.
  /// @param sched Provides execution contexts and timeouts. Must outlive the
  ///              semaphore and all of its pending timeouts.
  /// @param permits The initial number of permits. May be negative, in which
  ///                case `release` must be called before any grant.
  /// @param fair Selects strict arrival-order service.
  semaphore(scheduler& sched, int permits,
            bool fair = defaults::semaphore::fair);

  semaphore(semaphore&&) noexcept;

  semaphore(const semaphore&) noexcept;

  semaphore& operator=(semaphore&&) noexcept;

  semaphore& operator=(const semaphore&) noexcept;

  ~semaphore();

  // -- acquiring permits ------------------------------------------------------

  /// Acquires `permits` and then schedules `on_acquired` to the execution
  /// context of the caller. Parks the request if not enough permits are
  /// available. Never blocks.
  /// @throws std::invalid_argument if `permits` is negative.
  void acquire(int permits, action on_acquired);

  /// Acquires a single permit.
  /// @copydetails acquire(int, action)
  void acquire(action on_acquired);

  /// Acquires `permits` only if that many permits are available at the time
  /// of the call. Never parks a request and may take permits even while other
  /// requests are waiting.
  /// @throws std::invalid_argument if `permits` is negative.
  [[nodiscard]] bool try_acquire(int permits);

  /// Acquires a single permit only if it is available at the time of the call.
  [[nodiscard]] bool try_acquire();

  /// Like `try_acquire(permits)`, but additionally schedules `on_acquired` to
  /// the execution context of the caller on success.
  /// @throws std::invalid_argument if `permits` is negative.
  bool try_acquire(int permits, action on_acquired);

  /// Acquires `permits` within `timeout` and calls `on_result` on the
  /// execution context of the caller with `true` on success or with `false`
  /// after the timeout expired. Calls `on_result` exactly once.
  /// @throws std::invalid_argument if `permits` or `timeout` is negative.
  template <class F>
  void try_acquire(int permits, timespan timeout, F on_result) {
    static_assert(std::is_invocable_v<F, bool>,
                  "on_result must be callable with a bool argument");
    try_acquire_impl(permits, timeout,
                     make_shared_type_erased_callback<void(bool)>(
                       std::move(on_result)));
  }

  /// Acquires a single permit within `timeout`.
  /// @copydetails try_acquire(int, timespan, F)
  template <class F>
  void try_acquire(timespan timeout, F on_result) {
    try_acquire(1, timeout, std::move(on_result));
  }

  // -- releasing permits ------------------------------------------------------

  /// Returns `permits` to the semaphore and grants as many parked requests as
  /// possible. The continuation of each granted request runs on the execution
  /// context of the request.
  /// @throws std::invalid_argument if `permits` is negative.
  void release(int permits);

  /// Returns a single permit to the semaphore.
  void release();

  /// Sets the number of available permits to zero and returns the previous
  /// value. Does not affect parked requests.
  int drain_permits();

  // -- properties -------------------------------------------------------------

  /// Returns the number of parked requests.
  [[nodiscard]] size_t queue_length() const;

  /// Returns the number of currently available permits.
  [[nodiscard]] int available_permits() const;

  /// Returns whether this semaphore serves parked requests in arrival order.
  [[nodiscard]] bool fair() const noexcept;

private:
  void try_acquire_impl(int permits, timespan timeout,
                        shared_callback_ptr<void(bool)> on_result);

  class impl;

  intrusive_ptr<impl> pimpl_;
};

} // namespace evsync
