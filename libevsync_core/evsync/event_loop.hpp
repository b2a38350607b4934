// This file is part of evsync, the event-loop synchronization library. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#pragma once

#include "evsync/action.hpp"
#include "evsync/defaults.hpp"
#include "evsync/detail/atomic_ref_counted.hpp"
#include "evsync/detail/core_export.hpp"
#include "evsync/disposable.hpp"
#include "evsync/execution_context.hpp"
#include "evsync/fwd.hpp"
#include "evsync/intrusive_ptr.hpp"
#include "evsync/scheduler.hpp"

#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace evsync {

/// A single-threaded event loop that runs posted actions in FIFO order and
/// fires one-shot timers. Each event loop acts as execution context and as
/// scheduler for the synchronization primitives.
class EVSYNC_CORE_EXPORT event_loop : public detail::atomic_ref_counted,
                                      public execution_context,
                                      public scheduler {
public:
  // -- constructors, destructors, and assignment operators --------------------

  explicit event_loop(std::string name);

  event_loop(const event_loop&) = delete;

  event_loop& operator=(const event_loop&) = delete;

  ~event_loop() override;

  // -- factory functions ------------------------------------------------------

  /// Creates a new event loop. Users must call `start` before the loop runs
  /// any action and `stop` before dropping the last reference.
  static event_loop_ptr make(std::string_view name
                             = defaults::event_loop::name);

  // -- lifetime management ----------------------------------------------------

  /// Launches the worker thread.
  /// @throws std::logic_error if the loop was started before.
  void start();

  /// Runs all actions posted before this call, disposes all pending timers
  /// and joins the worker thread. Actions posted afterwards get disposed. A
  /// no-op if the loop is not running.
  /// @throws std::logic_error when called from the worker thread of this loop.
  void stop();

  // -- properties -------------------------------------------------------------

  /// Returns whether the worker thread is running.
  [[nodiscard]] bool running() const;

  [[nodiscard]] const std::string& name() const noexcept {
    return name_;
  }

  /// Returns the event loop that runs the calling thread or `nullptr` if the
  /// calling thread belongs to no event loop.
  static event_loop* current() noexcept;

  // -- implementation of execution_context ------------------------------------

  void ref_execution_context() const noexcept override;

  void deref_execution_context() const noexcept override;

  void schedule(action what) override;

  // -- implementation of scheduler --------------------------------------------

  /// Returns the event loop of the calling thread if there is one or this
  /// loop otherwise.
  execution_context_ptr current_context() override;

  disposable schedule(time_point timeout, action callback) override;

  // -- reference counting -----------------------------------------------------

  friend void intrusive_ptr_add_ref(const event_loop* ptr) noexcept {
    ptr->ref();
  }

  friend void intrusive_ptr_release(const event_loop* ptr) noexcept {
    ptr->deref();
  }

private:
  enum class state {
    idle,
    running,
    stopped,
  };

  struct timer {
    time_point timeout;
    action callback;
  };

  using lock_type = std::unique_lock<std::mutex>;

  /// Comparator for min-heap (smallest timeout at front).
  static bool timer_less(const timer& lhs, const timer& rhs) noexcept {
    return lhs.timeout > rhs.timeout;
  }

  void run();

  /// @pre `mtx_` is locked
  void push_timer(timer x);

  /// @pre `mtx_` is locked
  void pop_timer();

  std::string name_;

  /// Guards all member variables below.
  mutable std::mutex mtx_;

  /// Signals the worker thread to wake up.
  std::condition_variable cv_;

  state state_ = state::idle;

  /// Actions that are ready to run.
  std::deque<action> actions_;

  /// Min-heap of pending timers.
  std::vector<timer> timers_;

  std::thread worker_;
};

} // namespace evsync
