// This file is part of evsync, the event-loop synchronization library. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#pragma once

#include "evsync/action.hpp"
#include "evsync/disposable.hpp"
#include "evsync/execution_context.hpp"
#include "evsync/intrusive_ptr.hpp"
#include "evsync/ref_counted.hpp"
#include "evsync/scheduler.hpp"
#include "evsync/test/test_export.hpp"
#include "evsync/timespan.hpp"

#include <cstddef>
#include <deque>
#include <map>
#include <string>
#include <utility>

namespace evsync::test::fixture {

/// A deterministic fixture for running asynchronous code step by step. The
/// fixture replaces threads with named execution contexts that share a single
/// run queue and replaces the clock with a virtual clock that only moves when
/// calling `advance_time`.
class EVSYNC_TEST_EXPORT deterministic {
public:
  // -- member types -----------------------------------------------------------

  /// A named execution context that enqueues its actions to the fixture.
  class EVSYNC_TEST_EXPORT context : public ref_counted,
                                     public execution_context {
  public:
    context(deterministic* fix, std::string name);

    const std::string& name() const noexcept {
      return name_;
    }

    void ref_execution_context() const noexcept override;

    void deref_execution_context() const noexcept override;

    void schedule(action what) override;

    friend void intrusive_ptr_add_ref(const context* ptr) noexcept {
      ptr->ref();
    }

    friend void intrusive_ptr_release(const context* ptr) noexcept {
      ptr->deref();
    }

  private:
    deterministic* fix_;
    std::string name_;
  };

  using context_ptr = intrusive_ptr<context>;

  // -- constructors, destructors, and assignment operators --------------------

  deterministic();

  deterministic(const deterministic&) = delete;

  deterministic& operator=(const deterministic&) = delete;

  virtual ~deterministic();

  // -- contexts ---------------------------------------------------------------

  /// Creates a new execution context.
  context_ptr make_context(std::string name);

  /// Returns the context that runs the test body.
  const context_ptr& main_context() const noexcept {
    return main_;
  }

  /// Returns the context that currently runs code.
  context* current() const noexcept {
    return current_;
  }

  /// Runs `fn` as if it were called from `ctx`.
  template <class F>
  void on(const context_ptr& ctx, F&& fn) {
    auto prev = std::exchange(current_, ctx.get());
    auto guard = restore_guard{this, prev};
    fn();
  }

  // -- scheduler --------------------------------------------------------------

  /// Returns the scheduler for the synchronization primitives under test.
  scheduler& sched() noexcept {
    return sched_;
  }

  // -- run queue --------------------------------------------------------------

  /// Runs the oldest pending action on its context.
  /// @returns `false` if no action was pending.
  bool dispatch_action();

  /// Runs pending actions until the run queue becomes empty.
  /// @returns the number of actions that ran.
  size_t dispatch_actions();

  /// Returns the number of pending actions.
  size_t pending_actions() const noexcept {
    return actions_.size();
  }

  /// Returns the number of pending actions for `ctx`.
  size_t pending_actions(const context_ptr& ctx) const noexcept;

  // -- virtual time -----------------------------------------------------------

  /// Returns the number of timers that are neither expired nor disposed.
  size_t pending_timers() const noexcept;

  /// Moves the virtual clock forward by `amount` and fires all timers that
  /// expire on the way in order of their timeouts.
  /// @returns the number of timers that fired.
  size_t advance_time(timespan amount);

  /// Returns the current virtual time.
  scheduler::time_point now() const noexcept {
    return now_;
  }

private:
  struct restore_guard {
    deterministic* fix;
    context* prev;
    ~restore_guard() {
      fix->current_ = prev;
    }
  };

  class fake_scheduler : public scheduler {
  public:
    explicit fake_scheduler(deterministic* fix) : fix_(fix) {
      // nop
    }

    execution_context_ptr current_context() override;

    time_point now() const noexcept override;

    disposable schedule(time_point timeout, action callback) override;

  private:
    deterministic* fix_;
  };

  using timer_map = std::multimap<scheduler::time_point, action>;

  fake_scheduler sched_;

  context_ptr main_;

  context* current_ = nullptr;

  std::deque<std::pair<context_ptr, action>> actions_;

  timer_map timers_;

  scheduler::time_point now_;
};

} // namespace evsync::test::fixture
