// This file is part of evsync, the event-loop synchronization library. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#pragma once

#include "evsync/action.hpp"
#include "evsync/detail/core_export.hpp"
#include "evsync/intrusive_ptr.hpp"

#include <type_traits>
#include <utility>

namespace evsync {

/// Represents a single execution context with an internal event-loop to
/// schedule @ref action objects. Actions scheduled to the same context never
/// run concurrently.
class EVSYNC_CORE_EXPORT execution_context {
public:
  // -- constructors, destructors, and assignment operators --------------------

  virtual ~execution_context();

  // -- reference counting -----------------------------------------------------

  /// Increases the reference count of the execution_context.
  virtual void ref_execution_context() const noexcept = 0;

  /// Decreases the reference count of the execution context and destroys the
  /// object if necessary.
  virtual void deref_execution_context() const noexcept = 0;

  // -- scheduling of actions --------------------------------------------------

  /// Schedules @p what to run on the event loop of the execution context. This
  /// member function may get called from external sources or threads. The
  /// action never runs before `schedule` returns.
  /// @thread-safe
  virtual void schedule(action what) = 0;

  ///@copydoc schedule
  template <class F>
  void schedule_fn(F&& what) {
    static_assert(std::is_invocable_v<F>);
    return schedule(make_action(std::forward<F>(what)));
  }
};

/// @relates execution_context
inline void intrusive_ptr_add_ref(const execution_context* ptr) noexcept {
  ptr->ref_execution_context();
}

/// @relates execution_context
inline void intrusive_ptr_release(const execution_context* ptr) noexcept {
  ptr->deref_execution_context();
}

/// @relates execution_context
using execution_context_ptr = intrusive_ptr<execution_context>;

} // namespace evsync
