// This file is part of evsync, the event-loop synchronization library. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#include "evsync/scheduler.hpp"

namespace evsync {

scheduler::~scheduler() {
  // nop
}

scheduler::time_point scheduler::now() const noexcept {
  return clock_type::now();
}

disposable scheduler::delay_for(timespan rel_timeout, action f) {
  auto t0 = now();
  // Deadlines past the end of the clock saturate and never fire.
  if (is_infinite(rel_timeout) || rel_timeout >= time_point::max() - t0)
    return schedule(time_point::max(), std::move(f));
  return schedule(t0 + std::chrono::duration_cast<duration_type>(rel_timeout),
                  std::move(f));
}

} // namespace evsync
