// This file is part of evsync, the event-loop synchronization library. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#define EVSYNC_LOG_COMPONENT "evsync.event-loop"

#include "evsync/event_loop.hpp"

#include "evsync/detail/assert.hpp"
#include "evsync/detail/set_thread_name.hpp"
#include "evsync/logger.hpp"
#include "evsync/make_counted.hpp"
#include "evsync/raise_error.hpp"

#include <algorithm>
#include <stdexcept>

namespace evsync {

namespace {

thread_local event_loop* current_loop;

} // namespace

// -- constructors, destructors, and assignment operators ----------------------

event_loop::event_loop(std::string name) : name_(std::move(name)) {
  // nop
}

event_loop::~event_loop() {
  EVSYNC_ASSERT(!worker_.joinable());
}

// -- factory functions --------------------------------------------------------

event_loop_ptr event_loop::make(std::string_view name) {
  return make_counted<event_loop>(std::string{name});
}

// -- lifetime management ------------------------------------------------------

void event_loop::start() {
  {
    lock_type guard{mtx_};
    if (state_ != state::idle)
      EVSYNC_RAISE_ERROR(std::logic_error,
                         "event_loop::start: loop was started before");
    state_ = state::running;
  }
  EVSYNC_LOG_INFO("start event loop" << EVSYNC_ARG2("name", name_));
  // The worker keeps the loop alive until `stop` joins it.
  worker_ = std::thread{[self = event_loop_ptr{this}] { self->run(); }};
}

void event_loop::stop() {
  if (current_loop == this)
    EVSYNC_RAISE_ERROR(std::logic_error,
                       "event_loop::stop: called from the worker thread");
  {
    lock_type guard{mtx_};
    if (state_ != state::running)
      return;
    state_ = state::stopped;
  }
  cv_.notify_one();
  worker_.join();
  worker_ = std::thread{};
  EVSYNC_LOG_INFO("stopped event loop" << EVSYNC_ARG2("name", name_));
}

// -- properties ---------------------------------------------------------------

bool event_loop::running() const {
  lock_type guard{mtx_};
  return state_ == state::running;
}

event_loop* event_loop::current() noexcept {
  return current_loop;
}

// -- implementation of execution_context --------------------------------------

void event_loop::ref_execution_context() const noexcept {
  ref();
}

void event_loop::deref_execution_context() const noexcept {
  deref();
}

void event_loop::schedule(action what) {
  if (!what)
    return;
  {
    lock_type guard{mtx_};
    if (state_ != state::stopped) {
      actions_.emplace_back(std::move(what));
      if (actions_.size() == 1)
        cv_.notify_one();
      return;
    }
  }
  EVSYNC_LOG_DEBUG("schedule: event loop is stopped, disposing action");
  what.dispose();
}

// -- implementation of scheduler ----------------------------------------------

execution_context_ptr event_loop::current_context() {
  if (current_loop != nullptr)
    return execution_context_ptr{current_loop};
  return execution_context_ptr{this};
}

disposable event_loop::schedule(time_point timeout, action callback) {
  if (!callback)
    return {};
  // Only wake up the worker if the new timeout is the next one to expire.
  auto added = false;
  auto do_wakeup = false;
  {
    lock_type guard{mtx_};
    if (state_ != state::stopped) {
      do_wakeup = timers_.empty() || timeout < timers_.front().timeout;
      push_timer({timeout, callback});
      added = true;
    }
  }
  if (!added) {
    EVSYNC_LOG_DEBUG("schedule: event loop is stopped, disposing timer");
    callback.dispose();
    return {};
  }
  if (do_wakeup)
    cv_.notify_one();
  return std::move(callback).as_disposable();
}

// -- private utility functions ------------------------------------------------

void event_loop::run() {
  detail::set_thread_name(name_.c_str());
  current_loop = this;
  EVSYNC_LOG_DEBUG("worker thread started" << EVSYNC_ARG2("name", name_));
  lock_type guard{mtx_};
  for (;;) {
    if (!actions_.empty()) {
      auto fn = std::move(actions_.front());
      actions_.pop_front();
      guard.unlock();
      fn.run();
      guard.lock();
      continue;
    }
    // Posted actions drain before shutting down, but timers never fire after
    // `stop` has been called.
    if (state_ == state::stopped)
      break;
    if (timers_.empty()) {
      cv_.wait(guard);
      continue;
    }
    auto next_timeout = timers_.front().timeout;
    if (now() >= next_timeout) {
      auto fn = std::move(timers_.front().callback);
      pop_timer();
      guard.unlock();
      fn.run();
      guard.lock();
    } else if (next_timeout == time_point::max()) {
      cv_.wait(guard);
    } else {
      cv_.wait_until(guard, next_timeout);
    }
  }
  std::vector<timer> dropped;
  dropped.swap(timers_);
  guard.unlock();
  EVSYNC_LOG_DEBUG_IF(!dropped.empty(),
                      "dispose" << dropped.size() << "pending timers");
  for (auto& x : dropped)
    x.callback.dispose();
  current_loop = nullptr;
}

void event_loop::push_timer(timer x) {
  timers_.emplace_back(std::move(x));
  std::push_heap(timers_.begin(), timers_.end(), timer_less);
}

void event_loop::pop_timer() {
  std::pop_heap(timers_.begin(), timers_.end(), timer_less);
  timers_.pop_back();
}

} // namespace evsync
