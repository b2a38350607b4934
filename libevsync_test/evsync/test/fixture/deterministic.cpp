// This file is part of evsync, the event-loop synchronization library. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#include "evsync/test/fixture/deterministic.hpp"

#include "evsync/make_counted.hpp"

#include <algorithm>

namespace evsync::test::fixture {

// -- context ------------------------------------------------------------------

deterministic::context::context(deterministic* fix, std::string name)
  : fix_(fix), name_(std::move(name)) {
  // nop
}

void deterministic::context::ref_execution_context() const noexcept {
  ref();
}

void deterministic::context::deref_execution_context() const noexcept {
  deref();
}

void deterministic::context::schedule(action what) {
  if (!what)
    return;
  fix_->actions_.emplace_back(context_ptr{this}, std::move(what));
}

// -- fake_scheduler -----------------------------------------------------------

execution_context_ptr deterministic::fake_scheduler::current_context() {
  if (fix_->current_ != nullptr)
    return execution_context_ptr{fix_->current_};
  return fix_->main_;
}

scheduler::time_point deterministic::fake_scheduler::now() const noexcept {
  return fix_->now_;
}

disposable deterministic::fake_scheduler::schedule(time_point timeout,
                                                   action callback) {
  auto result = callback.as_disposable();
  fix_->timers_.emplace(timeout, std::move(callback));
  return result;
}

// -- deterministic ------------------------------------------------------------

deterministic::deterministic() : sched_(this) {
  main_ = make_context("main");
  current_ = main_.get();
}

deterministic::~deterministic() {
  // Break reference cycles between pending actions and their owners.
  for (auto& entry : actions_)
    entry.second.dispose();
  for (auto& entry : timers_)
    entry.second.dispose();
}

deterministic::context_ptr deterministic::make_context(std::string name) {
  return make_counted<context>(this, std::move(name));
}

bool deterministic::dispatch_action() {
  if (actions_.empty())
    return false;
  auto entry = std::move(actions_.front());
  actions_.pop_front();
  on(entry.first, [&entry] { entry.second.run(); });
  return true;
}

size_t deterministic::dispatch_actions() {
  size_t result = 0;
  while (dispatch_action())
    ++result;
  return result;
}

size_t
deterministic::pending_actions(const context_ptr& ctx) const noexcept {
  return static_cast<size_t>(
    std::count_if(actions_.begin(), actions_.end(),
                  [&ctx](const auto& x) { return x.first == ctx; }));
}

size_t deterministic::pending_timers() const noexcept {
  return static_cast<size_t>(
    std::count_if(timers_.begin(), timers_.end(),
                  [](const auto& x) { return !x.second.disposed(); }));
}

size_t deterministic::advance_time(timespan amount) {
  auto target = now_ + std::chrono::duration_cast<scheduler::duration_type>(
                         amount);
  size_t result = 0;
  while (!timers_.empty() && timers_.begin()->first <= target) {
    auto i = timers_.begin();
    now_ = i->first;
    auto fn = std::move(i->second);
    timers_.erase(i);
    if (fn.disposed())
      continue;
    // Timers run outside of any context.
    auto prev = std::exchange(current_, nullptr);
    auto guard = restore_guard{this, prev};
    fn.run();
    ++result;
  }
  now_ = target;
  return result;
}

} // namespace evsync::test::fixture
