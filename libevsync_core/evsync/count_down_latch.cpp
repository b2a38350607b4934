// This file is part of evsync, the event-loop synchronization library. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#define EVSYNC_LOG_COMPONENT "evsync.latch"

#include "evsync/count_down_latch.hpp"

#include "evsync/detail/waiter.hpp"
#include "evsync/execution_context.hpp"
#include "evsync/logger.hpp"
#include "evsync/make_counted.hpp"
#include "evsync/raise_error.hpp"
#include "evsync/ref_counted.hpp"
#include "evsync/scheduler.hpp"

#include <mutex>
#include <stdexcept>
#include <vector>

namespace evsync {

class count_down_latch::impl : public ref_counted {
public:
  impl(scheduler& sched, int count) : sched(sched), count(count) {
    // nop
  }

  void on_timeout(const detail::waiter_ptr& w,
                  const shared_callback_ptr<void(bool)>& on_result) {
    {
      std::lock_guard<std::mutex> guard{mtx};
      if (!detail::remove_waiter(waiters, w))
        return;
    }
    EVSYNC_LOG_DEBUG("timeout while waiting for the latch");
    w->fire(make_single_shot_action([on_result] { (*on_result)(false); }));
  }

  scheduler& sched;
  mutable std::mutex mtx;
  int count;
  std::vector<detail::waiter_ptr> waiters;
};

count_down_latch::count_down_latch(scheduler& sched, int count) {
  if (count < 0)
    EVSYNC_RAISE_ERROR(std::invalid_argument,
                       "count_down_latch: count must not be negative");
  pimpl_ = make_counted<impl>(sched, count);
}

count_down_latch::count_down_latch(count_down_latch&&) noexcept = default;

count_down_latch::count_down_latch(const count_down_latch&) noexcept = default;

count_down_latch&
count_down_latch::operator=(count_down_latch&&) noexcept = default;

count_down_latch&
count_down_latch::operator=(const count_down_latch&) noexcept = default;

count_down_latch::~count_down_latch() {
  // nop
}

void count_down_latch::count_down() {
  EVSYNC_LOG_TRACE("");
  std::vector<detail::waiter_ptr> released;
  {
    std::lock_guard<std::mutex> guard{pimpl_->mtx};
    if (pimpl_->count == 0)
      return;
    if (--pimpl_->count > 0)
      return;
    released.swap(pimpl_->waiters);
  }
  EVSYNC_LOG_DEBUG("latch reached zero:" << EVSYNC_ARG2("waiters",
                                                       released.size()));
  for (auto& w : released)
    w->fire();
}

void count_down_latch::await(action on_zero) {
  EVSYNC_LOG_TRACE("");
  auto ctx = pimpl_->sched.current_context();
  {
    std::lock_guard<std::mutex> guard{pimpl_->mtx};
    if (pimpl_->count > 0) {
      pimpl_->waiters.emplace_back(
        make_counted<detail::waiter>(std::move(ctx), std::move(on_zero)));
      return;
    }
  }
  ctx->schedule(std::move(on_zero));
}

void count_down_latch::await_impl(timespan timeout,
                                  shared_callback_ptr<void(bool)> on_result) {
  EVSYNC_LOG_TRACE(EVSYNC_ARG2("timeout", timeout.count()));
  if (timeout < timespan::zero())
    EVSYNC_RAISE_ERROR(std::invalid_argument,
                       "count_down_latch::await: timeout must not be negative");
  auto ctx = pimpl_->sched.current_context();
  auto on_zero = make_single_shot_action([on_result] { (*on_result)(true); });
  {
    std::lock_guard<std::mutex> guard{pimpl_->mtx};
    if (pimpl_->count > 0) {
      auto w = make_counted<detail::waiter>(std::move(ctx), std::move(on_zero));
      if (!is_infinite(timeout)) {
        auto on_timeout = make_single_shot_action(
          [self = pimpl_, w, on_result] { self->on_timeout(w, on_result); });
        w->timeout(pimpl_->sched.delay_for(timeout, std::move(on_timeout)));
      }
      pimpl_->waiters.emplace_back(std::move(w));
      return;
    }
  }
  ctx->schedule(std::move(on_zero));
}

int count_down_latch::count() const {
  std::lock_guard<std::mutex> guard{pimpl_->mtx};
  return pimpl_->count;
}

} // namespace evsync
