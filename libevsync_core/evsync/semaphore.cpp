// This file is part of evsync, the event-loop synchronization library. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#define EVSYNC_LOG_COMPONENT "evsync.semaphore"

#include "evsync/semaphore.hpp"

#include "evsync/detail/waiter.hpp"
#include "evsync/execution_context.hpp"
#include "evsync/logger.hpp"
#include "evsync/make_counted.hpp"
#include "evsync/raise_error.hpp"
#include "evsync/ref_counted.hpp"
#include "evsync/scheduler.hpp"

#include <algorithm>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace evsync {

// -- implementation class -----------------------------------------------------

class semaphore::impl : public ref_counted {
public:
  impl(scheduler& sched, int permits, bool fair)
    : sched(sched), available(permits), fair(fair) {
    // nop
  }

  /// Parks `w` according to the fairness policy.
  /// @pre `mtx` is locked
  void enqueue(detail::waiter_ptr w) {
    if (fair) {
      pending.push_back(std::move(w));
      return;
    }
    // Keep the queue sorted by request size. Inserting before the first larger
    // request puts `w` behind all requests of equal size.
    auto n = w->permits();
    auto pos = std::find_if(pending.begin(), pending.end(),
                            [n](const detail::waiter_ptr& x) {
                              return x->permits() > n;
                            });
    pending.insert(pos, std::move(w));
  }

  /// Moves all satisfiable waiters from the head of the queue to `granted`.
  /// @pre `mtx` is locked
  void grant(std::vector<detail::waiter_ptr>& granted) {
    while (!pending.empty() && pending.front()->permits() <= available) {
      available -= pending.front()->permits();
      granted.emplace_back(std::move(pending.front()));
      pending.pop_front();
    }
  }

  /// Called by the timer of `w`. Delivers `false` to `on_result` unless a
  /// release granted `w` first.
  void on_timeout(const detail::waiter_ptr& w,
                  const shared_callback_ptr<void(bool)>& on_result) {
    {
      std::lock_guard<std::mutex> guard{mtx};
      if (!detail::remove_waiter(pending, w)) {
        EVSYNC_LOG_DEBUG("timeout lost the race against a release");
        return;
      }
    }
    EVSYNC_LOG_DEBUG("timeout for waiter:" << EVSYNC_ARG2("permits",
                                                         w->permits()));
    w->fire(make_single_shot_action([on_result] { (*on_result)(false); }));
  }

  scheduler& sched;
  mutable std::mutex mtx;
  int available;
  const bool fair;
  std::deque<detail::waiter_ptr> pending;
};

// -- constructors, destructors, and assignment operators ----------------------

semaphore::semaphore(scheduler& sched, int permits, bool fair)
  : pimpl_(make_counted<impl>(sched, permits, fair)) {
  EVSYNC_LOG_DEBUG("new semaphore:" << EVSYNC_ARG(permits) << EVSYNC_ARG(fair));
}

semaphore::semaphore(semaphore&&) noexcept = default;

semaphore::semaphore(const semaphore&) noexcept = default;

semaphore& semaphore::operator=(semaphore&&) noexcept = default;

semaphore& semaphore::operator=(const semaphore&) noexcept = default;

semaphore::~semaphore() {
  // nop
}

// -- acquiring permits --------------------------------------------------------

void semaphore::acquire(int permits, action on_acquired) {
  EVSYNC_LOG_TRACE(EVSYNC_ARG(permits));
  if (permits < 0)
    EVSYNC_RAISE_ERROR(std::invalid_argument,
                       "semaphore::acquire: permits must not be negative");
  auto ctx = pimpl_->sched.current_context();
  {
    std::lock_guard<std::mutex> guard{pimpl_->mtx};
    if (permits > pimpl_->available) {
      EVSYNC_LOG_DEBUG("park request:" << EVSYNC_ARG(permits)
                                       << EVSYNC_ARG2("available",
                                                      pimpl_->available));
      pimpl_->enqueue(make_counted<detail::waiter>(permits, std::move(ctx),
                                                   std::move(on_acquired)));
      return;
    }
    pimpl_->available -= permits;
  }
  ctx->schedule(std::move(on_acquired));
}

void semaphore::acquire(action on_acquired) {
  acquire(1, std::move(on_acquired));
}

bool semaphore::try_acquire(int permits) {
  EVSYNC_LOG_TRACE(EVSYNC_ARG(permits));
  if (permits < 0)
    EVSYNC_RAISE_ERROR(std::invalid_argument,
                       "semaphore::try_acquire: permits must not be negative");
  std::lock_guard<std::mutex> guard{pimpl_->mtx};
  if (permits > pimpl_->available)
    return false;
  pimpl_->available -= permits;
  return true;
}

bool semaphore::try_acquire() {
  return try_acquire(1);
}

bool semaphore::try_acquire(int permits, action on_acquired) {
  if (!try_acquire(permits))
    return false;
  pimpl_->sched.current_context()->schedule(std::move(on_acquired));
  return true;
}

void semaphore::try_acquire_impl(int permits, timespan timeout,
                                 shared_callback_ptr<void(bool)> on_result) {
  EVSYNC_LOG_TRACE(EVSYNC_ARG(permits)
                   << EVSYNC_ARG2("timeout", timeout.count()));
  if (permits < 0)
    EVSYNC_RAISE_ERROR(std::invalid_argument,
                       "semaphore::try_acquire: permits must not be negative");
  if (timeout < timespan::zero())
    EVSYNC_RAISE_ERROR(std::invalid_argument,
                       "semaphore::try_acquire: timeout must not be negative");
  auto ctx = pimpl_->sched.current_context();
  auto on_success = make_single_shot_action([on_result] {
    (*on_result)(true);
  });
  {
    std::lock_guard<std::mutex> guard{pimpl_->mtx};
    if (permits > pimpl_->available) {
      EVSYNC_LOG_DEBUG("park request with timeout:"
                       << EVSYNC_ARG(permits)
                       << EVSYNC_ARG2("available", pimpl_->available));
      auto w = make_counted<detail::waiter>(permits, std::move(ctx),
                                            std::move(on_success));
      // The timer needs our lock before it can touch the queue. Hence, storing
      // the handle before unlocking is safe even if the timeout is very short.
      if (!is_infinite(timeout)) {
        auto on_timeout = make_single_shot_action(
          [self = pimpl_, w, on_result] { self->on_timeout(w, on_result); });
        w->timeout(pimpl_->sched.delay_for(timeout, std::move(on_timeout)));
      }
      pimpl_->enqueue(std::move(w));
      return;
    }
    pimpl_->available -= permits;
  }
  ctx->schedule(std::move(on_success));
}

// -- releasing permits --------------------------------------------------------

void semaphore::release(int permits) {
  EVSYNC_LOG_TRACE(EVSYNC_ARG(permits));
  if (permits < 0)
    EVSYNC_RAISE_ERROR(std::invalid_argument,
                       "semaphore::release: permits must not be negative");
  std::vector<detail::waiter_ptr> granted;
  {
    std::lock_guard<std::mutex> guard{pimpl_->mtx};
    pimpl_->available += permits;
    pimpl_->grant(granted);
  }
  EVSYNC_LOG_DEBUG_IF(!granted.empty(),
                      "granted" << granted.size() << "parked requests");
  for (auto& w : granted)
    w->fire();
}

void semaphore::release() {
  release(1);
}

int semaphore::drain_permits() {
  std::lock_guard<std::mutex> guard{pimpl_->mtx};
  return std::exchange(pimpl_->available, 0);
}

// -- properties ---------------------------------------------------------------

size_t semaphore::queue_length() const {
  std::lock_guard<std::mutex> guard{pimpl_->mtx};
  return pimpl_->pending.size();
}

int semaphore::available_permits() const {
  std::lock_guard<std::mutex> guard{pimpl_->mtx};
  return pimpl_->available;
}

bool semaphore::fair() const noexcept {
  return pimpl_->fair;
}

} // namespace evsync
