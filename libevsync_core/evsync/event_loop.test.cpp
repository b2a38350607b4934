// This file is part of evsync, the event-loop synchronization library. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#include "evsync/event_loop.hpp"

#include "evsync/count_down_latch.hpp"
#include "evsync/semaphore.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <utility>
#include <vector>

using namespace evsync;
using namespace std::literals;

namespace {

constexpr auto max_wait = 5s;

struct event_loop_test : ::testing::Test {
  event_loop_test() : loop(event_loop::make("evsync.test")) {
    loop->start();
  }

  ~event_loop_test() override {
    loop->stop();
  }

  event_loop_ptr loop;
};

} // namespace

TEST_F(event_loop_test, loops_run_posted_actions_in_order) {
  std::vector<int> xs;
  for (int i = 0; i < 5; ++i)
    loop->schedule_fn([&xs, i] { xs.push_back(i); });
  // Stopping the loop drains all pending actions.
  loop->stop();
  EXPECT_FALSE(loop->running());
  EXPECT_EQ(xs, (std::vector<int>{0, 1, 2, 3, 4}));
}

TEST_F(event_loop_test, loops_know_their_name_and_state) {
  EXPECT_EQ(loop->name(), "evsync.test");
  EXPECT_TRUE(loop->running());
  EXPECT_EQ(event_loop::current(), nullptr);
}

TEST_F(event_loop_test, current_returns_the_loop_on_its_worker_thread) {
  std::promise<event_loop*> res;
  loop->schedule_fn([&res] { res.set_value(event_loop::current()); });
  auto fut = res.get_future();
  ASSERT_EQ(fut.wait_for(max_wait), std::future_status::ready);
  EXPECT_EQ(fut.get(), loop.get());
}

TEST_F(event_loop_test, current_context_returns_the_loop_of_the_caller) {
  auto other = event_loop::make("evsync.other");
  other->start();
  EXPECT_EQ(other->current_context(), other);
  std::promise<execution_context_ptr> res;
  loop->schedule_fn([&res, other] { res.set_value(other->current_context()); });
  auto fut = res.get_future();
  ASSERT_EQ(fut.wait_for(max_wait), std::future_status::ready);
  EXPECT_EQ(fut.get(), loop);
  other->stop();
}

TEST_F(event_loop_test, timers_fire_after_their_timeout) {
  std::promise<scheduler::time_point> res;
  auto start = loop->now();
  loop->delay_for(5ms, make_single_shot_action([this, &res] {
                    res.set_value(loop->now());
                  }));
  auto fut = res.get_future();
  ASSERT_EQ(fut.wait_for(max_wait), std::future_status::ready);
  EXPECT_GE(fut.get() - start, 5ms);
}

TEST_F(event_loop_test, disposed_timers_never_fire) {
  std::atomic<bool> disposed_fired = false;
  std::promise<void> res;
  auto hdl = loop->delay_for(1ms, make_single_shot_action([&disposed_fired] {
                               disposed_fired = true;
                             }));
  hdl.dispose();
  loop->delay_for(10ms, make_single_shot_action([&res] { res.set_value(); }));
  auto fut = res.get_future();
  ASSERT_EQ(fut.wait_for(max_wait), std::future_status::ready);
  EXPECT_FALSE(disposed_fired);
}

TEST_F(event_loop_test, stopped_loops_dispose_new_actions_and_timers) {
  loop->stop();
  auto called = false;
  auto fn = make_action([&called] { called = true; });
  loop->schedule(fn);
  EXPECT_TRUE(fn.disposed());
  auto hdl = loop->delay_for(1ms, make_action([&called] { called = true; }));
  EXPECT_FALSE(hdl.valid());
  EXPECT_FALSE(called);
}

TEST_F(event_loop_test, stop_disposes_pending_timers) {
  auto fn = make_single_shot_action([] {});
  loop->delay_for(1h, fn);
  loop->stop();
  EXPECT_TRUE(fn.disposed());
}

TEST_F(event_loop_test, semaphore_timeouts_fire_on_the_loop) {
  semaphore sem{*loop, 1};
  std::promise<std::pair<bool, event_loop*>> res;
  sem.try_acquire(2, 5ms, [&res](bool x) {
    res.set_value(std::make_pair(x, event_loop::current()));
  });
  auto fut = res.get_future();
  ASSERT_EQ(fut.wait_for(max_wait), std::future_status::ready);
  auto [acquired, resumed_on] = fut.get();
  EXPECT_FALSE(acquired);
  EXPECT_EQ(resumed_on, loop.get());
  EXPECT_EQ(sem.queue_length(), 0u);
  EXPECT_EQ(sem.available_permits(), 1);
}

TEST_F(event_loop_test, timeouts_near_the_clock_limit_never_fire_early) {
  semaphore sem{*loop, 0};
  std::promise<bool> res;
  sem.try_acquire(1, infinite - timespan{1},
                  [&res](bool x) { res.set_value(x); });
  auto fut = res.get_future();
  EXPECT_EQ(fut.wait_for(100ms), std::future_status::timeout);
  EXPECT_EQ(sem.queue_length(), 1u);
  sem.release();
  ASSERT_EQ(fut.wait_for(max_wait), std::future_status::ready);
  EXPECT_TRUE(fut.get());
  EXPECT_EQ(sem.queue_length(), 0u);
}

TEST_F(event_loop_test, zero_timeouts_on_the_loop_thread_report_false) {
  semaphore sem{*loop, 0};
  std::promise<bool> res;
  loop->schedule_fn([&res, sem]() mutable {
    sem.try_acquire(1, 0ms, [&res](bool x) { res.set_value(x); });
  });
  auto fut = res.get_future();
  ASSERT_EQ(fut.wait_for(max_wait), std::future_status::ready);
  EXPECT_FALSE(fut.get());
  EXPECT_EQ(sem.queue_length(), 0u);
}

TEST_F(event_loop_test, releases_from_other_threads_resume_on_the_waiting_loop) {
  semaphore sem{*loop, 0};
  std::promise<event_loop*> res;
  loop->schedule_fn([&res, sem]() mutable {
    sem.acquire(make_action([&res] { res.set_value(event_loop::current()); }));
  });
  // Wait until the loop parked the request.
  std::promise<void> sync;
  loop->schedule_fn([&sync] { sync.set_value(); });
  ASSERT_EQ(sync.get_future().wait_for(max_wait), std::future_status::ready);
  EXPECT_EQ(sem.queue_length(), 1u);
  sem.release();
  auto fut = res.get_future();
  ASSERT_EQ(fut.wait_for(max_wait), std::future_status::ready);
  EXPECT_EQ(fut.get(), loop.get());
}

TEST_F(event_loop_test, latches_release_waiters_on_multiple_loops) {
  auto other = event_loop::make("evsync.other");
  other->start();
  count_down_latch latch{*loop, 2};
  std::promise<event_loop*> res1;
  std::promise<event_loop*> res2;
  auto await_on = [latch](std::promise<event_loop*>& res) mutable {
    latch.await(make_action([&res] { res.set_value(event_loop::current()); }));
  };
  std::promise<void> registered1;
  std::promise<void> registered2;
  loop->schedule_fn([&, await_on]() mutable {
    await_on(res1);
    registered1.set_value();
  });
  other->schedule_fn([&, await_on]() mutable {
    await_on(res2);
    registered2.set_value();
  });
  ASSERT_EQ(registered1.get_future().wait_for(max_wait),
            std::future_status::ready);
  ASSERT_EQ(registered2.get_future().wait_for(max_wait),
            std::future_status::ready);
  latch.count_down();
  latch.count_down();
  auto fut1 = res1.get_future();
  auto fut2 = res2.get_future();
  ASSERT_EQ(fut1.wait_for(max_wait), std::future_status::ready);
  ASSERT_EQ(fut2.wait_for(max_wait), std::future_status::ready);
  EXPECT_EQ(fut1.get(), loop.get());
  EXPECT_EQ(fut2.get(), other.get());
  other->stop();
}

#ifdef EVSYNC_ENABLE_EXCEPTIONS

TEST_F(event_loop_test, lifecycle_misuse_raises_logic_error) {
  EXPECT_THROW(loop->start(), std::logic_error);
  std::promise<bool> res;
  loop->schedule_fn([this, &res] {
    try {
      loop->stop();
      res.set_value(false);
    } catch (const std::logic_error&) {
      res.set_value(true);
    }
  });
  auto fut = res.get_future();
  ASSERT_EQ(fut.wait_for(max_wait), std::future_status::ready);
  EXPECT_TRUE(fut.get());
  EXPECT_TRUE(loop->running());
}

#endif // EVSYNC_ENABLE_EXCEPTIONS
