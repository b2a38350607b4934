// This file is part of evsync, the event-loop synchronization library. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

// Limits the number of concurrently running jobs with a semaphore and uses a
// count-down latch to detect when all jobs are done.

#include "evsync/count_down_latch.hpp"
#include "evsync/event_loop.hpp"
#include "evsync/logger.hpp"
#include "evsync/semaphore.hpp"

#include <array>
#include <chrono>
#include <cstdlib>
#include <future>
#include <iostream>
#include <mutex>
#include <string>

using namespace evsync;
using namespace std::literals;

namespace {

constexpr int num_jobs = 8;

constexpr int max_concurrent_jobs = 2;

std::mutex print_mtx;

template <class... Ts>
void print(const Ts&... xs) {
  std::lock_guard<std::mutex> guard{print_mtx};
  (std::cout << ... << xs) << std::endl;
}

void start_job(event_loop_ptr loop, semaphore sem, count_down_latch done,
               int id) {
  sem.acquire(make_action([loop, sem, done, id]() mutable {
    print("[", loop->name(), "] job ", id, " started");
    auto duration = std::chrono::milliseconds{10 * (1 + id % 3)};
    loop->delay_for(duration, make_single_shot_action([=]() mutable {
                      print("[", loop->name(), "] job ", id, " finished after ",
                            duration.count(), "ms");
                      sem.release();
                      done.count_down();
                    }));
  }));
}

} // namespace

int main() {
  logger::config cfg;
  cfg.verbosity = log::level::warning;
  logger::current_logger(logger::make(cfg));
  auto loops = std::array<event_loop_ptr, 2>{event_loop::make("worker-1"),
                                             event_loop::make("worker-2")};
  for (auto& loop : loops)
    loop->start();
  semaphore sem{*loops[0], max_concurrent_jobs};
  count_down_latch done{*loops[0], num_jobs};
  for (int id = 1; id <= num_jobs; ++id) {
    auto loop = loops[id % loops.size()];
    loop->schedule_fn([loop, sem, done, id] { start_job(loop, sem, done, id); });
  }
  // A request that cannot succeed in time reports `false` to its handler.
  loops[1]->schedule_fn([sem]() mutable {
    sem.try_acquire(max_concurrent_jobs + 1, 5ms, [](bool acquired) {
      print("acquired ", max_concurrent_jobs + 1, " permits at once: ",
            acquired ? "yes" : "no");
    });
  });
  std::promise<void> all_done;
  done.await(make_action([&all_done] { all_done.set_value(); }));
  if (all_done.get_future().wait_for(10s) != std::future_status::ready) {
    print("timeout while waiting for jobs");
    for (auto& loop : loops)
      loop->stop();
    return EXIT_FAILURE;
  }
  for (auto& loop : loops)
    loop->stop();
  print("all ", num_jobs, " jobs done, ", sem.available_permits(),
        " permits available");
  logger::current_logger(nullptr);
  return EXIT_SUCCESS;
}
