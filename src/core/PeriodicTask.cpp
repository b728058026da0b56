/* @file PeriodicTask.cpp
 * @brief interval scheduler with coalescing ticks
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <stdexcept>

// third-party headers
#include <spdlog/spdlog.h>

// benchguard headers
#include "core/PeriodicTask.hpp"

using namespace benchguard::core;

struct PeriodicTask::State {
  std::string name;
  std::chrono::milliseconds interval;
  Tick tick;

  std::mutex mtx;
  std::condition_variable cv;
  bool stop{ false };
  std::atomic<bool> done{ false };
};

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds interval, Tick tick)
    : state_(std::make_shared<State>()) {
  if (interval.count() <= 0)
    throw std::invalid_argument("[PeriodicTask] interval must be positive: " + name);
  if (!tick)
    throw std::invalid_argument("[PeriodicTask] tick is empty: " + name);

  state_->name = std::move(name);
  state_->interval = interval;
  state_->tick = std::move(tick);

  // the worker holds its own reference so a self-cancel + detach stays valid
  worker_ = std::thread([state = state_] {
    using steady = std::chrono::steady_clock;
    auto next = steady::now() + state->interval;

    for (;;) {
      {
        std::unique_lock lock(state->mtx);
        if (state->cv.wait_until(lock, next, [&] { return state->stop; }))
          break;
      }

      try {
        state->tick();
      } catch (const std::exception& e) {
        spdlog::error("[PeriodicTask] {} tick threw: {}", state->name, e.what());
      }

      // coalesce: skip every slot that elapsed while the tick was running
      const auto now = steady::now();
      next += state->interval;
      if (next <= now) {
        const auto behind = now - next;
        next += (behind / state->interval + 1) * state->interval;
      }
    }
    state->done = true;
  });
}

PeriodicTask::~PeriodicTask() {
  cancel();
  if (!worker_.joinable())
    return;
  if (worker_.get_id() == std::this_thread::get_id())
    worker_.detach();
  else
    worker_.join();
}

void PeriodicTask::cancel() noexcept {
  {
    std::lock_guard lock(state_->mtx);
    state_->stop = true;
  }
  state_->cv.notify_all();
}

bool PeriodicTask::cancelled() const noexcept {
  std::lock_guard lock(state_->mtx);
  return state_->stop;
}

bool PeriodicTask::finished() const noexcept { return state_->done.load(); }

void PeriodicTask::join() {
  if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id())
    worker_.join();
}

const std::string& PeriodicTask::name() const noexcept { return state_->name; }
