#pragma once
/** @file  PeriodicTask.hpp
 *  @brief Fixed-interval worker thread with a cancellation handle.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace benchguard::core {

  /**
 * @class PeriodicTask
 * @brief Runs `tick` every `interval` on its own thread until cancelled.
 *
 *  * Ticks never overlap: a tick that overruns its slot makes the task skip
 *    the missed slots instead of queueing them.
 *  * Exceptions escaping `tick` are logged and the schedule continues.
 *  * `cancel()` returns immediately and may be called from inside `tick`;
 *    a tick already running is allowed to finish.
 *  * The destructor cancels and joins (detaches when destroyed from its own
 *    worker thread).
 */
  class PeriodicTask {
  public:
    using Tick = std::function<void()>;

    PeriodicTask(std::string name, std::chrono::milliseconds interval, Tick tick);
    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    void cancel() noexcept;
    bool cancelled() const noexcept;

    /// true once the worker has left its loop
    bool finished() const noexcept;

    /// Block until the worker exits; no-op from the worker thread itself.
    void join();

    const std::string& name() const noexcept;

  private:
    struct State;

    std::shared_ptr<State> state_;
    std::thread worker_;
  };

} // namespace benchguard::core
