#pragma once
/** @file  ErrorMonitor.hpp
 *  @brief Central fault aggregator & escalation helper.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_set>

namespace benchguard::core {

  /**
 * @class ErrorMonitor
 * @brief Other threads call `notifyFailure()`; we call the registered
 *        escalation callback exactly once per unique error.
 *
 * * Thread-safe; the callback runs outside the lock so it may call back in.
 * * Debounces duplicate failures so TestBench doesn't get spammed by a
 *   controller that fails on every tick.
 */
  class ErrorMonitor {
  public:
    using Escalation = std::function<void(const std::string&)>;

    ErrorMonitor() = default;
    virtual ~ErrorMonitor() = default;

    /// Register the escalation hook (replaces any previous one).
    void registerEscalation(Escalation cb);

    /// Called by subsystems on fault; will forward to the escalation callback.
    virtual void notifyFailure(const std::string& message);

    std::size_t uniqueFailures() const;

  private:
    bool remember(const std::string& message);

    Escalation escalation_{};
    std::unordered_set<std::string> seen_; ///< de-dupe set
    mutable std::mutex mtx_;
  };

} // namespace benchguard::core
