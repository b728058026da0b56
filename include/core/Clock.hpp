#pragma once
/** @file  Clock.hpp
 *  @brief Monotonic time source for debounce windows (swappable in tests).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>

namespace benchguard::core {

  class Clock {
  public:
    using time_point = std::chrono::steady_clock::time_point;

    virtual ~Clock() = default;
    virtual time_point now() const = 0;
  };

  class SteadyClock final : public Clock {
  public:
    time_point now() const override { return std::chrono::steady_clock::now(); }
  };

} // namespace benchguard::core
