/* @file ErrorMonitor.cpp
 * @brief fault de-dupe + escalation
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <spdlog/spdlog.h>

#include "core/ErrorMonitor.hpp"

using namespace benchguard::core;

void ErrorMonitor::registerEscalation(Escalation cb) {
  std::lock_guard lock(mtx_);
  escalation_ = std::move(cb);
}

bool ErrorMonitor::remember(const std::string& message) {
  std::lock_guard lock(mtx_);
  return seen_.insert(message).second;
}

void ErrorMonitor::notifyFailure(const std::string& message) {
  if (!remember(message)) {
    spdlog::debug("[ErrorMonitor] duplicate suppressed: {}", message);
    return;
  }
  spdlog::error("[ErrorMonitor] {}", message);

  Escalation cb;
  {
    std::lock_guard lock(mtx_);
    cb = escalation_;
  }
  if (cb)
    cb(message);
}

std::size_t ErrorMonitor::uniqueFailures() const {
  std::lock_guard lock(mtx_);
  return seen_.size();
}
