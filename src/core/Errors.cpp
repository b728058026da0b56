/* @file Errors.cpp
 * @brief message assembly for the bench exception types
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "core/Errors.hpp"

using namespace benchguard::core;

namespace {
  std::string joinViolations(const std::vector<std::string>& violations) {
    std::string msg = "[SafetyMonitor] safety validation failed";
    for (std::size_t i = 0; i < violations.size(); ++i) {
      msg += (i == 0) ? ": " : "; ";
      msg += violations[i];
    }
    return msg;
  }
} // namespace

SafetyInterlockError::SafetyInterlockError(std::vector<std::string> violations)
    : std::runtime_error(joinViolations(violations)), violations_(std::move(violations)) {}
