#pragma once
/** @file  Errors.hpp
 *  @brief Exception types raised across the bench API.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <string>
#include <vector>

namespace benchguard {
  namespace core {

    /// Fatal set-up problem (unknown controller type, missing address, duplicate
    /// session ...). Never retried; surfaced before any outlet is energized.
    class ConfigError : public std::runtime_error {
    public:
      using std::runtime_error::runtime_error;
    };

    /// Thrown when a run is started on a station/outlet that fails validateSafety().
    class SafetyInterlockError : public std::runtime_error {
    public:
      explicit SafetyInterlockError(std::vector<std::string> violations);

      const std::vector<std::string>& violations() const noexcept { return violations_; }

    private:
      std::vector<std::string> violations_;
    };

  } // namespace core
} // namespace benchguard
