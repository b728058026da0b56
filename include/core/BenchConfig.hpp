#pragma once
/** @file  BenchConfig.hpp
 *  @brief Validated bench configuration: timings, adapter settings, catalog.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <string>
#include <vector>

// third-party headers
#include <nlohmann/json.hpp>

// benchguard headers
#include "adapters/ControllerAdapter.hpp"
#include "core/SafetyMonitor.hpp"
#include "core/Types.hpp"

namespace benchguard::core {

  struct StationConfig {
    Station station;
    std::vector<Outlet> outlets;
  };

  struct BenchConfig {
    std::chrono::milliseconds collectorInterval{ 1000 };
    MonitorSettings monitor{};
    adapters::AdapterSettings adapters{};
    std::string journalDir{}; ///< empty = no run journal
    std::string logLevel{ "info" };
    std::vector<StationConfig> stations{};
    std::vector<Profile> profiles{};

    /// Lookups throw ConfigError when the id is unknown.
    const Station& station(const std::string& id) const;
    const Outlet& outlet(const std::string& stationId, const std::string& outletId) const;
    const Profile& profile(const std::string& id) const;
  };

  /// Validate and convert a loaded config. Every schema problem is a ConfigError.
  BenchConfig parseBenchConfig(const nlohmann::json& j);

} // namespace benchguard::core
