#pragma once
/** @file  ControllerAdapter.hpp
 *  @brief Abstract capability set every power-controller protocol implements.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

// benchguard headers
#include "core/Types.hpp"

namespace benchguard::adapters {

  /// Timeouts and SNMP credentials shared by the built-in adapters.
  struct AdapterSettings {
    std::chrono::milliseconds readTimeout{ 3000 };   ///< getInstantReadings
    std::chrono::milliseconds healthTimeout{ 5000 }; ///< healthCheck
    std::chrono::milliseconds switchTimeout{ 5000 }; ///< turnOn / turnOff
    std::string snmpReadCommunity{ "public" };
    std::string snmpWriteCommunity{ "private" };
    std::uint16_t snmpPort{ 161 };
    int snmpBank{ 1 };
  };

  /**
 * @class ControllerAdapter
 * @brief Protocol-specific driver for one class of outlet controller.
 *
 *  * `turnOn` and `getInstantReadings` throw on transport failure; callers
 *    decide whether that aborts a run.
 *  * `turnOff` and `healthCheck` never throw: they sit on the emergency path.
 *  * Stateless between calls, so one instance may serve several runs.
 */
  class ControllerAdapter {
  public:
    virtual ~ControllerAdapter() = default;

    /// Human-readable adapter name for logs and summaries.
    virtual std::string name() const = 0;

    /// Energize the outlet. Throws std::runtime_error / core::ConfigError.
    virtual void turnOn(const core::Station& station, const core::Outlet& outlet) = 0;

    /// Best-effort de-energize; failures are logged, never raised.
    virtual void turnOff(const core::Station& station, const core::Outlet& outlet) noexcept = 0;

    /// Point sample, bounded by AdapterSettings::readTimeout. Throws on failure.
    virtual core::InstantReadings getInstantReadings(const core::Station& station,
                                                     const core::Outlet& outlet) = 0;

    /// Reachability check; any failure is reported as ok == false.
    virtual core::HealthCheckResult healthCheck(const core::Station& station) noexcept = 0;
  };

  namespace detail {
    /// Base address with trailing '/' removed; ConfigError when unset.
    std::string requireBaseUrl(const core::Station& station, const std::string& adapterName);

    /// Outlet channel as an integer id; ConfigError when not numeric.
    int channelNumber(const core::Outlet& outlet, const std::string& adapterName);

    std::optional<double> numberAt(const nlohmann::json& obj, const char* key);
  } // namespace detail

} // namespace benchguard::adapters
