#pragma once
/** @file  AdapterFactory.hpp
 *  @brief Runtime registry that maps controller-type strings to adapters.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>

#include "core/Types.hpp"

namespace benchguard::adapters {
  class ControllerAdapter;
  struct AdapterSettings;
} // namespace benchguard::adapters

namespace benchguard::core {

  /**
 * @class AdapterFactory
 * @brief Register & instantiate controller adapters by controller type.
 *
 *  * Keeps the collector and monitor decoupled from concrete protocols.
 *  * Unknown types fail at resolution time with `ConfigError`, never at first use.
 *  * Register everything during set-up; lookups afterwards are read-only.
 */
  class AdapterFactory {
  public:
    using Creator = std::function<std::shared_ptr<adapters::ControllerAdapter>()>;

    /// Factory pre-loaded with SHELLY_GEN2_HTTP, IOTAWATT_HTTP, SNMP_PDU and MANUAL.
    static AdapterFactory withBuiltins(const adapters::AdapterSettings& settings);

    /// Register an adapter under \p controllerType.  Returns false on duplicate.
    bool registerAdapter(const std::string& controllerType, Creator maker);

    bool knows(const std::string& controllerType) const;

    /// Create a fresh instance or throw `ConfigError` if the type is unknown.
    std::shared_ptr<adapters::ControllerAdapter> create(const std::string& controllerType) const;

    /// create() plus the station-level checks: networked controllers need a base address.
    std::shared_ptr<adapters::ControllerAdapter> forStation(const Station& station) const;

  private:
    std::unordered_map<std::string, Creator> creators_;
  };

} // namespace benchguard::core
