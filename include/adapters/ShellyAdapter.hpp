#pragma once
/** @file  ShellyAdapter.hpp
 *  @brief Relay-with-metering driver for Shelly Gen2 devices (local HTTP RPC).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <memory>

#include "adapters/ControllerAdapter.hpp"
#include "io/HttpChannel.hpp"

namespace benchguard::adapters {

  /**
 * @class ShellyAdapter
 * @brief Switch.Set / Switch.GetStatus / Shelly.GetStatus on `<base>/rpc/<method>`.
 *
 *  * Outlet channel is the numeric switch id (Pro 4PM: 0..3).
 *  * Metering maps apower/voltage/current/temperature.tC.
 */
  class ShellyAdapter final : public ControllerAdapter {
  public:
    explicit ShellyAdapter(AdapterSettings settings,
                           std::shared_ptr<io::HttpChannel> http = std::make_shared<io::HttpChannel>());

    std::string name() const override { return "Shelly Gen2 (HTTP)"; }

    void turnOn(const core::Station& station, const core::Outlet& outlet) override;
    void turnOff(const core::Station& station, const core::Outlet& outlet) noexcept override;
    core::InstantReadings getInstantReadings(const core::Station& station,
                                             const core::Outlet& outlet) override;
    core::HealthCheckResult healthCheck(const core::Station& station) noexcept override;

  private:
    std::string rpcUrl(const core::Station& station, const char* method) const;
    io::HttpResponse setSwitch(const core::Station& station, const core::Outlet& outlet, bool on);

    AdapterSettings settings_;
    std::shared_ptr<io::HttpChannel> http_;
  };

} // namespace benchguard::adapters
