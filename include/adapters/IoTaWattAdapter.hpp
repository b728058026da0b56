#pragma once
/** @file  IoTaWattAdapter.hpp
 *  @brief Monitor-only driver for the IoTaWatt CT-clamp energy monitor.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <memory>

#include "adapters/ControllerAdapter.hpp"
#include "io/HttpChannel.hpp"

namespace benchguard::adapters {

  /**
 * @class IoTaWattAdapter
 * @brief Metering via `/query?select=[ch.Watts,ch.Volts,ch.Amps]`.
 *
 *  * Cannot switch power: turnOn/turnOff only log a warning. The bench must
 *    pair this monitor with a separate relay.
 *  * Outlet channel is the IoTaWatt input name (e.g. "Bench_1").
 */
  class IoTaWattAdapter final : public ControllerAdapter {
  public:
    explicit IoTaWattAdapter(AdapterSettings settings,
                             std::shared_ptr<io::HttpChannel> http = std::make_shared<io::HttpChannel>());

    std::string name() const override { return "IoTaWatt (HTTP)"; }

    void turnOn(const core::Station& station, const core::Outlet& outlet) override;
    void turnOff(const core::Station& station, const core::Outlet& outlet) noexcept override;
    core::InstantReadings getInstantReadings(const core::Station& station,
                                             const core::Outlet& outlet) override;
    core::HealthCheckResult healthCheck(const core::Station& station) noexcept override;

  private:
    AdapterSettings settings_;
    std::shared_ptr<io::HttpChannel> http_;
  };

} // namespace benchguard::adapters
