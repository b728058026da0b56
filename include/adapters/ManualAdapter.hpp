#pragma once
/** @file  ManualAdapter.hpp
 *  @brief Human-operated station: no network, operator switches the outlet.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include "adapters/ControllerAdapter.hpp"

namespace benchguard::adapters {

  /**
 * @class ManualAdapter
 * @brief Every call is a stub. turnOn/turnOff log an operator instruction,
 *        readings carry no numeric fields, health is always ok. Pass/fail
 *        relies on the operator checklist.
 */
  class ManualAdapter final : public ControllerAdapter {
  public:
    std::string name() const override { return "Manual"; }

    void turnOn(const core::Station& station, const core::Outlet& outlet) override;
    void turnOff(const core::Station& station, const core::Outlet& outlet) noexcept override;
    core::InstantReadings getInstantReadings(const core::Station& station,
                                             const core::Outlet& outlet) override;
    core::HealthCheckResult healthCheck(const core::Station& station) noexcept override;
  };

} // namespace benchguard::adapters
