#pragma once
/** @file  SnmpPduAdapter.hpp
 *  @brief Managed rack PDU driver (APC Switched Rack PDU MIB) over SNMPv2c.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <memory>

#include "adapters/ControllerAdapter.hpp"
#include "io/SnmpChannel.hpp"

namespace benchguard::adapters {

  /**
 * @class SnmpPduAdapter
 * @brief Outlet switching via sPDUOutletCtl, bank-level current via rPDULoadStatusLoad.
 *
 *  * Metering is per bank, not per outlet: every outlet on a bank reports the
 *    same amps and no watts.
 *  * Station base address is "host" or "host:port"; an http:// prefix is tolerated.
 */
  class SnmpPduAdapter final : public ControllerAdapter {
  public:
    static constexpr const char* kOidOutletControl = ".1.3.6.1.4.1.318.1.1.4.4.2.1.3";
    static constexpr const char* kOidOutletStatus = ".1.3.6.1.4.1.318.1.1.12.3.5.1.1.4";
    static constexpr const char* kOidBankCurrent = ".1.3.6.1.4.1.318.1.1.12.2.3.1.1.2";
    static constexpr const char* kOidSysName = ".1.3.6.1.2.1.1.5.0";
    static constexpr int kOutletOn = 1;
    static constexpr int kOutletOff = 2;

    explicit SnmpPduAdapter(AdapterSettings settings,
                            std::shared_ptr<io::SnmpChannel> snmp = std::make_shared<io::SnmpChannel>());

    std::string name() const override { return "SNMP PDU"; }

    void turnOn(const core::Station& station, const core::Outlet& outlet) override;
    void turnOff(const core::Station& station, const core::Outlet& outlet) noexcept override;
    core::InstantReadings getInstantReadings(const core::Station& station,
                                             const core::Outlet& outlet) override;
    core::HealthCheckResult healthCheck(const core::Station& station) noexcept override;

  private:
    io::SnmpTarget target(const core::Station& station, const std::string& community) const;

    AdapterSettings settings_;
    std::shared_ptr<io::SnmpChannel> snmp_;
  };

} // namespace benchguard::adapters
