/* @file SnmpPduAdapter.cpp
 * @brief APC-style PDU control and bank metering over SNMPv2c
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>

// third-party headers
#include <spdlog/spdlog.h>

// benchguard headers
#include "adapters/SnmpPduAdapter.hpp"
#include "core/Errors.hpp"

using namespace benchguard::adapters;
using benchguard::core::HealthCheckResult;
using benchguard::core::InstantReadings;
using benchguard::core::Outlet;
using benchguard::core::Station;
using nlohmann::json;

namespace {
  using Millis = std::chrono::milliseconds;

  Millis remaining(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::duration_cast<Millis>(deadline - std::chrono::steady_clock::now());
    return left.count() > 0 ? left : Millis{ 1 };
  }

  json valueToJson(const benchguard::io::SnmpValue& v) {
    if (v.isNumeric())
      return v.integer;
    return v.text;
  }
} // namespace

SnmpPduAdapter::SnmpPduAdapter(AdapterSettings settings, std::shared_ptr<io::SnmpChannel> snmp)
    : settings_(std::move(settings)), snmp_(std::move(snmp)) {
  if (!snmp_)
    throw std::invalid_argument("[SnmpPduAdapter] snmp channel is nullptr");
}

benchguard::io::SnmpTarget SnmpPduAdapter::target(const Station& station,
                                                  const std::string& community) const {
  std::string host = detail::requireBaseUrl(station, "SnmpPduAdapter");
  for (const char* scheme : { "http://", "https://", "udp://" }) {
    if (host.starts_with(scheme)) {
      host.erase(0, std::string(scheme).size());
      break;
    }
  }

  io::SnmpTarget t;
  t.community = community;
  t.port = settings_.snmpPort;
  auto colon = host.rfind(':');
  if (colon != std::string::npos && host.find(':') == colon) { // ignore bare IPv6
    try {
      int port = std::stoi(host.substr(colon + 1));
      if (port <= 0 || port > 65535)
        throw std::out_of_range("port");
      t.port = static_cast<std::uint16_t>(port);
    } catch (const std::exception&) {
      throw core::ConfigError("[SnmpPduAdapter] bad port in controllerBaseUrl: " +
                              station.controllerBaseUrl);
    }
    host.erase(colon);
  }
  t.host = host;
  return t;
}

void SnmpPduAdapter::turnOn(const Station& station, const Outlet& outlet) {
  const int ch = detail::channelNumber(outlet, "SnmpPduAdapter");
  const auto tgt = target(station, settings_.snmpWriteCommunity);
  try {
    snmp_->setInteger(tgt, std::string(kOidOutletControl) + "." + std::to_string(ch), kOutletOn,
                      settings_.switchTimeout);
  } catch (const std::exception& e) {
    throw std::runtime_error(std::string("[SnmpPduAdapter] turnOn failed: ") + e.what());
  }
}

void SnmpPduAdapter::turnOff(const Station& station, const Outlet& outlet) noexcept {
  try {
    const int ch = detail::channelNumber(outlet, "SnmpPduAdapter");
    snmp_->setInteger(target(station, settings_.snmpWriteCommunity),
                      std::string(kOidOutletControl) + "." + std::to_string(ch), kOutletOff,
                      settings_.switchTimeout);
  } catch (const std::exception& e) {
    spdlog::error("[SnmpPduAdapter] turnOff error (best-effort): {}", e.what());
  }
}

InstantReadings SnmpPduAdapter::getInstantReadings(const Station& station, const Outlet& outlet) {
  const int ch = detail::channelNumber(outlet, "SnmpPduAdapter");
  const auto tgt = target(station, settings_.snmpReadCommunity);
  const auto deadline = std::chrono::steady_clock::now() + settings_.readTimeout;

  io::SnmpValue status;
  io::SnmpValue current;
  try {
    status = snmp_->get(tgt, std::string(kOidOutletStatus) + "." + std::to_string(ch),
                        remaining(deadline));
    current = snmp_->get(tgt, std::string(kOidBankCurrent) + "." + std::to_string(settings_.snmpBank),
                         remaining(deadline));
  } catch (const std::exception& e) {
    throw std::runtime_error(std::string("[SnmpPduAdapter] getInstantReadings failed: ") + e.what());
  }

  InstantReadings out;
  if (current.isNumeric())
    out.amps = static_cast<double>(current.integer) / 10.0; // tenths of amps
  out.raw = json{ { "outletStatus", valueToJson(status) },
                  { "bankCurrent", valueToJson(current) },
                  { "bank", settings_.snmpBank } };
  if (status.isNumeric())
    out.raw["outletState"] = status.integer == kOutletOn ? "on" : "off";
  return out;
}

HealthCheckResult SnmpPduAdapter::healthCheck(const Station& station) noexcept {
  try {
    auto v = snmp_->get(target(station, settings_.snmpReadCommunity), kOidSysName,
                        settings_.healthTimeout);
    return { true, json{ { "sysName", v.text.empty() ? std::string("Unknown") : v.text } } };
  } catch (const std::exception& e) {
    return { false, json{ { "error", e.what() } } };
  }
}
