/* @file IoTaWattAdapter.cpp
 * @brief IoTaWatt query API - metering only, switching is a logged no-op
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>

// third-party headers
#include <spdlog/spdlog.h>

// benchguard headers
#include "adapters/IoTaWattAdapter.hpp"

using namespace benchguard::adapters;
using benchguard::core::HealthCheckResult;
using benchguard::core::InstantReadings;
using benchguard::core::Outlet;
using benchguard::core::Station;
using nlohmann::json;

IoTaWattAdapter::IoTaWattAdapter(AdapterSettings settings, std::shared_ptr<io::HttpChannel> http)
    : settings_(std::move(settings)), http_(std::move(http)) {
  if (!http_)
    throw std::invalid_argument("[IoTaWattAdapter] http channel is nullptr");
}

void IoTaWattAdapter::turnOn(const Station& station, const Outlet& outlet) {
  spdlog::warn("[IoTaWattAdapter] turnOn is a no-op - IoTaWatt is monitor-only (station {}, {})",
               station.id, outlet.label);
}

void IoTaWattAdapter::turnOff(const Station& station, const Outlet& outlet) noexcept {
  spdlog::warn("[IoTaWattAdapter] turnOff is a no-op - IoTaWatt is monitor-only (station {}, {})",
               station.id, outlet.label);
}

InstantReadings IoTaWattAdapter::getInstantReadings(const Station& station, const Outlet& outlet) {
  const std::string base = detail::requireBaseUrl(station, "IoTaWattAdapter");
  const std::string& ch = outlet.controllerChannel;
  const std::string select = "[" + ch + ".Watts," + ch + ".Volts," + ch + ".Amps]";

  auto resp = http_->get(base + "/query?select=" + io::urlEncode(select), settings_.readTimeout);
  if (!resp.ok())
    throw std::runtime_error("[IoTaWattAdapter] query failed: " + std::to_string(resp.status));

  json data = json::parse(resp.body);
  if (!data.is_array())
    throw std::runtime_error("[IoTaWattAdapter] query returned non-array: " + resp.body);

  // values come back in select order
  auto at = [&data](std::size_t i) -> std::optional<double> {
    if (i < data.size() && data[i].is_number())
      return data[i].get<double>();
    return std::nullopt;
  };

  InstantReadings out;
  out.watts = at(0);
  out.volts = at(1);
  out.amps = at(2);
  out.raw = json{ { "channel", ch }, { "response", data } };
  return out;
}

HealthCheckResult IoTaWattAdapter::healthCheck(const Station& station) noexcept {
  try {
    const std::string base = detail::requireBaseUrl(station, "IoTaWattAdapter");
    auto resp = http_->get(base + "/status", settings_.healthTimeout);
    if (!resp.ok())
      return { false, json{ { "error", "HTTP " + std::to_string(resp.status) } } };
    return { true, json::parse(resp.body) };
  } catch (const std::exception& e) {
    return { false, json{ { "error", e.what() } } };
  }
}
