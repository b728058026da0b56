/* @file ShellyAdapter.cpp
 * @brief Shelly Gen2 RPC over HTTP - real switching, per-channel metering
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>

// third-party headers
#include <spdlog/spdlog.h>

// benchguard headers
#include "adapters/ShellyAdapter.hpp"

using namespace benchguard::adapters;
using benchguard::core::HealthCheckResult;
using benchguard::core::InstantReadings;
using benchguard::core::Outlet;
using benchguard::core::Station;
using nlohmann::json;

ShellyAdapter::ShellyAdapter(AdapterSettings settings, std::shared_ptr<io::HttpChannel> http)
    : settings_(std::move(settings)), http_(std::move(http)) {
  if (!http_)
    throw std::invalid_argument("[ShellyAdapter] http channel is nullptr");
}

std::string ShellyAdapter::rpcUrl(const Station& station, const char* method) const {
  return detail::requireBaseUrl(station, "ShellyAdapter") + "/rpc/" + method;
}

benchguard::io::HttpResponse ShellyAdapter::setSwitch(const Station& station, const Outlet& outlet, bool on) {
  const json body = { { "id", detail::channelNumber(outlet, "ShellyAdapter") }, { "on", on } };
  return http_->post(rpcUrl(station, "Switch.Set"), body.dump(), settings_.switchTimeout);
}

void ShellyAdapter::turnOn(const Station& station, const Outlet& outlet) {
  auto resp = setSwitch(station, outlet, true);
  if (!resp.ok())
    throw std::runtime_error("[ShellyAdapter] turnOn failed: " + std::to_string(resp.status) +
                             " " + resp.body);
}

void ShellyAdapter::turnOff(const Station& station, const Outlet& outlet) noexcept {
  try {
    auto resp = setSwitch(station, outlet, false);
    if (!resp.ok())
      spdlog::error("[ShellyAdapter] turnOff non-OK: {} (station {}, channel {})", resp.status,
                    station.id, outlet.controllerChannel);
  } catch (const std::exception& e) {
    spdlog::error("[ShellyAdapter] turnOff error (best-effort): {}", e.what());
  }
}

InstantReadings ShellyAdapter::getInstantReadings(const Station& station, const Outlet& outlet) {
  const json body = { { "id", detail::channelNumber(outlet, "ShellyAdapter") } };
  auto resp = http_->post(rpcUrl(station, "Switch.GetStatus"), body.dump(), settings_.readTimeout);
  if (!resp.ok())
    throw std::runtime_error("[ShellyAdapter] getInstantReadings failed: " +
                             std::to_string(resp.status));

  json data = json::parse(resp.body);
  InstantReadings out;
  out.watts = detail::numberAt(data, "apower");
  out.volts = detail::numberAt(data, "voltage");
  out.amps = detail::numberAt(data, "current");
  if (data.is_object() && data.contains("temperature"))
    out.tempC = detail::numberAt(data["temperature"], "tC");
  out.raw = std::move(data);
  return out;
}

HealthCheckResult ShellyAdapter::healthCheck(const Station& station) noexcept {
  try {
    auto resp = http_->post(rpcUrl(station, "Shelly.GetStatus"), "{}", settings_.healthTimeout);
    if (!resp.ok())
      return { false, json{ { "error", "HTTP " + std::to_string(resp.status) } } };

    json data = json::parse(resp.body);
    json details = json::object();
    if (data.is_object()) {
      details = data;
      if (data.contains("sys") && data["sys"].is_object()) {
        details["uptime"] = data["sys"].value("uptime", json());
        details["firmware"] = data["sys"].value("available_updates", json());
      }
    }
    return { true, std::move(details) };
  } catch (const std::exception& e) {
    return { false, json{ { "error", e.what() } } };
  }
}
