/* @file ManualAdapter.cpp
 * @brief operator-driven station stubs
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// third-party headers
#include <spdlog/spdlog.h>

// benchguard headers
#include "adapters/ManualAdapter.hpp"

using namespace benchguard::adapters;
using benchguard::core::HealthCheckResult;
using benchguard::core::InstantReadings;
using benchguard::core::Outlet;
using benchguard::core::Station;
using nlohmann::json;

void ManualAdapter::turnOn(const Station&, const Outlet& outlet) {
  spdlog::info("[ManualAdapter] OPERATOR: Please turn ON outlet \"{}\" (channel {})", outlet.label,
               outlet.controllerChannel);
}

void ManualAdapter::turnOff(const Station&, const Outlet& outlet) noexcept {
  spdlog::info("[ManualAdapter] OPERATOR: Please turn OFF outlet \"{}\" (channel {})", outlet.label,
               outlet.controllerChannel);
}

InstantReadings ManualAdapter::getInstantReadings(const Station&, const Outlet&) {
  InstantReadings out;
  out.raw = json{ { "source", "manual" },
                  { "message", "No automated readings - use operator checklist" } };
  return out;
}

HealthCheckResult ManualAdapter::healthCheck(const Station&) noexcept {
  return { true, json{ { "message", "Manual station - operator-controlled" } } };
}
