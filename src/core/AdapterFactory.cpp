/* @file AdapterFactory.cpp
 * @brief controller-type -> adapter resolution
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// Linux headers
#include <arpa/inet.h>
#include <netinet/in.h>

#include "core/AdapterFactory.hpp"

#include "adapters/IoTaWattAdapter.hpp"
#include "adapters/ManualAdapter.hpp"
#include "adapters/ShellyAdapter.hpp"
#include "adapters/SnmpPduAdapter.hpp"
#include "core/Errors.hpp"

using namespace benchguard::core;
using benchguard::adapters::AdapterSettings;
using benchguard::adapters::ControllerAdapter;

namespace {
  // host part of "scheme://host:port/path", "host:port", "[v6]:port" or a bare v6 literal
  std::string hostOf(std::string url) {
    if (auto scheme = url.find("://"); scheme != std::string::npos)
      url.erase(0, scheme + 3);
    url = url.substr(0, url.find('/'));
    if (url.starts_with('[')) {
      auto close = url.find(']');
      return close == std::string::npos ? std::string{} : url.substr(1, close - 1);
    }
    auto colon = url.find(':');
    if (colon != std::string::npos && url.rfind(':') == colon)
      url.erase(colon);
    return url;
  }

  bool isNumericHost(const std::string& host) {
    in6_addr addr{};
    return ::inet_pton(AF_INET, host.c_str(), &addr) == 1 ||
           ::inet_pton(AF_INET6, host.c_str(), &addr) == 1;
  }
} // namespace

AdapterFactory AdapterFactory::withBuiltins(const AdapterSettings& settings) {
  AdapterFactory factory;
  factory.registerAdapter(controller::kShellyGen2Http, [settings] {
    return std::make_shared<adapters::ShellyAdapter>(settings);
  });
  factory.registerAdapter(controller::kIoTaWattHttp, [settings] {
    return std::make_shared<adapters::IoTaWattAdapter>(settings);
  });
  factory.registerAdapter(controller::kSnmpPdu, [settings] {
    return std::make_shared<adapters::SnmpPduAdapter>(settings);
  });
  factory.registerAdapter(controller::kManual,
                          [] { return std::make_shared<adapters::ManualAdapter>(); });
  return factory;
}

bool AdapterFactory::registerAdapter(const std::string& controllerType, Creator maker) {
  if (!maker)
    return false;
  return creators_.emplace(controllerType, std::move(maker)).second;
}

bool AdapterFactory::knows(const std::string& controllerType) const {
  return creators_.count(controllerType) != 0;
}

std::shared_ptr<ControllerAdapter> AdapterFactory::create(const std::string& controllerType) const {
  auto it = creators_.find(controllerType);
  if (it == creators_.end())
    throw ConfigError("[AdapterFactory] unknown controller type: " + controllerType);
  auto adapter = it->second();
  if (!adapter)
    throw ConfigError("[AdapterFactory] creator for " + controllerType + " returned nullptr");
  return adapter;
}

std::shared_ptr<ControllerAdapter> AdapterFactory::forStation(const Station& station) const {
  auto adapter = create(station.controllerType);
  if (station.controllerType == controller::kManual)
    return adapter;
  if (station.controllerBaseUrl.empty())
    throw ConfigError("[AdapterFactory] station " + station.id + " (" + station.controllerType +
                      ") has no controllerBaseUrl");
  // name resolution cannot be bounded by the request deadline
  if (!isNumericHost(hostOf(station.controllerBaseUrl)))
    throw ConfigError("[AdapterFactory] station " + station.id +
                      " controllerBaseUrl must use a numeric IP address: " +
                      station.controllerBaseUrl);
  return adapter;
}
