/* @file BenchConfig.cpp
 * @brief schema validation for the bench config file
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <set>

// benchguard headers
#include "core/BenchConfig.hpp"
#include "core/Errors.hpp"

using namespace benchguard::core;
using nlohmann::json;

namespace {
  std::chrono::milliseconds positiveMs(const json& section, const char* key,
                                       std::chrono::milliseconds fallback) {
    if (!section.contains(key))
      return fallback;
    const auto& v = section.at(key);
    if (!v.is_number_integer() || v.get<long long>() <= 0)
      throw ConfigError(std::string("[BenchConfig] ") + key + " must be a positive integer (ms)");
    return std::chrono::milliseconds{ v.get<long long>() };
  }

  const json& section(const json& j, const char* key) {
    static const json empty = json::object();
    if (!j.contains(key))
      return empty;
    if (!j.at(key).is_object())
      throw ConfigError(std::string("[BenchConfig] ") + key + " must be an object");
    return j.at(key);
  }

  const std::set<std::string> kControllerTypes{ controller::kShellyGen2Http,
                                                controller::kIoTaWattHttp, controller::kSnmpPdu,
                                                controller::kManual };
  const std::set<std::string> kLogLevels{ "trace", "debug", "info", "warn", "error", "off" };
} // namespace

const Station& BenchConfig::station(const std::string& id) const {
  for (const auto& sc : stations)
    if (sc.station.id == id)
      return sc.station;
  throw ConfigError("[BenchConfig] unknown station: " + id);
}

const Outlet& BenchConfig::outlet(const std::string& stationId, const std::string& outletId) const {
  for (const auto& sc : stations) {
    if (sc.station.id != stationId)
      continue;
    for (const auto& o : sc.outlets)
      if (o.id == outletId)
        return o;
  }
  throw ConfigError("[BenchConfig] unknown outlet " + outletId + " on station " + stationId);
}

const Profile& BenchConfig::profile(const std::string& id) const {
  for (const auto& p : profiles)
    if (p.id == id)
      return p;
  throw ConfigError("[BenchConfig] unknown profile: " + id);
}

BenchConfig benchguard::core::parseBenchConfig(const json& j) {
  if (!j.is_object())
    throw ConfigError("[BenchConfig] config must be a JSON object");

  BenchConfig cfg;
  try {
    const json& collector = section(j, "collector");
    cfg.collectorInterval = positiveMs(collector, "intervalMs", cfg.collectorInterval);

    const json& monitor = section(j, "monitor");
    cfg.monitor.readingCheckInterval =
        positiveMs(monitor, "readingCheckMs", cfg.monitor.readingCheckInterval);
    cfg.monitor.spikeWindow = positiveMs(monitor, "spikeWindowMs", cfg.monitor.spikeWindow);
    cfg.monitor.healthCheckInterval =
        positiveMs(monitor, "healthCheckMs", cfg.monitor.healthCheckInterval);

    const json& ad = section(j, "adapters");
    cfg.adapters.readTimeout = positiveMs(ad, "httpTimeoutMs", cfg.adapters.readTimeout);
    cfg.adapters.healthTimeout = positiveMs(ad, "healthTimeoutMs", cfg.adapters.healthTimeout);
    cfg.adapters.switchTimeout = positiveMs(ad, "switchTimeoutMs", cfg.adapters.switchTimeout);
    cfg.adapters.snmpReadCommunity = ad.value("snmpReadCommunity", cfg.adapters.snmpReadCommunity);
    cfg.adapters.snmpWriteCommunity =
        ad.value("snmpWriteCommunity", cfg.adapters.snmpWriteCommunity);
    const int port = ad.value("snmpPort", static_cast<int>(cfg.adapters.snmpPort));
    if (port <= 0 || port > 65535)
      throw ConfigError("[BenchConfig] snmpPort out of range");
    cfg.adapters.snmpPort = static_cast<std::uint16_t>(port);
    cfg.adapters.snmpBank = ad.value("snmpBank", cfg.adapters.snmpBank);
    if (cfg.adapters.snmpBank <= 0)
      throw ConfigError("[BenchConfig] snmpBank must be positive");

    cfg.journalDir = j.value("journalDir", std::string{});
    cfg.logLevel = j.value("logLevel", cfg.logLevel);
    if (!kLogLevels.count(cfg.logLevel))
      throw ConfigError("[BenchConfig] unknown logLevel: " + cfg.logLevel);

    std::set<std::string> stationIds;
    for (const auto& sj : j.value("stations", json::array())) {
      StationConfig sc;
      sc.station = sj.get<Station>();
      if (!kControllerTypes.count(sc.station.controllerType))
        throw ConfigError("[BenchConfig] station " + sc.station.id +
                          ": unknown controllerType " + sc.station.controllerType);
      if (!stationIds.insert(sc.station.id).second)
        throw ConfigError("[BenchConfig] duplicate station id: " + sc.station.id);

      std::set<std::string> outletIds;
      for (const auto& oj : sj.value("outlets", json::array())) {
        Outlet o = oj.get<Outlet>();
        o.stationId = sc.station.id;
        if (!outletIds.insert(o.id).second)
          throw ConfigError("[BenchConfig] duplicate outlet " + o.id + " on " + sc.station.id);
        sc.outlets.push_back(std::move(o));
      }
      cfg.stations.push_back(std::move(sc));
    }

    std::set<std::string> profileIds;
    for (const auto& pj : j.value("profiles", json::array())) {
      Profile p = pj.get<Profile>();
      if (!profileIds.insert(p.id).second)
        throw ConfigError("[BenchConfig] duplicate profile id: " + p.id);
      cfg.profiles.push_back(std::move(p));
    }
  } catch (const json::exception& e) {
    throw ConfigError(std::string("[BenchConfig] malformed config: ") + e.what());
  }
  return cfg;
}
