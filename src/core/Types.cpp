/* @file Types.cpp
 * @brief string conversions and json mapping for the bench records
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <ctime>

// third-party headers
#include <spdlog/fmt/fmt.h>

// benchguard headers
#include "core/Types.hpp"

namespace benchguard {
  namespace core {

    namespace {
      using nlohmann::json;

      void putOptional(json& j, const char* key, const std::optional<double>& v) {
        if (v)
          j[key] = *v;
        else
          j[key] = nullptr;
      }

      std::optional<double> optionalNumber(const json& j, const char* key) {
        auto it = j.find(key);
        if (it == j.end() || !it->is_number())
          return std::nullopt;
        return it->get<double>();
      }
    } // namespace

    const char* toString(AnomalyType t) {
      switch (t) {
      case AnomalyType::Spike:
        return "SPIKE";
      case AnomalyType::Overcurrent:
        return "OVERCURRENT";
      case AnomalyType::HealthFail:
        return "HEALTH_FAIL";
      }
      return "UNKNOWN";
    }

    const char* toString(RunStatus s) {
      switch (s) {
      case RunStatus::Pending:
        return "PENDING";
      case RunStatus::InProgress:
        return "IN_PROGRESS";
      case RunStatus::Completed:
        return "COMPLETED";
      case RunStatus::Failed:
        return "FAILED";
      case RunStatus::Aborted:
        return "ABORTED";
      }
      return "UNKNOWN";
    }

    const char* toString(RunResult r) {
      switch (r) {
      case RunResult::Pass:
        return "PASS";
      case RunResult::Fail:
        return "FAIL";
      case RunResult::Anomaly:
        return "ANOMALY";
      case RunResult::Incomplete:
        return "INCOMPLETE";
      }
      return "UNKNOWN";
    }

    std::optional<RunStatus> parseRunStatus(const std::string& text) {
      for (auto s : { RunStatus::Pending, RunStatus::InProgress, RunStatus::Completed,
                      RunStatus::Failed, RunStatus::Aborted }) {
        if (text == toString(s))
          return s;
      }
      return std::nullopt;
    }

    std::string toIso8601(Timestamp ts) {
      const auto ms =
          std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
      std::time_t secs = static_cast<std::time_t>(ms / 1000);
      std::tm utc{};
      gmtime_r(&secs, &utc);
      char buf[32];
      std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &utc);
      return fmt::format("{}.{:03d}Z", buf, static_cast<int>(ms % 1000));
    }

    // ---- json ---------------------------------------------------------------

    void to_json(json& j, const SafetyFlags& f) {
      j = json{ { "gfciPresent", f.gfciPresent },
                { "surgeProtection", f.surgeProtection },
                { "acknowledgedBy", f.acknowledgedBy },
                { "acknowledgedAt", f.acknowledgedAt } };
    }

    void from_json(const json& j, SafetyFlags& f) {
      f.gfciPresent = j.value("gfciPresent", false);
      f.surgeProtection = j.value("surgeProtection", false);
      f.acknowledgedBy = j.value("acknowledgedBy", std::string{});
      f.acknowledgedAt = j.value("acknowledgedAt", std::string{});
    }

    void to_json(json& j, const Station& s) {
      j = json{ { "id", s.id },
                { "name", s.name },
                { "controllerType", s.controllerType },
                { "controllerBaseUrl", s.controllerBaseUrl },
                { "safetyFlags", s.safetyFlags } };
    }

    void from_json(const json& j, Station& s) {
      j.at("id").get_to(s.id);
      j.at("controllerType").get_to(s.controllerType);
      s.name = j.value("name", s.id);
      s.controllerBaseUrl = j.value("controllerBaseUrl", std::string{});
      s.safetyFlags = j.value("safetyFlags", SafetyFlags{});
    }

    void to_json(json& j, const Outlet& o) {
      j = json{ { "id", o.id },
                { "stationId", o.stationId },
                { "label", o.label },
                { "controllerChannel", o.controllerChannel },
                { "supportsOnOff", o.supportsOnOff },
                { "supportsPowerMetering", o.supportsPowerMetering },
                { "enabled", o.enabled } };
      putOptional(j, "maxAmps", o.maxAmps);
    }

    void from_json(const json& j, Outlet& o) {
      j.at("id").get_to(o.id);
      j.at("controllerChannel").get_to(o.controllerChannel);
      o.stationId = j.value("stationId", std::string{});
      o.label = j.value("label", o.id);
      o.supportsOnOff = j.value("supportsOnOff", true);
      o.supportsPowerMetering = j.value("supportsPowerMetering", true);
      o.enabled = j.value("enabled", true);
      // a zero or negative ceiling means "no ceiling configured"
      o.maxAmps = optionalNumber(j, "maxAmps");
      if (o.maxAmps && *o.maxAmps <= 0.0)
        o.maxAmps.reset();
    }

    void to_json(json& j, const Thresholds& t) {
      j = json{ { "maxPeakWatts", t.maxPeakWatts },
                { "minStableWatts", t.minStableWatts },
                { "maxStableWatts", t.maxStableWatts },
                { "spikeShutdownWatts", t.spikeShutdownWatts },
                { "minRunSeconds", t.minRunSeconds } };
    }

    void from_json(const json& j, Thresholds& t) {
      j.at("maxPeakWatts").get_to(t.maxPeakWatts);
      j.at("minStableWatts").get_to(t.minStableWatts);
      j.at("maxStableWatts").get_to(t.maxStableWatts);
      j.at("spikeShutdownWatts").get_to(t.spikeShutdownWatts);
      j.at("minRunSeconds").get_to(t.minRunSeconds);
    }

    void to_json(json& j, const ChecklistItem& c) {
      j = json{ { "id", c.id }, { "label", c.label }, { "type", c.type }, { "required", c.required } };
    }

    void from_json(const json& j, ChecklistItem& c) {
      j.at("id").get_to(c.id);
      c.label = j.value("label", c.id);
      c.type = j.value("type", std::string{ "boolean" });
      c.required = j.value("required", false);
    }

    void to_json(json& j, const Profile& p) {
      j = json{ { "id", p.id },
                { "category", p.category },
                { "name", p.name },
                { "thresholds", p.thresholds },
                { "operatorChecklist", p.operatorChecklist } };
    }

    void from_json(const json& j, Profile& p) {
      j.at("id").get_to(p.id);
      j.at("thresholds").get_to(p.thresholds);
      p.category = j.value("category", std::string{});
      p.name = j.value("name", p.id);
      p.operatorChecklist = j.value("operatorChecklist", std::vector<ChecklistItem>{});
    }

    void to_json(json& j, const Reading& r) {
      j = json{ { "runId", r.runId }, { "ts", toIso8601(r.ts) }, { "raw", r.raw } };
      putOptional(j, "watts", r.watts);
      putOptional(j, "volts", r.volts);
      putOptional(j, "amps", r.amps);
      putOptional(j, "tempC", r.tempC);
      putOptional(j, "pressure", r.pressure);
    }

    void to_json(json& j, const Anomaly& a) {
      j = json{ { "type", toString(a.type) },
                { "message", a.message },
                { "timestamp", toIso8601(a.timestamp) } };
      putOptional(j, "value", a.value);
      putOptional(j, "threshold", a.threshold);
    }

    void to_json(json& j, const TestRun& r) {
      j = json{ { "id", r.id },
                { "qlid", r.qlid },
                { "stationId", r.stationId },
                { "outletId", r.outletId },
                { "profileId", r.profileId },
                { "status", toString(r.status) },
                { "createdAt", toIso8601(r.createdAt) },
                { "anomalies", r.anomalies },
                { "checklistValues", r.checklistValues } };
      if (!r.palletId.empty())
        j["palletId"] = r.palletId;
      if (!r.operatorUserId.empty())
        j["operatorUserId"] = r.operatorUserId;
      if (!r.notes.empty())
        j["notes"] = r.notes;
      j["startedAt"] = r.startedAt ? json(toIso8601(*r.startedAt)) : json(nullptr);
      j["endedAt"] = r.endedAt ? json(toIso8601(*r.endedAt)) : json(nullptr);
      j["result"] = r.result ? json(toString(*r.result)) : json(nullptr);
      j["score"] = r.score ? json(*r.score) : json(nullptr);
    }

  } // namespace core
} // namespace benchguard
