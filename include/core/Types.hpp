#pragma once
/** @file  Types.hpp
 *  @brief Bench records shared by adapters, collector, monitor and run manager.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// third-party headers
#include <nlohmann/json.hpp>

namespace benchguard {
  namespace core {

    using WallClock = std::chrono::system_clock;
    using Timestamp = WallClock::time_point;

    /// Controller-type discriminants as they appear in station records.
    namespace controller {
      inline constexpr const char* kShellyGen2Http = "SHELLY_GEN2_HTTP";
      inline constexpr const char* kIoTaWattHttp = "IOTAWATT_HTTP";
      inline constexpr const char* kSnmpPdu = "SNMP_PDU";
      inline constexpr const char* kManual = "MANUAL";
    } // namespace controller

    struct SafetyFlags {
      bool gfciPresent{ false };
      bool surgeProtection{ false };
      std::string acknowledgedBy{}; ///< operator id, empty = never acknowledged
      std::string acknowledgedAt{};
    };

    /**
 * @struct Station
 * @brief One bench with a single power controller. Only the safety flags may
 *        change while a run is live.
 */
    struct Station {
      std::string id;
      std::string name;
      std::string controllerType;    ///< see controller:: constants
      std::string controllerBaseUrl; ///< "http://10.0.0.5", "10.0.0.9:161", empty for MANUAL
      SafetyFlags safetyFlags{};
    };

    struct Outlet {
      std::string id;
      std::string stationId;
      std::string label;
      std::string controllerChannel; ///< e.g. "0".."3" on a 4-channel relay
      std::optional<double> maxAmps{};
      bool supportsOnOff{ true };
      bool supportsPowerMetering{ true };
      bool enabled{ true };
    };

    struct Thresholds {
      double maxPeakWatts{ 0.0 };
      double minStableWatts{ 0.0 };
      double maxStableWatts{ 0.0 };
      double spikeShutdownWatts{ 0.0 };
      double minRunSeconds{ 0.0 };
    };

    struct ChecklistItem {
      std::string id;
      std::string label;
      std::string type{ "boolean" }; ///< boolean | number | text
      bool required{ false };
    };

    /// Per product-category thresholds. Runs reference a profile, never own it.
    struct Profile {
      std::string id;
      std::string category; ///< VACUUM | ICE_MAKER | SMALL_APPLIANCE ...
      std::string name;
      Thresholds thresholds{};
      std::vector<ChecklistItem> operatorChecklist{};
    };

    /// Point sample as returned by a controller adapter.
    struct InstantReadings {
      std::optional<double> watts{};
      std::optional<double> volts{};
      std::optional<double> amps{};
      std::optional<double> tempC{};
      std::optional<double> pressure{};
      nlohmann::json raw = nlohmann::json::object();
    };

    /// Persisted, immutable sample tied to one run.
    struct Reading {
      std::string runId;
      Timestamp ts{};
      std::optional<double> watts{};
      std::optional<double> volts{};
      std::optional<double> amps{};
      std::optional<double> tempC{};
      std::optional<double> pressure{};
      nlohmann::json raw = nlohmann::json::object();
    };

    struct HealthCheckResult {
      bool ok{ false };
      nlohmann::json details = nlohmann::json::object();
    };

    enum class AnomalyType : std::uint8_t { Spike, Overcurrent, HealthFail };

    struct Anomaly {
      AnomalyType type{ AnomalyType::Spike };
      std::string message;
      Timestamp timestamp{};
      std::optional<double> value{};
      std::optional<double> threshold{};
    };

    enum class RunStatus : std::uint8_t { Pending, InProgress, Completed, Failed, Aborted };
    enum class RunResult : std::uint8_t { Pass, Fail, Anomaly, Incomplete };

    /// COMPLETED, FAILED and ABORTED never transition again.
    constexpr bool isTerminal(RunStatus s) {
      return s == RunStatus::Completed || s == RunStatus::Failed || s == RunStatus::Aborted;
    }

    struct RunRequest {
      std::string qlid; ///< item under test
      std::string stationId;
      std::string outletId;
      std::string profileId;
      std::string operatorUserId{};
      std::string palletId{};
    };

    struct TestRun {
      std::string id;
      std::string qlid;
      std::string palletId;
      std::string stationId;
      std::string outletId;
      std::string profileId;
      std::string operatorUserId;
      RunStatus status{ RunStatus::Pending };
      Timestamp createdAt{};
      std::optional<Timestamp> startedAt{};
      std::optional<Timestamp> endedAt{};
      std::optional<RunResult> result{};
      std::optional<int> score{}; ///< 0-100
      std::vector<Anomaly> anomalies{};
      std::string notes{};
      nlohmann::json checklistValues = nlohmann::json::object();
    };

    const char* toString(AnomalyType t);
    const char* toString(RunStatus s);
    const char* toString(RunResult r);

    /// Parses "PENDING", "IN_PROGRESS", ... ; std::nullopt when unknown.
    std::optional<RunStatus> parseRunStatus(const std::string& text);

    /// UTC, millisecond precision: 2025-01-31T12:00:00.250Z
    std::string toIso8601(Timestamp ts);

    // ---- nlohmann::json (de)serialisers, found by ADL ---------------------
    void to_json(nlohmann::json& j, const SafetyFlags& f);
    void from_json(const nlohmann::json& j, SafetyFlags& f);
    void to_json(nlohmann::json& j, const Station& s);
    void from_json(const nlohmann::json& j, Station& s);
    void to_json(nlohmann::json& j, const Outlet& o);
    void from_json(const nlohmann::json& j, Outlet& o);
    void to_json(nlohmann::json& j, const Thresholds& t);
    void from_json(const nlohmann::json& j, Thresholds& t);
    void to_json(nlohmann::json& j, const ChecklistItem& c);
    void from_json(const nlohmann::json& j, ChecklistItem& c);
    void to_json(nlohmann::json& j, const Profile& p);
    void from_json(const nlohmann::json& j, Profile& p);
    void to_json(nlohmann::json& j, const Reading& r);
    void to_json(nlohmann::json& j, const Anomaly& a);
    void to_json(nlohmann::json& j, const TestRun& r);

  } // namespace core
} // namespace benchguard
