#pragma once
/** @file  SafetyMonitor.hpp
 *  @brief Threshold watchdog and emergency shutdown for live test runs.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// benchguard headers
#include "core/Clock.hpp"
#include "core/PeriodicTask.hpp"
#include "core/Types.hpp"

namespace benchguard::adapters {
  class ControllerAdapter;
} // namespace benchguard::adapters

namespace benchguard::core {

  class AdapterFactory;
  class ErrorMonitor;
  class ReadingsCollector;
  class TestRunManager;

  struct MonitorSettings {
    std::chrono::milliseconds readingCheckInterval{ 250 };
    std::chrono::milliseconds spikeWindow{ 250 }; ///< continuous time at/above spikeShutdownWatts
    std::chrono::milliseconds healthCheckInterval{ 30000 };
  };

  /**
 * @class SafetyMonitor
 * @brief Two periodic checks per monitored run plus the shutdown sequence.
 *
 *  Reading check (fast): evaluates the run's latest persisted Reading.
 *    - SPIKE once watts >= spikeShutdownWatts has held for spikeWindow; a
 *      single check below the threshold resets the window.
 *    - OVERCURRENT as soon as amps > outlet.maxAmps (a ceiling <= 0 is ignored).
 *  Health check (slow): HEALTH_FAIL when the controller reports !ok.
 *
 *  Emergency shutdown claims the run once, and only while it is still
 *  registered. It then runs, each step best-effort:
 *    turnOff -> collector.stop -> addAnomaly -> ABORTED -> stopMonitoring
 *    -> shutdown hook -> ErrorMonitor escalation.
 *
 *  Check results for a run that was deregistered mid-check are discarded.
 */
  class SafetyMonitor {
  public:
    /// Runs on the check thread after the run is ABORTED and deregistered.
    using ShutdownHook = std::function<void(const std::string& runId, const Anomaly& anomaly)>;

    SafetyMonitor(std::shared_ptr<AdapterFactory> factory,
                  std::shared_ptr<ReadingsCollector> collector,
                  std::shared_ptr<TestRunManager> runs, std::shared_ptr<ErrorMonitor> errorMonitor,
                  MonitorSettings settings = {},
                  std::shared_ptr<const Clock> clock = std::make_shared<SteadyClock>());
    ~SafetyMonitor(); ///< stopAll()

    SafetyMonitor(const SafetyMonitor&) = delete;
    SafetyMonitor& operator=(const SafetyMonitor&) = delete;

    /// Violated preconditions; empty means the outlet may be energized.
    static std::vector<std::string> validateSafety(const Station& station, const Outlet& outlet);

    /// validateSafety() or throw SafetyInterlockError.
    static void requireSafe(const Station& station, const Outlet& outlet);

    /// No-op if \p runId is already monitored. ConfigError when the adapter cannot be resolved.
    void startMonitoring(const std::string& runId, const Station& station, const Outlet& outlet,
                         const Profile& profile);

    /// Idempotent. @returns true if the run was registered.
    bool stopMonitoring(const std::string& runId);

    /// @returns number of registrations dropped.
    std::size_t stopAll();

    bool isMonitored(const std::string& runId) const;
    std::size_t activeCount() const;

    /// One reading-check pass. @returns true if it triggered a shutdown.
    bool checkReadings(const std::string& runId);

    /// One health-check pass. @returns true if it triggered a shutdown.
    bool checkHealth(const std::string& runId);

    /// Replaces any previous hook. Invoked once per emergency shutdown.
    void onEmergencyShutdown(ShutdownHook hook);

    /// Emergency shutdowns performed since construction.
    std::size_t shutdownCount() const noexcept { return shutdowns_.load(); }

  private:
    struct Registration {
      std::string runId;
      Station station;
      Outlet outlet;
      Profile profile;
      std::shared_ptr<adapters::ControllerAdapter> adapter;

      std::mutex mtx;
      bool active{ true };                           ///< guarded by mtx
      std::optional<Clock::time_point> spikeStart{}; ///< guarded by mtx
      std::atomic<bool> readingInFlight{ false };
      std::atomic<bool> healthInFlight{ false };
      std::atomic<bool> shutdownClaimed{ false };
      std::unique_ptr<PeriodicTask> readingTask;
      std::unique_ptr<PeriodicTask> healthTask;
    };

    std::shared_ptr<Registration> find(const std::string& runId) const;
    bool evaluateReadings(const std::shared_ptr<Registration>& reg);
    bool evaluateHealth(const std::shared_ptr<Registration>& reg);
    bool emergencyShutdown(const std::shared_ptr<Registration>& reg, const Anomaly& anomaly);
    void deactivateLocked(const std::shared_ptr<Registration>& reg); ///< caller holds mtx_

    std::shared_ptr<AdapterFactory> factory_;
    std::shared_ptr<ReadingsCollector> collector_;
    std::shared_ptr<TestRunManager> runs_;
    std::shared_ptr<ErrorMonitor> errorMonitor_;
    MonitorSettings settings_;
    std::shared_ptr<const Clock> clock_;

    mutable std::mutex mtx_;
    std::unordered_map<std::string, std::shared_ptr<Registration>> registry_;
    std::vector<std::unique_ptr<PeriodicTask>> retired_; ///< cancelled, not yet joined
    ShutdownHook shutdownHook_{};                        ///< guarded by mtx_
    std::atomic<std::size_t> shutdowns_{ 0 };
  };

} // namespace benchguard::core
