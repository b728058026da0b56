/* @file SafetyMonitor.cpp
 * @brief spike / overcurrent / health watchdog and emergency shutdown
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <stdexcept>

// third-party headers
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

// benchguard headers
#include "adapters/ControllerAdapter.hpp"
#include "core/AdapterFactory.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Errors.hpp"
#include "core/ReadingsCollector.hpp"
#include "core/SafetyMonitor.hpp"
#include "core/TestRunManager.hpp"

using namespace benchguard::core;

namespace {
  /// Skips the call when another pass of the same kind is still running.
  template <typename Fn> bool exclusive(std::atomic<bool>& inFlight, Fn&& fn) {
    if (inFlight.exchange(true))
      return false;
    struct Release {
      std::atomic<bool>& flag;
      ~Release() { flag = false; }
    } release{ inFlight };
    return fn();
  }
} // namespace

SafetyMonitor::SafetyMonitor(std::shared_ptr<AdapterFactory> factory,
                             std::shared_ptr<ReadingsCollector> collector,
                             std::shared_ptr<TestRunManager> runs,
                             std::shared_ptr<ErrorMonitor> errorMonitor, MonitorSettings settings,
                             std::shared_ptr<const Clock> clock)
    : factory_(std::move(factory)), collector_(std::move(collector)), runs_(std::move(runs)),
      errorMonitor_(std::move(errorMonitor)), settings_(settings), clock_(std::move(clock)) {
  if (!factory_ || !collector_ || !runs_ || !errorMonitor_ || !clock_)
    throw std::invalid_argument("[SafetyMonitor] collaborator is nullptr");
  if (settings_.readingCheckInterval.count() <= 0 || settings_.healthCheckInterval.count() <= 0 ||
      settings_.spikeWindow.count() < 0)
    throw std::invalid_argument("[SafetyMonitor] check intervals must be positive");
}

SafetyMonitor::~SafetyMonitor() { stopAll(); }

std::vector<std::string> SafetyMonitor::validateSafety(const Station& station,
                                                        const Outlet& outlet) {
  std::vector<std::string> errors;
  if (!station.safetyFlags.gfciPresent)
    errors.emplace_back("GFCI presence not acknowledged for this station");
  if (station.safetyFlags.acknowledgedBy.empty())
    errors.emplace_back("Station safety not acknowledged by any operator");
  if (!outlet.enabled)
    errors.emplace_back("Outlet is disabled");
  if (!outlet.supportsOnOff && station.controllerType != controller::kManual)
    errors.emplace_back("Outlet does not support automated on/off control");
  return errors;
}

void SafetyMonitor::requireSafe(const Station& station, const Outlet& outlet) {
  auto violations = validateSafety(station, outlet);
  if (!violations.empty())
    throw SafetyInterlockError(std::move(violations));
}

void SafetyMonitor::startMonitoring(const std::string& runId, const Station& station,
                                    const Outlet& outlet, const Profile& profile) {
  std::lock_guard lock(mtx_);
  if (registry_.count(runId)) {
    spdlog::debug("[SafetyMonitor] run {} already monitored", runId);
    return;
  }

  auto reg = std::make_shared<Registration>();
  reg->runId = runId;
  reg->station = station;
  reg->outlet = outlet;
  reg->profile = profile;
  reg->adapter = factory_->forStation(station);

  std::weak_ptr<Registration> weak = reg;
  reg->readingTask = std::make_unique<PeriodicTask>(
      "reading-check:" + runId, settings_.readingCheckInterval, [this, weak] {
        if (auto r = weak.lock())
          evaluateReadings(r);
      });
  reg->healthTask = std::make_unique<PeriodicTask>(
      "health-check:" + runId, settings_.healthCheckInterval, [this, weak] {
        if (auto r = weak.lock())
          evaluateHealth(r);
      });
  registry_.emplace(runId, std::move(reg));

  spdlog::info("[SafetyMonitor] monitoring run {} (spike {} W, max {} A)", runId,
               profile.thresholds.spikeShutdownWatts,
               outlet.maxAmps ? fmt::format("{}", *outlet.maxAmps) : std::string("-"));
}

std::shared_ptr<SafetyMonitor::Registration> SafetyMonitor::find(const std::string& runId) const {
  std::lock_guard lock(mtx_);
  auto it = registry_.find(runId);
  return it == registry_.end() ? nullptr : it->second;
}

void SafetyMonitor::onEmergencyShutdown(ShutdownHook hook) {
  std::lock_guard lock(mtx_);
  shutdownHook_ = std::move(hook);
}

void SafetyMonitor::deactivateLocked(const std::shared_ptr<Registration>& reg) {
  {
    std::lock_guard lock(reg->mtx);
    reg->active = false;
  }
  reg->readingTask->cancel();
  reg->healthTask->cancel();

  // retired in the same critical section as the registry erase so stopAll() joins them
  retired_.erase(std::remove_if(retired_.begin(), retired_.end(),
                                [](const auto& t) { return t->finished(); }),
                 retired_.end());
  retired_.push_back(std::move(reg->readingTask));
  retired_.push_back(std::move(reg->healthTask));
}

bool SafetyMonitor::stopMonitoring(const std::string& runId) {
  {
    std::lock_guard lock(mtx_);
    auto it = registry_.find(runId);
    if (it == registry_.end())
      return false;
    auto reg = std::move(it->second);
    registry_.erase(it);
    deactivateLocked(reg);
  }
  spdlog::info("[SafetyMonitor] stopped monitoring run {}", runId);
  return true;
}

std::size_t SafetyMonitor::stopAll() {
  std::size_t dropped = 0;
  std::vector<std::unique_ptr<PeriodicTask>> tasks;
  {
    std::lock_guard lock(mtx_);
    for (auto& [runId, reg] : registry_)
      deactivateLocked(reg);
    dropped = registry_.size();
    registry_.clear();
    tasks.swap(retired_);
  }
  for (auto& t : tasks)
    t->join();

  if (dropped != 0)
    spdlog::info("[SafetyMonitor] stopped monitoring {} run(s)", dropped);
  return dropped;
}

bool SafetyMonitor::isMonitored(const std::string& runId) const {
  std::lock_guard lock(mtx_);
  return registry_.count(runId) != 0;
}

std::size_t SafetyMonitor::activeCount() const {
  std::lock_guard lock(mtx_);
  return registry_.size();
}

bool SafetyMonitor::checkReadings(const std::string& runId) {
  auto reg = find(runId);
  return reg ? evaluateReadings(reg) : false;
}

bool SafetyMonitor::checkHealth(const std::string& runId) {
  auto reg = find(runId);
  return reg ? evaluateHealth(reg) : false;
}

bool SafetyMonitor::evaluateReadings(const std::shared_ptr<Registration>& reg) {
  return exclusive(reg->readingInFlight, [&] {
    const auto latest = collector_->getLatestReading(reg->runId);
    if (!latest)
      return false;

    const Thresholds& th = reg->profile.thresholds;
    std::optional<Anomaly> anomaly;
    {
      std::lock_guard lock(reg->mtx);
      if (!reg->active)
        return false;

      const auto now = clock_->now();
      if (latest->watts && *latest->watts >= th.spikeShutdownWatts) {
        if (!reg->spikeStart) {
          reg->spikeStart = now;
        } else if (now - *reg->spikeStart >= settings_.spikeWindow) {
          anomaly = Anomaly{ AnomalyType::Spike,
                             fmt::format("Power spike {}W exceeded shutdown threshold {}W for >{}ms",
                                         *latest->watts, th.spikeShutdownWatts,
                                         settings_.spikeWindow.count()),
                             WallClock::now(), latest->watts, th.spikeShutdownWatts };
        }
      } else {
        reg->spikeStart.reset();
      }

      // a non-positive ceiling means none is configured
      const auto& maxAmps = reg->outlet.maxAmps;
      if (!anomaly && latest->amps && maxAmps && *maxAmps > 0.0 && *latest->amps > *maxAmps) {
        anomaly = Anomaly{ AnomalyType::Overcurrent,
                           fmt::format("Current {}A exceeds outlet max {}A", *latest->amps,
                                       *maxAmps),
                           WallClock::now(), latest->amps, maxAmps };
      }
    }

    return anomaly ? emergencyShutdown(reg, *anomaly) : false;
  });
}

bool SafetyMonitor::evaluateHealth(const std::shared_ptr<Registration>& reg) {
  return exclusive(reg->healthInFlight, [&] {
    {
      std::lock_guard lock(reg->mtx);
      if (!reg->active)
        return false;
    }

    const HealthCheckResult health = reg->adapter->healthCheck(reg->station);
    if (health.ok)
      return false;

    {
      std::lock_guard lock(reg->mtx);
      if (!reg->active)
        return false; // stopped while the health check was in flight
    }
    return emergencyShutdown(
        reg, Anomaly{ AnomalyType::HealthFail,
                      "Controller health check failed: " + health.details.dump(),
                      WallClock::now(), std::nullopt, std::nullopt });
  });
}

bool SafetyMonitor::emergencyShutdown(const std::shared_ptr<Registration>& reg,
                                      const Anomaly& anomaly) {
  {
    std::lock_guard lock(mtx_);
    auto it = registry_.find(reg->runId);
    if (it == registry_.end() || it->second != reg)
      return false;
    if (reg->shutdownClaimed.exchange(true))
      return false;
  }
  ++shutdowns_;

  const std::string& runId = reg->runId;
  spdlog::error("[SafetyMonitor] EMERGENCY SHUTDOWN for {}: {}", runId, anomaly.message);

  // 1. de-energize first; never throws
  reg->adapter->turnOff(reg->station, reg->outlet);

  // 2..5 each best-effort so a failure cannot skip the rest
  try {
    collector_->stop(runId);
  } catch (const std::exception& e) {
    spdlog::error("[SafetyMonitor] {} collector stop failed: {}", runId, e.what());
  }
  try {
    runs_->addAnomaly(runId, anomaly);
  } catch (const std::exception& e) {
    spdlog::error("[SafetyMonitor] {} anomaly not recorded: {}", runId, e.what());
  }
  try {
    runs_->updateStatus(runId, RunStatus::Aborted);
  } catch (const std::exception& e) {
    spdlog::error("[SafetyMonitor] {} status update failed: {}", runId, e.what());
  }
  stopMonitoring(runId);

  ShutdownHook hook;
  {
    std::lock_guard lock(mtx_);
    hook = shutdownHook_;
  }
  if (hook) {
    try {
      hook(runId, anomaly);
    } catch (const std::exception& e) {
      spdlog::error("[SafetyMonitor] shutdown hook for {} failed: {}", runId, e.what());
    }
  }

  try {
    errorMonitor_->notifyFailure(fmt::format("[SafetyMonitor] {} aborted: {} ({})", runId,
                                             toString(anomaly.type), anomaly.message));
  } catch (const std::exception& e) {
    spdlog::error("[SafetyMonitor] escalation for {} failed: {}", runId, e.what());
  }
  return true;
}
