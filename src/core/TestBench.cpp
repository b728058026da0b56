/* @file TestBench.cpp
 * @brief run sequencing across collector, monitor and run manager
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <vector>

// third-party headers
#include <spdlog/spdlog.h>

// benchguard headers
#include "adapters/ControllerAdapter.hpp"
#include "core/AdapterFactory.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Errors.hpp"
#include "core/ReadingStore.hpp"
#include "core/ReadingsCollector.hpp"
#include "core/RunJournal.hpp"
#include "core/SafetyMonitor.hpp"
#include "core/TestBench.hpp"
#include "core/TestRunManager.hpp"

using namespace benchguard::core;

TestBench::TestBench(BenchConfig config, std::shared_ptr<AdapterFactory> factory,
                     std::shared_ptr<const Clock> clock)
    : config_(std::move(config)), errorMonitor_(std::make_shared<ErrorMonitor>()),
      factory_(std::move(factory)) {
  if (!factory_)
    factory_ = std::make_shared<AdapterFactory>(AdapterFactory::withBuiltins(config_.adapters));

  if (!config_.journalDir.empty()) {
    journal_ = std::make_shared<RunJournal>(config_.journalDir);
    journal_->start();
  }
  store_ = std::make_shared<InMemoryReadingStore>(journal_);
  collector_ = std::make_shared<ReadingsCollector>(factory_, store_);
  runs_ = std::make_shared<TestRunManager>(store_);
  monitor_ = std::make_shared<SafetyMonitor>(factory_, collector_, runs_, errorMonitor_,
                                             config_.monitor, std::move(clock));

  // the monitor already de-energized the outlet; only the bookkeeping is left
  monitor_->onEmergencyShutdown([this](const std::string& runId, const Anomaly& anomaly) {
    if (release(runId))
      spdlog::warn("[TestBench] {} released after {}", runId, toString(anomaly.type));
    closeJournal(runId);
  });
}

TestBench::~TestBench() { shutdown(); }

TestRun TestBench::startRun(const RunRequest& request) {
  return startRun(request, config_.station(request.stationId),
                  config_.outlet(request.stationId, request.outletId),
                  config_.profile(request.profileId));
}

TestRun TestBench::startRun(const RunRequest& request, const Station& station,
                            const Outlet& outlet, const Profile& profile) {
  if (request.stationId != station.id || request.outletId != outlet.id ||
      request.profileId != profile.id)
    throw ConfigError("[TestBench] run request does not match station/outlet/profile");

  SafetyMonitor::requireSafe(station, outlet);
  auto adapter = factory_->forStation(station);
  const TestRun run = runs_->createRun(request);

  try {
    adapter->turnOn(station, outlet);
  } catch (const std::exception& e) {
    runs_->updateStatus(run.id, RunStatus::Failed);
    errorMonitor_->notifyFailure("[TestBench] " + run.id + " turnOn failed on " + station.id +
                                 "/" + outlet.id + ": " + e.what());
    throw;
  }
  runs_->updateStatus(run.id, RunStatus::InProgress);

  try {
    collector_->start(run.id, station, outlet, config_.collectorInterval);
    monitor_->startMonitoring(run.id, station, outlet, profile);
  } catch (const std::exception& e) {
    spdlog::error("[TestBench] {} could not start collection/monitoring: {}", run.id, e.what());
    monitor_->stopMonitoring(run.id);
    collector_->stop(run.id);
    adapter->turnOff(station, outlet);
    runs_->updateStatus(run.id, RunStatus::Failed);
    throw;
  }

  {
    std::lock_guard lock(mtx_);
    live_.emplace(run.id, std::make_unique<LiveRun>(LiveRun{ station, outlet, profile, adapter }));
  }
  spdlog::info("[TestBench] {} running: {} on {}/{} ({})", run.id, run.qlid, station.id,
               outlet.label, adapter->name());
  return runs_->getRun(run.id);
}

std::unique_ptr<TestBench::LiveRun> TestBench::release(const std::string& runId) {
  std::lock_guard lock(mtx_);
  auto it = live_.find(runId);
  if (it == live_.end())
    return nullptr;
  auto entry = std::move(it->second);
  live_.erase(it);
  return entry;
}

void TestBench::closeJournal(const std::string& runId) {
  if (journal_)
    journal_->finishRun(runId);
}

std::size_t TestBench::stopRun(const std::string& runId) {
  if (!runs_->exists(runId))
    throw std::out_of_range("[TestBench] unknown run: " + runId);

  monitor_->stopMonitoring(runId);
  const std::size_t collected = collector_->stop(runId);
  if (auto live = release(runId))
    live->adapter->turnOff(live->station, live->outlet);
  if (runs_->updateStatus(runId, RunStatus::Aborted))
    spdlog::warn("[TestBench] {} stopped by operator after {} readings", runId, collected);
  closeJournal(runId);
  return collected;
}

TestRun TestBench::finishRun(const std::string& runId) {
  if (!runs_->exists(runId))
    throw std::out_of_range("[TestBench] unknown run: " + runId);

  monitor_->stopMonitoring(runId);
  collector_->stop(runId);
  auto live = release(runId);
  if (live) {
    live->adapter->turnOff(live->station, live->outlet);
    runs_->completeRun(runId, live->profile.thresholds);
  }
  closeJournal(runId);
  return runs_->getRun(runId);
}

void TestBench::shutdown() noexcept {
  monitor_->stopAll();
  collector_->stopAll();

  std::unordered_map<std::string, std::unique_ptr<LiveRun>> live;
  {
    std::lock_guard lock(mtx_);
    live.swap(live_);
  }
  for (auto& [runId, entry] : live) {
    entry->adapter->turnOff(entry->station, entry->outlet);
    try {
      runs_->updateStatus(runId, RunStatus::Aborted);
    } catch (const std::exception& e) {
      spdlog::error("[TestBench] {} not marked aborted on shutdown: {}", runId, e.what());
    }
    closeJournal(runId);
  }
  if (!live.empty())
    spdlog::warn("[TestBench] shutdown de-energized {} outlet(s)", live.size());

  if (journal_)
    journal_->stop();
}
