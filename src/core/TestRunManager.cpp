/* @file TestRunManager.cpp
 * @brief run state machine + scoring
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cmath>
#include <stdexcept>

// third-party headers
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

// benchguard headers
#include "core/Errors.hpp"
#include "core/ReadingStore.hpp"
#include "core/TestRunManager.hpp"

using namespace benchguard::core;

RunOutcome benchguard::core::computeResult(const std::vector<Reading>& readings,
                                           std::size_t anomalyCount, const Thresholds& th) {
  if (readings.empty())
    return { RunResult::Incomplete, 0 };

  const double durationSeconds =
      std::chrono::duration<double>(readings.back().ts - readings.front().ts).count();
  if (durationSeconds < th.minRunSeconds)
    return { RunResult::Incomplete, 20 };

  const bool hasAnomalies = anomalyCount > 0;

  std::vector<double> watts;
  for (const auto& r : readings)
    if (r.watts)
      watts.push_back(*r.watts);

  // no power data: cannot auto-grade beyond the anomaly log
  if (watts.empty())
    return hasAnomalies ? RunOutcome{ RunResult::Anomaly, 50 } : RunOutcome{ RunResult::Pass, 70 };

  if (*std::max_element(watts.begin(), watts.end()) > th.maxPeakWatts)
    return { RunResult::Fail, 10 };

  const auto outOfRange = std::count_if(watts.begin(), watts.end(), [&th](double w) {
    return w < th.minStableWatts || w > th.maxStableWatts;
  });
  const double fraction = static_cast<double>(outOfRange) / static_cast<double>(watts.size());

  long score = 100;
  score -= static_cast<long>(std::floor(fraction * 40.0 + 0.5));
  score -= static_cast<long>(anomalyCount) * 10;
  score = std::clamp(score, 0L, 100L);

  if (score < 50)
    return { RunResult::Fail, static_cast<int>(score) };
  if (hasAnomalies)
    return { RunResult::Anomaly, static_cast<int>(score) };
  return { RunResult::Pass, static_cast<int>(score) };
}

TestRunManager::TestRunManager(std::shared_ptr<const ReadingStore> readings)
    : readings_(std::move(readings)) {
  if (!readings_)
    throw std::invalid_argument("[TestRunManager] reading store is nullptr");
}

TestRun& TestRunManager::at(const std::string& runId) {
  auto it = runs_.find(runId);
  if (it == runs_.end())
    throw std::out_of_range("[TestRunManager] test run not found: " + runId);
  return it->second;
}

const TestRun& TestRunManager::at(const std::string& runId) const {
  auto it = runs_.find(runId);
  if (it == runs_.end())
    throw std::out_of_range("[TestRunManager] test run not found: " + runId);
  return it->second;
}

TestRun TestRunManager::createRun(const RunRequest& req) {
  if (req.qlid.empty() || req.stationId.empty() || req.outletId.empty() || req.profileId.empty())
    throw ConfigError("[TestRunManager] run request needs qlid, stationId, outletId and profileId");

  std::lock_guard lock(mtx_);
  for (const auto& [id, run] : runs_) {
    if (!isTerminal(run.status) && run.stationId == req.stationId && run.outletId == req.outletId)
      throw ConfigError(fmt::format("[TestRunManager] outlet {}/{} already claimed by {} ({})",
                                    req.stationId, req.outletId, id, toString(run.status)));
  }

  TestRun run;
  run.id = fmt::format("run-{:06d}", nextId_++);
  run.qlid = req.qlid;
  run.palletId = req.palletId;
  run.stationId = req.stationId;
  run.outletId = req.outletId;
  run.profileId = req.profileId;
  run.operatorUserId = req.operatorUserId;
  run.status = RunStatus::Pending;
  run.createdAt = WallClock::now();

  runs_.emplace(run.id, run);
  spdlog::info("[TestRunManager] created {} for {} on {}/{}", run.id, run.qlid, run.stationId,
               run.outletId);
  return run;
}

TestRun TestRunManager::getRun(const std::string& runId) const {
  std::lock_guard lock(mtx_);
  return at(runId);
}

bool TestRunManager::exists(const std::string& runId) const {
  std::lock_guard lock(mtx_);
  return runs_.count(runId) != 0;
}

std::vector<TestRun> TestRunManager::listRuns(const RunFilter& filter) const {
  std::vector<TestRun> out;
  {
    std::lock_guard lock(mtx_);
    for (const auto& [id, run] : runs_) {
      if (filter.stationId && run.stationId != *filter.stationId)
        continue;
      if (filter.status && run.status != *filter.status)
        continue;
      out.push_back(run);
    }
  }
  // ids are zero-padded and sequential, so id order is creation order
  std::sort(out.begin(), out.end(), [](const TestRun& a, const TestRun& b) { return a.id > b.id; });
  if (filter.limit != 0 && out.size() > filter.limit)
    out.resize(filter.limit);
  return out;
}

bool TestRunManager::updateStatus(const std::string& runId, RunStatus status) {
  std::lock_guard lock(mtx_);
  TestRun& run = at(runId);

  if (isTerminal(run.status)) {
    spdlog::debug("[TestRunManager] {} already {}, ignoring {}", runId, toString(run.status),
                  toString(status));
    return false;
  }
  if (run.status == status)
    return false;
  if (status == RunStatus::Pending) {
    spdlog::warn("[TestRunManager] {} cannot return to PENDING from {}", runId,
                 toString(run.status));
    return false;
  }

  const auto now = WallClock::now();
  if (status == RunStatus::InProgress)
    run.startedAt = now;
  if (isTerminal(status))
    run.endedAt = now;
  run.status = status;

  spdlog::info("[TestRunManager] {} -> {}", runId, toString(status));
  return true;
}

void TestRunManager::addAnomaly(const std::string& runId, const Anomaly& anomaly) {
  std::lock_guard lock(mtx_);
  at(runId).anomalies.push_back(anomaly);
}

void TestRunManager::submitChecklist(const std::string& runId, const nlohmann::json& values) {
  if (!values.is_object())
    throw std::invalid_argument("[TestRunManager] checklist values must be a JSON object");
  std::lock_guard lock(mtx_);
  at(runId).checklistValues = values;
}

void TestRunManager::setNotes(const std::string& runId, const std::string& notes) {
  std::lock_guard lock(mtx_);
  at(runId).notes = notes;
}

bool TestRunManager::completeRun(const std::string& runId, const Thresholds& thresholds) {
  // readings come from another lock domain; fetch before taking ours
  const auto readings = readings_->chronological(runId);

  std::lock_guard lock(mtx_);
  TestRun& run = at(runId);
  if (isTerminal(run.status)) {
    spdlog::debug("[TestRunManager] {} already {}, not completing", runId, toString(run.status));
    return false;
  }

  const RunOutcome outcome = computeResult(readings, run.anomalies.size(), thresholds);
  run.result = outcome.result;
  run.score = outcome.score;
  run.status = RunStatus::Completed;
  run.endedAt = WallClock::now();

  spdlog::info("[TestRunManager] {} completed: {} (score {}, {} readings)", runId,
               toString(outcome.result), outcome.score, readings.size());
  return true;
}
