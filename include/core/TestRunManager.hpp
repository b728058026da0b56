#pragma once
/** @file  TestRunManager.hpp
 *  @brief Run records, status state machine and result scoring.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// benchguard headers
#include "core/Types.hpp"

namespace benchguard::core {

  class ReadingStore;

  struct RunOutcome {
    RunResult result{ RunResult::Incomplete };
    int score{ 0 };
  };

  /// Grade a finished run from its readings (oldest first) and anomaly count.
  RunOutcome computeResult(const std::vector<Reading>& chronological, std::size_t anomalyCount,
                           const Thresholds& thresholds);

  struct RunFilter {
    std::optional<std::string> stationId{};
    std::optional<RunStatus> status{};
    std::size_t limit{ 0 }; ///< 0 = no limit
  };

  /**
 * @class TestRunManager
 * @brief Owns every TestRun and its anomaly log.
 *
 *  PENDING -> IN_PROGRESS -> {COMPLETED, FAILED, ABORTED}; PENDING may also go
 *  straight to FAILED or ABORTED. Terminal runs never change status again:
 *  `updateStatus` on them returns false instead of throwing, since a shutdown
 *  can race the run's own completion.
 *
 *  Unknown run ids raise std::out_of_range. Thread-safe.
 */
  class TestRunManager {
  public:
    explicit TestRunManager(std::shared_ptr<const ReadingStore> readings);

    /// New PENDING run. ConfigError when the outlet is held by a live run.
    TestRun createRun(const RunRequest& request);

    TestRun getRun(const std::string& runId) const;
    bool exists(const std::string& runId) const;

    /// Newest first.
    std::vector<TestRun> listRuns(const RunFilter& filter = {}) const;

    /// @returns true when the status changed.
    bool updateStatus(const std::string& runId, RunStatus status);

    void addAnomaly(const std::string& runId, const Anomaly& anomaly);
    void submitChecklist(const std::string& runId, const nlohmann::json& values);
    void setNotes(const std::string& runId, const std::string& notes);

    /// Score the run and mark it COMPLETED. @returns false when already terminal.
    bool completeRun(const std::string& runId, const Thresholds& thresholds);

  private:
    TestRun& at(const std::string& runId);
    const TestRun& at(const std::string& runId) const;

    std::shared_ptr<const ReadingStore> readings_;
    mutable std::mutex mtx_;
    std::map<std::string, TestRun> runs_;
    std::size_t nextId_{ 1 };
  };

} // namespace benchguard::core
