#pragma once
/** @file  ReadingsCollector.hpp
 *  @brief One polling task per active run: adapter -> ReadingStore.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// benchguard headers
#include "core/PeriodicTask.hpp"
#include "core/Types.hpp"

namespace benchguard::adapters {
  class ControllerAdapter;
} // namespace benchguard::adapters

namespace benchguard::core {

  class AdapterFactory;
  class ReadingStore;

  /**
 * @class ReadingsCollector
 * @brief Registry of collection sessions keyed by run id.
 *
 *  * A failed poll is logged and skipped; the next tick is the retry.
 *  * `stop()` returns only after any in-flight insert for that run has
 *    landed, and nothing is persisted for the run afterwards.
 *  * Thread-safe. Safe to call `stop()` from another registry's task.
 */
  class ReadingsCollector {
  public:
    static constexpr std::chrono::milliseconds kDefaultInterval{ 1000 };

    ReadingsCollector(std::shared_ptr<AdapterFactory> factory, std::shared_ptr<ReadingStore> store);
    ~ReadingsCollector(); ///< stopAll()

    ReadingsCollector(const ReadingsCollector&) = delete;
    ReadingsCollector& operator=(const ReadingsCollector&) = delete;

    /// Throws ConfigError when already collecting for \p runId, for a
    /// non-positive interval or when the station's adapter cannot be resolved.
    void start(const std::string& runId, const Station& station, const Outlet& outlet,
               std::chrono::milliseconds interval = kDefaultInterval);

    /// Idempotent. @returns readings collected in the stopped session, 0 if none.
    std::size_t stop(const std::string& runId);

    /// Stops every session. @returns number of sessions stopped.
    std::size_t stopAll();

    bool isCollecting(const std::string& runId) const;
    std::size_t activeCount() const;

    /// Poll the adapter once, outside the schedule. Skipped (false) while a
    /// tick for the same run is in flight or when nothing was persisted.
    bool pollNow(const std::string& runId);

    std::optional<Reading> getLatestReading(const std::string& runId) const;
    std::vector<Reading> getReadings(const std::string& runId, std::size_t limit = 0) const;

    /// Persist a sample from a source that cannot be polled (operator entry, external meter).
    Reading recordReading(const std::string& runId, const InstantReadings& sample);

  private:
    struct Session {
      std::string runId;
      Station station;
      Outlet outlet;
      std::shared_ptr<adapters::ControllerAdapter> adapter;

      std::mutex mtx;
      bool active{ true };       ///< guarded by mtx
      std::size_t collected{ 0 }; ///< guarded by mtx
      std::atomic<bool> inFlight{ false };
      std::unique_ptr<PeriodicTask> task;
    };

    bool poll(const std::shared_ptr<Session>& session);
    void retireLocked(std::unique_ptr<PeriodicTask> task); ///< caller holds mtx_

    std::shared_ptr<AdapterFactory> factory_;
    std::shared_ptr<ReadingStore> store_;

    mutable std::mutex mtx_;
    std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;
    std::vector<std::unique_ptr<PeriodicTask>> retired_; ///< cancelled, not yet joined
  };

} // namespace benchguard::core
