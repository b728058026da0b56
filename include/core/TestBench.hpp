#pragma once

/** @file  TestBench.hpp
 *  @brief Public API for benchguard::core::TestBench.
 *
 *  © 2025 Milo Medical — licensed under MIT.
 */

// STL headers
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

// benchguard headers
#include "core/BenchConfig.hpp"
#include "core/Clock.hpp"
#include "core/Types.hpp"

namespace benchguard::adapters {
  class ControllerAdapter;
} // namespace benchguard::adapters

namespace benchguard {
  namespace core {

    class AdapterFactory;
    class ErrorMonitor;
    class InMemoryReadingStore;
    class ReadingsCollector;
    class RunJournal;
    class SafetyMonitor;
    class TestRunManager;

    /**
 * @class TestBench
 * @brief Owns the collector, monitor and run manager and sequences a run:
 *        interlock check, energize, collect + monitor, stop or finish.
 *
 *  * Every outlet energized through startRun() is de-energized again by
 *    stopRun(), finishRun() or shutdown().
 *  * Unknown run ids raise std::out_of_range.
 */
    class TestBench {

    public:
      /// @param factory  adapter registry; defaults to the built-ins for config.adapters
      explicit TestBench(BenchConfig config, std::shared_ptr<AdapterFactory> factory = nullptr,
                         std::shared_ptr<const Clock> clock = std::make_shared<SteadyClock>());
      ~TestBench(); ///< shutdown()

      TestBench(const TestBench&) = delete;
      TestBench& operator=(const TestBench&) = delete;

      // ---- run lifecycle ----
      /// Throws SafetyInterlockError, ConfigError, or the adapter's turnOn failure
      /// (the run is then FAILED).
      TestRun startRun(const RunRequest& request, const Station& station, const Outlet& outlet,
                       const Profile& profile);

      /// Resolves station, outlet and profile from the configured catalog.
      TestRun startRun(const RunRequest& request);

      /// Operator cancellation. @returns readings collected by the session.
      std::size_t stopRun(const std::string& runId);

      /// Normal completion: de-energize and grade against the profile.
      TestRun finishRun(const std::string& runId);

      /// Drain both registries and de-energize every outlet still owned by a run.
      void shutdown() noexcept;

      // ---- collaborators ----
      const BenchConfig& config() const noexcept { return config_; }
      TestRunManager& runs() noexcept { return *runs_; }
      ReadingsCollector& collector() noexcept { return *collector_; }
      SafetyMonitor& monitor() noexcept { return *monitor_; }
      ErrorMonitor& errorMonitor() noexcept { return *errorMonitor_; }

    private:
      struct LiveRun {
        Station station;
        Outlet outlet;
        Profile profile;
        std::shared_ptr<adapters::ControllerAdapter> adapter;
      };

      /// Remove and return the live entry, or nullptr if the run is not live.
      std::unique_ptr<LiveRun> release(const std::string& runId);
      void closeJournal(const std::string& runId);

      BenchConfig config_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;
      std::shared_ptr<RunJournal> journal_;
      std::shared_ptr<InMemoryReadingStore> store_;
      std::shared_ptr<AdapterFactory> factory_;
      std::shared_ptr<ReadingsCollector> collector_;
      std::shared_ptr<TestRunManager> runs_;
      std::shared_ptr<SafetyMonitor> monitor_;

      std::mutex mtx_;
      std::unordered_map<std::string, std::unique_ptr<LiveRun>> live_;
    };

  } // namespace core
} // namespace benchguard
