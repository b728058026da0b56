#pragma once
/** @file  RunJournal.hpp
 *  @brief Asynchronous per-run CSV journal (runs its own worker thread).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>

// benchguard headers
#include "core/Types.hpp"
#include "io/FileLogger.hpp"

namespace benchguard {
  namespace core {

    /**
 * @class RunJournal
 * @brief Mirrors every persisted Reading to `<directory>/<runId>.csv`.
 *
 *  * `log()` only enqueues; the worker formats and writes, so a slow disk
 *    never delays a collector tick.
 *  * Write failures are reported through spdlog and otherwise ignored.
 */
    class RunJournal {

    public:
      static constexpr const char* kHeader = "ts,watts,volts,amps,tempC,pressure,raw\n";

      explicit RunJournal(std::string directory);
      ~RunJournal(); ///< stop()

      RunJournal(const RunJournal&) = delete;
      RunJournal& operator=(const RunJournal&) = delete;

      // --- public API ---
      void start();                         ///< create directory + launch worker thread
      void log(const Reading& reading);     ///< enqueue row (non-blocking)
      void finishRun(const std::string& runId); ///< flush + close that run's file
      void stop();                          ///< drain queue, close files, join worker

      bool running() const;
      std::string pathFor(const std::string& runId) const;

      /// One CSV row, raw payload quoted; exposed for tests.
      static std::string formatRow(const Reading& reading);

    private:
      struct Entry {
        std::string runId;
        std::optional<Reading> reading{}; ///< std::nullopt = close the run's file
      };

      void workerLoop();
      void writeEntry(const Entry& entry);

      std::string dir_;
      mutable std::mutex mtx_;
      std::condition_variable cv_;
      std::deque<Entry> queue_;
      bool running_{ false };
      std::thread worker_;
      std::unordered_map<std::string, io::FileLogger> files_; ///< worker thread only
    };

  } // namespace core
} // namespace benchguard
