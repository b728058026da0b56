#pragma once
/** @file  ReadingStore.hpp
 *  @brief Append-only storage for per-run readings.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// benchguard headers
#include "core/Types.hpp"

namespace benchguard::core {

  class RunJournal;

  /**
 * @class ReadingStore
 * @brief Persistence boundary used by the collector (writes) and the safety
 *        monitor (reads). Readings are never mutated once inserted.
 */
  class ReadingStore {
  public:
    virtual ~ReadingStore() = default;

    /// Stamp and persist one sample. Timestamps strictly increase per run.
    virtual Reading insert(const std::string& runId, const InstantReadings& sample) = 0;

    virtual std::optional<Reading> latest(const std::string& runId) const = 0;

    /// Most recent first; limit == 0 returns everything.
    virtual std::vector<Reading> list(const std::string& runId, std::size_t limit = 0) const = 0;

    /// Oldest first, for result computation.
    virtual std::vector<Reading> chronological(const std::string& runId) const = 0;
  };

  /// Process-local store; optionally mirrors every insert to a RunJournal.
  class InMemoryReadingStore final : public ReadingStore {
  public:
    explicit InMemoryReadingStore(std::shared_ptr<RunJournal> journal = nullptr);

    Reading insert(const std::string& runId, const InstantReadings& sample) override;
    std::optional<Reading> latest(const std::string& runId) const override;
    std::vector<Reading> list(const std::string& runId, std::size_t limit = 0) const override;
    std::vector<Reading> chronological(const std::string& runId) const override;

    std::size_t count(const std::string& runId) const;

  private:
    std::shared_ptr<RunJournal> journal_;
    mutable std::mutex mtx_;
    std::unordered_map<std::string, std::vector<Reading>> byRun_;
  };

} // namespace benchguard::core
