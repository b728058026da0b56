/* @file ReadingStore.cpp
 * @brief in-memory reading table
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "core/ReadingStore.hpp"

#include "core/RunJournal.hpp"

using namespace benchguard::core;

InMemoryReadingStore::InMemoryReadingStore(std::shared_ptr<RunJournal> journal)
    : journal_(std::move(journal)) {}

Reading InMemoryReadingStore::insert(const std::string& runId, const InstantReadings& sample) {
  Reading r;
  r.runId = runId;
  r.watts = sample.watts;
  r.volts = sample.volts;
  r.amps = sample.amps;
  r.tempC = sample.tempC;
  r.pressure = sample.pressure;
  r.raw = sample.raw;

  {
    std::lock_guard lock(mtx_);
    auto& rows = byRun_[runId];
    r.ts = WallClock::now();
    if (!rows.empty() && r.ts <= rows.back().ts)
      r.ts = rows.back().ts + std::chrono::microseconds{ 1 };
    rows.push_back(r);
    if (journal_)
      journal_->log(r); // under the lock so journal rows keep insert order
  }
  return r;
}

std::optional<Reading> InMemoryReadingStore::latest(const std::string& runId) const {
  std::lock_guard lock(mtx_);
  auto it = byRun_.find(runId);
  if (it == byRun_.end() || it->second.empty())
    return std::nullopt;
  return it->second.back();
}

std::vector<Reading> InMemoryReadingStore::list(const std::string& runId, std::size_t limit) const {
  std::lock_guard lock(mtx_);
  auto it = byRun_.find(runId);
  if (it == byRun_.end())
    return {};
  const auto& rows = it->second;
  const std::size_t n = (limit == 0 || limit > rows.size()) ? rows.size() : limit;
  return std::vector<Reading>(rows.rbegin(), rows.rbegin() + static_cast<std::ptrdiff_t>(n));
}

std::vector<Reading> InMemoryReadingStore::chronological(const std::string& runId) const {
  std::lock_guard lock(mtx_);
  auto it = byRun_.find(runId);
  return it == byRun_.end() ? std::vector<Reading>{} : it->second;
}

std::size_t InMemoryReadingStore::count(const std::string& runId) const {
  std::lock_guard lock(mtx_);
  auto it = byRun_.find(runId);
  return it == byRun_.end() ? 0 : it->second.size();
}
