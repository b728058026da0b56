/* @file ReadingsCollector.cpp
 * @brief per-run polling sessions
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <stdexcept>

// third-party headers
#include <spdlog/spdlog.h>

// benchguard headers
#include "adapters/ControllerAdapter.hpp"
#include "core/AdapterFactory.hpp"
#include "core/Errors.hpp"
#include "core/ReadingStore.hpp"
#include "core/ReadingsCollector.hpp"

using namespace benchguard::core;

ReadingsCollector::ReadingsCollector(std::shared_ptr<AdapterFactory> factory,
                                     std::shared_ptr<ReadingStore> store)
    : factory_(std::move(factory)), store_(std::move(store)) {
  if (!factory_)
    throw std::invalid_argument("[ReadingsCollector] adapter factory is nullptr");
  if (!store_)
    throw std::invalid_argument("[ReadingsCollector] reading store is nullptr");
}

ReadingsCollector::~ReadingsCollector() { stopAll(); }

void ReadingsCollector::start(const std::string& runId, const Station& station,
                              const Outlet& outlet, std::chrono::milliseconds interval) {
  if (interval.count() <= 0)
    throw ConfigError("[ReadingsCollector] interval must be positive for run " + runId);

  std::lock_guard lock(mtx_);
  if (sessions_.count(runId))
    throw ConfigError("[ReadingsCollector] already collecting readings for run " + runId);

  auto session = std::make_shared<Session>();
  session->runId = runId;
  session->station = station;
  session->outlet = outlet;
  session->adapter = factory_->forStation(station);

  std::weak_ptr<Session> weak = session;
  session->task = std::make_unique<PeriodicTask>("collect:" + runId, interval, [this, weak] {
    if (auto s = weak.lock())
      poll(s);
  });
  sessions_.emplace(runId, std::move(session));

  spdlog::info("[ReadingsCollector] started run {} ({} / {}) every {} ms via {}", runId,
               station.id, outlet.label, interval.count(), sessions_.at(runId)->adapter->name());
}

bool ReadingsCollector::poll(const std::shared_ptr<Session>& s) {
  if (s->inFlight.exchange(true)) {
    spdlog::debug("[ReadingsCollector] run {} poll still in flight, skipping", s->runId);
    return false;
  }
  struct Release {
    std::atomic<bool>& flag;
    ~Release() { flag = false; }
  } release{ s->inFlight };

  {
    std::lock_guard lock(s->mtx);
    if (!s->active)
      return false;
  }

  InstantReadings sample;
  try {
    sample = s->adapter->getInstantReadings(s->station, s->outlet);
  } catch (const std::exception& e) {
    spdlog::warn("[ReadingsCollector] run {} read failed: {}", s->runId, e.what());
    return false;
  }

  std::lock_guard lock(s->mtx);
  if (!s->active) {
    spdlog::debug("[ReadingsCollector] run {} stopped during read, sample discarded", s->runId);
    return false;
  }
  store_->insert(s->runId, sample);
  ++s->collected;
  return true;
}

bool ReadingsCollector::pollNow(const std::string& runId) {
  std::shared_ptr<Session> s;
  {
    std::lock_guard lock(mtx_);
    auto it = sessions_.find(runId);
    if (it == sessions_.end())
      return false;
    s = it->second;
  }
  return poll(s);
}

void ReadingsCollector::retireLocked(std::unique_ptr<PeriodicTask> task) {
  retired_.erase(std::remove_if(retired_.begin(), retired_.end(),
                                [](const auto& t) { return t->finished(); }),
                 retired_.end());
  retired_.push_back(std::move(task));
}

std::size_t ReadingsCollector::stop(const std::string& runId) {
  std::size_t collected = 0;
  {
    std::lock_guard lock(mtx_);
    auto it = sessions_.find(runId);
    if (it == sessions_.end())
      return 0;
    auto s = std::move(it->second);
    sessions_.erase(it);

    {
      std::lock_guard sessionLock(s->mtx);
      s->active = false;
      collected = s->collected;
    }
    s->task->cancel();
    retireLocked(std::move(s->task));
  }

  spdlog::info("[ReadingsCollector] stopped run {} after {} readings", runId, collected);
  return collected;
}

std::size_t ReadingsCollector::stopAll() {
  std::unordered_map<std::string, std::shared_ptr<Session>> sessions;
  std::vector<std::unique_ptr<PeriodicTask>> tasks;
  {
    std::lock_guard lock(mtx_);
    sessions.swap(sessions_);
    tasks.swap(retired_);
  }

  for (auto& [runId, s] : sessions) {
    {
      std::lock_guard lock(s->mtx);
      s->active = false;
    }
    s->task->cancel();
    tasks.push_back(std::move(s->task));
  }
  for (auto& t : tasks)
    t->join();

  if (!sessions.empty())
    spdlog::info("[ReadingsCollector] stopped {} collection session(s)", sessions.size());
  return sessions.size();
}

bool ReadingsCollector::isCollecting(const std::string& runId) const {
  std::lock_guard lock(mtx_);
  return sessions_.count(runId) != 0;
}

std::size_t ReadingsCollector::activeCount() const {
  std::lock_guard lock(mtx_);
  return sessions_.size();
}

std::optional<Reading> ReadingsCollector::getLatestReading(const std::string& runId) const {
  return store_->latest(runId);
}

std::vector<Reading> ReadingsCollector::getReadings(const std::string& runId,
                                                    std::size_t limit) const {
  return store_->list(runId, limit);
}

Reading ReadingsCollector::recordReading(const std::string& runId, const InstantReadings& sample) {
  std::shared_ptr<Session> s;
  {
    std::lock_guard lock(mtx_);
    auto it = sessions_.find(runId);
    if (it != sessions_.end())
      s = it->second;
  }
  if (!s)
    return store_->insert(runId, sample);

  std::lock_guard lock(s->mtx);
  Reading r = store_->insert(runId, sample);
  if (s->active)
    ++s->collected;
  return r;
}
