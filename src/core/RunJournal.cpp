/* @file RunJournal.cpp
 * @brief queue + worker that writes per-run CSV files
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <system_error>

// third-party headers
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

// benchguard headers
#include "core/RunJournal.hpp"

using namespace benchguard::core;

namespace {
  std::string field(const std::optional<double>& v) { return v ? fmt::format("{}", *v) : ""; }

  std::string quoted(const std::string& text) {
    std::string out = "\"";
    for (char c : text) {
      if (c == '"')
        out += '"';
      out += c;
    }
    out += '"';
    return out;
  }

  std::string safeFileName(std::string id) {
    for (char& c : id)
      if (c == '/' || c == '\\' || c == ':')
        c = '_';
    return id;
  }
} // namespace

RunJournal::RunJournal(std::string directory) : dir_(std::move(directory)) {
  if (dir_.empty())
    throw std::invalid_argument("[RunJournal] directory is empty");
}

RunJournal::~RunJournal() { stop(); }

void RunJournal::start() {
  std::lock_guard lock(mtx_);
  if (running_)
    return;

  std::error_code ec;
  std::filesystem::create_directories(dir_, ec);
  if (ec)
    throw std::runtime_error("[RunJournal] cannot create " + dir_ + ": " + ec.message());

  running_ = true;
  worker_ = std::thread([this] { workerLoop(); });
  spdlog::info("[RunJournal] writing run journals to {}", dir_);
}

void RunJournal::log(const Reading& reading) {
  {
    std::lock_guard lock(mtx_);
    if (!running_)
      return;
    queue_.push_back({ reading.runId, reading });
  }
  cv_.notify_one();
}

void RunJournal::finishRun(const std::string& runId) {
  {
    std::lock_guard lock(mtx_);
    if (!running_)
      return;
    queue_.push_back({ runId, std::nullopt });
  }
  cv_.notify_one();
}

void RunJournal::stop() {
  {
    std::lock_guard lock(mtx_);
    if (!running_)
      return;
    running_ = false;
  }
  cv_.notify_all();
  if (worker_.joinable())
    worker_.join();
}

bool RunJournal::running() const {
  std::lock_guard lock(mtx_);
  return running_;
}

std::string RunJournal::pathFor(const std::string& runId) const {
  return (std::filesystem::path(dir_) / (safeFileName(runId) + ".csv")).string();
}

std::string RunJournal::formatRow(const Reading& r) {
  return fmt::format("{},{},{},{},{},{},{}\n", toIso8601(r.ts), field(r.watts), field(r.volts),
                     field(r.amps), field(r.tempC), field(r.pressure), quoted(r.raw.dump()));
}

void RunJournal::workerLoop() {
  std::deque<Entry> batch;
  for (;;) {
    bool stopping = false;
    {
      std::unique_lock lock(mtx_);
      cv_.wait(lock, [this] { return !queue_.empty() || !running_; });
      batch.swap(queue_);
      stopping = !running_;
    }

    for (const auto& entry : batch)
      writeEntry(entry);
    batch.clear();

    for (auto& [runId, file] : files_)
      if (!file.flush())
        spdlog::warn("[RunJournal] flush failed for {}", file.path());

    if (stopping)
      break;
  }

  // anything queued between the last swap and stop() was drained above
  files_.clear();
}

void RunJournal::writeEntry(const Entry& entry) {
  if (!entry.reading) {
    files_.erase(entry.runId); // FileLogger dtor flushes + closes
    return;
  }

  auto it = files_.find(entry.runId);
  if (it == files_.end()) {
    const std::string path = pathFor(entry.runId);
    const bool fresh = !std::filesystem::exists(path);
    io::FileLogger file;
    if (!file.open(path)) {
      spdlog::warn("[RunJournal] cannot open {}", path);
      return;
    }
    if (fresh && !file.write(kHeader))
      spdlog::warn("[RunJournal] header write failed for {}", path);
    it = files_.emplace(entry.runId, std::move(file)).first;
  }

  if (!it->second.write(formatRow(*entry.reading)))
    spdlog::warn("[RunJournal] write failed for {}", it->second.path());
}
