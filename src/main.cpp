/* @file main.cpp
 * @brief benchguardd - run one bench test from a JSON config
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

// third-party headers
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

// benchguard headers
#include "core/BenchConfig.hpp"
#include "core/ConfigLoader.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Errors.hpp"
#include "core/TestBench.hpp"
#include "core/TestRunManager.hpp"

namespace {
  std::atomic<bool> gInterrupted{ false };

  void onSignal(int) { gInterrupted = true; }

  int usage(const char* argv0) {
    std::cerr << "usage: " << argv0
              << " <config.json> <stationId> <outletId> <profileId> <qlid> [seconds]\n";
    return 2;
  }
} // namespace

int main(int argc, char** argv) {
  using namespace benchguard::core;

  if (argc < 6 || argc > 7)
    return usage(argv[0]);

  std::chrono::seconds duration{ 0 };
  if (argc == 7) {
    try {
      duration = std::chrono::seconds{ std::stol(argv[6]) };
    } catch (const std::exception&) {
      return usage(argv[0]);
    }
    if (duration.count() <= 0)
      return usage(argv[0]);
  }

  BenchConfig config;
  try {
    config = parseBenchConfig(ConfigLoader(argv[1]).load());
  } catch (const std::exception& e) {
    spdlog::critical("[benchguardd] {}", e.what());
    return 1;
  }
  spdlog::set_level(spdlog::level::from_str(config.logLevel));

  RunRequest request;
  request.stationId = argv[2];
  request.outletId = argv[3];
  request.profileId = argv[4];
  request.qlid = argv[5];
  if (const char* user = std::getenv("USER"))
    request.operatorUserId = user;

  std::signal(SIGINT, onSignal);
  std::signal(SIGTERM, onSignal);

  std::unique_ptr<TestBench> owner;
  try {
    owner = std::make_unique<TestBench>(config);
  } catch (const std::exception& e) {
    spdlog::critical("[benchguardd] bench setup failed: {}", e.what());
    return 1;
  }
  TestBench& bench = *owner;
  bench.errorMonitor().registerEscalation(
      [](const std::string& msg) { spdlog::critical("[benchguardd] escalated: {}", msg); });

  std::string runId;
  try {
    const double minRun = config.profile(request.profileId).thresholds.minRunSeconds;
    if (duration.count() == 0)
      duration = std::chrono::seconds{ static_cast<long>(minRun) + 1 };
    runId = bench.startRun(request).id;
  } catch (const SafetyInterlockError& e) {
    for (const auto& v : e.violations())
      spdlog::error("[benchguardd] interlock: {}", v);
    return 3;
  } catch (const std::exception& e) {
    spdlog::error("[benchguardd] cannot start run: {}", e.what());
    return 1;
  }

  const auto deadline = std::chrono::steady_clock::now() + duration;
  while (!gInterrupted && std::chrono::steady_clock::now() < deadline &&
         !isTerminal(bench.runs().getRun(runId).status))
    std::this_thread::sleep_for(std::chrono::milliseconds{ 100 });

  TestRun run;
  if (gInterrupted) {
    spdlog::warn("[benchguardd] interrupted, aborting {}", runId);
    bench.stopRun(runId);
    run = bench.runs().getRun(runId);
  } else {
    run = bench.finishRun(runId);
  }
  bench.shutdown();

  std::cout << nlohmann::json(run).dump(2) << std::endl;
  return run.status == RunStatus::Completed ? 0 : 4;
}
