// benchguard headers
#include "core/BenchConfig.hpp"
#include "core/ConfigLoader.hpp"
#include "core/Errors.hpp"
#include "core/ReadingStore.hpp"
#include "core/TestRunManager.hpp"

// GTest headers
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace benchguard::test {

  using namespace benchguard::core;
  using nlohmann::json;
  using namespace std::chrono_literals;

  namespace {
    RunRequest request(const std::string& outletId, const std::string& qlid = "QL-1001") {
      RunRequest r;
      r.qlid = qlid;
      r.stationId = "st-1";
      r.outletId = outletId;
      r.profileId = "vacuum";
      r.operatorUserId = "op-7";
      return r;
    }

    Thresholds vacuumThresholds() {
      Thresholds t;
      t.maxPeakWatts = 1500;
      t.minStableWatts = 800;
      t.maxStableWatts = 1200;
      t.spikeShutdownWatts = 2000;
      t.minRunSeconds = 10;
      return t;
    }

    /// One reading per second starting at t0, oldest first.
    std::vector<Reading> series(std::initializer_list<std::optional<double>> watts) {
      std::vector<Reading> out;
      const Timestamp t0 = WallClock::now();
      int i = 0;
      for (const auto& w : watts) {
        Reading r;
        r.runId = "run-x";
        r.ts = t0 + std::chrono::seconds{ i++ };
        r.watts = w;
        out.push_back(r);
      }
      return out;
    }
  } // namespace

  // ---- state machine ------------------------------------------------------

  class TestRunManagerTest : public ::testing::Test {
  protected:
    std::shared_ptr<InMemoryReadingStore> store = std::make_shared<InMemoryReadingStore>();
    TestRunManager runs{ store };
  };

  TEST_F(TestRunManagerTest, createRun_StartsPendingWithSequentialIds) {
    auto a = runs.createRun(request("out-0"));
    auto b = runs.createRun(request("out-1"));
    EXPECT_EQ(a.id, "run-000001");
    EXPECT_EQ(b.id, "run-000002");
    EXPECT_EQ(a.status, RunStatus::Pending);
    EXPECT_FALSE(a.startedAt);
  }

  TEST_F(TestRunManagerTest, updateStatus_StampsStartAndEnd) {
    auto run = runs.createRun(request("out-0"));
    EXPECT_TRUE(runs.updateStatus(run.id, RunStatus::InProgress));
    EXPECT_TRUE(runs.getRun(run.id).startedAt);
    EXPECT_TRUE(runs.updateStatus(run.id, RunStatus::Aborted));

    auto done = runs.getRun(run.id);
    EXPECT_EQ(done.status, RunStatus::Aborted);
    ASSERT_TRUE(done.endedAt);
    EXPECT_GE(*done.endedAt, *done.startedAt);
  }

  TEST_F(TestRunManagerTest, updateStatus_OnTerminalRunIsANoOp) {
    auto run = runs.createRun(request("out-0"));
    runs.updateStatus(run.id, RunStatus::InProgress);
    runs.updateStatus(run.id, RunStatus::Completed);
    const auto endedAt = runs.getRun(run.id).endedAt;

    EXPECT_FALSE(runs.updateStatus(run.id, RunStatus::Aborted));
    EXPECT_FALSE(runs.updateStatus(run.id, RunStatus::InProgress));
    EXPECT_EQ(runs.getRun(run.id).status, RunStatus::Completed);
    EXPECT_EQ(runs.getRun(run.id).endedAt, endedAt);
  }

  TEST_F(TestRunManagerTest, createRun_RejectsOutletHeldByLiveRun) {
    auto first = runs.createRun(request("out-0"));
    EXPECT_THROW(runs.createRun(request("out-0", "QL-2002")), ConfigError);

    runs.updateStatus(first.id, RunStatus::Aborted);
    EXPECT_NO_THROW(runs.createRun(request("out-0", "QL-2002")));
  }

  TEST_F(TestRunManagerTest, unknownRunId_IsOutOfRange) {
    EXPECT_THROW(runs.getRun("run-999999"), std::out_of_range);
    EXPECT_THROW(runs.updateStatus("run-999999", RunStatus::Aborted), std::out_of_range);
    EXPECT_THROW(runs.addAnomaly("run-999999", Anomaly{}), std::out_of_range);
  }

  TEST_F(TestRunManagerTest, listRuns_FiltersNewestFirst) {
    auto a = runs.createRun(request("out-0"));
    auto b = runs.createRun(request("out-1"));
    auto c = runs.createRun(request("out-2"));
    runs.updateStatus(b.id, RunStatus::InProgress);

    auto all = runs.listRuns();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all.front().id, c.id);

    RunFilter pending;
    pending.status = RunStatus::Pending;
    auto p = runs.listRuns(pending);
    ASSERT_EQ(p.size(), 2u);
    EXPECT_EQ(p[1].id, a.id);

    RunFilter limited;
    limited.limit = 1;
    EXPECT_EQ(runs.listRuns(limited).size(), 1u);
  }

  TEST_F(TestRunManagerTest, checklistNotesAndAnomalies_AreRecorded) {
    auto run = runs.createRun(request("out-0"));
    runs.submitChecklist(run.id, { { "suction_ok", true }, { "noise_db", 72 } });
    runs.setNotes(run.id, "brush roll squeaks");
    runs.addAnomaly(run.id, Anomaly{ AnomalyType::Overcurrent, "Current 16A exceeds outlet max 15A",
                                     WallClock::now(), 16.0, 15.0 });

    auto got = runs.getRun(run.id);
    EXPECT_EQ(got.checklistValues["noise_db"], 72);
    EXPECT_EQ(got.notes, "brush roll squeaks");
    ASSERT_EQ(got.anomalies.size(), 1u);
    EXPECT_EQ(got.anomalies[0].type, AnomalyType::Overcurrent);

    EXPECT_THROW(runs.submitChecklist(run.id, json::array()), std::invalid_argument);

    const json j = got;
    EXPECT_EQ(j["status"], "PENDING");
    EXPECT_EQ(j["anomalies"][0]["type"], "OVERCURRENT");
  }

  TEST_F(TestRunManagerTest, completeRun_GradesFromStoredReadings) {
    auto run = runs.createRun(request("out-0"));
    runs.updateStatus(run.id, RunStatus::InProgress);

    InstantReadings sample;
    sample.watts = 1000;
    store->insert(run.id, sample);

    // single reading: zero duration is shorter than minRunSeconds
    EXPECT_TRUE(runs.completeRun(run.id, vacuumThresholds()));
    auto done = runs.getRun(run.id);
    EXPECT_EQ(done.status, RunStatus::Completed);
    EXPECT_EQ(done.result, RunResult::Incomplete);
    EXPECT_EQ(done.score, 20);

    EXPECT_FALSE(runs.completeRun(run.id, vacuumThresholds()));
  }

  // ---- computeResult ------------------------------------------------------

  TEST(compute_result, noReadings_IsIncompleteZero) {
    auto r = computeResult({}, 0, vacuumThresholds());
    EXPECT_EQ(r.result, RunResult::Incomplete);
    EXPECT_EQ(r.score, 0);
  }

  TEST(compute_result, shortRun_IsIncompleteTwenty) {
    auto r = computeResult(series({ 1000, 1000, 1000 }), 0, vacuumThresholds());
    EXPECT_EQ(r.result, RunResult::Incomplete);
    EXPECT_EQ(r.score, 20);
  }

  TEST(compute_result, noWattSamples_DependsOnAnomalies) {
    std::initializer_list<std::optional<double>> blanks = { std::nullopt, std::nullopt,
                                                            std::nullopt, std::nullopt,
                                                            std::nullopt, std::nullopt,
                                                            std::nullopt, std::nullopt,
                                                            std::nullopt, std::nullopt,
                                                            std::nullopt };
    auto clean = computeResult(series(blanks), 0, vacuumThresholds());
    EXPECT_EQ(clean.result, RunResult::Pass);
    EXPECT_EQ(clean.score, 70);

    auto flagged = computeResult(series(blanks), 1, vacuumThresholds());
    EXPECT_EQ(flagged.result, RunResult::Anomaly);
    EXPECT_EQ(flagged.score, 50);
  }

  TEST(compute_result, peakAboveMax_Fails) {
    auto r = computeResult(series({ 1000, 1000, 1000, 1000, 1000, 1600, 1000, 1000, 1000, 1000, 1000 }),
                           0, vacuumThresholds());
    EXPECT_EQ(r.result, RunResult::Fail);
    EXPECT_EQ(r.score, 10);
  }

  TEST(compute_result, stableRun_ScoresFromOutOfRangeFractionAndAnomalies) {
    // 11 samples, 2 outside [800,1200]: round(40 * 2/11) = round(7.27) = 7
    auto readings =
        series({ 1000, 1000, 700, 1000, 1000, 1250, 1000, 1000, 1000, 1000, 1000 });

    auto pass = computeResult(readings, 0, vacuumThresholds());
    EXPECT_EQ(pass.result, RunResult::Pass);
    EXPECT_EQ(pass.score, 93);

    auto anomaly = computeResult(readings, 2, vacuumThresholds());
    EXPECT_EQ(anomaly.result, RunResult::Anomaly);
    EXPECT_EQ(anomaly.score, 73);

    auto fail = computeResult(readings, 5, vacuumThresholds());
    EXPECT_EQ(fail.result, RunResult::Fail);
    EXPECT_EQ(fail.score, 43);
  }

  // ---- configuration ------------------------------------------------------

  TEST(bench_config, parse_AppliesDefaultsAndNestsOutlets) {
    const json j = {
      { "monitor", { { "healthCheckMs", 5000 } } },
      { "adapters", { { "snmpWriteCommunity", "bench-rw" } } },
      { "stations",
        { { { "id", "st-1" },
            { "controllerType", "SHELLY_GEN2_HTTP" },
            { "controllerBaseUrl", "http://10.0.0.5" },
            { "safetyFlags", { { "gfciPresent", true }, { "acknowledgedBy", "op-7" } } },
            { "outlets",
              { { { "id", "out-0" }, { "controllerChannel", "0" }, { "maxAmps", 15 } },
                { { "id", "out-1" }, { "controllerChannel", "1" }, { "maxAmps", 0 } } } } } } },
      { "profiles",
        { { { "id", "vacuum" },
            { "thresholds",
              { { "maxPeakWatts", 1500 },
                { "minStableWatts", 800 },
                { "maxStableWatts", 1200 },
                { "spikeShutdownWatts", 2000 },
                { "minRunSeconds", 10 } } } } } }
    };

    auto cfg = parseBenchConfig(j);
    EXPECT_EQ(cfg.collectorInterval, 1000ms);
    EXPECT_EQ(cfg.monitor.readingCheckInterval, 250ms);
    EXPECT_EQ(cfg.monitor.healthCheckInterval, 5000ms);
    EXPECT_EQ(cfg.adapters.snmpWriteCommunity, "bench-rw");
    EXPECT_EQ(cfg.adapters.snmpReadCommunity, "public");

    const auto& out0 = cfg.outlet("st-1", "out-0");
    EXPECT_EQ(out0.stationId, "st-1");
    EXPECT_EQ(out0.maxAmps, 15.0);
    EXPECT_FALSE(cfg.outlet("st-1", "out-1").maxAmps);
    EXPECT_TRUE(cfg.station("st-1").safetyFlags.gfciPresent);
    EXPECT_DOUBLE_EQ(cfg.profile("vacuum").thresholds.spikeShutdownWatts, 2000);

    EXPECT_THROW(cfg.profile("ice-maker"), ConfigError);
    EXPECT_THROW(cfg.outlet("st-1", "out-9"), ConfigError);
  }

  TEST(bench_config, parse_RejectsSchemaViolations) {
    EXPECT_THROW(parseBenchConfig(json{ { "collector", { { "intervalMs", 0 } } } }), ConfigError);
    EXPECT_THROW(parseBenchConfig(json{ { "logLevel", "chatty" } }), ConfigError);
    EXPECT_THROW(parseBenchConfig(json{
                     { "stations", { { { "id", "st-1" }, { "controllerType", "ZIGBEE" } } } } }),
                 ConfigError);
    EXPECT_THROW(parseBenchConfig(json{ { "profiles", { { { "id", "p" } } } } }), ConfigError);
  }

  TEST(config_loader, load_ReadsFileAndReportsParseErrors) {
    const auto path = std::filesystem::temp_directory_path() /
                      ("benchguard_config_" + std::to_string(::getpid()) + ".json");
    {
      std::ofstream out(path);
      out << "{\n  // bench 3\n  \"logLevel\": \"debug\"\n}\n";
    }
    EXPECT_EQ(ConfigLoader(path.string()).load()["logLevel"], "debug");

    {
      std::ofstream out(path);
      out << "{ \"logLevel\": ";
    }
    EXPECT_THROW(ConfigLoader(path.string()).load(), std::runtime_error);
    std::filesystem::remove(path);

    EXPECT_THROW(ConfigLoader("/nonexistent/bench.json").load(), std::runtime_error);
  }

} // namespace benchguard::test
