// benchguard headers
#include "core/AdapterFactory.hpp"
#include "core/Errors.hpp"
#include "core/PeriodicTask.hpp"
#include "core/ReadingStore.hpp"
#include "core/ReadingsCollector.hpp"
#include "core/RunJournal.hpp"

// benchguard fakes
#include "FakeAdapter.hpp"

// GTest headers
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include <unistd.h>

namespace benchguard::test {

  using benchguard::core::ConfigError;
  using benchguard::core::InMemoryReadingStore;
  using benchguard::core::InstantReadings;
  using benchguard::core::Outlet;
  using benchguard::core::PeriodicTask;
  using benchguard::core::ReadingsCollector;
  using benchguard::core::RunJournal;
  using benchguard::core::Station;
  using namespace std::chrono_literals;

  namespace {
    // the timer never fires inside a test; ticks are driven with pollNow()
    constexpr auto kManualOnly = std::chrono::hours{ 1 };

    template <typename Pred> bool eventually(Pred pred, std::chrono::milliseconds within = 2s) {
      const auto deadline = std::chrono::steady_clock::now() + within;
      while (std::chrono::steady_clock::now() < deadline) {
        if (pred())
          return true;
        std::this_thread::sleep_for(5ms);
      }
      return pred();
    }
  } // namespace

  class ReadingsCollectorTest : public ::testing::Test {
  protected:
    void SetUp() override {
      adapter = std::make_shared<FakeAdapter>();
      store = std::make_shared<InMemoryReadingStore>();
      collector = std::make_unique<ReadingsCollector>(factoryFor(adapter), store);

      station.id = "st-1";
      station.controllerType = core::controller::kShellyGen2Http;
      station.controllerBaseUrl = "http://10.0.0.5";
      outlet.id = "out-0";
      outlet.stationId = "st-1";
      outlet.label = "Outlet 0";
      outlet.controllerChannel = "0";
    }

    std::shared_ptr<FakeAdapter> adapter;
    std::shared_ptr<InMemoryReadingStore> store;
    std::unique_ptr<ReadingsCollector> collector;
    Station station;
    Outlet outlet;
  };

  TEST_F(ReadingsCollectorTest, stop_WithoutSessionReturnsZero) {
    EXPECT_EQ(collector->stop("run-000404"), 0u);
    EXPECT_EQ(collector->activeCount(), 0u);
    EXPECT_EQ(store->count("run-000404"), 0u);
  }

  TEST_F(ReadingsCollectorTest, start_TwiceIsRejectedAndOriginalKeepsRunning) {
    collector->start("run-000001", station, outlet, kManualOnly);
    EXPECT_THROW(collector->start("run-000001", station, outlet, 10ms), ConfigError);

    EXPECT_TRUE(collector->isCollecting("run-000001"));
    adapter->setReading(500.0);
    EXPECT_TRUE(collector->pollNow("run-000001"));
    EXPECT_EQ(collector->stop("run-000001"), 1u);
    EXPECT_FALSE(collector->isCollecting("run-000001"));
  }

  TEST_F(ReadingsCollectorTest, start_RejectsNonPositiveIntervalAndUnresolvableStation) {
    EXPECT_THROW(collector->start("run-000001", station, outlet, 0ms), ConfigError);

    Station unknown = station;
    unknown.controllerType = "ZIGBEE_PLUG";
    EXPECT_THROW(collector->start("run-000002", unknown, outlet), ConfigError);
    EXPECT_EQ(collector->activeCount(), 0u);
  }

  TEST_F(ReadingsCollectorTest, failedRead_IsSkippedAndCollectionContinues) {
    collector->start("run-000001", station, outlet, kManualOnly);
    adapter->setReading(100.0, 0.9);

    EXPECT_TRUE(collector->pollNow("run-000001"));
    adapter->reads_fail = true;
    EXPECT_FALSE(collector->pollNow("run-000001"));
    adapter->reads_fail = false;
    adapter->setReading(120.0, 1.1);
    EXPECT_TRUE(collector->pollNow("run-000001"));

    EXPECT_TRUE(collector->isCollecting("run-000001"));
    auto latest = collector->getLatestReading("run-000001");
    ASSERT_TRUE(latest);
    EXPECT_DOUBLE_EQ(*latest->watts, 120.0);
    EXPECT_EQ(collector->stop("run-000001"), 2u);
  }

  TEST_F(ReadingsCollectorTest, getReadings_MostRecentFirstWithStrictlyIncreasingTimestamps) {
    collector->start("run-000001", station, outlet, kManualOnly);
    for (double w : { 10.0, 20.0, 30.0 }) {
      adapter->setReading(w);
      ASSERT_TRUE(collector->pollNow("run-000001"));
    }

    auto rows = collector->getReadings("run-000001");
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_DOUBLE_EQ(*rows[0].watts, 30.0);
    EXPECT_DOUBLE_EQ(*rows[2].watts, 10.0);
    EXPECT_GT(rows[0].ts, rows[1].ts);
    EXPECT_GT(rows[1].ts, rows[2].ts);

    auto limited = collector->getReadings("run-000001", 2);
    ASSERT_EQ(limited.size(), 2u);
    EXPECT_DOUBLE_EQ(*limited[1].watts, 20.0);
  }

  TEST_F(ReadingsCollectorTest, inFlightRead_IsDiscardedOnceStopped) {
    collector->start("run-000001", station, outlet, kManualOnly);
    adapter->setReading(900.0);
    adapter->holdReads();

    std::thread poller([this] { EXPECT_FALSE(collector->pollNow("run-000001")); });
    ASSERT_TRUE(adapter->waitForReads(1, 2s));

    EXPECT_EQ(collector->stop("run-000001"), 0u);
    adapter->releaseReads();
    poller.join();

    EXPECT_EQ(store->count("run-000001"), 0u);
    EXPECT_FALSE(collector->getLatestReading("run-000001"));
  }

  TEST_F(ReadingsCollectorTest, overlappingPoll_IsSkippedNotQueued) {
    collector->start("run-000001", station, outlet, kManualOnly);
    adapter->setReading(50.0);
    adapter->holdReads();

    std::thread first([this] { EXPECT_TRUE(collector->pollNow("run-000001")); });
    ASSERT_TRUE(adapter->waitForReads(1, 2s));
    EXPECT_FALSE(collector->pollNow("run-000001"));
    adapter->releaseReads();
    first.join();

    EXPECT_EQ(adapter->read_calls.load(), 1);
    EXPECT_EQ(collector->stop("run-000001"), 1u);
  }

  TEST_F(ReadingsCollectorTest, recordReading_PersistsExternalSample) {
    InstantReadings manual;
    manual.watts = 42.0;
    manual.raw = { { "source", "operator" } };

    auto r = collector->recordReading("run-000009", manual);
    EXPECT_EQ(r.runId, "run-000009");
    EXPECT_EQ(collector->getLatestReading("run-000009")->raw["source"], "operator");
  }

  TEST_F(ReadingsCollectorTest, timer_PollsOnItsOwnAndStopAllDrains) {
    adapter->setReading(75.0);
    collector->start("run-000001", station, outlet, 10ms);
    collector->start("run-000002", station, outlet, 10ms);

    EXPECT_TRUE(eventually([this] { return store->count("run-000002") >= 3; }));
    EXPECT_EQ(collector->stopAll(), 2u);
    EXPECT_EQ(collector->activeCount(), 0u);

    const auto settled = store->count("run-000001");
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(store->count("run-000001"), settled);
  }

  // ---- PeriodicTask -------------------------------------------------------

  TEST(periodic_task, slowTick_CoalescesInsteadOfOverlapping) {
    std::atomic<int> running{ 0 };
    std::atomic<int> maxRunning{ 0 };
    std::atomic<int> ticks{ 0 };

    {
      PeriodicTask task("slow", 5ms, [&] {
        int now = ++running;
        int prev = maxRunning.load();
        while (now > prev && !maxRunning.compare_exchange_weak(prev, now)) {
        }
        std::this_thread::sleep_for(30ms);
        --running;
        ++ticks;
      });
      std::this_thread::sleep_for(200ms);
    }

    EXPECT_EQ(maxRunning.load(), 1);
    EXPECT_GE(ticks.load(), 2);
    EXPECT_LE(ticks.load(), 8); // ~200/30, not 200/5
  }

  TEST(periodic_task, throwingTick_KeepsSchedule) {
    std::atomic<int> ticks{ 0 };
    PeriodicTask task("thrower", 5ms, [&] {
      ++ticks;
      throw std::runtime_error("tick failed");
    });
    EXPECT_TRUE(eventually([&] { return ticks.load() >= 3; }));
    task.cancel();
    task.join();
    EXPECT_TRUE(task.finished());
  }

  TEST(periodic_task, cancelFromInsideTick_StopsWithoutDeadlock) {
    std::atomic<int> ticks{ 0 };
    std::atomic<PeriodicTask*> self{ nullptr };
    PeriodicTask task("self-cancel", 5ms, [&] {
      ++ticks;
      if (auto* t = self.load())
        t->cancel();
    });
    self = &task;

    EXPECT_TRUE(eventually([&] { return task.finished(); }));
    const int settled = ticks.load();
    EXPECT_GE(settled, 1);
    std::this_thread::sleep_for(30ms);
    EXPECT_EQ(ticks.load(), settled);
  }

  // ---- RunJournal ---------------------------------------------------------

  TEST(run_journal, store_MirrorsReadingsToPerRunCsv) {
    const auto dir = std::filesystem::temp_directory_path() /
                     ("benchguard_journal_" + std::to_string(::getpid()));
    std::filesystem::remove_all(dir);

    auto journal = std::make_shared<RunJournal>(dir.string());
    journal->start();
    InMemoryReadingStore store(journal);

    InstantReadings a;
    a.watts = 1500.5;
    a.amps = 12.5;
    a.raw = { { "note", "say \"hi\"" } };
    store.insert("run-000001", a);
    InstantReadings b;
    b.volts = 120.0;
    store.insert("run-000001", b);
    journal->finishRun("run-000001");
    journal->stop();

    std::ifstream in(journal->pathFor("run-000001"));
    ASSERT_TRUE(in.good());
    std::vector<std::string> lines;
    for (std::string line; std::getline(in, line);)
      lines.push_back(line);

    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0] + "\n", RunJournal::kHeader);
    EXPECT_NE(lines[1].find(",1500.5,,12.5,,,\"{\"\"note\"\":\"\"say \\\"\"hi\\\"\"\"\"}\""),
              std::string::npos)
        << lines[1];
    EXPECT_NE(lines[2].find(",,120,,,,\"{}\""), std::string::npos) << lines[2];

    std::filesystem::remove_all(dir);
  }

  TEST(run_journal, finishRun_ReopenedRunAppendsWithoutSecondHeader) {
    const auto dir = std::filesystem::temp_directory_path() /
                     ("benchguard_journal_reopen_" + std::to_string(::getpid()));
    std::filesystem::remove_all(dir);

    auto journal = std::make_shared<RunJournal>(dir.string());
    journal->start();
    InMemoryReadingStore store(journal);

    InstantReadings sample;
    sample.watts = 640.0;
    store.insert("run-000003", sample);
    journal->finishRun("run-000003");
    sample.watts = 655.0;
    store.insert("run-000003", sample);
    journal->stop();

    // rows queued after stop() are dropped, not written
    store.insert("run-000003", sample);

    std::ifstream in(journal->pathFor("run-000003"));
    ASSERT_TRUE(in.good());
    std::vector<std::string> lines;
    for (std::string line; std::getline(in, line);)
      lines.push_back(line);

    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0] + "\n", RunJournal::kHeader);
    EXPECT_NE(lines[1].find(",640,"), std::string::npos) << lines[1];
    EXPECT_NE(lines[2].find(",655,"), std::string::npos) << lines[2];

    std::filesystem::remove_all(dir);
  }

} // namespace benchguard::test
