/**
 * @file 01_CompareAndTimeline_Demo.cpp
 * @brief Demo 01: collate rows, compare two revisions, and run a timeline wave
 *
 * Walks through the whole flow on synthetic data:
 *  1. Collate measurement rows for two commits
 *  2. Compute change statistics and the overview summary
 *  3. Feed the values to the timeline updater and wait for the wave
 *
 * Usage:
 *   @code{.sh}
 *   ./TrendDemo_01_CompareAndTimeline --csv overview.csv --significance 2
 *   ./TrendDemo_01_CompareAndTimeline --profile gperf --artifact-root /tmp/trend
 *   @endcode
 */

#include <gtest/gtest.h>

#include <chrono>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <random>
#include <string>
#include <vector>

#include "src/trend/inc/Trend.hpp"

namespace bt = benchtrend::trend;

/* ----------------------------- Constants ----------------------------- */

static constexpr int INVOCATIONS = 3;
static constexpr int ITERATIONS = 20;

namespace {

bt::TrendConfig gCfg;

/** @brief Synthetic rows: one series per (bench, commit), slower by @p factor on "change". */
std::vector<bt::MeasurementRow> makeRows(const std::vector<std::string>& benches, double factor) {
  std::mt19937 rng(2024);
  std::normal_distribution<double> noise(0.0, 0.5);
  std::vector<bt::MeasurementRow> rows;

  int trialId = 0;
  for (const auto& commit : {"base", "change"}) {
    ++trialId;
    for (std::size_t b = 0; b < benches.size(); ++b) {
      const double MEAN = 50.0 + 10.0 * static_cast<double>(b);
      const double SCALE = std::string(commit) == "change" ? factor : 1.0;
      for (int inv = 1; inv <= INVOCATIONS; ++inv) {
        for (int it = 1; it <= ITERATIONS; ++it) {
          bt::MeasurementRow row;
          row.exe = "som";
          row.suite = "macro";
          row.bench = benches[b];
          row.criterion = "total";
          row.unit = "ms";
          row.cmdline = "/opt/som/som -cp Smalltalk " + benches[b];
          row.envId = 1;
          row.commitId = commit;
          row.runId = static_cast<int>(b) + 1;
          row.trialId = trialId;
          row.expId = 1;
          row.invocation = inv;
          row.iteration = it;
          row.value = MEAN * SCALE + noise(rng);
          rows.push_back(row);
        }
      }
    }
  }
  return rows;
}

} // namespace

/* ----------------------------- Tests ----------------------------- */

/** @test Compare two commits and print the overview summary. */
TEST(CompareAndTimeline, CompareRevisions) {
  const std::vector<std::string> BENCHES{"Richards", "DeltaBlue", "Json", "Bounce10", "Bounce2"};
  auto results = bt::collateMeasurements(makeRows(BENCHES, 1.1));

  const std::size_t N = bt::calculateAllChangeStatistics(
      results, std::string("base"), std::string("change"), gCfg.significanceThreshold,
      gCfg.significancePolicy);
  EXPECT_GT(N, 0U);

  const auto POINTS = bt::calculateDataForOverviewPlot(results, "total");
  const auto SUMMARY = bt::calculateStatsSummary(results, {"total"});
  std::printf("\n%zu run configuration(s), geomean ratio %.3f (min %.3f, max %.3f)\n\n",
              SUMMARY.numRunConfigs, SUMMARY.byCriterion[0].second.geomean,
              SUMMARY.byCriterion[0].second.min, SUMMARY.byCriterion[0].second.max);
  EXPECT_NEAR(SUMMARY.byCriterion[0].second.geomean, 1.1, 0.02);

  if (gCfg.csv) {
    std::ofstream csv(*gCfg.csv);
    bt::writeOverviewCsvHeader(csv);
    for (const auto& p : POINTS) {
      bt::writeOverviewCsvRow(csv, p);
    }
  }
}

/** @test One timeline wave over every series. */
TEST(CompareAndTimeline, TimelineWave) {
  const std::vector<std::string> BENCHES{"Richards", "DeltaBlue"};
  const auto RESULTS = bt::collateMeasurements(makeRows(BENCHES, 1.0));

  bt::MemoryTimelineStore store;
  bt::BatchingTimelineUpdater updater(store, gCfg);

  const int CRITERION_ID = 1;
  for (const auto& exe : RESULTS) {
    for (const auto& suite : exe.suites) {
      for (const auto& bench : suite.benchmarks) {
        for (const auto& m : bench.measurements) {
          for (const auto& inv : m.values) {
            updater.addValues(m.runId, m.trialId, CRITERION_ID, inv);
          }
        }
      }
    }
  }

  auto wave = updater.submitUpdateJobs();
  ASSERT_EQ(wave.wait_for(std::chrono::seconds(30)), std::future_status::ready);
  EXPECT_EQ(wave.get(), 4U);

  std::cout << "\n";
  bt::writeTimelineCsvHeader(std::cout);
  for (const auto& r : store.records()) {
    bt::writeTimelineCsvRow(std::cout, r);
  }
  std::cout << std::endl;
}

int main(int argc, char** argv) {
  bt::parseTrendFlags(gCfg, &argc, argv);
  bt::setMinLogLevel(bt::parseLogLevel(gCfg.minLevel));
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
