/**
 * @file Profiler_uTest.cpp
 * @brief Unit tests for the profiler facade factory.
 */

#include "src/trend/inc/Profiler.hpp"
#include "src/trend/inc/ProfilerGperf.hpp"

#include <gtest/gtest.h>

#include <thread>

using benchtrend::trend::GperfProfiler;
using benchtrend::trend::Profiler;
using benchtrend::trend::RequestSpan;
using benchtrend::trend::TrendConfig;

/** @test No tool requested gives an anonymous no-op. */
TEST(ProfilerTest, DefaultIsNoOp) {
  const TrendConfig CFG;

  const auto PROF = Profiler::make(CFG, "generate-timeline");

  ASSERT_NE(PROF, nullptr);
  EXPECT_TRUE(PROF->toolName().empty());
  EXPECT_TRUE(PROF->artifactDir().empty());
  PROF->beforeMeasure();
  PROF->afterMeasure(RequestSpan{"generate-timeline", 0.0, 1.0});
}

/** @test gperf is reported by name whether or not it was built in. */
TEST(ProfilerTest, GperfKeepsName) {
  TrendConfig cfg;
  cfg.profileTool = "gperf";
  cfg.artifactRoot = ::testing::TempDir();

  const auto PROF = Profiler::make(cfg, "generate-timeline");

  ASSERT_NE(PROF, nullptr);
  EXPECT_EQ(PROF->toolName(), "gperf");
}

/** @test Waves started on one thread and finished on another may overlap. */
TEST(ProfilerTest, GperfBracketsFromTwoThreads) {
  constexpr int WAVES = 50;
  TrendConfig cfg;
  cfg.profileTool = "gperf";
  cfg.artifactRoot = ::testing::TempDir();
  GperfProfiler prof(cfg, "generate-timeline");

  std::thread submitter([&] {
    for (int i = 0; i < WAVES; ++i) {
      prof.beforeMeasure();
    }
  });
  std::thread delivery([&] {
    for (int i = 0; i < WAVES; ++i) {
      prof.afterMeasure(RequestSpan{"generate-timeline", 0.0, 1.0});
    }
  });
  submitter.join();
  delivery.join();
  prof.afterMeasure(RequestSpan{"generate-timeline", 0.0, 1.0});

  EXPECT_EQ(prof.toolName(), "gperf");
  EXPECT_FALSE(prof.artifactDir().empty());
}

/** @test Unknown tools become a named no-op. */
TEST(ProfilerTest, UnknownToolIsNamedNoOp) {
  TrendConfig cfg;
  cfg.profileTool = "vtune";

  const auto PROF = Profiler::make(cfg, "generate-timeline");

  ASSERT_NE(PROF, nullptr);
  EXPECT_EQ(PROF->toolName(), "vtune");
  EXPECT_TRUE(PROF->artifactDir().empty());
}
