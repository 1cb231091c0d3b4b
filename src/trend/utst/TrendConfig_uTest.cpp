/**
 * @file TrendConfig_uTest.cpp
 * @brief Unit tests for benchtrend::trend::TrendConfig and parseTrendFlags().
 *
 * Tests default values, flag parsing, policy values, and gtest pass-through.
 */

#include "src/trend/inc/TrendConfig.hpp"

#include <gtest/gtest.h>

#include <initializer_list>
#include <string>
#include <vector>

using benchtrend::trend::parseTrendFlags;
using benchtrend::trend::PersistFailurePolicy;
using benchtrend::trend::SignificancePolicy;
using benchtrend::trend::TrendConfig;

namespace {

/** @brief Helper to create argc/argv from strings. */
class ArgvBuilder {
public:
  explicit ArgvBuilder(std::initializer_list<const char*> args) {
    for (const char* arg : args) {
      storage_.emplace_back(arg);
    }
    for (auto& s : storage_) {
      argv_.push_back(const_cast<char*>(s.c_str()));
    }
    argc_ = static_cast<int>(argv_.size());
  }

  int* argc() { return &argc_; }
  char** argv() { return argv_.data(); }

private:
  std::vector<std::string> storage_;
  std::vector<char*> argv_;
  int argc_ = 0;
};

} // namespace

/* ----------------------------- Default Values Tests ----------------------------- */

/** @test Default config has expected values. */
TEST(TrendConfigTest, DefaultValues) {
  const TrendConfig CFG;

  EXPECT_EQ(CFG.numBootstrapSamples, 1000);
  EXPECT_FALSE(CFG.significanceThreshold.has_value());
  EXPECT_EQ(CFG.significancePolicy, SignificancePolicy::Flag);
  EXPECT_EQ(CFG.persistFailure, PersistFailurePolicy::AbortBatch);
  EXPECT_TRUE(CFG.timelineEnabled);
  EXPECT_EQ(CFG.minLevel, "INFO");
  EXPECT_FALSE(CFG.csv.has_value());
  EXPECT_TRUE(CFG.profileTool.empty());
  EXPECT_TRUE(CFG.profileArgs.empty());
  EXPECT_TRUE(CFG.artifactRoot.empty());
  EXPECT_EQ(CFG.profileFrequency, 10000);
  EXPECT_FALSE(CFG.profileAnalyze);
}

/* ----------------------------- Flag Parsing Tests ----------------------------- */

/** @test Parse --bootstrap-samples flag. */
TEST(TrendConfigTest, ParseBootstrapSamples) {
  TrendConfig cfg;
  ArgvBuilder args{"prog", "--bootstrap-samples", "250"};

  parseTrendFlags(cfg, args.argc(), args.argv());

  EXPECT_EQ(cfg.numBootstrapSamples, 250);
  EXPECT_EQ(*args.argc(), 1);
}

/** @test Bootstrap sample count is clamped to at least 1. */
TEST(TrendConfigTest, BootstrapSamplesClampedToOne) {
  TrendConfig cfg;
  ArgvBuilder args{"prog", "--bootstrap-samples", "0"};

  parseTrendFlags(cfg, args.argc(), args.argv());

  EXPECT_EQ(cfg.numBootstrapSamples, 1);
}

/** @test Parse --significance flag. */
TEST(TrendConfigTest, ParseSignificance) {
  TrendConfig cfg;
  ArgvBuilder args{"prog", "--significance", "2.5"};

  parseTrendFlags(cfg, args.argc(), args.argv());

  ASSERT_TRUE(cfg.significanceThreshold.has_value());
  EXPECT_DOUBLE_EQ(*cfg.significanceThreshold, 2.5);
}

/** @test Parse both policy flags. */
TEST(TrendConfigTest, ParsePolicies) {
  TrendConfig cfg;
  ArgvBuilder args{"prog", "--significance-policy", "suppress", "--persist-failure", "continue"};

  parseTrendFlags(cfg, args.argc(), args.argv());

  EXPECT_EQ(cfg.significancePolicy, SignificancePolicy::Suppress);
  EXPECT_EQ(cfg.persistFailure, PersistFailurePolicy::ContinueBatch);
}

/** @test Unknown policy names keep the current value. */
TEST(TrendConfigTest, UnknownPolicyKeepsCurrent) {
  TrendConfig cfg;
  cfg.persistFailure = PersistFailurePolicy::ContinueBatch;
  ArgvBuilder args{"prog", "--persist-failure", "retry", "--significance-policy", "hide"};

  parseTrendFlags(cfg, args.argc(), args.argv());

  EXPECT_EQ(cfg.persistFailure, PersistFailurePolicy::ContinueBatch);
  EXPECT_EQ(cfg.significancePolicy, SignificancePolicy::Flag);
  EXPECT_EQ(*args.argc(), 1);
}

/** @test Parse --no-timeline, --min-level and --csv. */
TEST(TrendConfigTest, ParseTimelineLevelAndCsv) {
  TrendConfig cfg;
  ArgvBuilder args{"prog", "--no-timeline", "--min-level", "DEBUG", "--csv", "out.csv"};

  parseTrendFlags(cfg, args.argc(), args.argv());

  EXPECT_FALSE(cfg.timelineEnabled);
  EXPECT_EQ(cfg.minLevel, "DEBUG");
  ASSERT_TRUE(cfg.csv.has_value());
  EXPECT_EQ(*cfg.csv, "out.csv");
}

/** @test Parse profiling flags. */
TEST(TrendConfigTest, ParseProfilingFlags) {
  TrendConfig cfg;
  ArgvBuilder args{"prog", "--profile", "gperf", "--profile-args", "heap", "--artifact-root",
                   "/tmp/a", "--profile-frequency", "500", "--profile-analyze"};

  parseTrendFlags(cfg, args.argc(), args.argv());

  EXPECT_EQ(cfg.profileTool, "gperf");
  EXPECT_EQ(cfg.profileArgs, "heap");
  EXPECT_EQ(cfg.artifactRoot, "/tmp/a");
  EXPECT_EQ(cfg.profileFrequency, 500);
  EXPECT_TRUE(cfg.profileAnalyze);
}

/* ----------------------------- Pass-Through Tests ----------------------------- */

/** @test Unknown flags are left for gtest in their original order. */
TEST(TrendConfigTest, UnknownFlagsPassThrough) {
  TrendConfig cfg;
  ArgvBuilder args{"prog", "--gtest_filter=Foo.*", "--bootstrap-samples", "10", "--other"};

  parseTrendFlags(cfg, args.argc(), args.argv());

  ASSERT_EQ(*args.argc(), 3);
  EXPECT_STREQ(args.argv()[0], "prog");
  EXPECT_STREQ(args.argv()[1], "--gtest_filter=Foo.*");
  EXPECT_STREQ(args.argv()[2], "--other");
  EXPECT_EQ(cfg.numBootstrapSamples, 10);
}

/** @test A flag missing its value exits with status 2. */
TEST(TrendConfigDeathTest, MissingValueExits) {
  TrendConfig cfg;
  ArgvBuilder args{"prog", "--bootstrap-samples"};

  EXPECT_EXIT(parseTrendFlags(cfg, args.argc(), args.argv()), ::testing::ExitedWithCode(2),
              "Missing value for --bootstrap-samples");
}
