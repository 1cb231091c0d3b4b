/**
 * @file ChangeStatistics.cpp
 * @brief Implementation of baseline/change comparisons and their summaries.
 */

#include "src/trend/inc/ChangeStatistics.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include "src/trend/inc/SummaryStats.hpp"
#include "src/trend/inc/TrendLog.hpp"
#include "src/trend/inc/TrendUtils.hpp"

namespace benchtrend {
namespace trend {

namespace {

/** @brief Series of one run configuration, in revision order. */
struct RunConfiguration {
  int envId{};
  const std::string* cmdline{};
  const std::string* criterion{};
  std::vector<std::size_t> series;
};

std::vector<RunConfiguration> groupRunConfigurations(const ProcessedResult& result) {
  std::vector<RunConfiguration> groups;
  for (std::size_t i = 0; i < result.measurements.size(); ++i) {
    const Measurements& m = result.measurements[i];
    auto it = std::find_if(groups.begin(), groups.end(), [&](const RunConfiguration& g) {
      return g.envId == m.envId && *g.cmdline == m.runSettings->cmdline &&
             *g.criterion == m.criterion->name;
    });
    if (it == groups.end()) {
      groups.push_back(RunConfiguration{m.envId, &m.runSettings->cmdline, &m.criterion->name, {}});
      it = groups.end() - 1;
    }
    it->series.push_back(i);
  }

  // Revision order: commit, then trial, then run. Row order must not decide the baseline.
  for (auto& g : groups) {
    std::stable_sort(g.series.begin(), g.series.end(), [&](std::size_t a, std::size_t b) {
      const Measurements& ma = result.measurements[a];
      const Measurements& mb = result.measurements[b];
      if (ma.commitId != mb.commitId) {
        return naturalLess(ma.commitId, mb.commitId);
      }
      if (ma.trialId != mb.trialId) {
        return ma.trialId < mb.trialId;
      }
      return ma.runId < mb.runId;
    });
  }
  return groups;
}

/** @brief First series of @p group measured at @p commit. */
std::optional<std::size_t> findCommit(const ProcessedResult& result, const RunConfiguration& group,
                                      const std::string& commit) {
  for (const std::size_t IDX : group.series) {
    if (result.measurements[IDX].commitId == commit) {
      return IDX;
    }
  }
  return std::nullopt;
}

std::optional<SeriesComparison> compare(const ProcessedResult& result, std::size_t baseIdx,
                                        std::size_t changeIdx) {
  const Measurements& base = result.measurements[baseIdx];
  const Measurements& change = result.measurements[changeIdx];

  std::vector<double> baseValues = base.flatValues();
  std::vector<double> changeValues = change.flatValues();
  if (baseValues.empty() || changeValues.empty()) {
    return std::nullopt;
  }

  const double BASE_MEDIAN = median(baseValues);
  const double CHANGE_MEDIAN = median(changeValues);

  double ratio = 1.0;
  if (BASE_MEDIAN != 0.0) {
    ratio = CHANGE_MEDIAN / BASE_MEDIAN;
  } else if (CHANGE_MEDIAN != 0.0) {
    logf(LogLevel::Debug, "compare", "%s/%s/%s: zero baseline median, no change computed",
         result.exe.c_str(), result.suite.c_str(), result.bench.c_str());
    return std::nullopt;
  }

  SeriesComparison c;
  c.baselineIndex = baseIdx;
  c.changeIndex = changeIdx;
  c.criterion = change.criterion->name;
  c.baselineMedian = BASE_MEDIAN;
  c.baselineSamples = baseValues.size();
  c.stats.median = CHANGE_MEDIAN;
  c.stats.samples = changeValues.size();
  c.stats.changeM = (ratio - 1.0) * 100.0;
  c.ratio = ratio;
  return c;
}

/**
 * @brief Compare every run configuration of every benchmark; @p pick returns
 * the (baseline, change) series indices or nullopt to skip the group.
 */
template <typename Pick>
std::size_t compareRunConfigurations(ResultsByExeSuiteBenchmark& results, Pick&& pick,
                                     std::optional<double> significanceThreshold,
                                     SignificancePolicy policy) {
  std::size_t numComparisons = 0;

  for (auto& exe : results) {
    for (auto& suite : exe.suites) {
      for (auto& result : suite.benchmarks) {
        result.comparisons.clear();

        for (const auto& group : groupRunConfigurations(result)) {
          const auto PAIR = pick(result, group);
          if (!PAIR) {
            continue;
          }

          auto c = compare(result, PAIR->first, PAIR->second);
          if (!c) {
            continue;
          }

          if (significanceThreshold) {
            c->significant = std::fabs(c->stats.changeM) >= *significanceThreshold;
            if (!c->significant && policy == SignificancePolicy::Suppress) {
              continue;
            }
          }

          result.comparisons.push_back(std::move(*c));
          ++numComparisons;
        }
      }
    }
  }

  return numComparisons;
}

} // namespace

/* --------------------------------- API --------------------------------- */

std::size_t calculateAllChangeStatistics(ResultsByExeSuiteBenchmark& results,
                                         std::size_t baselineIndex, std::size_t changeIndex,
                                         std::optional<double> significanceThreshold,
                                         SignificancePolicy policy) {
  return compareRunConfigurations(
      results,
      [&](const ProcessedResult&,
          const RunConfiguration& group) -> std::optional<std::pair<std::size_t, std::size_t>> {
        if (baselineIndex >= group.series.size() || changeIndex >= group.series.size()) {
          return std::nullopt;
        }
        return std::make_pair(group.series[baselineIndex], group.series[changeIndex]);
      },
      significanceThreshold, policy);
}

std::size_t calculateAllChangeStatistics(ResultsByExeSuiteBenchmark& results,
                                         const std::string& baselineCommit,
                                         const std::string& changeCommit,
                                         std::optional<double> significanceThreshold,
                                         SignificancePolicy policy) {
  return compareRunConfigurations(
      results,
      [&](const ProcessedResult& result,
          const RunConfiguration& group) -> std::optional<std::pair<std::size_t, std::size_t>> {
        const auto BASE = findCommit(result, group, baselineCommit);
        const auto CHANGE = findCommit(result, group, changeCommit);
        if (!BASE || !CHANGE) {
          return std::nullopt;
        }
        return std::make_pair(*BASE, *CHANGE);
      },
      significanceThreshold, policy);
}

std::vector<OverviewPoint> calculateDataForOverviewPlot(const ResultsByExeSuiteBenchmark& results,
                                                        const std::string& criterionName) {
  std::vector<OverviewPoint> points;
  for (const auto& exe : results) {
    for (const auto& suite : exe.suites) {
      for (const auto& result : suite.benchmarks) {
        for (const auto& c : result.comparisons) {
          if (c.criterion != criterionName) {
            continue;
          }
          const Measurements& change = result.measurements[c.changeIndex];
          points.push_back(OverviewPoint{result.exe, result.suite, result.bench,
                                         change.runSettings->simplifiedCmdline, change.envId,
                                         c.ratio});
        }
      }
    }
  }
  return points;
}

std::vector<std::pair<std::string, std::vector<OverviewPoint>>>
groupOverviewBySuite(const std::vector<OverviewPoint>& points) {
  std::vector<std::pair<std::string, std::vector<OverviewPoint>>> bySuite;
  for (const auto& p : points) {
    auto it = std::find_if(bySuite.begin(), bySuite.end(),
                           [&](const auto& entry) { return entry.first == p.suite; });
    if (it == bySuite.end()) {
      bySuite.emplace_back(p.suite, std::vector<OverviewPoint>{});
      it = bySuite.end() - 1;
    }
    it->second.push_back(p);
  }
  return bySuite;
}

OverviewSummaryStatistics summarizeOverview(const std::vector<OverviewPoint>& points) {
  if (points.empty()) {
    return {};
  }

  OverviewSummaryStatistics s;
  s.min = points.front().ratio;
  s.max = points.front().ratio;

  // Geometric mean over positive ratios; a zero change median has no log.
  double logSum = 0.0;
  std::size_t positive = 0;
  for (const auto& p : points) {
    s.min = std::min(s.min, p.ratio);
    s.max = std::max(s.max, p.ratio);
    if (p.ratio > 0.0) {
      logSum += std::log(p.ratio);
      ++positive;
    }
  }
  s.geomean = positive > 0 ? std::exp(logSum / static_cast<double>(positive)) : 0.0;
  return s;
}

StatsSummary calculateStatsSummary(const ResultsByExeSuiteBenchmark& results,
                                   const std::vector<std::string>& criteria) {
  StatsSummary summary;
  for (std::size_t i = 0; i < criteria.size(); ++i) {
    const auto POINTS = calculateDataForOverviewPlot(results, criteria[i]);
    if (i == 0) {
      summary.numRunConfigs = POINTS.size();
    }
    summary.byCriterion.emplace_back(criteria[i], summarizeOverview(POINTS));
  }
  return summary;
}

Navigation getNavigation(const ResultsByExeSuiteBenchmark& results) {
  Navigation out;
  std::vector<std::pair<std::string, int>> suiteUse;

  for (const auto& exe : results) {
    NavigationEntry entry;
    entry.exeName = exe.exe;
    for (const auto& suite : exe.suites) {
      entry.suites.push_back(suite.suite);

      auto it = std::find_if(suiteUse.begin(), suiteUse.end(),
                             [&](const auto& u) { return u.first == suite.suite; });
      if (it == suiteUse.end()) {
        suiteUse.emplace_back(suite.suite, 1);
      } else {
        ++it->second;
      }
    }
    out.nav.push_back(std::move(entry));
  }

  for (const auto& u : suiteUse) {
    if (u.second > 1) {
      out.exeComparisonSuites.push_back(u.first);
    }
  }
  std::sort(out.exeComparisonSuites.begin(), out.exeComparisonSuites.end(),
            [](const std::string& a, const std::string& b) { return naturalLess(a, b); });
  return out;
}

} // namespace trend
} // namespace benchtrend
