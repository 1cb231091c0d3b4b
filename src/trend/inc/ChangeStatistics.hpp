#ifndef BENCHTREND_CHANGESTATISTICS_HPP
#define BENCHTREND_CHANGESTATISTICS_HPP
/**
 * @file ChangeStatistics.hpp
 * @brief Baseline/change comparison over collated results, overview plot data,
 * comparison summary, and navigation.
 *
 * A run configuration is the set of series of one benchmark that share
 * (envId, command line, criterion). Its series are ordered by revision
 * (commit id in natural order, then trial id, then run id), so the revision
 * indices passed to calculateAllChangeStatistics() select the same baseline and
 * change whatever order the rows were collated in. The commit overload selects
 * them by commit id instead.
 */

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "src/trend/inc/MeasurementTypes.hpp"
#include "src/trend/inc/TrendConfig.hpp"

namespace benchtrend {
namespace trend {

/* ------------------------------ Overview data ------------------------------ */

/** @brief One run configuration's change ratio for the overview plot. */
struct OverviewPoint {
  std::string exe;
  std::string suite;
  std::string bench;
  std::string cmdline; ///< simplified command line
  int envId{};
  double ratio{}; ///< changeMedian / baselineMedian
};

/** @brief min / max / geometric mean of change ratios. */
struct OverviewSummaryStatistics {
  double min{};
  double max{};
  double geomean{};
};

/** @brief Summary of a whole comparison. */
struct StatsSummary {
  std::size_t numRunConfigs{};
  std::vector<std::pair<std::string, OverviewSummaryStatistics>> byCriterion;
};

/* -------------------------------- Navigation -------------------------------- */

struct NavigationEntry {
  std::string exeName;
  std::vector<std::string> suites;
};

struct Navigation {
  std::vector<NavigationEntry> nav;
  /** Suites run by more than one exe, naturally sorted. */
  std::vector<std::string> exeComparisonSuites;
};

/* --------------------------------- API --------------------------------- */

/**
 * @brief Median, sample count, and percent median change for every run
 * configuration that has both revisions.
 *
 * changeM = (changeMedian / baselineMedian - 1) * 100. Run configurations
 * lacking either index, or with a zero baseline median and a non-zero change
 * median, get no comparison. Previous comparisons on the results are replaced.
 *
 * @param significanceThreshold Percent; nullopt disables significance checks.
 * @param policy Flag keeps below-threshold comparisons with significant=false,
 *               Suppress drops them.
 * @return number of comparisons stored.
 * @note NOT RT-safe (heap allocation).
 */
std::size_t calculateAllChangeStatistics(ResultsByExeSuiteBenchmark& results,
                                         std::size_t baselineIndex, std::size_t changeIndex,
                                         std::optional<double> significanceThreshold,
                                         SignificancePolicy policy = SignificancePolicy::Flag);

/**
 * @brief As above, with baseline and change named by commit id. A run
 * configuration without a series for either commit gets no comparison.
 */
std::size_t calculateAllChangeStatistics(ResultsByExeSuiteBenchmark& results,
                                         const std::string& baselineCommit,
                                         const std::string& changeCommit,
                                         std::optional<double> significanceThreshold,
                                         SignificancePolicy policy = SignificancePolicy::Flag);

/**
 * @brief One point per compared run configuration for @p criterionName.
 * Requires calculateAllChangeStatistics() to have run.
 */
std::vector<OverviewPoint> calculateDataForOverviewPlot(const ResultsByExeSuiteBenchmark& results,
                                                        const std::string& criterionName);

/** @brief Overview points grouped per suite, suites in first-appearance order. */
std::vector<std::pair<std::string, std::vector<OverviewPoint>>>
groupOverviewBySuite(const std::vector<OverviewPoint>& points);

/** @brief min/max/geomean of the points' ratios; zero-initialized if empty. */
OverviewSummaryStatistics summarizeOverview(const std::vector<OverviewPoint>& points);

/**
 * @brief Number of compared run configurations of the primary criterion
 * (the first entry of @p criteria) plus a ratio summary per criterion.
 */
StatsSummary calculateStatsSummary(const ResultsByExeSuiteBenchmark& results,
                                   const std::vector<std::string>& criteria);

/** @brief Suites per exe, and the suites shared by several exes. */
Navigation getNavigation(const ResultsByExeSuiteBenchmark& results);

} // namespace trend
} // namespace benchtrend

#endif // BENCHTREND_CHANGESTATISTICS_HPP
