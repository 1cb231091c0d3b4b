#ifndef BENCHTREND_MEASUREMENTTYPES_HPP
#define BENCHTREND_MEASUREMENTTYPES_HPP
/**
 * @file MeasurementTypes.hpp
 * @brief Flat measurement rows and the nested exe/suite/benchmark structure
 * they are collated into.
 */

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace benchtrend {
namespace trend {

/* ----------------------------- MeasurementRow ----------------------------- */

/** @brief One value of one iteration, as read from the database. */
struct MeasurementRow {
  std::string exe;
  std::string suite;
  std::string bench;
  std::string criterion;
  std::string unit;
  std::string cmdline;
  std::optional<std::string> varValue{};
  std::optional<std::string> cores{};
  std::optional<std::string> inputSize{};
  std::optional<std::string> extraArgs{};
  std::optional<int> warmup{};
  int envId{};
  std::string commitId;
  int runId{};
  int trialId{};
  int expId{};
  int invocation{}; ///< 1-based
  int iteration{};  ///< 1-based
  double value{};
};

/* ------------------------- Shared, immutable parts ------------------------- */

/** @brief Settings of one command line. Shared by all series that use it. */
struct RunSettings {
  std::string cmdline;
  std::optional<std::string> varValue{};
  std::optional<std::string> cores{};
  std::optional<std::string> inputSize{};
  std::optional<std::string> extraArgs{};
  std::optional<int> warmup{};
  std::string simplifiedCmdline;
};

/** @brief A measured quantity and its unit. */
struct CriterionData {
  std::string name;
  std::string unit;
};

/* ------------------------------ Comparisons ------------------------------ */

/** @brief Statistics of the change side of a comparison. */
struct ComparisonStatistics {
  double median{};       ///< median of the change series
  std::size_t samples{}; ///< number of values in the change series
  double changeM{};      ///< percent change of the median relative to the baseline
};

/** @brief Baseline/change pair for one run configuration of a benchmark. */
struct SeriesComparison {
  std::size_t baselineIndex{}; ///< index into ProcessedResult::measurements
  std::size_t changeIndex{};   ///< index into ProcessedResult::measurements
  std::string criterion;
  double baselineMedian{};
  std::size_t baselineSamples{};
  ComparisonStatistics stats{};
  double ratio{1.0}; ///< changeMedian / baselineMedian
  bool significant{true};
};

/* ------------------------------ Measurements ------------------------------ */

/** @brief One series: fixed identity plus its invocation x iteration grid. */
struct Measurements {
  std::shared_ptr<const CriterionData> criterion;
  std::shared_ptr<const RunSettings> runSettings;
  int envId{};
  std::string commitId;
  int runId{};
  int trialId{};
  int expId{};

  /** values[invocation-1][iteration-1]; unreported slots are nullopt. */
  std::vector<std::vector<std::optional<double>>> values;

  /** @brief All present values, invocation-major. */
  std::vector<double> flatValues() const {
    std::vector<double> out;
    for (const auto& inv : values) {
      for (const auto& v : inv) {
        if (v) {
          out.push_back(*v);
        }
      }
    }
    return out;
  }
};

/* ------------------------------ CriteriaRecord ------------------------------ */

/**
 * @brief name -> CriterionData in discovery order.
 *
 * Assigning an existing name replaces the value in place and keeps its
 * position.
 */
class CriteriaRecord {
public:
  void set(const std::string& name, std::shared_ptr<const CriterionData> criterion) {
    for (auto& entry : entries_) {
      if (entry.first == name) {
        entry.second = std::move(criterion);
        return;
      }
    }
    entries_.emplace_back(name, std::move(criterion));
  }

  std::shared_ptr<const CriterionData> find(const std::string& name) const {
    for (const auto& entry : entries_) {
      if (entry.first == name) {
        return entry.second;
      }
    }
    return nullptr;
  }

  std::vector<std::string> names() const {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& entry : entries_) {
      out.push_back(entry.first);
    }
    return out;
  }

  std::size_t size() const noexcept { return entries_.size(); }
  bool empty() const noexcept { return entries_.empty(); }

private:
  std::vector<std::pair<std::string, std::shared_ptr<const CriterionData>>> entries_;
};

/* ----------------------------- Nested results ----------------------------- */

/** @brief All series of one (exe, suite, bench). */
struct ProcessedResult {
  std::string exe;
  std::string suite;
  std::string bench;
  std::vector<Measurements> measurements;
  CriteriaRecord criteria;
  std::vector<SeriesComparison> comparisons; ///< filled by calculateAllChangeStatistics()
};

/** @brief Benchmarks of one suite of one exe. */
struct SuiteResults {
  std::string suite;
  std::vector<ProcessedResult> benchmarks;
  CriteriaRecord criteria; ///< union over the suite's benchmarks
};

/** @brief Suites of one execution unit. */
struct ExeResults {
  std::string exe;
  std::vector<SuiteResults> suites;
};

/** @brief exe -> suite -> benchmark, each level in natural name order. */
using ResultsByExeSuiteBenchmark = std::vector<ExeResults>;

} // namespace trend
} // namespace benchtrend

#endif // BENCHTREND_MEASUREMENTTYPES_HPP
