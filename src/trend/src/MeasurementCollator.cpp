/**
 * @file MeasurementCollator.cpp
 * @brief Implementation of row collation.
 */

#include "src/trend/inc/MeasurementCollator.hpp"

#include <algorithm>
#include <cstddef>
#include <string>
#include <unordered_map>

#include "src/trend/inc/TrendLog.hpp"
#include "src/trend/inc/TrendUtils.hpp"

namespace benchtrend {
namespace trend {

namespace {

/** @brief Lookup tables used while building; discarded afterwards. */
struct CollationIndex {
  std::unordered_map<std::string, std::shared_ptr<const CriterionData>> criteria;
  std::unordered_map<std::string, std::shared_ptr<const RunSettings>> runSettings;
  std::unordered_map<std::string, std::size_t> exes;
  std::vector<std::unordered_map<std::string, std::size_t>> suitesPerExe;
  std::vector<std::vector<std::unordered_map<std::string, std::size_t>>> benchesPerSuite;
};

std::shared_ptr<const CriterionData> findOrCreateCriterion(CollationIndex& idx,
                                                           const MeasurementRow& row) {
  const std::string KEY = row.criterion + "|" + row.unit;
  auto it = idx.criteria.find(KEY);
  if (it != idx.criteria.end()) {
    return it->second;
  }
  auto criterion = std::make_shared<const CriterionData>(CriterionData{row.criterion, row.unit});
  idx.criteria.emplace(KEY, criterion);
  return criterion;
}

std::shared_ptr<const RunSettings> findOrCreateRunSettings(CollationIndex& idx,
                                                           const MeasurementRow& row) {
  auto it = idx.runSettings.find(row.cmdline);
  if (it != idx.runSettings.end()) {
    return it->second;
  }
  auto settings = std::make_shared<const RunSettings>(
      RunSettings{row.cmdline, row.varValue, row.cores, row.inputSize, row.extraArgs, row.warmup,
                  simplifyCmdline(row.cmdline)});
  idx.runSettings.emplace(row.cmdline, settings);
  return settings;
}

SuiteResults& findOrCreateSuite(CollationIndex& idx, ResultsByExeSuiteBenchmark& results,
                                const MeasurementRow& row, std::size_t& exeIdx,
                                std::size_t& suiteIdx) {
  auto exeIt = idx.exes.find(row.exe);
  if (exeIt == idx.exes.end()) {
    exeIt = idx.exes.emplace(row.exe, results.size()).first;
    results.push_back(ExeResults{row.exe, {}});
    idx.suitesPerExe.emplace_back();
    idx.benchesPerSuite.emplace_back();
  }
  exeIdx = exeIt->second;
  ExeResults& exe = results[exeIdx];

  auto& suites = idx.suitesPerExe[exeIdx];
  auto suiteIt = suites.find(row.suite);
  if (suiteIt == suites.end()) {
    suiteIt = suites.emplace(row.suite, exe.suites.size()).first;
    exe.suites.push_back(SuiteResults{row.suite, {}, {}});
    idx.benchesPerSuite[exeIdx].emplace_back();
  }
  suiteIdx = suiteIt->second;
  return exe.suites[suiteIdx];
}

ProcessedResult& findOrCreateProcessedResult(CollationIndex& idx, SuiteResults& suite,
                                             std::size_t exeIdx, std::size_t suiteIdx,
                                             const MeasurementRow& row) {
  auto& benches = idx.benchesPerSuite[exeIdx][suiteIdx];
  auto it = benches.find(row.bench);
  if (it == benches.end()) {
    it = benches.emplace(row.bench, suite.benchmarks.size()).first;
    ProcessedResult result;
    result.exe = row.exe;
    result.suite = row.suite;
    result.bench = row.bench;
    suite.benchmarks.push_back(std::move(result));
  }
  return suite.benchmarks[it->second];
}

/** @brief Linear scan; k (series per benchmark) is small in practice. */
Measurements* findMeasurements(ProcessedResult& result, const MeasurementRow& row) {
  for (auto& m : result.measurements) {
    if (m.envId == row.envId && m.commitId == row.commitId && m.runId == row.runId &&
        m.trialId == row.trialId && m.criterion->name == row.criterion) {
      return &m;
    }
  }
  return nullptr;
}

Measurements& findOrCreateMeasurements(ProcessedResult& result, SuiteResults& suite,
                                       const MeasurementRow& row,
                                       std::shared_ptr<const CriterionData> criterion,
                                       std::shared_ptr<const RunSettings> runSettings) {
  if (Measurements* existing = findMeasurements(result, row)) {
    return *existing;
  }

  Measurements m;
  m.criterion = criterion;
  m.runSettings = std::move(runSettings);
  m.envId = row.envId;
  m.commitId = row.commitId;
  m.runId = row.runId;
  m.trialId = row.trialId;
  m.expId = row.expId;
  result.measurements.push_back(std::move(m));

  result.criteria.set(criterion->name, criterion);
  suite.criteria.set(criterion->name, criterion);
  return result.measurements.back();
}

template <class T, class NameOf>
void sortByName(std::vector<T>& items, NameOf nameOf) {
  std::stable_sort(items.begin(), items.end(),
                   [&](const T& a, const T& b) { return naturalLess(nameOf(a), nameOf(b)); });
}

} // namespace

/* --------------------------------- API --------------------------------- */

ResultsByExeSuiteBenchmark collateMeasurements(const std::vector<MeasurementRow>& rows) {
  ResultsByExeSuiteBenchmark results;
  CollationIndex idx;
  std::size_t skipped = 0;

  for (const auto& row : rows) {
    if (row.invocation < 1 || row.iteration < 1 || row.invocation > MAX_INVOCATION ||
        row.iteration > MAX_ITERATION) {
      ++skipped;
      continue;
    }

    auto criterion = findOrCreateCriterion(idx, row);
    auto runSettings = findOrCreateRunSettings(idx, row);

    std::size_t exeIdx = 0;
    std::size_t suiteIdx = 0;
    SuiteResults& suite = findOrCreateSuite(idx, results, row, exeIdx, suiteIdx);
    ProcessedResult& result = findOrCreateProcessedResult(idx, suite, exeIdx, suiteIdx, row);
    Measurements& m =
        findOrCreateMeasurements(result, suite, row, std::move(criterion), std::move(runSettings));

    // invocation and iteration are 1-based in the rows
    const auto INV = static_cast<std::size_t>(row.invocation - 1);
    const auto IT = static_cast<std::size_t>(row.iteration - 1);
    if (m.values.size() <= INV) {
      m.values.resize(INV + 1);
    }
    auto& iterations = m.values[INV];
    if (iterations.size() <= IT) {
      iterations.resize(IT + 1);
    }
    iterations[IT] = row.value;
  }

  if (skipped > 0) {
    logf(LogLevel::Warning, "collate",
         "skipped %zu row(s) with invocation/iteration outside [1, %d]/[1, %d]", skipped,
         MAX_INVOCATION, MAX_ITERATION);
  }

  sortResultsAlphabetically(results);
  return results;
}

void sortResultsAlphabetically(ResultsByExeSuiteBenchmark& results) {
  sortByName(results, [](const ExeResults& e) -> const std::string& { return e.exe; });
  for (auto& exe : results) {
    sortByName(exe.suites, [](const SuiteResults& s) -> const std::string& { return s.suite; });
    for (auto& suite : exe.suites) {
      sortByName(suite.benchmarks,
                 [](const ProcessedResult& r) -> const std::string& { return r.bench; });
    }
  }
}

const ProcessedResult* findProcessedResult(const ResultsByExeSuiteBenchmark& results,
                                           const std::string& exe, const std::string& suite,
                                           const std::string& bench) {
  for (const auto& e : results) {
    if (e.exe != exe) {
      continue;
    }
    for (const auto& s : e.suites) {
      if (s.suite != suite) {
        continue;
      }
      for (const auto& r : s.benchmarks) {
        if (r.bench == bench) {
          return &r;
        }
      }
    }
  }
  return nullptr;
}

} // namespace trend
} // namespace benchtrend
