#ifndef BENCHTREND_MEASUREMENTCOLLATOR_HPP
#define BENCHTREND_MEASUREMENTCOLLATOR_HPP
/**
 * @file MeasurementCollator.hpp
 * @brief Turns flat measurement rows into exe -> suite -> benchmark results.
 *
 * No statistics are computed here. Rows may arrive in any order, so it is not
 * known when a series is complete; statistics are a separate second step
 * (see ChangeStatistics.hpp).
 */

#include <vector>

#include "src/trend/inc/MeasurementTypes.hpp"

namespace benchtrend {
namespace trend {

/* ------------------------------- Constants ------------------------------- */

/// Largest invocation accepted; the grid is allocated up to it.
constexpr int MAX_INVOCATION = 10000;
/// Largest iteration accepted per invocation.
constexpr int MAX_ITERATION = 1000000;

/* --------------------------------- API --------------------------------- */

/**
 * @brief Collate rows into the nested result structure.
 *
 * Single pass over the rows; RunSettings and CriterionData are created once
 * and shared. Series within a benchmark are found by linear scan over the
 * identity (envId, commitId, runId, trialId, criterion). Afterwards exe, suite,
 * and benchmark levels are sorted with naturalLess(); criteria keep discovery
 * order.
 *
 * Rows with invocation or iteration below 1, or above MAX_INVOCATION /
 * MAX_ITERATION, are logged and skipped.
 *
 * @note NOT RT-safe (heap allocation).
 */
ResultsByExeSuiteBenchmark collateMeasurements(const std::vector<MeasurementRow>& rows);

/** @brief Sort every nesting level of @p results with naturalLess(). */
void sortResultsAlphabetically(ResultsByExeSuiteBenchmark& results);

/** @return the result for (exe, suite, bench), or nullptr. */
const ProcessedResult* findProcessedResult(const ResultsByExeSuiteBenchmark& results,
                                           const std::string& exe, const std::string& suite,
                                           const std::string& bench);

} // namespace trend
} // namespace benchtrend

#endif // BENCHTREND_MEASUREMENTCOLLATOR_HPP
