#ifndef BENCHTREND_TREND_HPP
#define BENCHTREND_TREND_HPP
/**
 * @file Trend.hpp
 * @brief All-in-one convenience header for collation, comparison, and
 * timeline updates.
 *
 * Typical usage:
 * @code{.cpp}
 *   #include "src/trend/inc/Trend.hpp"
 *
 *   auto results = collateMeasurements(rows);
 *   calculateAllChangeStatistics(results, 0, 1, cfg.significanceThreshold);
 *   auto points = calculateDataForOverviewPlot(results, "total");
 *
 *   BatchingTimelineUpdater updater(store, cfg);
 *   updater.addValues(runId, trialId, criterionId, values);
 *   updater.submitUpdateJobs().wait();
 * @endcode
 */

// Configuration, flag parsing, and logging
#include "src/trend/inc/TrendConfig.hpp"
#include "src/trend/inc/TrendLog.hpp"

// Row collation and comparisons
#include "src/trend/inc/ChangeStatistics.hpp"
#include "src/trend/inc/MeasurementCollator.hpp"

// Timeline waves and their store
#include "src/trend/inc/TimelineStore.hpp"
#include "src/trend/inc/TimelineUpdater.hpp"

// CSV output
#include "src/trend/inc/TrendCsv.hpp"

#endif // BENCHTREND_TREND_HPP
