#ifndef BENCHTREND_PERFTRACKER_HPP
#define BENCHTREND_PERFTRACKER_HPP
/**
 * @file PerfTracker.hpp
 * @brief Timing of internal requests (e.g. "generate-timeline") into the store.
 */

#include <string>

#include "src/trend/inc/TimelineStore.hpp"
#include "src/trend/inc/TrendUtils.hpp"

namespace benchtrend {
namespace trend {

/** @brief Completed span, handed to profilers after each wave. */
struct RequestSpan {
  std::string label;
  double startUs{};
  double durationMs{};
};

/** @return start marker in microseconds (monotonic). */
inline double startRequest() { return nowUs(); }

/**
 * @brief Close the span opened at @p startUs and record it under @p label.
 * @return the recorded span.
 * @note NOT RT-safe (store call).
 */
inline RequestSpan completeRequest(double startUs, TimelineStore& store, const std::string& label) {
  const double DURATION_MS = (nowUs() - startUs) / 1000.0;
  store.recordRequestDuration(label, DURATION_MS);
  return RequestSpan{label, startUs, DURATION_MS};
}

} // namespace trend
} // namespace benchtrend

#endif // BENCHTREND_PERFTRACKER_HPP
