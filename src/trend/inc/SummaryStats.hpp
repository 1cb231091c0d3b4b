#ifndef BENCHTREND_SUMMARYSTATS_HPP
#define BENCHTREND_SUMMARYSTATS_HPP
/**
 * @file SummaryStats.hpp
 * @brief Summary statistics for timeline values (median, min/max, mean,
 * stddev) with a bootstrap 95% confidence interval of the median.
 */

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <random>
#include <vector>

namespace benchtrend {
namespace trend {

/* ---------------------------- SummaryStatistics ---------------------------- */

/** @brief Reduced form of one timeline job, as persisted by the store. */
struct SummaryStatistics {
  double min{};                    ///< minimum
  double max{};                    ///< maximum
  double mean{};                   ///< arithmetic mean
  double median{};                 ///< 50th percentile
  double stddev{};                 ///< standard deviation (sample formula)
  std::size_t numberOfSamples{};   ///< values that went into the summary
  double bci95low{};               ///< lower bound of bootstrap CI of the median
  double bci95up{};                ///< upper bound of bootstrap CI of the median
};

/* --------------------------------- API --------------------------------- */

/**
 * @brief Quantile of sorted values with linear interpolation.
 * @param sorted Ascending values; must not be empty.
 * @note RT-safe (pure computation).
 */
inline double quantileSorted(const std::vector<double>& sorted, double f) {
  const double IDX = f * static_cast<double>(sorted.size() - 1);
  const std::size_t LO = static_cast<std::size_t>(IDX);
  const std::size_t HI = (LO + 1 < sorted.size()) ? (LO + 1) : LO;
  const double FRAC = IDX - static_cast<double>(LO);
  return sorted[LO] * (1.0 - FRAC) + sorted[HI] * FRAC;
}

/**
 * @brief Median of the given values; 0 if empty.
 * @param values Samples (modified: sorted in-place).
 * @note NOT RT-safe (sort).
 */
inline double median(std::vector<double>& values) {
  if (values.empty()) {
    return 0.0;
  }
  std::sort(values.begin(), values.end());
  return quantileSorted(values, 0.5);
}

/**
 * @brief Compute summary statistics without the confidence interval.
 *
 * bci95low/bci95up are set to the median; bootstrapSummary() fills them in.
 *
 * @param values Samples (modified: sorted in-place).
 * @return Zero-initialized if empty.
 * @note NOT RT-safe (sort).
 */
inline SummaryStatistics summarize(std::vector<double>& values) {
  if (values.empty()) {
    return {};
  }
  std::sort(values.begin(), values.end());

  double sum = 0.0;
  for (const double VAL : values) {
    sum += VAL;
  }
  const double MEAN = sum / static_cast<double>(values.size());

  double sumSquaredDiff = 0.0;
  for (const double VAL : values) {
    const double DIFF = VAL - MEAN;
    sumSquaredDiff += DIFF * DIFF;
  }
  const double STDDEV = values.size() > 1
                            ? std::sqrt(sumSquaredDiff / static_cast<double>(values.size() - 1))
                            : 0.0;

  const double MEDIAN = quantileSorted(values, 0.5);

  SummaryStatistics s;
  s.min = values.front();
  s.max = values.back();
  s.mean = MEAN;
  s.median = MEDIAN;
  s.stddev = STDDEV;
  s.numberOfSamples = values.size();
  s.bci95low = MEDIAN;
  s.bci95up = MEDIAN;
  return s;
}

/**
 * @brief Summary statistics plus a percentile bootstrap CI of the median.
 *
 * Draws numBootstrapSamples resamples with replacement, takes the median of
 * each, and reports the 2.5th and 97.5th percentile of those medians.
 * With a single value or no resamples, the interval collapses to the median.
 *
 * @note NOT RT-safe (heap allocation, sort).
 */
template <class Rng>
SummaryStatistics bootstrapSummary(std::vector<double> values, int numBootstrapSamples, Rng& rng) {
  SummaryStatistics s = summarize(values);
  if (values.size() < 2 || numBootstrapSamples <= 0) {
    return s;
  }

  std::uniform_int_distribution<std::size_t> pick(0, values.size() - 1);
  std::vector<double> medians;
  medians.reserve(static_cast<std::size_t>(numBootstrapSamples));
  std::vector<double> resample(values.size());

  for (int b = 0; b < numBootstrapSamples; ++b) {
    for (double& slot : resample) {
      slot = values[pick(rng)];
    }
    std::sort(resample.begin(), resample.end());
    medians.push_back(quantileSorted(resample, 0.5));
  }

  std::sort(medians.begin(), medians.end());
  s.bci95low = quantileSorted(medians, 0.025);
  s.bci95up = quantileSorted(medians, 0.975);
  return s;
}

} // namespace trend
} // namespace benchtrend

#endif // BENCHTREND_SUMMARYSTATS_HPP
