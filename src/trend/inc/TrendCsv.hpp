#ifndef BENCHTREND_TRENDCSV_HPP
#define BENCHTREND_TRENDCSV_HPP
/**
 * @file TrendCsv.hpp
 * @brief CSV helpers for timeline summaries and overview ratios.
 */

#include <ostream>
#include <string>

#include "src/trend/inc/ChangeStatistics.hpp"
#include "src/trend/inc/TimelineStore.hpp"

namespace benchtrend {
namespace trend {

namespace detail {

/** @brief Quote a field if it contains a separator, quote, or newline. */
inline std::string csvField(const std::string& s) {
  if (s.find_first_of(",\"\n") == std::string::npos) {
    return s;
  }
  std::string out = "\"";
  for (const char C : s) {
    if (C == '"') {
      out += '"';
    }
    out += C;
  }
  out += '"';
  return out;
}

} // namespace detail

/* ------------------------------- Timeline ------------------------------- */

/**
 * @brief Header matching writeTimelineCsvRow().
 * @note NOT RT-safe (stream I/O).
 */
inline void writeTimelineCsvHeader(std::ostream& csv) {
  csv << "runId,trialId,criterionId,min,max,mean,median,stddev,numberOfSamples,bci95low,bci95up"
      << "\n";
}

/** @note NOT RT-safe (stream I/O). */
inline void writeTimelineCsvRow(std::ostream& csv, const TimelineRecord& row) {
  const SummaryStatistics& s = row.stats;
  csv << row.runId << "," << row.trialId << "," << row.criterionId << "," << s.min << "," << s.max
      << "," << s.mean << "," << s.median << "," << s.stddev << "," << s.numberOfSamples << ","
      << s.bci95low << "," << s.bci95up << "\n";
}

/* ------------------------------- Overview ------------------------------- */

/** @note NOT RT-safe (stream I/O). */
inline void writeOverviewCsvHeader(std::ostream& csv) {
  csv << "exe,suite,bench,cmdline,envId,ratio\n";
}

/** @note NOT RT-safe (stream I/O, heap allocation). */
inline void writeOverviewCsvRow(std::ostream& csv, const OverviewPoint& p) {
  csv << detail::csvField(p.exe) << "," << detail::csvField(p.suite) << ","
      << detail::csvField(p.bench) << "," << detail::csvField(p.cmdline) << "," << p.envId << ","
      << p.ratio << "\n";
}

} // namespace trend
} // namespace benchtrend

#endif // BENCHTREND_TRENDCSV_HPP
