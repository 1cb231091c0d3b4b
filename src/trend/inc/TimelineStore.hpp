#ifndef BENCHTREND_TIMELINESTORE_HPP
#define BENCHTREND_TIMELINESTORE_HPP
/**
 * @file TimelineStore.hpp
 * @brief Persistence seam for timeline summaries and request timings, plus a
 * thread-safe in-memory implementation.
 */

#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "src/trend/inc/SummaryStats.hpp"

namespace benchtrend {
namespace trend {

/* ----------------------------- TimelineStore ----------------------------- */

/**
 * @brief Where timeline summaries go. Called from the worker's delivery thread.
 *
 * recordTimeline() reports failure by returning false or by throwing a
 * std::exception; either way the result is not retried.
 */
class TimelineStore {
public:
  virtual ~TimelineStore() = default;

  virtual bool recordTimeline(int runId, int trialId, int criterionId,
                              const SummaryStatistics& stats) = 0;

  /** Sink for performance-tracking spans. Default: ignored. */
  virtual void recordRequestDuration(const std::string& /*label*/, double /*durationMs*/) {}
};

/* ---------------------------- TimelineRecord ---------------------------- */

struct TimelineRecord {
  int runId{};
  int trialId{};
  int criterionId{};
  SummaryStatistics stats{};
};

struct RequestDuration {
  std::string label;
  double durationMs{};
};

/* -------------------------- MemoryTimelineStore -------------------------- */

/**
 * @brief Keeps everything in memory in arrival order.
 * @note NOT RT-safe (mutex locking, heap allocation).
 */
class MemoryTimelineStore : public TimelineStore {
public:
  bool recordTimeline(int runId, int trialId, int criterionId,
                      const SummaryStatistics& stats) override {
    std::lock_guard<std::mutex> lock(mu_);
    records_.push_back(TimelineRecord{runId, trialId, criterionId, stats});
    return true;
  }

  void recordRequestDuration(const std::string& label, double durationMs) override {
    std::lock_guard<std::mutex> lock(mu_);
    durations_.push_back(RequestDuration{label, durationMs});
  }

  /** @return copy of all records so far. */
  std::vector<TimelineRecord> records() const {
    std::lock_guard<std::mutex> lock(mu_);
    return records_;
  }

  /** @return all records so far, leaving the store empty. */
  std::vector<TimelineRecord> take() {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<TimelineRecord> out;
    out.swap(records_);
    return out;
  }

  std::vector<RequestDuration> requestDurations() const {
    std::lock_guard<std::mutex> lock(mu_);
    return durations_;
  }

private:
  mutable std::mutex mu_;
  std::vector<TimelineRecord> records_;
  std::vector<RequestDuration> durations_;
};

} // namespace trend
} // namespace benchtrend

#endif // BENCHTREND_TIMELINESTORE_HPP
