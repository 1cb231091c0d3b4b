#ifndef BENCHTREND_TIMELINEUPDATER_HPP
#define BENCHTREND_TIMELINEUPDATER_HPP
/**
 * @file TimelineUpdater.hpp
 * @brief Batches timeline values and hands them to the statistics worker in
 * waves.
 *
 * Usage:
 * @code
 *   MemoryTimelineStore store;
 *   BatchingTimelineUpdater updater(store, cfg);
 *   updater.addValues(runId, trialId, criterionId, {1.0, std::nullopt, 2.0});
 *   std::size_t n = updater.submitUpdateJobs().get();
 * @endcode
 *
 * Only one wave's handle is tracked at a time. A wave that is replaced before
 * it completes, or whose worker faulted, never resolves.
 */

#include <cstddef>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "src/trend/inc/ComputeProtocol.hpp"
#include "src/trend/inc/Profiler.hpp"
#include "src/trend/inc/TimelineStore.hpp"
#include "src/trend/inc/TimelineWorker.hpp"
#include "src/trend/inc/TrendConfig.hpp"

namespace benchtrend {
namespace trend {

/* ------------------------ BatchingTimelineUpdater ------------------------ */

/**
 * @brief Pending-job table, in-flight counter, and completion handle of the
 * current wave. All state is mutex-guarded, so addValues() may be called from
 * any thread while results arrive on the worker's delivery thread.
 *
 * @note NOT RT-safe (mutex locking, heap allocation, threads).
 */
class BatchingTimelineUpdater final : public ResultReceiver {
public:
  /**
   * @param store Receives summaries and request timings; must outlive the updater.
   * @param cfg numBootstrapSamples, persistFailure, timelineEnabled, profiling knobs.
   * @param reducer Replaces the worker's bootstrap reduction when set.
   */
  BatchingTimelineUpdater(TimelineStore& store, const TrendConfig& cfg,
                          TimelineWorker::Reducer reducer = nullptr);
  ~BatchingTimelineUpdater() override;

  BatchingTimelineUpdater(const BatchingTimelineUpdater&) = delete;
  BatchingTimelineUpdater& operator=(const BatchingTimelineUpdater&) = delete;

  /**
   * @brief Queue the present values for (runId, trialId, criterionId).
   * Missing values are dropped; if none remain nothing is queued. Never
   * waits for the worker.
   */
  void addValues(int runId, int trialId, int criterionId,
                 const std::vector<std::optional<double>>& values);

  /**
   * @brief Dispatch every pending job as one wave.
   * @return handle resolving to the number of jobs dispatched; ready with 0
   *         if nothing was pending.
   */
  std::shared_future<std::size_t> submitUpdateJobs();

  /** @brief Take and clear the pending jobs, in insertion order. */
  std::vector<ComputeJob> consumeUpdateJobs();

  /**
   * @brief Dispatch @p jobs as one wave started at @p requestStart.
   * @return handle as for submitUpdateJobs().
   */
  std::shared_future<std::size_t> processUpdateJobs(std::vector<ComputeJob> jobs,
                                                    double requestStart);

  /** @brief Persist a batch, then count it toward quiescence. */
  void receiveResults(const ComputeResults& batch) override;

  /** @return handle of the current wave, if one was dispatched. */
  std::optional<std::shared_future<std::size_t>> quiescence() const;

  /** @brief Administrative re-trigger: submit without waiting. */
  void performTimelineUpdate();

  /** @brief Stop the worker. Idempotent; see TimelineWorker::shutdown(). */
  std::shared_future<void> shutdown();

  std::size_t pendingJobCount() const;
  long activeRequests() const;
  /** @brief Number of wave handles replaced by a later wave; they never resolve. */
  std::size_t abandonedWaveCount() const;

private:
  static std::string jobKey(int runId, int trialId, int criterionId);

  TimelineStore& store_;
  TrendConfig cfg_;
  std::unique_ptr<Profiler> profiler_;

  mutable std::mutex mu_;
  std::vector<ComputeJob> jobs_;
  std::unordered_map<std::string, std::size_t> jobIndex_; ///< key -> index into jobs_
  long activeRequests_{0};
  std::size_t requestsAtStart_{0};
  std::optional<std::promise<std::size_t>> completion_;
  std::optional<std::shared_future<std::size_t>> current_;
  /**
   * Promises of waves replaced by an overlapping submit. Kept so their
   * handles stay pending rather than breaking; grows by one per overlapping
   * wave for the updater's lifetime.
   */
  std::vector<std::promise<std::size_t>> abandoned_;

  TimelineWorker worker_; ///< last: stopped before the state above is destroyed
};

} // namespace trend
} // namespace benchtrend

#endif // BENCHTREND_TIMELINEUPDATER_HPP
