#ifndef BENCHTREND_TIMELINEWORKER_HPP
#define BENCHTREND_TIMELINEWORKER_HPP
/**
 * @file TimelineWorker.hpp
 * @brief Background statistics worker for timeline waves.
 *
 * Two threads connected by unbounded channels:
 *  - the worker thread reduces every job of a ComputeRequest independently
 *    (bootstrap summary by default) and posts ComputeResults;
 *  - the delivery thread hands each ComputeResults to the ResultReceiver in
 *    arrival order and handles the worker's lifecycle messages.
 *
 * If a reduction throws, the worker posts a WorkerFault, logs it at ERROR and
 * stops. The request that failed never gets results.
 */

#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "src/trend/inc/Channel.hpp"
#include "src/trend/inc/ComputeProtocol.hpp"
#include "src/trend/inc/SummaryStats.hpp"

namespace benchtrend {
namespace trend {

/* ---------------------------- TimelineWorker ---------------------------- */

/**
 * @brief Owns the worker and delivery threads.
 * @note NOT RT-safe (threads, mutex locking, heap allocation).
 */
class TimelineWorker {
public:
  /** Reduction of one job's values; may throw. */
  using Reducer = std::function<SummaryStatistics(const std::vector<double>&)>;

  /**
   * @param receiver Gets every ComputeResults batch; must outlive the worker.
   * @param numBootstrapSamples Resamples used by the default reducer.
   * @param reducer Replaces the default bootstrap reduction when set.
   */
  TimelineWorker(ResultReceiver& receiver, int numBootstrapSamples, Reducer reducer = nullptr);
  ~TimelineWorker();

  TimelineWorker(const TimelineWorker&) = delete;
  TimelineWorker& operator=(const TimelineWorker&) = delete;

  /**
   * @brief Queue a request. Never blocks on the reduction.
   *
   * After shutdown() or a fault nothing reads the queue, so the request is
   * dropped with a warning and its wave never resolves.
   */
  void post(ComputeRequest request);

  /**
   * @brief Ask the worker to exit. Idempotent: every call returns the same
   * future, ready once the worker acknowledged and its thread was joined.
   */
  std::shared_future<void> shutdown();

  /** @return true once the worker stopped because of a fault. */
  bool faulted() const;

private:
  void workerLoop();
  void deliveryLoop();

  ResultReceiver& receiver_;
  Reducer reducer_;

  Channel<WorkerInbound> inbound_;
  Channel<WorkerOutbound> outbound_;

  mutable std::mutex mu_;
  bool faulted_{false};
  bool shutdownRequested_{false};
  std::promise<void> exited_;
  std::optional<std::shared_future<void>> exitedFuture_;

  std::thread worker_;
  std::thread delivery_;
};

/** @brief Bootstrap reducer with its own random engine. */
TimelineWorker::Reducer makeBootstrapReducer(int numBootstrapSamples);

} // namespace trend
} // namespace benchtrend

#endif // BENCHTREND_TIMELINEWORKER_HPP
