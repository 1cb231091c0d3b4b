#ifndef BENCHTREND_COMPUTEPROTOCOL_HPP
#define BENCHTREND_COMPUTEPROTOCOL_HPP
/**
 * @file ComputeProtocol.hpp
 * @brief Messages exchanged between the timeline updater and its worker.
 *
 * Inbound (to the worker): a ComputeRequest or the ExitSignal.
 * Outbound (from the worker): ComputeResults, the WorkerExiting
 * acknowledgement, or a WorkerFault when a reduction threw.
 */

#include <string>
#include <variant>
#include <vector>

#include "src/trend/inc/SummaryStats.hpp"

namespace benchtrend {
namespace trend {

/* ------------------------------- Requests ------------------------------- */

/** @brief Values of one (run, trial, criterion) to be summarized. */
struct ComputeJob {
  int runId{};
  int trialId{};
  int criterionId{};
  std::vector<double> values;
};

/** @brief All jobs of one wave. requestStart is echoed back unchanged. */
struct ComputeRequest {
  std::vector<ComputeJob> jobs;
  double requestStart{}; ///< nowUs() at dispatch
};

/** @brief Asks the worker to acknowledge and stop. */
struct ExitSignal {};

using WorkerInbound = std::variant<ComputeRequest, ExitSignal>;

/* ------------------------------- Responses ------------------------------- */

struct ComputeResult {
  int runId{};
  int trialId{};
  int criterionId{};
  SummaryStatistics stats{};
};

struct ComputeResults {
  std::vector<ComputeResult> results;
  double requestStart{};
};

/** @brief Last message of a worker that was asked to exit. */
struct WorkerExiting {};

/** @brief The worker stopped because a reduction threw. */
struct WorkerFault {
  std::string message;
};

using WorkerOutbound = std::variant<ComputeResults, WorkerExiting, WorkerFault>;

/* ---------------------------- ResultReceiver ---------------------------- */

/**
 * @brief Consumer of computed results. Called on the worker's delivery thread,
 * one batch at a time.
 */
class ResultReceiver {
public:
  virtual ~ResultReceiver() = default;

  virtual void receiveResults(const ComputeResults& batch) = 0;
};

} // namespace trend
} // namespace benchtrend

#endif // BENCHTREND_COMPUTEPROTOCOL_HPP
