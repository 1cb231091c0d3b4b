/**
 * @file TimelineUpdater.cpp
 * @brief Implementation of the batching timeline updater.
 */

#include "src/trend/inc/TimelineUpdater.hpp"

#include <chrono>
#include <exception>
#include <string>
#include <utility>

#include "src/trend/inc/PerfTracker.hpp"
#include "src/trend/inc/TrendLog.hpp"

namespace benchtrend {
namespace trend {

namespace {

constexpr const char* SPAN_LABEL = "generate-timeline";

} // namespace

/* ----------------------------- Construction ----------------------------- */

BatchingTimelineUpdater::BatchingTimelineUpdater(TimelineStore& store, const TrendConfig& cfg,
                                                 TimelineWorker::Reducer reducer)
    : store_(store), cfg_(cfg), profiler_(Profiler::make(cfg, SPAN_LABEL)),
      worker_(*this, cfg.numBootstrapSamples, std::move(reducer)) {}

BatchingTimelineUpdater::~BatchingTimelineUpdater() = default;

std::string BatchingTimelineUpdater::jobKey(int runId, int trialId, int criterionId) {
  return std::to_string(trialId) + "-" + std::to_string(runId) + "-" + std::to_string(criterionId);
}

/* ------------------------------- Ingestion ------------------------------- */

void BatchingTimelineUpdater::addValues(int runId, int trialId, int criterionId,
                                        const std::vector<std::optional<double>>& values) {
  std::vector<double> present;
  present.reserve(values.size());
  for (const auto& v : values) {
    if (v) {
      present.push_back(*v);
    }
  }
  if (present.empty()) {
    return;
  }

  const std::string KEY = jobKey(runId, trialId, criterionId);
  std::lock_guard<std::mutex> lock(mu_);
  auto it = jobIndex_.find(KEY);
  if (it != jobIndex_.end()) {
    auto& job = jobs_[it->second].values;
    job.insert(job.end(), present.begin(), present.end());
    return;
  }
  jobIndex_.emplace(KEY, jobs_.size());
  jobs_.push_back(ComputeJob{runId, trialId, criterionId, std::move(present)});
}

std::vector<ComputeJob> BatchingTimelineUpdater::consumeUpdateJobs() {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<ComputeJob> out;
  out.swap(jobs_);
  jobIndex_.clear();
  return out;
}

/* -------------------------------- Waves -------------------------------- */

std::shared_future<std::size_t> BatchingTimelineUpdater::submitUpdateJobs() {
  const double START = startRequest();
  return processUpdateJobs(consumeUpdateJobs(), START);
}

std::shared_future<std::size_t>
BatchingTimelineUpdater::processUpdateJobs(std::vector<ComputeJob> jobs, double requestStart) {
  if (jobs.empty()) {
    std::promise<std::size_t> none;
    none.set_value(0);
    return none.get_future().share();
  }

  std::shared_future<std::size_t> handle;
  {
    std::lock_guard<std::mutex> lock(mu_);
    activeRequests_ += static_cast<long>(jobs.size());
    requestsAtStart_ = static_cast<std::size_t>(activeRequests_);

    if (completion_) {
      abandoned_.push_back(std::move(*completion_));
      logf(LogLevel::Warning, "timeline",
           "new wave while %ld request(s) outstanding; previous handle will not resolve "
           "(%zu abandoned so far)",
           activeRequests_ - static_cast<long>(jobs.size()), abandoned_.size());
    }
    completion_.emplace();
    handle = completion_->get_future().share();
    current_ = handle;
  }

  logf(LogLevel::Debug, "timeline", "dispatching %zu job(s)", jobs.size());
  profiler_->beforeMeasure();
  worker_.post(ComputeRequest{std::move(jobs), requestStart});
  return handle;
}

void BatchingTimelineUpdater::receiveResults(const ComputeResults& batch) {
  for (std::size_t i = 0; i < batch.results.size(); ++i) {
    const ComputeResult& r = batch.results[i];

    bool stored = false;
    try {
      stored = store_.recordTimeline(r.runId, r.trialId, r.criterionId, r.stats);
      if (!stored) {
        logf(LogLevel::Error, "timeline", "store rejected run %d trial %d criterion %d", r.runId,
             r.trialId, r.criterionId);
      }
    } catch (const std::exception& e) {
      logf(LogLevel::Error, "timeline", "store failed for run %d trial %d criterion %d: %s",
           r.runId, r.trialId, r.criterionId, e.what());
    }

    if (!stored && cfg_.persistFailure == PersistFailurePolicy::AbortBatch) {
      logf(LogLevel::Error, "timeline", "batch aborted, %zu result(s) not persisted",
           batch.results.size() - i - 1);
      return;
    }
  }

  std::optional<std::promise<std::size_t>> done;
  std::size_t count = 0;
  {
    std::lock_guard<std::mutex> lock(mu_);
    activeRequests_ -= static_cast<long>(batch.results.size());
    if (activeRequests_ == 0 && completion_) {
      done = std::move(completion_);
      completion_.reset();
      count = requestsAtStart_;
    }
  }

  if (done) {
    const RequestSpan SPAN = completeRequest(batch.requestStart, store_, SPAN_LABEL);
    profiler_->afterMeasure(SPAN);
    logf(LogLevel::Debug, "timeline", "wave of %zu job(s) done in %.3f ms", count,
         SPAN.durationMs);
    done->set_value(count);
  }
}

std::optional<std::shared_future<std::size_t>> BatchingTimelineUpdater::quiescence() const {
  std::lock_guard<std::mutex> lock(mu_);
  return current_;
}

/* ------------------------------- Control ------------------------------- */

void BatchingTimelineUpdater::performTimelineUpdate() {
  if (!cfg_.timelineEnabled) {
    logf(LogLevel::Info, "timeline", "timeline updates disabled, ignoring request");
    return;
  }
  const auto HANDLE = submitUpdateJobs();
  if (HANDLE.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
    logf(LogLevel::Debug, "timeline", "nothing to update");
  }
}

std::shared_future<void> BatchingTimelineUpdater::shutdown() { return worker_.shutdown(); }

std::size_t BatchingTimelineUpdater::pendingJobCount() const {
  std::lock_guard<std::mutex> lock(mu_);
  return jobs_.size();
}

long BatchingTimelineUpdater::activeRequests() const {
  std::lock_guard<std::mutex> lock(mu_);
  return activeRequests_;
}

std::size_t BatchingTimelineUpdater::abandonedWaveCount() const {
  std::lock_guard<std::mutex> lock(mu_);
  return abandoned_.size();
}

} // namespace trend
} // namespace benchtrend
