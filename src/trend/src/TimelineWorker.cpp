/**
 * @file TimelineWorker.cpp
 * @brief Implementation of the worker and delivery threads.
 */

#include "src/trend/inc/TimelineWorker.hpp"

#include <exception>
#include <memory>
#include <random>
#include <utility>
#include <variant>

#include "src/trend/inc/TrendLog.hpp"

namespace benchtrend {
namespace trend {

/* ----------------------------- Construction ----------------------------- */

TimelineWorker::TimelineWorker(ResultReceiver& receiver, int numBootstrapSamples, Reducer reducer)
    : receiver_(receiver),
      reducer_(reducer ? std::move(reducer) : makeBootstrapReducer(numBootstrapSamples)) {
  worker_ = std::thread([this] { workerLoop(); });
  delivery_ = std::thread([this] { deliveryLoop(); });
  logf(LogLevel::Debug, "worker", "started (bootstrap samples: %d)", numBootstrapSamples);
}

TimelineWorker::~TimelineWorker() {
  shutdown().wait();
  if (delivery_.joinable()) {
    delivery_.join();
  }
}

/* --------------------------------- API --------------------------------- */

void TimelineWorker::post(ComputeRequest request) {
  std::lock_guard<std::mutex> lock(mu_);
  if (shutdownRequested_ || faulted_) {
    logf(LogLevel::Warning, "worker", "%s, dropping request with %zu job(s)",
         faulted_ ? "worker faulted" : "worker shutting down", request.jobs.size());
    return;
  }
  // Under mu_ so the request cannot land behind shutdown()'s ExitSignal.
  inbound_.push(std::move(request));
}

std::shared_future<void> TimelineWorker::shutdown() {
  std::lock_guard<std::mutex> lock(mu_);
  if (exitedFuture_) {
    return *exitedFuture_;
  }
  exitedFuture_ = exited_.get_future().share();
  shutdownRequested_ = true;

  if (faulted_) {
    // Nobody reads the inbound channel anymore; finish on the delivery thread.
    outbound_.push(WorkerExiting{});
  } else {
    inbound_.push(ExitSignal{});
  }
  return *exitedFuture_;
}

bool TimelineWorker::faulted() const {
  std::lock_guard<std::mutex> lock(mu_);
  return faulted_;
}

/* ------------------------------- Threads ------------------------------- */

void TimelineWorker::workerLoop() {
  for (;;) {
    WorkerInbound msg = inbound_.pop();
    if (std::holds_alternative<ExitSignal>(msg)) {
      outbound_.push(WorkerExiting{});
      return;
    }

    const ComputeRequest& req = std::get<ComputeRequest>(msg);
    ComputeResults out;
    out.requestStart = req.requestStart;
    out.results.reserve(req.jobs.size());

    try {
      for (const auto& job : req.jobs) {
        out.results.push_back(
            ComputeResult{job.runId, job.trialId, job.criterionId, reducer_(job.values)});
      }
    } catch (const std::exception& e) {
      outbound_.push(WorkerFault{e.what()});
      return;
    }

    outbound_.push(std::move(out));
  }
}

void TimelineWorker::deliveryLoop() {
  for (;;) {
    WorkerOutbound msg = outbound_.pop();

    if (const auto* batch = std::get_if<ComputeResults>(&msg)) {
      try {
        receiver_.receiveResults(*batch);
      } catch (const std::exception& e) {
        logf(LogLevel::Error, "worker", "result delivery failed: %s", e.what());
      }
      continue;
    }

    if (const auto* fault = std::get_if<WorkerFault>(&msg)) {
      logf(LogLevel::Error, "worker", "worker fault: %s", fault->message.c_str());
      bool stop = false;
      {
        std::lock_guard<std::mutex> lock(mu_);
        faulted_ = true;
        stop = shutdownRequested_;
      }
      if (!stop) {
        continue;
      }
    }

    // WorkerExiting, or a fault after shutdown was requested.
    break;
  }

  if (worker_.joinable()) {
    worker_.join();
  }
  logf(LogLevel::Debug, "worker", "exited");
  exited_.set_value();
}

/* ------------------------------- Reducer ------------------------------- */

TimelineWorker::Reducer makeBootstrapReducer(int numBootstrapSamples) {
  auto rng = std::make_shared<std::mt19937_64>(std::random_device{}());
  return [numBootstrapSamples, rng](const std::vector<double>& values) {
    return bootstrapSummary(values, numBootstrapSamples, *rng);
  };
}

} // namespace trend
} // namespace benchtrend
