/**
 * @file TimelineWorker_uTest.cpp
 * @brief Unit tests for the statistics worker: reduction, delivery, faults,
 * and shutdown.
 */

#include "src/trend/inc/TimelineWorker.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using benchtrend::trend::ComputeJob;
using benchtrend::trend::ComputeRequest;
using benchtrend::trend::ComputeResults;
using benchtrend::trend::makeBootstrapReducer;
using benchtrend::trend::ResultReceiver;
using benchtrend::trend::SummaryStatistics;
using benchtrend::trend::TimelineWorker;

namespace {

constexpr auto WAIT = std::chrono::seconds(5);
constexpr auto SHORT_WAIT = std::chrono::milliseconds(200);

/** @brief Collects delivered batches. */
class RecordingReceiver : public ResultReceiver {
public:
  void receiveResults(const ComputeResults& batch) override {
    {
      std::lock_guard<std::mutex> lock(mu_);
      batches_.push_back(batch);
    }
    cv_.notify_all();
  }

  bool waitForBatches(std::size_t n, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mu_);
    return cv_.wait_for(lock, timeout, [&] { return batches_.size() >= n; });
  }

  std::vector<ComputeResults> batches() {
    std::lock_guard<std::mutex> lock(mu_);
    return batches_;
  }

private:
  std::mutex mu_;
  std::condition_variable cv_;
  std::vector<ComputeResults> batches_;
};

SummaryStatistics countValues(const std::vector<double>& values) {
  SummaryStatistics s;
  s.numberOfSamples = values.size();
  return s;
}

ComputeRequest makeRequest(int jobs, double start) {
  ComputeRequest req;
  req.requestStart = start;
  for (int i = 0; i < jobs; ++i) {
    req.jobs.push_back(ComputeJob{1, 2, i, std::vector<double>(static_cast<std::size_t>(i) + 1,
                                                                1.0)});
  }
  return req;
}

} // namespace

/* ----------------------------- Reduction Tests ----------------------------- */

/** @test Every job gets one result carrying its identity; the marker is echoed. */
TEST(TimelineWorkerTest, ReducesEveryJob) {
  RecordingReceiver receiver;
  TimelineWorker worker(receiver, 10, countValues);

  worker.post(makeRequest(3, 123.0));

  ASSERT_TRUE(receiver.waitForBatches(1, WAIT));
  const auto BATCHES = receiver.batches();
  ASSERT_EQ(BATCHES.size(), 1U);
  EXPECT_DOUBLE_EQ(BATCHES[0].requestStart, 123.0);
  ASSERT_EQ(BATCHES[0].results.size(), 3U);
  for (const auto& r : BATCHES[0].results) {
    EXPECT_EQ(r.runId, 1);
    EXPECT_EQ(r.trialId, 2);
    EXPECT_EQ(r.stats.numberOfSamples, static_cast<std::size_t>(r.criterionId) + 1);
  }
}

/** @test The default reducer produces a bootstrap summary. */
TEST(TimelineWorkerTest, DefaultReducerSummarizes) {
  RecordingReceiver receiver;
  TimelineWorker worker(receiver, 50);

  ComputeRequest req;
  req.jobs.push_back(ComputeJob{1, 1, 1, {3.0, 1.0, 2.0, 4.0, 5.0}});
  worker.post(req);

  ASSERT_TRUE(receiver.waitForBatches(1, WAIT));
  const auto BATCHES = receiver.batches();
  const auto& s = BATCHES[0].results[0].stats;
  EXPECT_DOUBLE_EQ(s.median, 3.0);
  EXPECT_DOUBLE_EQ(s.min, 1.0);
  EXPECT_DOUBLE_EQ(s.max, 5.0);
  EXPECT_EQ(s.numberOfSamples, 5U);
  EXPECT_LE(s.bci95low, s.median);
  EXPECT_GE(s.bci95up, s.median);
}

/** @test The bootstrap reducer factory works on its own. */
TEST(TimelineWorkerTest, BootstrapReducerFactory) {
  const auto REDUCE = makeBootstrapReducer(20);

  const SummaryStatistics S = REDUCE({2.0, 2.0, 2.0});

  EXPECT_DOUBLE_EQ(S.median, 2.0);
  EXPECT_DOUBLE_EQ(S.bci95low, 2.0);
  EXPECT_DOUBLE_EQ(S.bci95up, 2.0);
}

/* ----------------------------- Shutdown Tests ----------------------------- */

/** @test Repeated shutdown calls return handles that resolve together. */
TEST(TimelineWorkerTest, ShutdownIsIdempotent) {
  RecordingReceiver receiver;
  TimelineWorker worker(receiver, 10, countValues);

  auto first = worker.shutdown();
  auto second = worker.shutdown();

  EXPECT_EQ(first.wait_for(WAIT), std::future_status::ready);
  EXPECT_EQ(second.wait_for(std::chrono::seconds(0)), std::future_status::ready);
  EXPECT_EQ(worker.shutdown().wait_for(std::chrono::seconds(0)), std::future_status::ready);
}

/** @test Requests queued before shutdown are still delivered. */
TEST(TimelineWorkerTest, ShutdownDrainsQueuedRequests) {
  RecordingReceiver receiver;
  TimelineWorker worker(receiver, 10, countValues);

  worker.post(makeRequest(2, 1.0));
  worker.post(makeRequest(1, 2.0));
  ASSERT_EQ(worker.shutdown().wait_for(WAIT), std::future_status::ready);

  const auto BATCHES = receiver.batches();
  ASSERT_EQ(BATCHES.size(), 2U);
  EXPECT_DOUBLE_EQ(BATCHES[0].requestStart, 1.0);
  EXPECT_DOUBLE_EQ(BATCHES[1].requestStart, 2.0);
}

/* ----------------------------- Fault Tests ----------------------------- */

/** @test A throwing reducer stops the worker; the request gets no results. */
TEST(TimelineWorkerTest, FaultDeliversNothing) {
  RecordingReceiver receiver;
  TimelineWorker worker(receiver, 10, [](const std::vector<double>&) -> SummaryStatistics {
    throw std::runtime_error("reduction failed");
  });

  worker.post(makeRequest(2, 1.0));

  EXPECT_FALSE(receiver.waitForBatches(1, SHORT_WAIT));
  const auto DEADLINE = std::chrono::steady_clock::now() + WAIT;
  while (!worker.faulted() && std::chrono::steady_clock::now() < DEADLINE) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  EXPECT_TRUE(worker.faulted());

  // Later requests are dropped with a warning.
  ::testing::internal::CaptureStderr();
  worker.post(makeRequest(1, 2.0));
  const std::string ERR = ::testing::internal::GetCapturedStderr();
  EXPECT_NE(ERR.find("[WARN] worker: worker faulted, dropping request with 1 job(s)"),
            std::string::npos);
  EXPECT_FALSE(receiver.waitForBatches(1, SHORT_WAIT));
}

/** @test A request posted after shutdown is dropped with a warning. */
TEST(TimelineWorkerTest, PostAfterShutdownWarns) {
  RecordingReceiver receiver;
  TimelineWorker worker(receiver, 10, countValues);

  EXPECT_EQ(worker.shutdown().wait_for(WAIT), std::future_status::ready);

  ::testing::internal::CaptureStderr();
  worker.post(makeRequest(2, 1.0));
  const std::string ERR = ::testing::internal::GetCapturedStderr();

  EXPECT_NE(ERR.find("[WARN] worker: worker shutting down, dropping request with 2 job(s)"),
            std::string::npos);
  EXPECT_TRUE(receiver.batches().empty());
}

/** @test Shutdown still resolves after a fault. */
TEST(TimelineWorkerTest, ShutdownAfterFault) {
  RecordingReceiver receiver;
  TimelineWorker worker(receiver, 10, [](const std::vector<double>&) -> SummaryStatistics {
    throw std::runtime_error("reduction failed");
  });

  worker.post(makeRequest(1, 1.0));

  EXPECT_EQ(worker.shutdown().wait_for(WAIT), std::future_status::ready);
  EXPECT_TRUE(worker.faulted());
}
