#ifndef BENCHTREND_PROFILERGPERF_HPP
#define BENCHTREND_PROFILERGPERF_HPP
/**
 * @file ProfilerGperf.hpp
 * @brief gperftools backend for the profiler facade.
 *
 * Modes:
 *  - CPU profiling (default): generates "<artifactDir>/cpu.prof"
 *  - Heap profiling (opt-in): "heap" in profileArgs starts the HeapProfiler
 *  - Both: "both" in profileArgs
 *
 * Built with gperftools only when the build defines BENCHTREND_HAS_GPERF=1.
 * Otherwise makeGperfProfiler(...) returns nullptr and the factory in
 * Profiler.hpp produces a named no-op.
 */

#include <memory>
#include <mutex>
#include <string>

#include "src/trend/inc/Profiler.hpp" // base
#include "src/trend/inc/TrendConfig.hpp"

#ifndef BENCHTREND_HAS_GPERF
#define BENCHTREND_HAS_GPERF 0
#endif

namespace benchtrend {
namespace trend {

/* ----------------------------- GperfProfiler ----------------------------- */

/**
 * @brief Brackets timeline waves with gperftools start/stop.
 *
 * beforeMeasure() runs on the submitting thread and afterMeasure() on the
 * worker's delivery thread; both hold mu_.
 */
class GperfProfiler final : public Profiler {
public:
  GperfProfiler(const TrendConfig& cfg, std::string spanName);
  ~GperfProfiler() override = default;

  std::string toolName() const noexcept override { return "gperf"; }
  std::string artifactDir() const noexcept override { return artifactDir_; }

  void beforeMeasure() override;
  void afterMeasure(const RequestSpan& span) override;

private:
  TrendConfig cfg_{};
  std::string spanName_;
  std::string artifactDir_;
  std::string cpuPath_;
  std::string heapPrefix_;

  bool wantCpu_{false};
  bool wantHeap_{false};
  std::mutex mu_;
  bool running_{false}; ///< Guarded by mu_.

  void runPprofAnalysis() const;
};

/* --------------------------------- API --------------------------------- */

/** @brief Factory function for gperftools profiler. */
std::unique_ptr<Profiler> makeGperfProfiler(const TrendConfig& cfg, const std::string& spanName);

} // namespace trend
} // namespace benchtrend

#endif // BENCHTREND_PROFILERGPERF_HPP
