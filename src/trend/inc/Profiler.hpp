#ifndef BENCHTREND_PROFILER_HPP
#define BENCHTREND_PROFILER_HPP
/**
 * @file Profiler.hpp
 * @brief Lightweight facade for an optional profiler around timeline waves.
 */

#include <cstdio>
#include <memory>
#include <string>
#include <utility>

#include "src/trend/inc/PerfTracker.hpp"
#include "src/trend/inc/TrendConfig.hpp"

namespace benchtrend {
namespace trend {

/* ------------------------------- Profiler ------------------------------- */

/**
 * @note NOT RT-safe (virtual dispatch, heap allocation, may spawn subprocesses).
 */
class Profiler {
public:
  virtual ~Profiler() = default;

  /** @return stable tool name ("gperf") or empty. */
  virtual std::string toolName() const noexcept = 0;

  /** @return directory path where artifacts are written (may be empty for no-op). */
  virtual std::string artifactDir() const noexcept = 0;

  /** Called when a wave is dispatched to the worker. */
  virtual void beforeMeasure() {}

  /** Called when the wave's last result was persisted; receives its span. */
  virtual void afterMeasure(const RequestSpan& /*span*/) {}

  /**
   * @brief Factory: returns a concrete profiler or a no-op based on cfg.
   * No-Op if cfg.profileTool is empty or unsupported in this build.
   */
  static std::unique_ptr<Profiler> make(const TrendConfig& cfg, const std::string& spanName);
};

/* -------------------------- Detail Implementation -------------------------- */

namespace detail {

class NoOpProfiler final : public Profiler {
public:
  explicit NoOpProfiler(std::string tool = {}, std::string dir = {})
      : tool_(std::move(tool)), dir_(std::move(dir)) {}
  std::string toolName() const noexcept override { return tool_; }
  std::string artifactDir() const noexcept override { return dir_; }

private:
  std::string tool_;
  std::string dir_;
};

} // namespace detail

/* --------------------------------- API --------------------------------- */

// Defined in ProfilerGperf.cpp; returns nullptr when built without gperftools.
std::unique_ptr<Profiler> makeGperfProfiler(const TrendConfig& cfg, const std::string& spanName);

inline std::unique_ptr<Profiler> Profiler::make(const TrendConfig& cfg,
                                                const std::string& spanName) {
  if (cfg.profileTool.empty()) {
    return std::make_unique<detail::NoOpProfiler>();
  }

  if (cfg.profileTool == "gperf") {
    if (auto p = makeGperfProfiler(cfg, spanName)) {
      return p;
    }
    std::fprintf(stderr,
                 "\n[WARN] Profiler 'gperf' requested but unavailable in this build.\n"
                 "   Install libgperftools-dev and rebuild.\n"
                 "   Falling back to no-op (timeline updates proceed without profiling).\n\n");
    return std::make_unique<detail::NoOpProfiler>("gperf", "");
  }

  // Unknown profiler: return a named no-op so the request stays visible.
  std::fprintf(stderr, "\n[WARN] Unknown profiler '%s'. Available: gperf.\n\n",
               cfg.profileTool.c_str());
  return std::make_unique<detail::NoOpProfiler>(cfg.profileTool, "");
}

} // namespace trend
} // namespace benchtrend

#endif // BENCHTREND_PROFILER_HPP
