/**
 * @file ProfilerGperf.cpp
 * @brief Implementation of gperftools profiler backend.
 */

#include "src/trend/inc/ProfilerGperf.hpp"

#include <array>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <system_error>
#include <utility>

#include <unistd.h>

#if BENCHTREND_HAS_GPERF
#include <gperftools/heap-profiler.h>
#include <gperftools/profiler.h>
#endif

#include "src/trend/inc/TrendLog.hpp"

namespace benchtrend {
namespace trend {

/* ----------------------------- GperfProfiler Methods ----------------------------- */

GperfProfiler::GperfProfiler(const TrendConfig& cfg, std::string spanName)
    : cfg_(cfg), spanName_(std::move(spanName)) {
  // <artifactRoot>/<span>.gperf/
  if (!cfg_.artifactRoot.empty()) {
    artifactDir_ = cfg_.artifactRoot + "/" + spanName_ + ".gperf";
  } else {
    artifactDir_ = "./" + spanName_ + ".gperf";
  }
  std::error_code ec;
  std::filesystem::create_directories(artifactDir_, ec);
  if (ec) {
    logf(LogLevel::Warning, "gperf", "cannot create %s: %s", artifactDir_.c_str(),
         ec.message().c_str());
  }

  const std::string& args = cfg_.profileArgs;
  auto containsKey = [&](const char* k) { return args.find(k) != std::string::npos; };

  wantCpu_ = (args.empty() || containsKey("cpu") || containsKey("both"));
  wantHeap_ = (containsKey("heap") || containsKey("both"));
}

void GperfProfiler::beforeMeasure() {
#if BENCHTREND_HAS_GPERF
  std::lock_guard<std::mutex> lock(mu_);
  // Only one wave is profiled at a time; a second start while running is ignored.
  if (running_) {
    return;
  }
  // gperftools reads CPUPROFILE_FREQUENCY at ProfilerStart() time.
  if (wantCpu_ && cfg_.profileFrequency > 0) {
    const std::string FREQ = std::to_string(cfg_.profileFrequency);
    ::setenv("CPUPROFILE_FREQUENCY", FREQ.c_str(), /*overwrite=*/1);
  }
  if (wantHeap_) {
    heapPrefix_ = artifactDir_ + "/heap";
    HeapProfilerStart(heapPrefix_.c_str());
  }
  if (wantCpu_) {
    cpuPath_ = artifactDir_ + "/cpu.prof";
    ProfilerStart(cpuPath_.c_str());
  }
  running_ = true;
#endif
}

void GperfProfiler::afterMeasure(const RequestSpan& span) {
#if BENCHTREND_HAS_GPERF
  std::lock_guard<std::mutex> lock(mu_);
  if (!running_) {
    return;
  }
  running_ = false;
  if (wantCpu_) {
    ProfilerFlush();
    ProfilerStop();
    logf(LogLevel::Info, "gperf", "%s (%.3f ms) profile: %s", span.label.c_str(),
         span.durationMs, cpuPath_.c_str());
    if (cfg_.profileAnalyze && !cpuPath_.empty()) {
      runPprofAnalysis();
    }
  }
  if (wantHeap_) {
    HeapProfilerDump("final");
    HeapProfilerStop();
  }
#else
  (void)span;
#endif
}

void GperfProfiler::runPprofAnalysis() const {
#ifdef __linux__
  bool hasPprof = (std::system("command -v google-pprof >/dev/null 2>&1") == 0);
  if (!hasPprof) {
    std::fprintf(stderr,
                 "\n[INFO] --profile-analyze: google-pprof not found. Install gperftools.\n"
                 "   Profile saved to: %s\n"
                 "   Manual analysis: google-pprof --text <binary> %s\n\n",
                 cpuPath_.c_str(), cpuPath_.c_str());
    return;
  }

  std::array<char, 4096> exePath{};
  ssize_t len = ::readlink("/proc/self/exe", exePath.data(), exePath.size() - 1);
  if (len <= 0) {
    std::fprintf(stderr, "[WARN] --profile-analyze: Could not determine binary path\n");
    return;
  }
  exePath[static_cast<std::size_t>(len)] = '\0';

  std::printf("\n=== gperftools Auto-Analysis (top 15 by cumulative) ===\n");
  std::printf("Profile: %s\n\n", cpuPath_.c_str());

  const std::string CMD = "google-pprof --text --cum --lines '" + std::string(exePath.data()) +
                          "' '" + cpuPath_ + "' 2>/dev/null | head -20";
  if (std::system(CMD.c_str()) != 0) {
    std::fprintf(stderr, "[WARN] --profile-analyze: google-pprof failed\n");
  }
  std::printf("\n");
#endif
}

/* --------------------------------- API --------------------------------- */

std::unique_ptr<Profiler> makeGperfProfiler(const TrendConfig& cfg, const std::string& spanName) {
#if BENCHTREND_HAS_GPERF
  return std::make_unique<GperfProfiler>(cfg, spanName);
#else
  (void)cfg;
  (void)spanName;
  return std::unique_ptr<Profiler>{}; // not built with gperftools -> factory falls back to no-op
#endif
}

} // namespace trend
} // namespace benchtrend
