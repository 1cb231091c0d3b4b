#ifndef BENCHTREND_TRENDCONFIG_HPP
#define BENCHTREND_TRENDCONFIG_HPP
/**
 * @file TrendConfig.hpp
 * @brief Tunables for collation, comparison, and timeline updates, plus a flag
 * parser that preserves gtest args.
 */

#include <algorithm> // std::max
#include <cstdio>    // std::fprintf
#include <cstdlib>   // std::atoi, std::atof, std::exit
#include <optional>
#include <string>
#include <string_view>

namespace benchtrend {
namespace trend {

/* ------------------------------- Policies ------------------------------- */

/** @brief What happens to comparisons whose change is below the threshold. */
enum class SignificancePolicy {
  Flag,    ///< keep the comparison, mark it not significant
  Suppress ///< drop the comparison
};

/** @brief What receiveResults() does when the store rejects a result. */
enum class PersistFailurePolicy {
  AbortBatch,   ///< stop at the failing result; the wave never completes
  ContinueBatch ///< log and go on with the next result
};

/* ----------------------------- TrendConfig ----------------------------- */

/** @brief Common configuration values (CLI-overridable). */
struct TrendConfig {
  int numBootstrapSamples = 1000;                ///< Resamples per timeline job
  std::optional<double> significanceThreshold{}; ///< Percent; unset disables filtering
  SignificancePolicy significancePolicy = SignificancePolicy::Flag;
  PersistFailurePolicy persistFailure = PersistFailurePolicy::AbortBatch;
  bool timelineEnabled = true;      ///< When false, updates are never submitted
  std::string minLevel = "INFO";    ///< DEBUG|INFO|WARNING|ERROR
  std::optional<std::string> csv{}; ///< Optional CSV output path

  // ---- Profiling / artifact knobs (default off) ----
  std::string profileTool;      ///< "" or "gperf"
  std::string profileArgs;      ///< "cpu" (default), "heap", or "both"
  std::string artifactRoot;     ///< Optional root for artifacts
  int profileFrequency = 10000; ///< Sampling frequency for CPU profilers (Hz)
  bool profileAnalyze = false;  ///< Auto-run pprof after profiling
};

/* --------------------------------- API --------------------------------- */

/**
 * @brief Parse trend flags, leaving unknown args for gtest. Mutates argc/argv.
 *
 * Recognized flags:
 *   --bootstrap-samples N     --significance X (percent)
 *   --significance-policy flag|suppress
 *   --persist-failure abort|continue
 *   --no-timeline             --min-level STR     --csv PATH
 *   --profile TOOL            --profile-args STR  --artifact-root PATH
 *   --profile-frequency N     --profile-analyze
 *
 * @note NOT RT-safe (heap allocation, console I/O, may call exit()).
 */
inline void parseTrendFlags(TrendConfig& cfg, int* argc, char** argv) {
  const auto NEED_ARG = [&](const char* name, int i, int argcVal, char** argvVal) -> const char* {
    if (i + 1 >= argcVal) {
      std::fprintf(stderr, "Missing value for %s\n", name);
      std::exit(2);
    }
    return argvVal[i + 1];
  };

  int w = 1;
  for (int i = 1; i < *argc; ++i) {
    std::string_view a = argv[i];

    if (a == "--bootstrap-samples") {
      cfg.numBootstrapSamples =
          std::max(1, std::atoi(NEED_ARG("--bootstrap-samples", i, *argc, argv)));
      ++i;
    } else if (a == "--significance") {
      cfg.significanceThreshold = std::atof(NEED_ARG("--significance", i, *argc, argv));
      ++i;
    } else if (a == "--significance-policy") {
      std::string_view v = NEED_ARG("--significance-policy", i, *argc, argv);
      if (v == "suppress") {
        cfg.significancePolicy = SignificancePolicy::Suppress;
      } else if (v == "flag") {
        cfg.significancePolicy = SignificancePolicy::Flag;
      } else {
        std::fprintf(stderr, "[WARN] Unknown significance policy '%.*s', keeping current\n",
                     static_cast<int>(v.size()), v.data());
      }
      ++i;
    } else if (a == "--persist-failure") {
      std::string_view v = NEED_ARG("--persist-failure", i, *argc, argv);
      if (v == "continue") {
        cfg.persistFailure = PersistFailurePolicy::ContinueBatch;
      } else if (v == "abort") {
        cfg.persistFailure = PersistFailurePolicy::AbortBatch;
      } else {
        std::fprintf(stderr, "[WARN] Unknown persist-failure policy '%.*s', keeping current\n",
                     static_cast<int>(v.size()), v.data());
      }
      ++i;
    } else if (a == "--no-timeline") {
      cfg.timelineEnabled = false;
    } else if (a == "--min-level") {
      cfg.minLevel = NEED_ARG("--min-level", i, *argc, argv);
      ++i;
    } else if (a == "--csv") {
      cfg.csv = std::string(NEED_ARG("--csv", i, *argc, argv));
      ++i;
    }

    // ---- Profiling / artifact flags ----
    else if (a == "--profile") {
      cfg.profileTool = NEED_ARG("--profile", i, *argc, argv);
      ++i;
    } else if (a == "--profile-args") {
      cfg.profileArgs = NEED_ARG("--profile-args", i, *argc, argv);
      ++i;
    } else if (a == "--artifact-root") {
      cfg.artifactRoot = NEED_ARG("--artifact-root", i, *argc, argv);
      ++i;
    } else if (a == "--profile-frequency") {
      cfg.profileFrequency =
          std::max(1, std::atoi(NEED_ARG("--profile-frequency", i, *argc, argv)));
      ++i;
    } else if (a == "--profile-analyze") {
      cfg.profileAnalyze = true;
    }

    // Pass-through to gtest
    else {
      argv[w++] = argv[i];
    }
  }
  *argc = w;
}

} // namespace trend
} // namespace benchtrend

#endif // BENCHTREND_TRENDCONFIG_HPP
