#ifndef BENCHTREND_TRENDUTILS_HPP
#define BENCHTREND_TRENDUTILS_HPP
/**
 * @file TrendUtils.hpp
 * @brief Small shared helpers: monotonic clock, natural ordering of names,
 * command-line simplification, and a start gate for multi-threaded tests.
 */

#include <atomic>
#include <cctype>
#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
#include <thread>

namespace benchtrend {
namespace trend {

/* ---------------------------- Clock Utilities ---------------------------- */

/**
 * @brief Current time in microseconds from a monotonic clock.
 * @note NOT RT-safe (system call).
 */
inline double nowUs() {
  using clock = std::chrono::steady_clock;
  return std::chrono::duration_cast<std::chrono::microseconds>(clock::now().time_since_epoch())
      .count();
}

/* ---------------------------- Natural Ordering ---------------------------- */

namespace detail {

/** @brief Collation class: punctuation/space, then digits, then letters. */
inline int charClass(unsigned char c) noexcept {
  if (std::isdigit(c)) {
    return 1;
  }
  if (std::isalpha(c)) {
    return 2;
  }
  return 0;
}

} // namespace detail

/**
 * @brief Three-way comparison of two names with numeric awareness.
 *
 * Digit runs compare by numeric value ("bench2" < "bench10"), letters compare
 * case-insensitively with lowercase first on a tie, punctuation sorts before
 * digits and digits before letters.
 *
 * @return negative, zero, or positive.
 * @note RT-safe (no allocations).
 */
inline int naturalCompare(std::string_view a, std::string_view b) noexcept {
  std::size_t i = 0;
  std::size_t j = 0;
  int caseTieBreak = 0;

  while (i < a.size() && j < b.size()) {
    const auto CA = static_cast<unsigned char>(a[i]);
    const auto CB = static_cast<unsigned char>(b[j]);

    if (std::isdigit(CA) && std::isdigit(CB)) {
      // Skip leading zeros, then the longer run is the larger number.
      std::size_t si = i;
      std::size_t sj = j;
      while (si < a.size() && a[si] == '0') {
        ++si;
      }
      while (sj < b.size() && b[sj] == '0') {
        ++sj;
      }
      std::size_t ei = si;
      std::size_t ej = sj;
      while (ei < a.size() && std::isdigit(static_cast<unsigned char>(a[ei]))) {
        ++ei;
      }
      while (ej < b.size() && std::isdigit(static_cast<unsigned char>(b[ej]))) {
        ++ej;
      }
      const std::size_t LEN_A = ei - si;
      const std::size_t LEN_B = ej - sj;
      if (LEN_A != LEN_B) {
        return LEN_A < LEN_B ? -1 : 1;
      }
      const int DIGITS = a.substr(si, LEN_A).compare(b.substr(sj, LEN_B));
      if (DIGITS != 0) {
        return DIGITS;
      }
      if (caseTieBreak == 0 && (si - i) != (sj - j)) {
        caseTieBreak = (si - i) < (sj - j) ? -1 : 1;
      }
      i = ei;
      j = ej;
      continue;
    }

    const int CLASS_A = detail::charClass(CA);
    const int CLASS_B = detail::charClass(CB);
    if (CLASS_A != CLASS_B) {
      return CLASS_A < CLASS_B ? -1 : 1;
    }

    const int LA = std::tolower(CA);
    const int LB = std::tolower(CB);
    if (LA != LB) {
      return LA < LB ? -1 : 1;
    }
    if (caseTieBreak == 0 && CA != CB) {
      // lowercase sorts first
      caseTieBreak = std::islower(CA) ? -1 : 1;
    }
    ++i;
    ++j;
  }

  if (i < a.size()) {
    return 1;
  }
  if (j < b.size()) {
    return -1;
  }
  return caseTieBreak;
}

/** @brief Strict weak ordering built on naturalCompare(). */
inline bool naturalLess(std::string_view a, std::string_view b) noexcept {
  return naturalCompare(a, b) < 0;
}

/* ------------------------- Command-Line Utilities ------------------------- */

/**
 * @brief Drop the directory part of the executable in a command line.
 *
 * "/opt/som/bin/som -cp . Bench" becomes "som -cp . Bench". Arguments are
 * left untouched.
 *
 * @note NOT RT-safe (heap allocation).
 */
inline std::string simplifyCmdline(std::string_view cmdline) {
  std::size_t start = 0;
  while (start < cmdline.size() && std::isspace(static_cast<unsigned char>(cmdline[start]))) {
    ++start;
  }
  std::size_t end = start;
  while (end < cmdline.size() && !std::isspace(static_cast<unsigned char>(cmdline[end]))) {
    ++end;
  }

  const std::string_view EXE = cmdline.substr(start, end - start);
  const std::size_t SLASH = EXE.rfind('/');
  if (SLASH == std::string_view::npos || SLASH + 1 == EXE.size()) {
    return std::string(cmdline.substr(start));
  }
  return std::string(cmdline.substr(start + SLASH + 1));
}

/* ------------------------ Synchronization Primitives ------------------------ */

/**
 * @brief Start-line gate so that several threads begin work together.
 *
 * Each thread calls start() and spins; the coordinating thread calls
 * releaseWhenAllReady() once everyone has arrived.
 *
 * @note RT-safe (lock-free atomics, yields while waiting).
 */
class StartGate {
public:
  explicit StartGate(int total) noexcept : total_(total) {}

  void start() noexcept {
    ready_.fetch_add(1, std::memory_order_acq_rel);
    while (!go_.load(std::memory_order_acquire)) {
      std::this_thread::yield();
    }
  }

  void releaseWhenAllReady() noexcept {
    while (ready_.load(std::memory_order_acquire) < total_) {
      std::this_thread::yield();
    }
    go_.store(true, std::memory_order_release);
  }

private:
  int total_;
  std::atomic<int> ready_{0};
  std::atomic<bool> go_{false};
};

} // namespace trend
} // namespace benchtrend

#endif // BENCHTREND_TRENDUTILS_HPP
