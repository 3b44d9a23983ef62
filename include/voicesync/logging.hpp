/**
 * @file logging.hpp
 * @brief Logging macros and stage timing collection
 *
 * @details Provides:
 *          - Compile-time controlled logging macros (LOG_INFO, LOG_WARN, etc.)
 *
 *          - Timing measurement macros (TIMER_START, TIMER_END)
 *
 *          - Thread-safe TimingCollector for per-stage durations
 *
 * @note All logs use fmt::print and are flushed immediately so that worker
 *       output interleaves line by line.
 *
 */

#ifndef VOICESYNC_LOGGING_HPP
#define VOICESYNC_LOGGING_HPP

#include <chrono>
#include <cstdio>
#include <mutex>
#include <string>
#include <vector>

#include <fmt/color.h>
#include <fmt/core.h>

namespace voicesync {

// **----- LOGGING CONFIGURATION -----**

/**
 * @brief Logging is controlled by ENABLE_LOGGING at compile time.
 */
#ifndef ENABLE_LOGGING
#define ENABLE_LOGGING 1
#endif

#ifndef ENABLE_TIMING
#define ENABLE_TIMING 1
#endif

/// Global log mutex (defined in logging.cpp)
extern std::mutex log_mutex;

// **----- LOGGING MACROS -----**

#if ENABLE_LOGGING
#define LOG_INFO(format_str, ...)                                              \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(voicesync::log_mutex);                    \
    fmt::print("[INFO] " format_str "\n", ##__VA_ARGS__);                      \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_WARN(format_str, ...)                                              \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(voicesync::log_mutex);                    \
    fmt::print(fg(fmt::color::yellow), "[WARN] " format_str "\n",              \
               ##__VA_ARGS__);                                                 \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_ERROR(format_str, ...)                                             \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(voicesync::log_mutex);                    \
    fmt::print(fg(fmt::color::red), "[ERROR] " format_str "\n",                \
               ##__VA_ARGS__);                                                 \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_PHASE(format_str, ...)                                             \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(voicesync::log_mutex);                    \
    fmt::print(fg(fmt::color::cyan), format_str "\n", ##__VA_ARGS__);          \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_SUCCESS(format_str, ...)                                           \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(voicesync::log_mutex);                    \
    fmt::print(fg(fmt::color::green), format_str "\n", ##__VA_ARGS__);         \
    std::fflush(stdout);                                                       \
  } while (0)
#else
#define LOG_INFO(...) ((void)0)
#define LOG_WARN(...) ((void)0)
#define LOG_ERROR(...) ((void)0)
#define LOG_PHASE(...) ((void)0)
#define LOG_SUCCESS(...) ((void)0)
#endif

// **----- TIMING COLLECTION -----**

/**
 * @brief TimingEntry: A single timing measurement.
 */
struct TimingEntry {
  std::string name;  //< Stage name (the TIMER_START label)
  long microseconds; //< Duration in microseconds
};

/**
 * @brief TimingStat: All measurements of one stage, summed.
 * @note With several ideas per run every stage is timed many times; the
 *       summary reports one row per stage.
 */
struct TimingStat {
  std::string name;
  int calls = 0;
  long total_us = 0;
  long max_us = 0;
};

/**
 * @class TimingCollector
 * @brief Thread-safe collector for stage timings.
 * @note Pipelines running on different workers record here concurrently;
 *       the summary is printed once at the end of a run.
 */
class TimingCollector {
  static std::mutex timing_mutex;
  static std::vector<TimingEntry> entries;

public:
  /**
   * @brief Record a timing measurement.
   * @param name Stage name
   * @param us Duration in microseconds
   */
  static void record(const std::string &name, long us);

  /**
   * @brief Per-stage totals, in order of first appearance.
   */
  static std::vector<TimingStat> totals();

  /**
   * @brief Print the per-stage totals as a formatted table.
   */
  static void print_summary();
};

// **----- TIMING MACROS -----**

#if ENABLE_TIMING
#define TIMER_START(name)                                                      \
  auto timer_start_##name = std::chrono::high_resolution_clock::now()

#define TIMER_END(name)                                                        \
  do {                                                                         \
    auto timer_end_##name = std::chrono::high_resolution_clock::now();         \
    auto timer_duration_##name =                                               \
        std::chrono::duration_cast<std::chrono::microseconds>(                 \
            timer_end_##name - timer_start_##name)                             \
            .count();                                                          \
    voicesync::TimingCollector::record(#name, timer_duration_##name);          \
  } while (0)
#else
#define TIMER_START(name) ((void)0)
#define TIMER_END(name) ((void)0)
#endif

} // namespace voicesync

#endif // VOICESYNC_LOGGING_HPP
