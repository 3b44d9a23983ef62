/**
 * @file logging.cpp
 * @brief Logging and timing utilities implementation
 *
 * @details Provides static member definitions for:
 *          - Global log mutex
 *
 *          - TimingCollector static members and per-stage totals
 */

#include "voicesync/logging.hpp"

#include <algorithm>
#include <cstdio>
#include <unordered_map>

#include <fmt/color.h>
#include <fmt/core.h>

namespace voicesync {

// **----- GLOBAL LOG MUTEX -----**

std::mutex log_mutex;

// **----- TIMING COLLECTOR STATIC MEMBERS -----**

std::mutex TimingCollector::timing_mutex;
std::vector<TimingEntry> TimingCollector::entries;

void TimingCollector::record(const std::string &name, long us) {
  std::lock_guard<std::mutex> lock(timing_mutex);
  entries.push_back({name, us});
}

std::vector<TimingStat> TimingCollector::totals() {
  std::lock_guard<std::mutex> lock(timing_mutex);

  std::vector<TimingStat> stats;
  std::unordered_map<std::string, size_t> slot;
  for (const auto &e : entries) {
    auto it = slot.find(e.name);
    if (it == slot.end()) {
      it = slot.emplace(e.name, stats.size()).first;
      stats.push_back({e.name, 0, 0, 0});
    }
    TimingStat &st = stats[it->second];
    st.calls++;
    st.total_us += e.microseconds;
    st.max_us = std::max(st.max_us, e.microseconds);
  }
  return stats;
}

void TimingCollector::print_summary() {
  const std::vector<TimingStat> stats = totals();
  if (stats.empty())
    return;

  std::lock_guard<std::mutex> log_lock(log_mutex);
  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "======================== TIMING SUMMARY ========================\n");
  fmt::print("{:<24} {:>6} {:>12} {:>10} {:>10}\n", "Stage", "Calls",
             "Total [s]", "Mean [s]", "Max [s]");
  fmt::print("{:-<24} {:->6} {:->12} {:->10} {:->10}\n", "", "", "", "", "");

  for (const auto &st : stats) {
    const double total = st.total_us / 1000000.0;
    fmt::print("{:<24} {:>6} {:>12.2f} {:>10.2f} {:>10.2f}\n", st.name,
               st.calls, total, total / st.calls, st.max_us / 1000000.0);
  }
  fmt::print(fg(fmt::color::cyan),
             "================================================================\n");
  std::fflush(stdout);
}

} // namespace voicesync
