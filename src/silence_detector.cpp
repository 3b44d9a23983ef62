/**
 * @file silence_detector.cpp
 * @brief Windowed silence detection implementation
 */

#include "voicesync/silence_detector.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include "voicesync/logging.hpp"

namespace voicesync {

double rms_dbfs(const float *samples, size_t count) {
  if (count == 0)
    return -std::numeric_limits<double>::infinity();

  double sum_sq = 0.0;
  for (size_t i = 0; i < count; ++i) {
    const double s = samples[i];
    sum_sq += s * s;
  }
  const double mean_sq = sum_sq / static_cast<double>(count);
  if (mean_sq <= 0.0)
    return -std::numeric_limits<double>::infinity();

  /// 20*log10(rms) == 10*log10(mean square)
  return 10.0 * std::log10(mean_sq);
}

ErrorCode detect_silence(const AudioTrack &track, const SilenceParams &params,
                         std::vector<SilenceInterval> &intervals) {
  intervals.clear();

  if (!(params.window_sec > 0.0) || params.min_silence_sec < 0.0) {
    LOG_ERROR("Invalid silence parameters (window {}s, min {}s)",
              params.window_sec, params.min_silence_sec);
    return ErrorCode::InvalidInput;
  }
  if (track.empty())
    return ErrorCode::Ok;

  const size_t n = track.samples.size();
  const double rate = static_cast<double>(track.sample_rate);
  const size_t window = std::max<size_t>(
      1, static_cast<size_t>(std::llround(params.window_sec * rate)));

  /// Keep runs that are at least min_silence_sec long (minus rounding slack)
  const double min_len = params.min_silence_sec - 1e-9;

  bool in_run = false;
  size_t run_start = 0;

  auto close_run = [&](size_t run_end) {
    const double start = run_start / rate;
    const double end = run_end / rate;
    if (end > start && end - start >= min_len) {
      intervals.push_back({start, end});
    }
  };

  for (size_t pos = 0; pos < n; pos += window) {
    const size_t count = std::min(window, n - pos);
    const bool silent =
        rms_dbfs(track.samples.data() + pos, count) < params.threshold_db;

    if (silent && !in_run) {
      in_run = true;
      run_start = pos;
    } else if (!silent && in_run) {
      in_run = false;
      close_run(pos);
    }
  }
  if (in_run)
    close_run(n);

  if (intervals.empty() && track.duration() > params.min_silence_sec) {
    return ErrorCode::SilenceDetectionInconclusive;
  }
  return ErrorCode::Ok;
}

std::vector<TimeSegment>
invert_intervals(const std::vector<SilenceInterval> &silences,
                 double duration) {
  std::vector<TimeSegment> voiced;
  double cursor = 0.0;

  for (const auto &s : silences) {
    const double gap_end = std::min(s.start, duration);
    if (gap_end > cursor)
      voiced.push_back({cursor, gap_end});
    cursor = std::max(cursor, s.end);
    if (cursor >= duration)
      break;
  }
  if (cursor < duration)
    voiced.push_back({cursor, duration});

  return voiced;
}

} // namespace voicesync
