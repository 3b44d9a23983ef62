/**
 * @file silence_detector.hpp
 * @brief Windowed energy scan for silent intervals
 *
 * @details The track is cut into fixed analysis windows. A window whose RMS
 *          level (dBFS) is below the threshold is silent. Runs of silent
 *          windows coalesce into one interval; runs shorter than the minimum
 *          duration are dropped. The scan is deterministic.
 */

#ifndef VOICESYNC_SILENCE_DETECTOR_HPP
#define VOICESYNC_SILENCE_DETECTOR_HPP

#include <cstddef>
#include <vector>

#include "errors.hpp"
#include "types.hpp"

namespace voicesync {

struct SilenceParams {
  double threshold_db = -40.0; //< Windows quieter than this are silent
  double min_silence_sec = 0.2; //< Shorter runs are treated as sound
  double window_sec = 0.010;    //< Analysis window length
};

/**
 * @brief RMS level of a sample range in dBFS.
 * @return -inf for an all-zero range
 */
double rms_dbfs(const float *samples, size_t count);

/**
 * @brief Find the silent intervals of a track.
 *
 * @param track Input track
 * @param params Threshold, minimum duration, window size
 * @param intervals Output: sorted, non-overlapping intervals
 * @return Ok; SilenceDetectionInconclusive when the track is longer than
 *         min_silence_sec but contains no silence; InvalidInput for
 *         non-positive window or negative minimum duration
 */
ErrorCode detect_silence(const AudioTrack &track, const SilenceParams &params,
                         std::vector<SilenceInterval> &intervals);

/**
 * @brief Complement of a silence list within [0, duration].
 * @return Voiced regions, sorted, each with end > start
 */
std::vector<TimeSegment>
invert_intervals(const std::vector<SilenceInterval> &silences,
                 double duration);

} // namespace voicesync

#endif // VOICESYNC_SILENCE_DETECTOR_HPP
