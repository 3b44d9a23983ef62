/**
 * @file sync_engine.hpp
 * @brief The timing engine proper: raw voiceover + script -> timing map
 *
 * @details Three steps, each usable on its own so a caller can observe and
 *          cancel between them:
 *
 *          1. adjust_audio: reconcile the raw track to the target duration
 *
 *          2. analyze_silence: silence intervals of the adjusted track
 *
 *          3. build_timing: word times, phrases and the validated map
 *
 *          align_voiceover runs all three.
 *
 * @note Silence analysis runs on the adjusted track, so every time in the
 *       map is in the coordinates of the audio that ships with the clip.
 */

#ifndef VOICESYNC_SYNC_ENGINE_HPP
#define VOICESYNC_SYNC_ENGINE_HPP

#include <string>
#include <vector>

#include "config.hpp"
#include "duration_reconciler.hpp"
#include "errors.hpp"
#include "media_toolkit.hpp"
#include "types.hpp"

namespace voicesync {

/**
 * @struct SyncResult
 * @brief Everything the engine produced for one voiceover.
 */
struct SyncResult {
  double raw_duration = 0.0;
  double target_duration = 0.0;
  ReconcilePlan plan;
  AudioTrack audio;                      //< Reconciled track
  std::vector<SilenceInterval> silences; //< Of the reconciled track
  bool silence_inconclusive = false;     //< No silence found at all
  std::vector<ScriptToken> tokens;
  TimingMap timing;
};

/**
 * @brief Step 1: bring the raw track to the target duration.
 * @return Ok, DurationUnreconcilable, InvalidInput or ToolkitFailure
 */
ErrorCode adjust_audio(const AudioTrack &raw, double target_duration,
                       const EngineConfig &cfg, MediaToolkit &toolkit,
                       const std::string &scratch_dir, SyncResult &result);

/**
 * @brief Step 2: silence intervals of result.audio.
 * @note An inconclusive scan is not an error: it is logged, flagged in the
 *       result, and segmentation falls back to the readability caps.
 * @return Ok or InvalidInput
 */
ErrorCode analyze_silence(const EngineConfig &cfg, SyncResult &result);

/**
 * @brief Step 3: timed words, phrases and the final map.
 * @param script_lines Script lines in reading order
 * @return Ok, InvalidInput or InvalidTimingMap
 */
ErrorCode build_timing(const std::vector<std::string> &script_lines,
                       const EngineConfig &cfg, SyncResult &result);

/**
 * @brief All three steps.
 */
ErrorCode align_voiceover(const AudioTrack &raw,
                          const std::vector<std::string> &script_lines,
                          double target_duration, const EngineConfig &cfg,
                          MediaToolkit &toolkit,
                          const std::string &scratch_dir, SyncResult &result);

} // namespace voicesync

#endif // VOICESYNC_SYNC_ENGINE_HPP
