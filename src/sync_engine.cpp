/**
 * @file sync_engine.cpp
 * @brief Engine step implementations
 */

#include "voicesync/sync_engine.hpp"

#include "voicesync/logging.hpp"
#include "voicesync/phrase_segmenter.hpp"
#include "voicesync/silence_detector.hpp"
#include "voicesync/timing_map_builder.hpp"
#include "voicesync/word_time_estimator.hpp"

namespace voicesync {

ErrorCode adjust_audio(const AudioTrack &raw, double target_duration,
                       const EngineConfig &cfg, MediaToolkit &toolkit,
                       const std::string &scratch_dir, SyncResult &result) {
  TIMER_START(adjust_audio);

  result.raw_duration = raw.duration();
  result.target_duration = target_duration;

  ErrorCode rc = reconcile_duration(raw, target_duration, cfg.reconcile,
                                    toolkit, scratch_dir, result.audio,
                                    &result.plan);

  TIMER_END(adjust_audio);
  return rc;
}

ErrorCode analyze_silence(const EngineConfig &cfg, SyncResult &result) {
  TIMER_START(silence);

  ErrorCode rc = detect_silence(result.audio, cfg.silence, result.silences);
  result.silence_inconclusive =
      (rc == ErrorCode::SilenceDetectionInconclusive);

  TIMER_END(silence);

  if (is_fatal(rc))
    return rc;
  if (result.silence_inconclusive) {
    LOG_WARN("No silence below {:.0f}dB in {:.2f}s of audio; phrases will "
             "follow the readability caps only",
             cfg.silence.threshold_db, result.audio.duration());
    return ErrorCode::Ok;
  }

  LOG_INFO("Found {} silent interval(s)", result.silences.size());
  return ErrorCode::Ok;
}

ErrorCode build_timing(const std::vector<std::string> &script_lines,
                       const EngineConfig &cfg, SyncResult &result) {
  TIMER_START(build_timing);

  const double duration = result.audio.duration();

  result.tokens = tokenize_script(script_lines);
  ErrorCode rc = estimate_word_times(result.tokens, duration, cfg.estimator,
                                     result.silences);
  if (rc != ErrorCode::Ok)
    return rc;

  std::vector<Phrase> phrases;
  rc = segment_phrases(result.tokens, result.silences, cfg.segmenter, phrases);
  if (rc != ErrorCode::Ok)
    return rc;

  rc = build_timing_map(phrases, duration, cfg.timing, result.timing);
  if (rc != ErrorCode::Ok)
    return rc;

  TIMER_END(build_timing);

  LOG_INFO("{} word(s) in {} phrase(s)", result.tokens.size(),
           result.timing.phrases.size());
  return ErrorCode::Ok;
}

ErrorCode align_voiceover(const AudioTrack &raw,
                          const std::vector<std::string> &script_lines,
                          double target_duration, const EngineConfig &cfg,
                          MediaToolkit &toolkit,
                          const std::string &scratch_dir, SyncResult &result) {
  ErrorCode rc =
      adjust_audio(raw, target_duration, cfg, toolkit, scratch_dir, result);
  if (rc != ErrorCode::Ok)
    return rc;

  rc = analyze_silence(cfg, result);
  if (rc != ErrorCode::Ok)
    return rc;

  return build_timing(script_lines, cfg, result);
}

} // namespace voicesync
