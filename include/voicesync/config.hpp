/**
 * @file config.hpp
 * @brief Configuration management via environment variables
 *
 * @details Provides a Config namespace with helpers that read environment
 *          variables and load_engine_config(), which gathers every tunable
 *          into one EngineConfig record. The record is built once by the
 *          CLI and passed by reference into each pipeline run; engine stages
 *          never read the environment themselves.
 *          See config/voicesync.env for documentation of each parameter.
 *
 */

#ifndef VOICESYNC_CONFIG_HPP
#define VOICESYNC_CONFIG_HPP

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <string>

#include "duration_reconciler.hpp"
#include "logging.hpp"
#include "phrase_segmenter.hpp"
#include "silence_detector.hpp"
#include "timing_map_builder.hpp"
#include "word_time_estimator.hpp"

namespace voicesync {

/**
 * @struct EngineConfig
 * @brief Every tunable of a run, grouped by the stage that consumes it.
 */
struct EngineConfig {
  ReconcileParams reconcile;
  SilenceParams silence;
  EstimatorParams estimator;
  SegmenterParams segmenter;
  TimingParams timing;

  // **---- PIPELINE ----**

  int max_parallel_ideas = 2;     //< Upper bound on concurrent ideas
  int synth_retries = 3;          //< TTS attempts per idea
  double synth_backoff_sec = 2.0; //< First retry delay, doubled each time
  int toolkit_retries = 2;        //< Attempts per cut, stretch, merge, burn
  double toolkit_backoff_sec = 1.0; //< First toolkit retry delay, doubled
  std::string tts_command;        //< CommandSynthesizer template
  std::string ffmpeg_bin = "ffmpeg";
  bool keep_scratch = false;      //< Keep per-idea scratch directories
};

namespace Config {

/**
 * @brief Get a double value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed double value or default (a malformed value is logged)
 */
inline double get_env_double(const char *name, double default_val) {
  const char *val = std::getenv(name);
  if (!val)
    return default_val;
  try {
    return std::stod(val);
  } catch (const std::logic_error &) {
    LOG_WARN("Ignoring malformed {}='{}', using {}", name, val, default_val);
    return default_val;
  }
}

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed integer value or default (a malformed value is logged)
 */
inline int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  if (!val)
    return default_val;
  try {
    return std::stoi(val);
  } catch (const std::logic_error &) {
    LOG_WARN("Ignoring malformed {}='{}', using {}", name, val, default_val);
    return default_val;
  }
}

/// Raw string value, or default_val when unset
inline std::string get_env_string(const char *name,
                                  const std::string &default_val) {
  const char *val = std::getenv(name);
  return val ? std::string(val) : default_val;
}

/// 1/0, true/false, yes/no, on/off (case-insensitive)
inline bool get_env_bool(const char *name, bool default_val) {
  const char *val = std::getenv(name);
  if (!val)
    return default_val;
  std::string s(val);
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (s == "1" || s == "true" || s == "yes" || s == "on")
    return true;
  if (s == "0" || s == "false" || s == "no" || s == "off" || s.empty())
    return false;
  LOG_WARN("Ignoring malformed {}='{}', using {}", name, val, default_val);
  return default_val;
}

/**
 * @brief Build the EngineConfig for this process from the environment.
 * @note Unset variables keep the defaults declared in the parameter structs.
 */
inline EngineConfig load_engine_config() {
  EngineConfig cfg;

  // **---- DURATION RECONCILIATION ----**

  ReconcileParams &r = cfg.reconcile;
  r.stretch_min = get_env_double("STRETCH_MIN", r.stretch_min);
  r.stretch_max = get_env_double("STRETCH_MAX", r.stretch_max);
  r.extended_min = get_env_double("EXTENDED_MIN", r.extended_min);
  r.extended_max = get_env_double("EXTENDED_MAX", r.extended_max);
  r.tolerance_sec = get_env_double("DURATION_TOLERANCE_SEC", r.tolerance_sec);
  cfg.timing.tolerance_sec = r.tolerance_sec;

  // **---- SILENCE ANALYSIS ----**

  SilenceParams &s = cfg.silence;
  s.threshold_db = get_env_double("SILENCE_THRESHOLD_DB", s.threshold_db);
  s.min_silence_sec = get_env_double("MIN_SILENCE_SEC", s.min_silence_sec);
  s.window_sec = get_env_double("ANALYSIS_WINDOW_SEC", s.window_sec);

  // **---- PHRASES ----**

  SegmenterParams &p = cfg.segmenter;
  p.hard_break_sec = get_env_double("HARD_BREAK_SEC", p.hard_break_sec);
  p.max_phrase_sec = get_env_double("MAX_PHRASE_SEC", p.max_phrase_sec);
  p.max_phrase_words = get_env_int("MAX_PHRASE_WORDS", p.max_phrase_words);
  p.break_on_lines = get_env_bool("BREAK_ON_LINES", p.break_on_lines);

  const std::string mode = get_env_string("WORD_TIMING_MODE", "chars");
  if (!parse_word_timing_mode(mode, cfg.estimator.mode)) {
    LOG_WARN("Unknown WORD_TIMING_MODE '{}', using chars", mode);
    cfg.estimator.mode = WordTimingMode::CharacterProportional;
  }

  // **---- PIPELINE ----**

  cfg.max_parallel_ideas =
      std::max(1, get_env_int("MAX_PARALLEL_IDEAS", cfg.max_parallel_ideas));
  cfg.synth_retries =
      std::max(1, get_env_int("SYNTH_RETRIES", cfg.synth_retries));
  cfg.synth_backoff_sec = std::max(
      0.0, get_env_double("SYNTH_BACKOFF_SEC", cfg.synth_backoff_sec));
  cfg.toolkit_retries =
      std::max(1, get_env_int("TOOLKIT_RETRIES", cfg.toolkit_retries));
  cfg.toolkit_backoff_sec = std::max(
      0.0, get_env_double("TOOLKIT_BACKOFF_SEC", cfg.toolkit_backoff_sec));
  cfg.tts_command = get_env_string("TTS_COMMAND", cfg.tts_command);
  cfg.ffmpeg_bin = get_env_string("FFMPEG_BIN", cfg.ffmpeg_bin);
  cfg.keep_scratch = get_env_bool("KEEP_SCRATCH", cfg.keep_scratch);

  return cfg;
}

} // namespace Config
} // namespace voicesync

#endif // VOICESYNC_CONFIG_HPP
