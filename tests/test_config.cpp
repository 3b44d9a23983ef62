/**
 * @file test_config.cpp
 * @brief Environment-driven engine configuration
 */

#include <cstdlib>

#include <gtest/gtest.h>

#include "voicesync/config.hpp"

using namespace voicesync;

namespace {

const char *const VARIABLES[] = {
    "STRETCH_MIN",      "STRETCH_MAX",         "EXTENDED_MIN",
    "EXTENDED_MAX",     "DURATION_TOLERANCE_SEC", "SILENCE_THRESHOLD_DB",
    "MIN_SILENCE_SEC",  "ANALYSIS_WINDOW_SEC", "HARD_BREAK_SEC",
    "MAX_PHRASE_SEC",   "MAX_PHRASE_WORDS",    "BREAK_ON_LINES",
    "WORD_TIMING_MODE", "MAX_PARALLEL_IDEAS",  "SYNTH_RETRIES",
    "SYNTH_BACKOFF_SEC", "TOOLKIT_RETRIES",    "TOOLKIT_BACKOFF_SEC",
    "TTS_COMMAND",      "FFMPEG_BIN",          "KEEP_SCRATCH"};

class ConfigTest : public ::testing::Test {
protected:
  void SetUp() override { clear(); }
  void TearDown() override { clear(); }

  static void clear() {
    for (const char *name : VARIABLES)
      unsetenv(name);
  }
};

} // namespace

TEST_F(ConfigTest, DefaultsWhenUnset) {
  const EngineConfig cfg = Config::load_engine_config();
  EXPECT_DOUBLE_EQ(cfg.reconcile.stretch_min, 0.85);
  EXPECT_DOUBLE_EQ(cfg.reconcile.stretch_max, 1.25);
  EXPECT_DOUBLE_EQ(cfg.reconcile.extended_min, 0.70);
  EXPECT_DOUBLE_EQ(cfg.reconcile.extended_max, 1.60);
  EXPECT_DOUBLE_EQ(cfg.reconcile.tolerance_sec, 0.020);
  EXPECT_DOUBLE_EQ(cfg.silence.threshold_db, -40.0);
  EXPECT_DOUBLE_EQ(cfg.silence.min_silence_sec, 0.2);
  EXPECT_DOUBLE_EQ(cfg.segmenter.hard_break_sec, 0.3);
  EXPECT_EQ(cfg.estimator.mode, WordTimingMode::CharacterProportional);
  EXPECT_EQ(cfg.max_parallel_ideas, 2);
  EXPECT_EQ(cfg.synth_retries, 3);
  EXPECT_DOUBLE_EQ(cfg.synth_backoff_sec, 2.0);
  EXPECT_EQ(cfg.toolkit_retries, 2);
  EXPECT_DOUBLE_EQ(cfg.toolkit_backoff_sec, 1.0);
  EXPECT_EQ(cfg.ffmpeg_bin, "ffmpeg");
  EXPECT_TRUE(cfg.tts_command.empty());
  EXPECT_FALSE(cfg.keep_scratch);
}

TEST_F(ConfigTest, ReadsEveryStage) {
  setenv("STRETCH_MAX", "1.3", 1);
  setenv("DURATION_TOLERANCE_SEC", "0.01", 1);
  setenv("SILENCE_THRESHOLD_DB", "-35", 1);
  setenv("HARD_BREAK_SEC", "0.4", 1);
  setenv("MAX_PHRASE_WORDS", "5", 1);
  setenv("BREAK_ON_LINES", "off", 1);
  setenv("WORD_TIMING_MODE", "voiced", 1);
  setenv("MAX_PARALLEL_IDEAS", "4", 1);
  setenv("TOOLKIT_RETRIES", "4", 1);
  setenv("TOOLKIT_BACKOFF_SEC", "0.25", 1);
  setenv("TTS_COMMAND", "say -o {output} -f {text_file}", 1);
  setenv("KEEP_SCRATCH", "yes", 1);

  const EngineConfig cfg = Config::load_engine_config();
  EXPECT_DOUBLE_EQ(cfg.reconcile.stretch_max, 1.3);
  EXPECT_DOUBLE_EQ(cfg.reconcile.tolerance_sec, 0.01);
  EXPECT_DOUBLE_EQ(cfg.timing.tolerance_sec, 0.01);
  EXPECT_DOUBLE_EQ(cfg.silence.threshold_db, -35.0);
  EXPECT_DOUBLE_EQ(cfg.segmenter.hard_break_sec, 0.4);
  EXPECT_EQ(cfg.segmenter.max_phrase_words, 5);
  EXPECT_FALSE(cfg.segmenter.break_on_lines);
  EXPECT_EQ(cfg.estimator.mode, WordTimingMode::VoicedRegions);
  EXPECT_EQ(cfg.max_parallel_ideas, 4);
  EXPECT_EQ(cfg.toolkit_retries, 4);
  EXPECT_DOUBLE_EQ(cfg.toolkit_backoff_sec, 0.25);
  EXPECT_EQ(cfg.tts_command, "say -o {output} -f {text_file}");
  EXPECT_TRUE(cfg.keep_scratch);
}

TEST_F(ConfigTest, MalformedValuesFallBack) {
  setenv("STRETCH_MIN", "fast", 1);
  setenv("SYNTH_RETRIES", "many", 1);
  setenv("KEEP_SCRATCH", "maybe", 1);
  setenv("WORD_TIMING_MODE", "psychic", 1);

  const EngineConfig cfg = Config::load_engine_config();
  EXPECT_DOUBLE_EQ(cfg.reconcile.stretch_min, 0.85);
  EXPECT_EQ(cfg.synth_retries, 3);
  EXPECT_FALSE(cfg.keep_scratch);
  EXPECT_EQ(cfg.estimator.mode, WordTimingMode::CharacterProportional);
}

TEST_F(ConfigTest, PipelineBoundsAreClamped) {
  setenv("MAX_PARALLEL_IDEAS", "0", 1);
  setenv("SYNTH_RETRIES", "-2", 1);
  setenv("SYNTH_BACKOFF_SEC", "-1", 1);
  setenv("TOOLKIT_RETRIES", "0", 1);
  setenv("TOOLKIT_BACKOFF_SEC", "-0.5", 1);

  const EngineConfig cfg = Config::load_engine_config();
  EXPECT_EQ(cfg.max_parallel_ideas, 1);
  EXPECT_EQ(cfg.synth_retries, 1);
  EXPECT_DOUBLE_EQ(cfg.synth_backoff_sec, 0.0);
  EXPECT_EQ(cfg.toolkit_retries, 1);
  EXPECT_DOUBLE_EQ(cfg.toolkit_backoff_sec, 0.0);
}

TEST_F(ConfigTest, EnvHelpers) {
  EXPECT_DOUBLE_EQ(Config::get_env_double("STRETCH_MIN", 0.5), 0.5);
  setenv("STRETCH_MIN", "0.9", 1);
  EXPECT_DOUBLE_EQ(Config::get_env_double("STRETCH_MIN", 0.5), 0.9);

  setenv("MAX_PHRASE_WORDS", "12", 1);
  EXPECT_EQ(Config::get_env_int("MAX_PHRASE_WORDS", 8), 12);

  EXPECT_EQ(Config::get_env_string("FFMPEG_BIN", "ffmpeg"), "ffmpeg");

  setenv("KEEP_SCRATCH", "TRUE", 1);
  EXPECT_TRUE(Config::get_env_bool("KEEP_SCRATCH", false));
}
