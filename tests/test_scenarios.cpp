/**
 * @file test_scenarios.cpp
 * @brief End-to-end engine runs on synthetic voiceovers
 *
 * @details Each case drives align_voiceover (or a whole batch) with tones
 *          and digital silence, so expected boundaries are known exactly.
 */

#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "test_helpers.hpp"
#include "voicesync/batch_runner.hpp"
#include "voicesync/config.hpp"
#include "voicesync/sync_engine.hpp"
#include "voicesync/timing_map_builder.hpp"

using namespace voicesync;
using namespace voicesync::test;

namespace {

/// One window of the default silence scan
constexpr double WINDOW_SLACK = 0.011;

std::string joined_phrases(const TimingMap &map) {
  std::string all;
  for (const auto &p : map.phrases) {
    if (!all.empty())
      all += ' ';
    all += p.text;
  }
  return all;
}

ClipIdea make_idea(const std::string &title, const std::string &script,
                   double start, double end) {
  ClipIdea idea;
  idea.title = title;
  idea.description = title + " description";
  idea.voice_style = "calm";
  idea.lines.push_back({0.0, end - start, script});
  idea.source_start = start;
  idea.source_end = end;
  return idea;
}

} // namespace

TEST(Scenario, LongVoiceoverIsStretchedOntoTheSegment) {
  TempDir scratch;
  FakeToolkit toolkit;
  EngineConfig cfg;

  AudioTrack raw = make_tone(12.0);
  SyncResult result;
  ASSERT_EQ(align_voiceover(raw, {"a steady tone with no pauses at all"}, 10.0,
                            cfg, toolkit, scratch.str(), result),
            ErrorCode::Ok);

  EXPECT_DOUBLE_EQ(result.plan.factor, 1.2);
  EXPECT_EQ(result.plan.mode, ReconcileMode::Stretch);
  EXPECT_NEAR(result.audio.duration(), 10.0, 0.020);
  EXPECT_EQ(result.audio.sample_rate, TEST_RATE);
  EXPECT_TRUE(result.silence_inconclusive);

  ASSERT_FALSE(result.timing.phrases.empty());
  EXPECT_LE(result.timing.phrases.back().end, 10.0 + 0.020);
}

TEST(Scenario, BreathKeepsThePhraseOnScreen) {
  TempDir scratch;
  FakeToolkit toolkit;
  EngineConfig cfg;

  AudioTrack raw = make_speech_like(5.0, 2.0, 0.15);
  SyncResult result;
  ASSERT_EQ(align_voiceover(raw, {"The quick brown fox jumps"}, 5.0, cfg,
                            toolkit, scratch.str(), result),
            ErrorCode::Ok);

  EXPECT_EQ(result.plan.mode, ReconcileMode::Passthrough);
  EXPECT_EQ(toolkit.stretch_calls.load(), 0);

  ASSERT_EQ(result.timing.phrases.size(), 1u);
  const Phrase &p = result.timing.phrases[0];
  EXPECT_EQ(p.text, "The quick brown fox jumps");
  EXPECT_DOUBLE_EQ(p.start, 0.0);
  EXPECT_NEAR(p.end, 5.0, 1e-6);
  ASSERT_EQ(p.words.size(), 5u);
  EXPECT_DOUBLE_EQ(p.words[0].offset, 0.0);
}

TEST(Scenario, LongPauseSplitsThePhrase) {
  TempDir scratch;
  FakeToolkit toolkit;
  EngineConfig cfg;

  AudioTrack raw = make_speech_like(5.0, 2.0, 0.6);
  SyncResult result;
  ASSERT_EQ(align_voiceover(raw, {"The quick brown fox jumps"}, 5.0, cfg,
                            toolkit, scratch.str(), result),
            ErrorCode::Ok);

  ASSERT_EQ(result.silences.size(), 1u);
  EXPECT_NEAR(result.silences[0].start, 2.0, WINDOW_SLACK);
  EXPECT_NEAR(result.silences[0].end, 2.6, WINDOW_SLACK);

  ASSERT_EQ(result.timing.phrases.size(), 2u);
  EXPECT_NEAR(result.timing.phrases[0].end, 2.0, WINDOW_SLACK);
  EXPECT_NEAR(result.timing.phrases[1].start, 2.6, WINDOW_SLACK);
  EXPECT_EQ(joined_phrases(result.timing), "The quick brown fox jumps");

  /// No cue covers the pause
  for (const Cue &cue : to_cues(result.timing)) {
    EXPECT_FALSE(cue.start_ms < 2590 && cue.end_ms > 2010)
        << cue.start_ms << "-" << cue.end_ms;
  }
}

TEST(Scenario, DoubleLengthVoiceoverIsRejected) {
  TempDir scratch;
  FakeToolkit toolkit;
  EngineConfig cfg;

  SyncResult result;
  EXPECT_EQ(align_voiceover(make_tone(20.0), {"far too much to say"}, 10.0,
                            cfg, toolkit, scratch.str(), result),
            ErrorCode::DurationUnreconcilable);
  EXPECT_EQ(toolkit.stretch_calls.load(), 0);
  EXPECT_TRUE(result.timing.phrases.empty());
}

TEST(Scenario, RejectedIdeaDoesNotSinkTheBatch) {
  TempDir out;
  FakeToolkit toolkit;
  FakeSynthesizer tts;
  tts.duration_for = [](const std::string &text) {
    return text.find("LONG") != std::string::npos ? 20.0 : 12.0;
  };

  EngineConfig cfg;
  cfg.synth_backoff_sec = 0.0;
  cfg.toolkit_backoff_sec = 0.0;

  std::vector<ClipIdea> ideas = {
      make_idea("First", "one two three four", 0.0, 10.0),
      make_idea("Second", "LONG script that runs on", 20.0, 30.0),
      make_idea("Third", "five six seven eight", 40.0, 50.0)};

  BatchRunner runner(cfg, tts, toolkit, 2);
  auto outcomes = runner.run(ideas, "source.mp4", out.str());

  ASSERT_EQ(outcomes.size(), 3u);
  EXPECT_TRUE(outcomes[0].ok());
  EXPECT_EQ(outcomes[1].code, ErrorCode::DurationUnreconcilable);
  EXPECT_TRUE(outcomes[2].ok());
}
