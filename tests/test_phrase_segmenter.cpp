/**
 * @file test_phrase_segmenter.cpp
 * @brief Phrase segmentation with hysteresis and readability caps
 */

#include <algorithm>
#include <random>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "voicesync/phrase_segmenter.hpp"
#include "voicesync/word_time_estimator.hpp"

using namespace voicesync;

namespace {

std::vector<ScriptToken> timed(const std::vector<std::string> &lines,
                               double duration) {
  auto tokens = tokenize_script(lines);
  EXPECT_EQ(estimate_word_times(tokens, duration, EstimatorParams{}),
            ErrorCode::Ok);
  return tokens;
}

std::string joined_words(const std::vector<Phrase> &phrases) {
  std::string all;
  for (const auto &p : phrases) {
    if (!all.empty())
      all += ' ';
    all += p.text;
  }
  return all;
}

std::string joined_words(const std::vector<ScriptToken> &tokens) {
  std::string all;
  for (const auto &t : tokens) {
    if (!all.empty())
      all += ' ';
    all += t.text;
  }
  return all;
}

/// "w00 w01 ..." with equal lengths, so word k starts at k * step
std::vector<std::string> numbered_words(int count) {
  std::string line;
  for (int i = 0; i < count; ++i) {
    if (i > 0)
      line += ' ';
    line += (i < 10 ? "w0" : "w") + std::to_string(i);
  }
  return {line};
}

} // namespace

TEST(SegmentPhrases, ShortPauseKeepsOnePhrase) {
  auto tokens = timed({"The quick brown fox jumps"}, 5.0);
  std::vector<Phrase> phrases;
  ASSERT_EQ(segment_phrases(tokens, {{2.0, 2.15}}, SegmenterParams{}, phrases),
            ErrorCode::Ok);
  ASSERT_EQ(phrases.size(), 1u);
  EXPECT_DOUBLE_EQ(phrases[0].start, 0.0);
  EXPECT_DOUBLE_EQ(phrases[0].end, 5.0);
  EXPECT_EQ(phrases[0].text, "The quick brown fox jumps");
}

TEST(SegmentPhrases, HardBreakSplitsAtSilenceStart) {
  auto tokens = timed({"The quick brown fox jumps"}, 5.0);
  std::vector<Phrase> phrases;
  ASSERT_EQ(segment_phrases(tokens, {{2.0, 2.6}}, SegmenterParams{}, phrases),
            ErrorCode::Ok);
  ASSERT_EQ(phrases.size(), 2u);
  EXPECT_DOUBLE_EQ(phrases[0].end, 2.0);
  EXPECT_DOUBLE_EQ(phrases[1].start, 2.6);
  EXPECT_EQ(joined_words(phrases), "The quick brown fox jumps");
}

TEST(SegmentPhrases, SilenceAfterLastWordDoesNotSplit) {
  auto tokens = timed({"one two three"}, 3.0);
  std::vector<Phrase> phrases;
  ASSERT_EQ(segment_phrases(tokens, {{2.5, 3.0}}, SegmenterParams{}, phrases),
            ErrorCode::Ok);
  EXPECT_EQ(phrases.size(), 1u);
}

TEST(SegmentPhrases, LeadingSilenceDelaysFirstPhrase) {
  auto tokens = timed({"one two three four"}, 4.0);
  std::vector<Phrase> phrases;
  ASSERT_EQ(segment_phrases(tokens, {{0.0, 0.5}}, SegmenterParams{}, phrases),
            ErrorCode::Ok);
  ASSERT_EQ(phrases.size(), 1u);
  EXPECT_DOUBLE_EQ(phrases[0].start, 0.5);
  EXPECT_EQ(phrases[0].words.size(), 4u);
}

TEST(SegmentPhrases, WordCapLimitsPhraseSize) {
  auto tokens = timed(numbered_words(20), 10.0);
  SegmenterParams params;
  params.max_phrase_words = 8;

  std::vector<Phrase> phrases;
  ASSERT_EQ(segment_phrases(tokens, {}, params, phrases), ErrorCode::Ok);
  ASSERT_EQ(phrases.size(), 3u);
  for (const auto &p : phrases)
    EXPECT_LE(p.words.size(), 8u);
  EXPECT_EQ(joined_words(phrases), joined_words(tokens));
}

TEST(SegmentPhrases, DurationCapLimitsScreenTime) {
  auto tokens = timed(numbered_words(30), 20.0);
  SegmenterParams params;
  params.max_phrase_words = 100;
  params.max_phrase_sec = 3.0;

  std::vector<Phrase> phrases;
  ASSERT_EQ(segment_phrases(tokens, {}, params, phrases), ErrorCode::Ok);
  EXPECT_GT(phrases.size(), 1u);
  for (const auto &p : phrases)
    EXPECT_LE(p.length(), params.max_phrase_sec + 1e-9);
  EXPECT_EQ(joined_words(phrases), joined_words(tokens));
}

TEST(SegmentPhrases, CapBoundaryNeverLandsInsideSoftPause) {
  /// Ten words of 0.5s; the word cap wants to cut at 2.0s, inside the pause
  auto tokens = timed(numbered_words(10), 5.0);
  SegmenterParams params;
  params.max_phrase_words = 4;
  const SilenceInterval pause{1.9, 2.1};

  std::vector<Phrase> phrases;
  ASSERT_EQ(segment_phrases(tokens, {pause}, params, phrases), ErrorCode::Ok);
  ASSERT_GT(phrases.size(), 1u);
  for (const auto &p : phrases) {
    EXPECT_FALSE(p.start > pause.start && p.start < pause.end) << p.start;
    EXPECT_FALSE(p.end > pause.start && p.end < pause.end) << p.end;
  }
}

TEST(SegmentPhrases, LineChangeInsidePauseAtPhraseStartIsDeferred) {
  /// w0..w7 fill [0, 4.0); the cap before "aa" moves the cut back to the
  /// pause start, so the next phrase begins exactly where the pause does.
  /// "bb" opens a new line but lies wholly inside the pause.
  std::vector<ScriptToken> tokens;
  for (int i = 0; i < 8; ++i)
    tokens.push_back({"w" + std::to_string(i), 0.5 * i, 0.5 * (i + 1), i, 0});
  tokens.push_back({"aa", 4.0, 4.16, 8, 0});
  tokens.push_back({"bb", 4.16, 4.18, 9, 1});
  tokens.push_back({"cc", 4.18, 5.0, 10, 1});
  tokens.push_back({"dd", 5.0, 6.0, 11, 1});
  const SilenceInterval pause{3.95, 4.2};

  std::vector<Phrase> phrases;
  ASSERT_EQ(segment_phrases(tokens, {pause}, SegmenterParams{}, phrases),
            ErrorCode::Ok);
  ASSERT_EQ(phrases.size(), 3u);
  EXPECT_DOUBLE_EQ(phrases[0].end, 3.95);
  EXPECT_EQ(phrases[1].text, "aa bb");
  EXPECT_DOUBLE_EQ(phrases[1].start, 3.95);
  EXPECT_DOUBLE_EQ(phrases[1].end, 4.2);
  EXPECT_EQ(phrases[2].text, "cc dd");
  EXPECT_DOUBLE_EQ(phrases[2].start, 4.2);
}

TEST(SegmentPhrases, NoBoundaryInsideSoftPausesAcrossLayouts) {
  std::mt19937 rng(20240611);
  std::uniform_real_distribution<double> word_len(0.02, 0.6);
  std::uniform_real_distribution<double> spacing(0.2, 1.5);
  std::uniform_real_distribution<double> soft_len(0.05, 0.28);
  std::uniform_real_distribution<double> hard_len(0.3, 0.8);
  std::uniform_real_distribution<double> coin(0.0, 1.0);

  SegmenterParams params;
  params.max_phrase_sec = 100.0;

  for (int round = 0; round < 2000; ++round) {
    std::vector<ScriptToken> tokens;
    double t = 0.0;
    int line = 0;
    const int count = 4 + round % 40;
    for (int i = 0; i < count; ++i) {
      if (i > 0 && coin(rng) < 0.15)
        ++line;
      const double len = word_len(rng);
      tokens.push_back({"w" + std::to_string(i), t, t + len, i, line});
      t += len;
    }
    const double total = t;

    std::vector<SilenceInterval> silences;
    double at = spacing(rng);
    while (at < total) {
      const double len = coin(rng) < 0.7 ? soft_len(rng) : hard_len(rng);
      silences.push_back({at, std::min(total, at + len)});
      at += len + spacing(rng);
    }

    std::vector<Phrase> phrases;
    ASSERT_EQ(segment_phrases(tokens, silences, params, phrases),
              ErrorCode::Ok);
    ASSERT_EQ(joined_words(phrases), joined_words(tokens)) << round;

    for (size_t i = 0; i < phrases.size(); ++i) {
      if (i > 0)
        EXPECT_GE(phrases[i].start, phrases[i - 1].end - 1e-9) << round;
      for (const auto &s : silences) {
        if (s.length() >= params.hard_break_sec)
          continue;
        EXPECT_FALSE(phrases[i].start > s.start + 1e-9 &&
                     phrases[i].start < s.end - 1e-9)
            << "round " << round << " start " << phrases[i].start;
        EXPECT_FALSE(phrases[i].end > s.start + 1e-9 &&
                     phrases[i].end < s.end - 1e-9)
            << "round " << round << " end " << phrases[i].end;
      }
    }
  }
}

TEST(SegmentPhrases, ScriptLinesStartNewPhrases) {
  auto tokens = timed({"first line here", "second line"}, 5.0);
  std::vector<Phrase> phrases;
  ASSERT_EQ(segment_phrases(tokens, {}, SegmenterParams{}, phrases),
            ErrorCode::Ok);
  ASSERT_EQ(phrases.size(), 2u);
  EXPECT_EQ(phrases[0].text, "first line here");
  EXPECT_EQ(phrases[1].text, "second line");
  EXPECT_EQ(phrases[1].words.front().ordinal, 3);
  EXPECT_DOUBLE_EQ(phrases[0].end, phrases[1].start);

  SegmenterParams flat;
  flat.break_on_lines = false;
  ASSERT_EQ(segment_phrases(tokens, {}, flat, phrases), ErrorCode::Ok);
  EXPECT_EQ(phrases.size(), 1u);
}

TEST(SegmentPhrases, HighlightOffsetsStayInsidePhrase) {
  auto tokens = timed({"The quick brown fox jumps over the lazy dog"}, 6.0);
  std::vector<Phrase> phrases;
  ASSERT_EQ(segment_phrases(tokens, {{2.0, 2.5}}, SegmenterParams{}, phrases),
            ErrorCode::Ok);
  for (const auto &p : phrases) {
    EXPECT_GT(p.end, p.start);
    double prev = 0.0;
    for (const auto &w : p.words) {
      EXPECT_GE(w.offset, prev);
      EXPECT_LE(w.offset, p.length());
      prev = w.offset;
    }
  }
}

TEST(SegmentPhrases, RejectsInvalidParameters) {
  auto tokens = timed({"hello world"}, 1.0);
  SegmenterParams bad;
  bad.max_phrase_words = 0;
  std::vector<Phrase> phrases;
  EXPECT_EQ(segment_phrases(tokens, {}, bad, phrases),
            ErrorCode::InvalidInput);
}
