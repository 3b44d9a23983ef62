/**
 * @file word_time_estimator.cpp
 * @brief Word timing estimation implementation
 */

#include "voicesync/word_time_estimator.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <utility>

#include "voicesync/logging.hpp"
#include "voicesync/silence_detector.hpp"

namespace voicesync {

namespace {

/// Length weight of a word; every word gets at least one unit
double word_weight(const ScriptToken &t) {
  return static_cast<double>(std::max<size_t>(1, utf8_length(t.text)));
}

/**
 * @brief Split [start, end] between tokens[first, last) by length.
 * @note The final token ends exactly at end.
 */
void distribute_by_length(std::vector<ScriptToken> &tokens, size_t first,
                          size_t last, double start, double end) {
  double total = 0.0;
  for (size_t i = first; i < last; ++i)
    total += word_weight(tokens[i]);

  const double span = end - start;
  double cumulative = 0.0;
  for (size_t i = first; i < last; ++i) {
    tokens[i].start = (i == first) ? start : tokens[i - 1].end;
    cumulative += word_weight(tokens[i]);
    tokens[i].end = (i + 1 == last) ? end : start + span * cumulative / total;
  }
}

void estimate_voiced(std::vector<ScriptToken> &tokens, double duration,
                     const std::vector<TimeSegment> &regions) {
  double voiced_total = 0.0;
  for (const auto &r : regions)
    voiced_total += r.end - r.start;

  const size_t n = tokens.size();
  size_t next = 0;

  for (size_t r = 0; r < regions.size() && next < n; ++r) {
    const auto &region = regions[r];
    size_t count;
    if (r + 1 == regions.size()) {
      count = n - next;
    } else {
      const double share = (region.end - region.start) / voiced_total;
      count = static_cast<size_t>(std::llround(share * static_cast<double>(n)));
      count = std::min(count, n - next);
    }
    if (count == 0)
      continue;

    distribute_by_length(tokens, next, next + count, region.start, region.end);
    next += count;
  }

  /// Close the gaps left by the silences: each token runs until the next one
  tokens.front().start = 0.0;
  for (size_t i = 0; i + 1 < n; ++i)
    tokens[i].end = tokens[i + 1].start;
  tokens.back().end = duration;
}

} // namespace

bool parse_word_timing_mode(const std::string &name, WordTimingMode &mode) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lower == "chars" || lower == "characters") {
    mode = WordTimingMode::CharacterProportional;
    return true;
  }
  if (lower == "voiced") {
    mode = WordTimingMode::VoicedRegions;
    return true;
  }
  return false;
}

std::vector<std::string> split_words(const std::string &text) {
  std::vector<std::string> words;
  std::string current;
  for (unsigned char c : text) {
    if (std::isspace(c)) {
      if (!current.empty()) {
        words.push_back(std::move(current));
        current.clear();
      }
    } else {
      current.push_back(static_cast<char>(c));
    }
  }
  if (!current.empty())
    words.push_back(std::move(current));
  return words;
}

size_t utf8_length(const std::string &word) {
  size_t count = 0;
  for (unsigned char c : word) {
    /// Continuation bytes look like 10xxxxxx
    if ((c & 0xC0) != 0x80)
      ++count;
  }
  return count;
}

std::vector<ScriptToken>
tokenize_script(const std::vector<std::string> &lines) {
  std::vector<ScriptToken> tokens;
  int ordinal = 0;
  for (size_t line = 0; line < lines.size(); ++line) {
    for (auto &word : split_words(lines[line])) {
      ScriptToken t;
      t.text = std::move(word);
      t.ordinal = ordinal++;
      t.line = static_cast<int>(line);
      tokens.push_back(std::move(t));
    }
  }
  return tokens;
}

ErrorCode estimate_word_times(std::vector<ScriptToken> &tokens,
                              double duration, const EstimatorParams &params,
                              const std::vector<SilenceInterval> &silences) {
  if (tokens.empty())
    return ErrorCode::Ok;

  if (!(duration > 0.0)) {
    LOG_ERROR("Cannot time {} words over a {:.3f}s track", tokens.size(),
              duration);
    return ErrorCode::InvalidInput;
  }

  if (params.mode == WordTimingMode::VoicedRegions && !silences.empty()) {
    auto regions = invert_intervals(silences, duration);
    if (!regions.empty()) {
      estimate_voiced(tokens, duration, regions);
      return ErrorCode::Ok;
    }
    LOG_WARN("Track is entirely silent, falling back to length-proportional "
             "word timing");
  }

  distribute_by_length(tokens, 0, tokens.size(), 0.0, duration);
  return ErrorCode::Ok;
}

} // namespace voicesync
