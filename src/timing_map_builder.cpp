/**
 * @file timing_map_builder.cpp
 * @brief Timing map construction, validation and serialization
 */

#include "voicesync/timing_map_builder.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>

#include <fmt/core.h>

#include "voicesync/logging.hpp"
#include "voicesync/word_time_estimator.hpp"

namespace voicesync {

namespace {

constexpr double TIME_EPS = 1e-9;

} // namespace

int64_t to_ms(double seconds) {
  return static_cast<int64_t>(std::llround(seconds * 1000.0));
}

bool validate_timing_map(const TimingMap &map, std::string &reason) {
  if (map.phrases.empty())
    return true;

  if (!(map.track_duration > 0.0)) {
    reason = "phrases present but track duration is not positive";
    return false;
  }

  double prev_end = 0.0;
  int prev_ordinal = -1;

  for (size_t i = 0; i < map.phrases.size(); ++i) {
    const Phrase &p = map.phrases[i];

    if (p.words.empty()) {
      reason = fmt::format("phrase {} has no words", i);
      return false;
    }
    if (split_words(p.text).size() != p.words.size()) {
      reason = fmt::format("phrase {} text does not match its {} words", i,
                           p.words.size());
      return false;
    }
    if (!(p.end > p.start)) {
      reason = fmt::format("phrase {} ends at {:.3f}s before it starts at "
                           "{:.3f}s",
                           i, p.end, p.start);
      return false;
    }
    if (p.start < -TIME_EPS || p.end > map.track_duration + TIME_EPS) {
      reason = fmt::format("phrase {} [{:.3f}, {:.3f}] outside track [0, "
                           "{:.3f}]",
                           i, p.start, p.end, map.track_duration);
      return false;
    }
    if (i > 0 && p.start < prev_end - TIME_EPS) {
      reason = fmt::format("phrase {} starts at {:.3f}s, overlapping the "
                           "previous phrase ending at {:.3f}s",
                           i, p.start, prev_end);
      return false;
    }

    double prev_offset = 0.0;
    for (const auto &w : p.words) {
      if (w.offset < -TIME_EPS || w.offset > p.length() + TIME_EPS ||
          w.offset < prev_offset - TIME_EPS) {
        reason = fmt::format("phrase {} word {} has offset {:.3f}s outside "
                             "[{:.3f}, {:.3f}]",
                             i, w.ordinal, w.offset, prev_offset, p.length());
        return false;
      }
      if (w.ordinal <= prev_ordinal) {
        reason = fmt::format("word ordinal {} follows {}", w.ordinal,
                             prev_ordinal);
        return false;
      }
      prev_offset = w.offset;
      prev_ordinal = w.ordinal;
    }
    prev_end = p.end;
  }
  return true;
}

ErrorCode build_timing_map(const std::vector<Phrase> &phrases,
                           double track_duration, const TimingParams &params,
                           TimingMap &map) {
  TimingMap result;
  result.track_duration = track_duration;
  result.phrases = phrases;

  if (!result.phrases.empty()) {
    // **---- CLIP FIRST START TO 0 ----**

    Phrase &first = result.phrases.front();
    if (first.start < 0.0) {
      if (first.start < -params.tolerance_sec) {
        LOG_ERROR("Timing map defect: first phrase starts at {:.3f}s",
                  first.start);
        return ErrorCode::InvalidTimingMap;
      }
      for (auto &w : first.words)
        w.offset = std::max(0.0, w.offset + first.start);
      first.start = 0.0;
    }

    // **---- CLIP LAST END TO THE TRACK ----**

    Phrase &last = result.phrases.back();
    if (last.end > track_duration) {
      if (last.end > track_duration + params.tolerance_sec) {
        LOG_ERROR("Timing map defect: last phrase ends at {:.3f}s, track is "
                  "{:.3f}s",
                  last.end, track_duration);
        return ErrorCode::InvalidTimingMap;
      }
      last.end = track_duration;
      for (auto &w : last.words)
        w.offset = std::min(w.offset, last.length());
    }
  }

  std::string reason;
  if (!validate_timing_map(result, reason)) {
    LOG_ERROR("Timing map defect: {}", reason);
    return ErrorCode::InvalidTimingMap;
  }

  map = std::move(result);
  return ErrorCode::Ok;
}

std::vector<Cue> to_cues(const TimingMap &map) {
  std::vector<Cue> cues;

  for (const auto &p : map.phrases) {
    std::vector<int64_t> offsets_ms;
    offsets_ms.reserve(p.words.size());
    for (const auto &w : p.words)
      offsets_ms.push_back(to_ms(w.offset));

    for (size_t i = 0; i < p.words.size(); ++i) {
      const double start = (i == 0) ? p.start : p.start + p.words[i].offset;
      const double end =
          (i + 1 < p.words.size()) ? p.start + p.words[i + 1].offset : p.end;

      Cue cue;
      cue.start_ms = to_ms(start);
      cue.end_ms = to_ms(end);
      if (cue.end_ms <= cue.start_ms)
        continue;
      cue.text = p.text;
      cue.highlighted_word_index = static_cast<int>(i);
      cue.word_ordinal = p.words[i].ordinal;
      cue.word_highlight_offsets_ms = offsets_ms;
      cues.push_back(std::move(cue));
    }
  }
  return cues;
}

nlohmann::json cue_to_json(const Cue &cue) {
  return nlohmann::json{
      {"start_ms", cue.start_ms},
      {"end_ms", cue.end_ms},
      {"text", cue.text},
      {"highlighted_word_index", cue.highlighted_word_index},
      {"word_ordinal", cue.word_ordinal},
      {"word_highlight_offsets_ms", cue.word_highlight_offsets_ms}};
}

nlohmann::json cues_to_json(const std::vector<Cue> &cues) {
  auto doc = nlohmann::json::array();
  for (const auto &cue : cues)
    doc.push_back(cue_to_json(cue));
  return doc;
}

nlohmann::json timing_map_to_json(const TimingMap &map) {
  nlohmann::json doc;
  doc["track_duration_ms"] = to_ms(map.track_duration);

  auto phrases = nlohmann::json::array();
  for (const auto &p : map.phrases) {
    auto words = nlohmann::json::array();
    for (const auto &w : p.words)
      words.push_back({{"ordinal", w.ordinal}, {"offset_ms", to_ms(w.offset)}});
    phrases.push_back({{"start_ms", to_ms(p.start)},
                       {"end_ms", to_ms(p.end)},
                       {"text", p.text},
                       {"words", std::move(words)}});
  }
  doc["phrases"] = std::move(phrases);

  doc["cues"] = cues_to_json(to_cues(map));

  return doc;
}

ErrorCode write_timing_map_json(const TimingMap &map, const std::string &path) {
  std::ofstream out(path);
  if (!out) {
    LOG_ERROR("Failed to open {} for writing", path);
    return ErrorCode::IoFailure;
  }
  out << timing_map_to_json(map).dump(2) << '\n';
  if (!out) {
    LOG_ERROR("Failed to write timing map to {}", path);
    return ErrorCode::IoFailure;
  }
  return ErrorCode::Ok;
}

} // namespace voicesync
