/**
 * @file phrase_segmenter.cpp
 * @brief Phrase segmentation implementation
 *
 * @details Single pass over the tokens. Silences are consumed in order and
 *          attributed to the first token whose end is at or after the
 *          silence start.
 */

#include "voicesync/phrase_segmenter.hpp"

#include <algorithm>
#include <cstddef>
#include <string>

#include "voicesync/logging.hpp"

namespace voicesync {

namespace {

/// Slack for comparing times derived from the same arithmetic
constexpr double TIME_EPS = 1e-9;

/**
 * @class PhraseAccumulator
 * @brief Collects the words of the phrase under construction.
 */
class PhraseAccumulator {
public:
  PhraseAccumulator(const std::vector<ScriptToken> &tokens,
                    const SegmenterParams &params,
                    std::vector<Phrase> &phrases)
      : tokens_(tokens), params_(params), phrases_(phrases) {}

  bool empty() const { return members_.empty(); }
  size_t size() const { return members_.size(); }
  double start() const { return start_; }
  const ScriptToken &last() const { return tokens_[members_.back()]; }

  void set_start(double t) { start_ = t; }
  void add(size_t token_index) { members_.push_back(token_index); }

  /**
   * @brief Emit the current phrase ending at end and clear it.
   * @note The end is clipped to the duration cap. A phrase that would be
   *       empty in time is folded into the previous phrase so no word is
   *       ever lost.
   */
  void close(double end) {
    if (members_.empty())
      return;

    end = std::min(end, start_ + params_.max_phrase_sec);

    if (end <= start_ + TIME_EPS && !phrases_.empty()) {
      LOG_WARN("Folding {} word(s) at {:.3f}s into the previous phrase",
               members_.size(), start_);
      Phrase &prev = phrases_.back();
      for (size_t idx : members_) {
        prev.text += ' ';
        prev.text += tokens_[idx].text;
        prev.words.push_back({tokens_[idx].ordinal, prev.length()});
      }
      members_.clear();
      return;
    }

    Phrase phrase;
    phrase.start = start_;
    phrase.end = end;
    for (size_t idx : members_) {
      const ScriptToken &t = tokens_[idx];
      if (!phrase.text.empty())
        phrase.text += ' ';
      phrase.text += t.text;
      const double offset =
          std::clamp(t.start - phrase.start, 0.0, phrase.length());
      phrase.words.push_back({t.ordinal, offset});
    }
    phrases_.push_back(std::move(phrase));
    members_.clear();
  }

private:
  const std::vector<ScriptToken> &tokens_;
  const SegmenterParams &params_;
  std::vector<Phrase> &phrases_;
  std::vector<size_t> members_;
  double start_ = 0.0;
};

/**
 * @brief Where to cut before a word when a cap or line change forces it.
 * @note Never strictly inside a silence: the cut moves to the silence start
 *       when that still leaves the current phrase some time, otherwise to
 *       the silence end. When the silence also covers the whole word there
 *       is no legal cut before it.
 * @return false if the word has to stay in the current phrase
 */
bool choose_cap_boundary(const ScriptToken &next, double phrase_start,
                         const std::vector<SilenceInterval> &silences,
                         double &boundary) {
  boundary = next.start;

  if (boundary <= phrase_start + TIME_EPS) {
    /// The word began before the phrase did (a break swallowed it); split
    /// the remaining span instead.
    boundary = phrase_start + (next.end - phrase_start) / 2.0;
  }

  for (const auto &s : silences) {
    if (s.start >= boundary)
      break;
    if (boundary < s.end) {
      if (s.start > phrase_start + TIME_EPS) {
        boundary = s.start;
        return true;
      }
      if (s.end < next.end) {
        boundary = s.end;
        return true;
      }
      return false;
    }
  }
  return true;
}

} // namespace

ErrorCode segment_phrases(const std::vector<ScriptToken> &tokens,
                          const std::vector<SilenceInterval> &silences,
                          const SegmenterParams &params,
                          std::vector<Phrase> &phrases) {
  phrases.clear();

  if (!(params.hard_break_sec > 0.0) || !(params.max_phrase_sec > 0.0) ||
      params.max_phrase_words < 1) {
    LOG_ERROR("Invalid segmenter parameters (hard break {}s, cap {}s / {} "
              "words)",
              params.hard_break_sec, params.max_phrase_sec,
              params.max_phrase_words);
    return ErrorCode::InvalidInput;
  }
  if (tokens.empty())
    return ErrorCode::Ok;

  const double speech_end = tokens.back().end;
  const size_t max_words = static_cast<size_t>(params.max_phrase_words);

  PhraseAccumulator current(tokens, params, phrases);
  current.set_start(tokens.front().start);

  size_t next_silence = 0;
  bool cut_pending = false; //< A forced cut had no legal boundary yet

  for (size_t k = 0; k < tokens.size(); ++k) {
    const ScriptToken &t = tokens[k];

    // **---- READABILITY CAPS / LINE CHANGES ----**

    if (!current.empty()) {
      const bool line_change =
          params.break_on_lines && t.line != current.last().line;
      const bool too_many = current.size() + 1 > max_words;
      const bool too_long =
          t.end - current.start() > params.max_phrase_sec + TIME_EPS;

      if (line_change || too_many || too_long || cut_pending) {
        double boundary = 0.0;
        if (t.end > current.start() + TIME_EPS) {
          cut_pending =
              !choose_cap_boundary(t, current.start(), silences, boundary);
          if (!cut_pending) {
            current.close(boundary);
            current.set_start(boundary);
          }
        }
      }
    }
    current.add(k);

    // **---- SILENCES STARTING WITHIN THIS WORD ----**

    while (next_silence < silences.size() &&
           silences[next_silence].start <= t.end + TIME_EPS) {
      const SilenceInterval &s = silences[next_silence++];

      /// Soft pause: text persists, the gap is part of the phrase
      if (s.length() + TIME_EPS < params.hard_break_sec)
        continue;

      /// Nothing is spoken after this silence
      if (s.end >= speech_end - TIME_EPS || k + 1 == tokens.size())
        continue;

      /// Silence before anything audible in this phrase: start later
      if (s.start <= current.start() + TIME_EPS || current.empty()) {
        current.set_start(std::max(current.start(), s.end));
        continue;
      }

      current.close(s.start);
      current.set_start(s.end);
      cut_pending = false;
    }
  }

  current.close(speech_end);
  return ErrorCode::Ok;
}

} // namespace voicesync
