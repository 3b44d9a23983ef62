/**
 * @file phrase_segmenter.hpp
 * @brief Groups timed words into on-screen phrases
 *
 * @details Phrase boundaries come from three sources:
 *
 *          - Hard breaks: a silence of at least hard_break_sec that starts
 *            inside (or exactly at the end of) the current word closes the
 *            phrase at the silence start. The next phrase starts when the
 *            silence ends, so nothing is shown during the silence.
 *
 *          - Readability caps: a phrase closes before the word that would
 *            push it past max_phrase_words or max_phrase_sec.
 *
 *          - Script lines (optional): a new script line starts a new phrase.
 *
 *          Silences shorter than hard_break_sec (soft pauses) never end a
 *          phrase and no boundary is ever placed strictly inside one, so the
 *          text stays on screen through short breaths.
 *
 * @attention A silence that starts exactly on the boundary between two words
 *            is attributed to the earlier word.
 */

#ifndef VOICESYNC_PHRASE_SEGMENTER_HPP
#define VOICESYNC_PHRASE_SEGMENTER_HPP

#include <vector>

#include "errors.hpp"
#include "types.hpp"

namespace voicesync {

struct SegmenterParams {
  double hard_break_sec = 0.3;  //< Silences at least this long end a phrase
  double max_phrase_sec = 6.0;  //< Longest time a phrase stays on screen
  int max_phrase_words = 8;     //< Most words shown at once
  bool break_on_lines = true;   //< Start a new phrase at each script line
};

/**
 * @brief Build display phrases from timed tokens and silences.
 *
 * @param tokens Contiguous timed tokens (WordTimeEstimator output)
 * @param silences Sorted silence intervals of the same track
 * @param params Break threshold and readability caps
 * @param phrases Output phrases, ordered and non-overlapping
 * @return Ok, or InvalidInput for non-positive thresholds/caps
 */
ErrorCode segment_phrases(const std::vector<ScriptToken> &tokens,
                          const std::vector<SilenceInterval> &silences,
                          const SegmenterParams &params,
                          std::vector<Phrase> &phrases);

} // namespace voicesync

#endif // VOICESYNC_PHRASE_SEGMENTER_HPP
