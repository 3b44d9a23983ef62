/**
 * @file word_time_estimator.hpp
 * @brief Estimated spoken span for every script word
 *
 * @details Without a forced-alignment signal the spoken span of a word is
 *          approximated from its length:
 *
 *          - CharacterProportional: the whole track is split between words
 *            in proportion to their length in code points.
 *
 *          - VoicedRegions: words are first distributed over the voiced
 *            regions (complement of the silences) in proportion to region
 *            length, then split by length inside each region. Tokens are
 *            stretched over the gaps afterwards so that coverage stays
 *            complete.
 *
 *          In both modes spans are contiguous, the first token starts at 0
 *          and the last ends exactly at the track duration.
 */

#ifndef VOICESYNC_WORD_TIME_ESTIMATOR_HPP
#define VOICESYNC_WORD_TIME_ESTIMATOR_HPP

#include <cstddef>
#include <string>
#include <vector>

#include "errors.hpp"
#include "types.hpp"

namespace voicesync {

enum class WordTimingMode { CharacterProportional, VoicedRegions };

struct EstimatorParams {
  WordTimingMode mode = WordTimingMode::CharacterProportional;
};

/**
 * @brief Parse "chars" / "voiced" (case-insensitive).
 * @return false for unknown names (mode untouched)
 */
bool parse_word_timing_mode(const std::string &name, WordTimingMode &mode);

/**
 * @brief Split text on ASCII whitespace.
 */
std::vector<std::string> split_words(const std::string &text);

/**
 * @brief Number of UTF-8 code points in a word.
 */
size_t utf8_length(const std::string &word);

/**
 * @brief Turn script lines into untimed tokens (ordinal and line set).
 */
std::vector<ScriptToken> tokenize_script(const std::vector<std::string> &lines);

/**
 * @brief Assign start/end to every token.
 *
 * @param tokens Tokens from tokenize_script (timed in place)
 * @param duration Final track duration in seconds
 * @param params Estimation mode
 * @param silences Silence intervals of the final track (VoicedRegions only)
 * @return Ok, or InvalidInput when there are tokens but no duration
 */
ErrorCode estimate_word_times(std::vector<ScriptToken> &tokens,
                              double duration, const EstimatorParams &params,
                              const std::vector<SilenceInterval> &silences = {});

} // namespace voicesync

#endif // VOICESYNC_WORD_TIME_ESTIMATOR_HPP
