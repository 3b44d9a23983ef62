/**
 * @file timing_map_builder.hpp
 * @brief Final subtitle timing map and its cue-list serialization
 *
 * @details build_timing_map clips the phrase list to [0, track duration] and
 *          verifies the map invariants:
 *
 *          - every phrase has words and end > start
 *
 *          - phrases are ordered and do not overlap (gaps are allowed and
 *            mean "no subtitle")
 *
 *          - nothing extends past the track by more than the tolerance
 *
 *          - highlight offsets lie inside their phrase and never decrease
 *
 *          - word ordinals strictly increase across the whole map
 *
 *          A violation is a logic defect upstream; it is logged and reported
 *          as InvalidTimingMap, never repaired.
 */

#ifndef VOICESYNC_TIMING_MAP_BUILDER_HPP
#define VOICESYNC_TIMING_MAP_BUILDER_HPP

#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "errors.hpp"
#include "types.hpp"

namespace voicesync {

struct TimingParams {
  double tolerance_sec = 0.020; //< Allowed overshoot before clipping
};

/**
 * @brief Clip and verify phrases into a TimingMap.
 * @return Ok or InvalidTimingMap
 */
ErrorCode build_timing_map(const std::vector<Phrase> &phrases,
                           double track_duration, const TimingParams &params,
                           TimingMap &map);

/**
 * @brief Re-check the invariants of an existing map.
 * @param reason Output: first violation found
 */
bool validate_timing_map(const TimingMap &map, std::string &reason);

/**
 * @brief Expand a map into per-word cues.
 * @note Each phrase yields one cue per word, from the word's highlight
 *       offset to the next word's (or the phrase end). Slices that round to
 *       zero milliseconds are skipped.
 */
std::vector<Cue> to_cues(const TimingMap &map);

nlohmann::json cue_to_json(const Cue &cue);

/// JSON array of cue_to_json objects
nlohmann::json cues_to_json(const std::vector<Cue> &cues);

/**
 * @brief Serialized document: {"track_duration_ms", "phrases", "cues"}.
 */
nlohmann::json timing_map_to_json(const TimingMap &map);

/**
 * @brief Write timing_map_to_json to a file (pretty printed).
 * @return Ok or IoFailure
 */
ErrorCode write_timing_map_json(const TimingMap &map, const std::string &path);

/// Seconds to rounded integer milliseconds
int64_t to_ms(double seconds);

} // namespace voicesync

#endif // VOICESYNC_TIMING_MAP_BUILDER_HPP
