/**
 * @file types.hpp
 * @brief Core data types and constants for VoiceSync
 *
 * @details Contains the data structures that flow between engine stages:
 *
 *          - AudioTrack: decoded mono voiceover samples
 *
 *          - SilenceInterval / TimeSegment for time ranges
 *
 *          - ScriptToken, WordHighlight, Phrase, TimingMap, Cue
 *
 *          - ClipIdea and ClipResult for the per-idea pipeline
 *
 * @note All engine times are seconds stored as double. Only the serialized
 *       cue list uses integer milliseconds.
 */

#ifndef VOICESYNC_TYPES_HPP
#define VOICESYNC_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace voicesync {

// **----- CONSTANTS -----**

/**
 * @brief Size of the I/O buffer handed to FFmpeg when decoding from memory.
 * @note Voiceover files are small; 64KB keeps a whole second of 24kHz PCM16
 *       in one read.
 */
constexpr size_t AVIO_BUFFER_SIZE = 64 * 1024; //< 64KB

/// Sample rate used when a track has to be synthesized from nothing
constexpr int DEFAULT_SAMPLE_RATE = 24000;

/// Portrait output frame of every clip (9:16)
constexpr int OUTPUT_WIDTH = 1080;
constexpr int OUTPUT_HEIGHT = 1920;

// **----- AUDIO -----**

/**
 * @struct AudioTrack
 * @brief Mono float PCM in [-1, 1].
 * @note A stage never mutates a track it received; it produces a new one.
 */
struct AudioTrack {
  std::vector<float> samples; //< Mono samples
  int sample_rate = 0;        //< Samples per second
  int channels = 1;           //< Always 1 after decoding (downmixed)

  double duration() const {
    return sample_rate > 0
               ? static_cast<double>(samples.size()) / sample_rate
               : 0.0;
  }

  bool empty() const { return samples.empty() || sample_rate <= 0; }
};

// **----- TIME RANGES -----**

/**
 * @struct TimeSegment
 * @brief Represents a time range [start, end) in seconds.
 * @note Used for voiced regions and source clip ranges.
 */
struct TimeSegment {
  double start; //< Start time in seconds
  double end;   //< End time in seconds
};

/**
 * @struct SilenceInterval
 * @brief A silent stretch of a track. Lists are sorted and non-overlapping.
 */
struct SilenceInterval {
  double start; //< Start offset in seconds
  double end;   //< End offset in seconds (> start)

  double length() const { return end - start; }
};

// **----- SCRIPT & SUBTITLES -----**

/**
 * @struct ScriptToken
 * @brief One script word with its estimated spoken span.
 */
struct ScriptToken {
  std::string text;   //< Word as written in the script
  double start = 0.0; //< Estimated start in seconds
  double end = 0.0;   //< Estimated end in seconds
  int ordinal = 0;    //< Position in the whole script (0-based)
  int line = 0;       //< Script line the word came from
};

/**
 * @struct WordHighlight
 * @brief When a word of a phrase becomes the highlighted one.
 */
struct WordHighlight {
  int ordinal;   //< Script ordinal of the word
  double offset; //< Seconds from the phrase start
};

/**
 * @struct Phrase
 * @brief Run of words shown on screen together.
 */
struct Phrase {
  std::string text;                //< Words joined by single spaces
  double start = 0.0;              //< Display start in seconds
  double end = 0.0;                //< Display end in seconds
  std::vector<WordHighlight> words; //< Per-word highlight timings

  double length() const { return end - start; }
};

/**
 * @struct TimingMap
 * @brief Ordered, non-overlapping phrases bound to one audio track.
 */
struct TimingMap {
  std::vector<Phrase> phrases;
  double track_duration = 0.0;
};

/**
 * @struct Cue
 * @brief Serialized subtitle slice: one phrase with one word highlighted.
 */
struct Cue {
  int64_t start_ms = 0;
  int64_t end_ms = 0;
  std::string text;
  int highlighted_word_index = 0; //< Index into the phrase's words
  int word_ordinal = 0;           //< Script ordinal of the highlighted word
  std::vector<int64_t> word_highlight_offsets_ms;
};

// **----- CLIPS -----**

/**
 * @struct ScriptLine
 * @brief One line of the voiceover script as delivered by the idea source.
 * @note Line timings are the generator's suggestion and are informational.
 */
struct ScriptLine {
  double start_s = 0.0;
  double end_s = 0.0;
  std::string text;
};

/**
 * @struct ClipIdea
 * @brief One short-form clip candidate. Read-only pipeline input.
 */
struct ClipIdea {
  std::string title;
  std::string description;
  std::string voice_style;
  std::vector<ScriptLine> lines;
  double source_start = 0.0; //< Seconds into the source video
  double source_end = 0.0;   //< Seconds into the source video

  /// Full script: all line texts joined by single spaces
  std::string script_text() const;
};

/**
 * @struct ClipResult
 * @brief Terminal artifact of a successful pipeline run.
 */
struct ClipResult {
  std::string video_path;  //< Rendered clip (merged and captioned)
  std::string timing_path; //< Cue list JSON written beside the clip
  AudioTrack audio;        //< Final reconciled voiceover
  TimingMap timing;
  ClipIdea idea;
};

// **----- PIPELINE STATE -----**

/**
 * @brief Per-idea pipeline states, in order. Failed is reachable from any.
 */
enum class PipelineState {
  Pending,
  AudioAdjusted,
  SilenceAnalyzed,
  TimingBuilt,
  Merged,
  Done,
  Failed
};

/// Stable state name for logs and progress events
const char *state_name(PipelineState state);

} // namespace voicesync

#endif // VOICESYNC_TYPES_HPP
