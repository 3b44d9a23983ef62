/**
 * @file clip_pipeline.hpp
 * @brief Per-idea processing pipeline
 *
 * @details The ClipPipeline class turns one ClipIdea into a finished clip:
 *
 *          1. Cut the source segment and measure its duration (the target)
 *
 *          2. Synthesize the voiceover
 *
 *          3. Reconcile the voiceover duration          -> AudioAdjusted
 *
 *          4. Detect silences                           -> SilenceAnalyzed
 *
 *          5. Word times, phrases, timing map           -> TimingBuilt
 *
 *          6. Merge audio, burn subtitles               -> Merged
 *
 *          7. Publish clip and timing JSON              -> Done
 *
 * @note All log messages are prefixed with [Idea N]. Any failure moves the
 *       pipeline to Failed with the reason recorded in the outcome.
 *
 * @note Synthesis and every toolkit step (cut, stretch, merge, burn) are
 *       retried a bounded number of times with doubling backoff. Cancelled
 *       is never retried.
 */

#ifndef VOICESYNC_CLIP_PIPELINE_HPP
#define VOICESYNC_CLIP_PIPELINE_HPP

#include <atomic>
#include <functional>
#include <string>

#include "config.hpp"
#include "media_toolkit.hpp"
#include "progress_queue.hpp"
#include "speech_synthesizer.hpp"
#include "task_queue.hpp"
#include "types.hpp"

namespace voicesync {

/**
 * @class ClipPipeline
 * @brief State machine for one idea.
 *
 * @attention THREAD MODEL:
 *
 * - One instance per idea, run on one worker thread
 *
 * - The synthesizer and toolkit are shared between workers and must be
 *   thread-safe
 *
 * - The cancel flag is polled before every stage and during retry backoff
 */
class ClipPipeline {
  const ClipIdea &idea_;
  size_t index_; //< Position in the idea list (0-based)
  const EngineConfig &cfg_;
  SpeechSynthesizer &tts_;
  MediaToolkit &toolkit_;
  std::string source_path_;
  std::string output_dir_;

  const std::atomic<bool> *cancel_ = nullptr;
  ProgressQueue *progress_ = nullptr;
  PipelineState state_ = PipelineState::Pending;

  /**
   * @brief Enter a state and publish the transition.
   */
  void transition(PipelineState next, int percent, const std::string &msg);

  /**
   * @brief Enter Failed and fill the outcome.
   */
  void fail(ErrorCode code, const std::string &reason, IdeaOutcome &outcome);

  bool cancelled() const;

  /**
   * @brief Sleep in short slices, returning early on cancellation.
   * @return false if cancelled during the wait
   */
  bool backoff(double seconds) const;

  /**
   * @brief Run a stage with bounded attempts and doubling backoff.
   * @param what Stage label for logs
   * @param attempts Total attempts (at least one is made)
   * @param delay First retry delay in seconds
   * @param op Stage body; only SynthesisFailure and ToolkitFailure are
   *        retried, Cancelled and every other code end the loop at once
   * @return Code of the last attempt, or Cancelled
   */
  ErrorCode with_retries(const char *what, int attempts, double delay,
                         const std::function<ErrorCode()> &op);

  /// Toolkit stage under the toolkit_retries policy
  ErrorCode toolkit_step(const char *what,
                         const std::function<ErrorCode()> &op);

  /**
   * @brief Synthesize with up to synth_retries attempts.
   */
  ErrorCode synthesize_with_retries(const std::string &scratch_dir,
                                    AudioTrack &raw);

public:
  /**
   * @brief Construct a pipeline for one idea.
   * @param idea Idea to render (must outlive the pipeline)
   * @param index Position in the idea list, used for logs and file names
   * @param cfg Engine configuration for this run
   * @param tts Speech synthesizer
   * @param toolkit Media toolkit
   * @param source_path Source video the idea's segment is cut from
   * @param output_dir Directory receiving the clip and its timing JSON
   */
  ClipPipeline(const ClipIdea &idea, size_t index, const EngineConfig &cfg,
               SpeechSynthesizer &tts, MediaToolkit &toolkit,
               std::string source_path, std::string output_dir);

  /// Optional progress sink (nullptr = no events)
  void set_progress_queue(ProgressQueue *queue) { progress_ = queue; }

  /// Optional cancel flag (nullptr = never cancelled)
  void set_cancel_flag(const std::atomic<bool> *flag) { cancel_ = flag; }

  /**
   * @brief Run the pipeline to Done or Failed.
   * @return Outcome with the ClipResult on success
   */
  IdeaOutcome run();

  PipelineState state() const { return state_; }

  /// Base file name of this idea's outputs (no extension)
  std::string output_stem() const;
};

} // namespace voicesync

#endif // VOICESYNC_CLIP_PIPELINE_HPP
