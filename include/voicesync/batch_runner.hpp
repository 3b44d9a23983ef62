/**
 * @file batch_runner.hpp
 * @brief Parallel idea processing for batch mode
 *
 * @details The BatchRunner class orchestrates the per-idea pipelines:
 *
 *          - Spawns min(MAX_PARALLEL_IDEAS, ideas, CPU limit) worker threads
 *
 *          - Workers pop idea indices from a shared TaskQueue
 *
 *          - Each outcome lands in the ResultCollector slot of its idea, so
 *
 *            results come back in idea order
 *
 *          - Logging is idea-prefixed for clarity
 *
 * @note Ideas still queued when the cancel flag is raised are reported as
 *       Cancelled ("not started").
 */

#ifndef VOICESYNC_BATCH_RUNNER_HPP
#define VOICESYNC_BATCH_RUNNER_HPP

#include <atomic>
#include <string>
#include <vector>

#include "config.hpp"
#include "media_toolkit.hpp"
#include "progress_queue.hpp"
#include "speech_synthesizer.hpp"
#include "task_queue.hpp"
#include "types.hpp"

namespace voicesync {

/**
 * @class BatchRunner
 * @brief Bounded worker pool over ClipPipelines.
 */
class BatchRunner {
public:
  /**
   * @brief Construct a batch runner.
   * @param cfg Engine configuration shared by every pipeline
   * @param tts Speech synthesizer (must be thread-safe)
   * @param toolkit Media toolkit (must be thread-safe)
   * @param cpu_limit CPUs available (0 = auto-detect)
   */
  BatchRunner(const EngineConfig &cfg, SpeechSynthesizer &tts,
              MediaToolkit &toolkit, int cpu_limit = 0);

  /// Optional progress sink handed to every pipeline
  void set_progress_queue(ProgressQueue *queue) { progress_ = queue; }

  /// Optional cancel flag, checked before each pop and between stages
  void set_cancel_flag(const std::atomic<bool> *flag) { cancel_ = flag; }

  /**
   * @brief Run every idea and wait for all workers.
   *
   * @param ideas Ideas to render, in output order
   * @param source_path Source video the segments are cut from
   * @param output_dir Directory receiving clips and timing maps
   * @return One outcome per idea, in idea order
   */
  std::vector<IdeaOutcome> run(const std::vector<ClipIdea> &ideas,
                               const std::string &source_path,
                               const std::string &output_dir);

  /// Workers used by the last run()
  int worker_count() const { return workers_; }

private:
  const EngineConfig &cfg_;
  SpeechSynthesizer &tts_;
  MediaToolkit &toolkit_;
  int cpu_limit_;
  int workers_{0};

  ProgressQueue *progress_ = nullptr;
  const std::atomic<bool> *cancel_ = nullptr;

  std::atomic<int> ideas_done_{0}; //< Counter for progress
  int total_ideas_{0};

  bool cancelled() const { return cancel_ && cancel_->load(); }

  /**
   * @brief Worker function for each pool thread.
   */
  void idea_worker(int worker_id, TaskQueue &queue, ResultCollector &results,
                   const std::vector<ClipIdea> &ideas,
                   const std::string &source_path,
                   const std::string &output_dir);

  /**
   * @brief Print final batch summary.
   * @param wall_clock_sec Actual elapsed wall-clock time in seconds
   */
  void print_batch_summary(const std::vector<ClipIdea> &ideas,
                           const std::vector<IdeaOutcome> &outcomes,
                           double wall_clock_sec) const;
};

} // namespace voicesync

#endif // VOICESYNC_BATCH_RUNNER_HPP
