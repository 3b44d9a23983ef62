/**
 * @file batch_runner.cpp
 * @brief Parallel idea processing implementation
 *
 * @details Implements the BatchRunner class:
 *
 *          - Worker pool sized from config and the cgroup CPU limit
 *
 *          - Shared queue for load balancing
 *
 *          - Idea-prefixed logging
 *
 *          - Sequential summary output
 */

#include "voicesync/batch_runner.hpp"

#include <chrono>
#include <cstdio>
#include <functional>
#include <mutex>
#include <thread>

#include <fmt/color.h>
#include <fmt/core.h>

#include "voicesync/clip_pipeline.hpp"
#include "voicesync/logging.hpp"
#include "voicesync/system.hpp"

namespace voicesync {

BatchRunner::BatchRunner(const EngineConfig &cfg, SpeechSynthesizer &tts,
                         MediaToolkit &toolkit, int cpu_limit)
    : cfg_(cfg), tts_(tts), toolkit_(toolkit),
      cpu_limit_(cpu_limit > 0 ? cpu_limit : detect_cpu_limit()) {}

std::vector<IdeaOutcome>
BatchRunner::run(const std::vector<ClipIdea> &ideas,
                 const std::string &source_path,
                 const std::string &output_dir) {
  total_ideas_ = static_cast<int>(ideas.size());
  ideas_done_.store(0);
  workers_ =
      calculate_worker_count(cfg_.max_parallel_ideas, ideas.size(), cpu_limit_);

  ResultCollector results(ideas.size());
  if (ideas.empty()) {
    LOG_WARN("No ideas to process");
    return results.extract();
  }

  /// Populate work queue; nothing is added once workers start
  TaskQueue queue;
  for (size_t i = 0; i < ideas.size(); ++i)
    queue.push(i);
  queue.finish();

  LOG_PHASE("================== BATCH PROCESSING ==================");
  LOG_INFO("Ideas to process: {}", total_ideas_);
  LOG_INFO("Parallel workers: {}", workers_);
  LOG_INFO("Available CPUs: {}", cpu_limit_);
  LOG_INFO("Source: {}", source_path);
  LOG_PHASE("=======================================================");

  auto batch_start = std::chrono::high_resolution_clock::now();

  std::vector<std::thread> pool;
  pool.reserve(static_cast<size_t>(workers_));
  for (int i = 0; i < workers_; ++i) {
    pool.emplace_back(&BatchRunner::idea_worker, this, i, std::ref(queue),
                      std::ref(results), std::cref(ideas),
                      std::cref(source_path), std::cref(output_dir));
  }

  for (auto &worker : pool)
    worker.join();

  auto batch_end = std::chrono::high_resolution_clock::now();
  double elapsed_sec =
      std::chrono::duration<double>(batch_end - batch_start).count();

  std::vector<IdeaOutcome> outcomes = results.extract();

  if (cancelled()) {
    int skipped = 0;
    for (const auto &o : outcomes) {
      if (o.reached == PipelineState::Pending &&
          o.code == ErrorCode::Cancelled)
        skipped++;
    }
    LOG_WARN("Batch cancelled; {} idea(s) not started", skipped);
  }

  print_batch_summary(ideas, outcomes, elapsed_sec);
  return outcomes;
}

void BatchRunner::idea_worker(int worker_id, TaskQueue &queue,
                              ResultCollector &results,
                              const std::vector<ClipIdea> &ideas,
                              const std::string &source_path,
                              const std::string &output_dir) {
  size_t index = 0;
  while (!cancelled() && queue.pop(index)) {
    const ClipIdea &idea = ideas[index];

    LOG_PHASE("[Worker {}] ----------------------------------------",
              worker_id);
    LOG_INFO("[Worker {}] Processing idea {}: {}", worker_id, index + 1,
             idea.title);
    LOG_INFO("[Worker {}] Progress: {}/{}", worker_id, ideas_done_.load() + 1,
             total_ideas_);

    auto start_time = std::chrono::high_resolution_clock::now();

    ClipPipeline pipeline(idea, index, cfg_, tts_, toolkit_, source_path,
                          output_dir);
    pipeline.set_progress_queue(progress_);
    pipeline.set_cancel_flag(cancel_);

    IdeaOutcome outcome = pipeline.run();

    auto end_time = std::chrono::high_resolution_clock::now();
    outcome.processing_time_us =
        std::chrono::duration_cast<std::chrono::microseconds>(end_time -
                                                              start_time)
            .count();

    const bool success = outcome.ok();
    const double secs = outcome.processing_time_us / 1000000.0;
    results.store(index, std::move(outcome));
    ++ideas_done_;

    if (success) {
      LOG_SUCCESS("[Worker {}] Completed idea {} ({:.1f}s)", worker_id,
                  index + 1, secs);
    } else {
      LOG_ERROR("[Worker {}] Failed idea {} ({:.1f}s)", worker_id, index + 1,
                secs);
    }
  }

  LOG_INFO("[Worker {}] Finished ({})", worker_id,
           cancelled() ? "cancelled" : "no more ideas");
}

void BatchRunner::print_batch_summary(const std::vector<ClipIdea> &ideas,
                                      const std::vector<IdeaOutcome> &outcomes,
                                      double wall_clock_sec) const {
  int total = static_cast<int>(outcomes.size());
  int success = 0;
  int failed = 0;
  long total_time_us = 0;

  for (const auto &o : outcomes) {
    if (o.ok()) {
      success++;
    } else {
      failed++;
    }
    total_time_us += o.processing_time_us;
  }

  double sum_time_sec = total_time_us / 1000000.0;
  double speedup = (wall_clock_sec > 0) ? sum_time_sec / wall_clock_sec : 1.0;

  std::lock_guard<std::mutex> lock(log_mutex);

  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "============== BATCH PROCESSING SUMMARY ==============\n");
  fmt::print("{:<25} {:>25}\n", "Total ideas:", total);
  fmt::print("{:<25} {:>25}\n", "Successful:", success);
  fmt::print("{:<25} {:>25}\n", "Failed:", failed);
  fmt::print("{:<25} {:>25}\n", "Parallel workers:", workers_);
  fmt::print("{:<25} {:>22.1f}s\n", "Wall-clock time:", wall_clock_sec);
  fmt::print("{:<25} {:>22.1f}s\n", "Sum of idea times:", sum_time_sec);
  fmt::print("{:<25} {:>22.2f}x\n", "Speedup:", speedup);

  if (total > 0) {
    double avg_time = sum_time_sec / total;
    fmt::print("{:<25} {:>22.1f}s\n", "Average time per idea:", avg_time);
  }

  fmt::print(fg(fmt::color::cyan),
             "======================================================\n");
  std::fflush(stdout);

  if (failed > 0) {
    fmt::print(fg(fmt::color::red), "\nFailed ideas:\n");
    for (size_t i = 0; i < outcomes.size(); ++i) {
      const auto &o = outcomes[i];
      if (o.ok())
        continue;
      fmt::print(fg(fmt::color::red), "  - [{}] {}: {} ({}, after {})\n",
                 i + 1, i < ideas.size() ? ideas[i].title : std::string(),
                 o.reason, error_name(o.code), state_name(o.reached));
    }
    std::fflush(stdout);
  }
}

} // namespace voicesync
