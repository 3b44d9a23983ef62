/**
 * @file task_queue.hpp
 * @brief Thread-safe idea queue and order-preserving result collection
 *
 * @details Provides:
 *          - TaskQueue: shared queue of idea indices for the worker pool
 *
 *          - ResultCollector: one outcome slot per idea, so results come
 *            back in idea order no matter which worker finished first
 */

#ifndef VOICESYNC_TASK_QUEUE_HPP
#define VOICESYNC_TASK_QUEUE_HPP

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <string>
#include <vector>

#include "errors.hpp"
#include "types.hpp"

namespace voicesync {

/**
 * @struct IdeaOutcome
 * @brief Terminal status of one idea.
 * @note A slot that no worker filled stays Cancelled.
 */
struct IdeaOutcome {
  ErrorCode code = ErrorCode::Cancelled;
  PipelineState reached = PipelineState::Pending; //< Last state entered
  std::string reason = "not started";
  ClipResult result; //< Valid only when code == Ok
  long processing_time_us = 0; //< Wall time spent in the pipeline

  bool ok() const { return code == ErrorCode::Ok; }
};

/**
 * @class TaskQueue
 * @brief Thread-safe queue of idea indices.
 *
 * @attention DESIGN:
 *
 * - Workers pop the next idea from a shared queue
 *
 * - A worker stuck on a slow idea (long TTS, retries) does not hold up the
 *   others
 */
class TaskQueue {
  std::queue<size_t> tasks;
  std::mutex mutex;
  std::condition_variable cv;
  std::atomic<bool> done{false};

public:
  /**
   * @brief Add an idea index.
   * @note Thread-safe; notifies one waiting worker.
   */
  void push(size_t idea_index);

  /**
   * @brief Pop the next idea index.
   * @note Blocks until a task is available or the queue is finished.
   * @return true if a task was retrieved, false if empty and done
   */
  bool pop(size_t &idea_index);

  /**
   * @brief Signal that no more tasks will be added.
   */
  void finish();
};

/**
 * @class ResultCollector
 * @brief Thread-safe, index-addressed outcome store.
 */
class ResultCollector {
  std::vector<IdeaOutcome> outcomes;
  std::mutex mutex;

public:
  /// One slot per idea, all initially "not started"
  explicit ResultCollector(size_t idea_count);

  /**
   * @brief Record the outcome of one idea.
   * @attention Out-of-range indices are ignored.
   */
  void store(size_t idea_index, IdeaOutcome &&outcome);

  /**
   * @brief Extract all outcomes in idea order.
   * @attention Moves the internal vector out, leaving the collector empty.
   */
  std::vector<IdeaOutcome> extract();
};

} // namespace voicesync

#endif // VOICESYNC_TASK_QUEUE_HPP
