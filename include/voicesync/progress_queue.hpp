/**
 * @file progress_queue.hpp
 * @brief Thread-safe progress event channel
 *
 * @details Pipelines running on worker threads push one event per state
 *          transition; a single consumer (the CLI printer, or a GUI) pops
 *          them in arrival order.
 *
 * @attention USAGE:
 *
 *   - Workers call push() on every transition
 *
 *   - The consumer calls pop() in a loop until it returns false
 *
 *   - Call finish() once every worker has joined; pending events are still
 *     delivered
 */

#ifndef VOICESYNC_PROGRESS_QUEUE_HPP
#define VOICESYNC_PROGRESS_QUEUE_HPP

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <string>

#include "types.hpp"

namespace voicesync {

/**
 * @struct ProgressEvent
 * @brief One state transition of one idea.
 */
struct ProgressEvent {
  size_t idea_index;   //< Position in the idea list
  PipelineState state; //< State just entered
  int percent;         //< Overall progress of this idea, 0..100
  std::string message; //< Human readable detail
};

/**
 * @class ProgressQueue
 * @brief Multi-producer, single-consumer queue of ProgressEvents.
 */
class ProgressQueue {
public:
  /**
   * @brief Push an event.
   * @note Events pushed after finish() are dropped.
   */
  void push(ProgressEvent event);

  /**
   * @brief Pop an event (blocking).
   * @return true if an event was retrieved, false once finished and empty
   */
  bool pop(ProgressEvent &event);

  /**
   * @brief Signal that no more events will be pushed.
   */
  void finish();

  bool is_done() const { return done_.load() && empty(); }

  bool empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.empty();
  }

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::queue<ProgressEvent> events_;
  std::atomic<bool> done_{false};
};

} // namespace voicesync

#endif // VOICESYNC_PROGRESS_QUEUE_HPP
